#pragma once

#include <cstdio>

#include "ocid/cli/options.hpp"
#include "ocid/core/errors.hpp"

namespace ocid::cli {

    enum class OutputFormat : u8 {
        Text = 0,
        Hex = 1,
    };

    struct CliConfig {
        OutputFormat format{OutputFormat::Text};
        i64 count{1};
    };

    [[nodiscard]] bool parse_output_format(const char* s, OutputFormat* out) noexcept;

    // Defaults, then OCID_FORMAT from the environment. An unrecognised value is
    // reported and ignored.
    CliConfig load_config_from_env(std::FILE* err) noexcept;

    // Runs one invocation (argv without the program name). Results go to
    // `out`, diagnostics to `err`. Returns a process exit code.
    int run_tool(const CliArgs& args, const CliConfig& base, std::FILE* out, std::FILE* err);

    void print_status_error(std::FILE* err, const char* context, ocid::core::Status s) noexcept;
    void print_decode_error(std::FILE* err, const char* context, ocid::core::DecodeError e) noexcept;

} // namespace ocid::cli
