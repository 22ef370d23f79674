#pragma once

#include <cstdio>
#include <type_traits>

#include "ocid/cli/options.hpp"
#include "ocid/core/errors.hpp"

namespace ocid::cli {
    using u32 = ocid::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Hash = 2,
        Rand = 3,
        Parse = 4,
        Raw = 5,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const char* synopsis{nullptr};  // arguments after the name, e.g. "<id>..."
        const char* help{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    [[nodiscard]] const CommandSpec* find_command(const CommandSpec* specs, u32 spec_count, const char* name) noexcept;

    // Matches argv[0] against `specs`; `out->args` is the remainder.
    // Unknown names fail with Cli/NotFound, anything else malformed with Cli/Invalid.
    ocid::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    void print_command_help(std::FILE* f, const CommandSpec* specs, u32 spec_count) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace ocid::cli
