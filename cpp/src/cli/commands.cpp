#include "ocid/cli/commands.hpp"

#include <cstring>

namespace ocid::cli {
    const CommandSpec* find_command(const CommandSpec* specs, u32 spec_count, const char* name) noexcept {
        if (specs == nullptr || name == nullptr) {
            return nullptr;
        }
        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, name) == 0) {
                return &specs[i];
            }
        }
        return nullptr;
    }

    ocid::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        const ocid::core::Status bad =
            ocid::core::make_status(ocid::core::StatusDomain::Cli, ocid::core::StatusCode::Invalid);
        if (out == nullptr || consumed == nullptr) {
            return bad;
        }
        *out = CommandInvocation{};
        *consumed = 0;

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr || args.argv[0][0] == '-') {
            return bad;
        }
        if (spec_count > 0 && specs == nullptr) {
            return bad;
        }

        const CommandSpec* match = find_command(specs, spec_count, args.argv[0]);
        if (match == nullptr) {
            return ocid::core::make_status(ocid::core::StatusDomain::Cli, ocid::core::StatusCode::NotFound);
        }

        out->id = match->id;
        out->args = CliArgs{args.argv + 1, args.argc - 1};
        *consumed = 1;
        return ocid::core::ok_status();
    }

    void print_command_help(std::FILE* f, const CommandSpec* specs, u32 spec_count) noexcept {
        if (f == nullptr || specs == nullptr) {
            return;
        }
        char left[48];
        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name == nullptr) {
                continue;
            }
            std::snprintf(left, sizeof(left), "%s%s%s", s.name,
                s.synopsis != nullptr ? " " : "", s.synopsis != nullptr ? s.synopsis : "");
            std::fprintf(f, "  %-24s%s\n", left, s.help != nullptr ? s.help : "");
        }
    }
} // namespace ocid::cli
