#include "ocid/cli/options.hpp"

#include <charconv>
#include <cstddef>
#include <cstring>

namespace ocid::cli {
    namespace {
        [[nodiscard]] ocid::core::Status invalid() noexcept {
            return ocid::core::make_status(ocid::core::StatusDomain::Cli, ocid::core::StatusCode::Invalid);
        }

        [[nodiscard]] ocid::core::Status unknown_at(u32 index) noexcept {
            return ocid::core::make_status(ocid::core::StatusDomain::Cli, ocid::core::StatusCode::NotFound, index);
        }

        [[nodiscard]] bool is_option_token(const char* tok) noexcept {
            return tok != nullptr && tok[0] == '-' && tok[1] != '\0';
        }

        // Resolved form of one argv token: which option, and the value glued
        // onto it ("--format=hex", "-fhex") if any.
        struct Match {
            const OptionSpec* spec{nullptr};
            const char* inline_value{nullptr};
        };

        [[nodiscard]] bool match_long(const char* tok, const OptionSpec* specs, u32 spec_count, Match* m) noexcept {
            const char* name = tok + 2;
            const char* eq = std::strchr(name, '=');
            const size_t name_len = (eq != nullptr) ? static_cast<size_t>(eq - name) : std::strlen(name);
            if (name_len == 0) {
                return false;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const char* ln = specs[i].long_name;
                if (ln != nullptr && std::strlen(ln) == name_len && std::strncmp(ln, name, name_len) == 0) {
                    m->spec = &specs[i];
                    m->inline_value = (eq != nullptr) ? eq + 1 : nullptr;
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] bool match_short(const char* tok, const OptionSpec* specs, u32 spec_count, Match* m) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name != '\0' && specs[i].short_name == tok[1]) {
                    m->spec = &specs[i];
                    m->inline_value = (tok[2] != '\0') ? tok + 2 : nullptr;
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] ocid::core::Status store_value(OptionType type, const char* value, OptionValue* out) noexcept {
            switch (type) {
                case OptionType::Flag:
                    if (value != nullptr) {
                        return invalid();
                    }
                    out->boolv = 1;
                    return ocid::core::ok_status();
                case OptionType::String:
                    out->str = value;
                    return ocid::core::ok_status();
                case OptionType::I64:
                    return parse_i64(value, &out->i64v) ? ocid::core::ok_status() : invalid();
            }
            return invalid();
        }
    } // namespace

    ocid::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;

        if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc && is_option_token(args.argv[i])) {
            const char* tok = args.argv[i];
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            Match m{};
            const bool found = (tok[1] == '-') ? match_long(tok, specs, spec_count, &m)
                                               : match_short(tok, specs, spec_count, &m);
            if (!found) {
                return (tok[1] == '-' && tok[2] == '=') ? invalid() : unknown_at(i);
            }

            // Non-flag options without an inline value take the next token.
            const char* value = m.inline_value;
            u32 used = 1;
            if (m.spec->type != OptionType::Flag && value == nullptr) {
                if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                    return invalid();
                }
                value = args.argv[i + 1];
                used = 2;
            }

            ParsedOption opt{};
            opt.id = m.spec->id;
            opt.type = m.spec->type;
            const ocid::core::Status s = store_value(m.spec->type, value, &opt.value);
            if (!ocid::core::is_ok(s)) {
                return s;
            }
            if (out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            i += used;
        }

        *consumed = i;
        return ocid::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }

    void print_option_help(std::FILE* f, const OptionSpec* specs, u32 spec_count) noexcept {
        if (f == nullptr || specs == nullptr) {
            return;
        }
        char left[48];
        for (u32 i = 0; i < spec_count; ++i) {
            const OptionSpec& s = specs[i];
            if (s.long_name == nullptr) {
                continue;
            }
            const bool takes_value = s.type != OptionType::Flag && s.metavar != nullptr;
            if (s.short_name != '\0') {
                std::snprintf(left, sizeof(left), "-%c, --%s%s%s", s.short_name, s.long_name,
                    takes_value ? " " : "", takes_value ? s.metavar : "");
            } else {
                std::snprintf(left, sizeof(left), "    --%s%s%s", s.long_name,
                    takes_value ? " " : "", takes_value ? s.metavar : "");
            }
            std::fprintf(f, "  %-24s%s\n", left, s.help != nullptr ? s.help : "");
        }
    }
} // namespace ocid::cli
