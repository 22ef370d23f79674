#include "ocid/cli/tool.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <vector>

#include "ocid/cli/commands.hpp"
#include "ocid/core/content_id.hpp"
#include "ocid/hashing/hashing.hpp"
#include "ocid/entropy/entropy.hpp"

namespace ocid::cli {
    namespace {
        using ocid::core::ContentId;
        using ocid::core::DecodeError;
        using ocid::core::Status;

        constexpr i64 kMaxRandCount = 1000000;

        const OptionSpec kOptionSpecs[] = {
            {OptionId::Format, OptionType::String, "format", 'f', "text|hex", "Output format (default: $OCID_FORMAT or text)"},
            {OptionId::Count, OptionType::I64, "count", 'n', "N", "Number of ids for 'rand'"},
            {OptionId::Help, OptionType::Flag, "help", 'h', nullptr, "Show this help"},
        };
        constexpr u32 kOptionSpecCount = sizeof(kOptionSpecs) / sizeof(kOptionSpecs[0]);

        const CommandSpec kCommandSpecs[] = {
            {CommandId::Hash, "hash", "<file|->...", "Print the content id of each file ('-' reads stdin)"},
            {CommandId::Rand, "rand", "[-n N]", "Print N random ids (default 1)"},
            {CommandId::Parse, "parse", "<id>...", "Validate ids and print their bytes as hex"},
            {CommandId::Raw, "raw", "<hex>", "Build an id from 64 hex digits"},
            {CommandId::Help, "help", nullptr, "Show this help"},
        };
        constexpr u32 kCommandSpecCount = sizeof(kCommandSpecs) / sizeof(kCommandSpecs[0]);

        // ====================================================================
        // Output
        // ====================================================================

        void print_usage(std::FILE* f) {
            std::fprintf(f, "usage: ocid [options] <command> [args...]\n");
            std::fprintf(f, "\nCommands:\n");
            print_command_help(f, kCommandSpecs, kCommandSpecCount);
            std::fprintf(f, "\nOptions:\n");
            print_option_help(f, kOptionSpecs, kOptionSpecCount);
            std::fprintf(f, "\nIds may start with '-'; pass them after '--' (ocid parse -- <id>).\n");
        }

        void hex_encode(const ContentId& id, char out[ocid::core::kContentIdBytes * 2 + 1]) noexcept {
            static const char hex[] = "0123456789abcdef";
            size_t pos = 0;
            for (ocid::core::u8 v : id.b) {
                out[pos++] = hex[(v >> 4) & 0xF];
                out[pos++] = hex[v & 0xF];
            }
            out[pos] = '\0';
        }

        void print_id(std::FILE* out, const ContentId& id, OutputFormat format, const char* label) {
            if (format == OutputFormat::Hex) {
                char hex[ocid::core::kContentIdBytes * 2 + 1];
                hex_encode(id, hex);
                std::fprintf(out, "%s", hex);
            } else {
                ocid::core::ContentIdText text{};
                if (!ocid::core::is_ok(ocid::core::content_id_encode_text(id, &text))) {
                    return;
                }
                std::fprintf(out, "%s", text.c);
            }
            if (label != nullptr) {
                std::fprintf(out, "  %s", label);
            }
            std::fprintf(out, "\n");
        }

        // ====================================================================
        // Input
        // ====================================================================

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        // Same error taxonomy as the text decoder: characters first, then length.
        [[nodiscard]] DecodeError parse_hex(std::string_view s, ContentId* out) noexcept {
            for (size_t i = 0; i < s.size(); ++i) {
                if (hex_value(s[i]) < 0) {
                    return ocid::core::invalid_character(static_cast<u32>(i));
                }
            }
            if (s.size() != ocid::core::kContentIdBytes * 2) {
                return ocid::core::length_mismatch(ocid::core::kContentIdBytes, static_cast<u32>(s.size() / 2));
            }
            std::array<ocid::core::u8, ocid::core::kContentIdBytes> bytes{};
            for (size_t i = 0; i < bytes.size(); ++i) {
                bytes[i] = static_cast<ocid::core::u8>((hex_value(s[i * 2]) << 4) | hex_value(s[i * 2 + 1]));
            }
            return ocid::core::content_id_from_bytes({bytes.data(), ocid::core::kContentIdBytes}, out);
        }

#if defined(OCID_HAVE_BLAKE3)
        Status read_all(const char* path, std::vector<ocid::core::u8>* out) {
            const bool use_stdin = std::strcmp(path, "-") == 0;
            std::FILE* f = use_stdin ? stdin : std::fopen(path, "rb");
            if (f == nullptr) {
                return ocid::core::make_status(ocid::core::StatusDomain::Cli, ocid::core::StatusCode::Io,
                    static_cast<u32>(errno));
            }

            out->clear();
            ocid::core::u8 chunk[64 * 1024];
            Status s = ocid::core::ok_status();
            for (;;) {
                const size_t n = std::fread(chunk, 1, sizeof(chunk), f);
                if (n > 0) {
                    if (out->size() + n > 0xffffffffull) {
                        s = ocid::core::make_status(ocid::core::StatusDomain::Cli, ocid::core::StatusCode::Unsupported);
                        break;
                    }
                    out->insert(out->end(), chunk, chunk + n);
                }
                if (n < sizeof(chunk)) {
                    if (std::ferror(f)) {
                        s = ocid::core::make_status(ocid::core::StatusDomain::Cli, ocid::core::StatusCode::Io);
                    }
                    break;
                }
            }

            if (!use_stdin) {
                std::fclose(f);
            }
            return s;
        }
#endif

        // ====================================================================
        // Command Handlers
        // ====================================================================

        int cmd_hash(const CliArgs& args, const CliConfig& cfg, std::FILE* out, std::FILE* err) {
#if defined(OCID_HAVE_BLAKE3)
            if (args.argc == 0) {
                std::fprintf(err, "error: hash: expected at least one file\n");
                return EXIT_FAILURE;
            }

            int rc = EXIT_SUCCESS;
            std::vector<ocid::core::u8> content;
            for (u32 i = 0; i < args.argc; ++i) {
                const char* path = args.argv[i];
                Status s = read_all(path, &content);
                if (!ocid::core::is_ok(s)) {
                    print_status_error(err, path, s);
                    rc = EXIT_FAILURE;
                    continue;
                }

                ContentId id{};
                s = ocid::hashing::content_id_from_content(
                    {content.data(), static_cast<u32>(content.size())}, &id);
                if (!ocid::core::is_ok(s)) {
                    print_status_error(err, path, s);
                    rc = EXIT_FAILURE;
                    continue;
                }
                print_id(out, id, cfg.format, path);
            }
            return rc;
#else
            (void)args;
            (void)cfg;
            (void)out;
            std::fprintf(err, "error: hash: built without hashing support\n");
            return EXIT_FAILURE;
#endif
        }

        int cmd_rand(const CliArgs& args, const CliConfig& cfg, std::FILE* out, std::FILE* err) {
            if (args.argc != 0) {
                std::fprintf(err, "error: rand: unexpected argument '%s'\n", args.argv[0]);
                return EXIT_FAILURE;
            }
            if (cfg.count < 1 || cfg.count > kMaxRandCount) {
                std::fprintf(err, "error: rand: count must be between 1 and %lld\n",
                    static_cast<long long>(kMaxRandCount));
                return EXIT_FAILURE;
            }
#if defined(OCID_HAVE_LIBSODIUM) || defined(OCID_HAVE_OPENSSL)
            ocid::entropy::SystemEntropy source;
            for (i64 i = 0; i < cfg.count; ++i) {
                ContentId id{};
                const Status s = ocid::entropy::content_id_random(source, &id);
                if (!ocid::core::is_ok(s)) {
                    print_status_error(err, "rand", s);
                    return EXIT_FAILURE;
                }
                print_id(out, id, cfg.format, nullptr);
            }
            return EXIT_SUCCESS;
#else
            (void)out;
            std::fprintf(err, "error: rand: built without entropy support\n");
            return EXIT_FAILURE;
#endif
        }

        int cmd_parse(const CliArgs& args, std::FILE* out, std::FILE* err) {
            if (args.argc == 0) {
                std::fprintf(err, "error: parse: expected at least one id\n");
                return EXIT_FAILURE;
            }
            for (u32 i = 0; i < args.argc; ++i) {
                ContentId id{};
                const DecodeError e = ocid::core::content_id_from_text(args.argv[i], &id);
                if (!ocid::core::is_ok(e)) {
                    print_decode_error(err, args.argv[i], e);
                    return EXIT_FAILURE;
                }
                print_id(out, id, OutputFormat::Hex, nullptr);
            }
            return EXIT_SUCCESS;
        }

        int cmd_raw(const CliArgs& args, const CliConfig& cfg, std::FILE* out, std::FILE* err) {
            if (args.argc != 1) {
                std::fprintf(err, "error: raw: expected exactly one hex string\n");
                return EXIT_FAILURE;
            }
            ContentId id{};
            const DecodeError e = parse_hex(args.argv[0], &id);
            if (!ocid::core::is_ok(e)) {
                print_decode_error(err, args.argv[0], e);
                return EXIT_FAILURE;
            }
            print_id(out, id, cfg.format, nullptr);
            return EXIT_SUCCESS;
        }

        // Returns false after reporting a bad value.
        bool apply_options(const ParsedOptions& opts, CliConfig* cfg, std::FILE* err) {
            if (const ParsedOption* f = find_option(opts, OptionId::Format)) {
                if (!parse_output_format(f->value.str, &cfg->format)) {
                    std::fprintf(err, "error: unknown format '%s' (expected text or hex)\n", f->value.str);
                    return false;
                }
            }
            if (const ParsedOption* n = find_option(opts, OptionId::Count)) {
                cfg->count = n->value.i64v;
            }
            return true;
        }

        bool parse_and_apply(const CliArgs& args, CliConfig* cfg, bool* help, u32* consumed, std::FILE* err) {
            ParsedOption buf[16]{};
            ParsedOptions opts{buf, 0, 16};
            const Status s = parse_options(args, kOptionSpecs, kOptionSpecCount, &opts, consumed);
            if (!ocid::core::is_ok(s)) {
                print_status_error(err, "option parsing", s);
                return false;
            }
            if (find_option(opts, OptionId::Help) != nullptr) {
                *help = true;
            }
            return apply_options(opts, cfg, err);
        }
    } // namespace

    bool parse_output_format(const char* s, OutputFormat* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        if (std::strcmp(s, "text") == 0) {
            *out = OutputFormat::Text;
            return true;
        }
        if (std::strcmp(s, "hex") == 0) {
            *out = OutputFormat::Hex;
            return true;
        }
        return false;
    }

    CliConfig load_config_from_env(std::FILE* err) noexcept {
        CliConfig cfg{};
        const char* fmt = std::getenv("OCID_FORMAT");
        if (fmt != nullptr && *fmt != '\0' && !parse_output_format(fmt, &cfg.format)) {
            if (err != nullptr) {
                std::fprintf(err, "warning: ignoring OCID_FORMAT='%s' (expected text or hex)\n", fmt);
            }
        }
        return cfg;
    }

    void print_status_error(std::FILE* err, const char* context, ocid::core::Status s) noexcept {
        std::fprintf(err,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            ocid::core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            ocid::core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
        if (s.code == ocid::core::StatusCode::Io && s.aux != 0) {
            std::fprintf(err, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
        }
    }

    void print_decode_error(std::FILE* err, const char* context, ocid::core::DecodeError e) noexcept {
        switch (e.kind) {
            case ocid::core::DecodeErrorKind::LengthMismatch:
                std::fprintf(err, "error: %s: %s (expected=%u bytes, actual=%u bytes)\n",
                    context, ocid::core::decode_error_kind_name(e.kind), e.expected, e.actual);
                return;
            case ocid::core::DecodeErrorKind::InvalidCharacter:
                std::fprintf(err, "error: %s: %s (position=%u)\n",
                    context, ocid::core::decode_error_kind_name(e.kind), e.position);
                return;
            case ocid::core::DecodeErrorKind::None:
                return;
        }
    }

    int run_tool(const CliArgs& args, const CliConfig& base, std::FILE* out, std::FILE* err) {
        CliConfig cfg = base;
        bool help = false;

        u32 consumed = 0;
        if (!parse_and_apply(args, &cfg, &help, &consumed, err)) {
            return EXIT_FAILURE;
        }
        if (help) {
            print_usage(out);
            return EXIT_SUCCESS;
        }

        const CliArgs rest{args.argv + consumed, args.argc - consumed};
        if (rest.argc == 0) {
            print_usage(err);
            return EXIT_FAILURE;
        }

        CommandInvocation inv{};
        Status s = parse_command(rest, kCommandSpecs, kCommandSpecCount, &inv, &consumed);
        if (!ocid::core::is_ok(s)) {
            std::fprintf(err, "error: unknown command '%s'\n", rest.argv[0]);
            print_usage(err);
            return EXIT_FAILURE;
        }

        // Options may also follow the command name.
        if (!parse_and_apply(inv.args, &cfg, &help, &consumed, err)) {
            return EXIT_FAILURE;
        }
        if (help) {
            print_usage(out);
            return EXIT_SUCCESS;
        }
        const CliArgs positional{inv.args.argv + consumed, inv.args.argc - consumed};

        switch (inv.id) {
            case CommandId::Help:
                print_usage(out);
                return EXIT_SUCCESS;
            case CommandId::Hash:
                return cmd_hash(positional, cfg, out, err);
            case CommandId::Rand:
                return cmd_rand(positional, cfg, out, err);
            case CommandId::Parse:
                return cmd_parse(positional, out, err);
            case CommandId::Raw:
                return cmd_raw(positional, cfg, out, err);
            case CommandId::None:
                break;
        }
        print_usage(err);
        return EXIT_FAILURE;
    }
} // namespace ocid::cli
