#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "ocid/cli/tool.hpp"

namespace {
constexpr const char* kSequentialHex = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";
constexpr const char* kSequentialText = "--31-kF40VR71FcA2-oD2l-G3WBJ4GNM50ZP5lkS6Ww";
constexpr const char* kZeroText = "-------------------------------------------";
constexpr const char* kZeroHex = "0000000000000000000000000000000000000000000000000000000000000000";

std::string slurp(std::FILE* f) {
    std::string s;
    std::rewind(f);
    char buf[256];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        s.append(buf, n);
    }
    return s;
}

struct RunResult {
    int rc{0};
    std::string out;
    std::string err;
};

RunResult run(std::vector<const char*> argv, ocid::cli::CliConfig cfg = {}) {
    std::FILE* out = std::tmpfile();
    std::FILE* err = std::tmpfile();
    RunResult r{};
    if (out == nullptr || err == nullptr) {
        ADD_FAILURE() << "tmpfile failed";
        if (out != nullptr) std::fclose(out);
        if (err != nullptr) std::fclose(err);
        r.rc = -1;
        return r;
    }
    r.rc = ocid::cli::run_tool({argv.data(), static_cast<ocid::cli::u32>(argv.size())}, cfg, out, err);
    r.out = slurp(out);
    r.err = slurp(err);
    std::fclose(out);
    std::fclose(err);
    return r;
}
} // namespace

TEST(CliTool, HelpPrintsUsageToOut) {
    const RunResult r = run({"help"});
    EXPECT_EQ(r.rc, EXIT_SUCCESS);
    EXPECT_NE(r.out.find("usage: ocid"), std::string::npos);
    EXPECT_TRUE(r.err.empty());

    const RunResult flag = run({"-h"});
    EXPECT_EQ(flag.rc, EXIT_SUCCESS);
    EXPECT_EQ(flag.out, r.out);
}

TEST(CliTool, NoCommandPrintsUsageToErr) {
    const RunResult r = run({});
    EXPECT_EQ(r.rc, EXIT_FAILURE);
    EXPECT_TRUE(r.out.empty());
    EXPECT_NE(r.err.find("usage: ocid"), std::string::npos);
}

TEST(CliTool, UnknownCommand) {
    const RunResult r = run({"frobnicate"});
    EXPECT_EQ(r.rc, EXIT_FAILURE);
    EXPECT_NE(r.err.find("unknown command 'frobnicate'"), std::string::npos);
}

TEST(CliTool, RawPrintsText) {
    const RunResult r = run({"raw", kSequentialHex});
    EXPECT_EQ(r.rc, EXIT_SUCCESS);
    EXPECT_EQ(r.out, std::string(kSequentialText) + "\n");
}

TEST(CliTool, FormatOptionAfterCommand) {
    const RunResult r = run({"raw", "-f", "hex", kSequentialHex});
    EXPECT_EQ(r.rc, EXIT_SUCCESS);
    EXPECT_EQ(r.out, std::string(kSequentialHex) + "\n");
}

TEST(CliTool, ConfigFormatIsOverriddenByOption) {
    ocid::cli::CliConfig cfg{};
    cfg.format = ocid::cli::OutputFormat::Hex;

    const RunResult hex = run({"raw", kSequentialHex}, cfg);
    EXPECT_EQ(hex.out, std::string(kSequentialHex) + "\n");

    const RunResult text = run({"--format=text", "raw", kSequentialHex}, cfg);
    EXPECT_EQ(text.out, std::string(kSequentialText) + "\n");
}

TEST(CliTool, UnknownFormatRejected) {
    const RunResult r = run({"-f", "base32", "raw", kSequentialHex});
    EXPECT_EQ(r.rc, EXIT_FAILURE);
    EXPECT_TRUE(r.out.empty());
    EXPECT_NE(r.err.find("unknown format 'base32'"), std::string::npos);
}

TEST(CliTool, RawReportsBadHexCharacter) {
    std::string hex(kSequentialHex);
    hex[10] = 'g';
    const RunResult r = run({"raw", hex.c_str()});
    EXPECT_EQ(r.rc, EXIT_FAILURE);
    EXPECT_NE(r.err.find("InvalidCharacter (position=10)"), std::string::npos);
}

TEST(CliTool, RawReportsLength) {
    const std::string hex(kSequentialHex, 62);
    const RunResult r = run({"raw", hex.c_str()});
    EXPECT_EQ(r.rc, EXIT_FAILURE);
    EXPECT_NE(r.err.find("LengthMismatch (expected=32 bytes, actual=31 bytes)"), std::string::npos);
}

TEST(CliTool, ParsePrintsHex) {
    const RunResult r = run({"parse", "--", kSequentialText, kZeroText});
    EXPECT_EQ(r.rc, EXIT_SUCCESS);
    EXPECT_EQ(r.out, std::string(kSequentialHex) + "\n" + kZeroHex + "\n");
}

TEST(CliTool, LeadingDashIdNeedsSeparator) {
    const RunResult r = run({"parse", kZeroText});
    EXPECT_EQ(r.rc, EXIT_FAILURE);
    EXPECT_TRUE(r.out.empty());
    EXPECT_NE(r.err.find("NotFound"), std::string::npos);
}

TEST(CliTool, ParseReportsInvalidCharacter) {
    std::string text(kSequentialText);
    text[5] = '+';
    const RunResult r = run({"parse", "--", text.c_str()});
    EXPECT_EQ(r.rc, EXIT_FAILURE);
    EXPECT_NE(r.err.find("InvalidCharacter (position=5)"), std::string::npos);
}

TEST(CliTool, ParseReportsLength) {
    const RunResult r = run({"parse", "abc"});
    EXPECT_EQ(r.rc, EXIT_FAILURE);
    EXPECT_NE(r.err.find("LengthMismatch (expected=32 bytes, actual=2 bytes)"), std::string::npos);
}

TEST(CliTool, ParseRejectsNonCanonicalTail) {
    std::string text(kZeroText);
    text[42] = '0';
    const RunResult r = run({"parse", "--", text.c_str()});
    EXPECT_EQ(r.rc, EXIT_FAILURE);
    EXPECT_NE(r.err.find("InvalidCharacter (position=42)"), std::string::npos);
}

TEST(CliTool, ParseNeedsArgument) {
    const RunResult r = run({"parse"});
    EXPECT_EQ(r.rc, EXIT_FAILURE);
    EXPECT_NE(r.err.find("expected at least one id"), std::string::npos);
}

TEST(CliTool, RandRejectsCountOutOfRange) {
    EXPECT_EQ(run({"rand", "-n", "0"}).rc, EXIT_FAILURE);
    EXPECT_EQ(run({"rand", "--count=1000001"}).rc, EXIT_FAILURE);
    EXPECT_EQ(run({"rand", "stray"}).rc, EXIT_FAILURE);
}

#if defined(OCID_HAVE_LIBSODIUM) || defined(OCID_HAVE_OPENSSL)
TEST(CliTool, RandPrintsRequestedCount) {
    const RunResult r = run({"rand", "-n", "3"});
    ASSERT_EQ(r.rc, EXIT_SUCCESS);
    ASSERT_EQ(r.out.size(), 3u * 44u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(r.out[i * 44 + 43], '\n');
    }
    EXPECT_NE(r.out.substr(0, 43), r.out.substr(44, 43));
}
#endif

#if defined(OCID_HAVE_BLAKE3)
TEST(CliTool, HashFile) {
    const std::string path = ::testing::TempDir() + "ocid_cli_tool_abc.txt";
    std::FILE* f = std::fopen(path.c_str(), "wb");
    ASSERT_NE(f, nullptr);
    ASSERT_EQ(std::fwrite("abc", 1, 3, f), 3u);
    std::fclose(f);

    const RunResult r = run({"hash", path.c_str()});
    std::remove(path.c_str());
    EXPECT_EQ(r.rc, EXIT_SUCCESS);
    EXPECT_EQ(r.out, "O2Tnf2W5JIEzhYhp8neChJY4L3OSTSg2zILRQCLxbNJ  " + path + "\n");
}
#endif

TEST(CliTool, HashMissingFile) {
    const std::string path = ::testing::TempDir() + "ocid_cli_tool_does_not_exist";
    const RunResult r = run({"hash", path.c_str()});
    EXPECT_EQ(r.rc, EXIT_FAILURE);
    EXPECT_TRUE(r.out.empty());
#if defined(OCID_HAVE_BLAKE3)
    EXPECT_NE(r.err.find("Io"), std::string::npos);
#endif
}

TEST(CliTool, LoadConfigFromEnv) {
    ASSERT_EQ(::setenv("OCID_FORMAT", "hex", 1), 0);
    EXPECT_EQ(ocid::cli::load_config_from_env(nullptr).format, ocid::cli::OutputFormat::Hex);

    std::FILE* err = std::tmpfile();
    ASSERT_NE(err, nullptr);
    ASSERT_EQ(::setenv("OCID_FORMAT", "octal", 1), 0);
    const ocid::cli::CliConfig cfg = ocid::cli::load_config_from_env(err);
    EXPECT_EQ(cfg.format, ocid::cli::OutputFormat::Text);
    EXPECT_NE(slurp(err).find("ignoring OCID_FORMAT='octal'"), std::string::npos);
    std::fclose(err);

    ASSERT_EQ(::unsetenv("OCID_FORMAT"), 0);
    EXPECT_EQ(ocid::cli::load_config_from_env(nullptr).format, ocid::cli::OutputFormat::Text);
    EXPECT_EQ(ocid::cli::load_config_from_env(nullptr).count, 1);
}
