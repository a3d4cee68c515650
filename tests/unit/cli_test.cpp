#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "utils/cli.h"
#include "utils/version.h"

using namespace segdl;

namespace {

CliResult parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);
    return parseCliArgs(static_cast<int>(args.size()), argv.data());
}

}  // namespace

TEST(CliTest, HelpFlagShowsHelpMessage) {
    auto result = parse({"segdl", "--help"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("segdl"), std::string::npos);
    EXPECT_NE(result.output.find("COMMANDS"), std::string::npos);
}

TEST(CliTest, VersionFlagShowsVersion) {
    for (const char* flag : {"--version", "-V"}) {
        auto result = parse({"segdl", flag});
        EXPECT_TRUE(result.should_exit);
        EXPECT_EQ(result.exit_code, 0);
        EXPECT_NE(result.output.find(SEGDL_VERSION), std::string::npos);
    }
}

TEST(CliTest, NoArgumentsPrintsUsageAndFails) {
    auto result = parse({"segdl"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("USAGE"), std::string::npos);
}

TEST(CliTest, UnknownCommandFails) {
    auto result = parse({"segdl", "fetch"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("unknown command 'fetch'"), std::string::npos);
}

TEST(CliTest, DownloadWithDefaults) {
    auto result = parse({"segdl", "download", "https://example.com/a.iso"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.subcommand, Subcommand::Download);
    const auto& opts = result.download_options;
    EXPECT_EQ(opts.url, "https://example.com/a.iso");
    EXPECT_TRUE(opts.output.empty());
    EXPECT_FALSE(opts.segments.has_value());
    EXPECT_FALSE(opts.max_retries.has_value());
    EXPECT_FALSE(opts.timeout_sec.has_value());
    EXPECT_FALSE(opts.single_stream);
    EXPECT_FALSE(opts.overwrite);
}

TEST(CliTest, DownloadWithAllOptions) {
    auto result = parse({"segdl", "download", "https://example.com/a.iso", "-o", "/tmp/out.iso", "-s", "8",
                         "-H", "Authorization: Bearer abc", "--header", "X-Trace:1", "--timeout", "30",
                         "--retries", "3", "--proxy", "proxy.local:3128", "--insecure", "--overwrite",
                         "--single", "-q", "-v"});
    ASSERT_FALSE(result.should_exit) << result.output;
    const auto& opts = result.download_options;
    EXPECT_EQ(opts.output, "/tmp/out.iso");
    EXPECT_EQ(opts.segments.value_or(0), 8);
    EXPECT_EQ(opts.timeout_sec.value_or(0), 30);
    EXPECT_EQ(opts.max_retries.value_or(-1), 3);
    EXPECT_EQ(opts.proxy, "proxy.local:3128");
    ASSERT_EQ(opts.headers.size(), 2u);
    EXPECT_EQ(opts.headers.at("Authorization"), "Bearer abc");
    EXPECT_EQ(opts.headers.at("X-Trace"), "1");
    EXPECT_TRUE(opts.insecure);
    EXPECT_TRUE(opts.overwrite);
    EXPECT_TRUE(opts.single_stream);
    EXPECT_TRUE(opts.quiet);
    EXPECT_TRUE(opts.verbose);
}

TEST(CliTest, DownloadRequiresUrl) {
    auto result = parse({"segdl", "download", "-s", "4"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("Error: URL required"), std::string::npos);
}

TEST(CliTest, DownloadRejectsBadValues) {
    EXPECT_EQ(parse({"segdl", "download", "u", "-s", "0"}).exit_code, 1);
    EXPECT_EQ(parse({"segdl", "download", "u", "-s", "four"}).exit_code, 1);
    EXPECT_EQ(parse({"segdl", "download", "u", "--retries", "-1"}).exit_code, 1);
    EXPECT_EQ(parse({"segdl", "download", "u", "-H", "no-colon"}).exit_code, 1);
    EXPECT_EQ(parse({"segdl", "download", "u", "--proxy", "hostonly"}).exit_code, 1);
    EXPECT_EQ(parse({"segdl", "download", "u", "--bogus"}).exit_code, 1);
    EXPECT_EQ(parse({"segdl", "download", "u", "v"}).exit_code, 1);
}

TEST(CliTest, DownloadHelp) {
    auto result = parse({"segdl", "download", "--help"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("--segments"), std::string::npos);
}

TEST(CliTest, ProbeParsesUrlAndHeaders) {
    auto result = parse({"segdl", "probe", "http://h/f", "-H", "Cookie: a=b", "-v"});
    ASSERT_FALSE(result.should_exit);
    EXPECT_EQ(result.subcommand, Subcommand::Probe);
    EXPECT_EQ(result.probe_options.url, "http://h/f");
    EXPECT_EQ(result.probe_options.headers.at("Cookie"), "a=b");
    EXPECT_TRUE(result.probe_options.verbose);
    EXPECT_EQ(subcommandToString(result.subcommand), "probe");
}

TEST(CliTest, HeaderArgumentSplitting) {
    auto h = parseHeaderArg("Range : bytes=0-1");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->first, "Range");
    EXPECT_EQ(h->second, "bytes=0-1");
    EXPECT_FALSE(parseHeaderArg(": value").has_value());
    EXPECT_FALSE(parseHeaderArg("novalue").has_value());
    auto empty = parseHeaderArg("X-Empty:");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->second.empty());
}
