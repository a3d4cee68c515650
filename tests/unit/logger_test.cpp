#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>

#include "utils/logger.h"
#include "test_support.h"

namespace fs = std::filesystem;
using segdl::test::TempDir;

namespace {

std::string format_date(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

void touch_file(const fs::path& path) {
    std::ofstream ofs(path);
    ofs << "log";
}

}  // namespace

TEST(LoggerTest, ParsesLevelsCaseInsensitively) {
    using segdl::logger::parse_level;
    EXPECT_EQ(parse_level("TRACE"), spdlog::level::trace);
    EXPECT_EQ(parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_level("Warning"), spdlog::level::warn);
    EXPECT_EQ(parse_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_level("off"), spdlog::level::off);
    EXPECT_EQ(parse_level("nonsense"), spdlog::level::info);
}

TEST(LoggerTest, LogDirComesFromEnvironment) {
    TempDir temp;
    const char* saved = std::getenv("SEGDL_LOG_DIR");
    const std::string saved_value = saved ? saved : "";
    setenv("SEGDL_LOG_DIR", temp.path().c_str(), 1);

    EXPECT_EQ(segdl::logger::get_log_dir(), temp.path().string());
    const auto file = fs::path(segdl::logger::get_log_file_path()).filename().string();
    EXPECT_EQ(file, "segdl.jsonl." + format_date(std::chrono::system_clock::now()));

    if (saved) {
        setenv("SEGDL_LOG_DIR", saved_value.c_str(), 1);
    } else {
        unsetenv("SEGDL_LOG_DIR");
    }
}

TEST(LoggerTest, RetentionDaysFallsBackOnInvalidValues) {
    const char* saved = std::getenv("SEGDL_LOG_RETENTION_DAYS");
    const std::string saved_value = saved ? saved : "";

    setenv("SEGDL_LOG_RETENTION_DAYS", "30", 1);
    EXPECT_EQ(segdl::logger::get_retention_days(), 30);
    setenv("SEGDL_LOG_RETENTION_DAYS", "0", 1);
    EXPECT_EQ(segdl::logger::get_retention_days(), 7);
    setenv("SEGDL_LOG_RETENTION_DAYS", "abc", 1);
    EXPECT_EQ(segdl::logger::get_retention_days(), 7);

    if (saved) {
        setenv("SEGDL_LOG_RETENTION_DAYS", saved_value.c_str(), 1);
    } else {
        unsetenv("SEGDL_LOG_RETENTION_DAYS");
    }
}

TEST(LoggerTest, RemovesLogsOlderThanRetention) {
    TempDir temp;
    auto now = std::chrono::system_clock::now();
    fs::path old_file = temp.path() / ("segdl.jsonl." + format_date(now - std::chrono::hours(24 * 10)));
    fs::path recent_file = temp.path() / ("segdl.jsonl." + format_date(now - std::chrono::hours(24)));
    fs::path unrelated = temp.path() / "other.log";
    touch_file(old_file);
    touch_file(recent_file);
    touch_file(unrelated);

    segdl::logger::cleanup_old_logs(temp.path().string(), 7);

    EXPECT_FALSE(fs::exists(old_file));
    EXPECT_TRUE(fs::exists(recent_file));
    EXPECT_TRUE(fs::exists(unrelated));
}

TEST(LoggerTest, InitWithSinkCapturesMessagesAtLevel) {
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    segdl::logger::init("warn", "%l %v", "", {sink});

    spdlog::info("hidden message");
    spdlog::warn("Component: visible {}", 42);
    spdlog::default_logger()->flush();

    const auto out = captured.str();
    EXPECT_EQ(out.find("hidden message"), std::string::npos);
    EXPECT_NE(out.find("warning Component: visible 42"), std::string::npos);

    // captured goes out of scope; later tests must not log into it
    segdl::logger::init("info", "", "", {std::make_shared<spdlog::sinks::null_sink_mt>()});
}
