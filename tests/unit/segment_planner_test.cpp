#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "download/download_error.h"
#include "download/manifest.h"
#include "download/segment_planner.h"
#include "test_support.h"

using namespace segdl;
using segdl::test::TempDir;

namespace {

constexpr uint64_t kMiB = 1024 * 1024;

void expectTiles(const SegmentTable& table, uint64_t size) {
    ASSERT_EQ(table.segments.size(), table.segment_count);
    uint64_t expected_start = 0;
    for (size_t i = 0; i < table.segments.size(); ++i) {
        const auto& s = table.segments[i];
        EXPECT_EQ(s.index, i);
        EXPECT_EQ(s.start, expected_start) << "segment " << i;
        EXPECT_GE(s.end, s.start) << "segment " << i;
        EXPECT_EQ(s.segment_size, s.end - s.start + 1) << "segment " << i;
        expected_start = s.end + 1;
    }
    EXPECT_EQ(expected_start, size);
    EXPECT_EQ(table.totalSize(), size);
}

}  // namespace

TEST(SegmentPlannerTest, PartitionsEvenlyDivisibleSize) {
    auto table = SegmentPlanner::partition("http://h/f", "/tmp/f", 4, 1000000, std::nullopt);
    ASSERT_EQ(table.segments.size(), 4u);
    EXPECT_EQ(table.segments[0].start, 0u);
    EXPECT_EQ(table.segments[0].end, 249999u);
    EXPECT_EQ(table.segments[1].start, 250000u);
    EXPECT_EQ(table.segments[1].end, 499999u);
    EXPECT_EQ(table.segments[2].start, 500000u);
    EXPECT_EQ(table.segments[2].end, 749999u);
    EXPECT_EQ(table.segments[3].start, 750000u);
    EXPECT_EQ(table.segments[3].end, 999999u);
    for (const auto& s : table.segments) {
        EXPECT_EQ(s.segment_size, 250000u);
    }
    EXPECT_EQ(table.segments[2].path, "/tmp/f.2.bin");
    EXPECT_EQ(table.segments[1].rangeHeader(), "bytes=250000-499999");
    EXPECT_EQ(table.segments[1].rangeHeader(100), "bytes=250100-499999");
}

TEST(SegmentPlannerTest, LastSegmentEndsAtFinalByte) {
    auto table = SegmentPlanner::partition("u", "d", 3, 10, std::nullopt);
    ASSERT_EQ(table.segments.size(), 3u);
    EXPECT_EQ(table.segments[0].start, 0u);
    EXPECT_EQ(table.segments[0].end, 2u);
    EXPECT_EQ(table.segments[1].start, 3u);
    EXPECT_EQ(table.segments[1].end, 5u);
    EXPECT_EQ(table.segments[2].start, 6u);
    EXPECT_EQ(table.segments[2].end, 9u);
    EXPECT_EQ(table.segments[2].segment_size, 4u);
}

TEST(SegmentPlannerTest, SegmentsTileTheResourceWithoutGaps) {
    const uint64_t sizes[] = {1, 7, 999, 4096, 1000003, 123456789ULL, 5ULL * 1024 * kMiB + 17};
    for (uint64_t size : sizes) {
        for (size_t n : {1u, 2u, 3u, 5u, 10u, 64u}) {
            if (n > size) continue;
            SCOPED_TRACE("size=" + std::to_string(size) + " n=" + std::to_string(n));
            expectTiles(SegmentPlanner::partition("u", "d", n, size, std::nullopt), size);
        }
    }
}

TEST(SegmentPlannerTest, ClampsSegmentCountForSmallFiles) {
    EXPECT_EQ(SegmentPlanner::clampSegmentCount(10, 10 * kMiB), 5u);
    EXPECT_EQ(SegmentPlanner::clampSegmentCount(10, 50 * kMiB - 1), 5u);
    EXPECT_EQ(SegmentPlanner::clampSegmentCount(10, 50 * kMiB), 10u);
    EXPECT_EQ(SegmentPlanner::clampSegmentCount(10, 60 * kMiB), 10u);
    EXPECT_EQ(SegmentPlanner::clampSegmentCount(4, 1024), 4u);
    EXPECT_EQ(SegmentPlanner::clampSegmentCount(5, 1024), 5u);
}

TEST(SegmentPlannerTest, NeverPlansMoreSegmentsThanBytes) {
    EXPECT_EQ(SegmentPlanner::clampSegmentCount(8, 3), 3u);
    EXPECT_EQ(SegmentPlanner::clampSegmentCount(4, 1), 1u);

    TempDir dir;
    SegmentPlanner planner;
    auto table = planner.plan("http://h/tiny", dir.file("tiny"), 4, 2, std::nullopt);
    EXPECT_EQ(table.segment_count, 2u);
    expectTiles(table, 2);
}

TEST(SegmentPlannerTest, PlanPersistsManifest) {
    TempDir dir;
    const auto dest = dir.file("file.iso");
    SegmentPlanner planner;
    auto table = planner.plan("http://h/file.iso", dest, 8, 100 * kMiB, std::string("\"v1\""));
    EXPECT_EQ(table.segment_count, 8u);
    EXPECT_EQ(table.url, "http://h/file.iso");
    ASSERT_TRUE(table.etag.has_value());
    EXPECT_EQ(*table.etag, "\"v1\"");

    auto manifest = loadManifest(dest + ".json");
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->url, "http://h/file.iso");
    ASSERT_TRUE(manifest->etag.has_value());
    EXPECT_EQ(*manifest->etag, "\"v1\"");
    EXPECT_EQ(manifest->segments, 8u);
}

TEST(SegmentPlannerTest, AbsentEtagIsRecordedAsNull) {
    TempDir dir;
    const auto dest = dir.file("noetag.bin");
    SegmentPlanner planner;
    planner.plan("http://h/noetag.bin", dest, 2, 1000, std::nullopt);

    auto j = nlohmann::json::parse(test::readFile(dest + ".json"));
    ASSERT_TRUE(j.contains("etag"));
    EXPECT_TRUE(j["etag"].is_null());
    EXPECT_EQ(j["segments"].get<int>(), 2);
    EXPECT_EQ(j["url"].get<std::string>(), "http://h/noetag.bin");
}

TEST(SegmentPlannerTest, ResumeReusesRecordedSegmentCount) {
    TempDir dir;
    const auto dest = dir.file("big.bin");
    const std::string url = "http://h/big.bin";
    const std::optional<std::string> etag("abc");
    SegmentPlanner planner;

    auto first = planner.plan(url, dest, 4, 100 * kMiB, etag);
    auto second = planner.plan(url, dest, 16, 100 * kMiB, etag);
    auto third = planner.plan(url, dest, 16, 100 * kMiB, etag);

    ASSERT_EQ(second.segment_count, 4u);
    ASSERT_EQ(third.segment_count, 4u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(first.segments[i].start, second.segments[i].start);
        EXPECT_EQ(first.segments[i].end, second.segments[i].end);
        EXPECT_EQ(second.segments[i].start, third.segments[i].start);
        EXPECT_EQ(second.segments[i].end, third.segments[i].end);
    }
    EXPECT_EQ(loadManifest(dest + ".json")->segments, 4u);
}

TEST(SegmentPlannerTest, EtagMismatchReplans) {
    TempDir dir;
    const auto dest = dir.file("big.bin");
    const std::string url = "http://h/big.bin";
    SegmentPlanner planner;

    planner.plan(url, dest, 4, 100 * kMiB, std::string("old"));
    auto table = planner.plan(url, dest, 8, 100 * kMiB, std::string("new"));
    EXPECT_EQ(table.segment_count, 8u);

    auto manifest = loadManifest(dest + ".json");
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->segments, 8u);
    EXPECT_EQ(manifest->etag.value_or(""), "new");
}

TEST(SegmentPlannerTest, UrlMismatchReplans) {
    TempDir dir;
    const auto dest = dir.file("big.bin");
    SegmentPlanner planner;

    planner.plan("http://a/big.bin", dest, 4, 100 * kMiB, std::string("e"));
    auto table = planner.plan("http://b/big.bin", dest, 6, 100 * kMiB, std::string("e"));
    EXPECT_EQ(table.segment_count, 6u);
    EXPECT_EQ(loadManifest(dest + ".json")->url, "http://b/big.bin");
}

TEST(SegmentPlannerTest, ManifestIsNotAdoptedWithoutEtag) {
    TempDir dir;
    const auto dest = dir.file("big.bin");
    const std::string url = "http://h/big.bin";
    SegmentPlanner planner;

    planner.plan(url, dest, 4, 100 * kMiB, std::nullopt);
    auto table = planner.plan(url, dest, 8, 100 * kMiB, std::nullopt);
    EXPECT_EQ(table.segment_count, 8u);
}

TEST(SegmentPlannerTest, CorruptManifestIsReplaced) {
    TempDir dir;
    const auto dest = dir.file("big.bin");
    test::writeFile(dest + ".json", "{ this is not json");

    SegmentPlanner planner;
    auto table = planner.plan("http://h/big.bin", dest, 3, 100 * kMiB, std::string("e"));
    EXPECT_EQ(table.segment_count, 3u);

    auto manifest = loadManifest(dest + ".json");
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->segments, 3u);
}

TEST(SegmentPlannerTest, RejectsUnplannableInputs) {
    TempDir dir;
    SegmentPlanner planner;
    EXPECT_THROW(planner.plan("u", dir.file("a"), 4, 0, std::nullopt), InvalidPlanError);
    EXPECT_THROW(planner.plan("u", dir.file("b"), 0, 100, std::nullopt), InvalidPlanError);
    EXPECT_THROW(planner.plan("u", dir.file("c"), -3, 100, std::nullopt), InvalidPlanError);
    EXPECT_THROW(SegmentPlanner::partition("u", "d", 0, 100, std::nullopt), InvalidPlanError);
    // every segment must own at least one byte
    EXPECT_THROW(SegmentPlanner::partition("u", "d", 5, 3, std::nullopt), InvalidPlanError);
    EXPECT_THROW(SegmentPlanner::partition("u", "d", 2, 1, std::nullopt), InvalidPlanError);
    EXPECT_NO_THROW(SegmentPlanner::partition("u", "d", 3, 3, std::nullopt));
    EXPECT_FALSE(std::filesystem::exists(dir.file("a.json")));
}
