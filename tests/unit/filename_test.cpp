#include <gtest/gtest.h>

#include "utils/filename.h"

using namespace segdl;

TEST(FilenameTest, PercentDecode) {
    EXPECT_EQ(percentDecode("a%20b"), "a b");
    EXPECT_EQ(percentDecode("%E3%81%82"), "\xE3\x81\x82");
    EXPECT_EQ(percentDecode("100%"), "100%");
    EXPECT_EQ(percentDecode("%zz"), "%zz");
    EXPECT_EQ(percentDecode("%4"), "%4");
}

TEST(FilenameTest, UsesLastUrlPathComponent) {
    EXPECT_EQ(filenameFromHeaders("https://example.com/pub/ubuntu.iso", ""), "ubuntu.iso");
    EXPECT_EQ(filenameFromHeaders("https://example.com/pub/my%20file.tar.gz?sig=1#frag", ""),
              "my file.tar.gz");
}

TEST(FilenameTest, ContentDispositionWins) {
    EXPECT_EQ(filenameFromHeaders("https://example.com/download?id=7", "attachment; filename=\"report.pdf\""),
              "report.pdf");
    EXPECT_EQ(filenameFromHeaders("https://example.com/x", "attachment; filename=plain.txt; size=10"),
              "plain.txt");
}

TEST(FilenameTest, StripsDirectoriesFromHeaderNames) {
    EXPECT_EQ(filenameFromHeaders("https://example.com/x", "attachment; filename=\"../../etc/passwd\""),
              "passwd");
    EXPECT_EQ(filenameFromHeaders("https://example.com/x", "attachment; filename=\"..%2F..%2Fevil\""), "evil");
}

TEST(FilenameTest, FallsBackToIndexHtml) {
    EXPECT_EQ(filenameFromHeaders("https://example.com/", ""), "index.html");
    EXPECT_EQ(filenameFromHeaders("https://example.com", ""), "index.html");
    EXPECT_EQ(filenameFromHeaders("https://example.com/a/..", "attachment; filename=\"\""), "index.html");
}
