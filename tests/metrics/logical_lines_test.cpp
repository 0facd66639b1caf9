#include <gtest/gtest.h>
#include "metrics/logical_lines.hpp"

using scorecard::metrics::LogicalLineIndex;

TEST(LogicalLinesTest, SkipsBlankAndCommentLines) {
    auto index = LogicalLineIndex::from_source(
        "x = 1\n"
        "\n"
        "# comment\n"
        "    # indented comment\n"
        "y = 2  # trailing comment\n");

    EXPECT_EQ(index.physical_lines(), 5u);
    EXPECT_EQ(index.total(), 2u);
    EXPECT_TRUE(index.starts_logical_line(1));
    EXPECT_FALSE(index.starts_logical_line(3));
    EXPECT_TRUE(index.starts_logical_line(5));
}

TEST(LogicalLinesTest, BracketedStatementCountsOnce) {
    auto index = LogicalLineIndex::from_source(
        "x = call(\n"
        "    1,\n"
        "    [2, 3],\n"
        ")\n"
        "y = 3\n");

    EXPECT_EQ(index.total(), 2u);
    EXPECT_TRUE(index.starts_logical_line(1));
    EXPECT_FALSE(index.starts_logical_line(2));
    EXPECT_FALSE(index.starts_logical_line(4));
    EXPECT_TRUE(index.starts_logical_line(5));
}

TEST(LogicalLinesTest, TripleQuotedStringCountsOnce) {
    auto index = LogicalLineIndex::from_source(
        "s = \"\"\"\n"
        "text # not a comment (\n"
        "\"\"\"\n"
        "z = 1\n");

    EXPECT_EQ(index.total(), 2u);
    EXPECT_TRUE(index.starts_logical_line(4));
}

TEST(LogicalLinesTest, BackslashContinuationCountsOnce) {
    auto index = LogicalLineIndex::from_source(
        "x = 1 + \\\n"
        "    2\n"
        "y = x\n");

    EXPECT_EQ(index.total(), 2u);
    EXPECT_FALSE(index.starts_logical_line(2));
}

TEST(LogicalLinesTest, HashAndBracketsInsideStringsAreText) {
    auto index = LogicalLineIndex::from_source(
        "s = '(# not open'\n"
        "t = \"[\"\n"
        "u = 1\n");

    EXPECT_EQ(index.total(), 3u);
}

TEST(LogicalLinesTest, HandlesCarriageReturns) {
    auto index = LogicalLineIndex::from_source("a = 1\r\n\r\nb = 2\r\n");
    EXPECT_EQ(index.total(), 2u);
    EXPECT_EQ(index.physical_lines(), 3u);
}

TEST(LogicalLinesTest, CountsRanges) {
    auto index = LogicalLineIndex::from_source("a\nb\nc\nd\ne\n");

    EXPECT_EQ(index.count(2, 4), 3u);
    EXPECT_EQ(index.count(1, 5), 5u);
    EXPECT_EQ(index.count(3, 100), 3u);
    EXPECT_EQ(index.count(4, 2), 0u);
    EXPECT_EQ(index.count(0, 3), 0u);
}

TEST(LogicalLinesTest, EmptySource) {
    auto index = LogicalLineIndex::from_source("");
    EXPECT_EQ(index.total(), 0u);
    EXPECT_EQ(index.count(1, 1), 0u);
}
