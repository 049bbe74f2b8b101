//
// Created by Giuseppe Francione on 18/02/26.
//

#include "../libfolio/include/page_range.hpp"
#include <gtest/gtest.h>

using namespace folio;

TEST(PageRangeTest, EmptyInputIsUnfiltered) {
    const auto range = PageRange::parse("");
    EXPECT_FALSE(range.is_filtered());
    EXPECT_FALSE(range.empty());
    EXPECT_TRUE(range.contains(1));
    EXPECT_TRUE(range.contains(999));
    EXPECT_EQ(range.select(3), (std::vector<int>{1, 2, 3}));

    EXPECT_FALSE(PageRange::parse("   ").is_filtered());
}

TEST(PageRangeTest, SinglesAndRangesCollapseToOrderedSet) {
    const auto range = PageRange::parse("5-8,1,3,6");
    EXPECT_TRUE(range.is_filtered());
    EXPECT_EQ(range.pages(), (std::set<int>{1, 3, 5, 6, 7, 8}));
    EXPECT_FALSE(range.contains(2));
    EXPECT_TRUE(range.contains(7));
}

TEST(PageRangeTest, ReversedRangeEmitsNothing) {
    const auto range = PageRange::parse("5-3");
    EXPECT_TRUE(range.is_filtered());
    EXPECT_TRUE(range.empty());
}

TEST(PageRangeTest, MalformedTokensAreSkipped) {
    const auto range = PageRange::parse("abc,2,-4,7-,x-9,0,4");
    EXPECT_EQ(range.pages(), (std::set<int>{2, 4}));
}

TEST(PageRangeTest, OnlyMalformedTokensYieldFilteredEmptySet) {
    const auto range = PageRange::parse("foo,bar");
    EXPECT_TRUE(range.is_filtered());
    EXPECT_TRUE(range.empty());
    EXPECT_FALSE(range.contains(1));
}

TEST(PageRangeTest, WhitespaceAroundTokensIsIgnored) {
    const auto range = PageRange::parse(" 1 , 3 - 4 ");
    EXPECT_EQ(range.pages(), (std::set<int>{1, 3, 4}));
}

TEST(PageRangeTest, SelectClampsToPageCount) {
    const auto range = PageRange::parse("2,4-10");
    EXPECT_EQ(range.select(5), (std::vector<int>{2, 4, 5}));
    EXPECT_TRUE(range.select(1).empty());
}

TEST(PageRangeTest, CanonicalFormParsesBackToSameSet) {
    const auto range = PageRange::parse("8,1,3,5-7,2");
    EXPECT_EQ(range.to_string(), "1-3,5-8");
    EXPECT_EQ(PageRange::parse(range.to_string()).pages(), range.pages());
}

TEST(PageRangeTest, PagesPastTheLimitAreDroppedInEitherForm) {
    EXPECT_EQ(PageRange::parse("1000000").pages(), (std::set<int>{1000000}));
    EXPECT_EQ(PageRange::parse("2,1000001").pages(), (std::set<int>{2}));
    EXPECT_EQ(PageRange::parse("2,5-1000001").pages(), (std::set<int>{2}));
    EXPECT_TRUE(PageRange::parse("1000001").empty());
}

TEST(PageRangeTest, ExplicitSetDropsNonPositivePages) {
    const PageRange range(std::set<int>{-1, 0, 2});
    EXPECT_EQ(range.pages(), (std::set<int>{2}));
}

TEST(PageNumbersTest, KeepsOrderAndDuplicates) {
    EXPECT_EQ(parse_page_numbers("3,1,2,1"), (std::vector<int>{3, 1, 2, 1}));
    EXPECT_EQ(parse_page_numbers("3, x, 0, -2, 5"), (std::vector<int>{3, 5}));
    EXPECT_TRUE(parse_page_numbers("").empty());
}

TEST(InsertSpecTest, ParsesPositionCountPairs) {
    const auto spec = parse_insert_spec("1:2,4:1,bad,3:0,5:x");
    EXPECT_EQ(spec, (std::map<int, int>{{1, 2}, {4, 1}}));
}
