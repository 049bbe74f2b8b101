//
// Created by Giuseppe Francione on 18/02/26.
//

#include "../libfolio/include/naming_strategy.hpp"
#include <gtest/gtest.h>

using namespace folio;

class NamingStrategyTest : public ::testing::Test {
protected:
    NamingRules rules;

    void SetUp() override {
        rules.original_stem = "report";
    }
};

TEST_F(NamingStrategyTest, DefaultFormPadsPageToThreeDigits) {
    EXPECT_EQ(resolve_name(1, rules), "report-001");
    EXPECT_EQ(resolve_name(42, rules), "report-042");
    EXPECT_EQ(resolve_name(1234, rules), "report-1234");
}

TEST_F(NamingStrategyTest, TemplateSubstitutesOriginalAndPage) {
    rules.name_template = "{original}_p{page}";
    EXPECT_EQ(resolve_name(7, rules), "report_p007");
    EXPECT_EQ(expand_template("{page}-{page}", "x", 3), "003-003");
    EXPECT_EQ(expand_template("static", "x", 3), "static");
}

TEST_F(NamingStrategyTest, BookmarkBeatsTemplate) {
    rules.name_template = "{original}-{page}";
    rules.bookmark_titles = {{2, "Intro: Part/1"}};
    EXPECT_EQ(resolve_name(2, rules), "Intro Part1");
    EXPECT_EQ(resolve_name(3, rules), "report-003");
}

TEST_F(NamingStrategyTest, BookmarkNamesAreTruncated) {
    rules.bookmark_titles = {{1, std::string(250, 'a')}};
    EXPECT_EQ(resolve_name(1, rules).size(), kMaxBookmarkNameLength);
}

TEST_F(NamingStrategyTest, OverrideBeatsEverything) {
    rules.name_template = "{original}-{page}";
    rules.bookmark_titles = {{1, "Title"}};
    rules.overrides = {{1, "cover"}};
    EXPECT_EQ(resolve_name(1, rules), "cover");
}

TEST_F(NamingStrategyTest, EmptyLevelFallsThrough) {
    rules.overrides = {{1, ""}};
    rules.bookmark_titles = {{1, "///"}};
    EXPECT_EQ(resolve_name(1, rules), "report-001");
}

TEST_F(NamingStrategyTest, PlanKeepsNamesUnique) {
    rules.overrides = {{1, "same"}, {2, "same"}, {3, "SAME"}};
    NamingPlan plan(rules);
    EXPECT_EQ(plan.assign(1), "same");
    EXPECT_EQ(plan.assign(2), "same-002");
    EXPECT_EQ(plan.assign(3), "SAME-003");
}

TEST_F(NamingStrategyTest, PlanAddsCounterWhenPageSuffixIsTaken) {
    rules.overrides = {{1, "a-002"}, {2, "a"}, {3, "a"}};
    NamingPlan plan(rules);
    EXPECT_EQ(plan.assign(1), "a-002");
    EXPECT_EQ(plan.assign(2), "a");
    EXPECT_EQ(plan.assign(3), "a-003");

    NamingRules clash;
    clash.original_stem = "doc";
    clash.overrides = {{5, "x"}, {6, "x-005"}};
    NamingPlan second(clash);
    EXPECT_EQ(second.assign(6), "x-005");
    EXPECT_EQ(second.assign(5), "x");
    EXPECT_EQ(second.assign(5), "x-005-2");
}

TEST(NamesScriptTest, LinesFollowCounterAndJumps) {
    const auto names = parse_names_script({"cover", "intro", "10=chapter", "next"});
    EXPECT_EQ(names, (std::map<int, std::string>{
        {1, "cover"}, {2, "intro"}, {10, "chapter"}, {11, "next"}}));
}

TEST(NamesScriptTest, UnparsableAssignmentIsSkippedButCounts) {
    const auto names = parse_names_script({"a", "bad=line", "c"});
    EXPECT_EQ(names, (std::map<int, std::string>{{1, "a"}, {3, "c"}}));
}

TEST(NamesScriptTest, FirstEntryForAPageWins) {
    const auto names = parse_names_script({"a", "1=b"});
    EXPECT_EQ(names.at(1), "a");
    EXPECT_EQ(names.size(), 1u);
}
