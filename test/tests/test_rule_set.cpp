#include <gtest/gtest.h>
#include "tier_log/config/rule_set.hpp"

using tierlog::LogLevel;
using tierlog::RuleSet;

TEST(RuleSetTest, SpecificityCountsSegmentsBeforeWildcard) {
    EXPECT_EQ(RuleSet::specificity("*"), 0);
    EXPECT_EQ(RuleSet::specificity("mqtt.*"), 1);
    EXPECT_EQ(RuleSet::specificity("mqtt.transport.*"), 2);
    EXPECT_EQ(RuleSet::specificity("a.b.c"), 3);
}

TEST(RuleSetTest, WildcardMatchesPrefix) {
    EXPECT_TRUE(RuleSet::matchesWildcard("mqtt.transport", "mqtt.*"));
    EXPECT_TRUE(RuleSet::matchesWildcard("anything", "*"));
    EXPECT_TRUE(RuleSet::matchesWildcard("app", "app*"));
    EXPECT_TRUE(RuleSet::matchesWildcard("application", "app*"));
    EXPECT_FALSE(RuleSet::matchesWildcard("mqtt", "mqtt.*"));
    EXPECT_FALSE(RuleSet::matchesWildcard("other.mqtt", "mqtt.*"));
}

TEST(RuleSetTest, InnerWildcardOnlyMatchesItself) {
    EXPECT_FALSE(RuleSet::matchesWildcard("a.x.c", "a.*.c"));
    EXPECT_TRUE(RuleSet::matchesWildcard("a.*.c", "a.*.c"));
}

TEST(RuleSetTest, ParseClassifiesKeys) {
    RuleSet rules = RuleSet::parse(
        "root=WARN\n"
        "App.Database=DEBUG\n"
        "app.ui.*=TRACE\n");

    EXPECT_EQ(rules.rootLevel(), LogLevel::WARN);
    ASSERT_EQ(rules.exactRules().size(), 1u);
    EXPECT_EQ(rules.exactRules().at("app.database"), LogLevel::DEBUG);
    ASSERT_EQ(rules.wildcardRules().size(), 1u);
    EXPECT_EQ(rules.wildcardRules()[0].first, "app.ui.*");
    EXPECT_EQ(rules.wildcardRules()[0].second, LogLevel::TRACE);
}

TEST(RuleSetTest, StarKeySetsRoot) {
    RuleSet rules = RuleSet::parse("*=ERROR\n");
    EXPECT_EQ(rules.rootLevel(), LogLevel::ERROR);
    EXPECT_TRUE(rules.wildcardRules().empty());
}

TEST(RuleSetTest, ParseSkipsCommentsAndMalformedLines) {
    RuleSet rules = RuleSet::parse(
        "# comment=DEBUG\n"
        "! bang comment=DEBUG\n"
        "\n"
        "   \n"
        "no equals sign here\n"
        "=DEBUG\n"
        "empty.value=\n"
        "valid.rule=ERROR\n");

    ASSERT_EQ(rules.exactRules().size(), 1u);
    EXPECT_EQ(rules.exactRules().at("valid.rule"), LogLevel::ERROR);
    EXPECT_TRUE(rules.wildcardRules().empty());
    EXPECT_EQ(rules.rootLevel(), LogLevel::INFO);
}

TEST(RuleSetTest, ParseHandlesCrLfAndBom) {
    RuleSet rules = RuleSet::parse("\xEF\xBB\xBFroot=DEBUG\r\nnet=WARN\r\n");
    EXPECT_EQ(rules.rootLevel(), LogLevel::DEBUG);
    EXPECT_EQ(rules.exactRules().at("net"), LogLevel::WARN);
}

TEST(RuleSetTest, ValueMaySplitOnFirstEqualsOnly) {
    RuleSet rules = RuleSet::parse("weird=WARN=x\n");
    // "WARN=x" is not a level name
    EXPECT_EQ(rules.exactRules().at("weird"), LogLevel::INFO);
}

TEST(RuleSetTest, LastExactRuleWins) {
    RuleSet rules = RuleSet::parse("db=DEBUG\nDB=ERROR\n");
    ASSERT_EQ(rules.exactRules().size(), 1u);
    EXPECT_EQ(rules.exactRules().at("db"), LogLevel::ERROR);
}

TEST(RuleSetTest, DuplicateWildcardReplacesEarlier) {
    RuleSet rules = RuleSet::parse("net.*=DEBUG\nnet.*=ERROR\n");
    ASSERT_EQ(rules.wildcardRules().size(), 1u);
    EXPECT_EQ(rules.wildcardRules()[0].second, LogLevel::ERROR);
}

TEST(RuleSetTest, WildcardsSortedMostSpecificFirst) {
    RuleSet rules = RuleSet::parse(
        "a.*=WARN\n"
        "a.b.c.*=TRACE\n"
        "a.b.*=DEBUG\n");

    ASSERT_EQ(rules.wildcardRules().size(), 3u);
    EXPECT_EQ(rules.wildcardRules()[0].first, "a.b.c.*");
    EXPECT_EQ(rules.wildcardRules()[1].first, "a.b.*");
    EXPECT_EQ(rules.wildcardRules()[2].first, "a.*");
}

TEST(RuleSetTest, EqualSpecificityKeepsLoadOrder) {
    RuleSet rules = RuleSet::parse(
        "app*=ERROR\n"
        "ap*=DEBUG\n");

    EXPECT_EQ(rules.resolve("application", LogLevel::INFO), LogLevel::ERROR);
}

TEST(RuleSetTest, ScanKeysDoNotBecomeRules) {
    RuleSet rules = RuleSet::parse("scan=TRUE\nscan.period=10 seconds\n");
    EXPECT_TRUE(rules.scanEnabled());
    EXPECT_EQ(rules.scanPeriod(), std::chrono::milliseconds(10000));
    EXPECT_TRUE(rules.exactRules().empty());
    EXPECT_TRUE(rules.wildcardRules().empty());
}

TEST(RuleSetTest, ScanAnythingButTrueDisables) {
    EXPECT_FALSE(RuleSet::parse("scan=yes\n").scanEnabled());
    EXPECT_FALSE(RuleSet::parse("scan=false\n").scanEnabled());
    EXPECT_FALSE(RuleSet::parse("").scanEnabled());
}

TEST(RuleSetTest, ClearRulesResetsRoot) {
    RuleSet rules = RuleSet::parse("root=ERROR\na=DEBUG\nb.*=WARN\n");
    rules.clearRules();
    EXPECT_EQ(rules.rootLevel(), LogLevel::INFO);
    EXPECT_TRUE(rules.exactRules().empty());
    EXPECT_TRUE(rules.wildcardRules().empty());
}

TEST(RuleSetTest, RecordsWhichScanKeysWerePresent) {
    RuleSet both = RuleSet::parse("scan=false\nscan.period=5 seconds\n");
    EXPECT_TRUE(both.hasScanEnabled());
    EXPECT_TRUE(both.hasScanPeriod());

    RuleSet none = RuleSet::parse("app=DEBUG\n");
    EXPECT_FALSE(none.hasScanEnabled());
    EXPECT_FALSE(none.hasScanPeriod());
}
