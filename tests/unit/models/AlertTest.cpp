/**
 * @file AlertTest.cpp
 * @brief Unit tests for threshold classification and alert queries
 */

#include <gtest/gtest.h>

#include "models/Alert.hpp"

// Test: a value equal to a threshold belongs to the higher level
TEST(AlertClassifyTest, Classify_BoundaryBelongsToHigherLevel) {
    EXPECT_EQ(classify(49.9, 50, 60), AlertLevel::Clear);
    EXPECT_EQ(classify(50, 50, 60), AlertLevel::Warn);
    EXPECT_EQ(classify(59.9, 50, 60), AlertLevel::Warn);
    EXPECT_EQ(classify(60, 50, 60), AlertLevel::Crit);
}

TEST(AlertClassifyTest, Classify_EqualThresholdsSkipWarn) {
    EXPECT_EQ(classify(1, 1, 1), AlertLevel::Crit);
    EXPECT_EQ(classify(0, 1, 1), AlertLevel::Clear);
}

TEST(AlertClassifyTest, ClassifyBelow_SmallerIsWorseAndZeroDisables) {
    EXPECT_EQ(classify_below(20, 14, 3), AlertLevel::Clear);
    EXPECT_EQ(classify_below(14, 14, 3), AlertLevel::Warn);
    EXPECT_EQ(classify_below(3, 14, 3), AlertLevel::Crit);
    EXPECT_EQ(classify_below(1, 0, 0), AlertLevel::Clear);
    EXPECT_EQ(classify_below(1, 14, 0), AlertLevel::Warn);
}

TEST(AlertModelTest, RuleKindNames_RoundTrip) {
    for (auto kind : ALL_RULE_KINDS) {
        auto parsed = rule_kind_from_string(to_string(kind));
        ASSERT_TRUE(parsed.has_value()) << to_string(kind);
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(rule_kind_from_string("threshold-everything").has_value());
}

TEST(AlertModelTest, Key_CombinesDeviceAndRule) {
    Alert alert;
    alert.device = "sda";
    alert.rule = RuleKind::SectorCount;
    EXPECT_EQ(alert.key(), "sda|sector-count");
}

class AlertQueryTest : public ::testing::Test {
protected:
    Alert warn_alert;
    Alert crit_alert;

    void SetUp() override {
        warn_alert.device = "sda";
        warn_alert.rule = RuleKind::ThresholdTemp;
        warn_alert.severity = Severity::Warn;
        warn_alert.message = "Temperature 52°C >= warning threshold 50°C";
        warn_alert.last_fired_at = util::from_unix_seconds(1000);

        crit_alert.device = "/home";
        crit_alert.rule = RuleKind::ThresholdFs;
        crit_alert.severity = Severity::Crit;
        crit_alert.message = "96% full, critically low space";
        crit_alert.last_fired_at = util::from_unix_seconds(2000);
        crit_alert.resolved = true;
    }
};

TEST_F(AlertQueryTest, Matches_MinSeverityCritDropsWarn) {
    AlertQuery query;
    query.min_severity = Severity::Crit;
    EXPECT_FALSE(query.matches(warn_alert));
    EXPECT_TRUE(query.matches(crit_alert));
}

TEST_F(AlertQueryTest, Matches_ActiveOnlyDropsResolved) {
    AlertQuery query;
    query.active_only = true;
    EXPECT_TRUE(query.matches(warn_alert));
    EXPECT_FALSE(query.matches(crit_alert));
}

TEST_F(AlertQueryTest, Matches_SinceUsesLastFired) {
    AlertQuery query;
    query.since = util::from_unix_seconds(1500);
    EXPECT_FALSE(query.matches(warn_alert));
    EXPECT_TRUE(query.matches(crit_alert));
}

// Test: search is case-insensitive over device and message
TEST_F(AlertQueryTest, Matches_SearchIsCaseInsensitive) {
    AlertQuery query;
    query.search = "TEMPERATURE";
    EXPECT_TRUE(query.matches(warn_alert));
    EXPECT_FALSE(query.matches(crit_alert));

    query.search = "/HOME";
    EXPECT_TRUE(query.matches(crit_alert));
}
