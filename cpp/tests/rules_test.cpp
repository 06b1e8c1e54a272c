#include <gtest/gtest.h>
#include "rules.h"

using namespace txguard;

namespace {

FeatureVector daytime(int count = 0) {
    FeatureVector f;
    f.transaction_count_in_window = count;
    f.hour_of_day = 12;
    return f;
}

std::vector<std::string> names(const std::vector<RuleHit>& hits) {
    std::vector<std::string> out;
    for (const auto& h : hits) out.push_back(h.rule_name);
    return out;
}

}

TEST(Rules, QuietTransactionHasNoHits) {
    EXPECT_TRUE(evaluate_rules(RuleConfig{}, daytime(1)).empty());
}

TEST(Rules, VelocityCountsCurrentTransaction) {
    RuleConfig cfg;
    EXPECT_TRUE(evaluate_rules(cfg, daytime(3)).empty());

    const auto hits = evaluate_rules(cfg, daytime(4));
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].rule_name, "velocity");
    EXPECT_EQ(hits[0].severity, Severity::High);
    EXPECT_EQ(hits[0].message, "High transaction velocity");
}

TEST(Rules, GeoJumpNeedsPriorActivity) {
    RuleConfig cfg;
    FeatureVector first = daytime(0);
    first.is_new_country_for_user = true;
    EXPECT_TRUE(evaluate_rules(cfg, first).empty());

    FeatureVector moved = daytime(1);
    moved.is_new_country_for_user = true;
    const auto hits = evaluate_rules(cfg, moved);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].severity, Severity::Medium);
    EXPECT_EQ(hits[0].message, "Geo-location change");

    cfg.geo_enabled = false;
    EXPECT_TRUE(evaluate_rules(cfg, moved).empty());
}

TEST(Rules, AmountSpikeIsStrictlyAboveThreshold) {
    RuleConfig cfg;
    FeatureVector f = daytime(2);
    f.amount_zscore_vs_recent_avg = 3.0;
    EXPECT_TRUE(evaluate_rules(cfg, f).empty());

    f.amount_zscore_vs_recent_avg = 3.01;
    const auto hits = evaluate_rules(cfg, f);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].message, "Sudden amount spike");
    EXPECT_EQ(hits[0].severity, Severity::High);
}

TEST(Rules, OddHourBand) {
    RuleConfig cfg;
    FeatureVector f = daytime();
    for (int h = 0; h <= 4; ++h) {
        f.hour_of_day = h;
        const auto hits = evaluate_rules(cfg, f);
        ASSERT_EQ(hits.size(), 1u) << "hour " << h;
        EXPECT_EQ(hits[0].severity, Severity::Low);
        EXPECT_EQ(hits[0].message, "Unusual transaction time");
    }
    f.hour_of_day = 5;
    EXPECT_TRUE(evaluate_rules(cfg, f).empty());
}

TEST(Rules, NightBandWrapsMidnight) {
    EXPECT_TRUE(in_night_band(23, 22, 3));
    EXPECT_TRUE(in_night_band(2, 22, 3));
    EXPECT_FALSE(in_night_band(12, 22, 3));
    EXPECT_TRUE(in_night_band(0, 0, 4));
    EXPECT_FALSE(in_night_band(5, 0, 4));
}

TEST(Rules, AllRulesFireInFixedOrder) {
    RuleConfig cfg;
    FeatureVector f;
    f.transaction_count_in_window = 9;
    f.is_new_country_for_user = true;
    f.amount_zscore_vs_recent_avg = 10.0;
    f.hour_of_day = 3;
    const std::vector<std::string> expected = {"velocity", "geo_jump", "amount_spike", "odd_hour"};
    EXPECT_EQ(names(evaluate_rules(cfg, f)), expected);
}
