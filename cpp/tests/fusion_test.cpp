#include <gtest/gtest.h>
#include "fusion.h"

using namespace txguard;

namespace {

const RuleHit kVelocity{"velocity", Severity::High, "High transaction velocity"};
const RuleHit kGeo{"geo_jump", Severity::Medium, "Geo-location change"};
const RuleHit kSpike{"amount_spike", Severity::High, "Sudden amount spike"};
const RuleHit kNight{"odd_hour", Severity::Low, "Unusual transaction time"};

int rank(Action a) {
    return a == Action::Allow ? 0 : (a == Action::Flag ? 1 : 2);
}

}

TEST(Fusion, NormalTransactionAllowed) {
    const auto r = fuse(FusionConfig{}, {}, 0.1, 0.1);
    EXPECT_EQ(r.action, Action::Allow);
    EXPECT_EQ(r.reason, "Normal transaction");
}

TEST(Fusion, HighRiskBlocksWithoutRules) {
    const auto r = fuse(FusionConfig{}, {}, 0.92, 0.04);
    EXPECT_EQ(r.action, Action::Block);
    EXPECT_EQ(r.reason, "High fraud probability");
}

TEST(Fusion, HighRuleBlocksAndNamesFirstHighHit) {
    const auto r = fuse(FusionConfig{}, {kGeo, kSpike, kNight}, 0.0, 0.0);
    EXPECT_EQ(r.action, Action::Block);
    EXPECT_EQ(r.reason, "Sudden amount spike");

    const auto both = fuse(FusionConfig{}, {kVelocity, kSpike}, 0.99, 0.0);
    EXPECT_EQ(both.reason, "High transaction velocity");
}

TEST(Fusion, BlockingRiskWithOnlyMediumHitUsesProbabilityReason) {
    const auto r = fuse(FusionConfig{}, {kGeo}, 0.9, 0.0);
    EXPECT_EQ(r.action, Action::Block);
    EXPECT_EQ(r.reason, "High fraud probability");
}

TEST(Fusion, NonHighHitFlagsWithFirstHitMessage) {
    const auto r = fuse(FusionConfig{}, {kGeo, kNight}, 0.6, 0.9);
    EXPECT_EQ(r.action, Action::Flag);
    EXPECT_EQ(r.reason, "Geo-location change");
}

TEST(Fusion, RiskCheckedBeforeAnomalyForReason) {
    EXPECT_EQ(fuse(FusionConfig{}, {}, 0.5, 0.9).reason, "Elevated risk score");
    EXPECT_EQ(fuse(FusionConfig{}, {}, 0.2, 0.7).reason, "Anomalous behavior pattern");
    EXPECT_EQ(fuse(FusionConfig{}, {}, 0.2, 0.7).action, Action::Flag);
}

TEST(Fusion, AnomalyAloneNeverBlocks) {
    EXPECT_EQ(fuse(FusionConfig{}, {}, 0.0, 1.0).action, Action::Flag);
}

TEST(Fusion, ThresholdsAreConfigurable) {
    FusionConfig cfg;
    cfg.block_threshold = 0.6;
    cfg.flag_threshold = 0.3;
    cfg.anomaly_threshold = 0.95;
    EXPECT_EQ(fuse(cfg, {}, 0.6, 0.0).action, Action::Block);
    EXPECT_EQ(fuse(cfg, {}, 0.3, 0.0).action, Action::Flag);
    EXPECT_EQ(fuse(cfg, {}, 0.0, 0.9).action, Action::Allow);
}

TEST(Fusion, BlockingRiskAlwaysBlocks) {
    const std::vector<std::vector<RuleHit>> hit_sets = {{}, {kGeo}, {kNight}, {kGeo, kNight}, {kSpike}};
    for (const auto& hits : hit_sets) {
        for (double anomaly : {0.0, 0.5, 1.0}) {
            EXPECT_EQ(fuse(FusionConfig{}, hits, 0.85, anomaly).action, Action::Block);
        }
    }
}

TEST(Fusion, MonotoneInRiskScore) {
    const std::vector<std::vector<RuleHit>> hit_sets = {{}, {kGeo}, {kNight}, {kSpike}};
    for (const auto& hits : hit_sets) {
        for (double anomaly : {0.0, 0.69, 0.7, 1.0}) {
            int previous = -1;
            for (int step = 0; step <= 100; ++step) {
                const double risk = step / 100.0;
                const int now = rank(fuse(FusionConfig{}, hits, risk, anomaly).action);
                EXPECT_GE(now, previous) << "risk " << risk << " anomaly " << anomaly;
                previous = now;
            }
        }
    }
}
