#include <gtest/gtest.h>
#include "features.h"

using namespace txguard;

namespace {

Transaction txn(double amount, const std::string& country) {
    Transaction t;
    t.user_id = "u1";
    t.transaction_id = "t1";
    t.amount = amount;
    t.location_country = country;
    return t;
}

Timestamp at(std::int64_t seconds, int hour = 12) {
    return Timestamp{seconds * 1000, hour};
}

}

TEST(Features, EmptyHistoryUsesSentinels) {
    const FeatureVector f = build_features(txn(7000.0, "Germany"), at(100, 12), {});
    EXPECT_EQ(f.transaction_count_in_window, 0);
    EXPECT_EQ(f.distinct_countries_in_window, 1);
    EXPECT_DOUBLE_EQ(f.amount_zscore_vs_recent_avg, 0.0);
    EXPECT_DOUBLE_EQ(f.seconds_since_last_txn, -1.0);
    EXPECT_EQ(f.hour_of_day, 12);
    EXPECT_TRUE(f.is_new_country_for_user);
    EXPECT_DOUBLE_EQ(f.amount, 7000.0);
}

TEST(Features, CountsAndCountries) {
    std::vector<TransactionSummary> history = {
        {10000, 100.0, "FR"},
        {20000, 100.0, "DE"},
        {30000, 100.0, "FR"},
    };
    const FeatureVector f = build_features(txn(100.0, "FR"), at(45), history);
    EXPECT_EQ(f.transaction_count_in_window, 3);
    EXPECT_EQ(f.distinct_countries_in_window, 2);
    EXPECT_FALSE(f.is_new_country_for_user);
    EXPECT_DOUBLE_EQ(f.seconds_since_last_txn, 15.0);

    const FeatureVector g = build_features(txn(100.0, "US"), at(45), history);
    EXPECT_EQ(g.distinct_countries_in_window, 3);
    EXPECT_TRUE(g.is_new_country_for_user);
}

TEST(Features, ZScoreAgainstHistory) {
    std::vector<TransactionSummary> history = {
        {0, 100.0, "DE"},
        {1000, 110.0, "DE"},
    };
    // mean 105, population stddev 5.
    const FeatureVector f = build_features(txn(130.0, "DE"), at(2), history);
    EXPECT_DOUBLE_EQ(f.amount_zscore_vs_recent_avg, 5.0);
}

TEST(Features, ZScoreZeroForSingleEntryOrFlatHistory) {
    std::vector<TransactionSummary> one = {{0, 100.0, "DE"}};
    EXPECT_DOUBLE_EQ(build_features(txn(9000.0, "DE"), at(1), one).amount_zscore_vs_recent_avg, 0.0);

    std::vector<TransactionSummary> flat = {{0, 50.0, "DE"}, {1000, 50.0, "DE"}, {2000, 50.0, "DE"}};
    EXPECT_DOUBLE_EQ(build_features(txn(9000.0, "DE"), at(3), flat).amount_zscore_vs_recent_avg, 0.0);
}

TEST(Features, LateTransactionClampsGap) {
    std::vector<TransactionSummary> history = {{50000, 10.0, "DE"}};
    EXPECT_DOUBLE_EQ(build_features(txn(10.0, "DE"), at(40), history).seconds_since_last_txn, 0.0);
}

TEST(Features, ArrayFollowsNames) {
    FeatureVector f;
    f.transaction_count_in_window = 3;
    f.is_new_country_for_user = true;
    f.amount = 42.0;
    const auto values = to_array(f);
    ASSERT_EQ(values.size(), feature_names().size());
    EXPECT_EQ(feature_names()[0], "transaction_count_in_window");
    EXPECT_DOUBLE_EQ(values[0], 3.0);
    EXPECT_DOUBLE_EQ(values[5], 1.0);
    EXPECT_DOUBLE_EQ(values[6], 42.0);
}

TEST(Features, OodWarningsFormatAndThreshold) {
    FeatureVector f;
    f.amount = 9000.0;
    f.transaction_count_in_window = 1;

    DriftConfig drift;
    drift.means["amount"] = 1000.0;
    drift.stds["amount"] = 1000.0;
    drift.means["transaction_count_in_window"] = 1.0;
    drift.stds["transaction_count_in_window"] = 2.0;
    drift.means["hour_of_day"] = 12.0;  // no stddev, skipped
    drift.z_threshold = 4.0;

    const auto w = ood_warnings(f, drift);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0], "ood_warning:amount:z=8.00 (threshold=4.00)");
}

TEST(Features, OodWarningsIgnoreDegenerateStd) {
    FeatureVector f;
    f.amount = 1e9;
    DriftConfig drift;
    drift.means["amount"] = 0.0;
    drift.stds["amount"] = 0.0;
    EXPECT_TRUE(ood_warnings(f, drift).empty());
}
