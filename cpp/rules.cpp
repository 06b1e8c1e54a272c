#include "rules.h"

namespace txguard {

bool in_night_band(int hour, int start_hour, int end_hour) {
    if (start_hour <= end_hour) return hour >= start_hour && hour <= end_hour;
    return hour >= start_hour || hour <= end_hour;
}

std::vector<RuleHit> evaluate_rules(const RuleConfig& config, const FeatureVector& f) {
    std::vector<RuleHit> hits;

    // The window count excludes the transaction being scored.
    if (f.transaction_count_in_window + 1 >= config.velocity_threshold) {
        hits.push_back({"velocity", Severity::High, "High transaction velocity"});
    }
    if (config.geo_enabled && f.is_new_country_for_user && f.transaction_count_in_window > 0) {
        hits.push_back({"geo_jump", Severity::Medium, "Geo-location change"});
    }
    if (f.amount_zscore_vs_recent_avg > config.amount_zscore_threshold) {
        hits.push_back({"amount_spike", Severity::High, "Sudden amount spike"});
    }
    if (in_night_band(f.hour_of_day, config.night_start_hour, config.night_end_hour)) {
        hits.push_back({"odd_hour", Severity::Low, "Unusual transaction time"});
    }
    return hits;
}

} // namespace txguard
