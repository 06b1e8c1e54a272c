#include "types.h"

namespace txguard {

const std::vector<std::string>& feature_names() {
    static const std::vector<std::string> names = {
        "transaction_count_in_window",
        "distinct_countries_in_window",
        "amount_zscore_vs_recent_avg",
        "seconds_since_last_txn",
        "hour_of_day",
        "is_new_country_for_user",
        "amount",
    };
    return names;
}

std::vector<double> to_array(const FeatureVector& f) {
    return {
        static_cast<double>(f.transaction_count_in_window),
        static_cast<double>(f.distinct_countries_in_window),
        f.amount_zscore_vs_recent_avg,
        f.seconds_since_last_txn,
        static_cast<double>(f.hour_of_day),
        f.is_new_country_for_user ? 1.0 : 0.0,
        f.amount,
    };
}

const char* to_string(Action a) {
    switch (a) {
    case Action::Allow: return "ALLOW";
    case Action::Flag: return "FLAG";
    case Action::Block: return "BLOCK";
    }
    return "ALLOW";
}

const char* to_string(Severity s) {
    switch (s) {
    case Severity::Low: return "LOW";
    case Severity::Medium: return "MEDIUM";
    case Severity::High: return "HIGH";
    }
    return "LOW";
}

} // namespace txguard
