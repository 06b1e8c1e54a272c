#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace txguard {

struct Transaction {
    std::string user_id;
    std::string transaction_id;
    double amount = 0.0;
    std::string location_country;
    std::string transaction_time;
};

// Point in time of a transaction. hour_of_day is the hour as written in the
// timestamp, before any UTC offset is applied.
struct Timestamp {
    std::int64_t epoch_ms = 0;
    int hour_of_day = 0;
};

struct TransactionSummary {
    std::int64_t epoch_ms = 0;
    double amount = 0.0;
    std::string country;
};

struct FeatureVector {
    int transaction_count_in_window = 0;
    int distinct_countries_in_window = 0;
    double amount_zscore_vs_recent_avg = 0.0;
    double seconds_since_last_txn = -1.0;
    int hour_of_day = 0;
    bool is_new_country_for_user = false;
    double amount = 0.0;
};

// Order used by to_array() and by model weight files.
const std::vector<std::string>& feature_names();
std::vector<double> to_array(const FeatureVector& f);

enum class Severity { Low = 0, Medium = 1, High = 2 };

struct RuleHit {
    std::string rule_name;
    Severity severity = Severity::Low;
    std::string message;
};

enum class Action { Allow, Flag, Block };

struct Verdict {
    std::string user_id;
    std::string transaction_id;
    Action action = Action::Allow;
    std::string reason;
    double risk_score = 0.0;
    double anomaly_score = 0.0;

    std::vector<RuleHit> rule_hits;
    FeatureVector features;
    std::vector<std::string> degraded;
    std::vector<std::string> warnings;
};

const char* to_string(Action a);
const char* to_string(Severity s);

} // namespace txguard
