#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>

namespace txguard {

struct VelocityConfig {
    std::chrono::milliseconds window{std::chrono::minutes(10)};
    // Requests between expiry sweeps of idle users.
    std::size_t sweep_interval = 1024;
};

struct RuleConfig {
    int velocity_threshold = 5;
    bool geo_enabled = true;
    double amount_zscore_threshold = 3.0;
    int night_start_hour = 0;
    int night_end_hour = 4;
};

struct FusionConfig {
    double block_threshold = 0.85;
    double flag_threshold = 0.5;
    double anomaly_threshold = 0.7;
};

struct DriftConfig {
    std::unordered_map<std::string, double> means;
    std::unordered_map<std::string, double> stds;
    double z_threshold = 4.0;
};

// What to do when velocity state cannot be read or updated.
enum class FailurePolicy { FailOpen, FailClosed };

struct EngineConfig {
    VelocityConfig velocity;
    RuleConfig rules;
    FusionConfig fusion;
    DriftConfig drift;

    std::chrono::milliseconds store_timeout{100};
    std::chrono::milliseconds scorer_timeout{250};
    FailurePolicy failure_policy = FailurePolicy::FailOpen;

    // Transactions stamped further than this past the wall clock are rejected.
    std::chrono::milliseconds max_future_skew{std::chrono::minutes(5)};
    // Upper bound on store and scorer calls running at once, abandoned ones included.
    std::size_t max_in_flight_calls = 256;

    std::size_t replay_capacity = 10000;
    std::size_t journal_capacity = 50;
};

// Throws ConfigError describing the first invalid setting.
void validate(const EngineConfig& config);

const char* to_string(FailurePolicy p);
bool parse_failure_policy(const std::string& name, FailurePolicy& out);

// One-line summary for the startup log.
std::string describe(const EngineConfig& config);

} // namespace txguard
