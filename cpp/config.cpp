#include "config.h"
#include "errors.h"
#include <cmath>
#include <sstream>

namespace txguard {

namespace {

void require_unit(double v, const char* name) {
    if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
        std::ostringstream ss;
        ss << name << " must be within [0,1], got " << v;
        throw ConfigError(ss.str());
    }
}

void require_hour(int h, const char* name) {
    if (h < 0 || h > 23) {
        std::ostringstream ss;
        ss << name << " must be within 0..23, got " << h;
        throw ConfigError(ss.str());
    }
}

} // namespace

void validate(const EngineConfig& c) {
    if (c.velocity.window.count() <= 0) throw ConfigError("velocity window must be positive");
    if (c.velocity.sweep_interval == 0) throw ConfigError("sweep_interval must be positive");

    if (c.rules.velocity_threshold < 1) throw ConfigError("velocity_threshold must be at least 1");
    if (!std::isfinite(c.rules.amount_zscore_threshold) || c.rules.amount_zscore_threshold <= 0.0) {
        throw ConfigError("amount_zscore_threshold must be positive");
    }
    require_hour(c.rules.night_start_hour, "night_start_hour");
    require_hour(c.rules.night_end_hour, "night_end_hour");

    require_unit(c.fusion.block_threshold, "block_threshold");
    require_unit(c.fusion.flag_threshold, "flag_threshold");
    require_unit(c.fusion.anomaly_threshold, "anomaly_threshold");
    if (c.fusion.flag_threshold > c.fusion.block_threshold) {
        throw ConfigError("flag_threshold must not exceed block_threshold");
    }

    if (!std::isfinite(c.drift.z_threshold) || c.drift.z_threshold <= 0.0) {
        throw ConfigError("drift z_threshold must be positive");
    }

    if (c.store_timeout.count() <= 0) throw ConfigError("store_timeout must be positive");
    if (c.scorer_timeout.count() <= 0) throw ConfigError("scorer_timeout must be positive");
    if (c.max_future_skew.count() < 0) throw ConfigError("max_future_skew must not be negative");
    if (c.max_in_flight_calls == 0) throw ConfigError("max_in_flight_calls must be positive");
    if (c.replay_capacity == 0) throw ConfigError("replay_capacity must be positive");
    if (c.journal_capacity == 0) throw ConfigError("journal_capacity must be positive");
}

const char* to_string(FailurePolicy p) {
    return p == FailurePolicy::FailClosed ? "fail_closed" : "fail_open";
}

bool parse_failure_policy(const std::string& name, FailurePolicy& out) {
    if (name == "fail_open") out = FailurePolicy::FailOpen;
    else if (name == "fail_closed") out = FailurePolicy::FailClosed;
    else return false;
    return true;
}

std::string describe(const EngineConfig& c) {
    std::ostringstream ss;
    ss << "window=" << c.velocity.window.count() << "ms"
       << " velocity>=" << c.rules.velocity_threshold
       << " geo=" << (c.rules.geo_enabled ? "on" : "off")
       << " z>" << c.rules.amount_zscore_threshold
       << " night=" << c.rules.night_start_hour << ".." << c.rules.night_end_hour
       << " block>=" << c.fusion.block_threshold
       << " flag>=" << c.fusion.flag_threshold
       << " anomaly>=" << c.fusion.anomaly_threshold
       << " store_timeout=" << c.store_timeout.count() << "ms"
       << " scorer_timeout=" << c.scorer_timeout.count() << "ms"
       << " policy=" << to_string(c.failure_policy)
       << " max_skew=" << c.max_future_skew.count() << "ms"
       << " max_in_flight=" << c.max_in_flight_calls;
    return ss.str();
}

} // namespace txguard
