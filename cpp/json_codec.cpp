#include "json_codec.h"
#include "errors.h"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>

namespace txguard {

using nlohmann::json;

namespace {

std::string require_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) throw InvalidTransaction(std::string("missing ") + key);
    if (!it->is_string()) throw InvalidTransaction(std::string(key) + " must be a string");
    return it->get<std::string>();
}

// Reads j[key] into out when present. Throws ConfigError on a type mismatch.
template <typename T>
void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("config key '") + key + "': " + e.what());
    }
}

// Integer settings: rejects fractions and anything T cannot hold.
template <typename T>
void read_integer(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    const auto bad = [key](const char* why) {
        return ConfigError(std::string("config key '") + key + "' " + why);
    };
    if (it->is_number_unsigned()) {
        const std::uint64_t v = it->get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) throw bad("is out of range");
        out = static_cast<T>(v);
    } else if (it->is_number_integer()) {
        const std::int64_t v = it->get<std::int64_t>();
        if (v < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
            (v > 0 && static_cast<std::uint64_t>(v) > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))) {
            throw bad("is out of range");
        }
        out = static_cast<T>(v);
    } else {
        throw bad("must be an integer");
    }
}

void read_ms(const json& j, const char* key, std::chrono::milliseconds& out) {
    long long ms = out.count();
    read_integer(j, key, ms);
    out = std::chrono::milliseconds(ms);
}

void read_seconds(const json& j, const char* key, std::chrono::milliseconds& out) {
    constexpr double kMaxSeconds = 1e12;
    double s = out.count() / 1000.0;
    read_key(j, key, s);
    if (!std::isfinite(s) || s < 0.0 || s > kMaxSeconds) {
        throw ConfigError(std::string("config key '") + key + "' is out of range");
    }
    out = std::chrono::milliseconds(static_cast<long long>(s * 1000.0));
}

const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return empty;
    if (!it->is_object()) throw ConfigError(std::string("config key '") + key + "' must be an object");
    return *it;
}

} // namespace

Transaction transaction_from_json(const json& j) {
    if (!j.is_object()) throw InvalidTransaction("request must be a JSON object");

    Transaction t;
    t.user_id = require_string(j, "user_id");
    t.transaction_id = require_string(j, "transaction_id");
    t.location_country = require_string(j, "location_country");
    t.transaction_time = require_string(j, "transaction_time");

    auto amount = j.find("amount");
    if (amount == j.end() || amount->is_null()) throw InvalidTransaction("missing amount");
    if (!amount->is_number()) throw InvalidTransaction("amount must be a number");
    t.amount = amount->get<double>();
    return t;
}

json to_json(const FeatureVector& f) {
    return json{
        {"transaction_count_in_window", f.transaction_count_in_window},
        {"distinct_countries_in_window", f.distinct_countries_in_window},
        {"amount_zscore_vs_recent_avg", f.amount_zscore_vs_recent_avg},
        {"seconds_since_last_txn", f.seconds_since_last_txn},
        {"hour_of_day", f.hour_of_day},
        {"is_new_country_for_user", f.is_new_country_for_user},
        {"amount", f.amount},
    };
}

json to_json(const RuleHit& h) {
    return json{{"rule", h.rule_name}, {"severity", to_string(h.severity)}, {"message", h.message}};
}

json to_json(const Verdict& v) {
    json hits = json::array();
    for (const auto& h : v.rule_hits) hits.push_back(to_json(h));
    return json{
        {"user_id", v.user_id},
        {"transaction_id", v.transaction_id},
        {"action", to_string(v.action)},
        {"reason", v.reason},
        {"risk_score", v.risk_score},
        {"anomaly_score", v.anomaly_score},
        {"rule_hits", hits},
        {"degraded", v.degraded},
        {"warnings", v.warnings},
        {"features", to_json(v.features)},
    };
}

json to_json(const EngineConfig& c) {
    return json{
        {"window_seconds", c.velocity.window.count() / 1000.0},
        {"sweep_interval", c.velocity.sweep_interval},
        {"rules", {
            {"velocity_threshold", c.rules.velocity_threshold},
            {"geo_enabled", c.rules.geo_enabled},
            {"amount_zscore_threshold", c.rules.amount_zscore_threshold},
            {"night_start_hour", c.rules.night_start_hour},
            {"night_end_hour", c.rules.night_end_hour},
        }},
        {"fusion", {
            {"block_threshold", c.fusion.block_threshold},
            {"flag_threshold", c.fusion.flag_threshold},
            {"anomaly_threshold", c.fusion.anomaly_threshold},
        }},
        {"drift", {
            {"means", c.drift.means},
            {"stds", c.drift.stds},
            {"z_threshold", c.drift.z_threshold},
        }},
        {"store_timeout_ms", c.store_timeout.count()},
        {"scorer_timeout_ms", c.scorer_timeout.count()},
        {"failure_policy", to_string(c.failure_policy)},
        {"max_future_skew_ms", c.max_future_skew.count()},
        {"max_in_flight_calls", c.max_in_flight_calls},
        {"replay_capacity", c.replay_capacity},
        {"journal_capacity", c.journal_capacity},
    };
}

EngineConfig config_from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("config must be a JSON object");

    EngineConfig c;
    read_seconds(j, "window_seconds", c.velocity.window);
    read_integer(j, "sweep_interval", c.velocity.sweep_interval);

    const json& rules = section(j, "rules");
    read_integer(rules, "velocity_threshold", c.rules.velocity_threshold);
    read_key(rules, "geo_enabled", c.rules.geo_enabled);
    read_key(rules, "amount_zscore_threshold", c.rules.amount_zscore_threshold);
    read_integer(rules, "night_start_hour", c.rules.night_start_hour);
    read_integer(rules, "night_end_hour", c.rules.night_end_hour);

    const json& fusion = section(j, "fusion");
    read_key(fusion, "block_threshold", c.fusion.block_threshold);
    read_key(fusion, "flag_threshold", c.fusion.flag_threshold);
    read_key(fusion, "anomaly_threshold", c.fusion.anomaly_threshold);

    const json& drift = section(j, "drift");
    read_key(drift, "means", c.drift.means);
    read_key(drift, "stds", c.drift.stds);
    read_key(drift, "z_threshold", c.drift.z_threshold);

    read_ms(j, "store_timeout_ms", c.store_timeout);
    read_ms(j, "scorer_timeout_ms", c.scorer_timeout);
    read_ms(j, "max_future_skew_ms", c.max_future_skew);
    read_integer(j, "max_in_flight_calls", c.max_in_flight_calls);
    read_integer(j, "replay_capacity", c.replay_capacity);
    read_integer(j, "journal_capacity", c.journal_capacity);

    std::string policy = to_string(c.failure_policy);
    read_key(j, "failure_policy", policy);
    if (!parse_failure_policy(policy, c.failure_policy)) {
        throw ConfigError("failure_policy must be 'fail_open' or 'fail_closed', got '" + policy + "'");
    }

    validate(c);
    return c;
}

EngineConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file: " + path);
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
    return config_from_json(j);
}

json process_line(DecisionEngine& engine, const std::string& line, std::size_t lineno) {
    json request;
    try {
        request = json::parse(line);
        return to_json(engine.decide(transaction_from_json(request)));
    } catch (const json::parse_error& e) {
        return json{{"line", lineno}, {"error", "InvalidTransaction"}, {"detail", e.what()}};
    } catch (const InvalidTransaction& e) {
        json out{{"line", lineno}, {"error", "InvalidTransaction"}, {"detail", e.what()}};
        if (request.is_object() && request.contains("transaction_id")) {
            out["transaction_id"] = request["transaction_id"];
        }
        return out;
    }
}

} // namespace txguard
