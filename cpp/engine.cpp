#include "engine.h"
#include "bounded_call.h"
#include "errors.h"
#include "features.h"
#include "fusion.h"
#include "log.h"
#include "rules.h"
#include "timestamp.h"
#include <chrono>
#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <sstream>
#include <utility>

namespace txguard {

namespace {

const char* const kStateDegraded = "velocity state unavailable";
const char* const kRiskDegraded = "risk scorer unavailable";
const char* const kAnomalyDegraded = "anomaly scorer unavailable";

std::int64_t wall_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string annotate(const std::string& reason, const std::vector<std::string>& degraded) {
    if (degraded.empty()) return reason;
    std::ostringstream ss;
    ss << reason << " (degraded: ";
    for (size_t i = 0; i < degraded.size(); ++i) {
        if (i) ss << "; ";
        ss << degraded[i];
    }
    ss << ")";
    return ss.str();
}

} // namespace

Timestamp validate_transaction(const Transaction& txn) {
    if (txn.user_id.empty()) throw InvalidTransaction("missing user_id");
    if (txn.transaction_id.empty()) throw InvalidTransaction("missing transaction_id");
    if (txn.location_country.empty()) throw InvalidTransaction("missing location_country");
    if (!std::isfinite(txn.amount) || txn.amount < 0.0) {
        std::ostringstream ss;
        ss << "amount must be a non-negative number, got " << txn.amount;
        throw InvalidTransaction(ss.str());
    }
    return parse_timestamp(txn.transaction_time);
}

Timestamp validate_transaction(const Transaction& txn, std::int64_t now_ms,
                               std::chrono::milliseconds max_future_skew) {
    const Timestamp ts = validate_transaction(txn);
    if (ts.epoch_ms > now_ms + max_future_skew.count()) {
        throw InvalidTransaction("transaction_time is in the future: '" + txn.transaction_time + "'");
    }
    return ts;
}

DecisionEngine::DecisionEngine(
    EngineConfig config,
    std::shared_ptr<const Scorer> risk_scorer,
    std::shared_ptr<const Scorer> anomaly_scorer,
    std::shared_ptr<VelocityStore> store
)
    : config_(std::move(config)),
      risk_scorer_(std::move(risk_scorer)),
      anomaly_scorer_(std::move(anomaly_scorer)),
      store_(std::move(store)),
      replay_(config_.replay_capacity),
      journal_(config_.journal_capacity),
      calls_(std::make_shared<CallBudget>(config_.max_in_flight_calls)),
      event_clock_ms_(std::numeric_limits<std::int64_t>::min()) {
    validate(config_);
    if (!store_) store_ = std::make_shared<InMemoryVelocityStore>();
    if (!risk_scorer_) log::warn("ENGINE", "no risk scorer configured, risk signal disabled");
    if (!anomaly_scorer_) log::warn("ENGINE", "no anomaly scorer configured, anomaly signal disabled");
    log::info("ENGINE", "config " + describe(config_));
}

Verdict DecisionEngine::decide(const Transaction& txn) {
    Timestamp ts;
    try {
        ts = validate_transaction(txn, wall_clock_ms(), config_.max_future_skew);
    } catch (const InvalidTransaction& e) {
        ++invalid_;
        log::debug("ENGINE", std::string("rejected ") + txn.transaction_id + ": " + e.what());
        throw;
    }

    ReplayCache::Claim claim = replay_.claim(txn.user_id, txn.transaction_id);
    if (!claim.owner) {
        ++replays_;
        log::debug("ENGINE", "replay " + txn.user_id + "/" + txn.transaction_id);
        return claim.verdict.get();
    }

    try {
        Verdict v = evaluate(txn, ts);
        replay_.publish(claim, v);
        journal_.record(v);
        count(v);
        return v;
    } catch (...) {
        replay_.abandon(claim, std::current_exception());
        throw;
    }
}

Verdict DecisionEngine::evaluate(const Transaction& txn, const Timestamp& ts) {
    std::vector<std::string> degraded;

    std::vector<TransactionSummary> history;
    const bool state_ok = fetch_history(txn, ts, history);
    advance_event_clock(ts.epoch_ms);
    maybe_sweep();

    const FeatureVector features = build_features(txn, ts, history);
    std::vector<RuleHit> hits = evaluate_rules(config_.rules, features);

    ScoreOutcome risk, anomaly;
    score(features, risk, anomaly);

    FusionResult fused = fuse(config_.fusion, hits, risk.value, anomaly.value);

    if (!state_ok) {
        degraded.push_back(kStateDegraded);
        if (config_.failure_policy == FailurePolicy::FailClosed && fused.action == Action::Allow) {
            fused.action = Action::Flag;
            fused.reason = "Fail-closed policy";
        }
    }
    if (!risk.ok) degraded.push_back(kRiskDegraded);
    if (!anomaly.ok) degraded.push_back(kAnomalyDegraded);

    Verdict v;
    v.user_id = txn.user_id;
    v.transaction_id = txn.transaction_id;
    v.action = fused.action;
    v.reason = annotate(fused.reason, degraded);
    v.risk_score = risk.value;
    v.anomaly_score = anomaly.value;
    v.rule_hits = std::move(hits);
    v.features = features;
    v.degraded = std::move(degraded);
    v.warnings = ood_warnings(features, config_.drift);

    if (!v.degraded.empty()) {
        log::warn("ENGINE", "degraded verdict " + v.user_id + "/" + v.transaction_id + ": " + v.reason);
    } else if (log::enabled(log::Level::Debug)) {
        std::ostringstream ss;
        ss << v.user_id << "/" << v.transaction_id << " " << to_string(v.action)
           << " risk=" << v.risk_score << " anomaly=" << v.anomaly_score << " reason=" << v.reason;
        log::debug("ENGINE", ss.str());
    }
    return v;
}

bool DecisionEngine::fetch_history(const Transaction& txn, const Timestamp& ts,
                                   std::vector<TransactionSummary>& history) {
    std::shared_ptr<VelocityStore> store = store_;
    const std::string user = txn.user_id;
    const TransactionSummary summary{ts.epoch_ms, txn.amount, txn.location_country};
    const std::chrono::milliseconds window = config_.velocity.window;

    try {
        // The append completes on its own thread even if we stop waiting.
        auto pending = launch_detached(calls_, [store, user, summary, window]() {
            return store->record_and_fetch(user, summary, window);
        }, "velocity store");
        const auto deadline = std::chrono::steady_clock::now() + config_.store_timeout;
        history = await_until(pending, deadline, "velocity store");
        return true;
    } catch (const Timeout& e) {
        log::warn("STORE", std::string(e.what()) + " for user " + user);
    } catch (const StateUnavailable& e) {
        log::warn("STORE", std::string("velocity store unavailable: ") + e.what());
    } catch (const Overloaded& e) {
        log::warn("STORE", e.what());
    } catch (const std::exception& e) {
        log::error("STORE", std::string("velocity store failed: ") + e.what());
    } catch (...) {
        log::error("STORE", "velocity store failed with an unknown exception");
    }
    history.clear();
    return false;
}

void DecisionEngine::score(const FeatureVector& features, ScoreOutcome& risk, ScoreOutcome& anomaly) const {
    struct Job {
        const char* name;
        std::shared_ptr<const Scorer> scorer;
        ScoreOutcome* out;
        std::future<double> pending;
    };
    Job jobs[] = {
        {"risk", risk_scorer_, &risk, {}},
        {"anomaly", anomaly_scorer_, &anomaly, {}},
    };

    // Both scorers share one deadline.
    const auto deadline = std::chrono::steady_clock::now() + config_.scorer_timeout;
    for (auto& job : jobs) {
        if (!job.scorer) continue;
        std::shared_ptr<const Scorer> scorer = job.scorer;
        const std::string name = std::string(job.name) + " scorer";
        try {
            job.pending = launch_detached(calls_, [scorer, features, name]() {
                try {
                    return scorer->score(features);
                } catch (const std::exception& e) {
                    throw ScorerUnavailable(name + " unavailable: " + e.what());
                }
            }, name);
        } catch (const std::exception& e) {
            log::warn("SCORER", e.what());
        }
    }

    for (auto& job : jobs) {
        if (!job.pending.valid()) continue;
        try {
            const double raw = await_until(job.pending, deadline, std::string(job.name) + " scorer");
            job.out->value = checked_score(raw, job.name);
            job.out->ok = true;
        } catch (const Error& e) {
            log::warn("SCORER", e.what());
        } catch (const std::exception& e) {
            log::error("SCORER", std::string(job.name) + " scorer failed: " + e.what());
        } catch (...) {
            log::error("SCORER", std::string(job.name) + " scorer failed with an unknown exception");
        }
    }
}

void DecisionEngine::advance_event_clock(std::int64_t epoch_ms) {
    std::int64_t seen = event_clock_ms_.load();
    while (seen < epoch_ms && !event_clock_ms_.compare_exchange_weak(seen, epoch_ms)) {
    }
}

// Idle users are judged against the newest transaction time seen, held back
// to the wall clock, so no request can expire other users' state early.
void DecisionEngine::maybe_sweep() {
    if (++since_sweep_ % config_.velocity.sweep_interval != 0) return;
    const std::int64_t now_ms = std::min(event_clock_ms_.load(), wall_clock_ms());
    try {
        const std::size_t removed = store_->purge_expired(now_ms, config_.velocity.window);
        if (removed) log::debug("STORE", "expired " + std::to_string(removed) + " idle users");
    } catch (const std::exception& e) {
        log::warn("STORE", std::string("expiry sweep failed: ") + e.what());
    } catch (...) {
        log::warn("STORE", "expiry sweep failed with an unknown exception");
    }
}

void DecisionEngine::count(const Verdict& v) {
    ++decisions_;
    if (!v.degraded.empty()) ++degraded_;
    switch (v.action) {
    case Action::Allow: ++allowed_; break;
    case Action::Flag: ++flagged_; break;
    case Action::Block: ++blocked_; break;
    }
}

std::vector<Verdict> DecisionEngine::recent_decisions(std::size_t limit) const {
    return journal_.recent(limit);
}

EngineStats DecisionEngine::stats() const {
    EngineStats s;
    s.decisions = decisions_.load();
    s.replays = replays_.load();
    s.invalid = invalid_.load();
    s.degraded = degraded_.load();
    s.allowed = allowed_.load();
    s.flagged = flagged_.load();
    s.blocked = blocked_.load();
    return s;
}

} // namespace txguard
