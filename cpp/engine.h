#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "bounded_call.h"
#include "config.h"
#include "journal.h"
#include "replay_cache.h"
#include "scorer.h"
#include "types.h"
#include "velocity_store.h"

namespace txguard {

struct EngineStats {
    std::uint64_t decisions = 0;
    std::uint64_t replays = 0;
    std::uint64_t invalid = 0;
    std::uint64_t degraded = 0;
    std::uint64_t allowed = 0;
    std::uint64_t flagged = 0;
    std::uint64_t blocked = 0;
};

// Checks required fields and parses the timestamp.
// Throws InvalidTransaction.
Timestamp validate_transaction(const Transaction& txn);

// As above, and also rejects a timestamp more than max_future_skew past now_ms.
Timestamp validate_transaction(const Transaction& txn, std::int64_t now_ms,
                               std::chrono::milliseconds max_future_skew);

// Hybrid decision engine: velocity state, features, rules and two external
// scorers fused into one verdict. Safe to call decide() from many threads.
//
// A null scorer is treated as permanently unavailable. A null store selects
// the in-process InMemoryVelocityStore.
class DecisionEngine {
public:
    DecisionEngine(
        EngineConfig config,
        std::shared_ptr<const Scorer> risk_scorer,
        std::shared_ptr<const Scorer> anomaly_scorer,
        std::shared_ptr<VelocityStore> store = nullptr
    );
    DecisionEngine(const DecisionEngine&) = delete;
    DecisionEngine& operator=(const DecisionEngine&) = delete;

    // Returns the verdict for txn. A repeated (user_id, transaction_id)
    // returns the first verdict without touching velocity state.
    // Throws InvalidTransaction for malformed input; every other failure is
    // absorbed into a degraded verdict.
    Verdict decide(const Transaction& txn);

    std::vector<Verdict> recent_decisions(std::size_t limit) const;
    EngineStats stats() const;

    const EngineConfig& config() const { return config_; }
    const VelocityStore& store() const { return *store_; }

private:
    struct ScoreOutcome {
        bool ok = false;
        double value = 0.0;
    };

    Verdict evaluate(const Transaction& txn, const Timestamp& ts);
    bool fetch_history(const Transaction& txn, const Timestamp& ts,
                       std::vector<TransactionSummary>& history);
    void score(const FeatureVector& features, ScoreOutcome& risk, ScoreOutcome& anomaly) const;
    void advance_event_clock(std::int64_t epoch_ms);
    void maybe_sweep();
    void count(const Verdict& v);

    const EngineConfig config_;
    std::shared_ptr<const Scorer> risk_scorer_;
    std::shared_ptr<const Scorer> anomaly_scorer_;
    std::shared_ptr<VelocityStore> store_;

    ReplayCache replay_;
    DecisionJournal journal_;
    std::shared_ptr<CallBudget> calls_;

    // Newest transaction time seen. Never ahead of the wall clock by more
    // than max_future_skew, since later timestamps are rejected.
    std::atomic<std::int64_t> event_clock_ms_;

    std::atomic<std::uint64_t> since_sweep_{0};
    std::atomic<std::uint64_t> decisions_{0};
    std::atomic<std::uint64_t> replays_{0};
    std::atomic<std::uint64_t> invalid_{0};
    std::atomic<std::uint64_t> degraded_{0};
    std::atomic<std::uint64_t> allowed_{0};
    std::atomic<std::uint64_t> flagged_{0};
    std::atomic<std::uint64_t> blocked_{0};
};

} // namespace txguard
