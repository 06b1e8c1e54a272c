#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.h"

namespace txguard {

// Per-user sliding window of recent transactions.
class VelocityStore {
public:
    virtual ~VelocityStore() = default;

    // Appends `summary` to the user's record, evicts entries older than
    // summary.epoch_ms - window, and returns the entries that were present
    // before the append and lie within `window` of summary.epoch_ms on
    // either side, oldest first. Atomic per user.
    // Throws StateUnavailable when the backing store cannot be reached.
    virtual std::vector<TransactionSummary> record_and_fetch(
        const std::string& user_id,
        const TransactionSummary& summary,
        std::chrono::milliseconds window) = 0;

    // Read-only view of the user's record, oldest first.
    virtual std::vector<TransactionSummary> history(const std::string& user_id) const = 0;

    // Drops users whose newest entry is older than now_ms - window.
    // Returns the number of users removed.
    virtual std::size_t purge_expired(std::int64_t now_ms, std::chrono::milliseconds window) = 0;
};

// In-process store. Users are spread over shards; a shard lock covers only
// the slot lookup, the read-modify-write runs under the user's own lock.
class InMemoryVelocityStore : public VelocityStore {
public:
    InMemoryVelocityStore() = default;
    InMemoryVelocityStore(const InMemoryVelocityStore&) = delete;
    InMemoryVelocityStore& operator=(const InMemoryVelocityStore&) = delete;

    std::vector<TransactionSummary> record_and_fetch(
        const std::string& user_id,
        const TransactionSummary& summary,
        std::chrono::milliseconds window) override;

    std::vector<TransactionSummary> history(const std::string& user_id) const override;

    std::size_t purge_expired(std::int64_t now_ms, std::chrono::milliseconds window) override;

    std::size_t user_count() const;

private:
    struct UserSlot {
        std::mutex mtx;
        std::deque<TransactionSummary> entries;
        // Set once the slot is unlinked from its shard; writers must re-resolve.
        bool retired = false;
    };

    static constexpr std::size_t kShards = 64;

    struct Shard {
        mutable std::mutex mtx;
        std::unordered_map<std::string, std::shared_ptr<UserSlot>> users;
    };

    Shard& shard_for(const std::string& user_id);
    const Shard& shard_for(const std::string& user_id) const;

    std::array<Shard, kShards> shards_;
};

} // namespace txguard
