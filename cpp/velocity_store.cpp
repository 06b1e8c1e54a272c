#include "velocity_store.h"
#include <functional>
#include <iterator>

namespace txguard {

InMemoryVelocityStore::Shard& InMemoryVelocityStore::shard_for(const std::string& user_id) {
    return shards_[std::hash<std::string>{}(user_id) % kShards];
}

const InMemoryVelocityStore::Shard& InMemoryVelocityStore::shard_for(const std::string& user_id) const {
    return shards_[std::hash<std::string>{}(user_id) % kShards];
}

std::vector<TransactionSummary> InMemoryVelocityStore::record_and_fetch(
    const std::string& user_id,
    const TransactionSummary& summary,
    std::chrono::milliseconds window) {
    const std::int64_t cutoff = summary.epoch_ms - window.count();
    Shard& shard = shard_for(user_id);

    for (;;) {
        std::shared_ptr<UserSlot> slot;
        {
            std::lock_guard<std::mutex> lk(shard.mtx);
            auto& entry = shard.users[user_id];
            if (!entry) entry = std::make_shared<UserSlot>();
            slot = entry;
        }

        std::lock_guard<std::mutex> lk(slot->mtx);
        if (slot->retired) continue;

        auto& entries = slot->entries;
        while (!entries.empty() && entries.front().epoch_ms < cutoff) entries.pop_front();

        // A late arrival only sees entries within one window after it.
        const std::int64_t horizon = summary.epoch_ms + window.count();
        std::vector<TransactionSummary> prior;
        for (const auto& e : entries) {
            if (e.epoch_ms > horizon) break;
            prior.push_back(e);
        }

        // Entries stay sorted by time; late arrivals are inserted in place.
        auto it = entries.end();
        while (it != entries.begin() && std::prev(it)->epoch_ms > summary.epoch_ms) --it;
        entries.insert(it, summary);
        return prior;
    }
}

std::vector<TransactionSummary> InMemoryVelocityStore::history(const std::string& user_id) const {
    std::shared_ptr<UserSlot> slot;
    {
        const Shard& shard = shard_for(user_id);
        std::lock_guard<std::mutex> lk(shard.mtx);
        auto it = shard.users.find(user_id);
        if (it == shard.users.end()) return {};
        slot = it->second;
    }
    std::lock_guard<std::mutex> lk(slot->mtx);
    return std::vector<TransactionSummary>(slot->entries.begin(), slot->entries.end());
}

std::size_t InMemoryVelocityStore::purge_expired(std::int64_t now_ms, std::chrono::milliseconds window) {
    const std::int64_t cutoff = now_ms - window.count();
    std::size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lk(shard.mtx);
        for (auto it = shard.users.begin(); it != shard.users.end();) {
            UserSlot& slot = *it->second;
            std::unique_lock<std::mutex> slot_lk(slot.mtx, std::try_to_lock);
            // A busy slot is in use right now; leave it for the next sweep.
            if (slot_lk.owns_lock() &&
                (slot.entries.empty() || slot.entries.back().epoch_ms < cutoff)) {
                slot.retired = true;
                it = shard.users.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

std::size_t InMemoryVelocityStore::user_count() const {
    std::size_t n = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lk(shard.mtx);
        n += shard.users.size();
    }
    return n;
}

} // namespace txguard
