#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "types.h"

namespace txguard {

// Idempotency table keyed on (user_id, transaction_id). The first request
// for a key owns it and must publish() or abandon(); later requests get a
// future for the owner's verdict. Oldest keys are evicted past capacity.
class ReplayCache {
public:
    struct Claim {
        bool owner = false;
        std::shared_future<Verdict> verdict;

        std::string key;
        std::uint64_t generation = 0;
        std::shared_ptr<std::promise<Verdict>> promise;
    };

    explicit ReplayCache(std::size_t capacity);
    ReplayCache(const ReplayCache&) = delete;
    ReplayCache& operator=(const ReplayCache&) = delete;

    Claim claim(const std::string& user_id, const std::string& transaction_id);

    void publish(Claim& claim, const Verdict& verdict);

    // Drops the key so a retry recomputes; waiters receive `error`.
    void abandon(Claim& claim, std::exception_ptr error);

    bool contains(const std::string& user_id, const std::string& transaction_id) const;
    std::size_t size() const;

private:
    struct Entry {
        std::shared_future<Verdict> verdict;
        std::uint64_t generation = 0;
    };

    static std::string make_key(const std::string& user_id, const std::string& transaction_id);

    std::size_t capacity_;
    std::uint64_t next_generation_ = 1;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, Entry> entries_;
    std::deque<std::pair<std::string, std::uint64_t>> order_;
};

} // namespace txguard
