#include "replay_cache.h"

namespace txguard {

ReplayCache::ReplayCache(std::size_t capacity) : capacity_(capacity) {}

std::string ReplayCache::make_key(const std::string& user_id, const std::string& transaction_id) {
    return std::to_string(user_id.size()) + ":" + user_id + transaction_id;
}

ReplayCache::Claim ReplayCache::claim(const std::string& user_id, const std::string& transaction_id) {
    Claim c;
    c.key = make_key(user_id, transaction_id);

    std::lock_guard<std::mutex> lk(mtx_);
    auto it = entries_.find(c.key);
    if (it != entries_.end()) {
        c.verdict = it->second.verdict;
        return c;
    }

    c.owner = true;
    c.generation = next_generation_++;
    c.promise = std::make_shared<std::promise<Verdict>>();
    c.verdict = c.promise->get_future().share();
    entries_[c.key] = Entry{c.verdict, c.generation};
    order_.emplace_back(c.key, c.generation);

    while (entries_.size() > capacity_ && !order_.empty()) {
        const auto& oldest = order_.front();
        auto victim = entries_.find(oldest.first);
        if (victim != entries_.end() && victim->second.generation == oldest.second) {
            entries_.erase(victim);
        }
        order_.pop_front();
    }
    return c;
}

void ReplayCache::publish(Claim& claim, const Verdict& verdict) {
    if (!claim.owner || !claim.promise) return;
    claim.promise->set_value(verdict);
    claim.promise.reset();
}

void ReplayCache::abandon(Claim& claim, std::exception_ptr error) {
    if (!claim.owner || !claim.promise) return;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = entries_.find(claim.key);
        if (it != entries_.end() && it->second.generation == claim.generation) entries_.erase(it);
    }
    claim.promise->set_exception(error);
    claim.promise.reset();
}

bool ReplayCache::contains(const std::string& user_id, const std::string& transaction_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.count(make_key(user_id, transaction_id)) != 0;
}

std::size_t ReplayCache::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.size();
}

} // namespace txguard
