#include "journal.h"

namespace txguard {

void DecisionJournal::record(const Verdict& v) {
    std::lock_guard<std::mutex> lk(mtx_);
    entries_.push_back(v);
    while (entries_.size() > capacity_) entries_.pop_front();
}

std::vector<Verdict> DecisionJournal::recent(std::size_t limit) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<Verdict> out;
    for (auto it = entries_.rbegin(); it != entries_.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::size_t DecisionJournal::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.size();
}

} // namespace txguard
