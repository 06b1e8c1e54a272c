#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>
#include "types.h"

namespace txguard {

// Most recent verdicts, bounded.
class DecisionJournal {
public:
    explicit DecisionJournal(std::size_t capacity) : capacity_(capacity) {}

    void record(const Verdict& v);

    // Newest first, at most `limit` entries.
    std::vector<Verdict> recent(std::size_t limit) const;

    std::size_t size() const;

private:
    std::size_t capacity_;
    mutable std::mutex mtx_;
    std::deque<Verdict> entries_;
};

} // namespace txguard
