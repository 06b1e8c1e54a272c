#pragma once
#include <vector>
#include "config.h"
#include "types.h"

namespace txguard {

// history is the user's window before this transaction, already filtered by
// the velocity store. Pure and total: an empty history yields sentinel values.
FeatureVector build_features(
    const Transaction& txn,
    const Timestamp& ts,
    const std::vector<TransactionSummary>& history
);

// Out-of-distribution warnings for features with a known mean and stddev.
std::vector<std::string> ood_warnings(const FeatureVector& features, const DriftConfig& drift);

} // namespace txguard
