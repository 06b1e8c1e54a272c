#pragma once
#include <string>
#include <vector>
#include "config.h"
#include "types.h"

namespace txguard {

struct FusionResult {
    Action action = Action::Allow;
    std::string reason;
};

// Decision table, first match wins:
//   any HIGH hit, or risk >= block_threshold               -> BLOCK
//   any hit, or risk >= flag_threshold,
//     or anomaly >= anomaly_threshold                       -> FLAG
//   otherwise                                               -> ALLOW
// The anomaly score alone never blocks.
FusionResult fuse(
    const FusionConfig& config,
    const std::vector<RuleHit>& hits,
    double risk_score,
    double anomaly_score
);

} // namespace txguard
