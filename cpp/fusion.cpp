#include "fusion.h"

namespace txguard {

FusionResult fuse(
    const FusionConfig& config,
    const std::vector<RuleHit>& hits,
    double risk_score,
    double anomaly_score
) {
    const RuleHit* first_high = nullptr;
    for (const auto& h : hits) {
        if (h.severity == Severity::High) {
            first_high = &h;
            break;
        }
    }

    if (first_high || risk_score >= config.block_threshold) {
        return {Action::Block, first_high ? first_high->message : "High fraud probability"};
    }
    if (!hits.empty()) return {Action::Flag, hits.front().message};
    if (risk_score >= config.flag_threshold) return {Action::Flag, "Elevated risk score"};
    if (anomaly_score >= config.anomaly_threshold) return {Action::Flag, "Anomalous behavior pattern"};
    return {Action::Allow, "Normal transaction"};
}

} // namespace txguard
