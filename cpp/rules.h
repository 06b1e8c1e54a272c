#pragma once
#include <vector>
#include "config.h"
#include "types.h"

namespace txguard {

// Evaluates every rule against the features. Hits come back in the fixed
// order velocity, geo_jump, amount_spike, odd_hour.
std::vector<RuleHit> evaluate_rules(const RuleConfig& config, const FeatureVector& features);

bool in_night_band(int hour, int start_hour, int end_hour);

} // namespace txguard
