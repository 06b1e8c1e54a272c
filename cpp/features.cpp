#include "features.h"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace txguard {

FeatureVector build_features(
    const Transaction& txn,
    const Timestamp& ts,
    const std::vector<TransactionSummary>& history
) {
    FeatureVector f;
    f.amount = txn.amount;
    f.hour_of_day = ts.hour_of_day;
    f.transaction_count_in_window = static_cast<int>(history.size());

    std::set<std::string> countries;
    countries.insert(txn.location_country);
    bool seen_country = false;
    for (const auto& h : history) {
        countries.insert(h.country);
        if (h.country == txn.location_country) seen_country = true;
    }
    f.distinct_countries_in_window = static_cast<int>(countries.size());
    f.is_new_country_for_user = !seen_country;

    if (!history.empty()) {
        std::int64_t newest_ms = history.front().epoch_ms;
        for (const auto& h : history) newest_ms = std::max(newest_ms, h.epoch_ms);
        const double gap = static_cast<double>(ts.epoch_ms - newest_ms) / 1000.0;
        f.seconds_since_last_txn = std::max(0.0, gap);
    }

    if (history.size() >= 2) {
        double sum = 0.0;
        for (const auto& h : history) sum += h.amount;
        const double mu = sum / static_cast<double>(history.size());
        double sq = 0.0;
        for (const auto& h : history) sq += (h.amount - mu) * (h.amount - mu);
        const double sd = std::sqrt(sq / static_cast<double>(history.size()));
        if (std::isfinite(mu) && std::isfinite(sd) && sd > 1e-12) {
            f.amount_zscore_vs_recent_avg = (txn.amount - mu) / sd;
        }
    }
    return f;
}

std::vector<std::string> ood_warnings(const FeatureVector& features, const DriftConfig& drift) {
    std::vector<std::string> out;
    const auto& names = feature_names();
    const auto values = to_array(features);
    for (size_t i = 0; i < names.size(); ++i) {
        const auto& key = names[i];
        const double val = values[i];

        auto mit = drift.means.find(key);
        auto sit = drift.stds.find(key);
        if (mit == drift.means.end() || sit == drift.stds.end()) continue;

        const double mu = mit->second;
        const double sd = sit->second;
        if (!std::isfinite(mu) || !std::isfinite(sd) || sd <= 1e-12) continue;

        const double z = (val - mu) / sd;
        if (std::fabs(z) >= drift.z_threshold) {
            std::ostringstream ss;
            ss.setf(std::ios::fixed);
            ss.precision(2);
            ss << "ood_warning:" << key << ":z=" << z << " (threshold=" << drift.z_threshold << ")";
            out.push_back(ss.str());
        }
    }
    return out;
}

} // namespace txguard
