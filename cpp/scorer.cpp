#include "scorer.h"
#include "errors.h"
#include <cmath>
#include <fstream>
#include <sstream>

namespace txguard {

namespace {

double sig(double z) { return 1.0 / (1.0 + std::exp(-z)); }

int feature_index(const std::string& name) {
    const auto& names = feature_names();
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) return static_cast<int>(i);
    }
    return -1;
}

} // namespace

FunctionScorer::FunctionScorer(Fn fn) : fn_(std::move(fn)) {
    if (!fn_) throw ConfigError("FunctionScorer requires a callable");
}

double FunctionScorer::score(const FeatureVector& features) const {
    return fn_(features);
}

LogisticScorer::LogisticScorer(std::unordered_map<std::string, double> weights, double bias)
    : w_(feature_names().size(), 0.0), bias_(bias) {
    for (const auto& kv : weights) {
        const int idx = feature_index(kv.first);
        if (idx < 0) throw ConfigError("unknown feature in scorer weights: " + kv.first);
        w_[idx] = kv.second;
    }
}

LogisticScorer LogisticScorer::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open scorer weights: " + path);

    std::unordered_map<std::string, double> weights;
    double bias = 0.0;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        std::istringstream ls(line);
        std::string k;
        if (!(ls >> k) || k[0] == '#') continue;
        double v = 0.0;
        if (!(ls >> v) || !std::isfinite(v)) {
            std::ostringstream ss;
            ss << path << ":" << lineno << ": expected '<name> <number>'";
            throw ConfigError(ss.str());
        }
        if (k == "bias") bias = v;
        else weights[k] = v;
    }
    return LogisticScorer(std::move(weights), bias);
}

double LogisticScorer::score(const FeatureVector& features) const {
    const auto x = to_array(features);
    double z = bias_;
    for (size_t i = 0; i < w_.size() && i < x.size(); ++i) z += w_[i] * x[i];
    return sig(z);
}

double LogisticScorer::weight(const std::string& feature) const {
    const int idx = feature_index(feature);
    if (idx < 0 || w_.empty()) return 0.0;
    return w_[idx];
}

double checked_score(double value, const char* which) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        std::ostringstream ss;
        ss << which << " scorer returned " << value << ", expected a value in [0,1]";
        throw ScorerContractViolation(ss.str());
    }
    return value;
}

} // namespace txguard
