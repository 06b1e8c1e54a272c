#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.h"

namespace txguard {

// Opaque pre-trained model. Implementations must be safe to call from
// several threads at once.
class Scorer {
public:
    virtual ~Scorer() = default;
    virtual double score(const FeatureVector& features) const = 0;
};

class FunctionScorer : public Scorer {
public:
    using Fn = std::function<double(const FeatureVector&)>;

    explicit FunctionScorer(Fn fn);
    double score(const FeatureVector& features) const override;

private:
    Fn fn_;
};

// Deterministic stand-in for a trained model.
class ConstantScorer : public Scorer {
public:
    explicit ConstantScorer(double value) : value_(value) {}
    double score(const FeatureVector&) const override { return value_; }

private:
    double value_;
};

// sigmoid(bias + sum of weight * feature). Weight files hold one
// "<feature_name> <weight>" pair per line plus an optional "bias <value>";
// blank lines and lines starting with '#' are skipped.
class LogisticScorer : public Scorer {
public:
    LogisticScorer() = default;
    LogisticScorer(std::unordered_map<std::string, double> weights, double bias);

    // Throws ConfigError when the file is missing or names an unknown feature.
    static LogisticScorer load(const std::string& path);

    double score(const FeatureVector& features) const override;

    double bias() const { return bias_; }
    double weight(const std::string& feature) const;

private:
    std::vector<double> w_;
    double bias_ = 0.0;
};

// Checks a scorer output against the [0,1] contract.
// Throws ScorerContractViolation naming `which` otherwise.
double checked_score(double value, const char* which);

} // namespace txguard
