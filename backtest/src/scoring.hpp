#pragma once

#include "types.hpp"
#include <vector>

// Running accuracy / Brier / log-loss totals over binary outcomes
class MetricsAccumulator {
public:
    static constexpr double kProbabilityEpsilon = 1e-6;

    // prob_positive: probability assigned to the positive class
    // prob_true: probability assigned to the outcome that actually happened
    // label: 1.0 when the positive class happened, else 0.0
    void add(double prob_positive, double prob_true, double label, bool correct);

    size_t count() const { return n_; }

    // Null brier/log_loss when nothing was added
    MetricsResult result() const;

private:
    size_t n_ = 0;
    size_t correct_ = 0;
    double brier_sum_ = 0.0;
    double log_loss_sum_ = 0.0;
};

class PredictionScorer {
public:
    // Brier is measured against the away side
    static constexpr Side kPositiveSide = Side::Away;

    PredictionScorer() = default;

    // Pure; an empty set yields n=0 with null brier/log_loss
    MetricsResult score(const std::vector<Prediction>& predictions) const;

    // Contribution of a single game, exposed for diagnostics
    void accumulate(const Prediction& prediction, MetricsAccumulator& acc) const;
};
