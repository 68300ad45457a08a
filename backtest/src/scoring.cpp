#include "scoring.hpp"
#include <algorithm>
#include <cmath>

void MetricsAccumulator::add(double prob_positive, double prob_true, double label, bool correct) {
    ++n_;
    if (correct) {
        ++correct_;
    }

    double diff = prob_positive - label;
    brier_sum_ += diff * diff;

    // Clamp so a confident miss costs -log(1e-6) instead of infinity
    double p = std::min(std::max(prob_true, kProbabilityEpsilon), 1.0 - kProbabilityEpsilon);
    log_loss_sum_ += -std::log(p);
}

MetricsResult MetricsAccumulator::result() const {
    MetricsResult metrics;
    metrics.n = n_;
    if (n_ == 0) {
        return metrics;
    }

    double n = static_cast<double>(n_);
    metrics.accuracy = static_cast<double>(correct_) / n;
    metrics.brier = brier_sum_ / n;
    metrics.log_loss = log_loss_sum_ / n;
    return metrics;
}

void PredictionScorer::accumulate(const Prediction& prediction, MetricsAccumulator& acc) const {
    double label = binary_label(prediction.actual_winner, kPositiveSide);
    bool correct = prediction.predicted_side() == prediction.actual_winner;
    acc.add(prediction.prob_of(kPositiveSide),
            prediction.prob_of(prediction.actual_winner),
            label,
            correct);
}

MetricsResult PredictionScorer::score(const std::vector<Prediction>& predictions) const {
    MetricsAccumulator acc;
    for (const auto& prediction : predictions) {
        accumulate(prediction, acc);
    }
    return acc.result();
}
