#pragma once

#include "types.hpp"
#include "config.hpp"
#include <array>
#include <string>
#include <utility>
#include <vector>

constexpr size_t kMetaFeatureCount = 10;
using FeatureVector = std::array<double, kMetaFeatureCount>;

// Builds the fixed-order meta-model input for one game
class FeatureBuilder {
public:
    explicit FeatureBuilder(const FeatureDefaults& defaults);

    FeatureVector build(const Prediction& prediction) const;

    static const std::array<std::string, kMetaFeatureCount>& feature_names();

private:
    FeatureDefaults defaults_;
};

// Binary logistic regression fitted by full-batch gradient descent
class LogisticRegression {
public:
    LogisticRegression();

    // Resets to zero weights before fitting; returns the number of epochs run
    int fit(const std::vector<FeatureVector>& x,
            const std::vector<double>& y,
            double learning_rate,
            int epochs,
            double convergence_tolerance = 0.0);

    double predict_proba(const FeatureVector& x) const;

    const FeatureVector& weights() const { return weights_; }
    double bias() const { return bias_; }

    static double sigmoid(double z);

private:
    FeatureVector weights_;
    double bias_;
};

struct MetaModelReport {
    bool sufficient = false;
    std::string message;
    size_t n_train = 0;
    size_t n_test = 0;
    int epochs_run = 0;
    FeatureVector weights{};
    double bias = 0.0;
    std::vector<std::pair<std::string, double>> coefficients;
    MetricsResult train_metrics;
    MetricsResult test_metrics;

    nlohmann::json to_json() const;
};

class MetaModelTrainer {
public:
    // Predicts P(home win)
    static constexpr Side kPositiveSide = Side::Home;

    // Throws std::invalid_argument on bad hyperparameters
    explicit MetaModelTrainer(const MetaModelConfig& config);

    // Chronological train/test split, fit, evaluate both halves
    MetaModelReport run(const std::vector<Prediction>& predictions) const;

    // Accuracy / Brier / log-loss of the fitted model against the home-win label
    static MetricsResult evaluate(const LogisticRegression& model,
                                  const std::vector<FeatureVector>& x,
                                  const std::vector<double>& y);

private:
    MetaModelConfig config_;
    FeatureBuilder features_;
};
