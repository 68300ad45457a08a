#include "meta_model.hpp"
#include "scoring.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace {
    // Upstream writes 0 for metrics it did not compute
    double nonzero_or(const std::optional<double>& value, double fallback) {
        return value && *value != 0.0 ? *value : fallback;
    }
}

FeatureBuilder::FeatureBuilder(const FeatureDefaults& defaults) : defaults_(defaults) {}

const std::array<std::string, kMetaFeatureCount>& FeatureBuilder::feature_names() {
    static const std::array<std::string, kMetaFeatureCount> names = {
        "away_prob",
        "home_prob",
        "margin",
        "confidence",
        "spread",
        "flip_rate",
        "away_prob_score_first",
        "home_prob_score_first",
        "away_first_goal_uplift",
        "home_first_goal_uplift"
    };
    return names;
}

FeatureVector FeatureBuilder::build(const Prediction& prediction) const {
    const auto& m = prediction.metrics;
    double margin = prediction.spread();

    return {
        prediction.away_prob,
        prediction.home_prob,
        margin,
        prediction.confidence(),
        margin,
        nonzero_or(m.monte_carlo_flip_rate, defaults_.flip_rate),
        nonzero_or(m.away_prob_score_first, defaults_.prob_score_first),
        nonzero_or(m.home_prob_score_first, defaults_.prob_score_first),
        nonzero_or(m.away_first_goal_win_uplift, defaults_.first_goal_win_uplift),
        nonzero_or(m.home_first_goal_win_uplift, defaults_.first_goal_win_uplift)
    };
}

LogisticRegression::LogisticRegression() : bias_(0.0) {
    weights_.fill(0.0);
}

double LogisticRegression::sigmoid(double z) {
    if (z >= 0.0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    double e = std::exp(z);
    return e / (1.0 + e);
}

double LogisticRegression::predict_proba(const FeatureVector& x) const {
    double z = bias_;
    for (size_t j = 0; j < kMetaFeatureCount; ++j) {
        z += weights_[j] * x[j];
    }
    return sigmoid(z);
}

int LogisticRegression::fit(const std::vector<FeatureVector>& x,
                            const std::vector<double>& y,
                            double learning_rate,
                            int epochs,
                            double convergence_tolerance) {
    weights_.fill(0.0);
    bias_ = 0.0;

    if (x.empty() || x.size() != y.size()) {
        return 0;
    }

    double n = static_cast<double>(x.size());
    int epoch = 0;
    for (; epoch < epochs; ++epoch) {
        FeatureVector grad_w{};
        double grad_b = 0.0;

        for (size_t i = 0; i < x.size(); ++i) {
            double diff = predict_proba(x[i]) - y[i];
            for (size_t j = 0; j < kMetaFeatureCount; ++j) {
                grad_w[j] += diff * x[i][j];
            }
            grad_b += diff;
        }

        double max_step = std::fabs(grad_b / n);
        for (size_t j = 0; j < kMetaFeatureCount; ++j) {
            weights_[j] -= learning_rate * grad_w[j] / n;
            max_step = std::max(max_step, std::fabs(grad_w[j] / n));
        }
        bias_ -= learning_rate * grad_b / n;

        if (epoch % 100 == 0) {
            spdlog::debug("Meta-model epoch {}: max gradient {:.6f}", epoch, max_step);
        }

        if (convergence_tolerance > 0.0 && max_step < convergence_tolerance) {
            ++epoch;
            break;
        }
    }

    return epoch;
}

nlohmann::json MetaModelReport::to_json() const {
    nlohmann::json coef = nlohmann::json::array();
    for (const auto& [name, value] : coefficients) {
        coef.push_back(nlohmann::json{{"feature", name}, {"weight", value}});
    }
    return {
        {"sufficient", sufficient},
        {"message", message},
        {"n_train", n_train},
        {"n_test", n_test},
        {"epochs_run", epochs_run},
        {"coefficients", coef},
        {"intercept", bias},
        {"train", train_metrics.to_json()},
        {"test", test_metrics.to_json()}
    };
}

MetaModelTrainer::MetaModelTrainer(const MetaModelConfig& config)
    : config_(config), features_(config.defaults) {
    config_.validate();
}

MetricsResult MetaModelTrainer::evaluate(const LogisticRegression& model,
                                         const std::vector<FeatureVector>& x,
                                         const std::vector<double>& y) {
    MetricsAccumulator acc;
    for (size_t i = 0; i < x.size() && i < y.size(); ++i) {
        double p = model.predict_proba(x[i]);
        double label = y[i];
        double predicted = p >= 0.5 ? 1.0 : 0.0;
        acc.add(p, label == 1.0 ? p : 1.0 - p, label, predicted == label);
    }
    return acc.result();
}

MetaModelReport MetaModelTrainer::run(const std::vector<Prediction>& predictions) const {
    MetaModelReport report;

    size_t n = predictions.size();
    size_t cutoff = static_cast<size_t>(std::floor(static_cast<double>(n) * config_.train_fraction));
    if (n < config_.min_records || cutoff == 0 || cutoff == n) {
        report.message = fmt::format("Not enough completed games with features ({}); need at least {}",
                                     n, config_.min_records);
        spdlog::warn("{}", report.message);
        return report;
    }

    std::vector<FeatureVector> x_train, x_test;
    std::vector<double> y_train, y_test;
    x_train.reserve(cutoff);
    y_train.reserve(cutoff);
    x_test.reserve(n - cutoff);
    y_test.reserve(n - cutoff);

    // No shuffling: earlier games train, later games test
    for (size_t i = 0; i < n; ++i) {
        FeatureVector features = features_.build(predictions[i]);
        double label = binary_label(predictions[i].actual_winner, kPositiveSide);
        if (i < cutoff) {
            x_train.push_back(features);
            y_train.push_back(label);
        } else {
            x_test.push_back(features);
            y_test.push_back(label);
        }
    }

    spdlog::info("Training meta-model on {} games, testing on {} future games", x_train.size(), x_test.size());

    LogisticRegression model;
    report.epochs_run = model.fit(x_train, y_train, config_.learning_rate, config_.epochs,
                                  config_.convergence_tolerance);

    report.sufficient = true;
    report.n_train = x_train.size();
    report.n_test = x_test.size();
    report.weights = model.weights();
    report.bias = model.bias();

    const auto& names = FeatureBuilder::feature_names();
    for (size_t j = 0; j < kMetaFeatureCount; ++j) {
        report.coefficients.emplace_back(names[j], report.weights[j]);
    }

    report.train_metrics = evaluate(model, x_train, y_train);
    report.test_metrics = evaluate(model, x_test, y_test);
    report.message = fmt::format("Trained for {} epochs", report.epochs_run);

    return report;
}
