#include "calibration.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace {
    nlohmann::json points_to_json(const CalibrationCurve& curve) {
        nlohmann::json points = nlohmann::json::array();
        for (const auto& [x, y] : curve.points) {
            points.push_back(nlohmann::json::array({x, y}));
        }
        return {{"sample_size", curve.sample_size}, {"points", points}};
    }

    double clamp_unit(double p) {
        return std::max(0.0, std::min(1.0, p));
    }
}

nlohmann::json CalibrationReport::to_json() const {
    nlohmann::json contexts = nlohmann::json::object();
    for (const auto& [bucket, curve] : by_context) {
        contexts[bucket] = points_to_json(curve);
    }

    nlohmann::json bins = nlohmann::json::array();
    for (const auto& bin : reliability) {
        bins.push_back(nlohmann::json{
            {"lower", bin.lower},
            {"upper", bin.upper},
            {"n", bin.n},
            {"mean_predicted", bin.mean_predicted ? nlohmann::json(*bin.mean_predicted) : nlohmann::json(nullptr)},
            {"observed_rate", bin.observed_rate ? nlohmann::json(*bin.observed_rate) : nlohmann::json(nullptr)}
        });
    }

    return {
        {"sufficient", sufficient},
        {"message", message},
        {"num_bins", num_bins},
        {"overall", points_to_json(overall)},
        {"by_context", contexts},
        {"reliability", bins}
    };
}

CalibrationCurveBuilder::CalibrationCurveBuilder(const CalibrationConfig& config) : config_(config) {
    config_.validate();
}

size_t CalibrationCurveBuilder::min_bucket_samples() const {
    return std::max<size_t>(30, config_.min_games / 2);
}

size_t CalibrationCurveBuilder::bin_index(double prob) const {
    auto bins = static_cast<size_t>(config_.num_bins);
    auto idx = static_cast<size_t>(std::floor(clamp_unit(prob) * static_cast<double>(bins)));
    return std::min(bins - 1, idx);
}

CalibrationCurve CalibrationCurveBuilder::build_curve(const std::vector<std::pair<double, double>>& records,
                                                      int num_bins) {
    CalibrationCurve curve;
    if (records.empty() || num_bins < 1) {
        return curve;
    }

    auto bins = static_cast<size_t>(num_bins);
    std::vector<double> outcome_sums(bins, 0.0);
    std::vector<size_t> counts(bins, 0);
    for (const auto& [prob, outcome] : records) {
        auto idx = static_cast<size_t>(std::floor(clamp_unit(prob) * static_cast<double>(bins)));
        idx = std::min(bins - 1, idx);
        outcome_sums[idx] += outcome;
        ++counts[idx];
    }

    // Empty bins inherit the previous rate; the running rate never decreases
    double running_prev = 0.0;
    double width = 1.0 / static_cast<double>(bins);
    for (size_t i = 0; i < bins; ++i) {
        double rate = counts[i] > 0 ? outcome_sums[i] / static_cast<double>(counts[i]) : running_prev;
        rate = std::max(running_prev, rate);
        running_prev = rate;
        double midpoint = (static_cast<double>(i) + 0.5) * width;
        curve.points.emplace_back(midpoint, rate);
    }
    curve.sample_size = records.size();
    return curve;
}

double CalibrationCurveBuilder::interpolate(const CalibrationPoints& points, double prob) {
    if (points.empty()) {
        return prob;
    }
    if (prob <= points.front().first) {
        return points.front().second;
    }
    if (prob >= points.back().first) {
        return points.back().second;
    }
    for (size_t i = 1; i < points.size(); ++i) {
        const auto& [x0, y0] = points[i - 1];
        const auto& [x1, y1] = points[i];
        if (prob >= x0 && prob <= x1) {
            if (x1 == x0) {
                return y1;
            }
            double t = (prob - x0) / (x1 - x0);
            return y0 + t * (y1 - y0);
        }
    }
    return prob;
}

std::vector<ReliabilityBin> CalibrationCurveBuilder::reliability_table(
    const std::vector<Prediction>& predictions) const {
    auto bins = static_cast<size_t>(config_.num_bins);
    std::vector<ReliabilityBin> table(bins);
    std::vector<double> prob_sums(bins, 0.0);
    std::vector<double> outcome_sums(bins, 0.0);

    double width = 1.0 / static_cast<double>(bins);
    for (size_t i = 0; i < bins; ++i) {
        table[i].lower = static_cast<double>(i) * width;
        table[i].upper = static_cast<double>(i + 1) * width;
    }

    for (const auto& p : predictions) {
        size_t idx = bin_index(p.away_prob);
        ++table[idx].n;
        prob_sums[idx] += p.away_prob;
        outcome_sums[idx] += binary_label(p.actual_winner, Side::Away);
    }

    for (size_t i = 0; i < bins; ++i) {
        if (table[i].n > 0) {
            double n = static_cast<double>(table[i].n);
            table[i].mean_predicted = prob_sums[i] / n;
            table[i].observed_rate = outcome_sums[i] / n;
        }
    }
    return table;
}

CalibrationReport CalibrationCurveBuilder::fit(const std::vector<Prediction>& predictions) const {
    CalibrationReport report;
    report.num_bins = config_.num_bins;
    report.reliability = reliability_table(predictions);

    if (predictions.size() < config_.min_games) {
        report.message = fmt::format("Not enough completed games ({}) to fit a calibration curve; need at least {}",
                                     predictions.size(), config_.min_games);
        spdlog::warn("{}", report.message);
        return report;
    }

    std::vector<std::pair<double, double>> overall_records;
    std::map<std::string, std::vector<std::pair<double, double>>> bucket_records;
    overall_records.reserve(predictions.size());
    for (const auto& p : predictions) {
        std::pair<double, double> record{p.away_prob, binary_label(p.actual_winner, Side::Away)};
        overall_records.push_back(record);
        bucket_records[p.context_bucket].push_back(record);
    }

    report.overall = build_curve(overall_records, config_.num_bins);

    size_t min_bucket = min_bucket_samples();
    for (const auto& [bucket, records] : bucket_records) {
        if (records.size() < min_bucket) {
            spdlog::debug("Skipping calibration for context '{}': {} games < {}", bucket, records.size(), min_bucket);
            continue;
        }
        report.by_context[bucket] = build_curve(records, config_.num_bins);
    }

    report.sufficient = true;
    report.message = fmt::format("Calibration fitted on {} games ({} context curves)",
                                 report.overall.sample_size, report.by_context.size());
    return report;
}

double CalibrationCurveBuilder::apply(const CalibrationReport& report, double away_prob,
                                      const std::string& context_bucket) const {
    double prob = std::isfinite(away_prob) ? clamp_unit(away_prob) : 0.5;

    const CalibrationCurve* curve = nullptr;
    if (!context_bucket.empty()) {
        auto it = report.by_context.find(context_bucket);
        if (it != report.by_context.end() && it->second.usable()) {
            curve = &it->second;
        }
    }
    if (!curve && report.overall.usable()) {
        curve = &report.overall;
    }
    if (!curve) {
        return prob;
    }

    double calibrated = interpolate(curve->points, prob);
    return std::max(config_.floor, std::min(config_.ceiling, calibrated));
}
