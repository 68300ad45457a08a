#include "metric_diagnostics.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <map>

nlohmann::json RecentWindowResult::to_json() const {
    return {
        {"requested", requested},
        {"metrics", metrics.to_json()}
    };
}

nlohmann::json CorrelationReport::to_json() const {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : top) {
        entries.push_back(nlohmann::json{
            {"metric", entry.metric},
            {"r", entry.r},
            {"samples", entry.samples}
        });
    }
    return {
        {"target", target},
        {"completed", completed},
        {"metrics_seen", metrics_seen},
        {"top", entries}
    };
}

MetricDiagnostics::MetricDiagnostics(const DiagnosticsConfig& config, const PredictionScorer& scorer)
    : config_(config), scorer_(scorer) {
    config_.validate();
}

RecentWindowResult MetricDiagnostics::recent_window(const std::vector<Prediction>& predictions) const {
    RecentWindowResult result;
    result.requested = config_.recent_window;

    size_t take = std::min(config_.recent_window, predictions.size());
    std::vector<Prediction> window(predictions.end() - static_cast<std::ptrdiff_t>(take), predictions.end());
    result.metrics = scorer_.score(window);
    return result;
}

std::optional<double> MetricDiagnostics::pearson(const std::vector<std::pair<double, double>>& pairs) {
    if (pairs.size() < 3) {
        return std::nullopt;
    }

    double n = static_cast<double>(pairs.size());
    double mean_x = 0.0;
    double mean_y = 0.0;
    for (const auto& [x, y] : pairs) {
        mean_x += x;
        mean_y += y;
    }
    mean_x /= n;
    mean_y /= n;

    double num = 0.0;
    double ss_x = 0.0;
    double ss_y = 0.0;
    for (const auto& [x, y] : pairs) {
        double dx = x - mean_x;
        double dy = y - mean_y;
        num += dx * dy;
        ss_x += dx * dx;
        ss_y += dy * dy;
    }

    double den_x = std::sqrt(ss_x);
    double den_y = std::sqrt(ss_y);
    if (den_x == 0.0 || den_y == 0.0) {
        return std::nullopt;
    }
    return num / (den_x * den_y);
}

CorrelationReport MetricDiagnostics::correlations(const std::vector<Prediction>& predictions) const {
    CorrelationReport report;
    report.target = side_to_string(kPositiveSide) + "_win";
    report.completed = predictions.size();

    std::map<std::string, std::vector<std::pair<double, double>>> metric_pairs;
    for (const auto& p : predictions) {
        double label = binary_label(p.actual_winner, kPositiveSide);
        for (const auto& [name, value] : p.metrics.scalars) {
            metric_pairs[name].emplace_back(value, label);
        }
    }
    report.metrics_seen = metric_pairs.size();

    for (const auto& [name, pairs] : metric_pairs) {
        auto r = pearson(pairs);
        if (!r) {
            spdlog::debug("No correlation for metric '{}' ({} samples)", name, pairs.size());
            continue;
        }
        report.top.push_back(MetricCorrelation{name, *r, pairs.size()});
    }

    // Ties keep metric name order
    std::stable_sort(report.top.begin(), report.top.end(),
        [](const MetricCorrelation& a, const MetricCorrelation& b) {
            return std::fabs(a.r) > std::fabs(b.r);
        });
    if (report.top.size() > config_.top_correlations) {
        report.top.resize(config_.top_correlations);
    }
    return report;
}
