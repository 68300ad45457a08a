#pragma once

#include "types.hpp"
#include "config.hpp"
#include "scoring.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct RecentWindowResult {
    size_t requested = 0;
    MetricsResult metrics;

    nlohmann::json to_json() const;
};

struct MetricCorrelation {
    std::string metric;
    double r = 0.0;
    size_t samples = 0;
};

struct CorrelationReport {
    std::string target;
    size_t completed = 0;
    size_t metrics_seen = 0;
    // Sorted by |r| descending, truncated to the configured count
    std::vector<MetricCorrelation> top;

    nlohmann::json to_json() const;
};

class MetricDiagnostics {
public:
    // Correlations are measured against a home win
    static constexpr Side kPositiveSide = Side::Home;

    MetricDiagnostics(const DiagnosticsConfig& config, const PredictionScorer& scorer);

    // Scores the last N games of a chronologically ordered set
    RecentWindowResult recent_window(const std::vector<Prediction>& predictions) const;

    CorrelationReport correlations(const std::vector<Prediction>& predictions) const;

    // nullopt with fewer than 3 pairs or when either side has zero variance
    static std::optional<double> pearson(const std::vector<std::pair<double, double>>& pairs);

private:
    DiagnosticsConfig config_;
    const PredictionScorer& scorer_;
};
