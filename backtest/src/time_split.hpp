#pragma once

#include "types.hpp"
#include "config.hpp"
#include "scoring.hpp"
#include <optional>
#include <string>
#include <vector>

struct SplitResult {
    double train_fraction = 0.0;
    size_t cutoff = 0;
    size_t train_size = 0;
    MetricsResult test_metrics;

    std::string label() const;
    nlohmann::json to_json() const;
};

struct TimeSplitReport {
    bool sufficient = false;
    std::string message;
    size_t total = 0;
    std::vector<SplitResult> splits;

    nlohmann::json to_json() const;
};

class TimeSplitEngine {
public:
    // Throws std::invalid_argument if the split configuration is invalid
    TimeSplitEngine(const TimeSplitConfig& config, const PredictionScorer& scorer);

    // Scores only the games after each cutoff. Input must be chronological.
    TimeSplitReport run_splits(const std::vector<Prediction>& predictions) const;

    // Metrics per season label, sorted by label
    BucketReport season_breakdown(const std::vector<Prediction>& predictions) const;

    // Seasons run September through the following summer, e.g. "2024-2025"
    static std::string season_label(const std::optional<CalendarDate>& date);

    // Undated games first, then non-decreasing dates
    static bool is_chronological(const std::vector<Prediction>& predictions);

private:
    TimeSplitConfig config_;
    const PredictionScorer& scorer_;
};
