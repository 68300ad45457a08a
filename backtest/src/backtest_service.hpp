#pragma once

#include "config.hpp"
#include "loader.hpp"
#include "scoring.hpp"
#include "bucketing.hpp"
#include "time_split.hpp"
#include "meta_model.hpp"
#include "calibration.hpp"
#include "metric_diagnostics.hpp"
#include <memory>
#include <vector>

struct BacktestReport {
    LoadStats load_stats;
    MetricsResult overall;
    BucketReport by_context;
    BucketReport by_spread;
    BucketReport by_confidence;
    TimeSplitReport time_splits;
    BucketReport by_season;
    CalibrationReport calibration;
    MetaModelReport meta_model;
    RecentWindowResult recent;
    CorrelationReport metric_correlations;

    nlohmann::json to_json() const;
};

class BacktestService {
public:
    // Throws std::invalid_argument if the configuration is invalid
    explicit BacktestService(const Config& config);

    // Full pipeline over an in-memory snapshot
    BacktestReport run(const std::vector<RawPrediction>& raw) const;

    // Same pipeline over a predictions JSON file
    BacktestReport run_file(const std::string& path) const;

private:
    BacktestReport evaluate(const LoadResult& loaded) const;

    // Console-style summary of every section
    void log_report(const BacktestReport& report) const;

    // Configuration
    Config config_;

    // Service components
    std::unique_ptr<PredictionLoader> loader_;
    std::unique_ptr<PredictionScorer> scorer_;
    std::unique_ptr<BucketingEngine> bucketing_;
    std::unique_ptr<TimeSplitEngine> time_split_;
    std::unique_ptr<MetaModelTrainer> meta_trainer_;
    std::unique_ptr<CalibrationCurveBuilder> calibration_;
    std::unique_ptr<MetricDiagnostics> diagnostics_;
};
