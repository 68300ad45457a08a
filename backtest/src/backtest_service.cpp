#include "backtest_service.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
    void log_buckets(const std::string& title, const std::string& prefix, const BucketReport& report) {
        spdlog::info("=== {} ===", title);
        for (const auto& [label, metrics] : report) {
            spdlog::info("{}{:15s}: {}", prefix, label, metrics.to_string());
        }
    }
}

nlohmann::json BacktestReport::to_json() const {
    return {
        {"load", load_stats.to_json()},
        {"overall", overall.to_json()},
        {"by_context", bucket_report_to_json(by_context)},
        {"by_spread", bucket_report_to_json(by_spread)},
        {"by_confidence", bucket_report_to_json(by_confidence)},
        {"time_splits", time_splits.to_json()},
        {"by_season", bucket_report_to_json(by_season)},
        {"calibration", calibration.to_json()},
        {"meta_model", meta_model.to_json()},
        {"recent", recent.to_json()},
        {"metric_correlations", metric_correlations.to_json()}
    };
}

BacktestService::BacktestService(const Config& config)
    : config_(config) {

    config_.validate();

    // Initialize components
    loader_ = std::make_unique<PredictionLoader>();
    scorer_ = std::make_unique<PredictionScorer>();
    bucketing_ = std::make_unique<BucketingEngine>(*scorer_);
    time_split_ = std::make_unique<TimeSplitEngine>(config_.time_split, *scorer_);
    meta_trainer_ = std::make_unique<MetaModelTrainer>(config_.meta_model);
    calibration_ = std::make_unique<CalibrationCurveBuilder>(config_.calibration);
    diagnostics_ = std::make_unique<MetricDiagnostics>(config_.diagnostics, *scorer_);
}

BacktestReport BacktestService::run(const std::vector<RawPrediction>& raw) const {
    return evaluate(loader_->load(raw));
}

BacktestReport BacktestService::run_file(const std::string& path) const {
    spdlog::info("Loading predictions from {}", path);
    return evaluate(loader_->load_file(path));
}

BacktestReport BacktestService::evaluate(const LoadResult& loaded) const {
    const auto& predictions = loaded.predictions;

    BacktestReport report;
    report.load_stats = loaded.stats;
    report.overall = scorer_->score(predictions);
    report.by_context = bucketing_->by_context(predictions);
    report.by_spread = bucketing_->by_spread(predictions);
    report.by_confidence = bucketing_->by_confidence(predictions);
    report.time_splits = time_split_->run_splits(predictions);
    report.by_season = time_split_->season_breakdown(predictions);
    report.calibration = calibration_->fit(predictions);
    report.meta_model = meta_trainer_->run(predictions);
    report.recent = diagnostics_->recent_window(predictions);
    report.metric_correlations = diagnostics_->correlations(predictions);

    log_report(report);
    return report;
}

void BacktestService::log_report(const BacktestReport& report) const {
    spdlog::info("Overall: {}", report.overall.to_string());

    log_buckets("Performance by context_bucket (rest/B2B)", "", report.by_context);
    log_buckets("Performance by probability spread (confidence buckets)", "Spread ", report.by_spread);
    log_buckets("Performance by pick confidence", "Confidence ", report.by_confidence);

    spdlog::info("=== Time-aware train/test splits ===");
    if (!report.time_splits.sufficient) {
        spdlog::info("{}", report.time_splits.message);
    }
    for (const auto& split : report.time_splits.splits) {
        spdlog::info("{} -> Test {}", split.label(), split.test_metrics.to_string());
    }

    log_buckets("Season-by-season performance", "", report.by_season);

    spdlog::info("=== Backtest (stored probabilities, last {} completed games) ===", report.recent.requested);
    spdlog::info("{}", report.recent.metrics.to_string());

    const auto& corr = report.metric_correlations;
    spdlog::info("=== Top {} metrics by |correlation with {}| ({} completed games) ===",
                 corr.top.size(), corr.target, corr.completed);
    for (const auto& entry : corr.top) {
        spdlog::info("{:28s} r={: .3f}  samples={}", entry.metric, entry.r, entry.samples);
    }

    spdlog::info("=== Calibration ===");
    spdlog::info("{}", report.calibration.message);

    const auto& meta = report.meta_model;
    spdlog::info("=== Meta-model performance (logistic on top of existing features) ===");
    if (!meta.sufficient) {
        spdlog::info("{}", meta.message);
        return;
    }
    spdlog::info("Train: {}", meta.train_metrics.to_string());
    spdlog::info("Test : {}", meta.test_metrics.to_string());
    for (const auto& [name, weight] : meta.coefficients) {
        spdlog::info("  {:26s}: {:+.4f}", name, weight);
    }
    spdlog::info("  {:26s}: {:+.4f}", "intercept", meta.bias);
}
