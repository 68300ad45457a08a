#include "time_split.hpp"
#include "bucketing.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

std::string SplitResult::label() const {
    int train_pct = static_cast<int>(std::lround(train_fraction * 100.0));
    return fmt::format("Train {:2d}% / Test {:2d}%", train_pct, 100 - train_pct);
}

nlohmann::json SplitResult::to_json() const {
    return {
        {"train_fraction", train_fraction},
        {"cutoff", cutoff},
        {"train_size", train_size},
        {"test", test_metrics.to_json()}
    };
}

nlohmann::json TimeSplitReport::to_json() const {
    nlohmann::json split_array = nlohmann::json::array();
    for (const auto& split : splits) {
        split_array.push_back(split.to_json());
    }
    return {
        {"sufficient", sufficient},
        {"message", message},
        {"total", total},
        {"splits", split_array}
    };
}

TimeSplitEngine::TimeSplitEngine(const TimeSplitConfig& config, const PredictionScorer& scorer)
    : config_(config), scorer_(scorer) {
    config_.validate();
}

bool TimeSplitEngine::is_chronological(const std::vector<Prediction>& predictions) {
    for (size_t i = 1; i < predictions.size(); ++i) {
        const auto& prev = predictions[i - 1].parsed_date;
        const auto& curr = predictions[i].parsed_date;
        if (prev && !curr) {
            return false;
        }
        if (prev && curr && *curr < *prev) {
            return false;
        }
    }
    return true;
}

TimeSplitReport TimeSplitEngine::run_splits(const std::vector<Prediction>& predictions) const {
    if (!is_chronological(predictions)) {
        throw std::invalid_argument("Time-aware splits require chronologically sorted predictions");
    }

    TimeSplitReport report;
    report.total = predictions.size();

    if (predictions.size() < config_.min_records) {
        report.sufficient = false;
        report.message = fmt::format("Not enough completed games ({}) for meaningful time splits; need at least {}",
                                     predictions.size(), config_.min_records);
        spdlog::warn("{}", report.message);
        return report;
    }

    report.sufficient = true;
    for (double fraction : config_.train_fractions) {
        SplitResult split;
        split.train_fraction = fraction;
        split.cutoff = static_cast<size_t>(std::floor(static_cast<double>(predictions.size()) * fraction));
        split.train_size = split.cutoff;

        // Training games are never scored
        std::vector<Prediction> test(predictions.begin() + static_cast<std::ptrdiff_t>(split.cutoff),
                                     predictions.end());
        split.test_metrics = scorer_.score(test);

        spdlog::debug("{} -> cutoff {} of {}", split.label(), split.cutoff, predictions.size());
        report.splits.push_back(std::move(split));
    }
    report.message = fmt::format("Evaluated {} chronological splits over {} games",
                                 report.splits.size(), predictions.size());
    return report;
}

std::string TimeSplitEngine::season_label(const std::optional<CalendarDate>& date) {
    if (!date) {
        return "unknown";
    }
    int year = date->year;
    if (date->month >= 9) {
        return fmt::format("{}-{}", year, year + 1);
    }
    return fmt::format("{}-{}", year - 1, year);
}

BucketReport TimeSplitEngine::season_breakdown(const std::vector<Prediction>& predictions) const {
    BucketingEngine bucketing(scorer_);
    return bucketing.score_partition(BucketingEngine::partition(
        predictions,
        [](const Prediction& p) { return season_label(p.parsed_date); }));
}
