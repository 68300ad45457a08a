#include "config.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    void require_unit_interval(const char* name, double value) {
        if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
            throw std::invalid_argument(fmt::format("{} must be within [0, 1], got {}", name, value));
        }
    }

    std::vector<double> parse_fractions(const std::string& text) {
        std::vector<double> fractions;
        for (const auto& token : util::split_string(text, ',')) {
            try {
                size_t pos = 0;
                double value = std::stod(token, &pos);
                if (pos != token.size()) {
                    throw std::invalid_argument("trailing characters");
                }
                fractions.push_back(value);
            } catch (const std::exception&) {
                throw std::runtime_error(fmt::format("Invalid train fraction: {}", token));
            }
        }
        return fractions;
    }
}

void MetaModelConfig::validate() const {
    if (!std::isfinite(learning_rate) || learning_rate <= 0.0) {
        throw std::invalid_argument(fmt::format("Learning rate must be positive, got {}", learning_rate));
    }
    if (epochs <= 0) {
        throw std::invalid_argument(fmt::format("Epoch count must be positive, got {}", epochs));
    }
    if (!(train_fraction > 0.0 && train_fraction < 1.0)) {
        throw std::invalid_argument(fmt::format("Meta-model train fraction must be in (0, 1), got {}", train_fraction));
    }
    if (!std::isfinite(convergence_tolerance) || convergence_tolerance < 0.0) {
        throw std::invalid_argument(fmt::format("Convergence tolerance must be non-negative, got {}", convergence_tolerance));
    }
    if (min_records < 2) {
        throw std::invalid_argument("Meta-model needs a minimum of at least 2 records");
    }
    require_unit_interval("Default flip rate", defaults.flip_rate);
    require_unit_interval("Default score-first probability", defaults.prob_score_first);
    require_unit_interval("Default first-goal uplift", defaults.first_goal_win_uplift);
}

void TimeSplitConfig::validate() const {
    if (train_fractions.empty()) {
        throw std::invalid_argument("At least one train fraction is required");
    }
    for (double fraction : train_fractions) {
        if (!(fraction > 0.0 && fraction < 1.0)) {
            throw std::invalid_argument(fmt::format("Train fraction must be in (0, 1), got {}", fraction));
        }
    }
    if (min_records == 0) {
        throw std::invalid_argument("Minimum split record count must be positive");
    }
}

void CalibrationConfig::validate() const {
    if (num_bins < 2) {
        throw std::invalid_argument(fmt::format("Calibration needs at least 2 bins, got {}", num_bins));
    }
    require_unit_interval("Calibration floor", floor);
    require_unit_interval("Calibration ceiling", ceiling);
    if (floor >= ceiling) {
        throw std::invalid_argument("Calibration floor must be below the ceiling");
    }
}

void DiagnosticsConfig::validate() const {
    if (recent_window == 0) {
        throw std::invalid_argument("Recent window must be positive");
    }
    if (top_correlations == 0) {
        throw std::invalid_argument("At least one metric correlation must be reported");
    }
}

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = util::get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = util::get_env_var("LOG_LEVEL", config.log_level);
    config.predictions_path = util::get_env_var("PREDICTIONS_PATH", config.predictions_path);

    // Time-aware splits
    std::string fractions = util::get_env_var("TRAIN_FRACTIONS");
    if (!fractions.empty()) {
        config.time_split.train_fractions = parse_fractions(fractions);
    }
    config.time_split.min_records = static_cast<size_t>(
        std::max(0, util::get_env_int("MIN_SPLIT_RECORDS", static_cast<int>(config.time_split.min_records))));

    // Meta-model
    auto& meta = config.meta_model;
    meta.learning_rate = util::get_env_double("META_LEARNING_RATE", meta.learning_rate);
    meta.epochs = util::get_env_int("META_EPOCHS", meta.epochs);
    meta.train_fraction = util::get_env_double("META_TRAIN_FRACTION", meta.train_fraction);
    meta.convergence_tolerance = util::get_env_double("META_TOLERANCE", meta.convergence_tolerance);
    meta.min_records = static_cast<size_t>(
        std::max(0, util::get_env_int("META_MIN_RECORDS", static_cast<int>(meta.min_records))));
    meta.defaults.flip_rate = util::get_env_double("DEFAULT_FLIP_RATE", meta.defaults.flip_rate);
    meta.defaults.prob_score_first = util::get_env_double("DEFAULT_SCORE_FIRST", meta.defaults.prob_score_first);
    meta.defaults.first_goal_win_uplift = util::get_env_double("DEFAULT_FIRST_GOAL_UPLIFT", meta.defaults.first_goal_win_uplift);

    // Calibration
    config.calibration.num_bins = util::get_env_int("CALIBRATION_BINS", config.calibration.num_bins);
    config.calibration.min_games = static_cast<size_t>(
        std::max(0, util::get_env_int("CALIBRATION_MIN_GAMES", static_cast<int>(config.calibration.min_games))));

    // Diagnostics
    config.diagnostics.recent_window = static_cast<size_t>(
        std::max(0, util::get_env_int("RECENT_WINDOW", static_cast<int>(config.diagnostics.recent_window))));
    config.diagnostics.top_correlations = static_cast<size_t>(
        std::max(0, util::get_env_int("TOP_CORRELATIONS", static_cast<int>(config.diagnostics.top_correlations))));

    return config;
}

void Config::validate() const {
    time_split.validate();
    meta_model.validate();
    calibration.validate();
    diagnostics.validate();

    spdlog::info("Configuration validated successfully");
}
