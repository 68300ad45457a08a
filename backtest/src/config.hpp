#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Values used when an auxiliary metric is missing from a prediction
struct FeatureDefaults {
    double flip_rate = 0.0;
    double prob_score_first = 0.5;
    double first_goal_win_uplift = 0.2;
};

struct MetaModelConfig {
    double learning_rate = 0.05;
    int epochs = 800;
    double train_fraction = 0.7;
    // Stop early once the largest averaged gradient component drops below this; 0 disables
    double convergence_tolerance = 0.0;
    size_t min_records = 50;
    FeatureDefaults defaults;

    void validate() const;
};

struct TimeSplitConfig {
    std::vector<double> train_fractions = {0.6, 0.7, 0.8};
    size_t min_records = 50;

    void validate() const;
};

struct CalibrationConfig {
    int num_bins = 12;
    size_t min_games = 60;
    // Applied probabilities are clamped to [floor, ceiling]
    double floor = 0.05;
    double ceiling = 0.95;

    void validate() const;
};

struct DiagnosticsConfig {
    // Last N completed games scored on their own
    size_t recent_window = 60;
    // Strongest metric correlations kept in the report
    size_t top_correlations = 25;

    void validate() const;
};

struct Config {
    // Service configuration
    std::string service_name = "wincal";
    std::string log_level = "info";
    std::string predictions_path = "win_probability_predictions_v2.json";

    TimeSplitConfig time_split;
    MetaModelConfig meta_model;
    CalibrationConfig calibration;
    DiagnosticsConfig diagnostics;

    // Load from environment variables
    static Config from_env();

    // Throws std::invalid_argument on any bad hyperparameter
    void validate() const;
};
