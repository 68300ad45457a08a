#include <gtest/gtest.h>

#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() {
        unsetenv(name_);
    }

private:
    const char* name_;
};

} // namespace

TEST(Config, DefaultsAreValid) {
    Config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.time_split.train_fractions, (std::vector<double>{0.6, 0.7, 0.8}));
    EXPECT_EQ(config.time_split.min_records, 50u);
    EXPECT_DOUBLE_EQ(config.meta_model.learning_rate, 0.05);
    EXPECT_EQ(config.meta_model.epochs, 800);
    EXPECT_DOUBLE_EQ(config.meta_model.train_fraction, 0.7);
    EXPECT_DOUBLE_EQ(config.meta_model.defaults.prob_score_first, 0.5);
    EXPECT_DOUBLE_EQ(config.meta_model.defaults.first_goal_win_uplift, 0.2);
    EXPECT_EQ(config.calibration.num_bins, 12);
}

TEST(Config, ReadsOverridesFromEnvironment) {
    ScopedEnv fractions("TRAIN_FRACTIONS", "0.5, 0.9");
    ScopedEnv lr("META_LEARNING_RATE", "0.1");
    ScopedEnv epochs("META_EPOCHS", "300");
    ScopedEnv minimum("MIN_SPLIT_RECORDS", "20");
    ScopedEnv uplift("DEFAULT_FIRST_GOAL_UPLIFT", "0.25");

    Config config = Config::from_env();
    EXPECT_EQ(config.time_split.train_fractions, (std::vector<double>{0.5, 0.9}));
    EXPECT_DOUBLE_EQ(config.meta_model.learning_rate, 0.1);
    EXPECT_EQ(config.meta_model.epochs, 300);
    EXPECT_EQ(config.time_split.min_records, 20u);
    EXPECT_DOUBLE_EQ(config.meta_model.defaults.first_goal_win_uplift, 0.25);
    EXPECT_NO_THROW(config.validate());
}

TEST(Config, RejectsUnparsableEnvironmentValues) {
    ScopedEnv epochs("META_EPOCHS", "many");
    EXPECT_THROW(Config::from_env(), std::runtime_error);
}

TEST(Config, RejectsTrainFractionsWithTrailingCharacters) {
    ScopedEnv fractions("TRAIN_FRACTIONS", "0.6, 0.7x");
    EXPECT_THROW(Config::from_env(), std::runtime_error);
}

TEST(Config, ReadsDiagnosticsWindowFromEnvironment) {
    ScopedEnv window("RECENT_WINDOW", "120");
    ScopedEnv top("TOP_CORRELATIONS", "10");
    Config config = Config::from_env();
    EXPECT_EQ(config.diagnostics.recent_window, 120u);
    EXPECT_EQ(config.diagnostics.top_correlations, 10u);

    Config empty_window;
    empty_window.diagnostics.recent_window = 0;
    EXPECT_THROW(empty_window.validate(), std::invalid_argument);
}

TEST(Config, ValidateFailsFastOnBadHyperparameters) {
    Config zero_lr;
    zero_lr.meta_model.learning_rate = 0.0;
    EXPECT_THROW(zero_lr.validate(), std::invalid_argument);

    Config negative_epochs;
    negative_epochs.meta_model.epochs = -5;
    EXPECT_THROW(negative_epochs.validate(), std::invalid_argument);

    Config no_fractions;
    no_fractions.time_split.train_fractions.clear();
    EXPECT_THROW(no_fractions.validate(), std::invalid_argument);

    Config negative_tolerance;
    negative_tolerance.meta_model.convergence_tolerance = -1e-3;
    EXPECT_THROW(negative_tolerance.validate(), std::invalid_argument);
}
