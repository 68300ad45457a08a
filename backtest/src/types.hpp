#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

// Canonical outcome side. Every component labels outcomes through binary_label().
enum class Side {
    Away,
    Home
};

std::string side_to_string(Side side);

// 1.0 when the realized winner is the component's positive side, else 0.0
double binary_label(Side winner, Side positive_side);

struct CalendarDate {
    int year = 0;
    int month = 0;
    int day = 0;

    bool operator<(const CalendarDate& other) const;
    bool operator==(const CalendarDate& other) const;
};

// Numbers as-is, booleans as 0/1, arrays as the mean of their numeric elements,
// numeric strings parsed; anything else is nullopt
std::optional<double> scalarize_metric(const nlohmann::json& value);

// Auxiliary per-game metrics; every field is optional
struct AuxMetrics {
    std::optional<double> monte_carlo_flip_rate;
    std::optional<double> away_prob_score_first;
    std::optional<double> home_prob_score_first;
    std::optional<double> away_first_goal_win_uplift;
    std::optional<double> home_first_goal_win_uplift;

    // Every metrics_used entry that reduces to a scalar, keyed by name
    std::map<std::string, double> scalars;

    static AuxMetrics from_json(const nlohmann::json& j);
};

// Prediction as produced upstream, before normalization
struct RawPrediction {
    std::string date;
    std::string away_team;
    std::string home_team;
    std::optional<double> predicted_away_win_prob;
    std::optional<double> predicted_home_win_prob;
    std::optional<std::string> actual_winner;
    std::optional<std::string> context_bucket;
    std::optional<double> monte_carlo_flip_rate;
    AuxMetrics metrics_used;

    // Lenient: wrong-typed fields are left empty so the loader can count the drop
    static RawPrediction from_json(const nlohmann::json& j);
};

// Completed game with a normalized probability pair (away_prob + home_prob == 1)
struct Prediction {
    std::string date;
    std::optional<CalendarDate> parsed_date;
    std::string away_team;
    std::string home_team;
    double away_prob = 0.5;
    double home_prob = 0.5;
    Side actual_winner = Side::Home;
    std::string context_bucket = "neutral";
    AuxMetrics metrics;

    Side predicted_side() const;
    double spread() const;
    double confidence() const;
    double prob_of(Side side) const;
};

struct MetricsResult {
    size_t n = 0;
    double accuracy = 0.0;
    std::optional<double> brier;
    std::optional<double> log_loss;

    bool empty() const { return n == 0; }
    std::string to_string() const;
    nlohmann::json to_json() const;
};

// Ordered bucket label -> metrics
using BucketReport = std::map<std::string, MetricsResult>;

nlohmann::json bucket_report_to_json(const BucketReport& report);
