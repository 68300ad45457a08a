#pragma once

#include "types.hpp"
#include "config.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// (bin midpoint, observed away-win rate), non-decreasing in both coordinates
using CalibrationPoints = std::vector<std::pair<double, double>>;

struct ReliabilityBin {
    double lower = 0.0;
    double upper = 0.0;
    size_t n = 0;
    std::optional<double> mean_predicted;
    std::optional<double> observed_rate;
};

struct CalibrationCurve {
    CalibrationPoints points;
    size_t sample_size = 0;

    bool usable() const { return points.size() >= 2; }
};

struct CalibrationReport {
    bool sufficient = false;
    std::string message;
    int num_bins = 0;
    CalibrationCurve overall;
    std::map<std::string, CalibrationCurve> by_context;
    std::vector<ReliabilityBin> reliability;

    nlohmann::json to_json() const;
};

// Maps raw away-win probabilities onto observed frequencies
class CalibrationCurveBuilder {
public:
    // Throws std::invalid_argument on a bad calibration configuration
    explicit CalibrationCurveBuilder(const CalibrationConfig& config);

    CalibrationReport fit(const std::vector<Prediction>& predictions) const;

    // Context curve first, then the overall curve, else the clamped input
    double apply(const CalibrationReport& report, double away_prob,
                 const std::string& context_bucket = "") const;

    std::vector<ReliabilityBin> reliability_table(const std::vector<Prediction>& predictions) const;

    static CalibrationCurve build_curve(const std::vector<std::pair<double, double>>& records, int num_bins);
    static double interpolate(const CalibrationPoints& points, double prob);

    // Context curves need at least this many games
    size_t min_bucket_samples() const;

private:
    size_t bin_index(double prob) const;

    CalibrationConfig config_;
};
