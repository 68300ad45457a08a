#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Drop counters; every input record lands in exactly one of kept or a drop bucket
struct LoadStats {
    size_t total = 0;
    size_t kept = 0;
    size_t malformed_record = 0;
    size_t no_outcome = 0;
    size_t malformed_probability = 0;
    size_t degenerate_probability = 0;
    size_t unresolved_winner = 0;
    size_t undated = 0;  // kept records without a parsable date (sorted first)

    size_t dropped() const;
    nlohmann::json to_json() const;
};

struct LoadResult {
    std::vector<Prediction> predictions;
    LoadStats stats;
};

// Rescales a [0,100] pair to [0,1] and renormalizes it to sum to 1.
// Returns nullopt when the pair sums to <= 0.
std::optional<std::pair<double, double>> normalize_probabilities(double away_prob, double home_prob);

// Maps "away"/"home" or a team id onto a side
std::optional<Side> resolve_winner(const std::string& winner,
                                   const std::string& away_team,
                                   const std::string& home_team);

class PredictionLoader {
public:
    PredictionLoader() = default;

    // Clean, normalize and chronologically sort the given records
    LoadResult load(const std::vector<RawPrediction>& raw) const;

    // Accepts a JSON array or an object holding a "predictions" array
    LoadResult load_json(const nlohmann::json& document) const;

    // Throws std::runtime_error when the file can't be read or parsed
    LoadResult load_file(const std::string& path) const;

private:
    LoadResult load_records(const std::vector<RawPrediction>& raw, LoadStats stats) const;
    std::optional<Prediction> clean(const RawPrediction& raw, LoadStats& stats) const;
};
