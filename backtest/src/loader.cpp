#include "loader.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

size_t LoadStats::dropped() const {
    return malformed_record + no_outcome + malformed_probability +
           degenerate_probability + unresolved_winner;
}

nlohmann::json LoadStats::to_json() const {
    return {
        {"total", total},
        {"kept", kept},
        {"malformed_record", malformed_record},
        {"no_outcome", no_outcome},
        {"malformed_probability", malformed_probability},
        {"degenerate_probability", degenerate_probability},
        {"unresolved_winner", unresolved_winner},
        {"undated", undated}
    };
}

std::optional<std::pair<double, double>> normalize_probabilities(double away_prob, double home_prob) {
    if (away_prob > 1.0 || home_prob > 1.0) {
        away_prob /= 100.0;
        home_prob /= 100.0;
    }

    double total = away_prob + home_prob;
    if (!(total > 0.0)) {
        return std::nullopt;
    }

    return std::make_pair(away_prob / total, home_prob / total);
}

std::optional<Side> resolve_winner(const std::string& winner,
                                   const std::string& away_team,
                                   const std::string& home_team) {
    std::string literal = util::to_lower(util::trim(winner));
    if (literal == "away") {
        return Side::Away;
    }
    if (literal == "home") {
        return Side::Home;
    }
    if (!away_team.empty() && winner == away_team) {
        return Side::Away;
    }
    if (!home_team.empty() && winner == home_team) {
        return Side::Home;
    }
    return std::nullopt;
}

std::optional<Prediction> PredictionLoader::clean(const RawPrediction& raw, LoadStats& stats) const {
    if (!raw.actual_winner) {
        ++stats.no_outcome;
        return std::nullopt;
    }

    if (!raw.predicted_away_win_prob || !raw.predicted_home_win_prob) {
        spdlog::debug("Dropping {} @ {} ({}): missing probability", raw.away_team, raw.home_team, raw.date);
        ++stats.malformed_probability;
        return std::nullopt;
    }

    double pa = *raw.predicted_away_win_prob;
    double ph = *raw.predicted_home_win_prob;
    if (!std::isfinite(pa) || !std::isfinite(ph) || pa < 0.0 || ph < 0.0) {
        spdlog::debug("Dropping {} @ {} ({}): invalid probability pair {} / {}",
                      raw.away_team, raw.home_team, raw.date, pa, ph);
        ++stats.malformed_probability;
        return std::nullopt;
    }

    auto normalized = normalize_probabilities(pa, ph);
    if (!normalized) {
        spdlog::debug("Dropping {} @ {} ({}): probability pair sums to zero",
                      raw.away_team, raw.home_team, raw.date);
        ++stats.degenerate_probability;
        return std::nullopt;
    }

    auto winner = resolve_winner(*raw.actual_winner, raw.away_team, raw.home_team);
    if (!winner) {
        spdlog::debug("Dropping {} @ {} ({}): unresolvable winner '{}'",
                      raw.away_team, raw.home_team, raw.date, *raw.actual_winner);
        ++stats.unresolved_winner;
        return std::nullopt;
    }

    Prediction p;
    p.date = raw.date;
    p.parsed_date = util::parse_date(raw.date);
    p.away_team = raw.away_team;
    p.home_team = raw.home_team;
    p.away_prob = normalized->first;
    p.home_prob = normalized->second;
    p.actual_winner = *winner;
    p.context_bucket = raw.context_bucket.value_or("neutral");
    p.metrics = raw.metrics_used;
    if (!p.metrics.monte_carlo_flip_rate) {
        p.metrics.monte_carlo_flip_rate = raw.monte_carlo_flip_rate;
    }
    return p;
}

LoadResult PredictionLoader::load(const std::vector<RawPrediction>& raw) const {
    return load_records(raw, LoadStats{});
}

LoadResult PredictionLoader::load_records(const std::vector<RawPrediction>& raw, LoadStats stats) const {
    LoadResult result;
    result.stats = stats;
    result.stats.total += raw.size();
    result.predictions.reserve(raw.size());

    for (const auto& record : raw) {
        auto cleaned = clean(record, result.stats);
        if (cleaned) {
            result.predictions.push_back(std::move(*cleaned));
        }
    }

    // Undated records go first; ties keep input order
    std::stable_sort(result.predictions.begin(), result.predictions.end(),
        [](const Prediction& a, const Prediction& b) {
            if (!a.parsed_date || !b.parsed_date) {
                return !a.parsed_date && b.parsed_date;
            }
            return *a.parsed_date < *b.parsed_date;
        });

    result.stats.kept = result.predictions.size();
    result.stats.undated = static_cast<size_t>(std::count_if(
        result.predictions.begin(), result.predictions.end(),
        [](const Prediction& p) { return !p.parsed_date; }));

    spdlog::info("Loaded {} completed games with valid probabilities ({} of {} dropped: "
                 "{} no outcome, {} malformed probability, {} degenerate, {} unresolved winner, {} malformed record)",
                 result.stats.kept, result.stats.dropped(), result.stats.total,
                 result.stats.no_outcome, result.stats.malformed_probability,
                 result.stats.degenerate_probability, result.stats.unresolved_winner,
                 result.stats.malformed_record);
    if (result.stats.undated > 0) {
        spdlog::warn("{} games have no parsable date and are ordered before all dated games",
                     result.stats.undated);
    }

    return result;
}

LoadResult PredictionLoader::load_json(const nlohmann::json& document) const {
    const nlohmann::json* entries = &document;
    if (document.is_object() && document.contains("predictions")) {
        entries = &document.at("predictions");
    }
    if (!entries->is_array()) {
        throw std::runtime_error("Predictions document must be an array or hold a 'predictions' array");
    }

    std::vector<RawPrediction> raw;
    raw.reserve(entries->size());
    LoadStats stats;
    for (const auto& entry : *entries) {
        if (!entry.is_object()) {
            ++stats.malformed_record;
            ++stats.total;
            continue;
        }
        raw.push_back(RawPrediction::from_json(entry));
    }

    return load_records(raw, stats);
}

LoadResult PredictionLoader::load_file(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open predictions file: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse predictions file " + path + ": " + e.what());
    }

    return load_json(document);
}
