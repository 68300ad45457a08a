#include "types.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <tuple>

namespace {
    std::optional<double> optional_number(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number()) {
            return std::nullopt;
        }
        double value = it->get<double>();
        if (!std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    }

    // Team ids and winners arrive as strings or numbers depending on the feed
    std::optional<std::string> optional_text(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return std::nullopt;
        }
        if (it->is_string()) {
            auto value = it->get<std::string>();
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }
        if (it->is_number_integer()) {
            return it->dump();
        }
        return std::nullopt;
    }

    std::optional<double> parse_number(const std::string& text) {
        const char* begin = text.c_str();
        char* end = nullptr;
        double value = std::strtod(begin, &end);
        if (end == begin || *end != '\0' || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    }

    nlohmann::json optional_to_json(const std::optional<double>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }
}

std::optional<double> scalarize_metric(const nlohmann::json& value) {
    if (value.is_boolean()) {
        return value.get<bool>() ? 1.0 : 0.0;
    }
    if (value.is_number()) {
        double number = value.get<double>();
        return std::isfinite(number) ? std::optional<double>(number) : std::nullopt;
    }
    if (value.is_string()) {
        return parse_number(value.get<std::string>());
    }
    if (value.is_array()) {
        double sum = 0.0;
        size_t count = 0;
        for (const auto& element : value) {
            std::optional<double> number;
            if (element.is_number() || element.is_boolean()) {
                number = scalarize_metric(element);
            } else if (element.is_string()) {
                number = parse_number(element.get<std::string>());
            }
            if (number) {
                sum += *number;
                ++count;
            }
        }
        if (count == 0) {
            return std::nullopt;
        }
        return sum / static_cast<double>(count);
    }
    return std::nullopt;
}

std::string side_to_string(Side side) {
    return side == Side::Away ? "away" : "home";
}

double binary_label(Side winner, Side positive_side) {
    return winner == positive_side ? 1.0 : 0.0;
}

bool CalendarDate::operator<(const CalendarDate& other) const {
    return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
}

bool CalendarDate::operator==(const CalendarDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

AuxMetrics AuxMetrics::from_json(const nlohmann::json& j) {
    AuxMetrics m;
    if (!j.is_object()) {
        return m;
    }
    m.monte_carlo_flip_rate = optional_number(j, "monte_carlo_flip_rate");
    m.away_prob_score_first = optional_number(j, "away_prob_score_first");
    m.home_prob_score_first = optional_number(j, "home_prob_score_first");
    m.away_first_goal_win_uplift = optional_number(j, "away_first_goal_win_uplift");
    m.home_first_goal_win_uplift = optional_number(j, "home_first_goal_win_uplift");
    for (const auto& item : j.items()) {
        auto scalar = scalarize_metric(item.value());
        if (scalar) {
            m.scalars[item.key()] = *scalar;
        }
    }
    return m;
}

RawPrediction RawPrediction::from_json(const nlohmann::json& j) {
    RawPrediction raw;
    raw.date = optional_text(j, "date").value_or("");
    raw.away_team = optional_text(j, "away_team").value_or("");
    raw.home_team = optional_text(j, "home_team").value_or("");
    raw.predicted_away_win_prob = optional_number(j, "predicted_away_win_prob");
    raw.predicted_home_win_prob = optional_number(j, "predicted_home_win_prob");
    raw.actual_winner = optional_text(j, "actual_winner");
    raw.context_bucket = optional_text(j, "context_bucket");
    raw.monte_carlo_flip_rate = optional_number(j, "monte_carlo_flip_rate");
    if (j.contains("metrics_used")) {
        raw.metrics_used = AuxMetrics::from_json(j.at("metrics_used"));
    }
    return raw;
}

Side Prediction::predicted_side() const {
    // Exact ties go to the home side
    return away_prob > home_prob ? Side::Away : Side::Home;
}

double Prediction::spread() const {
    return std::fabs(away_prob - home_prob);
}

double Prediction::confidence() const {
    return std::max(away_prob, home_prob);
}

double Prediction::prob_of(Side side) const {
    return side == Side::Away ? away_prob : home_prob;
}

std::string MetricsResult::to_string() const {
    std::string brier_str = brier ? fmt::format("{:.3f}", *brier) : "N/A";
    std::string log_loss_str = log_loss ? fmt::format("{:.3f}", *log_loss) : "N/A";
    return fmt::format("N={}, Acc={:.3f}, Brier={}, LogLoss={}",
                       n, accuracy, brier_str, log_loss_str);
}

nlohmann::json MetricsResult::to_json() const {
    return {
        {"n", n},
        {"accuracy", accuracy},
        {"brier", optional_to_json(brier)},
        {"log_loss", optional_to_json(log_loss)}
    };
}

nlohmann::json bucket_report_to_json(const BucketReport& report) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [label, metrics] : report) {
        j[label] = metrics.to_json();
    }
    return j;
}
