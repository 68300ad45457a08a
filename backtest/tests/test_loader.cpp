#include <gtest/gtest.h>

#include "loader.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

using test_helpers::make_raw;

TEST(NormalizeProbabilities, AlreadyNormalizedPairIsUnchanged) {
    auto once = normalize_probabilities(0.6, 0.4);
    ASSERT_TRUE(once.has_value());
    EXPECT_DOUBLE_EQ(once->first, 0.6);
    EXPECT_DOUBLE_EQ(once->second, 0.4);

    auto twice = normalize_probabilities(once->first, once->second);
    ASSERT_TRUE(twice.has_value());
    EXPECT_DOUBLE_EQ(twice->first, once->first);
    EXPECT_DOUBLE_EQ(twice->second, once->second);
}

TEST(NormalizeProbabilities, PercentageScaleIsDividedByHundred) {
    auto pair = normalize_probabilities(70.0, 30.0);
    ASSERT_TRUE(pair.has_value());
    EXPECT_NEAR(pair->first, 0.7, 1e-12);
    EXPECT_NEAR(pair->second, 0.3, 1e-12);
}

TEST(NormalizeProbabilities, PercentagePairThatOvershootsIsRenormalized) {
    auto pair = normalize_probabilities(150.0, 50.0);
    ASSERT_TRUE(pair.has_value());
    EXPECT_NEAR(pair->first, 0.75, 1e-12);
    EXPECT_NEAR(pair->second, 0.25, 1e-12);
}

TEST(NormalizeProbabilities, ZeroSumIsDegenerate) {
    EXPECT_FALSE(normalize_probabilities(0.0, 0.0).has_value());
}

TEST(ResolveWinner, LiteralsAndTeamIds) {
    EXPECT_EQ(resolve_winner("away", "BOS", "TOR"), Side::Away);
    EXPECT_EQ(resolve_winner(" HOME ", "BOS", "TOR"), Side::Home);
    EXPECT_EQ(resolve_winner("BOS", "BOS", "TOR"), Side::Away);
    EXPECT_EQ(resolve_winner("TOR", "BOS", "TOR"), Side::Home);
    EXPECT_FALSE(resolve_winner("MTL", "BOS", "TOR").has_value());
}

TEST(PredictionLoader, DropsAreCountedNotThrown) {
    std::vector<RawPrediction> raw = {
        make_raw(0.6, 0.4, std::string("away")),          // kept
        make_raw(0.6, 0.4, std::nullopt),                 // no outcome
        make_raw(std::nullopt, 0.4, std::string("home")), // missing probability
        make_raw(-0.2, 0.4, std::string("home")),         // negative probability
        make_raw(0.0, 0.0, std::string("home")),          // degenerate
        make_raw(0.5, 0.5, std::string("MTL")),           // unresolved winner
        make_raw(55.0, 45.0, std::string("TOR")),         // kept, percentage scale
    };

    PredictionLoader loader;
    LoadResult result;
    ASSERT_NO_THROW(result = loader.load(raw));

    EXPECT_EQ(result.stats.total, 7u);
    EXPECT_EQ(result.stats.kept, 2u);
    EXPECT_EQ(result.stats.no_outcome, 1u);
    EXPECT_EQ(result.stats.malformed_probability, 2u);
    EXPECT_EQ(result.stats.degenerate_probability, 1u);
    EXPECT_EQ(result.stats.unresolved_winner, 1u);
    EXPECT_EQ(result.stats.kept + result.stats.dropped(), result.stats.total);

    for (const auto& p : result.predictions) {
        EXPECT_NEAR(p.away_prob + p.home_prob, 1.0, 1e-12);
    }
    EXPECT_EQ(result.predictions[1].actual_winner, Side::Home);
    EXPECT_NEAR(result.predictions[1].away_prob, 0.55, 1e-12);
}

TEST(PredictionLoader, SortsChronologicallyWithUndatedFirst) {
    std::vector<RawPrediction> raw = {
        make_raw(0.6, 0.4, std::string("away"), "2024-11-05"),
        make_raw(0.6, 0.4, std::string("away"), "not a date"),
        make_raw(0.6, 0.4, std::string("away"), "2024/10/20"),
        make_raw(0.6, 0.4, std::string("away"), "2024-10-20T19:00:00"),
        make_raw(0.6, 0.4, std::string("away"), ""),
    };
    raw[2].away_team = "first-of-tie";
    raw[3].away_team = "second-of-tie";

    LoadResult result = PredictionLoader().load(raw);
    ASSERT_EQ(result.predictions.size(), 5u);
    EXPECT_EQ(result.stats.undated, 2u);

    EXPECT_EQ(result.predictions[0].date, "not a date");
    EXPECT_EQ(result.predictions[1].date, "");
    EXPECT_EQ(result.predictions[2].away_team, "first-of-tie");
    EXPECT_EQ(result.predictions[3].away_team, "second-of-tie");
    EXPECT_EQ(result.predictions[4].date, "2024-11-05");
}

TEST(PredictionLoader, ContextDefaultsToNeutralAndFlipRateFallsBackToTopLevel) {
    auto raw = make_raw(0.6, 0.4, std::string("home"));
    raw.monte_carlo_flip_rate = 0.12;

    auto with_context = make_raw(0.6, 0.4, std::string("home"));
    with_context.context_bucket = "b2b_away";
    with_context.metrics_used.monte_carlo_flip_rate = 0.3;
    with_context.monte_carlo_flip_rate = 0.9;

    LoadResult result = PredictionLoader().load({raw, with_context});
    ASSERT_EQ(result.predictions.size(), 2u);
    EXPECT_EQ(result.predictions[0].context_bucket, "neutral");
    EXPECT_DOUBLE_EQ(*result.predictions[0].metrics.monte_carlo_flip_rate, 0.12);
    EXPECT_EQ(result.predictions[1].context_bucket, "b2b_away");
    EXPECT_DOUBLE_EQ(*result.predictions[1].metrics.monte_carlo_flip_rate, 0.3);
}

TEST(PredictionLoader, ReadsPredictionsDocument) {
    auto document = nlohmann::json::parse(R"({
        "predictions": [
            {"date": "2024-10-02", "away_team": "BOS", "home_team": "TOR",
             "predicted_away_win_prob": 62, "predicted_home_win_prob": 38,
             "actual_winner": "BOS", "context_bucket": "rested",
             "metrics_used": {"away_prob_score_first": 0.55, "home_xg": 2.4,
                              "rested": true, "shot_rates": [1.0, "2.0", "n/a"], "goalie": "Smith"}},
            {"date": "2024-10-01", "away_team": "MTL", "home_team": "OTT",
             "predicted_away_win_prob": 0.4, "predicted_home_win_prob": 0.6,
             "actual_winner": null},
            {"date": "2024-10-03", "away_team": "NYR", "home_team": "NJD",
             "predicted_away_win_prob": "0.4", "predicted_home_win_prob": 0.6,
             "actual_winner": "home"},
            "garbage"
        ]
    })");

    LoadResult result = PredictionLoader().load_json(document);
    EXPECT_EQ(result.stats.total, 4u);
    EXPECT_EQ(result.stats.kept, 1u);
    EXPECT_EQ(result.stats.no_outcome, 1u);
    EXPECT_EQ(result.stats.malformed_probability, 1u);
    EXPECT_EQ(result.stats.malformed_record, 1u);

    const auto& game = result.predictions.front();
    EXPECT_EQ(game.actual_winner, Side::Away);
    EXPECT_NEAR(game.away_prob, 0.62, 1e-12);
    EXPECT_EQ(game.context_bucket, "rested");
    EXPECT_DOUBLE_EQ(*game.metrics.away_prob_score_first, 0.55);
    EXPECT_DOUBLE_EQ(game.metrics.scalars.at("home_xg"), 2.4);
    EXPECT_DOUBLE_EQ(game.metrics.scalars.at("away_prob_score_first"), 0.55);
    EXPECT_DOUBLE_EQ(game.metrics.scalars.at("rested"), 1.0);
    EXPECT_DOUBLE_EQ(game.metrics.scalars.at("shot_rates"), 1.5);
    EXPECT_EQ(game.metrics.scalars.count("goalie"), 0u);
    EXPECT_FALSE(game.metrics.home_prob_score_first.has_value());
}

TEST(PredictionLoader, AcceptsBareArrayAndRejectsOtherShapes) {
    auto array = nlohmann::json::parse(R"([
        {"date": "2024-10-02", "away_team": "BOS", "home_team": "TOR",
         "predicted_away_win_prob": 0.5, "predicted_home_win_prob": 0.5,
         "actual_winner": "home"}
    ])");
    EXPECT_EQ(PredictionLoader().load_json(array).stats.kept, 1u);

    EXPECT_THROW(PredictionLoader().load_json(nlohmann::json{{"games", 3}}), std::runtime_error);
    EXPECT_THROW(PredictionLoader().load_file("/nonexistent/predictions.json"), std::runtime_error);
}

TEST(ParseDate, AcceptsBothSeparatorsAndRejectsGarbage) {
    auto dash = util::parse_date("2025-02-28");
    ASSERT_TRUE(dash.has_value());
    EXPECT_EQ(dash->year, 2025);
    EXPECT_EQ(dash->month, 2);
    EXPECT_EQ(dash->day, 28);

    EXPECT_TRUE(util::parse_date("2024/02/29").has_value());
    EXPECT_FALSE(util::parse_date("2025-02-29").has_value());
    EXPECT_FALSE(util::parse_date("2025-13-01").has_value());
    EXPECT_FALSE(util::parse_date("2025-1-01").has_value());
    EXPECT_FALSE(util::parse_date("yesterday").has_value());
}
