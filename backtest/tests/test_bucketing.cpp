#include <gtest/gtest.h>

#include "bucketing.hpp"
#include "test_helpers.hpp"

#include <set>

using test_helpers::make_prediction;

namespace {

std::vector<Prediction> mixed_games() {
    std::vector<Prediction> games = {
        make_prediction(0.51, Side::Home, "2024-10-01", "neutral"),
        make_prediction(0.46, Side::Home, "2024-10-02", "b2b_home"),
        make_prediction(0.58, Side::Away, "2024-10-03", "b2b_away"),
        make_prediction(0.70, Side::Away, "2024-10-04", "neutral"),
        make_prediction(0.25, Side::Away, "2024-10-05", "rested"),
        make_prediction(0.61, Side::Home, "2024-10-06", ""),
        make_prediction(0.90, Side::Away, "2024-10-07", "neutral"),
    };
    for (size_t i = 0; i < games.size(); ++i) {
        games[i].away_team = "team" + std::to_string(i);
    }
    return games;
}

} // namespace

TEST(BucketingEngine, SpreadLadderBoundariesAreLowerInclusive) {
    EXPECT_EQ(BucketingEngine::spread_label(0.0), "<5%");
    EXPECT_EQ(BucketingEngine::spread_label(0.049), "<5%");
    EXPECT_EQ(BucketingEngine::spread_label(0.05), "5-10%");
    EXPECT_EQ(BucketingEngine::spread_label(0.10), "10-15%");
    EXPECT_EQ(BucketingEngine::spread_label(0.15), "15-20%");
    EXPECT_EQ(BucketingEngine::spread_label(0.20), ">=20%");
    EXPECT_EQ(BucketingEngine::spread_label(1.0), ">=20%");
}

TEST(BucketingEngine, ConfidenceLadderBoundaries) {
    EXPECT_EQ(BucketingEngine::confidence_label(0.50), "50-55%");
    EXPECT_EQ(BucketingEngine::confidence_label(0.549), "50-55%");
    EXPECT_EQ(BucketingEngine::confidence_label(0.55), "55-60%");
    EXPECT_EQ(BucketingEngine::confidence_label(0.60), "60-65%");
    EXPECT_EQ(BucketingEngine::confidence_label(0.65), "65-100%");
    EXPECT_EQ(BucketingEngine::confidence_label(1.0), "65-100%");
}

TEST(BucketingEngine, EveryGameLandsInExactlyOneBucket) {
    auto games = mixed_games();

    std::vector<BucketingEngine::KeyFunction> keys = {
        &BucketingEngine::context_label,
        [](const Prediction& p) { return BucketingEngine::spread_label(p.spread()); },
        [](const Prediction& p) { return BucketingEngine::confidence_label(p.confidence()); },
    };

    for (const auto& key : keys) {
        Partition partition = BucketingEngine::partition(games, key);
        std::multiset<std::string> seen;
        for (const auto& [label, members] : partition) {
            for (const auto& member : members) {
                seen.insert(member.away_team);
            }
        }
        ASSERT_EQ(seen.size(), games.size());
        for (const auto& game : games) {
            EXPECT_EQ(seen.count(game.away_team), 1u) << game.away_team;
        }
    }
}

TEST(BucketingEngine, ContextBucketsAreSortedAndDefaultToNeutral) {
    PredictionScorer scorer;
    BucketingEngine engine(scorer);

    BucketReport report = engine.by_context(mixed_games());
    std::vector<std::string> labels;
    for (const auto& [label, metrics] : report) {
        labels.push_back(label);
    }
    EXPECT_EQ(labels, (std::vector<std::string>{"b2b_away", "b2b_home", "neutral", "rested"}));
    EXPECT_EQ(report.at("neutral").n, 4u);
    EXPECT_EQ(report.at("rested").n, 1u);
    EXPECT_DOUBLE_EQ(report.at("rested").accuracy, 0.0);
}

TEST(BucketingEngine, EmptyLadderBandsReportNullMetrics) {
    PredictionScorer scorer;
    BucketingEngine engine(scorer);

    std::vector<Prediction> games = {
        make_prediction(0.90, Side::Away),
        make_prediction(0.85, Side::Home),
    };

    BucketReport spread = engine.by_spread(games);
    ASSERT_EQ(spread.size(), BucketingEngine::spread_labels().size());
    EXPECT_EQ(spread.at(">=20%").n, 2u);
    EXPECT_DOUBLE_EQ(spread.at(">=20%").accuracy, 0.5);
    for (const auto& label : {"<5%", "5-10%", "10-15%", "15-20%"}) {
        EXPECT_EQ(spread.at(label).n, 0u);
        EXPECT_FALSE(spread.at(label).brier.has_value());
        EXPECT_FALSE(spread.at(label).log_loss.has_value());
    }

    BucketReport confidence = engine.by_confidence(games);
    ASSERT_EQ(confidence.size(), BucketingEngine::confidence_labels().size());
    EXPECT_EQ(confidence.at("65-100%").n, 2u);
    EXPECT_EQ(confidence.at("50-55%").n, 0u);
}

TEST(BucketingEngine, BucketCountsSumToTotal) {
    PredictionScorer scorer;
    BucketingEngine engine(scorer);
    auto games = mixed_games();

    for (const auto& report : {engine.by_context(games), engine.by_spread(games), engine.by_confidence(games)}) {
        size_t total = 0;
        for (const auto& [label, metrics] : report) {
            total += metrics.n;
        }
        EXPECT_EQ(total, games.size());
    }
}
