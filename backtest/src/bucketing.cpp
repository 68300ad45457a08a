#include "bucketing.hpp"

BucketingEngine::BucketingEngine(const PredictionScorer& scorer) : scorer_(scorer) {}

std::string BucketingEngine::context_label(const Prediction& prediction) {
    return prediction.context_bucket.empty() ? "neutral" : prediction.context_bucket;
}

std::string BucketingEngine::spread_label(double spread) {
    // Spread is |away - home| in [0, 1]
    if (spread < 0.05) {
        return "<5%";
    } else if (spread < 0.10) {
        return "5-10%";
    } else if (spread < 0.15) {
        return "10-15%";
    } else if (spread < 0.20) {
        return "15-20%";
    } else {
        return ">=20%";
    }
}

std::string BucketingEngine::confidence_label(double confidence) {
    // Confidence is max(away, home), never below 0.5 for a normalized pair
    if (confidence < 0.55) {
        return "50-55%";
    } else if (confidence < 0.60) {
        return "55-60%";
    } else if (confidence < 0.65) {
        return "60-65%";
    } else {
        return "65-100%";
    }
}

const std::vector<std::string>& BucketingEngine::spread_labels() {
    static const std::vector<std::string> labels = {"<5%", "5-10%", "10-15%", "15-20%", ">=20%"};
    return labels;
}

const std::vector<std::string>& BucketingEngine::confidence_labels() {
    static const std::vector<std::string> labels = {"50-55%", "55-60%", "60-65%", "65-100%"};
    return labels;
}

Partition BucketingEngine::partition(const std::vector<Prediction>& predictions,
                                     const KeyFunction& key,
                                     const std::vector<std::string>& seed_labels) {
    Partition buckets;
    for (const auto& label : seed_labels) {
        buckets[label];
    }
    for (const auto& prediction : predictions) {
        buckets[key(prediction)].push_back(prediction);
    }
    return buckets;
}

BucketReport BucketingEngine::score_partition(const Partition& partition) const {
    BucketReport report;
    for (const auto& [label, members] : partition) {
        report[label] = scorer_.score(members);
    }
    return report;
}

BucketReport BucketingEngine::by_context(const std::vector<Prediction>& predictions) const {
    return score_partition(partition(predictions, &BucketingEngine::context_label));
}

BucketReport BucketingEngine::by_spread(const std::vector<Prediction>& predictions) const {
    return score_partition(partition(
        predictions,
        [](const Prediction& p) { return spread_label(p.spread()); },
        spread_labels()));
}

BucketReport BucketingEngine::by_confidence(const std::vector<Prediction>& predictions) const {
    return score_partition(partition(
        predictions,
        [](const Prediction& p) { return confidence_label(p.confidence()); },
        confidence_labels()));
}
