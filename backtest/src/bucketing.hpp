#pragma once

#include "types.hpp"
#include "scoring.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

using Partition = std::map<std::string, std::vector<Prediction>>;

class BucketingEngine {
public:
    using KeyFunction = std::function<std::string(const Prediction&)>;

    explicit BucketingEngine(const PredictionScorer& scorer);

    // Label ladders
    static std::string context_label(const Prediction& prediction);
    static std::string spread_label(double spread);
    static std::string confidence_label(double confidence);
    static const std::vector<std::string>& spread_labels();
    static const std::vector<std::string>& confidence_labels();

    // Every prediction lands in exactly one bucket; seeded labels start out empty
    static Partition partition(const std::vector<Prediction>& predictions,
                               const KeyFunction& key,
                               const std::vector<std::string>& seed_labels = {});

    BucketReport by_context(const std::vector<Prediction>& predictions) const;
    BucketReport by_spread(const std::vector<Prediction>& predictions) const;
    BucketReport by_confidence(const std::vector<Prediction>& predictions) const;

    // Score an arbitrary partition
    BucketReport score_partition(const Partition& partition) const;

private:
    const PredictionScorer& scorer_;
};
