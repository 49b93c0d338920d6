/**
 * @file Aggregator.cpp
 * @brief Score aggregation implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/scoring/Aggregator.hpp"
#include "dedup/core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace dedup {

Aggregator::Aggregator(AggregationStrategy strategy, std::vector<double> weights)
    : strategy_(strategy)
    , weights_(std::move(weights)) {

    if (strategy_ != AggregationStrategy::WEIGHTED_MEAN) {
        return;
    }

    double total = 0.0;
    for (double w : weights_) {
        if (!std::isfinite(w) || w < 0.0) {
            throw ConfigurationError("Aggregation weights must be finite and non-negative");
        }
        total += w;
    }
    if (!weights_.empty() && total <= 0.0) {
        throw ConfigurationError("Aggregation weights must have a positive sum");
    }
}

Aggregator::Aggregator(const std::string& strategyName, std::vector<double> weights)
    : Aggregator(stringToAggregationStrategy(strategyName), std::move(weights)) {}

double Aggregator::aggregate(const std::vector<double>& scores) const {
    if (scores.empty()) {
        return 0.0;
    }

    switch (strategy_) {
        case AggregationStrategy::MEAN:
            return mean(scores);
        case AggregationStrategy::MEDIAN:
            return median(scores);
        case AggregationStrategy::MIN:
            return min(scores);
        case AggregationStrategy::MAX:
            return max(scores);
        case AggregationStrategy::WEIGHTED_MEAN:
            return weightedMean(scores, weights_);
        default:
            return mean(scores);
    }
}

double Aggregator::mean(const std::vector<double>& scores) {
    if (scores.empty()) return 0.0;
    return std::accumulate(scores.begin(), scores.end(), 0.0) / static_cast<double>(scores.size());
}

double Aggregator::median(const std::vector<double>& scores) {
    if (scores.empty()) return 0.0;

    std::vector<double> sorted = scores;
    std::sort(sorted.begin(), sorted.end());
    size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 1) {
        return sorted[mid];
    }
    return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

double Aggregator::min(const std::vector<double>& scores) {
    if (scores.empty()) return 0.0;
    return *std::min_element(scores.begin(), scores.end());
}

double Aggregator::max(const std::vector<double>& scores) {
    if (scores.empty()) return 0.0;
    return *std::max_element(scores.begin(), scores.end());
}

double Aggregator::weightedMean(const std::vector<double>& scores, const std::vector<double>& weights) {
    if (scores.empty()) return 0.0;

    // Missing weights count as 1
    double sum = 0.0;
    double total = 0.0;
    for (size_t i = 0; i < scores.size(); ++i) {
        double w = i < weights.size() ? weights[i] : 1.0;
        sum += w * scores[i];
        total += w;
    }
    return total > 0.0 ? sum / total : 0.0;
}

} // namespace dedup
