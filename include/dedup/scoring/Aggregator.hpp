/**
 * @file Aggregator.hpp
 * @brief Combines per-attribute similarities into one score
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_SCORING_AGGREGATOR_HPP
#define DEDUP_SCORING_AGGREGATOR_HPP

#include "../core/Types.hpp"
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Pure, deterministic aggregation of a score vector
 *
 * Weights are only used by WEIGHTED_MEAN and are normalized internally.
 * An empty score vector aggregates to 0.
 */
class Aggregator {
public:
    /**
     * @brief Construct aggregator
     *
     * @param strategy Aggregation strategy
     * @param weights One weight per comparator entry (WEIGHTED_MEAN only)
     * @throws ConfigurationError if WEIGHTED_MEAN weights are negative,
     *         non-finite or sum to zero
     */
    explicit Aggregator(AggregationStrategy strategy = AggregationStrategy::MEAN,
                        std::vector<double> weights = {});

    /**
     * @brief Construct from a strategy name
     * @throws ConfigurationError on unknown names
     */
    explicit Aggregator(const std::string& strategyName, std::vector<double> weights = {});

    /**
     * @brief Aggregate scores
     */
    double aggregate(const std::vector<double>& scores) const;

    double operator()(const std::vector<double>& scores) const { return aggregate(scores); }

    AggregationStrategy getStrategy() const { return strategy_; }
    std::string getName() const { return aggregationStrategyToString(strategy_); }

    // Individual strategies
    static double mean(const std::vector<double>& scores);
    static double median(const std::vector<double>& scores);
    static double min(const std::vector<double>& scores);
    static double max(const std::vector<double>& scores);
    static double weightedMean(const std::vector<double>& scores, const std::vector<double>& weights);

private:
    AggregationStrategy strategy_;
    std::vector<double> weights_;
};

} // namespace dedup

#endif // DEDUP_SCORING_AGGREGATOR_HPP
