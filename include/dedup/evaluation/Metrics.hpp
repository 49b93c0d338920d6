/**
 * @file Metrics.hpp
 * @brief Pairwise clustering and blocking quality metrics
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_EVALUATION_METRICS_HPP
#define DEDUP_EVALUATION_METRICS_HPP

#include "../core/Block.hpp"
#include "../core/Cluster.hpp"
#include <cstdint>
#include <vector>

namespace dedup {

/**
 * @brief Pair confusion matrix
 *
 * TP: same true entity, same predicted cluster. FP: different entities,
 * same cluster. FN: same entity, different clusters. TN: the rest.
 */
struct PairConfusion {
    uint64_t truePositives = 0;
    uint64_t falsePositives = 0;
    uint64_t falseNegatives = 0;
    uint64_t trueNegatives = 0;
};

/**
 * @brief Evaluation of a deduplication run against ground truth
 *
 * Labelings are one label per record, aligned by record id. All ratios are
 * fractions in [0, 1].
 */
class Metrics {
public:
    /**
     * @brief n * (n - 1) / 2
     */
    static uint64_t maxPossibleComparisons(uint64_t recordCount);

    /**
     * @brief Fraction of predicted pairs that are true pairs (1 if none predicted)
     */
    static double precision(const std::vector<int>& trueLabels, const std::vector<int>& predLabels);

    /**
     * @brief Fraction of true pairs that were predicted (1 if there are none)
     */
    static double recall(const std::vector<int>& trueLabels, const std::vector<int>& predLabels);

    static double f1Score(const std::vector<int>& trueLabels, const std::vector<int>& predLabels);

    /**
     * @throws std::invalid_argument if the labelings differ in length
     */
    static PairConfusion confusionMatrix(const std::vector<int>& trueLabels,
                                         const std::vector<int>& predLabels);

    /**
     * @brief 1 - after / before; 0 when before is 0
     */
    static double reductionRatio(uint64_t comparisonsBefore, uint64_t comparisonsAfter);

    /**
     * @brief before / after; infinity when after is 0
     */
    static double comparisonEfficiency(uint64_t comparisonsBefore, uint64_t comparisonsAfter);

    /**
     * @brief Fraction of true pairs that share at least one block
     */
    static double pairCompleteness(const std::vector<int>& trueLabels, const BlockList& blocks);

    /**
     * @brief Total pairs inside the given blocks
     */
    static uint64_t comparisonsInBlocks(const BlockList& blocks);

    /**
     * @brief Label per record from a run's clusters
     *
     * Members of a cluster get its id; every other record gets a label of
     * its own.
     */
    static std::vector<int> labelsFromClusters(const ClusterSequence& clusters, size_t recordCount);

private:
    Metrics() = delete;
};

} // namespace dedup

#endif // DEDUP_EVALUATION_METRICS_HPP
