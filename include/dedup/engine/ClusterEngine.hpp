/**
 * @file ClusterEngine.hpp
 * @brief Per-sub-block clustering and cross-block reconciliation
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_ENGINE_CLUSTERENGINE_HPP
#define DEDUP_ENGINE_CLUSTERENGINE_HPP

#include "../core/Block.hpp"
#include "../core/DeduplicatorConfig.hpp"
#include "../core/RunReport.hpp"
#include "../clustering/DistanceMatrix.hpp"
#include "../clustering/IClustering.hpp"
#include "../scoring/PairwiseScorer.hpp"
#include <vector>

namespace dedup {

/**
 * @brief Outcome of processing one sub-block
 */
struct SubBlockResult {
    size_t blockId = 0;
    std::vector<RecordId> members;
    std::vector<ClusterLabel> labels;       // Aligned with members
    size_t comparisons = 0;
    std::vector<Diagnostic> diagnostics;
    bool filtered = false;                  // Skipped by the cardinality filter
    bool clusteringFailed = false;          // Oracle threw; all labels are noise
};

/**
 * @brief Turns aggregated scores into local labels and merges them globally
 *
 * Distance is 1 - score for compared pairs that pass the similarity
 * threshold. Pairs below the threshold and pairs that were never compared
 * are unreachable. A threshold of 1.0 lets no pair through. An oracle failure turns the whole sub-block into noise
 * and is reported as a diagnostic.
 */
class ClusterEngine {
public:
    ClusterEngine(ClusteringParams params, double similarityThreshold);

    /**
     * @brief True when a pair with this aggregated score may link
     *
     * score >= threshold, except that a threshold of 1.0 rejects every pair.
     */
    bool passesThreshold(double score) const;

    /**
     * @brief Build the distance matrix of a sub-block of n records
     */
    DistanceMatrix buildDistanceMatrix(size_t n, const std::vector<AggregatedScore>& scores) const;

    /**
     * @brief Cluster one sub-block
     *
     * @param block Sub-block
     * @param scores Aggregated scores of the sub-block's pairs
     * @param oracle Clustering algorithm (one instance per worker)
     * @param result Receives labels and diagnostics
     */
    void clusterBlock(const Block& block,
                      const std::vector<AggregatedScore>& scores,
                      const IClustering& oracle,
                      SubBlockResult& result) const;

    /**
     * @brief Union-find merge of local clusters into global groups
     *
     * Every pair of records sharing a non-noise local label in any sub-block
     * ends up in the same group. The result does not depend on the order of
     * the sub-blocks and merging twice gives the same groups.
     *
     * @param results Sub-block results
     * @param recordCount Number of records in the run
     * @param includeSingletons Also return records not linked to any other
     * @return Groups ordered by smallest member, members ascending
     */
    static std::vector<std::vector<RecordId>> merge(const std::vector<SubBlockResult>& results,
                                                    size_t recordCount,
                                                    bool includeSingletons);

    const ClusteringParams& getParams() const { return params_; }
    double getSimilarityThreshold() const { return similarityThreshold_; }

private:
    ClusteringParams params_;
    double similarityThreshold_;
};

} // namespace dedup

#endif // DEDUP_ENGINE_CLUSTERENGINE_HPP
