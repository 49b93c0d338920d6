/**
 * @file PairwiseScorer.hpp
 * @brief Attribute-level scoring of record pairs inside a sub-block
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_SCORING_PAIRWISESCORER_HPP
#define DEDUP_SCORING_PAIRWISESCORER_HPP

#include "Aggregator.hpp"
#include "../core/Block.hpp"
#include "../core/Record.hpp"
#include "../core/RunReport.hpp"
#include "../matching/Comparator.hpp"
#include <vector>

namespace dedup {

/**
 * @brief Per-comparator similarities of one pair
 *
 * first/second index into the sub-block's member list (first < second).
 */
struct PairScore {
    size_t first = 0;
    size_t second = 0;
    RecordId firstId = 0;
    RecordId secondId = 0;
    std::vector<double> scores;     // One per comparator entry, in [0, 1]
};

/**
 * @brief Aggregated similarity of one pair
 */
struct AggregatedScore {
    size_t first = 0;
    size_t second = 0;
    RecordId firstId = 0;
    RecordId secondId = 0;
    double score = 0.0;
};

/**
 * @brief Scores record pairs within a sub-block
 *
 * Pairs are generated in lexicographic order of member positions
 * ((0,1), (0,2), ..., (1,2), ...). With a cap only the first maxComparisons
 * pairs are scored. Comparator failures never escape: the attribute scores 0
 * and a Diagnostic is appended.
 */
class PairwiseScorer {
public:
    /**
     * @param comparators Comparator entries, evaluated in order
     * @param maxComparisons Pairs scored per sub-block, 0 = all
     */
    explicit PairwiseScorer(ComparatorList comparators, size_t maxComparisons = 0);

    /**
     * @brief Score the pairs of one sub-block
     *
     * @param block Sub-block to score
     * @param records All records of the run, indexed by id
     * @param diagnostics Receives one entry per recovered comparator failure
     */
    std::vector<PairScore> score(const Block& block,
                                 const RecordList& records,
                                 std::vector<Diagnostic>& diagnostics) const;

    /**
     * @brief Apply an aggregator to every pair
     */
    static std::vector<AggregatedScore> aggregate(const std::vector<PairScore>& pairs,
                                                  const Aggregator& aggregator);

    /**
     * @brief Number of pairs score() will produce for a block of this size
     */
    size_t pairBudget(size_t blockSize) const;

    const ComparatorList& getComparators() const { return comparators_; }
    size_t getMaxComparisons() const { return maxComparisons_; }

private:
    double compareAttribute(const ComparatorEntry& entry,
                            const Record& a, const Record& b,
                            size_t blockId,
                            std::vector<Diagnostic>& diagnostics) const;

    ComparatorList comparators_;
    size_t maxComparisons_;
};

} // namespace dedup

#endif // DEDUP_SCORING_PAIRWISESCORER_HPP
