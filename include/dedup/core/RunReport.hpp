/**
 * @file RunReport.hpp
 * @brief Diagnostics and statistics gathered during a deduplication run
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CORE_RUNREPORT_HPP
#define DEDUP_CORE_RUNREPORT_HPP

#include "Types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief A recovered failure, reported at warning level
 *
 * Comparator and oracle failures never abort a run; they are logged and
 * collected here instead.
 */
struct Diagnostic {
    Stage stage = Stage::SCORING;
    std::string message;

    // Block the failure happened in
    size_t blockId = 0;

    // Records involved (a pair for scoring, the sub-block for clustering)
    std::vector<RecordId> records;

    // Attribute being compared, empty when not applicable
    std::string attribute;
};

/**
 * @brief Counters for one run
 */
struct RunStatistics {
    uint64_t totalRecords = 0;
    uint64_t initialBlocks = 0;
    uint64_t subBlocks = 0;
    uint64_t filteredSubBlocks = 0;
    uint64_t comparisons = 0;           // Pairs actually scored
    uint64_t possibleComparisons = 0;   // n * (n - 1) / 2 without blocking
    uint64_t comparatorFailures = 0;
    uint64_t clusteringFailures = 0;
    uint64_t clustersEmitted = 0;
    double processingTimeMs = 0.0;
};

} // namespace dedup

#endif // DEDUP_CORE_RUNREPORT_HPP
