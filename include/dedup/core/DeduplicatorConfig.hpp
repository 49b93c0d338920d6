/**
 * @file DeduplicatorConfig.hpp
 * @brief Main deduplicator configuration structure
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CORE_DEDUPLICATORCONFIG_HPP
#define DEDUP_CORE_DEDUPLICATORCONFIG_HPP

#include "Types.hpp"
#include "../blocking/BlockingRule.hpp"
#include "../matching/Comparator.hpp"
#include "../observability/Logging.hpp"
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Parameters forwarded to the clustering oracle (clust_kwargs)
 */
struct ClusteringParams {
    std::string algorithm = "DBSCAN";   // DBSCAN, CONNECTED_COMPONENTS
    double eps = 0.5;                   // Neighbourhood radius in distance units
    int minSamples = 2;                 // Neighbours (self included) for a core point
    std::string metric = "precomputed"; // Only precomputed is supported

    /**
     * @brief Resolved algorithm enum
     * @throws ConfigurationError on unknown names
     */
    ClusteringAlgorithm getAlgorithm() const;
};

/**
 * @brief Block splitter selection
 */
struct SplitterParams {
    std::string kind = "identity";      // identity, sorted_neighbourhood
    std::vector<std::string> fields;    // Sort key for sorted_neighbourhood
    size_t maxBlockSize = 20;           // Window size
    size_t overlap = 0;                 // Records shared by consecutive windows

    /**
     * @throws ConfigurationError on unknown names
     */
    SplitterKind getKind() const;
};

/**
 * @brief Cardinality filter on sub-blocks (0 = no bound)
 */
struct BlockFilterParams {
    size_t minBlockSize = 0;
    size_t maxBlockSize = 0;

    bool isActive() const { return minBlockSize > 0 || maxBlockSize > 0; }

    /**
     * @brief True when a sub-block of this size is skipped
     */
    bool rejects(size_t size) const {
        return (minBlockSize > 0 && size < minBlockSize) ||
               (maxBlockSize > 0 && size > maxBlockSize);
    }
};

/**
 * @brief Complete deduplicator configuration
 *
 * Strategy and algorithm selections are kept as strings so the structure
 * maps one to one onto the JSON configuration file; they are resolved and
 * checked by validate().
 */
struct DeduplicatorConfig {
    // Attribute comparators (at least one)
    ComparatorList comparators;

    // mean, median, min, max, weighted_mean
    std::string aggregationStrategy = "mean";

    // Blocking: either a list of exact-match attributes or a rule, not both.
    // Neither means a single block of all records.
    std::vector<std::string> blockingAttributes;
    BlockingRulePtr blockingRule;

    SplitterParams splitter;
    ClusteringParams clusteringParams;
    BlockFilterParams blockFilter;

    // Pairs scoring below this never link, whatever eps allows; 1.0 links nothing
    double similarityThreshold = 0.0;

    // Report unclustered records as clusters of one
    bool includeSingletons = false;

    // Pairs scored per sub-block, 0 = all
    size_t maxComparisonsPerBlock = 0;

    // Worker threads for sub-block processing
    size_t numThreads = 1;

    // Known attribute names; when non-empty comparator attributes must be in it
    std::vector<std::string> schema;

    observability::LoggingConfig logging;

    /**
     * @brief Resolved aggregation strategy
     * @throws ConfigurationError on unknown names
     */
    AggregationStrategy getAggregationStrategy() const {
        return stringToAggregationStrategy(aggregationStrategy);
    }

    /**
     * @brief Effective blocking rule
     *
     * @return blockingRule, an exact-match AND chain over blockingAttributes,
     *         or nullptr for cartesian blocking
     */
    BlockingRulePtr resolveBlockingRule() const;

    /**
     * @brief Check every record-independent constraint
     * @throws ConfigurationError describing the first problem found
     */
    void validate() const;

    /**
     * @brief Check validity without throwing
     */
    bool isValid() const;

    /**
     * @brief Preset for person/contact directories
     *
     * Blocks on phonetic name OR normalized phone, compares names with
     * jaro_winkler and phones exactly, weighted towards the name.
     */
    static DeduplicatorConfig contactDirectory();

    /**
     * @brief Preset for large inputs with poor blocking keys
     *
     * First-three-characters blocking on name, sorted-neighbourhood splitting
     * in windows of 50, a pair cap and four worker threads.
     */
    static DeduplicatorConfig largeDataset();
};

} // namespace dedup

#endif // DEDUP_CORE_DEDUPLICATORCONFIG_HPP
