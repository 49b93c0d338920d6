/**
 * @file Deduplicator.hpp
 * @brief Main engine orchestrating the deduplication pipeline
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_ENGINE_DEDUPLICATOR_HPP
#define DEDUP_ENGINE_DEDUPLICATOR_HPP

#include "ClusterEngine.hpp"
#include "../core/Cluster.hpp"
#include "../core/DeduplicatorConfig.hpp"
#include "../core/Record.hpp"
#include "../blocking/IBlockSplitter.hpp"
#include "../clustering/IClustering.hpp"
#include "../scoring/Aggregator.hpp"
#include "../scoring/PairwiseScorer.hpp"
#include <memory>
#include <optional>

namespace dedup {

/**
 * @brief Per-call overrides of the configuration
 */
struct RunOptions {
    std::optional<double> similarityThreshold;
    std::optional<size_t> numThreads;
    std::optional<bool> includeSingletons;
};

/**
 * @brief Entity resolution engine
 *
 * Pipeline: assign ids → Blocking → Splitting → Filtering → Scoring →
 * Aggregation → Clustering → Union-find merge
 *
 * The configuration is validated on construction. A call never mutates the
 * engine, so one instance may serve concurrent calls.
 *
 * @code
 * DeduplicatorConfig config;
 * config.comparators = {ComparatorFactory::makeEntry("name", "jaro_winkler")};
 * config.blockingAttributes = {"phone"};
 * Deduplicator dedup(config);
 * for (const auto& cluster : dedup(records)) { ... }
 * @endcode
 */
class Deduplicator {
public:
    /**
     * @brief Construct engine with configuration
     * @throws ConfigurationError on invalid configuration
     */
    explicit Deduplicator(const DeduplicatorConfig& config);

    ~Deduplicator() = default;

    // Non-copyable
    Deduplicator(const Deduplicator&) = delete;
    Deduplicator& operator=(const Deduplicator&) = delete;

    // Movable
    Deduplicator(Deduplicator&&) = default;
    Deduplicator& operator=(Deduplicator&&) = default;

    /**
     * @brief Resolve records into clusters
     *
     * @param records Input records; record i gets id i
     * @param options Per-call overrides
     * @return Clusters ordered by smallest member id, with diagnostics and
     *         statistics of the run
     * @throws ConfigurationError when a non-optional comparator attribute is
     *         present in no record, or an override is out of range
     */
    ClusterSequence operator()(const RecordList& records, const RunOptions& options = {}) const;

    /**
     * @brief Same as operator()
     */
    ClusterSequence run(const RecordList& records, const RunOptions& options = {}) const {
        return (*this)(records, options);
    }

    /**
     * @brief Initial blocks after splitting and filtering, without scoring
     *
     * Useful for measuring blocking quality (reduction ratio, pair
     * completeness). Records are numbered by position.
     */
    BlockList buildSubBlocks(const RecordList& records) const;

    /**
     * @brief Get current configuration
     */
    const DeduplicatorConfig& getConfig() const { return config_; }

private:
    /**
     * @brief Records with ids set to their position
     */
    static RecordList assignIds(const RecordList& records);

    /**
     * @brief Record-dependent configuration checks
     */
    void validateAgainstRecords(const RecordList& records) const;

    /**
     * @brief Blocking, then splitting; sub-block ids are sequential
     */
    BlockList makeSubBlocks(const RecordList& records, RunStatistics& stats) const;

    /**
     * @brief Score, aggregate and cluster one sub-block
     */
    void processSubBlock(const Block& block,
                         const RecordList& records,
                         const ClusterEngine& engine,
                         const IClustering& oracle,
                         SubBlockResult& result) const;

    /**
     * @brief Process all sub-blocks on a pool of worker threads
     */
    std::vector<SubBlockResult> processAll(const BlockList& subBlocks,
                                           const RecordList& records,
                                           const ClusterEngine& engine,
                                           size_t numThreads) const;

    DeduplicatorConfig config_;

    // Pipeline components
    BlockingRulePtr rule_;
    std::unique_ptr<IBlockSplitter> splitter_;
    std::unique_ptr<IClustering> clustering_;
    std::unique_ptr<Aggregator> aggregator_;
    std::unique_ptr<PairwiseScorer> scorer_;
};

} // namespace dedup

#endif // DEDUP_ENGINE_DEDUPLICATOR_HPP
