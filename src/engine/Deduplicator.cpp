/**
 * @file Deduplicator.cpp
 * @brief Deduplication engine implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/engine/Deduplicator.hpp"
#include "dedup/blocking/Blocker.hpp"
#include "dedup/blocking/BlockSplitterFactory.hpp"
#include "dedup/clustering/ClusteringFactory.hpp"
#include "dedup/observability/Logging.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <thread>

namespace dedup {

using observability::intField;
using observability::doubleField;
using observability::stringField;

Deduplicator::Deduplicator(const DeduplicatorConfig& config)
    : config_(config) {

    config_.validate();

    // Create pipeline components
    rule_ = config_.resolveBlockingRule();
    splitter_ = BlockSplitterFactory::create(config_.splitter);
    clustering_ = ClusteringFactory::create(config_.clusteringParams);

    std::vector<double> weights;
    weights.reserve(config_.comparators.size());
    for (const auto& entry : config_.comparators) {
        weights.push_back(entry.weight);
    }
    aggregator_ = std::make_unique<Aggregator>(config_.getAggregationStrategy(), std::move(weights));
    scorer_ = std::make_unique<PairwiseScorer>(config_.comparators, config_.maxComparisonsPerBlock);
}

RecordList Deduplicator::assignIds(const RecordList& records) {
    RecordList numbered = records;
    for (size_t i = 0; i < numbered.size(); ++i) {
        numbered[i].setId(i);
    }
    return numbered;
}

void Deduplicator::validateAgainstRecords(const RecordList& records) const {
    for (const auto& entry : config_.comparators) {
        if (entry.optional) {
            continue;
        }
        bool present = std::any_of(records.begin(), records.end(), [&](const Record& r) {
            return r.has(entry.attribute);
        });
        if (!present) {
            throw ConfigurationError("Comparator attribute '" + entry.attribute +
                                     "' is not present in any record");
        }
    }
}

BlockList Deduplicator::makeSubBlocks(const RecordList& records, RunStatistics& stats) const {
    Blocker blocker(rule_);
    BlockList initial = blocker.build(records);
    stats.initialBlocks = initial.size();

    DEDUP_LOG_DEBUG("blocking done",
                    {intField("blocks", static_cast<int64_t>(initial.size())),
                     intField("unmatched", static_cast<int64_t>(blocker.getUnmatchedCount())),
                     stringField("rule", rule_ ? rule_->toString() : "cartesian")});

    BlockList subBlocks;
    for (const auto& block : initial) {
        for (auto& sub : splitter_->split(block, records)) {
            sub.id = subBlocks.size();
            sub.parentId = block.id;
            subBlocks.push_back(std::move(sub));
        }
    }
    stats.subBlocks = subBlocks.size();

    DEDUP_LOG_DEBUG("splitting done",
                    {intField("sub_blocks", static_cast<int64_t>(subBlocks.size())),
                     stringField("splitter", splitter_->getName())});
    return subBlocks;
}

BlockList Deduplicator::buildSubBlocks(const RecordList& records) const {
    RecordList numbered = assignIds(records);
    RunStatistics stats;
    BlockList subBlocks = makeSubBlocks(numbered, stats);

    if (!config_.blockFilter.isActive()) {
        return subBlocks;
    }
    BlockList kept;
    for (auto& block : subBlocks) {
        if (!config_.blockFilter.rejects(block.size())) {
            kept.push_back(std::move(block));
        }
    }
    return kept;
}

void Deduplicator::processSubBlock(const Block& block,
                                   const RecordList& records,
                                   const ClusterEngine& engine,
                                   const IClustering& oracle,
                                   SubBlockResult& result) const {
    result.blockId = block.id;
    result.members = block.members;

    if (config_.blockFilter.rejects(block.size())) {
        result.filtered = true;
        result.labels.assign(block.size(), NOISE_LABEL);
        return;
    }

    std::vector<PairScore> pairs = scorer_->score(block, records, result.diagnostics);
    result.comparisons = pairs.size();

    std::vector<AggregatedScore> scores = PairwiseScorer::aggregate(pairs, *aggregator_);
    engine.clusterBlock(block, scores, oracle, result);
}

std::vector<SubBlockResult> Deduplicator::processAll(const BlockList& subBlocks,
                                                     const RecordList& records,
                                                     const ClusterEngine& engine,
                                                     size_t numThreads) const {
    std::vector<SubBlockResult> results(subBlocks.size());
    std::atomic<size_t> next{0};

    auto work = [&](const IClustering& oracle) {
        for (;;) {
            size_t idx = next.fetch_add(1);
            if (idx >= subBlocks.size()) {
                break;
            }
            processSubBlock(subBlocks[idx], records, engine, oracle, results[idx]);
        }
    };

    size_t workers = std::min(numThreads, subBlocks.size());
    if (workers <= 1) {
        work(*clustering_);
        return results;
    }

    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> threads;
    threads.reserve(workers);

    for (size_t w = 0; w < workers; ++w) {
        std::shared_ptr<IClustering> oracle = clustering_->clone();
        threads.emplace_back([&, w, oracle]() {
            try {
                work(*oracle);
            } catch (const std::exception& e) {
                DEDUP_LOG_ERROR("worker failed", {intField("worker", static_cast<int64_t>(w)),
                                                  stringField("error", e.what())});
                errors[w] = std::current_exception();
            } catch (...) {
                DEDUP_LOG_ERROR("worker failed", {intField("worker", static_cast<int64_t>(w)),
                                                  stringField("error", "unknown exception")});
                errors[w] = std::current_exception();
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return results;
}

ClusterSequence Deduplicator::operator()(const RecordList& records, const RunOptions& options) const {
    auto startTime = std::chrono::high_resolution_clock::now();

    // Resolve overrides
    double threshold = options.similarityThreshold.value_or(config_.similarityThreshold);
    size_t numThreads = options.numThreads.value_or(config_.numThreads);
    bool includeSingletons = options.includeSingletons.value_or(config_.includeSingletons);

    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw ConfigurationError("similarity_threshold must be within [0, 1]");
    }
    if (numThreads < 1) {
        throw ConfigurationError("num_threads must be at least 1");
    }

    RunStatistics stats;
    stats.totalRecords = records.size();
    stats.possibleComparisons = records.size() < 2 ? 0 : records.size() * (records.size() - 1) / 2;

    if (records.empty()) {
        return ClusterSequence({}, {}, stats);
    }

    validateAgainstRecords(records);

    DEDUP_LOG_INFO("deduplication started",
                   {intField("records", static_cast<int64_t>(records.size())),
                    doubleField("threshold", threshold),
                    intField("threads", static_cast<int64_t>(numThreads)),
                    stringField("algorithm", clustering_->getName())});

    // 1. Ids, blocking and splitting
    RecordList numbered = assignIds(records);
    BlockList subBlocks = makeSubBlocks(numbered, stats);

    // 2. Scoring, aggregation and clustering per sub-block
    ClusterEngine engine(config_.clusteringParams, threshold);
    std::vector<SubBlockResult> results = processAll(subBlocks, numbered, engine, numThreads);

    // 3. Diagnostics and counters, in sub-block order
    std::vector<Diagnostic> diagnostics;
    for (const auto& result : results) {
        stats.comparisons += result.comparisons;
        if (result.filtered) {
            ++stats.filteredSubBlocks;
        }
        if (result.clusteringFailed) {
            ++stats.clusteringFailures;
        }
        for (const auto& diag : result.diagnostics) {
            if (diag.stage == Stage::SCORING) {
                ++stats.comparatorFailures;
            }
            diagnostics.push_back(diag);
        }
    }

    // 4. Global merge
    std::vector<std::vector<RecordId>> groups =
        ClusterEngine::merge(results, numbered.size(), includeSingletons);

    std::vector<ResolvedCluster> clusters;
    clusters.reserve(groups.size());
    for (const auto& group : groups) {
        ResolvedCluster cluster;
        cluster.clusterId = static_cast<int>(clusters.size());
        cluster.members.reserve(group.size());
        for (RecordId id : group) {
            cluster.members.push_back(numbered[id]);
        }
        clusters.push_back(std::move(cluster));
    }
    stats.clustersEmitted = clusters.size();

    auto endTime = std::chrono::high_resolution_clock::now();
    stats.processingTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    DEDUP_LOG_INFO("deduplication finished",
                   {intField("clusters", static_cast<int64_t>(stats.clustersEmitted)),
                    intField("sub_blocks", static_cast<int64_t>(stats.subBlocks)),
                    intField("comparisons", static_cast<int64_t>(stats.comparisons)),
                    intField("diagnostics", static_cast<int64_t>(diagnostics.size())),
                    doubleField("ms", stats.processingTimeMs)});

    return ClusterSequence(std::move(clusters), std::move(diagnostics), stats);
}

} // namespace dedup
