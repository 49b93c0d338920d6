/**
 * @file Dedup.hpp
 * @brief Main include file for the Dedup toolkit
 * @copyright Dedup record linkage toolkit
 *
 * Include this single header to access all Dedup functionality.
 */

#ifndef DEDUP_DEDUP_HPP
#define DEDUP_DEDUP_HPP

// Core types
#include "core/Types.hpp"
#include "core/Errors.hpp"
#include "core/Value.hpp"
#include "core/Record.hpp"
#include "core/Block.hpp"
#include "core/Cluster.hpp"
#include "core/RunReport.hpp"
#include "core/DeduplicatorConfig.hpp"

// Utilities
#include "utils/UnionFind.hpp"

// Blocking
#include "blocking/BlockKey.hpp"
#include "blocking/KeyEncoder.hpp"
#include "blocking/BlockingRule.hpp"
#include "blocking/Blocker.hpp"
#include "blocking/IBlockSplitter.hpp"
#include "blocking/SortedNeighbourhoodSplitter.hpp"
#include "blocking/BlockSplitterFactory.hpp"

// Matching and scoring
#include "matching/Comparator.hpp"
#include "matching/StringSimilarity.hpp"
#include "matching/ComparatorFactory.hpp"
#include "scoring/Aggregator.hpp"
#include "scoring/PairwiseScorer.hpp"

// Clustering
#include "clustering/DistanceMatrix.hpp"
#include "clustering/IClustering.hpp"
#include "clustering/DBSCANClustering.hpp"
#include "clustering/ConnectedComponentsClustering.hpp"
#include "clustering/ClusteringFactory.hpp"

// Engine
#include "engine/ClusterEngine.hpp"
#include "engine/Deduplicator.hpp"

// Configuration and I/O
#include "config/JsonValue.hpp"
#include "config/JsonLoader.hpp"
#include "config/JsonSaver.hpp"
#include "io/RecordReader.hpp"

// Evaluation
#include "evaluation/Metrics.hpp"

// Logging
#include "observability/Logging.hpp"

/**
 * @namespace dedup
 * @brief Dedup - entity resolution over attribute records
 *
 * - **Blocking**: rule algebra over encoded keys, sorted-neighbourhood splitting
 * - **Scoring**: per-attribute comparators, aggregation strategies
 * - **Clustering**: DBSCAN and connected components over precomputed distances
 * - **Engine**: Deduplicator runs the pipeline and merges clusters globally
 *
 * @code
 * #include <dedup/Dedup.hpp>
 *
 * dedup::DeduplicatorConfig config = dedup::DeduplicatorConfig::contactDirectory();
 * dedup::Deduplicator deduplicator(config);
 *
 * dedup::RecordList records = dedup::RecordReader::readFile("contacts.json");
 * for (const auto& cluster : deduplicator(records)) {
 *     auto ids = cluster.memberIds();
 * }
 * @endcode
 */

#endif // DEDUP_DEDUP_HPP
