/**
 * @file DeduplicatorConfig.cpp
 * @brief Configuration validation and presets
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/core/DeduplicatorConfig.hpp"
#include "dedup/blocking/BlockSplitterFactory.hpp"
#include "dedup/matching/ComparatorFactory.hpp"
#include "dedup/scoring/Aggregator.hpp"
#include <algorithm>
#include <cmath>

namespace dedup {

ClusteringAlgorithm ClusteringParams::getAlgorithm() const {
    return stringToClusteringAlgorithm(algorithm);
}

SplitterKind SplitterParams::getKind() const {
    return stringToSplitterKind(kind);
}

BlockingRulePtr DeduplicatorConfig::resolveBlockingRule() const {
    if (blockingRule) {
        return blockingRule;
    }
    if (!blockingAttributes.empty()) {
        return BlockingRule::fromAttributes(blockingAttributes);
    }
    return nullptr;
}

void DeduplicatorConfig::validate() const {
    AggregationStrategy strategy = getAggregationStrategy();

    // Blocking
    if (!blockingAttributes.empty() && blockingRule) {
        throw ConfigurationError("Give either blocking_attributes or blocking_rule, not both");
    }
    resolveBlockingRule();

    // Comparators
    if (comparators.empty()) {
        throw ConfigurationError("At least one comparator is required");
    }
    std::vector<double> weights;
    weights.reserve(comparators.size());
    for (const auto& entry : comparators) {
        if (entry.attribute.empty()) {
            throw ConfigurationError("Comparator attribute name must not be empty");
        }
        if (!entry.comparator) {
            throw ConfigurationError("Comparator for '" + entry.attribute + "' is empty");
        }
        if (!std::isfinite(entry.weight) || entry.weight < 0.0) {
            throw ConfigurationError("Comparator weight for '" + entry.attribute +
                                     "' must be finite and non-negative");
        }
        if (!schema.empty() &&
            std::find(schema.begin(), schema.end(), entry.attribute) == schema.end()) {
            throw ConfigurationError("Comparator attribute '" + entry.attribute +
                                     "' is not in the schema");
        }
        weights.push_back(entry.weight);
    }
    Aggregator checkWeights(strategy, weights);

    // Clustering
    clusteringParams.getAlgorithm();
    if (clusteringParams.metric != "precomputed") {
        throw ConfigurationError("Clustering metric must be 'precomputed', got '" +
                                 clusteringParams.metric + "'");
    }
    if (!(clusteringParams.eps > 0.0)) {
        throw ConfigurationError("Clustering eps must be positive");
    }
    if (clusteringParams.minSamples < 1) {
        throw ConfigurationError("Clustering min_samples must be at least 1");
    }

    // Splitting and filtering
    BlockSplitterFactory::create(splitter);
    if (blockFilter.minBlockSize > 0 && blockFilter.maxBlockSize > 0 &&
        blockFilter.minBlockSize > blockFilter.maxBlockSize) {
        throw ConfigurationError("Block filter min_block_size exceeds max_block_size");
    }

    if (!(similarityThreshold >= 0.0 && similarityThreshold <= 1.0)) {
        throw ConfigurationError("similarity_threshold must be within [0, 1]");
    }
    if (numThreads < 1) {
        throw ConfigurationError("num_threads must be at least 1");
    }
}

bool DeduplicatorConfig::isValid() const {
    try {
        validate();
        return true;
    } catch (const ConfigurationError&) {
        return false;
    }
}

DeduplicatorConfig DeduplicatorConfig::contactDirectory() {
    DeduplicatorConfig cfg;
    cfg.comparators = {
        ComparatorFactory::makeEntry("name", "jaro_winkler", 2.0),
        ComparatorFactory::makeEntry("phone", "exact", 1.0),
    };
    cfg.aggregationStrategy = "weighted_mean";
    cfg.blockingRule = BlockingRule::disjunction(BlockingRule::phonetic("name"),
                                                 BlockingRule::phone("phone"));
    cfg.clusteringParams.eps = 0.2;
    cfg.clusteringParams.minSamples = 2;
    cfg.similarityThreshold = 0.8;
    return cfg;
}

DeduplicatorConfig DeduplicatorConfig::largeDataset() {
    DeduplicatorConfig cfg;
    cfg.comparators = {
        ComparatorFactory::makeEntry("name", "name"),
    };
    cfg.aggregationStrategy = "mean";
    cfg.blockingRule = BlockingRule::firstNChars("name", 3);
    cfg.splitter.kind = "sorted_neighbourhood";
    cfg.splitter.fields = {"name"};
    cfg.splitter.maxBlockSize = 50;
    cfg.splitter.overlap = 5;
    cfg.maxComparisonsPerBlock = 1000;
    cfg.clusteringParams.eps = 0.15;
    cfg.similarityThreshold = 0.85;
    cfg.numThreads = 4;
    return cfg;
}

} // namespace dedup
