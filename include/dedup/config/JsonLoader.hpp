/**
 * @file JsonLoader.hpp
 * @brief JSON configuration loader
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CONFIG_JSONLOADER_HPP
#define DEDUP_CONFIG_JSONLOADER_HPP

#include "JsonValue.hpp"
#include "../core/DeduplicatorConfig.hpp"
#include <string>

namespace dedup {

/**
 * @brief JSON configuration file loader
 *
 * Loads DeduplicatorConfig from JSON files or strings. Comparators are
 * referenced by name (see ComparatorFactory) and blocking rules are nested
 * objects:
 *
 * @code
 * {
 *   "comparators": [{"attribute": "name", "comparator": "jaro_winkler", "weight": 2}],
 *   "aggregation_strategy": "weighted_mean",
 *   "blocking_rule": {"or": [{"phonetic": "name", "n": 4}, {"phone": "phone"}]},
 *   "blocking_splitter": {"kind": "sorted_neighbourhood", "fields": ["name"], "max_block_size": 20},
 *   "clust_kwargs": {"algorithm": "DBSCAN", "eps": 0.3, "min_samples": 2, "metric": "precomputed"},
 *   "similarity_threshold": 0.7
 * }
 * @endcode
 */
class JsonLoader {
public:
    /**
     * @brief Load configuration from file
     *
     * @param filepath Path to JSON file
     * @return Parsed DeduplicatorConfig
     * @throws std::runtime_error on I/O or parse error
     * @throws ConfigurationError on unknown names or malformed rules
     */
    static DeduplicatorConfig loadFromFile(const std::string& filepath);

    /**
     * @brief Load configuration from JSON string
     *
     * @param jsonString JSON configuration string
     * @return Parsed DeduplicatorConfig
     * @throws std::runtime_error on parse error
     * @throws ConfigurationError on unknown names or malformed rules
     */
    static DeduplicatorConfig loadFromString(const std::string& jsonString);

    /**
     * @brief Build a blocking rule from its JSON form
     * @throws ConfigurationError on malformed rules
     */
    static BlockingRulePtr parseRule(const JsonValue& node);

private:
    JsonLoader() = delete;
};

} // namespace dedup

#endif // DEDUP_CONFIG_JSONLOADER_HPP
