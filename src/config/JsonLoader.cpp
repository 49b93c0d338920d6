/**
 * @file JsonLoader.cpp
 * @brief JSON configuration loader implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/config/JsonLoader.hpp"
#include "dedup/matching/ComparatorFactory.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dedup {

namespace {  // Anonymous namespace for implementation details

std::vector<std::string> stringList(const JsonValue& node, const std::string& what) {
    std::vector<std::string> out;
    if (node.isNull()) {
        return out;
    }
    if (!node.isArray()) {
        throw ConfigurationError("'" + what + "' must be an array of strings");
    }
    for (const auto& item : node.getArray()) {
        if (!item.isString()) {
            throw ConfigurationError("'" + what + "' must be an array of strings");
        }
        out.push_back(item.getString());
    }
    return out;
}

size_t sizeOr(const JsonValue& node, size_t def, const std::string& what) {
    if (node.isNull()) {
        return def;
    }
    if (!node.isNumber() || node.getNumber() < 0) {
        throw ConfigurationError("'" + what + "' must be a non-negative number");
    }
    return static_cast<size_t>(node.getNumber());
}

std::vector<BlockingRulePtr> ruleList(const JsonValue& node, const std::string& op) {
    if (!node.isArray() || node.getArray().empty()) {
        throw ConfigurationError("Blocking rule '" + op + "' needs a non-empty array");
    }
    std::vector<BlockingRulePtr> rules;
    for (const auto& child : node.getArray()) {
        rules.push_back(JsonLoader::parseRule(child));
    }
    return rules;
}

ComparatorEntry parseComparator(const JsonValue& node) {
    if (!node.isObject()) {
        throw ConfigurationError(std::string("Comparator entry must be an object, got ") + node.typeName());
    }
    std::string attribute = node["attribute"].getOr(std::string());
    std::string name = node["comparator"].getOr(std::string());
    if (attribute.empty()) {
        throw ConfigurationError("Comparator entry needs an 'attribute'");
    }
    if (name.empty()) {
        throw ConfigurationError("Comparator entry for '" + attribute + "' needs a 'comparator'");
    }
    ComparatorEntry entry = ComparatorFactory::makeEntry(attribute, name, node["weight"].getOr(1.0));
    entry.optional = node["optional"].getOr(false);
    return entry;
}

DeduplicatorConfig convertToConfig(const JsonValue& root) {
    DeduplicatorConfig config;

    if (!root.isObject()) {
        throw std::runtime_error(std::string("JSON root must be an object, got ") + root.typeName());
    }

    // Comparators
    if (root.has("comparators")) {
        const auto& list = root["comparators"];
        if (!list.isArray()) {
            throw ConfigurationError(std::string("'comparators' must be an array, got ") + list.typeName());
        }
        for (const auto& item : list.getArray()) {
            config.comparators.push_back(parseComparator(item));
        }
    }

    config.aggregationStrategy = root["aggregation_strategy"].getOr(config.aggregationStrategy);

    // Blocking
    config.blockingAttributes = stringList(root["blocking_attributes"], "blocking_attributes");
    if (root.has("blocking_rule") && !root["blocking_rule"].isNull()) {
        config.blockingRule = JsonLoader::parseRule(root["blocking_rule"]);
    }

    if (root.has("blocking_splitter")) {
        const auto& split = root["blocking_splitter"];
        if (split.isString()) {
            config.splitter.kind = split.getString();
        } else if (split.isObject()) {
            config.splitter.kind = split["kind"].getOr(std::string("identity"));
            config.splitter.fields = stringList(split["fields"], "blocking_splitter.fields");
            config.splitter.maxBlockSize = sizeOr(split["max_block_size"], config.splitter.maxBlockSize,
                                                  "blocking_splitter.max_block_size");
            config.splitter.overlap = sizeOr(split["overlap"], config.splitter.overlap,
                                             "blocking_splitter.overlap");
        }
    }

    if (root.has("block_filter")) {
        const auto& filter = root["block_filter"];
        config.blockFilter.minBlockSize = sizeOr(filter["min_block_size"], 0, "block_filter.min_block_size");
        config.blockFilter.maxBlockSize = sizeOr(filter["max_block_size"], 0, "block_filter.max_block_size");
    }

    // Clustering
    if (root.has("clust_kwargs")) {
        const auto& clust = root["clust_kwargs"];
        if (clust.isObject()) {
            config.clusteringParams.algorithm = clust["algorithm"].getOr(std::string("DBSCAN"));
            config.clusteringParams.eps = clust["eps"].getOr(config.clusteringParams.eps);
            config.clusteringParams.minSamples =
                static_cast<int>(clust["min_samples"].getOr(static_cast<double>(config.clusteringParams.minSamples)));
            config.clusteringParams.metric = clust["metric"].getOr(std::string("precomputed"));
        }
    }

    config.similarityThreshold = root["similarity_threshold"].getOr(config.similarityThreshold);
    config.includeSingletons = root["include_singletons"].getOr(config.includeSingletons);
    config.maxComparisonsPerBlock = sizeOr(root["max_comparisons_per_block"], 0, "max_comparisons_per_block");
    config.numThreads = sizeOr(root["num_threads"], 1, "num_threads");
    config.schema = stringList(root["schema"], "schema");

    // Logging
    if (root.has("logging")) {
        const auto& logging = root["logging"];
        config.logging.level = logging["level"].getOr(config.logging.level);
        config.logging.pattern = logging["pattern"].getOr(config.logging.pattern);
    }

    return config;
}

}  // anonymous namespace

BlockingRulePtr JsonLoader::parseRule(const JsonValue& node) {
    if (!node.isObject()) {
        throw ConfigurationError(std::string("Blocking rule must be an object, got ") + node.typeName());
    }

    if (node.has("and")) {
        return BlockingRule::allOf(ruleList(node["and"], "and"));
    }
    if (node.has("or")) {
        return BlockingRule::anyOf(ruleList(node["or"], "or"));
    }
    if (node.has("combinations_except_k")) {
        size_t k = sizeOr(node["k"], 1, "k");
        return BlockingRule::combinationsExceptK(ruleList(node["combinations_except_k"],
                                                          "combinations_except_k"), k);
    }

    // Leaf: {"<encoding>": "<attribute>", "n": <parameter>}
    for (const auto& [key, value] : node.getObject()) {
        if (key == "n") {
            continue;
        }
        KeyEncoding encoding = stringToKeyEncoding(key);
        if (!value.isString()) {
            throw ConfigurationError("Blocking rule '" + key + "' needs an attribute name");
        }
        if (node.has("n")) {
            return BlockingRule::leaf(value.getString(), encoding,
                                      static_cast<int>(node["n"].getOr(0.0)));
        }
        return BlockingRule::leaf(value.getString(), encoding);
    }

    throw ConfigurationError("Blocking rule object is empty");
}

DeduplicatorConfig JsonLoader::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return loadFromString(buffer.str());
}

DeduplicatorConfig JsonLoader::loadFromString(const std::string& jsonString) {
    auto root = parseJson(jsonString);
    return convertToConfig(root);
}

} // namespace dedup
