/**
 * @file JsonSaver.cpp
 * @brief JSON saver implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/config/JsonSaver.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace dedup {

namespace {

std::string number(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream ss;
    ss << std::setprecision(15) << value;
    return ss.str();
}

template <typename T>
std::string joinStrings(const std::vector<T>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

}  // anonymous namespace

std::string JsonSaver::escapeString(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }

    return result;
}

std::string JsonSaver::indent(int level) {
    return std::string(static_cast<size_t>(level) * 2, ' ');
}

std::string JsonSaver::valueToString(const Value& value) {
    if (value.isNull()) return "null";
    if (value.isBool()) return value.getBool() ? "true" : "false";
    if (value.isNumber()) return number(value.getNumber());
    return "\"" + escapeString(value.getString()) + "\"";
}

std::string JsonSaver::ruleToString(const BlockingRule& rule) {
    const auto& node = rule.node();
    if (const auto* leaf = std::get_if<BlockingRule::Leaf>(&node)) {
        std::string out = "{\"" + keyEncodingToString(leaf->encoding) + "\": \"" +
                          escapeString(leaf->attribute) + "\"";
        if (leaf->parameter > 0) {
            out += ", \"n\": " + std::to_string(leaf->parameter);
        }
        return out + "}";
    }
    if (const auto* both = std::get_if<BlockingRule::And>(&node)) {
        return "{\"and\": [" + ruleToString(*both->left) + ", " + ruleToString(*both->right) + "]}";
    }
    const auto& either = std::get<BlockingRule::Or>(node);
    return "{\"or\": [" + ruleToString(*either.left) + ", " + ruleToString(*either.right) + "]}";
}

std::string JsonSaver::saveToString(const DeduplicatorConfig& config, bool pretty) {
    std::ostringstream ss;

    std::string nl = pretty ? "\n" : "";
    auto ind = [&](int level) { return pretty ? indent(level) : ""; };
    auto quoted = [](const std::string& s) { return "\"" + escapeString(s) + "\""; };
    auto quotedList = [&](const std::vector<std::string>& items) {
        std::vector<std::string> q;
        for (const auto& item : items) q.push_back(quoted(item));
        return "[" + joinStrings(q, ", ") + "]";
    };

    ss << "{" << nl;

    // Comparators
    ss << ind(1) << "\"comparators\": [" << nl;
    for (size_t i = 0; i < config.comparators.size(); ++i) {
        const auto& entry = config.comparators[i];
        ss << ind(2) << "{\"attribute\": " << quoted(entry.attribute)
           << ", \"comparator\": " << quoted(entry.name.empty() ? "custom" : entry.name)
           << ", \"weight\": " << number(entry.weight);
        if (entry.optional) {
            ss << ", \"optional\": true";
        }
        ss << "}" << (i + 1 < config.comparators.size() ? "," : "") << nl;
    }
    ss << ind(1) << "]," << nl;

    ss << ind(1) << "\"aggregation_strategy\": " << quoted(config.aggregationStrategy) << "," << nl;

    // Blocking
    if (!config.blockingAttributes.empty()) {
        ss << ind(1) << "\"blocking_attributes\": " << quotedList(config.blockingAttributes) << "," << nl;
    }
    if (config.blockingRule) {
        ss << ind(1) << "\"blocking_rule\": " << ruleToString(*config.blockingRule) << "," << nl;
    }

    ss << ind(1) << "\"blocking_splitter\": {" << nl;
    ss << ind(2) << "\"kind\": " << quoted(config.splitter.kind) << "," << nl;
    ss << ind(2) << "\"fields\": " << quotedList(config.splitter.fields) << "," << nl;
    ss << ind(2) << "\"max_block_size\": " << config.splitter.maxBlockSize << "," << nl;
    ss << ind(2) << "\"overlap\": " << config.splitter.overlap << nl;
    ss << ind(1) << "}," << nl;

    ss << ind(1) << "\"block_filter\": {" << nl;
    ss << ind(2) << "\"min_block_size\": " << config.blockFilter.minBlockSize << "," << nl;
    ss << ind(2) << "\"max_block_size\": " << config.blockFilter.maxBlockSize << nl;
    ss << ind(1) << "}," << nl;

    // Clustering
    ss << ind(1) << "\"clust_kwargs\": {" << nl;
    ss << ind(2) << "\"algorithm\": " << quoted(config.clusteringParams.algorithm) << "," << nl;
    ss << ind(2) << "\"eps\": " << number(config.clusteringParams.eps) << "," << nl;
    ss << ind(2) << "\"min_samples\": " << config.clusteringParams.minSamples << "," << nl;
    ss << ind(2) << "\"metric\": " << quoted(config.clusteringParams.metric) << nl;
    ss << ind(1) << "}," << nl;

    ss << ind(1) << "\"similarity_threshold\": " << number(config.similarityThreshold) << "," << nl;
    ss << ind(1) << "\"include_singletons\": " << (config.includeSingletons ? "true" : "false") << "," << nl;
    ss << ind(1) << "\"max_comparisons_per_block\": " << config.maxComparisonsPerBlock << "," << nl;
    ss << ind(1) << "\"num_threads\": " << config.numThreads << "," << nl;
    ss << ind(1) << "\"schema\": " << quotedList(config.schema) << "," << nl;

    // Logging
    ss << ind(1) << "\"logging\": {" << nl;
    ss << ind(2) << "\"level\": " << quoted(config.logging.level) << "," << nl;
    ss << ind(2) << "\"pattern\": " << quoted(config.logging.pattern) << nl;
    ss << ind(1) << "}" << nl;

    ss << "}" << nl;

    return ss.str();
}

std::string JsonSaver::clustersToString(const ClusterSequence& clusters, bool pretty) {
    std::ostringstream ss;

    std::string nl = pretty ? "\n" : "";
    auto ind = [&](int level) { return pretty ? indent(level) : ""; };

    ss << "{" << nl;

    ss << ind(1) << "\"clusters\": [" << nl;
    for (size_t c = 0; c < clusters.size(); ++c) {
        const auto& cluster = clusters[c];
        ss << ind(2) << "{\"cluster_id\": " << cluster.clusterId << ", \"members\": [" << nl;
        for (size_t m = 0; m < cluster.members.size(); ++m) {
            const auto& record = cluster.members[m];
            std::vector<std::string> fields;
            fields.push_back("\"_id\": " + std::to_string(record.getId()));
            for (const auto& [path, value] : record.attributes()) {
                fields.push_back("\"" + escapeString(path) + "\": " + valueToString(value));
            }
            ss << ind(3) << "{" << joinStrings(fields, ", ") << "}"
               << (m + 1 < cluster.members.size() ? "," : "") << nl;
        }
        ss << ind(2) << "]}" << (c + 1 < clusters.size() ? "," : "") << nl;
    }
    ss << ind(1) << "]," << nl;

    ss << ind(1) << "\"diagnostics\": [" << nl;
    const auto& diagnostics = clusters.diagnostics();
    for (size_t d = 0; d < diagnostics.size(); ++d) {
        const auto& diag = diagnostics[d];
        std::vector<std::string> ids;
        for (RecordId id : diag.records) ids.push_back(std::to_string(id));
        ss << ind(2) << "{\"stage\": \"" << stageToString(diag.stage) << "\""
           << ", \"block\": " << diag.blockId
           << ", \"records\": [" << joinStrings(ids, ", ") << "]"
           << ", \"attribute\": \"" << escapeString(diag.attribute) << "\""
           << ", \"message\": \"" << escapeString(diag.message) << "\"}"
           << (d + 1 < diagnostics.size() ? "," : "") << nl;
    }
    ss << ind(1) << "]," << nl;

    const auto& stats = clusters.statistics();
    ss << ind(1) << "\"statistics\": {" << nl;
    ss << ind(2) << "\"records\": " << stats.totalRecords << "," << nl;
    ss << ind(2) << "\"initial_blocks\": " << stats.initialBlocks << "," << nl;
    ss << ind(2) << "\"sub_blocks\": " << stats.subBlocks << "," << nl;
    ss << ind(2) << "\"filtered_sub_blocks\": " << stats.filteredSubBlocks << "," << nl;
    ss << ind(2) << "\"comparisons\": " << stats.comparisons << "," << nl;
    ss << ind(2) << "\"possible_comparisons\": " << stats.possibleComparisons << "," << nl;
    ss << ind(2) << "\"comparator_failures\": " << stats.comparatorFailures << "," << nl;
    ss << ind(2) << "\"clustering_failures\": " << stats.clusteringFailures << "," << nl;
    ss << ind(2) << "\"clusters\": " << stats.clustersEmitted << "," << nl;
    ss << ind(2) << "\"processing_time_ms\": " << number(stats.processingTimeMs) << nl;
    ss << ind(1) << "}" << nl;

    ss << "}" << nl;

    return ss.str();
}

void JsonSaver::saveToFile(const DeduplicatorConfig& config, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << saveToString(config, true);

    if (!file.good()) {
        throw std::runtime_error("Error writing to file: " + filepath);
    }
}

} // namespace dedup
