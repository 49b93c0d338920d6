/**
 * @file JsonSaver.hpp
 * @brief JSON configuration and result saver
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CONFIG_JSONSAVER_HPP
#define DEDUP_CONFIG_JSONSAVER_HPP

#include "../core/Cluster.hpp"
#include "../core/DeduplicatorConfig.hpp"
#include <string>

namespace dedup {

/**
 * @brief JSON configuration file saver
 *
 * Saves DeduplicatorConfig in the format JsonLoader reads, and serializes
 * run results. Comparators given as plain callables have no name and are
 * written as "custom"; such a file does not load back.
 */
class JsonSaver {
public:
    /**
     * @brief Save configuration to file
     *
     * @param config Configuration to save
     * @param filepath Output file path
     * @throws std::runtime_error on write error
     */
    static void saveToFile(const DeduplicatorConfig& config, const std::string& filepath);

    /**
     * @brief Save configuration to JSON string
     *
     * @param config Configuration to save
     * @param pretty If true, format with indentation
     * @return JSON string
     */
    static std::string saveToString(const DeduplicatorConfig& config, bool pretty = true);

    /**
     * @brief JSON form of a blocking rule, e.g. {"and": [{"exact": "phone"}, ...]}
     */
    static std::string ruleToString(const BlockingRule& rule);

    /**
     * @brief Serialize clusters, diagnostics and statistics of a run
     */
    static std::string clustersToString(const ClusterSequence& clusters, bool pretty = true);

    /**
     * @brief JSON literal of an attribute value
     */
    static std::string valueToString(const Value& value);

    /**
     * @brief Escape a string for inclusion in a JSON string literal
     */
    static std::string escapeString(const std::string& str);

private:
    JsonSaver() = delete;

    static std::string indent(int level);
};

} // namespace dedup

#endif // DEDUP_CONFIG_JSONSAVER_HPP
