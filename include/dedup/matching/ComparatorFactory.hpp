/**
 * @file ComparatorFactory.hpp
 * @brief Factory for creating reference comparators by name
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_MATCHING_COMPARATORFACTORY_HPP
#define DEDUP_MATCHING_COMPARATORFACTORY_HPP

#include "Comparator.hpp"
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Builds the reference comparators
 *
 * Only used to turn configuration files into ComparatorEntry lists; code
 * that builds a configuration directly can pass any callable.
 */
class ComparatorFactory {
public:
    /**
     * @brief Create comparator by name
     *
     * @param comparatorName exact, levenshtein, damerau_levenshtein, jaro,
     *        jaro_winkler, lcs, overlap, name, numeric
     * @throws ConfigurationError on unknown names
     */
    static Comparator create(const std::string& comparatorName);

    /**
     * @brief Create a configuration entry using a named comparator
     */
    static ComparatorEntry makeEntry(const std::string& attribute,
                                     const std::string& comparatorName,
                                     double weight = 1.0);

    /**
     * @brief Check if comparator name is valid
     */
    static bool isValidComparator(const std::string& comparatorName);

    /**
     * @brief Get list of available comparators
     */
    static std::vector<std::string> getAvailableComparators();

private:
    ComparatorFactory() = delete;
};

} // namespace dedup

#endif // DEDUP_MATCHING_COMPARATORFACTORY_HPP
