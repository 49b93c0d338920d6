/**
 * @file Comparator.hpp
 * @brief Attribute comparator capability
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_MATCHING_COMPARATOR_HPP
#define DEDUP_MATCHING_COMPARATOR_HPP

#include "../core/Value.hpp"
#include <functional>
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Similarity of two attribute values in [0, 1]
 *
 * Comparators must be free of side effects (or thread-safe): the pipeline
 * calls them concurrently from its worker pool. A comparator may throw; the
 * scorer records a diagnostic and scores the attribute 0.
 */
using Comparator = std::function<double(const Value&, const Value&)>;

/**
 * @brief One (attribute, comparator) pair of the configuration
 */
struct ComparatorEntry {
    std::string attribute;          // Dot-path of the compared attribute
    Comparator comparator;
    double weight = 1.0;            // Used by the weighted_mean strategy
    bool optional = false;          // Skip the "present in some record" check

    // Name the comparator was built from, empty for user callables
    std::string name;

    ComparatorEntry() = default;

    ComparatorEntry(std::string attr, Comparator cmp, double w = 1.0)
        : attribute(std::move(attr)), comparator(std::move(cmp)), weight(w) {}
};

using ComparatorList = std::vector<ComparatorEntry>;

} // namespace dedup

#endif // DEDUP_MATCHING_COMPARATOR_HPP
