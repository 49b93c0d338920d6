/**
 * @file Errors.hpp
 * @brief Exception types raised by Dedup
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CORE_ERRORS_HPP
#define DEDUP_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace dedup {

/**
 * @brief Invalid or conflicting configuration
 *
 * Raised before any record is processed.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& msg)
        : std::invalid_argument(msg) {}
};

/**
 * @brief Clustering oracle could not run on its input
 *
 * Recovered per sub-block by the cluster engine.
 */
class ClusteringError : public std::runtime_error {
public:
    explicit ClusteringError(const std::string& msg)
        : std::runtime_error(msg) {}
};

} // namespace dedup

#endif // DEDUP_CORE_ERRORS_HPP
