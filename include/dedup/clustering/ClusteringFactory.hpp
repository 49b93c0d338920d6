/**
 * @file ClusteringFactory.hpp
 * @brief Factory for creating clustering algorithms
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CLUSTERING_FACTORY_HPP
#define DEDUP_CLUSTERING_FACTORY_HPP

#include "IClustering.hpp"
#include "../core/DeduplicatorConfig.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Factory for creating clustering algorithm instances
 */
class ClusteringFactory {
public:
    /**
     * @brief Create clustering algorithm from configuration
     *
     * @param params Clustering parameters (the algorithm field is used)
     * @throws ConfigurationError on unknown algorithms
     */
    static std::unique_ptr<IClustering> create(const ClusteringParams& params);

    /**
     * @brief Create clustering algorithm by name
     *
     * @param algorithmName Algorithm name (DBSCAN, CONNECTED_COMPONENTS)
     * @throws ConfigurationError on unknown algorithms
     */
    static std::unique_ptr<IClustering> create(const std::string& algorithmName);

    /**
     * @brief Check if algorithm name is valid
     */
    static bool isValidAlgorithm(const std::string& algorithmName);

    /**
     * @brief Get list of available algorithms
     */
    static std::vector<std::string> getAvailableAlgorithms();

private:
    ClusteringFactory() = delete;  // Static factory, no instantiation
};

} // namespace dedup

#endif // DEDUP_CLUSTERING_FACTORY_HPP
