/**
 * @file ClusteringFactory.cpp
 * @brief Clustering factory implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/clustering/ClusteringFactory.hpp"
#include "dedup/clustering/DBSCANClustering.hpp"
#include "dedup/clustering/ConnectedComponentsClustering.hpp"

namespace dedup {

std::unique_ptr<IClustering> ClusteringFactory::create(const ClusteringParams& params) {
    return create(params.algorithm);
}

std::unique_ptr<IClustering> ClusteringFactory::create(const std::string& algorithmName) {
    switch (stringToClusteringAlgorithm(algorithmName)) {
        case ClusteringAlgorithm::CONNECTED_COMPONENTS:
            return std::make_unique<ConnectedComponentsClustering>();

        case ClusteringAlgorithm::DBSCAN:
        default:
            return std::make_unique<DBSCANClustering>();
    }
}

bool ClusteringFactory::isValidAlgorithm(const std::string& algorithmName) {
    try {
        stringToClusteringAlgorithm(algorithmName);
        return true;
    } catch (const ConfigurationError&) {
        return false;
    }
}

std::vector<std::string> ClusteringFactory::getAvailableAlgorithms() {
    return {"DBSCAN", "CONNECTED_COMPONENTS"};
}

} // namespace dedup
