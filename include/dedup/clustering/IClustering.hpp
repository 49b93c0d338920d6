/**
 * @file IClustering.hpp
 * @brief Clustering oracle interface
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CLUSTERING_ICLUSTERING_HPP
#define DEDUP_CLUSTERING_ICLUSTERING_HPP

#include "DistanceMatrix.hpp"
#include "../core/DeduplicatorConfig.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Abstract interface for clustering algorithms
 *
 * Defines the contract for all clustering implementations. An algorithm
 * consumes a precomputed distance matrix and returns one label per row,
 * aligned with matrix order: labels 0, 1, ... name local clusters and
 * NOISE_LABEL marks unclustered records.
 */
class IClustering {
public:
    /**
     * @brief Virtual destructor
     */
    virtual ~IClustering() = default;

    /**
     * @brief Cluster the rows of a distance matrix
     *
     * @param distances Precomputed distances of one sub-block
     * @param params eps, min_samples and metric
     * @return Local label per row
     * @throws ClusteringError on a malformed matrix or unusable parameters
     */
    virtual std::vector<ClusterLabel> cluster(const DistanceMatrix& distances,
                                              const ClusteringParams& params) const = 0;

    /**
     * @brief Get algorithm name
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Clone the clustering algorithm
     */
    virtual std::unique_ptr<IClustering> clone() const = 0;

protected:
    IClustering() = default;

    // Prevent copying through base class
    IClustering(const IClustering&) = default;
    IClustering& operator=(const IClustering&) = default;

    /**
     * @brief Common parameter and matrix checks
     */
    static void checkInput(const DistanceMatrix& distances, const ClusteringParams& params) {
        if (params.metric != "precomputed") {
            throw ClusteringError("Unsupported metric: " + params.metric);
        }
        if (!(params.eps > 0.0)) {
            throw ClusteringError("eps must be positive");
        }
        if (params.minSamples < 1) {
            throw ClusteringError("min_samples must be at least 1");
        }
        distances.validate();
    }
};

} // namespace dedup

#endif // DEDUP_CLUSTERING_ICLUSTERING_HPP
