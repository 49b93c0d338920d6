/**
 * @file DBSCANClustering.hpp
 * @brief DBSCAN clustering over a precomputed distance matrix
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CLUSTERING_DBSCAN_HPP
#define DEDUP_CLUSTERING_DBSCAN_HPP

#include "IClustering.hpp"

namespace dedup {

/**
 * @brief DBSCAN (Density-Based Spatial Clustering) implementation
 *
 * A row is a core point when at least minSamples rows, itself included, lie
 * within eps. Clusters grow from core points; border points join the first
 * cluster that reaches them; everything else is noise. Unreachable pairs
 * (infinite distance) are never neighbours.
 */
class DBSCANClustering : public IClustering {
public:
    DBSCANClustering() = default;

    ~DBSCANClustering() override = default;

    /**
     * @brief Cluster matrix rows using DBSCAN
     */
    std::vector<ClusterLabel> cluster(const DistanceMatrix& distances,
                                      const ClusteringParams& params) const override;

    std::string getName() const override { return "DBSCAN"; }

    std::unique_ptr<IClustering> clone() const override;

private:
    /**
     * @brief Find rows within eps, the row itself included
     */
    std::vector<size_t> findNeighbors(const DistanceMatrix& distances,
                                      size_t pointIdx, double eps) const;

    /**
     * @brief Expand cluster from seed point
     */
    void expandCluster(const DistanceMatrix& distances,
                       const ClusteringParams& params,
                       size_t pointIdx,
                       std::vector<size_t>& neighbors,
                       int clusterId,
                       std::vector<int>& labels) const;
};

} // namespace dedup

#endif // DEDUP_CLUSTERING_DBSCAN_HPP
