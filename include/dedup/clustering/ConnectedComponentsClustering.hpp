/**
 * @file ConnectedComponentsClustering.hpp
 * @brief Single-linkage clustering: connected components of the eps graph
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CLUSTERING_CONNECTEDCOMPONENTS_HPP
#define DEDUP_CLUSTERING_CONNECTEDCOMPONENTS_HPP

#include "IClustering.hpp"

namespace dedup {

/**
 * @brief Connected components clustering
 *
 * Two rows are linked when their distance is at most eps; each connected
 * component with at least minSamples rows becomes a cluster, smaller
 * components are noise. This is transitive closure: highest recall, lowest
 * precision. Labels are assigned in order of each component's first row.
 */
class ConnectedComponentsClustering : public IClustering {
public:
    ConnectedComponentsClustering() = default;

    ~ConnectedComponentsClustering() override = default;

    std::vector<ClusterLabel> cluster(const DistanceMatrix& distances,
                                      const ClusteringParams& params) const override;

    std::string getName() const override { return "CONNECTED_COMPONENTS"; }

    std::unique_ptr<IClustering> clone() const override;
};

} // namespace dedup

#endif // DEDUP_CLUSTERING_CONNECTEDCOMPONENTS_HPP
