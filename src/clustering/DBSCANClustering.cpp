/**
 * @file DBSCANClustering.cpp
 * @brief DBSCAN clustering implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/clustering/DBSCANClustering.hpp"
#include <algorithm>

namespace dedup {

std::unique_ptr<IClustering> DBSCANClustering::clone() const {
    return std::make_unique<DBSCANClustering>(*this);
}

std::vector<size_t> DBSCANClustering::findNeighbors(const DistanceMatrix& distances,
                                                    size_t pointIdx, double eps) const {
    std::vector<size_t> neighbors;
    for (size_t i = 0; i < distances.size(); ++i) {
        if (distances.at(pointIdx, i) <= eps) {
            neighbors.push_back(i);
        }
    }
    return neighbors;
}

void DBSCANClustering::expandCluster(const DistanceMatrix& distances,
                                     const ClusteringParams& params,
                                     size_t pointIdx,
                                     std::vector<size_t>& neighbors,
                                     int clusterId,
                                     std::vector<int>& labels) const {
    labels[pointIdx] = clusterId;

    size_t i = 0;
    while (i < neighbors.size()) {
        size_t neighborIdx = neighbors[i];

        if (labels[neighborIdx] == -1) {
            // Was marked as noise, now a border point of this cluster
            labels[neighborIdx] = clusterId;
        }

        if (labels[neighborIdx] == 0) {
            // Unprocessed point
            labels[neighborIdx] = clusterId;

            std::vector<size_t> neighborNeighbors = findNeighbors(distances, neighborIdx, params.eps);

            if (static_cast<int>(neighborNeighbors.size()) >= params.minSamples) {
                // Core point, add its neighbors
                for (size_t nn : neighborNeighbors) {
                    if (std::find(neighbors.begin(), neighbors.end(), nn) == neighbors.end()) {
                        neighbors.push_back(nn);
                    }
                }
            }
        }

        ++i;
    }
}

std::vector<ClusterLabel> DBSCANClustering::cluster(const DistanceMatrix& distances,
                                                    const ClusteringParams& params) const {
    checkInput(distances, params);

    const size_t n = distances.size();
    if (n == 0) {
        return {};
    }

    // Labels: 0 = unprocessed, -1 = noise, >0 = cluster ID
    std::vector<int> labels(n, 0);
    int clusterId = 0;

    for (size_t i = 0; i < n; ++i) {
        if (labels[i] != 0) {
            continue;  // Already processed
        }

        std::vector<size_t> neighbors = findNeighbors(distances, i, params.eps);

        if (static_cast<int>(neighbors.size()) < params.minSamples) {
            // Mark as noise (might be claimed by another cluster later)
            labels[i] = -1;
        } else {
            ++clusterId;
            expandCluster(distances, params, i, neighbors, clusterId, labels);
        }
    }

    // Zero-indexed local labels
    std::vector<ClusterLabel> result(n, NOISE_LABEL);
    for (size_t i = 0; i < n; ++i) {
        if (labels[i] > 0) {
            result[i] = labels[i] - 1;
        }
    }
    return result;
}

} // namespace dedup
