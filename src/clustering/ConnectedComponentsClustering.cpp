/**
 * @file ConnectedComponentsClustering.cpp
 * @brief Connected components clustering implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/clustering/ConnectedComponentsClustering.hpp"
#include <queue>

namespace dedup {

std::unique_ptr<IClustering> ConnectedComponentsClustering::clone() const {
    return std::make_unique<ConnectedComponentsClustering>(*this);
}

std::vector<ClusterLabel> ConnectedComponentsClustering::cluster(const DistanceMatrix& distances,
                                                                 const ClusteringParams& params) const {
    checkInput(distances, params);

    const size_t n = distances.size();
    std::vector<ClusterLabel> labels(n, NOISE_LABEL);
    std::vector<bool> visited(n, false);
    ClusterLabel nextLabel = 0;

    for (size_t seed = 0; seed < n; ++seed) {
        if (visited[seed]) {
            continue;
        }

        // Breadth-first walk of the component
        std::vector<size_t> component;
        std::queue<size_t> frontier;
        frontier.push(seed);
        visited[seed] = true;

        while (!frontier.empty()) {
            size_t current = frontier.front();
            frontier.pop();
            component.push_back(current);

            for (size_t other = 0; other < n; ++other) {
                if (!visited[other] && distances.at(current, other) <= params.eps) {
                    visited[other] = true;
                    frontier.push(other);
                }
            }
        }

        if (static_cast<int>(component.size()) >= params.minSamples) {
            for (size_t idx : component) {
                labels[idx] = nextLabel;
            }
            ++nextLabel;
        }
    }

    return labels;
}

} // namespace dedup
