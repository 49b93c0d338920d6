/**
 * @file ClusterEngine.cpp
 * @brief Cluster engine implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/engine/ClusterEngine.hpp"
#include "dedup/observability/Logging.hpp"
#include "dedup/utils/UnionFind.hpp"
#include <exception>
#include <map>
#include <string>

namespace dedup {

ClusterEngine::ClusterEngine(ClusteringParams params, double similarityThreshold)
    : params_(std::move(params))
    , similarityThreshold_(similarityThreshold) {}

bool ClusterEngine::passesThreshold(double score) const {
    if (similarityThreshold_ >= 1.0) {
        return false;
    }
    return score >= similarityThreshold_;
}

DistanceMatrix ClusterEngine::buildDistanceMatrix(size_t n,
                                                  const std::vector<AggregatedScore>& scores) const {
    DistanceMatrix matrix(n);
    for (const auto& s : scores) {
        if (!passesThreshold(s.score)) {
            continue;  // Stays unreachable
        }
        matrix.set(s.first, s.second, 1.0 - s.score);
    }
    return matrix;
}

void ClusterEngine::clusterBlock(const Block& block,
                                 const std::vector<AggregatedScore>& scores,
                                 const IClustering& oracle,
                                 SubBlockResult& result) const {
    result.blockId = block.id;
    result.members = block.members;
    result.labels.assign(block.size(), NOISE_LABEL);

    if (block.empty()) {
        return;
    }

    DistanceMatrix matrix = buildDistanceMatrix(block.size(), scores);

    auto markFailed = [&](const std::string& error) {
        result.labels.assign(block.size(), NOISE_LABEL);
        result.clusteringFailed = true;

        Diagnostic diag;
        diag.stage = Stage::CLUSTERING;
        diag.message = "clustering failed: " + error;
        diag.blockId = block.id;
        diag.records = block.members;
        result.diagnostics.push_back(std::move(diag));

        DEDUP_LOG_WARN("clustering failed, sub-block treated as noise",
                       {observability::intField("block", static_cast<int64_t>(block.id)),
                        observability::intField("records", static_cast<int64_t>(block.size())),
                        observability::stringField("algorithm", oracle.getName()),
                        observability::stringField("error", error)});
    };

    try {
        std::vector<ClusterLabel> labels = oracle.cluster(matrix, params_);
        if (labels.size() != block.size()) {
            throw ClusteringError("Clustering returned " + std::to_string(labels.size()) +
                                  " labels for " + std::to_string(block.size()) + " records");
        }
        result.labels = std::move(labels);
    } catch (const std::exception& e) {
        markFailed(e.what());
    } catch (...) {
        markFailed("unknown exception");
    }
}

std::vector<std::vector<RecordId>> ClusterEngine::merge(const std::vector<SubBlockResult>& results,
                                                        size_t recordCount,
                                                        bool includeSingletons) {
    UnionFind sets(recordCount);

    for (const auto& result : results) {
        // First member seen for each local label
        std::map<ClusterLabel, RecordId> anchors;
        for (size_t i = 0; i < result.members.size(); ++i) {
            ClusterLabel label = result.labels[i];
            if (label == NOISE_LABEL) {
                continue;
            }
            RecordId id = result.members[i];
            auto it = anchors.find(label);
            if (it == anchors.end()) {
                anchors.emplace(label, id);
            } else {
                sets.unite(it->second, id);
            }
        }
    }

    std::vector<std::vector<RecordId>> out;
    for (auto& group : sets.groups()) {
        if (group.size() > 1 || includeSingletons) {
            out.push_back(std::move(group));
        }
    }
    return out;
}

} // namespace dedup
