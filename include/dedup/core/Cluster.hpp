/**
 * @file Cluster.hpp
 * @brief Resolved clusters and the sequence returned by a run
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CORE_CLUSTER_HPP
#define DEDUP_CORE_CLUSTER_HPP

#include "Types.hpp"
#include "Record.hpp"
#include "RunReport.hpp"
#include <vector>

namespace dedup {

/**
 * @brief Records resolved to the same real-world entity
 */
struct ResolvedCluster {
    // Cluster identifier, stable only within one run
    int clusterId = -1;

    // Member records, ascending by record id
    std::vector<Record> members;

    size_t size() const { return members.size(); }
    bool empty() const { return members.empty(); }

    /**
     * @brief Identifiers of the member records
     */
    std::vector<RecordId> memberIds() const {
        std::vector<RecordId> ids;
        ids.reserve(members.size());
        for (const auto& record : members) {
            ids.push_back(record.getId());
        }
        return ids;
    }
};

/**
 * @brief Output of one deduplication run
 *
 * Clusters are only available once blocking, scoring, clustering and the
 * global merge have all completed; the sequence iterates over the
 * materialized result. Diagnostics and statistics of the run travel with it.
 */
class ClusterSequence {
public:
    using const_iterator = std::vector<ResolvedCluster>::const_iterator;

    ClusterSequence() = default;

    ClusterSequence(std::vector<ResolvedCluster> clusters,
                    std::vector<Diagnostic> diagnostics,
                    RunStatistics statistics)
        : clusters_(std::move(clusters))
        , diagnostics_(std::move(diagnostics))
        , statistics_(statistics) {}

    const_iterator begin() const { return clusters_.begin(); }
    const_iterator end() const { return clusters_.end(); }

    size_t size() const { return clusters_.size(); }
    bool empty() const { return clusters_.empty(); }

    const ResolvedCluster& operator[](size_t i) const { return clusters_[i]; }

    const std::vector<ResolvedCluster>& clusters() const { return clusters_; }
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    const RunStatistics& statistics() const { return statistics_; }

private:
    std::vector<ResolvedCluster> clusters_;
    std::vector<Diagnostic> diagnostics_;
    RunStatistics statistics_;
};

} // namespace dedup

#endif // DEDUP_CORE_CLUSTER_HPP
