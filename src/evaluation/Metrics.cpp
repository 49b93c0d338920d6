/**
 * @file Metrics.cpp
 * @brief Evaluation metrics implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/evaluation/Metrics.hpp"
#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

namespace dedup {

namespace {

uint64_t pairsOf(uint64_t n) {
    return n < 2 ? 0 : n * (n - 1) / 2;
}

template <typename Key>
uint64_t pairsWithin(const std::map<Key, uint64_t>& sizes) {
    uint64_t total = 0;
    for (const auto& entry : sizes) {
        total += pairsOf(entry.second);
    }
    return total;
}

}  // anonymous namespace

uint64_t Metrics::maxPossibleComparisons(uint64_t recordCount) {
    return pairsOf(recordCount);
}

PairConfusion Metrics::confusionMatrix(const std::vector<int>& trueLabels,
                                       const std::vector<int>& predLabels) {
    if (trueLabels.size() != predLabels.size()) {
        throw std::invalid_argument("Label vectors differ in length");
    }

    std::map<std::pair<int, int>, uint64_t> joint;
    std::map<int, uint64_t> predicted;
    std::map<int, uint64_t> truth;
    for (size_t i = 0; i < trueLabels.size(); ++i) {
        ++joint[{predLabels[i], trueLabels[i]}];
        ++predicted[predLabels[i]];
        ++truth[trueLabels[i]];
    }

    uint64_t tp = pairsWithin(joint);
    uint64_t p = pairsWithin(predicted);
    uint64_t t = pairsWithin(truth);

    PairConfusion cm;
    cm.truePositives = tp;
    cm.falsePositives = p - tp;
    cm.falseNegatives = t - tp;
    cm.trueNegatives = pairsOf(trueLabels.size()) - p - cm.falseNegatives;
    return cm;
}

double Metrics::precision(const std::vector<int>& trueLabels, const std::vector<int>& predLabels) {
    PairConfusion cm = confusionMatrix(trueLabels, predLabels);
    uint64_t predictedPairs = cm.truePositives + cm.falsePositives;
    if (predictedPairs == 0) {
        return 1.0;
    }
    return static_cast<double>(cm.truePositives) / static_cast<double>(predictedPairs);
}

double Metrics::recall(const std::vector<int>& trueLabels, const std::vector<int>& predLabels) {
    // Recall is precision with the roles of the labelings swapped
    return precision(predLabels, trueLabels);
}

double Metrics::f1Score(const std::vector<int>& trueLabels, const std::vector<int>& predLabels) {
    double p = precision(trueLabels, predLabels);
    double r = recall(trueLabels, predLabels);
    if (p + r == 0.0) {
        return 0.0;
    }
    return 2.0 * p * r / (p + r);
}

double Metrics::reductionRatio(uint64_t comparisonsBefore, uint64_t comparisonsAfter) {
    if (comparisonsBefore == 0) {
        return 0.0;
    }
    return 1.0 - static_cast<double>(comparisonsAfter) / static_cast<double>(comparisonsBefore);
}

double Metrics::comparisonEfficiency(uint64_t comparisonsBefore, uint64_t comparisonsAfter) {
    if (comparisonsAfter == 0) {
        return std::numeric_limits<double>::infinity();
    }
    return static_cast<double>(comparisonsBefore) / static_cast<double>(comparisonsAfter);
}

uint64_t Metrics::comparisonsInBlocks(const BlockList& blocks) {
    uint64_t total = 0;
    for (const auto& block : blocks) {
        total += block.pairCount();
    }
    return total;
}

double Metrics::pairCompleteness(const std::vector<int>& trueLabels, const BlockList& blocks) {
    std::set<std::pair<RecordId, RecordId>> covered;
    for (const auto& block : blocks) {
        for (size_t i = 0; i < block.members.size(); ++i) {
            for (size_t j = i + 1; j < block.members.size(); ++j) {
                RecordId a = block.members[i];
                RecordId b = block.members[j];
                if (a < trueLabels.size() && b < trueLabels.size() && trueLabels[a] == trueLabels[b]) {
                    covered.insert({std::min(a, b), std::max(a, b)});
                }
            }
        }
    }

    std::map<int, uint64_t> truth;
    for (int label : trueLabels) {
        ++truth[label];
    }
    uint64_t truePairs = pairsWithin(truth);
    if (truePairs == 0) {
        return 1.0;
    }
    return static_cast<double>(covered.size()) / static_cast<double>(truePairs);
}

std::vector<int> Metrics::labelsFromClusters(const ClusterSequence& clusters, size_t recordCount) {
    const int unassigned = std::numeric_limits<int>::min();
    std::vector<int> labels(recordCount, unassigned);

    int nextLabel = 0;
    for (const auto& cluster : clusters) {
        nextLabel = std::max(nextLabel, cluster.clusterId + 1);
        for (const auto& record : cluster.members) {
            if (record.getId() < recordCount) {
                labels[record.getId()] = cluster.clusterId;
            }
        }
    }

    for (auto& label : labels) {
        if (label == unassigned) {
            label = nextLabel++;
        }
    }
    return labels;
}

} // namespace dedup
