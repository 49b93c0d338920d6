/**
 * @file PairwiseScorer.cpp
 * @brief Pairwise scoring implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/scoring/PairwiseScorer.hpp"
#include "dedup/observability/Logging.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <string>

namespace dedup {

namespace {

Diagnostic scoringFailure(const ComparatorEntry& entry, const Record& a, const Record& b,
                          size_t blockId, std::string message) {
    DEDUP_LOG_WARN("comparator failed",
                   {observability::stringField("attribute", entry.attribute),
                    observability::intField("block", static_cast<int64_t>(blockId)),
                    observability::intField("a", static_cast<int64_t>(a.getId())),
                    observability::intField("b", static_cast<int64_t>(b.getId())),
                    observability::stringField("error", message)});

    Diagnostic diag;
    diag.stage = Stage::SCORING;
    diag.message = std::move(message);
    diag.blockId = blockId;
    diag.records = {a.getId(), b.getId()};
    diag.attribute = entry.attribute;
    return diag;
}

}  // anonymous namespace

PairwiseScorer::PairwiseScorer(ComparatorList comparators, size_t maxComparisons)
    : comparators_(std::move(comparators))
    , maxComparisons_(maxComparisons) {}

size_t PairwiseScorer::pairBudget(size_t blockSize) const {
    size_t all = blockSize < 2 ? 0 : blockSize * (blockSize - 1) / 2;
    if (maxComparisons_ == 0) {
        return all;
    }
    return std::min(all, maxComparisons_);
}

std::vector<PairScore> PairwiseScorer::score(const Block& block,
                                             const RecordList& records,
                                             std::vector<Diagnostic>& diagnostics) const {
    std::vector<PairScore> pairs;
    const size_t budget = pairBudget(block.size());
    pairs.reserve(budget);

    const size_t n = block.size();
    for (size_t i = 0; i < n && pairs.size() < budget; ++i) {
        const Record& a = records[block.members[i]];
        for (size_t j = i + 1; j < n && pairs.size() < budget; ++j) {
            const Record& b = records[block.members[j]];

            PairScore pair;
            pair.first = i;
            pair.second = j;
            pair.firstId = a.getId();
            pair.secondId = b.getId();
            pair.scores.reserve(comparators_.size());

            for (const auto& entry : comparators_) {
                pair.scores.push_back(compareAttribute(entry, a, b, block.id, diagnostics));
            }
            pairs.push_back(std::move(pair));
        }
    }
    return pairs;
}

double PairwiseScorer::compareAttribute(const ComparatorEntry& entry,
                                        const Record& a, const Record& b,
                                        size_t blockId,
                                        std::vector<Diagnostic>& diagnostics) const {
    const Value* left = a.get(entry.attribute);
    const Value* right = b.get(entry.attribute);
    if (left == nullptr || right == nullptr) {
        return 0.0;
    }

    double similarity = 0.0;
    try {
        similarity = entry.comparator(*left, *right);
    } catch (const std::exception& e) {
        diagnostics.push_back(scoringFailure(entry, a, b, blockId, std::string("comparator failed: ") + e.what()));
        return 0.0;
    } catch (...) {
        // User comparators may throw values outside the std hierarchy
        diagnostics.push_back(scoringFailure(entry, a, b, blockId, "comparator failed: unknown exception"));
        return 0.0;
    }

    if (!std::isfinite(similarity)) {
        diagnostics.push_back(scoringFailure(entry, a, b, blockId, "comparator returned a non-finite score"));
        return 0.0;
    }

    return std::clamp(similarity, 0.0, 1.0);
}

std::vector<AggregatedScore> PairwiseScorer::aggregate(const std::vector<PairScore>& pairs,
                                                       const Aggregator& aggregator) {
    std::vector<AggregatedScore> out;
    out.reserve(pairs.size());
    for (const auto& pair : pairs) {
        AggregatedScore agg;
        agg.first = pair.first;
        agg.second = pair.second;
        agg.firstId = pair.firstId;
        agg.secondId = pair.secondId;
        agg.score = std::clamp(aggregator.aggregate(pair.scores), 0.0, 1.0);
        out.push_back(agg);
    }
    return out;
}

} // namespace dedup
