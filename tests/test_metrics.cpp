#include <gtest/gtest.h>
#include "dedup/evaluation/Metrics.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace dedup;

namespace {

Block blockOf(std::vector<RecordId> members) {
    Block block;
    block.members = std::move(members);
    return block;
}

ResolvedCluster clusterOf(int id, const std::vector<RecordId>& ids) {
    ResolvedCluster cluster;
    cluster.clusterId = id;
    for (RecordId rid : ids) {
        Record record;
        record.setId(rid);
        cluster.members.push_back(record);
    }
    return cluster;
}

}  // namespace

TEST(Metrics, ConfusionMatrixCountsPairs) {
    PairConfusion cm = Metrics::confusionMatrix({0, 0, 1, 1}, {0, 0, 0, 1});

    EXPECT_EQ(cm.truePositives, 1u);
    EXPECT_EQ(cm.falsePositives, 2u);
    EXPECT_EQ(cm.falseNegatives, 1u);
    EXPECT_EQ(cm.trueNegatives, 2u);
}

TEST(Metrics, PrecisionRecallF1) {
    std::vector<int> truth = {0, 0, 1, 1};
    std::vector<int> predicted = {0, 0, 0, 1};

    EXPECT_NEAR(Metrics::precision(truth, predicted), 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(Metrics::recall(truth, predicted), 0.5, 1e-12);
    EXPECT_NEAR(Metrics::f1Score(truth, predicted), 0.4, 1e-12);

    EXPECT_DOUBLE_EQ(Metrics::f1Score(truth, truth), 1.0);
}

TEST(Metrics, NoPredictedPairsIsPerfectPrecision) {
    std::vector<int> truth = {0, 0, 1};
    std::vector<int> allApart = {0, 1, 2};

    EXPECT_DOUBLE_EQ(Metrics::precision(truth, allApart), 1.0);
    EXPECT_DOUBLE_EQ(Metrics::recall(truth, allApart), 0.0);
}

TEST(Metrics, LabelLengthsMustMatch) {
    EXPECT_THROW(Metrics::confusionMatrix({0, 1}, {0}), std::invalid_argument);
    EXPECT_THROW(Metrics::precision({0}, {0, 1}), std::invalid_argument);
}

TEST(Metrics, ComparisonReduction) {
    EXPECT_EQ(Metrics::maxPossibleComparisons(5), 10u);
    EXPECT_EQ(Metrics::maxPossibleComparisons(1), 0u);

    EXPECT_DOUBLE_EQ(Metrics::reductionRatio(10, 4), 0.6);
    EXPECT_DOUBLE_EQ(Metrics::reductionRatio(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(Metrics::comparisonEfficiency(10, 4), 2.5);
    EXPECT_TRUE(std::isinf(Metrics::comparisonEfficiency(10, 0)));
}

TEST(Metrics, PairCompletenessOfBlocks) {
    std::vector<int> truth = {0, 0, 1, 1, 1};
    BlockList blocks = {blockOf({0, 1, 2}), blockOf({2, 3})};

    EXPECT_EQ(Metrics::comparisonsInBlocks(blocks), 4u);
    EXPECT_DOUBLE_EQ(Metrics::pairCompleteness(truth, blocks), 0.5);

    // A pair covered twice counts once
    blocks.push_back(blockOf({0, 1}));
    EXPECT_DOUBLE_EQ(Metrics::pairCompleteness(truth, blocks), 0.5);

    EXPECT_DOUBLE_EQ(Metrics::pairCompleteness({0, 1, 2}, blocks), 1.0);
}

TEST(Metrics, LabelsFromClusters) {
    ClusterSequence clusters({clusterOf(0, {0, 2}), clusterOf(1, {3})}, {}, RunStatistics{});

    EXPECT_EQ(Metrics::labelsFromClusters(clusters, 5), (std::vector<int>{0, 2, 0, 1, 3}));
}
