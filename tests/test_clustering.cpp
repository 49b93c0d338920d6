#include <gtest/gtest.h>
#include "dedup/clustering/ClusteringFactory.hpp"
#include "dedup/clustering/ConnectedComponentsClustering.hpp"
#include "dedup/clustering/DBSCANClustering.hpp"
#include "dedup/utils/UnionFind.hpp"

#include <limits>
#include <vector>

using namespace dedup;

namespace {

ClusteringParams params(double eps, int minSamples) {
    ClusteringParams p;
    p.eps = eps;
    p.minSamples = minSamples;
    return p;
}

// Chain 0-1-2 at distance 0.1, 3 isolated
DistanceMatrix chain() {
    DistanceMatrix m(4);
    m.set(0, 1, 0.1);
    m.set(1, 2, 0.1);
    return m;
}

}  // namespace

TEST(DistanceMatrix, StartsUnreachable) {
    DistanceMatrix m(3);
    EXPECT_DOUBLE_EQ(m(0, 0), 0.0);
    EXPECT_FALSE(m.isReachable(0, 1));
    m.set(0, 1, 0.25);
    EXPECT_DOUBLE_EQ(m(1, 0), 0.25);
    EXPECT_TRUE(m.isReachable(1, 0));
    EXPECT_NO_THROW(m.validate());
}

TEST(DistanceMatrix, ValidateRejectsMalformedInput) {
    DistanceMatrix asymmetric(2);
    asymmetric.setEntry(0, 1, 0.2);
    EXPECT_THROW(asymmetric.validate(), ClusteringError);

    DistanceMatrix negative(2);
    negative.set(0, 1, -0.1);
    EXPECT_THROW(negative.validate(), ClusteringError);

    DistanceMatrix nan(2);
    nan.set(0, 1, std::numeric_limits<double>::quiet_NaN());
    EXPECT_THROW(nan.validate(), ClusteringError);

    DistanceMatrix diagonal(2);
    diagonal.setEntry(1, 1, 0.5);
    EXPECT_THROW(diagonal.validate(), ClusteringError);
}

TEST(DBSCANClustering, ChainFormsOneCluster) {
    DBSCANClustering dbscan;
    auto labels = dbscan.cluster(chain(), params(0.2, 2));

    ASSERT_EQ(labels.size(), 4u);
    EXPECT_EQ(labels[0], 0);
    EXPECT_EQ(labels[1], 0);
    EXPECT_EQ(labels[2], 0);
    EXPECT_EQ(labels[3], NOISE_LABEL);
}

TEST(DBSCANClustering, MinSamplesCountsThePointItself) {
    DBSCANClustering dbscan;
    DistanceMatrix pair(2);
    pair.set(0, 1, 0.1);

    EXPECT_EQ(dbscan.cluster(pair, params(0.2, 2)), (std::vector<ClusterLabel>{0, 0}));
    EXPECT_EQ(dbscan.cluster(pair, params(0.2, 3)), (std::vector<ClusterLabel>{-1, -1}));
    // Every point is its own cluster at min_samples 1
    EXPECT_EQ(dbscan.cluster(DistanceMatrix(2), params(0.2, 1)), (std::vector<ClusterLabel>{0, 1}));
}

TEST(DBSCANClustering, EpsIsInclusive) {
    DBSCANClustering dbscan;
    DistanceMatrix pair(2);
    pair.set(0, 1, 0.25);

    EXPECT_EQ(dbscan.cluster(pair, params(0.25, 2)), (std::vector<ClusterLabel>{0, 0}));
    EXPECT_EQ(dbscan.cluster(pair, params(0.24, 2)), (std::vector<ClusterLabel>{-1, -1}));
}

TEST(DBSCANClustering, BorderPointJoinsCluster) {
    // 0 is core (neighbours 1 and 2); 1 and 2 are border points
    DistanceMatrix m(3);
    m.set(0, 1, 0.1);
    m.set(0, 2, 0.1);
    DBSCANClustering dbscan;

    auto labels = dbscan.cluster(m, params(0.15, 3));
    EXPECT_EQ(labels, (std::vector<ClusterLabel>{0, 0, 0}));
}

TEST(DBSCANClustering, SeparateGroupsGetSeparateLabels) {
    DistanceMatrix m(4);
    m.set(0, 1, 0.1);
    m.set(2, 3, 0.1);
    DBSCANClustering dbscan;

    auto labels = dbscan.cluster(m, params(0.2, 2));
    EXPECT_EQ(labels, (std::vector<ClusterLabel>{0, 0, 1, 1}));
}

TEST(DBSCANClustering, RejectsBadParameters) {
    DBSCANClustering dbscan;
    EXPECT_THROW(dbscan.cluster(chain(), params(0.0, 2)), ClusteringError);
    EXPECT_THROW(dbscan.cluster(chain(), params(0.2, 0)), ClusteringError);

    ClusteringParams euclidean = params(0.2, 2);
    euclidean.metric = "euclidean";
    EXPECT_THROW(dbscan.cluster(chain(), euclidean), ClusteringError);
}

TEST(DBSCANClustering, EmptyMatrixGivesNoLabels) {
    DBSCANClustering dbscan;
    EXPECT_TRUE(dbscan.cluster(DistanceMatrix(0), params(0.2, 2)).empty());
}

TEST(ConnectedComponentsClustering, FollowsEdgesWithinEps) {
    ConnectedComponentsClustering cc;
    auto labels = cc.cluster(chain(), params(0.2, 2));
    EXPECT_EQ(labels, (std::vector<ClusterLabel>{0, 0, 0, NOISE_LABEL}));
}

TEST(ConnectedComponentsClustering, SmallComponentsAreNoise) {
    DistanceMatrix m(5);
    m.set(0, 1, 0.1);
    m.set(2, 3, 0.1);
    m.set(3, 4, 0.1);
    ConnectedComponentsClustering cc;

    auto labels = cc.cluster(m, params(0.2, 3));
    EXPECT_EQ(labels, (std::vector<ClusterLabel>{-1, -1, 0, 0, 0}));
}

TEST(ClusteringFactory, CreatesByName) {
    EXPECT_EQ(ClusteringFactory::create("DBSCAN")->getName(), "DBSCAN");
    EXPECT_EQ(ClusteringFactory::create("connected_components")->getName(), "CONNECTED_COMPONENTS");
    EXPECT_THROW(ClusteringFactory::create("OPTICS"), ConfigurationError);
    EXPECT_TRUE(ClusteringFactory::isValidAlgorithm("dbscan"));
    EXPECT_FALSE(ClusteringFactory::isValidAlgorithm("OPTICS"));

    auto oracle = ClusteringFactory::create(ClusteringParams{});
    auto copy = oracle->clone();
    EXPECT_EQ(copy->getName(), oracle->getName());
}

TEST(UnionFind, GroupsAreOrderedBySmallestMember) {
    UnionFind sets(6);
    sets.unite(4, 1);
    sets.unite(5, 0);
    sets.unite(1, 3);

    EXPECT_TRUE(sets.connected(3, 4));
    EXPECT_FALSE(sets.connected(0, 1));
    EXPECT_EQ(sets.componentCount(), 3u);

    auto groups = sets.groups();
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0], (std::vector<size_t>{0, 5}));
    EXPECT_EQ(groups[1], (std::vector<size_t>{1, 3, 4}));
    EXPECT_EQ(groups[2], (std::vector<size_t>{2}));
}

TEST(UnionFind, UniteIsIdempotent) {
    UnionFind sets(3);
    EXPECT_TRUE(sets.unite(0, 1));
    EXPECT_FALSE(sets.unite(1, 0));
    EXPECT_EQ(sets.componentCount(), 2u);
}
