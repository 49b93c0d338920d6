#include <gtest/gtest.h>
#include "dedup/scoring/PairwiseScorer.hpp"
#include "dedup/matching/ComparatorFactory.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

using namespace dedup;

namespace {

RecordList numbered(RecordList records) {
    for (size_t i = 0; i < records.size(); ++i) {
        records[i].setId(i);
    }
    return records;
}

Block blockOf(const RecordList& records) {
    Block block;
    block.id = 3;
    block.parentId = 3;
    for (const auto& r : records) {
        block.members.push_back(r.getId());
    }
    return block;
}

}  // namespace

TEST(PairwiseScorer, ScoresEveryPairInOrder) {
    auto records = numbered({Record{{"name", "a"}}, Record{{"name", "b"}}, Record{{"name", "a"}}});
    PairwiseScorer scorer({ComparatorFactory::makeEntry("name", "exact")});
    std::vector<Diagnostic> diagnostics;

    auto pairs = scorer.score(blockOf(records), records, diagnostics);
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0].first, 0u);
    EXPECT_EQ(pairs[0].second, 1u);
    EXPECT_EQ(pairs[1].first, 0u);
    EXPECT_EQ(pairs[1].second, 2u);
    EXPECT_EQ(pairs[2].first, 1u);
    EXPECT_EQ(pairs[2].second, 2u);
    EXPECT_DOUBLE_EQ(pairs[1].scores[0], 1.0);
    EXPECT_DOUBLE_EQ(pairs[0].scores[0], 0.0);
    EXPECT_TRUE(diagnostics.empty());
}

TEST(PairwiseScorer, MissingAttributeScoresZero) {
    auto records = numbered({Record{{"name", "a"}}, Record{{"phone", "555"}}});
    PairwiseScorer scorer({ComparatorFactory::makeEntry("name", "exact"),
                           ComparatorFactory::makeEntry("phone", "exact")});
    std::vector<Diagnostic> diagnostics;

    auto pairs = scorer.score(blockOf(records), records, diagnostics);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].scores, (std::vector<double>{0.0, 0.0}));
    EXPECT_TRUE(diagnostics.empty());
}

TEST(PairwiseScorer, ThrowingComparatorBecomesDiagnostic) {
    auto records = numbered({Record{{"age", "forty"}}, Record{{"age", 40}}, Record{{"age", 41}}});
    PairwiseScorer scorer({ComparatorFactory::makeEntry("age", "numeric")});
    std::vector<Diagnostic> diagnostics;

    auto pairs = scorer.score(blockOf(records), records, diagnostics);
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_DOUBLE_EQ(pairs[0].scores[0], 0.0);
    EXPECT_DOUBLE_EQ(pairs[1].scores[0], 0.0);
    EXPECT_GT(pairs[2].scores[0], 0.9);

    ASSERT_EQ(diagnostics.size(), 2u);
    EXPECT_EQ(diagnostics[0].stage, Stage::SCORING);
    EXPECT_EQ(diagnostics[0].attribute, "age");
    EXPECT_EQ(diagnostics[0].blockId, 3u);
    EXPECT_EQ(diagnostics[0].records, (std::vector<RecordId>{0, 1}));
    EXPECT_EQ(diagnostics[1].records, (std::vector<RecordId>{0, 2}));
}

TEST(PairwiseScorer, NonFiniteAndOutOfRangeScores) {
    auto records = numbered({Record{{"x", "1"}}, Record{{"x", "2"}}});
    ComparatorList comparators = {
        ComparatorEntry("x", [](const Value&, const Value&) {
            return std::numeric_limits<double>::quiet_NaN();
        }),
        ComparatorEntry("x", [](const Value&, const Value&) { return 1.7; }),
        ComparatorEntry("x", [](const Value&, const Value&) { return -0.3; }),
    };
    PairwiseScorer scorer(comparators);
    std::vector<Diagnostic> diagnostics;

    auto pairs = scorer.score(blockOf(records), records, diagnostics);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].scores, (std::vector<double>{0.0, 1.0, 0.0}));
    EXPECT_EQ(diagnostics.size(), 1u);
}

TEST(PairwiseScorer, ComparisonCapLimitsPairs) {
    RecordList raw;
    for (int i = 0; i < 6; ++i) {
        raw.push_back(Record{{"name", "n"}});
    }
    auto records = numbered(raw);
    PairwiseScorer scorer({ComparatorFactory::makeEntry("name", "exact")}, 4);
    std::vector<Diagnostic> diagnostics;

    EXPECT_EQ(scorer.pairBudget(6), 4u);
    EXPECT_EQ(scorer.pairBudget(2), 1u);
    EXPECT_EQ(scorer.score(blockOf(records), records, diagnostics).size(), 4u);
}

TEST(PairwiseScorer, AggregateKeepsPairIdentity) {
    auto records = numbered({Record{{"a", "x"}, {"b", "y"}}, Record{{"a", "x"}, {"b", "z"}}});
    PairwiseScorer scorer({ComparatorFactory::makeEntry("a", "exact"),
                           ComparatorFactory::makeEntry("b", "exact")});
    std::vector<Diagnostic> diagnostics;

    auto pairs = scorer.score(blockOf(records), records, diagnostics);
    auto aggregated = PairwiseScorer::aggregate(pairs, Aggregator(AggregationStrategy::MEAN));
    ASSERT_EQ(aggregated.size(), 1u);
    EXPECT_EQ(aggregated[0].firstId, 0u);
    EXPECT_EQ(aggregated[0].secondId, 1u);
    EXPECT_DOUBLE_EQ(aggregated[0].score, 0.5);
}

TEST(PairwiseScorer, NonStandardThrowBecomesDiagnostic) {
    auto records = numbered({Record{{"name", "x"}}, Record{{"name", "bad"}}});
    ComparatorList comparators = {
        ComparatorEntry("name", [](const Value& a, const Value& b) -> double {
            if (a.toString() == "bad" || b.toString() == "bad") {
                throw 42;
            }
            return 1.0;
        }),
    };
    PairwiseScorer scorer(comparators);
    std::vector<Diagnostic> diagnostics;

    std::vector<PairScore> pairs;
    EXPECT_NO_THROW(pairs = scorer.score(blockOf(records), records, diagnostics));
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_DOUBLE_EQ(pairs[0].scores[0], 0.0);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].stage, Stage::SCORING);
    EXPECT_EQ(diagnostics[0].message, "comparator failed: unknown exception");
    EXPECT_EQ(diagnostics[0].records, (std::vector<RecordId>{0, 1}));
}
