#include <gtest/gtest.h>
#include "dedup/blocking/BlockSplitterFactory.hpp"
#include "dedup/blocking/SortedNeighbourhoodSplitter.hpp"

#include <set>
#include <string>
#include <vector>

using namespace dedup;

namespace {

// Records named by letter in reverse order: "j", "i", ..., "a"
RecordList reversedLetters(size_t n) {
    RecordList records;
    for (size_t i = 0; i < n; ++i) {
        Record r{{"name", Value(std::string(1, static_cast<char>('a' + (n - 1 - i))))}};
        r.setId(i);
        records.push_back(r);
    }
    return records;
}

Block wholeBlock(const RecordList& records, size_t id = 7) {
    Block block;
    block.id = id;
    block.parentId = id;
    block.label = "k";
    for (const auto& r : records) {
        block.members.push_back(r.getId());
    }
    return block;
}

}  // namespace

TEST(SortedNeighbourhoodSplitter, SmallBlockIsReturnedUnchanged) {
    auto records = reversedLetters(4);
    Block block = wholeBlock(records);
    SortedNeighbourhoodSplitter splitter({"name"}, 4);

    auto out = splitter.split(block, records);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].members, block.members);
    EXPECT_EQ(out[0].label, block.label);
}

TEST(SortedNeighbourhoodSplitter, WindowsWithoutOverlap) {
    auto records = reversedLetters(10);
    Block block = wholeBlock(records);
    SortedNeighbourhoodSplitter splitter({"name"}, 4);

    auto out = splitter.split(block, records);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].size(), 4u);
    EXPECT_EQ(out[1].size(), 4u);
    EXPECT_EQ(out[2].size(), 2u);

    std::set<RecordId> covered;
    for (const auto& sub : out) {
        EXPECT_EQ(sub.parentId, block.id);
        EXPECT_LE(sub.size(), 4u);
        covered.insert(sub.members.begin(), sub.members.end());
    }
    EXPECT_EQ(covered.size(), records.size());
    EXPECT_EQ(out[0].label, "k/w0");
    EXPECT_EQ(out[2].label, "k/w2");
}

TEST(SortedNeighbourhoodSplitter, WindowsFollowSortOrder) {
    auto records = reversedLetters(6);
    Block block = wholeBlock(records);
    SortedNeighbourhoodSplitter splitter({"name"}, 3);

    auto out = splitter.split(block, records);
    ASSERT_EQ(out.size(), 2u);
    // "a", "b", "c" are the last three records
    EXPECT_EQ(out[0].members, (std::vector<RecordId>{5, 4, 3}));
    EXPECT_EQ(out[1].members, (std::vector<RecordId>{2, 1, 0}));
}

TEST(SortedNeighbourhoodSplitter, OverlapSharesRecordsBetweenWindows) {
    auto records = reversedLetters(10);
    Block block = wholeBlock(records);
    SortedNeighbourhoodSplitter splitter({"name"}, 4, 1);

    auto out = splitter.split(block, records);
    ASSERT_EQ(out.size(), 3u);
    for (size_t w = 0; w + 1 < out.size(); ++w) {
        EXPECT_EQ(out[w].members.back(), out[w + 1].members.front());
    }
    EXPECT_EQ(out.back().members.back(), 0u);
}

TEST(SortedNeighbourhoodSplitter, TiesAreBrokenById) {
    RecordList records;
    for (size_t i = 0; i < 4; ++i) {
        Record r{{"name", "same"}};
        r.setId(i);
        records.push_back(r);
    }
    Block block = wholeBlock(records);
    block.members = {3, 1, 2, 0};
    SortedNeighbourhoodSplitter splitter({"name"}, 2);

    auto out = splitter.split(block, records);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].members, (std::vector<RecordId>{0, 1}));
    EXPECT_EQ(out[1].members, (std::vector<RecordId>{2, 3}));
}

TEST(SortedNeighbourhoodSplitter, InvalidParametersThrow) {
    EXPECT_THROW(SortedNeighbourhoodSplitter({}, 4), ConfigurationError);
    EXPECT_THROW(SortedNeighbourhoodSplitter({""}, 4), ConfigurationError);
    EXPECT_THROW(SortedNeighbourhoodSplitter({"name"}, 0), ConfigurationError);
    EXPECT_THROW(SortedNeighbourhoodSplitter({"name"}, 4, 4), ConfigurationError);
}

TEST(IdentitySplitter, ReturnsBlockAsIs) {
    auto records = reversedLetters(30);
    Block block = wholeBlock(records);
    IdentitySplitter splitter;

    auto out = splitter.split(block, records);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].members, block.members);
}

TEST(BlockSplitterFactory, CreatesByKind) {
    SplitterParams params;
    EXPECT_EQ(BlockSplitterFactory::create(params)->getName(), "identity");

    params.kind = "sorted_neighbourhood";
    params.fields = {"name"};
    params.maxBlockSize = 10;
    auto splitter = BlockSplitterFactory::create(params);
    EXPECT_EQ(splitter->getName(), "sorted_neighbourhood");
    EXPECT_EQ(splitter->clone()->getName(), "sorted_neighbourhood");

    params.kind = "windowed";
    EXPECT_THROW(BlockSplitterFactory::create(params), ConfigurationError);
    EXPECT_FALSE(BlockSplitterFactory::isValidSplitter("windowed"));
    EXPECT_TRUE(BlockSplitterFactory::isValidSplitter("identity"));
}
