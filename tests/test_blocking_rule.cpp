#include <gtest/gtest.h>
#include "dedup/blocking/BlockingRule.hpp"

#include <algorithm>
#include <type_traits>
#include <string>
#include <vector>

using namespace dedup;

namespace {

bool sharesKey(const BlockingRule& rule, const Record& a, const Record& b) {
    auto ka = rule.keys(a);
    auto kb = rule.keys(b);
    for (const auto& key : ka) {
        if (std::find(kb.begin(), kb.end(), key) != kb.end()) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST(BlockingRule, ExactLeafProducesOneKey) {
    auto rule = BlockingRule::exact("phone");
    Record r{{"phone", "555"}};

    auto keys = rule->keys(r);
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0], BlockKey::atom("555"));
    EXPECT_TRUE(rule->isLeaf());
}

TEST(BlockingRule, MissingOrNullAttributeGivesNoKey) {
    auto rule = BlockingRule::exact("phone");
    EXPECT_TRUE(rule->keys(Record{{"name", "Amy"}}).empty());
    EXPECT_TRUE(rule->keys(Record{{"phone", nullptr}}).empty());
}

TEST(BlockingRule, EmptyEncodingGivesNoKey) {
    auto rule = BlockingRule::phone("phone");
    EXPECT_TRUE(rule->keys(Record{{"phone", "unknown"}}).empty());
}

TEST(BlockingRule, ConjunctionNeedsBothSides) {
    auto rule = BlockingRule::conjunction(BlockingRule::exact("city"), BlockingRule::exact("zip"));

    Record both{{"city", "Oslo"}, {"zip", "0150"}};
    Record onlyCity{{"city", "Oslo"}};

    EXPECT_EQ(rule->keys(both).size(), 1u);
    EXPECT_TRUE(rule->keys(onlyCity).empty());
    EXPECT_TRUE(rule->isAnd());
}

TEST(BlockingRule, ConjunctionMatchesOnlyWhenAllPartsAgree) {
    auto rule = BlockingRule::fromAttributes({"city", "zip"});

    Record a{{"city", "Oslo"}, {"zip", "0150"}};
    Record b{{"city", "Oslo"}, {"zip", "0150"}};
    Record c{{"city", "Oslo"}, {"zip", "0151"}};

    EXPECT_TRUE(sharesKey(*rule, a, b));
    EXPECT_FALSE(sharesKey(*rule, a, c));
}

TEST(BlockingRule, DisjunctionKeepsEitherSide) {
    auto rule = BlockingRule::disjunction(BlockingRule::exact("email"), BlockingRule::exact("phone"));

    Record both{{"email", "a@x.org"}, {"phone", "555"}};
    Record onlyPhone{{"phone", "555"}};
    Record neither{{"name", "Amy"}};

    EXPECT_EQ(rule->keys(both).size(), 2u);
    EXPECT_EQ(rule->keys(onlyPhone).size(), 1u);
    EXPECT_TRUE(rule->keys(neither).empty());
    EXPECT_TRUE(rule->isOr());

    EXPECT_TRUE(sharesKey(*rule, both, onlyPhone));
}

TEST(BlockingRule, DisjunctionBranchesDoNotCollide) {
    // Same text under different branches must not put records together
    auto rule = BlockingRule::disjunction(BlockingRule::exact("phone"), BlockingRule::exact("zip"));

    Record a{{"phone", "555"}};
    Record b{{"zip", "555"}};
    EXPECT_FALSE(sharesKey(*rule, a, b));
}

TEST(BlockingRule, ConjunctionOverDisjunctionExpandsKeys) {
    auto either = BlockingRule::disjunction(BlockingRule::exact("email"), BlockingRule::exact("phone"));
    auto rule = BlockingRule::conjunction(either, BlockingRule::exact("city"));

    Record r{{"email", "a@x.org"}, {"phone", "555"}, {"city", "Oslo"}};
    EXPECT_EQ(rule->keys(r).size(), 2u);

    Record samePhone{{"phone", "555"}, {"city", "Oslo"}};
    Record otherCity{{"phone", "555"}, {"city", "Bergen"}};
    EXPECT_TRUE(sharesKey(*rule, r, samePhone));
    EXPECT_FALSE(sharesKey(*rule, r, otherCity));
}

TEST(BlockingRule, PhoneticLeafGroupsSpellingVariants) {
    auto rule = BlockingRule::phonetic("name");
    EXPECT_TRUE(sharesKey(*rule, Record{{"name", "John Smith"}}, Record{{"name", "Jon Smyth"}}));
    EXPECT_FALSE(sharesKey(*rule, Record{{"name", "John Smith"}}, Record{{"name", "Mary Jones"}}));
}

TEST(BlockingRule, CombinationsExceptKToleratesOneMismatch) {
    auto rule = BlockingRule::combinationsExceptK(
        {BlockingRule::exact("first"), BlockingRule::exact("last"), BlockingRule::exact("zip")}, 1);

    Record a{{"first", "ann"}, {"last", "lee"}, {"zip", "0150"}};
    Record b{{"first", "ann"}, {"last", "lee"}, {"zip", "9999"}};
    Record c{{"first", "ann"}, {"last", "kim"}, {"zip", "9999"}};

    EXPECT_TRUE(sharesKey(*rule, a, b));
    EXPECT_FALSE(sharesKey(*rule, a, c));

    auto attrs = rule->attributes();
    EXPECT_EQ(attrs, (std::vector<std::string>{"first", "last", "zip"}));
}

TEST(BlockingRule, KeysAreDeduplicated) {
    auto rule = BlockingRule::disjunction(
        BlockingRule::conjunction(BlockingRule::exact("a"), BlockingRule::exact("b")),
        BlockingRule::conjunction(BlockingRule::exact("a"), BlockingRule::exact("b")));
    Record r{{"a", "1"}, {"b", "2"}};

    // One key per branch
    EXPECT_EQ(rule->keys(r).size(), 2u);
}

TEST(BlockingRule, ToStringShowsStructure) {
    auto rule = BlockingRule::conjunction(BlockingRule::exact("a"), BlockingRule::phonetic("b"));
    EXPECT_EQ(rule->toString(), "(exact(a) & phonetic(b,4))");

    auto either = BlockingRule::disjunction(BlockingRule::consonant("a"), BlockingRule::phone("p"));
    EXPECT_EQ(either->toString(), "(consonant(a) | phone(p,10))");
}

TEST(BlockingRule, InvalidConstructionThrows) {
    EXPECT_THROW(BlockingRule::exact(""), ConfigurationError);
    EXPECT_THROW(BlockingRule::phonetic("name", 0), ConfigurationError);
    EXPECT_THROW(BlockingRule::firstNChars("name", -1), ConfigurationError);
    EXPECT_THROW(BlockingRule::conjunction(nullptr, BlockingRule::exact("a")), ConfigurationError);
    EXPECT_THROW(BlockingRule::disjunction(BlockingRule::exact("a"), nullptr), ConfigurationError);
    EXPECT_THROW(BlockingRule::allOf({}), ConfigurationError);
    EXPECT_THROW(BlockingRule::anyOf({}), ConfigurationError);
    EXPECT_THROW(BlockingRule::combinationsExceptK({BlockingRule::exact("a"), BlockingRule::exact("b")}, 2),
                 ConfigurationError);
}

TEST(BlockingRule, OnlyNamedConstructorsBuildRules) {
    static_assert(!std::is_constructible<BlockingRule, BlockingRule::Node>::value,
                  "rules are built through the named constructors");
    static_assert(!std::is_default_constructible<BlockingRule>::value, "rules always carry a node");

    auto rule = BlockingRule::exact("name");
    EXPECT_EQ(rule.use_count(), 1);
    EXPECT_TRUE(rule->isLeaf());
}

TEST(BlockingRule, DateAndIntegerLeavesTakeNoParameter) {
    auto born = BlockingRule::year("dob");
    EXPECT_EQ(born->toString(), "year(dob)");
    EXPECT_TRUE(sharesKey(*born, Record{{"dob", "1987-03-14"}}, Record{{"dob", "03/30/1987"}}));
    EXPECT_FALSE(sharesKey(*born, Record{{"dob", "1987-03-14"}}, Record{{"dob", "1988-03-14"}}));
    EXPECT_TRUE(born->keys(Record{{"dob", "unknown"}}).empty());

    auto age = BlockingRule::roundInteger("age");
    EXPECT_EQ(age->toString(), "round_integer(age)");
    EXPECT_TRUE(sharesKey(*age, Record{{"age", 41.6}}, Record{{"age", "42"}}));
}

TEST(BlockingRule, SortedIntegersMatchAdjacentValues) {
    auto rule = BlockingRule::leaf("age", KeyEncoding::SORTED_INTEGERS, 1);
    EXPECT_EQ(rule->toString(), "sorted_integers(age,1)");
    EXPECT_TRUE(sharesKey(*rule, Record{{"age", 25}}, Record{{"age", 25.9}}));
    EXPECT_FALSE(sharesKey(*rule, Record{{"age", 25}}, Record{{"age", 26}}));
}

TEST(BlockingRule, GeohashLeafGroupsNearbyPoints) {
    auto rule = BlockingRule::geohash("location");
    EXPECT_EQ(rule->toString(), "geohash(location,5)");

    Record skagen{{"location.lat", 57.64911}, {"location.lon", 10.40744}};
    Record nearby{{"location.0", 10.4075}, {"location.1", 57.6490}};
    Record madrid{{"location.lat", 40.4168}, {"location.lon", -3.7038}};

    auto keys = rule->keys(skagen);
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0].toString(), "u4pru");
    EXPECT_TRUE(sharesKey(*rule, skagen, nearby));
    EXPECT_FALSE(sharesKey(*rule, skagen, madrid));
    EXPECT_TRUE(rule->keys(Record{{"location", "Skagen"}}).empty());
    EXPECT_EQ(rule->attributes(), std::vector<std::string>{"location"});
}

TEST(BlockingRule, GeohashPrecisionIsBounded) {
    EXPECT_NO_THROW(BlockingRule::geohash("location", 12));
    EXPECT_THROW(BlockingRule::geohash("location", 13), ConfigurationError);
    EXPECT_THROW(BlockingRule::geohash("location", 0), ConfigurationError);
}
