#include <gtest/gtest.h>
#include "dedup/blocking/KeyEncoder.hpp"

#include <string>
#include <vector>

using namespace dedup;

TEST(KeyEncoder, SoundexClassicCodes) {
    EXPECT_EQ(KeyEncoder::soundex("Robert"), "R163");
    EXPECT_EQ(KeyEncoder::soundex("Rupert"), "R163");
    EXPECT_EQ(KeyEncoder::soundex("Ashcraft"), "A261");
    EXPECT_EQ(KeyEncoder::soundex("Tymczak"), "T522");
    EXPECT_EQ(KeyEncoder::soundex("Pfister"), "P236");
    EXPECT_EQ(KeyEncoder::soundex("Lee"), "L000");
}

TEST(KeyEncoder, SoundexIgnoresNonLetters) {
    EXPECT_EQ(KeyEncoder::soundex("O'Brien"), KeyEncoder::soundex("OBrien"));
    EXPECT_EQ(KeyEncoder::soundex("1234"), "");
    EXPECT_EQ(KeyEncoder::soundex(""), "");
}

TEST(KeyEncoder, PhoneticToleratesSpellingVariants) {
    std::string a = KeyEncoder::encode(KeyEncoding::PHONETIC, Value("John Smith"), 4);
    std::string b = KeyEncoder::encode(KeyEncoding::PHONETIC, Value("Jon Smyth"), 4);
    EXPECT_EQ(a, "J5S5");
    EXPECT_EQ(a, b);
}

TEST(KeyEncoder, PhoneticIgnoresTokenOrder) {
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::PHONETIC, Value("Smith John"), 4),
              KeyEncoder::encode(KeyEncoding::PHONETIC, Value("John Smith"), 4));
}

TEST(KeyEncoder, PhoneticTruncatesToLength) {
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::PHONETIC, Value("John Smith"), 2), "J5");
}

TEST(KeyEncoder, ConsonantsKeepFirstLetter) {
    EXPECT_EQ(KeyEncoder::consonants("Robert"), "RBRT");
    EXPECT_EQ(KeyEncoder::consonants("Alice"), "ALC");
    EXPECT_EQ(KeyEncoder::consonants(""), "");
}

TEST(KeyEncoder, FirstAndLastCharacters) {
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::FIRST_N_CHARS, Value("John Smith"), 3), "johsmi");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::LAST_N_CHARS, Value("John Smith"), 2), "hnth");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::LAST_N_CHARS, Value("Al"), 3), "al");
}

TEST(KeyEncoder, FirstWordsAndAbbreviation) {
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::FIRST_N_WORDS, Value("John  Smith"), 1), "john");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::FIRST_N_WORDS, Value("John Smith"), 5), "johnsmith");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::ABBREVIATION, Value("John Quincy Adams"), 3), "ajq");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::ABBREVIATION, Value("John Quincy Adams"), 2), "aj");
}

TEST(KeyEncoder, PhoneNormalizesDigits) {
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::PHONE, Value("(555) 123-4567"), 10), "5551234567");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::PHONE, Value("555-1234"), 10), "0005551234");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::PHONE, Value("no digits"), 10), "");
}

TEST(KeyEncoder, ExactUsesCanonicalText) {
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::EXACT, Value(555), 0), "555");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::EXACT, Value("555"), 0), "555");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::EXACT, Value("Main St"), 0), "Main St");
}

TEST(KeyEncoder, TokenizeSplitsOnWhitespace) {
    auto tokens = KeyEncoder::tokenize("  a\tb  c\n");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "a");
    EXPECT_EQ(tokens[1], "b");
    EXPECT_EQ(tokens[2], "c");
}

TEST(KeyEncoder, DatePartsAcrossFormats) {
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::YEAR, Value("1987-03-14"), 0), "1987");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::MONTH, Value("1987-03-14"), 0), "3");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::DAY, Value("1987-03-14T08:30:00"), 0), "14");

    // Slashes are month first, dots and dashes day first
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::MONTH, Value("03/14/1987"), 0), "3");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::MONTH, Value("14.03.1987"), 0), "3");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::DAY, Value("14-03-1987"), 0), "14");

    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::YEAR, Value(19870314), 0), "1987");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::DAY, Value(" 19870314 "), 0), "14");
}

TEST(KeyEncoder, InvalidDatesGiveNoKey) {
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::YEAR, Value("not a date"), 0), "");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::YEAR, Value("1987-13-01"), 0), "");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::DAY, Value("2023-02-29"), 0), "");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::DAY, Value("2024-02-29"), 0), "29");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::MONTH, Value("1987-03/14"), 0), "");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::MONTH, Value("87-03-14"), 0), "");
    EXPECT_FALSE(KeyEncoder::parseDate("").has_value());
}

TEST(KeyEncoder, RoundIntegerRoundsHalfToEven) {
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::ROUND_INTEGER, Value(2.5), 0), "2");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::ROUND_INTEGER, Value(3.5), 0), "4");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::ROUND_INTEGER, Value("41.6"), 0), "42");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::ROUND_INTEGER, Value(-0.4), 0), "0");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::ROUND_INTEGER, Value("forty"), 0), "");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::ROUND_INTEGER, Value(true), 0), "");
}

TEST(KeyEncoder, SortedIntegersLetNeighboursMeet) {
    EXPECT_EQ(KeyEncoder::integerNeighbourhood(25.0), (std::vector<std::string>{"49", "50", "51"}));
    EXPECT_EQ(KeyEncoder::integerNeighbourhood(5.7), (std::vector<std::string>{"10", "11", "9"}));

    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::SORTED_INTEGERS, Value(25), 3), "49 50 51");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::SORTED_INTEGERS, Value(25), 1), "49");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::SORTED_INTEGERS, Value("x"), 3), "");
}

TEST(KeyEncoder, GeohashKnownCells) {
    EXPECT_EQ(KeyEncoder::geohash(57.64911, 10.40744, 11), "u4pruydqqvj");
    EXPECT_EQ(KeyEncoder::geohash(57.64911, 10.40744, 5), "u4pru");
    EXPECT_EQ(KeyEncoder::geohash(42.6, -5.6, 5), "ezs42");
    EXPECT_EQ(KeyEncoder::geohash(91.0, 0.0, 5), "");
    EXPECT_EQ(KeyEncoder::geohash(0.0, -181.0, 5), "");
}

TEST(KeyEncoder, GeoReadsNamedOrPairedCoordinates) {
    Record named{{"location.lat", 57.64911}, {"location.lon", 10.40744}};
    Record paired{{"location.0", 10.40744}, {"location.1", 57.64911}};
    Record textual{{"location.lat", "57.64911"}, {"location.lon", "10.40744"}};
    Record partial{{"location.lat", 57.64911}};

    EXPECT_EQ(KeyEncoder::encodeGeo(named, "location", 5), "u4pru");
    EXPECT_EQ(KeyEncoder::encodeGeo(paired, "location", 5), "u4pru");
    EXPECT_EQ(KeyEncoder::encodeGeo(textual, "location", 5), "u4pru");
    EXPECT_EQ(KeyEncoder::encodeGeo(partial, "location", 5), "");
    EXPECT_EQ(KeyEncoder::encode(KeyEncoding::GEOHASH, Value(57.6), 5), "");
}

TEST(KeyEncoder, NewEncodingNamesRoundTrip) {
    for (const char* name : {"year", "month", "day", "round_integer", "sorted_integers", "geohash"}) {
        EXPECT_EQ(keyEncodingToString(stringToKeyEncoding(name)), name);
    }
    EXPECT_EQ(defaultEncodingParameter(KeyEncoding::GEOHASH), 5);
    EXPECT_EQ(defaultEncodingParameter(KeyEncoding::SORTED_INTEGERS), 3);
}
