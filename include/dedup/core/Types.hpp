/**
 * @file Types.hpp
 * @brief Core type definitions for Dedup
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CORE_TYPES_HPP
#define DEDUP_CORE_TYPES_HPP

#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace dedup {

// Forward declarations
class Value;
class Record;
struct Block;
struct Diagnostic;
struct DeduplicatorConfig;

// Type aliases for clarity
using RecordId = std::size_t;
using ClusterLabel = int;
using Similarity = double;

// Constants
constexpr ClusterLabel NOISE_LABEL = -1;

// Distance assigned to pairs that were never compared or were suppressed.
// No finite eps can reach it.
constexpr double UNREACHABLE_DISTANCE = std::numeric_limits<double>::infinity();

// Aggregation strategy enumeration
enum class AggregationStrategy {
    MEAN,
    MEDIAN,
    MIN,
    MAX,
    WEIGHTED_MEAN
};

// Clustering algorithm enumeration
enum class ClusteringAlgorithm {
    DBSCAN,
    CONNECTED_COMPONENTS
};

// Block splitter enumeration
enum class SplitterKind {
    IDENTITY,
    SORTED_NEIGHBOURHOOD
};

// Blocking key encodings for leaf rules
enum class KeyEncoding {
    EXACT,          // Canonical text of the value
    PHONETIC,       // Soundex per token
    CONSONANT,      // Vowels stripped after first letter
    FIRST_N_CHARS,  // Prefix of each token
    LAST_N_CHARS,   // Suffix of each token
    FIRST_N_WORDS,  // Leading tokens
    ABBREVIATION,   // Initials of tokens
    PHONE,          // Digits, zero padded
    YEAR,           // Year of a parsed date
    MONTH,          // Month of a parsed date
    DAY,            // Day of month of a parsed date
    ROUND_INTEGER,  // Number rounded half to even
    SORTED_INTEGERS, // Sorted neighbourhood tokens of a number
    GEOHASH         // Geohash cell of a latitude/longitude pair
};

// Pipeline stage that produced a diagnostic
enum class Stage {
    VALIDATION,
    BLOCKING,
    SCORING,
    CLUSTERING,
    MERGE
};

// Helper functions for enum conversions
inline std::string aggregationStrategyToString(AggregationStrategy strategy) {
    switch (strategy) {
        case AggregationStrategy::MEAN: return "mean";
        case AggregationStrategy::MEDIAN: return "median";
        case AggregationStrategy::MIN: return "min";
        case AggregationStrategy::MAX: return "max";
        case AggregationStrategy::WEIGHTED_MEAN: return "weighted_mean";
        default: return "mean";
    }
}

/**
 * @brief Parse an aggregation strategy name
 * @throws ConfigurationError on unknown names
 */
inline AggregationStrategy stringToAggregationStrategy(const std::string& str) {
    if (str == "mean") return AggregationStrategy::MEAN;
    if (str == "median") return AggregationStrategy::MEDIAN;
    if (str == "min") return AggregationStrategy::MIN;
    if (str == "max") return AggregationStrategy::MAX;
    if (str == "weighted_mean" || str == "weighted") return AggregationStrategy::WEIGHTED_MEAN;
    throw ConfigurationError("Unknown aggregation strategy: " + str);
}

inline std::string clusteringAlgorithmToString(ClusteringAlgorithm algo) {
    switch (algo) {
        case ClusteringAlgorithm::DBSCAN: return "DBSCAN";
        case ClusteringAlgorithm::CONNECTED_COMPONENTS: return "CONNECTED_COMPONENTS";
        default: return "DBSCAN";
    }
}

/**
 * @brief Parse a clustering algorithm name (case-insensitive)
 * @throws ConfigurationError on unknown names
 */
inline ClusteringAlgorithm stringToClusteringAlgorithm(const std::string& str) {
    std::string name = str;
    std::transform(name.begin(), name.end(), name.begin(), ::toupper);
    if (name == "DBSCAN") return ClusteringAlgorithm::DBSCAN;
    if (name == "CONNECTED_COMPONENTS" || name == "COMPONENTS") {
        return ClusteringAlgorithm::CONNECTED_COMPONENTS;
    }
    throw ConfigurationError("Unknown clustering algorithm: " + str);
}

inline std::string splitterKindToString(SplitterKind kind) {
    switch (kind) {
        case SplitterKind::IDENTITY: return "identity";
        case SplitterKind::SORTED_NEIGHBOURHOOD: return "sorted_neighbourhood";
        default: return "identity";
    }
}

/**
 * @throws ConfigurationError on unknown names
 */
inline SplitterKind stringToSplitterKind(const std::string& str) {
    if (str == "identity" || str.empty()) return SplitterKind::IDENTITY;
    if (str == "sorted_neighbourhood" || str == "sorted_neighborhood") {
        return SplitterKind::SORTED_NEIGHBOURHOOD;
    }
    throw ConfigurationError("Unknown block splitter: " + str);
}

inline std::string keyEncodingToString(KeyEncoding encoding) {
    switch (encoding) {
        case KeyEncoding::EXACT: return "exact";
        case KeyEncoding::PHONETIC: return "phonetic";
        case KeyEncoding::CONSONANT: return "consonant";
        case KeyEncoding::FIRST_N_CHARS: return "first_n_chars";
        case KeyEncoding::LAST_N_CHARS: return "last_n_chars";
        case KeyEncoding::FIRST_N_WORDS: return "first_n_words";
        case KeyEncoding::ABBREVIATION: return "abbreviation";
        case KeyEncoding::PHONE: return "phone";
        case KeyEncoding::YEAR: return "year";
        case KeyEncoding::MONTH: return "month";
        case KeyEncoding::DAY: return "day";
        case KeyEncoding::ROUND_INTEGER: return "round_integer";
        case KeyEncoding::SORTED_INTEGERS: return "sorted_integers";
        case KeyEncoding::GEOHASH: return "geohash";
        default: return "exact";
    }
}

/**
 * @brief Parse a key encoding name (exact, phonetic, first_n_chars, ...)
 * @throws ConfigurationError on unknown names
 */
inline KeyEncoding stringToKeyEncoding(const std::string& str) {
    if (str == "exact") return KeyEncoding::EXACT;
    if (str == "phonetic") return KeyEncoding::PHONETIC;
    if (str == "consonant") return KeyEncoding::CONSONANT;
    if (str == "first_n_chars") return KeyEncoding::FIRST_N_CHARS;
    if (str == "last_n_chars") return KeyEncoding::LAST_N_CHARS;
    if (str == "first_n_words") return KeyEncoding::FIRST_N_WORDS;
    if (str == "abbreviation") return KeyEncoding::ABBREVIATION;
    if (str == "phone") return KeyEncoding::PHONE;
    if (str == "year") return KeyEncoding::YEAR;
    if (str == "month") return KeyEncoding::MONTH;
    if (str == "day") return KeyEncoding::DAY;
    if (str == "round_integer") return KeyEncoding::ROUND_INTEGER;
    if (str == "sorted_integers") return KeyEncoding::SORTED_INTEGERS;
    if (str == "geohash") return KeyEncoding::GEOHASH;
    throw ConfigurationError("Unknown blocking key encoding: " + str);
}

/**
 * @brief Default parameter for an encoding (characters, words or letters)
 */
inline int defaultEncodingParameter(KeyEncoding encoding) {
    switch (encoding) {
        case KeyEncoding::PHONETIC: return 4;
        case KeyEncoding::FIRST_N_CHARS: return 3;
        case KeyEncoding::LAST_N_CHARS: return 3;
        case KeyEncoding::FIRST_N_WORDS: return 1;
        case KeyEncoding::ABBREVIATION: return 3;
        case KeyEncoding::PHONE: return 10;
        case KeyEncoding::SORTED_INTEGERS: return 3;
        case KeyEncoding::GEOHASH: return 5;
        default: return 0;
    }
}

inline std::string stageToString(Stage stage) {
    switch (stage) {
        case Stage::VALIDATION: return "validation";
        case Stage::BLOCKING: return "blocking";
        case Stage::SCORING: return "scoring";
        case Stage::CLUSTERING: return "clustering";
        case Stage::MERGE: return "merge";
        default: return "unknown";
    }
}

} // namespace dedup

#endif // DEDUP_CORE_TYPES_HPP
