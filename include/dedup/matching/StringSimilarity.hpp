/**
 * @file StringSimilarity.hpp
 * @brief Normalized string similarity functions
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_MATCHING_STRINGSIMILARITY_HPP
#define DEDUP_MATCHING_STRINGSIMILARITY_HPP

#include <cstddef>
#include <string>

namespace dedup {

/**
 * @brief String similarity metrics
 *
 * All similarities are in [0, 1], 1 meaning identical. Two empty strings
 * are identical; an empty and a non-empty string score 0. Strings are
 * compared byte-wise.
 */
class StringSimilarity {
public:
    // Edit distances
    static size_t levenshteinDistance(const std::string& a, const std::string& b);
    static size_t osaDistance(const std::string& a, const std::string& b);
    static size_t indelDistance(const std::string& a, const std::string& b);

    /**
     * @brief Positions that differ, plus the length difference
     */
    static size_t hammingDistance(const std::string& a, const std::string& b);

    // Longest common subsequence and substring lengths
    static size_t lcsSeqLength(const std::string& a, const std::string& b);
    static size_t longestCommonSubstringLength(const std::string& a, const std::string& b);

    /**
     * @brief 1 - levenshtein / max(len)
     */
    static double levenshtein(const std::string& a, const std::string& b);

    /**
     * @brief 1 - optimal string alignment distance / max(len)
     */
    static double damerauLevenshtein(const std::string& a, const std::string& b);

    /**
     * @brief 1 - indel distance / (len(a) + len(b))
     */
    static double indel(const std::string& a, const std::string& b);

    static double hamming(const std::string& a, const std::string& b);

    static double jaro(const std::string& a, const std::string& b);

    /**
     * @brief Jaro-Winkler with prefix scale 0.1 over at most 4 characters
     */
    static double jaroWinkler(const std::string& a, const std::string& b,
                              double prefixScale = 0.1);

    /**
     * @brief Longest common subsequence over the longer length
     */
    static double lcsSeq(const std::string& a, const std::string& b);

    /**
     * @brief Longest common substring over the longer length
     */
    static double longestCommonSubstring(const std::string& a, const std::string& b);

    /**
     * @brief len(shorter) / len(longer) when one contains the other, else 0
     */
    static double overlapRatio(const std::string& a, const std::string& b);

    /**
     * @brief Best of the string similarities on lower-cased input
     */
    static double name(const std::string& a, const std::string& b);

private:
    StringSimilarity() = delete;
};

} // namespace dedup

#endif // DEDUP_MATCHING_STRINGSIMILARITY_HPP
