/**
 * @file StringSimilarity.cpp
 * @brief String similarity implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/matching/StringSimilarity.hpp"
#include "dedup/blocking/KeyEncoder.hpp"
#include <algorithm>
#include <vector>

namespace dedup {

namespace {

double normalizedBy(size_t distance, size_t length) {
    if (length == 0) {
        return 1.0;
    }
    return 1.0 - static_cast<double>(distance) / static_cast<double>(length);
}

}  // anonymous namespace

size_t StringSimilarity::levenshteinDistance(const std::string& a, const std::string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) {
        prev[j] = j;
    }

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

size_t StringSimilarity::osaDistance(const std::string& a, const std::string& b) {
    const size_t n = a.size();
    const size_t m = b.size();
    if (n == 0) return m;
    if (m == 0) return n;

    std::vector<std::vector<size_t>> d(n + 1, std::vector<size_t>(m + 1, 0));
    for (size_t i = 0; i <= n; ++i) d[i][0] = i;
    for (size_t j = 0; j <= m; ++j) d[0][j] = j;

    for (size_t i = 1; i <= n; ++i) {
        for (size_t j = 1; j <= m; ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            d[i][j] = std::min({d[i - 1][j] + 1, d[i][j - 1] + 1, d[i - 1][j - 1] + cost});
            if (i > 1 && j > 1 && a[i - 1] == b[j - 2] && a[i - 2] == b[j - 1]) {
                d[i][j] = std::min(d[i][j], d[i - 2][j - 2] + 1);
            }
        }
    }
    return d[n][m];
}

size_t StringSimilarity::lcsSeqLength(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0;

    std::vector<size_t> prev(b.size() + 1, 0);
    std::vector<size_t> curr(b.size() + 1, 0);
    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                curr[j] = prev[j - 1] + 1;
            } else {
                curr[j] = std::max(prev[j], curr[j - 1]);
            }
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

size_t StringSimilarity::indelDistance(const std::string& a, const std::string& b) {
    return a.size() + b.size() - 2 * lcsSeqLength(a, b);
}

size_t StringSimilarity::hammingDistance(const std::string& a, const std::string& b) {
    size_t common = std::min(a.size(), b.size());
    size_t distance = std::max(a.size(), b.size()) - common;
    for (size_t i = 0; i < common; ++i) {
        if (a[i] != b[i]) ++distance;
    }
    return distance;
}

size_t StringSimilarity::longestCommonSubstringLength(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0;

    std::vector<size_t> prev(b.size() + 1, 0);
    std::vector<size_t> curr(b.size() + 1, 0);
    size_t longest = 0;
    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                curr[j] = prev[j - 1] + 1;
                longest = std::max(longest, curr[j]);
            } else {
                curr[j] = 0;
            }
        }
        std::swap(prev, curr);
    }
    return longest;
}

double StringSimilarity::levenshtein(const std::string& a, const std::string& b) {
    return normalizedBy(levenshteinDistance(a, b), std::max(a.size(), b.size()));
}

double StringSimilarity::damerauLevenshtein(const std::string& a, const std::string& b) {
    return normalizedBy(osaDistance(a, b), std::max(a.size(), b.size()));
}

double StringSimilarity::indel(const std::string& a, const std::string& b) {
    return normalizedBy(indelDistance(a, b), a.size() + b.size());
}

double StringSimilarity::hamming(const std::string& a, const std::string& b) {
    return normalizedBy(hammingDistance(a, b), std::max(a.size(), b.size()));
}

double StringSimilarity::jaro(const std::string& a, const std::string& b) {
    if (a.empty() && b.empty()) return 1.0;
    if (a.empty() || b.empty()) return 0.0;

    const size_t longer = std::max(a.size(), b.size());
    const size_t window = longer / 2 > 0 ? longer / 2 - 1 : 0;

    std::vector<bool> aMatched(a.size(), false);
    std::vector<bool> bMatched(b.size(), false);
    size_t matches = 0;

    for (size_t i = 0; i < a.size(); ++i) {
        size_t lo = i > window ? i - window : 0;
        size_t hi = std::min(i + window + 1, b.size());
        for (size_t j = lo; j < hi; ++j) {
            if (!bMatched[j] && a[i] == b[j]) {
                aMatched[i] = true;
                bMatched[j] = true;
                ++matches;
                break;
            }
        }
    }

    if (matches == 0) return 0.0;

    // Half the number of matched characters out of order
    size_t outOfOrder = 0;
    size_t k = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!aMatched[i]) continue;
        while (!bMatched[k]) ++k;
        if (a[i] != b[k]) ++outOfOrder;
        ++k;
    }

    double m = static_cast<double>(matches);
    double t = static_cast<double>(outOfOrder) / 2.0;
    return (m / static_cast<double>(a.size()) +
            m / static_cast<double>(b.size()) +
            (m - t) / m) / 3.0;
}

double StringSimilarity::jaroWinkler(const std::string& a, const std::string& b, double prefixScale) {
    double j = jaro(a, b);

    size_t prefix = 0;
    size_t limit = std::min({a.size(), b.size(), static_cast<size_t>(4)});
    while (prefix < limit && a[prefix] == b[prefix]) {
        ++prefix;
    }
    return j + static_cast<double>(prefix) * prefixScale * (1.0 - j);
}

double StringSimilarity::lcsSeq(const std::string& a, const std::string& b) {
    size_t longer = std::max(a.size(), b.size());
    if (longer == 0) return 1.0;
    return static_cast<double>(lcsSeqLength(a, b)) / static_cast<double>(longer);
}

double StringSimilarity::longestCommonSubstring(const std::string& a, const std::string& b) {
    if (a == b) return 1.0;
    if (a.empty() || b.empty()) return 0.0;
    return static_cast<double>(longestCommonSubstringLength(a, b)) /
           static_cast<double>(std::max(a.size(), b.size()));
}

double StringSimilarity::overlapRatio(const std::string& a, const std::string& b) {
    const std::string& longer = a.size() >= b.size() ? a : b;
    const std::string& shorter = a.size() >= b.size() ? b : a;
    if (longer.empty()) return 1.0;
    if (longer.find(shorter) == std::string::npos) return 0.0;
    return static_cast<double>(shorter.size()) / static_cast<double>(longer.size());
}

double StringSimilarity::name(const std::string& a, const std::string& b) {
    std::string x = KeyEncoder::toLower(a);
    std::string y = KeyEncoder::toLower(b);
    return std::max({hamming(x, y),
                     damerauLevenshtein(x, y),
                     jaro(x, y),
                     indel(x, y),
                     jaroWinkler(x, y),
                     lcsSeq(x, y)});
}

} // namespace dedup
