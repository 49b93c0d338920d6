/**
 * @file ComparatorFactory.cpp
 * @brief Comparator factory implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/matching/ComparatorFactory.hpp"
#include "dedup/matching/StringSimilarity.hpp"
#include "dedup/core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace dedup {

namespace {

using StringMetric = double (*)(const std::string&, const std::string&);

Comparator onText(StringMetric metric) {
    return [metric](const Value& a, const Value& b) {
        return metric(a.toString(), b.toString());
    };
}

double asNumber(const Value& value) {
    if (value.isNumber()) {
        return value.getNumber();
    }
    if (value.isBool()) {
        return value.getBool() ? 1.0 : 0.0;
    }
    const std::string text = value.toString();
    size_t consumed = 0;
    double parsed = std::stod(text, &consumed);  // Throws std::invalid_argument
    if (consumed != text.size()) {
        throw std::invalid_argument("Not a number: " + text);
    }
    return parsed;
}

double exactSimilarity(const Value& a, const Value& b) {
    return a == b ? 1.0 : 0.0;
}

double numericSimilarity(const Value& a, const Value& b) {
    double x = asNumber(a);
    double y = asNumber(b);
    double scale = std::max(std::fabs(x), std::fabs(y));
    if (scale == 0.0) {
        return 1.0;
    }
    return std::max(0.0, 1.0 - std::fabs(x - y) / scale);
}

double jaroWinkler(const std::string& a, const std::string& b) {
    return StringSimilarity::jaroWinkler(a, b);
}

}  // anonymous namespace

Comparator ComparatorFactory::create(const std::string& comparatorName) {
    if (comparatorName == "exact") return exactSimilarity;
    if (comparatorName == "numeric") return numericSimilarity;
    if (comparatorName == "levenshtein") return onText(&StringSimilarity::levenshtein);
    if (comparatorName == "damerau_levenshtein") return onText(&StringSimilarity::damerauLevenshtein);
    if (comparatorName == "jaro") return onText(&StringSimilarity::jaro);
    if (comparatorName == "jaro_winkler") return onText(&jaroWinkler);
    if (comparatorName == "lcs") return onText(&StringSimilarity::longestCommonSubstring);
    if (comparatorName == "overlap") return onText(&StringSimilarity::overlapRatio);
    if (comparatorName == "name") return onText(&StringSimilarity::name);

    throw ConfigurationError("Unknown comparator: " + comparatorName);
}

ComparatorEntry ComparatorFactory::makeEntry(const std::string& attribute,
                                             const std::string& comparatorName,
                                             double weight) {
    ComparatorEntry entry(attribute, create(comparatorName), weight);
    entry.name = comparatorName;
    return entry;
}

bool ComparatorFactory::isValidComparator(const std::string& comparatorName) {
    auto names = getAvailableComparators();
    return std::find(names.begin(), names.end(), comparatorName) != names.end();
}

std::vector<std::string> ComparatorFactory::getAvailableComparators() {
    return {"exact", "levenshtein", "damerau_levenshtein", "jaro", "jaro_winkler",
            "lcs", "overlap", "name", "numeric"};
}

} // namespace dedup
