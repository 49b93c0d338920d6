/**
 * @file Value.hpp
 * @brief Attribute value held by a record
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CORE_VALUE_HPP
#define DEDUP_CORE_VALUE_HPP

#include "Types.hpp"
#include <string>
#include <variant>

namespace dedup {

/**
 * @brief A single attribute value: null, boolean, number or string
 *
 * Values carry a total, type-stable ordering so that records can be sorted
 * on arbitrary attribute tuples: null < bool < number < string. Strings
 * compare case-insensitively first and fall back to a case-sensitive
 * comparison to break ties.
 */
class Value {
public:
    using Storage = std::variant<std::monostate, bool, double, std::string>;

    Value() : value_(std::monostate{}) {}
    Value(std::nullptr_t) : value_(std::monostate{}) {}
    Value(bool b) : value_(b) {}
    Value(double d) : value_(d) {}
    Value(int i) : value_(static_cast<double>(i)) {}
    Value(long i) : value_(static_cast<double>(i)) {}
    Value(long long i) : value_(static_cast<double>(i)) {}
    Value(const char* s) : value_(std::string(s)) {}
    Value(std::string s) : value_(std::move(s)) {}

    bool isNull() const { return std::holds_alternative<std::monostate>(value_); }
    bool isBool() const { return std::holds_alternative<bool>(value_); }
    bool isNumber() const { return std::holds_alternative<double>(value_); }
    bool isString() const { return std::holds_alternative<std::string>(value_); }

    bool getBool() const { return std::get<bool>(value_); }
    double getNumber() const { return std::get<double>(value_); }
    const std::string& getString() const { return std::get<std::string>(value_); }

    const Storage& storage() const { return value_; }

    /**
     * @brief Canonical text of the value
     *
     * Integral numbers print without a fractional part ("555"), other
     * numbers with up to 15 significant digits. Null prints as "".
     */
    std::string toString() const;

    /**
     * @brief Three-way comparison under the type-stable ordering
     * @return negative, zero or positive
     */
    static int compare(const Value& a, const Value& b);

    bool operator==(const Value& other) const { return value_ == other.value_; }
    bool operator!=(const Value& other) const { return !(*this == other); }
    bool operator<(const Value& other) const { return compare(*this, other) < 0; }

private:
    Storage value_;
};

} // namespace dedup

#endif // DEDUP_CORE_VALUE_HPP
