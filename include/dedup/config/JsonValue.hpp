/**
 * @file JsonValue.hpp
 * @brief Minimal JSON document model and parser
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CONFIG_JSONVALUE_HPP
#define DEDUP_CONFIG_JSONVALUE_HPP

#include <map>
#include <type_traits>
#include <string>
#include <variant>
#include <vector>

namespace dedup {

/**
 * @brief Parsed JSON node
 *
 * Read-only once built. Looking up a missing key, or any key on a
 * non-object, yields a shared null node, so lookups chain without checks:
 * root["clust_kwargs"]["eps"].getOr(0.5).
 */
class JsonValue {
public:
    using Object = std::map<std::string, JsonValue>;
    using Array = std::vector<JsonValue>;

    JsonValue() = default;
    JsonValue(bool b) : storage_(b) {}
    JsonValue(double d) : storage_(d) {}
    JsonValue(std::string s) : storage_(std::move(s)) {}
    JsonValue(Array a) : storage_(std::move(a)) {}
    JsonValue(Object o) : storage_(std::move(o)) {}

    bool isNull() const { return std::holds_alternative<std::monostate>(storage_); }
    bool isBool() const { return std::holds_alternative<bool>(storage_); }
    bool isNumber() const { return std::holds_alternative<double>(storage_); }
    bool isString() const { return std::holds_alternative<std::string>(storage_); }
    bool isArray() const { return std::holds_alternative<Array>(storage_); }
    bool isObject() const { return std::holds_alternative<Object>(storage_); }

    bool getBool() const { return std::get<bool>(storage_); }
    double getNumber() const { return std::get<double>(storage_); }
    const std::string& getString() const { return std::get<std::string>(storage_); }
    const Array& getArray() const { return std::get<Array>(storage_); }
    const Object& getObject() const { return std::get<Object>(storage_); }

    /**
     * @brief The held bool, double or std::string, or def when the node holds
     *        something else (including null)
     */
    template <typename T>
    T getOr(T def) const {
        static_assert(std::is_same<T, bool>::value || std::is_same<T, double>::value ||
                          std::is_same<T, std::string>::value,
                      "getOr reads bool, double or std::string");
        const T* held = std::get_if<T>(&storage_);
        return held != nullptr ? *held : def;
    }

    bool has(const std::string& key) const {
        return isObject() && getObject().count(key) > 0;
    }

    const JsonValue& operator[](const std::string& key) const;

    /**
     * @brief "null", "bool", "number", "string", "array" or "object"
     */
    const char* typeName() const;

private:
    std::variant<std::monostate, bool, double, std::string, Array, Object> storage_;
};

/**
 * @brief Parse one JSON document
 * @throws std::runtime_error on parse error or trailing content
 */
JsonValue parseJson(const std::string& json);

/**
 * @brief Parse a sequence of whitespace-separated JSON documents (NDJSON)
 * @throws std::runtime_error on parse error
 */
std::vector<JsonValue> parseJsonSequence(const std::string& json);

} // namespace dedup

#endif // DEDUP_CONFIG_JSONVALUE_HPP
