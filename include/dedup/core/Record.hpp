/**
 * @file Record.hpp
 * @brief Record structure for entity resolution input
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CORE_RECORD_HPP
#define DEDUP_CORE_RECORD_HPP

#include "Types.hpp"
#include "Value.hpp"
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace dedup {

/**
 * @brief A structured input record
 *
 * Attributes are addressed by dot-path ("address.city"); nested input is
 * flattened into dot-paths on ingestion. The identifier is the index of the
 * record in the input sequence and is assigned by the Deduplicator.
 */
class Record {
public:
    using AttributeMap = std::map<std::string, Value>;

    Record() = default;

    Record(std::initializer_list<std::pair<const std::string, Value>> attributes)
        : attributes_(attributes) {}

    explicit Record(AttributeMap attributes)
        : attributes_(std::move(attributes)) {}

    RecordId getId() const { return id_; }
    void setId(RecordId id) { id_ = id; }

    /**
     * @brief Set (or replace) an attribute
     */
    void set(const std::string& path, Value value) {
        attributes_[path] = std::move(value);
    }

    /**
     * @brief Look up an attribute by dot-path
     *
     * @return Pointer to the value, or nullptr when the attribute is missing
     *         or null
     */
    const Value* get(const std::string& path) const {
        auto it = attributes_.find(path);
        if (it == attributes_.end() || it->second.isNull()) {
            return nullptr;
        }
        return &it->second;
    }

    /**
     * @brief True when the attribute exists and is not null
     */
    bool has(const std::string& path) const { return get(path) != nullptr; }

    const AttributeMap& attributes() const { return attributes_; }

    size_t size() const { return attributes_.size(); }
    bool empty() const { return attributes_.empty(); }

    bool operator==(const Record& other) const {
        return id_ == other.id_ && attributes_ == other.attributes_;
    }

private:
    RecordId id_ = 0;
    AttributeMap attributes_;
};

using RecordList = std::vector<Record>;

} // namespace dedup

#endif // DEDUP_CORE_RECORD_HPP
