/**
 * @file BlockKey.hpp
 * @brief Hashable grouping key produced by blocking rules
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_BLOCKING_BLOCKKEY_HPP
#define DEDUP_BLOCKING_BLOCKKEY_HPP

#include <functional>
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Opaque block key
 *
 * Three shapes exist: an atom (the encoded text of one attribute), a tuple
 * of keys (AND composition) and a key tagged with the OR branch that
 * produced it. The canonical form is length-prefixed, so distinct shapes can
 * never collide.
 */
class BlockKey {
public:
    BlockKey() = default;

    static BlockKey atom(const std::string& text) {
        BlockKey key;
        key.canonical_ = "A" + std::to_string(text.size()) + ":" + text;
        key.display_ = text;
        return key;
    }

    static BlockKey tuple(const std::vector<BlockKey>& parts) {
        BlockKey key;
        key.canonical_ = "T" + std::to_string(parts.size()) + "(";
        key.display_ = "(";
        for (size_t i = 0; i < parts.size(); ++i) {
            key.canonical_ += std::to_string(parts[i].canonical_.size()) + ":" + parts[i].canonical_;
            if (i > 0) key.display_ += ", ";
            key.display_ += parts[i].display_;
        }
        key.canonical_ += ")";
        key.display_ += ")";
        return key;
    }

    static BlockKey tagged(size_t branch, const BlockKey& inner) {
        BlockKey key;
        key.canonical_ = "O" + std::to_string(branch) + "|" + inner.canonical_;
        key.display_ = "#" + std::to_string(branch) + " " + inner.display_;
        return key;
    }

    const std::string& canonical() const { return canonical_; }

    /**
     * @brief Human-readable form, e.g. "(J5, 555)"
     */
    const std::string& toString() const { return display_; }

    bool operator==(const BlockKey& other) const { return canonical_ == other.canonical_; }
    bool operator!=(const BlockKey& other) const { return canonical_ != other.canonical_; }
    bool operator<(const BlockKey& other) const { return canonical_ < other.canonical_; }

private:
    std::string canonical_;
    std::string display_;
};

struct BlockKeyHash {
    size_t operator()(const BlockKey& key) const {
        return std::hash<std::string>()(key.canonical());
    }
};

} // namespace dedup

#endif // DEDUP_BLOCKING_BLOCKKEY_HPP
