/**
 * @file SortedNeighbourhoodSplitter.cpp
 * @brief Sorted neighbourhood splitter implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/blocking/SortedNeighbourhoodSplitter.hpp"
#include "dedup/core/Errors.hpp"
#include <algorithm>

namespace dedup {

namespace {

const Value NULL_VALUE;

const Value& fieldOf(const Record& record, const std::string& field) {
    const Value* v = record.get(field);
    return v != nullptr ? *v : NULL_VALUE;
}

}  // anonymous namespace

SortedNeighbourhoodSplitter::SortedNeighbourhoodSplitter(std::vector<std::string> fields,
                                                         size_t maxBlockSize,
                                                         size_t overlap)
    : fields_(std::move(fields))
    , maxBlockSize_(maxBlockSize)
    , overlap_(overlap) {

    if (fields_.empty()) {
        throw ConfigurationError("Sorted neighbourhood splitter needs at least one field");
    }
    for (const auto& field : fields_) {
        if (field.empty()) {
            throw ConfigurationError("Sorted neighbourhood field must not be empty");
        }
    }
    if (maxBlockSize_ < 1) {
        throw ConfigurationError("Sorted neighbourhood max_block_size must be at least 1");
    }
    if (overlap_ >= maxBlockSize_) {
        throw ConfigurationError("Sorted neighbourhood overlap must be smaller than max_block_size");
    }
}

std::unique_ptr<IBlockSplitter> SortedNeighbourhoodSplitter::clone() const {
    return std::make_unique<SortedNeighbourhoodSplitter>(*this);
}

std::vector<Block> SortedNeighbourhoodSplitter::split(const Block& block,
                                                      const RecordList& records) const {
    const size_t n = block.size();
    if (n <= maxBlockSize_) {
        return {block};
    }

    std::vector<RecordId> order = block.members;
    std::sort(order.begin(), order.end(), [&](RecordId lhs, RecordId rhs) {
        const Record& a = records[lhs];
        const Record& b = records[rhs];
        for (const auto& field : fields_) {
            int c = Value::compare(fieldOf(a, field), fieldOf(b, field));
            if (c != 0) {
                return c < 0;
            }
        }
        return lhs < rhs;
    });

    std::vector<Block> windows;
    const size_t step = maxBlockSize_ - overlap_;

    for (size_t start = 0; start < n; start += step) {
        size_t end = std::min(start + maxBlockSize_, n);

        Block sub;
        sub.parentId = block.id;
        sub.label = block.label + "/w" + std::to_string(windows.size());
        sub.members.assign(order.begin() + static_cast<std::ptrdiff_t>(start),
                           order.begin() + static_cast<std::ptrdiff_t>(end));
        windows.push_back(std::move(sub));

        if (end == n) {
            break;
        }
    }
    return windows;
}

} // namespace dedup
