/**
 * @file Block.hpp
 * @brief Candidate block of records
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CORE_BLOCK_HPP
#define DEDUP_CORE_BLOCK_HPP

#include "Types.hpp"
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Records sharing blocking membership
 *
 * Only records inside the same block are ever compared. Members are kept in
 * ascending id order for initial blocks; sub-blocks produced by a splitter
 * keep the splitter's order.
 */
struct Block {
    // Block identifier, unique within one run
    size_t id = 0;

    // Identifier of the block this one was split from (same as id if not split)
    size_t parentId = 0;

    // Printable form of the blocking key, for logs
    std::string label;

    // Member record identifiers
    std::vector<RecordId> members;

    size_t size() const { return members.size(); }
    bool empty() const { return members.empty(); }

    /**
     * @brief Number of unordered pairs in the block
     */
    size_t pairCount() const {
        size_t n = members.size();
        return n < 2 ? 0 : n * (n - 1) / 2;
    }
};

using BlockList = std::vector<Block>;

} // namespace dedup

#endif // DEDUP_CORE_BLOCK_HPP
