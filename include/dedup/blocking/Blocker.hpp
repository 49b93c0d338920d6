/**
 * @file Blocker.hpp
 * @brief Groups records into initial blocks by blocking key
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_BLOCKING_BLOCKER_HPP
#define DEDUP_BLOCKING_BLOCKER_HPP

#include "BlockingRule.hpp"
#include "../core/Block.hpp"
#include "../core/Record.hpp"

namespace dedup {

/**
 * @brief Builds the initial blocks of a run
 *
 * Blocks are created in order of first appearance while scanning records by
 * ascending id, and members are ascending by id. A record without any key
 * becomes a singleton block, so no record is ever dropped. Without a rule
 * every record goes into a single block (cartesian blocking).
 */
class Blocker {
public:
    /**
     * @brief Construct blocker
     * @param rule Blocking rule, or nullptr for cartesian blocking
     */
    explicit Blocker(BlockingRulePtr rule = nullptr);

    /**
     * @brief Partition records into blocks
     *
     * Records must carry ids equal to their position in the list.
     */
    BlockList build(const RecordList& records);

    /**
     * @brief Number of records that produced no key in the last call
     */
    size_t getUnmatchedCount() const { return unmatched_; }

    bool isCartesian() const { return !rule_; }
    const BlockingRulePtr& getRule() const { return rule_; }

private:
    BlockingRulePtr rule_;
    size_t unmatched_ = 0;
};

} // namespace dedup

#endif // DEDUP_BLOCKING_BLOCKER_HPP
