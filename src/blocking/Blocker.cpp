/**
 * @file Blocker.cpp
 * @brief Initial block construction
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/blocking/Blocker.hpp"
#include <unordered_map>

namespace dedup {

Blocker::Blocker(BlockingRulePtr rule)
    : rule_(std::move(rule)) {}

BlockList Blocker::build(const RecordList& records) {
    BlockList blocks;
    unmatched_ = 0;

    if (records.empty()) {
        return blocks;
    }

    if (!rule_) {
        Block all;
        all.id = 0;
        all.parentId = 0;
        all.label = "*";
        all.members.reserve(records.size());
        for (const auto& record : records) {
            all.members.push_back(record.getId());
        }
        blocks.push_back(std::move(all));
        return blocks;
    }

    std::unordered_map<BlockKey, size_t, BlockKeyHash> index;

    for (const auto& record : records) {
        std::vector<BlockKey> keys = rule_->keys(record);

        if (keys.empty()) {
            // NO_MATCH: the record still appears, alone
            Block single;
            single.id = blocks.size();
            single.parentId = single.id;
            single.label = "<unmatched " + std::to_string(record.getId()) + ">";
            single.members.push_back(record.getId());
            blocks.push_back(std::move(single));
            ++unmatched_;
            continue;
        }

        for (const auto& key : keys) {
            auto it = index.find(key);
            if (it == index.end()) {
                Block block;
                block.id = blocks.size();
                block.parentId = block.id;
                block.label = key.toString();
                block.members.push_back(record.getId());
                index.emplace(key, block.id);
                blocks.push_back(std::move(block));
            } else {
                blocks[it->second].members.push_back(record.getId());
            }
        }
    }

    return blocks;
}

} // namespace dedup
