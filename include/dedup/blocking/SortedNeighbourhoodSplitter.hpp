/**
 * @file SortedNeighbourhoodSplitter.hpp
 * @brief Sliding-window sorted neighbourhood block splitter
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_BLOCKING_SORTEDNEIGHBOURHOODSPLITTER_HPP
#define DEDUP_BLOCKING_SORTEDNEIGHBOURHOODSPLITTER_HPP

#include "IBlockSplitter.hpp"
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Sorted neighbourhood splitter
 *
 * Sorts the block's records by a tuple of fields (Value ordering, ties broken
 * by record id) and slides a window of maxBlockSize records over the sorted
 * sequence with step (maxBlockSize - overlap). Each window becomes a
 * sub-block. With overlap 0 a block of n records yields ceil(n / w)
 * sub-blocks covering every record exactly once. Blocks of at most
 * maxBlockSize records are returned as is.
 *
 * Missing fields sort first (as null).
 */
class SortedNeighbourhoodSplitter : public IBlockSplitter {
public:
    /**
     * @brief Construct splitter
     *
     * @param fields Sort key, at least one dot-path
     * @param maxBlockSize Window size, at least 1
     * @param overlap Records shared by consecutive windows, less than maxBlockSize
     * @throws ConfigurationError on invalid parameters
     */
    SortedNeighbourhoodSplitter(std::vector<std::string> fields,
                                size_t maxBlockSize,
                                size_t overlap = 0);

    std::vector<Block> split(const Block& block, const RecordList& records) const override;

    std::string getName() const override { return "sorted_neighbourhood"; }

    std::unique_ptr<IBlockSplitter> clone() const override;

    const std::vector<std::string>& getFields() const { return fields_; }
    size_t getMaxBlockSize() const { return maxBlockSize_; }
    size_t getOverlap() const { return overlap_; }

private:
    std::vector<std::string> fields_;
    size_t maxBlockSize_;
    size_t overlap_;
};

} // namespace dedup

#endif // DEDUP_BLOCKING_SORTEDNEIGHBOURHOODSPLITTER_HPP
