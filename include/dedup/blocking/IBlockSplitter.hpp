/**
 * @file IBlockSplitter.hpp
 * @brief Block splitter interface
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_BLOCKING_IBLOCKSPLITTER_HPP
#define DEDUP_BLOCKING_IBLOCKSPLITTER_HPP

#include "../core/Block.hpp"
#include "../core/Record.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Abstract interface for block splitters
 *
 * A splitter subdivides one initial block into sub-blocks that are scored
 * and clustered independently. Every member of the input block must appear
 * in at least one sub-block.
 */
class IBlockSplitter {
public:
    virtual ~IBlockSplitter() = default;

    /**
     * @brief Split a block
     *
     * @param block Initial block
     * @param records All records of the run, indexed by id
     * @return Sub-blocks; ids are assigned by the caller
     */
    virtual std::vector<Block> split(const Block& block, const RecordList& records) const = 0;

    /**
     * @brief Get splitter name
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Clone the splitter
     */
    virtual std::unique_ptr<IBlockSplitter> clone() const = 0;

protected:
    IBlockSplitter() = default;
    IBlockSplitter(const IBlockSplitter&) = default;
    IBlockSplitter& operator=(const IBlockSplitter&) = default;
};

/**
 * @brief Splitter returning the block unchanged
 */
class IdentitySplitter : public IBlockSplitter {
public:
    IdentitySplitter() = default;

    std::vector<Block> split(const Block& block, const RecordList&) const override {
        return {block};
    }

    std::string getName() const override { return "identity"; }

    std::unique_ptr<IBlockSplitter> clone() const override {
        return std::make_unique<IdentitySplitter>(*this);
    }
};

} // namespace dedup

#endif // DEDUP_BLOCKING_IBLOCKSPLITTER_HPP
