/**
 * @file BlockSplitterFactory.cpp
 * @brief Block splitter factory implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/blocking/BlockSplitterFactory.hpp"
#include "dedup/blocking/SortedNeighbourhoodSplitter.hpp"

namespace dedup {

std::unique_ptr<IBlockSplitter> BlockSplitterFactory::create(const SplitterParams& params) {
    switch (params.getKind()) {
        case SplitterKind::SORTED_NEIGHBOURHOOD:
            return std::make_unique<SortedNeighbourhoodSplitter>(
                params.fields, params.maxBlockSize, params.overlap);

        case SplitterKind::IDENTITY:
        default:
            return std::make_unique<IdentitySplitter>();
    }
}

bool BlockSplitterFactory::isValidSplitter(const std::string& splitterName) {
    return splitterName == "identity" ||
           splitterName == "sorted_neighbourhood" ||
           splitterName == "sorted_neighborhood";
}

std::vector<std::string> BlockSplitterFactory::getAvailableSplitters() {
    return {"identity", "sorted_neighbourhood"};
}

} // namespace dedup
