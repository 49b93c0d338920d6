/**
 * @file BlockSplitterFactory.hpp
 * @brief Factory for creating block splitters
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_BLOCKING_BLOCKSPLITTERFACTORY_HPP
#define DEDUP_BLOCKING_BLOCKSPLITTERFACTORY_HPP

#include "IBlockSplitter.hpp"
#include "../core/DeduplicatorConfig.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Factory for creating block splitter instances
 */
class BlockSplitterFactory {
public:
    /**
     * @brief Create splitter from configuration
     *
     * @param params Splitter parameters
     * @throws ConfigurationError on unknown kinds or invalid parameters
     */
    static std::unique_ptr<IBlockSplitter> create(const SplitterParams& params);

    /**
     * @brief Check if splitter name is valid
     */
    static bool isValidSplitter(const std::string& splitterName);

    /**
     * @brief Get list of available splitters
     */
    static std::vector<std::string> getAvailableSplitters();

private:
    BlockSplitterFactory() = delete;  // Static factory, no instantiation
};

} // namespace dedup

#endif // DEDUP_BLOCKING_BLOCKSPLITTERFACTORY_HPP
