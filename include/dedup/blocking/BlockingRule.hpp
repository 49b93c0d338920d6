/**
 * @file BlockingRule.hpp
 * @brief Blocking rule algebra (leaf rules composed with AND / OR)
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_BLOCKING_BLOCKINGRULE_HPP
#define DEDUP_BLOCKING_BLOCKINGRULE_HPP

#include "BlockKey.hpp"
#include "../core/Types.hpp"
#include "../core/Record.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace dedup {

class BlockingRule;
using BlockingRulePtr = std::shared_ptr<const BlockingRule>;

/**
 * @brief Immutable blocking rule
 *
 * A rule is a tagged variant of three node kinds:
 *
 * - Leaf: encodes one attribute (exact, phonetic, first_n_chars, ...)
 * - And:  key is the tuple (left key, right key); NO_MATCH if either side is
 * - Or:   record joins every block produced by either side
 *
 * keys() evaluates the tree recursively. An empty result is NO_MATCH. A
 * record gets more than one key only through OR; the keys are distinct, so
 * the record never lands twice in the same block.
 *
 * @code
 * auto rule = BlockingRule::disjunction(
 *     BlockingRule::conjunction(BlockingRule::phonetic("name"), BlockingRule::exact("phone")),
 *     BlockingRule::abbreviation("name"));
 * @endcode
 */
class BlockingRule {
    // Restricts construction to the named constructors below
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    struct Leaf {
        std::string attribute;
        KeyEncoding encoding = KeyEncoding::EXACT;
        int parameter = 0;
    };

    struct And {
        BlockingRulePtr left;
        BlockingRulePtr right;
    };

    struct Or {
        BlockingRulePtr left;
        BlockingRulePtr right;
    };

    using Node = std::variant<Leaf, And, Or>;

    // Leaf constructors
    static BlockingRulePtr leaf(const std::string& attribute, KeyEncoding encoding, int parameter);
    static BlockingRulePtr leaf(const std::string& attribute, KeyEncoding encoding);
    static BlockingRulePtr exact(const std::string& attribute);
    static BlockingRulePtr phonetic(const std::string& attribute, int maxLength = 4);
    static BlockingRulePtr consonant(const std::string& attribute);
    static BlockingRulePtr firstNChars(const std::string& attribute, int nChars = 3);
    static BlockingRulePtr lastNChars(const std::string& attribute, int nChars = 3);
    static BlockingRulePtr firstNWords(const std::string& attribute, int nWords = 1);
    static BlockingRulePtr abbreviation(const std::string& attribute, int nLetters = 3);
    static BlockingRulePtr phone(const std::string& attribute, int digits = 10);
    static BlockingRulePtr year(const std::string& attribute);
    static BlockingRulePtr roundInteger(const std::string& attribute);
    /// Reads <attribute>.lat and <attribute>.lon, or a [lon, lat] pair
    static BlockingRulePtr geohash(const std::string& attribute, int precision = 5);

    // Composition
    static BlockingRulePtr conjunction(BlockingRulePtr left, BlockingRulePtr right);
    static BlockingRulePtr disjunction(BlockingRulePtr left, BlockingRulePtr right);

    /**
     * @brief Left-nested AND chain over all rules
     * @throws ConfigurationError if rules is empty
     */
    static BlockingRulePtr allOf(const std::vector<BlockingRulePtr>& rules);

    /**
     * @brief Left-nested OR chain over all rules
     * @throws ConfigurationError if rules is empty
     */
    static BlockingRulePtr anyOf(const std::vector<BlockingRulePtr>& rules);

    /**
     * @brief AND chain of exact-match rules, the blocking_attributes sugar
     */
    static BlockingRulePtr fromAttributes(const std::vector<std::string>& attributes);

    /**
     * @brief OR over the AND of every combination of (size - k) rules
     *
     * With k = 1 two records share a block when they agree on all but one of
     * the rules.
     */
    static BlockingRulePtr combinationsExceptK(const std::vector<BlockingRulePtr>& rules, size_t k);

    /**
     * @brief Block keys of a record; empty means NO_MATCH
     */
    std::vector<BlockKey> keys(const Record& record) const;

    /**
     * @brief Attribute paths referenced anywhere in the rule
     */
    std::vector<std::string> attributes() const;

    /**
     * @brief Printable form, e.g. "(phonetic(name,4) & exact(phone)) | abbreviation(name,3)"
     */
    std::string toString() const;

    const Node& node() const { return node_; }

    bool isLeaf() const { return std::holds_alternative<Leaf>(node_); }
    bool isAnd() const { return std::holds_alternative<And>(node_); }
    bool isOr() const { return std::holds_alternative<Or>(node_); }

    BlockingRule(ConstructionKey, Node node) : node_(std::move(node)) {}

private:
    Node node_;
};

} // namespace dedup

#endif // DEDUP_BLOCKING_BLOCKINGRULE_HPP
