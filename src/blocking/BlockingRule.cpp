/**
 * @file BlockingRule.cpp
 * @brief Blocking rule algebra implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/blocking/BlockingRule.hpp"
#include "dedup/blocking/KeyEncoder.hpp"
#include "dedup/core/Errors.hpp"
#include <algorithm>
#include <memory>
#include <string>
#include <unordered_set>

namespace dedup {

namespace {

// Geohash cells are never longer than this
constexpr int MAX_GEOHASH_PRECISION = 12;

bool needsParameter(KeyEncoding encoding) {
    switch (encoding) {
        case KeyEncoding::EXACT:
        case KeyEncoding::CONSONANT:
        case KeyEncoding::YEAR:
        case KeyEncoding::MONTH:
        case KeyEncoding::DAY:
        case KeyEncoding::ROUND_INTEGER:
            return false;
        default:
            return true;
    }
}

void appendUnique(std::vector<BlockKey>& out,
                  std::unordered_set<BlockKey, BlockKeyHash>& seen,
                  BlockKey key) {
    if (seen.insert(key).second) {
        out.push_back(std::move(key));
    }
}

std::vector<BlockKey> evaluate(const BlockingRule& rule, const Record& record);

std::vector<BlockKey> evaluateLeaf(const BlockingRule::Leaf& leaf, const Record& record) {
    std::string text;
    if (leaf.encoding == KeyEncoding::GEOHASH) {
        // Coordinates live below the attribute after flattening
        text = KeyEncoder::encodeGeo(record, leaf.attribute, leaf.parameter);
    } else {
        const Value* value = record.get(leaf.attribute);
        if (value == nullptr) {
            return {};
        }
        text = KeyEncoder::encode(leaf.encoding, *value, leaf.parameter);
    }
    if (text.empty()) {
        return {};
    }
    return {BlockKey::atom(text)};
}

std::vector<BlockKey> evaluateAnd(const BlockingRule::And& node, const Record& record) {
    std::vector<BlockKey> left = evaluate(*node.left, record);
    if (left.empty()) {
        return {};
    }
    std::vector<BlockKey> right = evaluate(*node.right, record);
    if (right.empty()) {
        return {};
    }

    // Cartesian product; a single pair when neither side contains an OR
    std::vector<BlockKey> out;
    std::unordered_set<BlockKey, BlockKeyHash> seen;
    out.reserve(left.size() * right.size());
    for (const auto& l : left) {
        for (const auto& r : right) {
            appendUnique(out, seen, BlockKey::tuple({l, r}));
        }
    }
    return out;
}

std::vector<BlockKey> evaluateOr(const BlockingRule::Or& node, const Record& record) {
    std::vector<BlockKey> out;
    std::unordered_set<BlockKey, BlockKeyHash> seen;
    for (const auto& key : evaluate(*node.left, record)) {
        appendUnique(out, seen, BlockKey::tagged(0, key));
    }
    for (const auto& key : evaluate(*node.right, record)) {
        appendUnique(out, seen, BlockKey::tagged(1, key));
    }
    return out;
}

std::vector<BlockKey> evaluate(const BlockingRule& rule, const Record& record) {
    const auto& node = rule.node();
    if (const auto* leaf = std::get_if<BlockingRule::Leaf>(&node)) {
        return evaluateLeaf(*leaf, record);
    }
    if (const auto* both = std::get_if<BlockingRule::And>(&node)) {
        return evaluateAnd(*both, record);
    }
    return evaluateOr(std::get<BlockingRule::Or>(node), record);
}

void collectAttributes(const BlockingRule& rule, std::vector<std::string>& out) {
    const auto& node = rule.node();
    if (const auto* leaf = std::get_if<BlockingRule::Leaf>(&node)) {
        if (std::find(out.begin(), out.end(), leaf->attribute) == out.end()) {
            out.push_back(leaf->attribute);
        }
    } else if (const auto* both = std::get_if<BlockingRule::And>(&node)) {
        collectAttributes(*both->left, out);
        collectAttributes(*both->right, out);
    } else {
        const auto& either = std::get<BlockingRule::Or>(node);
        collectAttributes(*either.left, out);
        collectAttributes(*either.right, out);
    }
}

// Recursive helper for combinationsExceptK
void combine(const std::vector<BlockingRulePtr>& rules, size_t size, size_t start,
             std::vector<BlockingRulePtr>& current,
             std::vector<BlockingRulePtr>& out) {
    if (current.size() == size) {
        out.push_back(BlockingRule::allOf(current));
        return;
    }
    for (size_t i = start; i < rules.size(); ++i) {
        current.push_back(rules[i]);
        combine(rules, size, i + 1, current, out);
        current.pop_back();
    }
}

}  // anonymous namespace

BlockingRulePtr BlockingRule::leaf(const std::string& attribute, KeyEncoding encoding, int parameter) {
    if (attribute.empty()) {
        throw ConfigurationError("Blocking rule attribute must not be empty");
    }
    if (needsParameter(encoding) && parameter < 1) {
        throw ConfigurationError("Blocking rule " + keyEncodingToString(encoding) +
                                 "(" + attribute + ") needs a positive parameter");
    }
    if (encoding == KeyEncoding::GEOHASH && parameter > MAX_GEOHASH_PRECISION) {
        throw ConfigurationError("Blocking rule geohash(" + attribute + ") precision must be at most " +
                                 std::to_string(MAX_GEOHASH_PRECISION));
    }
    return std::make_shared<BlockingRule>(ConstructionKey{}, Leaf{attribute, encoding, parameter});
}

BlockingRulePtr BlockingRule::leaf(const std::string& attribute, KeyEncoding encoding) {
    return leaf(attribute, encoding, defaultEncodingParameter(encoding));
}

BlockingRulePtr BlockingRule::exact(const std::string& attribute) {
    return leaf(attribute, KeyEncoding::EXACT, 0);
}

BlockingRulePtr BlockingRule::phonetic(const std::string& attribute, int maxLength) {
    return leaf(attribute, KeyEncoding::PHONETIC, maxLength);
}

BlockingRulePtr BlockingRule::consonant(const std::string& attribute) {
    return leaf(attribute, KeyEncoding::CONSONANT, 0);
}

BlockingRulePtr BlockingRule::firstNChars(const std::string& attribute, int nChars) {
    return leaf(attribute, KeyEncoding::FIRST_N_CHARS, nChars);
}

BlockingRulePtr BlockingRule::lastNChars(const std::string& attribute, int nChars) {
    return leaf(attribute, KeyEncoding::LAST_N_CHARS, nChars);
}

BlockingRulePtr BlockingRule::firstNWords(const std::string& attribute, int nWords) {
    return leaf(attribute, KeyEncoding::FIRST_N_WORDS, nWords);
}

BlockingRulePtr BlockingRule::abbreviation(const std::string& attribute, int nLetters) {
    return leaf(attribute, KeyEncoding::ABBREVIATION, nLetters);
}

BlockingRulePtr BlockingRule::phone(const std::string& attribute, int digits) {
    return leaf(attribute, KeyEncoding::PHONE, digits);
}

BlockingRulePtr BlockingRule::year(const std::string& attribute) {
    return leaf(attribute, KeyEncoding::YEAR, 0);
}

BlockingRulePtr BlockingRule::roundInteger(const std::string& attribute) {
    return leaf(attribute, KeyEncoding::ROUND_INTEGER, 0);
}

BlockingRulePtr BlockingRule::geohash(const std::string& attribute, int precision) {
    return leaf(attribute, KeyEncoding::GEOHASH, precision);
}

BlockingRulePtr BlockingRule::conjunction(BlockingRulePtr left, BlockingRulePtr right) {
    if (!left || !right) {
        throw ConfigurationError("AND blocking rule needs two operands");
    }
    return std::make_shared<BlockingRule>(ConstructionKey{}, And{std::move(left), std::move(right)});
}

BlockingRulePtr BlockingRule::disjunction(BlockingRulePtr left, BlockingRulePtr right) {
    if (!left || !right) {
        throw ConfigurationError("OR blocking rule needs two operands");
    }
    return std::make_shared<BlockingRule>(ConstructionKey{}, Or{std::move(left), std::move(right)});
}

BlockingRulePtr BlockingRule::allOf(const std::vector<BlockingRulePtr>& rules) {
    if (rules.empty()) {
        throw ConfigurationError("AND blocking rule needs at least one operand");
    }
    BlockingRulePtr result = rules.front();
    if (!result) {
        throw ConfigurationError("AND blocking rule operand is null");
    }
    for (size_t i = 1; i < rules.size(); ++i) {
        result = conjunction(result, rules[i]);
    }
    return result;
}

BlockingRulePtr BlockingRule::anyOf(const std::vector<BlockingRulePtr>& rules) {
    if (rules.empty()) {
        throw ConfigurationError("OR blocking rule needs at least one operand");
    }
    BlockingRulePtr result = rules.front();
    if (!result) {
        throw ConfigurationError("OR blocking rule operand is null");
    }
    for (size_t i = 1; i < rules.size(); ++i) {
        result = disjunction(result, rules[i]);
    }
    return result;
}

BlockingRulePtr BlockingRule::fromAttributes(const std::vector<std::string>& attributes) {
    std::vector<BlockingRulePtr> rules;
    rules.reserve(attributes.size());
    for (const auto& attribute : attributes) {
        rules.push_back(exact(attribute));
    }
    return allOf(rules);
}

BlockingRulePtr BlockingRule::combinationsExceptK(const std::vector<BlockingRulePtr>& rules, size_t k) {
    if (rules.empty() || k >= rules.size()) {
        throw ConfigurationError("combinations_except_k needs k smaller than the number of rules");
    }
    std::vector<BlockingRulePtr> combos;
    std::vector<BlockingRulePtr> current;
    combine(rules, rules.size() - k, 0, current, combos);
    return anyOf(combos);
}

std::vector<BlockKey> BlockingRule::keys(const Record& record) const {
    return evaluate(*this, record);
}

std::vector<std::string> BlockingRule::attributes() const {
    std::vector<std::string> out;
    collectAttributes(*this, out);
    return out;
}

std::string BlockingRule::toString() const {
    if (const auto* l = std::get_if<Leaf>(&node_)) {
        std::string s = keyEncodingToString(l->encoding) + "(" + l->attribute;
        if (needsParameter(l->encoding)) {
            s += "," + std::to_string(l->parameter);
        }
        return s + ")";
    }
    if (const auto* a = std::get_if<And>(&node_)) {
        return "(" + a->left->toString() + " & " + a->right->toString() + ")";
    }
    const auto& o = std::get<Or>(node_);
    return "(" + o.left->toString() + " | " + o.right->toString() + ")";
}

} // namespace dedup
