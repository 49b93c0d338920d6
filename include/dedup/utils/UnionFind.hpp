/**
 * @file UnionFind.hpp
 * @brief Disjoint-set forest with path compression and union by rank
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_UTILS_UNIONFIND_HPP
#define DEDUP_UTILS_UNIONFIND_HPP

#include <cstddef>
#include <map>
#include <numeric>
#include <utility>
#include <vector>

namespace dedup {

/**
 * @brief Disjoint sets over the integers 0..n-1
 */
class UnionFind {
public:
    explicit UnionFind(size_t n = 0)
        : parent_(n)
        , rank_(n, 0)
        , components_(n) {
        std::iota(parent_.begin(), parent_.end(), size_t{0});
    }

    size_t size() const { return parent_.size(); }

    /**
     * @brief Number of disjoint sets
     */
    size_t componentCount() const { return components_; }

    size_t find(size_t x) {
        size_t root = x;
        while (parent_[root] != root) {
            root = parent_[root];
        }
        // Path compression
        while (parent_[x] != root) {
            size_t next = parent_[x];
            parent_[x] = root;
            x = next;
        }
        return root;
    }

    /**
     * @brief Merge the sets of a and b
     * @return true if they were disjoint
     */
    bool unite(size_t a, size_t b) {
        size_t ra = find(a);
        size_t rb = find(b);
        if (ra == rb) {
            return false;
        }
        if (rank_[ra] < rank_[rb]) {
            std::swap(ra, rb);
        }
        parent_[rb] = ra;
        if (rank_[ra] == rank_[rb]) {
            ++rank_[ra];
        }
        --components_;
        return true;
    }

    bool connected(size_t a, size_t b) { return find(a) == find(b); }

    /**
     * @brief All sets, members ascending, sets ordered by smallest member
     */
    std::vector<std::vector<size_t>> groups() {
        std::map<size_t, size_t> rootToGroup;
        std::vector<std::vector<size_t>> out;
        for (size_t i = 0; i < parent_.size(); ++i) {
            size_t root = find(i);
            auto it = rootToGroup.find(root);
            if (it == rootToGroup.end()) {
                rootToGroup.emplace(root, out.size());
                out.push_back({i});
            } else {
                out[it->second].push_back(i);
            }
        }
        return out;
    }

private:
    std::vector<size_t> parent_;
    std::vector<size_t> rank_;
    size_t components_;
};

} // namespace dedup

#endif // DEDUP_UTILS_UNIONFIND_HPP
