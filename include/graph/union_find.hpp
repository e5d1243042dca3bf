#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tg {

/**
 * @brief Disjoint-set forest over the indices [0, n)
 *
 * Parent and rank live in flat arrays addressed by element index. find() is
 * iterative with full path compression; unite() is union-by-rank.
 */
class UnionFind {
public:
    explicit UnionFind(size_t n = 0);

    void reset(size_t n);

    size_t find(size_t x);

    /**
     * @brief Merge the sets containing a and b
     * @return false if they were already in the same set
     */
    bool unite(size_t a, size_t b);

    bool connected(size_t a, size_t b) { return find(a) == find(b); }

    size_t set_size(size_t x) { return size_[find(x)]; }

    size_t size() const { return parent_.size(); }

    size_t num_sets() const { return num_sets_; }

    /**
     * @brief Members of every set, each list ascending, lists ordered by
     *        their smallest member
     */
    std::vector<std::vector<size_t>> groups();

private:
    std::vector<size_t> parent_;
    std::vector<uint8_t> rank_;
    std::vector<size_t> size_;
    size_t num_sets_ = 0;
};

} // namespace tg
