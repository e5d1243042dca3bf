#include "graph/union_find.hpp"
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace tg {

UnionFind::UnionFind(size_t n) {
    reset(n);
}

void UnionFind::reset(size_t n) {
    parent_.resize(n);
    std::iota(parent_.begin(), parent_.end(), 0);
    rank_.assign(n, 0);
    size_.assign(n, 1);
    num_sets_ = n;
}

size_t UnionFind::find(size_t x) {
    if (x >= parent_.size()) {
        throw std::out_of_range("UnionFind index out of range: " + std::to_string(x));
    }

    size_t root = x;
    while (parent_[root] != root) {
        root = parent_[root];
    }

    // Second pass: point every node on the path at the root
    while (parent_[x] != root) {
        size_t next = parent_[x];
        parent_[x] = root;
        x = next;
    }

    return root;
}

bool UnionFind::unite(size_t a, size_t b) {
    size_t root_a = find(a);
    size_t root_b = find(b);
    if (root_a == root_b) return false;

    if (rank_[root_a] < rank_[root_b]) {
        std::swap(root_a, root_b);
    }
    parent_[root_b] = root_a;
    size_[root_a] += size_[root_b];
    if (rank_[root_a] == rank_[root_b]) {
        rank_[root_a]++;
    }

    num_sets_--;
    return true;
}

std::vector<std::vector<size_t>> UnionFind::groups() {
    std::vector<std::vector<size_t>> result;
    std::vector<size_t> root_to_group(parent_.size(), parent_.size());

    // Ascending scan means each group is ordered and groups appear by their
    // smallest member.
    for (size_t i = 0; i < parent_.size(); ++i) {
        size_t root = find(i);
        if (root_to_group[root] == parent_.size()) {
            root_to_group[root] = result.size();
            result.emplace_back();
        }
        result[root_to_group[root]].push_back(i);
    }

    return result;
}

} // namespace tg
