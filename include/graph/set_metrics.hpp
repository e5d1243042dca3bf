#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <set>
#include <vector>

namespace tg {

/**
 * @brief Number of elements present in both sets
 */
template <typename T>
size_t intersection_size(const std::set<T>& a, const std::set<T>& b) {
    size_t count = 0;
    auto it_a = a.begin();
    auto it_b = b.begin();
    while (it_a != a.end() && it_b != b.end()) {
        if (*it_a < *it_b) {
            ++it_a;
        } else if (*it_b < *it_a) {
            ++it_b;
        } else {
            ++count;
            ++it_a;
            ++it_b;
        }
    }
    return count;
}

/**
 * @brief |A n B| / |A u B|, 0 when both sets are empty
 */
template <typename T>
double jaccard_similarity(const std::set<T>& a, const std::set<T>& b) {
    size_t inter = intersection_size(a, b);
    size_t uni = a.size() + b.size() - inter;
    return uni > 0 ? static_cast<double>(inter) / static_cast<double>(uni) : 0.0;
}

/**
 * @brief Fraction of linked pairs among the members of a neighborhood
 *
 * `linked(i, j)` reports whether two neighbors are adjacent. Returns 0 for
 * fewer than two neighbors.
 */
template <typename Index, typename LinkFn>
double local_clustering_coefficient(const std::vector<Index>& neighbors, LinkFn linked) {
    size_t k = neighbors.size();
    if (k < 2) return 0.0;

    size_t links = 0;
    for (size_t i = 0; i < k; ++i) {
        for (size_t j = i + 1; j < k; ++j) {
            if (linked(neighbors[i], neighbors[j])) links++;
        }
    }
    return static_cast<double>(links) / (static_cast<double>(k) * (k - 1) / 2.0);
}

} // namespace tg
