#include <gtest/gtest.h>
#include "graph/union_find.hpp"
#include "graph/set_metrics.hpp"
#include <set>
#include <string>

using namespace tg;

TEST(UnionFindTest, StartsAsSingletons) {
    UnionFind uf(5);
    EXPECT_EQ(uf.size(), 5);
    EXPECT_EQ(uf.num_sets(), 5);
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(uf.find(i), i);
        EXPECT_EQ(uf.set_size(i), 1);
    }
}

TEST(UnionFindTest, UniteMergesAndReportsNoOp) {
    UnionFind uf(6);
    EXPECT_TRUE(uf.unite(0, 1));
    EXPECT_TRUE(uf.unite(2, 3));
    EXPECT_TRUE(uf.unite(1, 3));
    EXPECT_FALSE(uf.unite(0, 2));

    EXPECT_TRUE(uf.connected(0, 3));
    EXPECT_FALSE(uf.connected(0, 4));
    EXPECT_EQ(uf.set_size(2), 4);
    EXPECT_EQ(uf.num_sets(), 3);
}

TEST(UnionFindTest, GroupsOrderedBySmallestMember) {
    UnionFind uf(7);
    uf.unite(5, 1);
    uf.unite(6, 3);
    uf.unite(3, 0);

    auto groups = uf.groups();
    ASSERT_EQ(groups.size(), 4);
    EXPECT_EQ(groups[0], (std::vector<size_t>{0, 3, 6}));
    EXPECT_EQ(groups[1], (std::vector<size_t>{1, 5}));
    EXPECT_EQ(groups[2], (std::vector<size_t>{2}));
    EXPECT_EQ(groups[3], (std::vector<size_t>{4}));
}

TEST(UnionFindTest, LongChainDoesNotRecurse) {
    const size_t n = 200000;
    UnionFind uf(n);
    for (size_t i = 1; i < n; ++i) {
        uf.unite(i - 1, i);
    }
    EXPECT_EQ(uf.num_sets(), 1);
    EXPECT_EQ(uf.set_size(n - 1), n);
    EXPECT_TRUE(uf.connected(0, n - 1));
}

TEST(UnionFindTest, OutOfRangeThrows) {
    UnionFind uf(3);
    EXPECT_THROW(uf.find(3), std::out_of_range);
    EXPECT_THROW(uf.unite(0, 7), std::out_of_range);
}

TEST(UnionFindTest, ResetRestoresSingletons) {
    UnionFind uf(4);
    uf.unite(0, 1);
    uf.reset(2);
    EXPECT_EQ(uf.size(), 2);
    EXPECT_EQ(uf.num_sets(), 2);
    EXPECT_FALSE(uf.connected(0, 1));
}

// ==========================================
// Set metrics
// ==========================================

TEST(SetMetricsTest, Jaccard) {
    std::set<std::string> a = {"x", "y", "z"};
    std::set<std::string> b = {"y", "z", "w"};
    EXPECT_EQ(intersection_size(a, b), 2);
    EXPECT_DOUBLE_EQ(jaccard_similarity(a, b), 0.5);
    EXPECT_DOUBLE_EQ(jaccard_similarity(std::set<int>{}, std::set<int>{}), 0.0);
}

TEST(SetMetricsTest, LocalClusteringCoefficient) {
    // 0 is linked to 1, 2 and 3; only 1-2 are linked among them
    std::vector<int> neighbors = {1, 2, 3};
    auto linked = [](int a, int b) { return (a == 1 && b == 2) || (a == 2 && b == 1); };
    EXPECT_DOUBLE_EQ(local_clustering_coefficient(neighbors, linked), 1.0 / 3.0);

    std::vector<int> single = {1};
    EXPECT_DOUBLE_EQ(local_clustering_coefficient(single, linked), 0.0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
