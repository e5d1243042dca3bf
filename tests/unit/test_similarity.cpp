#include <gtest/gtest.h>
#include "clustering/similarity.hpp"
#include "test_fixtures.hpp"
#include <limits>

using namespace tg;
using namespace tg::testing_support;

namespace {

Account make_account(const std::string& id) {
    Account a;
    a.account_id = id;
    return a;
}

std::vector<const Account*> pointers(const std::vector<Account>& accounts) {
    std::vector<const Account*> result;
    for (const auto& a : accounts) result.push_back(&a);
    return result;
}

} // namespace

class SimilarityTest : public ::testing::Test {
protected:
    SimilarityFunction function;
};

TEST_F(SimilarityTest, IsSymmetric) {
    Account a = make_account("a");
    a.connections = {{"x", 1.0}, {"y", 1.0}, {"b", 0.5}};
    a.contributions = {{kEpochMs, std::nullopt, "endorse"}, {kEpochMs + 3 * kDayMs, 812, "review"}};
    a.metadata.email_domain = "a@corp.example";
    a.metadata.stake = 40.0;

    Account b = make_account("b");
    b.connections = {{"y", 1.0}, {"z", 1.0}};
    b.contributions = {{kEpochMs + 3 * kDayMs, std::nullopt, "endorse"}};
    b.metadata.email_domain = "b@corp.example";
    b.metadata.activity_level = 2.5;

    AccountPair ab = function.compare(a, b);
    AccountPair ba = function.compare(b, a);
    EXPECT_DOUBLE_EQ(ab.similarity, ba.similarity);
    EXPECT_EQ(ab.features.shared_connections, 1);
    EXPECT_EQ(ab.features.graph_distance, 1);
    EXPECT_EQ(ba.features.graph_distance, 1);
    EXPECT_DOUBLE_EQ(ab.features.connection_overlap, ba.features.connection_overlap);
    EXPECT_DOUBLE_EQ(ab.features.temporal_similarity, 0.5);
}

TEST_F(SimilarityTest, SharedEmailDomainOnly) {
    auto accounts = shared_email_accounts();
    AccountPair pair = function.compare(accounts[0], accounts[1]);

    EXPECT_DOUBLE_EQ(pair.features.metadata_similarity, 1.0);
    EXPECT_EQ(pair.features.shared_connections, 0);
    EXPECT_DOUBLE_EQ(pair.features.temporal_similarity, 0.0);
    EXPECT_EQ(pair.features.graph_distance, -1);
    EXPECT_NEAR(pair.similarity, 0.15, 1e-12);
}

TEST_F(SimilarityTest, SybilRingPairsAreNearlyIdentical) {
    auto accounts = sybil_ring_accounts();
    // accounts[1], accounts[2] are sybil-01 and sybil-02
    EXPECT_NEAR(function.compare(accounts[1], accounts[2]).similarity, 0.965, 1e-9);
    // sybil-00 has one extra connection to member-0
    EXPECT_NEAR(function.compare(accounts[0], accounts[1]).similarity,
                0.3 + 0.25 * 18.0 / 21.0 + 0.2 + 0.15 + 0.09, 1e-9);
    // member-0 and member-1 share stake, payments and a direct link
    EXPECT_NEAR(function.compare(accounts[20], accounts[21]).similarity, 0.19, 1e-9);
    EXPECT_LE(function.compare(accounts[0], accounts[20]).similarity, 0.09 + 1e-12);
}

// ==========================================
// Metadata feature
// ==========================================

TEST(MetadataSimilarityTest, EmailDomainAfterAt) {
    AccountMetadata a;
    AccountMetadata b;
    a.email_domain = "alice@mail.example";
    b.email_domain = "bob@mail.example";
    EXPECT_DOUBLE_EQ(SimilarityFunction::metadata_similarity(a, b), 0.5);

    b.email_domain = "bob@other.example";
    EXPECT_DOUBLE_EQ(SimilarityFunction::metadata_similarity(a, b), 0.0);
}

TEST(MetadataSimilarityTest, NumericFieldsUseRelativeDifference) {
    AccountMetadata a;
    AccountMetadata b;
    a.stake = 100.0;
    b.stake = 50.0;
    EXPECT_DOUBLE_EQ(SimilarityFunction::metadata_similarity(a, b), 0.5);

    // Small values are compared against a floor of 1
    a.stake = 0.0;
    b.stake = 0.5;
    EXPECT_DOUBLE_EQ(SimilarityFunction::metadata_similarity(a, b), 0.5);

    a.registration_date = kEpochMs;
    b.registration_date = kEpochMs;
    EXPECT_DOUBLE_EQ(SimilarityFunction::metadata_similarity(a, b), 0.75);
}

TEST(MetadataSimilarityTest, OneSidedFieldIsMismatch) {
    AccountMetadata a;
    AccountMetadata b;
    a.email_domain = "same.example";
    b.email_domain = "same.example";
    a.activity_level = 3.0;
    EXPECT_DOUBLE_EQ(SimilarityFunction::metadata_similarity(a, b), 0.5);

    b.extensions["country"] = "NZ";
    EXPECT_NEAR(SimilarityFunction::metadata_similarity(a, b), 1.0 / 3.0, 1e-12);
    a.extensions["country"] = "NZ";
    EXPECT_NEAR(SimilarityFunction::metadata_similarity(a, b), 2.0 / 3.0, 1e-12);
}

TEST(MetadataSimilarityTest, NothingToCompare) {
    EXPECT_DOUBLE_EQ(SimilarityFunction::metadata_similarity({}, {}), 0.0);
}

// ==========================================
// Temporal and structural features
// ==========================================

TEST_F(SimilarityTest, ActivityDaysJaccard) {
    Account a = make_account("a");
    Account b = make_account("b");
    a.contributions = {{kEpochMs, std::nullopt, "x"}, {kEpochMs + kDayMs, std::nullopt, "x"}};
    b.contributions = {{kEpochMs + kDayMs, std::nullopt, "x"}, {kEpochMs + 2 * kDayMs, std::nullopt, "x"}};
    EXPECT_NEAR(function.compare(a, b).features.temporal_similarity, 1.0 / 3.0, 1e-12);

    b.contributions.clear();
    EXPECT_DOUBLE_EQ(function.compare(a, b).features.temporal_similarity, 0.0);
}

TEST_F(SimilarityTest, NegativeTimestampsBucketByFloor) {
    Account a = make_account("a");
    Account b = make_account("b");
    a.contributions = {{-1, std::nullopt, "x"}};
    b.contributions = {{-kDayMs, std::nullopt, "x"}};
    EXPECT_DOUBLE_EQ(function.compare(a, b).features.temporal_similarity, 1.0);

    b.contributions = {{0, std::nullopt, "x"}};
    EXPECT_DOUBLE_EQ(function.compare(a, b).features.temporal_similarity, 0.0);
}

TEST_F(SimilarityTest, OneDirectionalLinkCountsAsAdjacent) {
    Account a = make_account("a");
    Account b = make_account("b");
    a.connections = {{"b", 1.0}};

    EXPECT_EQ(function.compare(b, a).features.graph_distance, 1);
    EXPECT_NEAR(function.compare(b, a).similarity, 0.09, 1e-12);
    EXPECT_FALSE(b.connects_to("a"));
    EXPECT_TRUE(a.connects_to("b"));
}

// ==========================================
// Weights and combination
// ==========================================

TEST(FeatureWeightsTest, RejectsNegativeOrNonFinite) {
    FeatureWeights weights;
    weights.temporal_similarity = -0.1;
    EXPECT_THROW(SimilarityFunction function(weights), std::invalid_argument);

    weights.temporal_similarity = std::numeric_limits<double>::quiet_NaN();
    std::string error;
    EXPECT_FALSE(weights.validate(error));
}

TEST(FeatureWeightsTest, PartialJsonKeepsDefaults) {
    auto w = FeatureWeights::from_json(nlohmann::json::parse(R"({"metadata_similarity": 0.5})"));
    EXPECT_DOUBLE_EQ(w.metadata_similarity, 0.5);
    EXPECT_DOUBLE_EQ(w.shared_connections, 0.30);
    EXPECT_DOUBLE_EQ(w.graph_distance, 0.10);
}

TEST(FeatureWeightsTest, CombineClampsToUnitInterval) {
    FeatureWeights weights;
    weights.shared_connections = 1.0;
    weights.connection_overlap = 1.0;
    weights.temporal_similarity = 1.0;
    weights.metadata_similarity = 1.0;
    weights.graph_distance = 1.0;
    SimilarityFunction function(weights);

    PairFeatures f;
    f.shared_connections = 25;
    f.connection_overlap = 1.0;
    f.temporal_similarity = 1.0;
    f.metadata_similarity = 1.0;
    f.graph_distance = 1;
    EXPECT_DOUBLE_EQ(function.combine(f), 1.0);

    EXPECT_DOUBLE_EQ(function.combine(PairFeatures{}), 0.0);
}

// ==========================================
// Matrix
// ==========================================

TEST(SimilarityMatrixTest, ThreadCountDoesNotChangeValues) {
    auto accounts = sybil_ring_accounts();
    auto ptrs = pointers(accounts);
    SimilarityFunction function;

    SimilarityMatrix serial(ptrs, function, 1);
    SimilarityMatrix parallel(ptrs, function, 4);

    ASSERT_EQ(serial.size(), accounts.size());
    for (size_t i = 0; i < serial.size(); ++i) {
        for (size_t j = 0; j < serial.size(); ++j) {
            EXPECT_EQ(serial.at(i, j), parallel.at(i, j)) << i << "," << j;
            EXPECT_EQ(serial.at(i, j), serial.at(j, i));
        }
    }
}

TEST(SimilarityMatrixTest, NeighborsAndMeanPairwise) {
    auto accounts = shared_email_accounts();
    SimilarityMatrix matrix(pointers(accounts), SimilarityFunction());

    EXPECT_DOUBLE_EQ(matrix.at(2, 2), 1.0);
    EXPECT_EQ(matrix.neighbors(1, 0.1), (std::vector<size_t>{0, 2, 3}));
    EXPECT_TRUE(matrix.neighbors(1, 0.2).empty());
    EXPECT_NEAR(matrix.mean_pairwise({0, 1, 2, 3}), 0.15, 1e-12);
    EXPECT_DOUBLE_EQ(matrix.mean_pairwise({0}), 0.0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
