#include <gtest/gtest.h>
#include "reputation/reputation_scorer.hpp"
#include "test_fixtures.hpp"
#include <algorithm>
#include <cmath>

using namespace tg;
using namespace tg::testing_support;

namespace {

constexpr int64_t kYearMs = 365LL * kDayMs;

double total_final(const ReputationReport& report) {
    double total = 0.0;
    for (const auto& [id, s] : report.scores) total += s.final_score;
    return total;
}

double percentile_sum(const ReputationReport& report) {
    double total = 0.0;
    for (const auto& [id, s] : report.scores) total += s.percentile;
    return total;
}

bool contains(const std::vector<std::string>& items, const std::string& item) {
    return std::find(items.begin(), items.end(), item) != items.end();
}

} // namespace

class ReputationScorerTest : public ::testing::Test {
protected:
    ScorerConfig precise;

    void SetUp() override {
        precise.tolerance = 1e-12;
        precise.max_iterations = 1000;
    }

    // hub is endorsed by most nodes and endorses a and y
    TrustGraph hub_graph(bool with_hub_to_x) const {
        std::vector<GraphNode> nodes = {
            make_node("hub"), make_node("a"), make_node("b"),
            make_node("c"), make_node("x"), make_node("y")
        };
        std::vector<GraphEdge> edges = {
            make_edge("a", "hub"), make_edge("b", "hub"), make_edge("c", "hub"),
            make_edge("y", "hub"), make_edge("hub", "a"), make_edge("hub", "y"),
            make_edge("x", "b")
        };
        if (with_hub_to_x) {
            edges.push_back(make_edge("hub", "x"));
        }
        return TrustGraph(nodes, edges);
    }
};

// ==========================================
// Degenerate inputs and validation
// ==========================================

TEST_F(ReputationScorerTest, EmptyGraphReturnsEmptyReport) {
    ReputationScorer scorer;
    ReputationReport report = scorer.score(TrustGraph());

    EXPECT_TRUE(report.empty());
    EXPECT_TRUE(report.sybil.empty());
    EXPECT_TRUE(report.audits.empty());
    EXPECT_FALSE(report.fairness.has_value());
    EXPECT_TRUE(report.metadata.converged);
}

TEST_F(ReputationScorerTest, UnknownEdgeEndpointRejected) {
    ReputationScorer scorer;
    try {
        scorer.score({make_node("a")}, {make_edge("a", "ghost")});
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.subject(), "a->ghost#0");
    }
}

TEST_F(ReputationScorerTest, ZeroHybridWeightsRejected) {
    ScorerConfig config;
    config.graph_weight = 0.0;
    config.quality_weight = 0.0;
    config.stake_weight = 0.0;
    config.payment_weight = 0.0;
    EXPECT_THROW(ReputationScorer scorer(config), std::invalid_argument);

    // Hybrid off: the weights are irrelevant
    config.hybrid_enabled = false;
    EXPECT_NO_THROW(ReputationScorer scorer(config));
}

TEST_F(ReputationScorerTest, InvalidDampingRejected) {
    ScorerConfig config;
    config.damping_factor = 1.0;
    std::string error;
    EXPECT_FALSE(config.validate(error));
    EXPECT_FALSE(error.empty());
    EXPECT_THROW(ReputationScorer scorer(config), std::invalid_argument);
}

// ==========================================
// Scenarios
// ==========================================

TEST_F(ReputationScorerTest, TrivialRingScoresEqually) {
    ReputationScorer scorer;
    ReputationReport report = scorer.score(ring_graph(3));

    ASSERT_EQ(report.scores.size(), 3);
    const double expected_final = report.scores.at("n0").final_score;
    for (const auto& [id, s] : report.scores) {
        EXPECT_EQ(s.final_score, expected_final) << id;
        EXPECT_DOUBLE_EQ(s.percentile, 200.0 / 3.0) << id;
    }
    EXPECT_TRUE(report.metadata.converged);
}

TEST_F(ReputationScorerTest, IsolatedHighStakeNodeKeepsHybridFloor) {
    ScorerConfig config;
    config.teleport_stake_bias = 0.0;
    config.teleport_payment_bias = 0.0;
    ReputationScorer scorer(config);

    std::vector<GraphNode> nodes = {
        make_node("n0"), make_node("n1"), make_node("n2"), make_node("n3"),
        make_node("whale", 100000.0, 100000.0)
    };
    std::vector<GraphEdge> edges = {
        make_edge("n0", "n1"), make_edge("n1", "n2"), make_edge("n2", "n3"), make_edge("n3", "n0")
    };
    ReputationReport report = scorer.score(nodes, edges);

    const auto& whale = report.scores.at("whale");
    const auto& member = report.scores.at("n0");
    EXPECT_LT(whale.graph_score, member.graph_score);
    EXPECT_GT(whale.stake_score, 0.0);
    EXPECT_GT(whale.payment_score, 0.0);
    EXPECT_GT(whale.final_score, 0.5 * whale.graph_score);
    EXPECT_TRUE(contains(whale.explanation, "Stake commitment: 1000.00"));
}

TEST_F(ReputationScorerTest, TeleportFavorsEconomicCommitment) {
    ReputationScorer scorer;
    TrustGraph graph({make_node("poor"), make_node("rich", 10000.0, 50000.0)}, {});

    auto teleport = scorer.teleport_distribution(graph);
    ASSERT_EQ(teleport.size(), 2);
    EXPECT_NEAR(teleport[0] + teleport[1], 1.0, 1e-12);
    EXPECT_GT(teleport[1], teleport[0]);
}

TEST_F(ReputationScorerTest, AddedEndorsementDoesNotLowerTarget) {
    ReputationScorer scorer(precise);

    ReputationReport before = scorer.score(hub_graph(false));
    ReputationReport after = scorer.score(hub_graph(true));

    EXPECT_GT(before.scores.at("hub").graph_score, before.scores.at("x").graph_score);
    EXPECT_GT(after.scores.at("x").graph_score, before.scores.at("x").graph_score);
}

TEST_F(ReputationScorerTest, RecentEdgesOutweighOldOnes) {
    ReputationScorer scorer(precise);
    TrustGraph graph(
        {make_node("s"), make_node("old"), make_node("new")},
        {make_edge("s", "old", 1.0, kEpochMs), make_edge("s", "new", 1.0, kEpochMs + 5 * kYearMs)});

    auto weights = scorer.effective_edge_weights(graph);
    ASSERT_EQ(weights.size(), 2);
    EXPECT_NEAR(weights[1], 1.0, 1e-12);
    EXPECT_NEAR(weights[0], 0.3 + 0.7 * std::exp(-0.5), 1e-12);

    ReputationReport report = scorer.score(graph);
    EXPECT_GT(report.scores.at("new").graph_score, report.scores.at("old").graph_score);
}

TEST_F(ReputationScorerTest, EdgeMetadataBoostsWeight) {
    ReputationScorer scorer;
    GraphEdge backed = make_edge("a", "b");
    backed.metadata.stake_backed = true;
    GraphEdge verified = make_edge("b", "a");
    verified.metadata.stake_backed = true;
    verified.metadata.verified = true;

    TrustGraph graph({make_node("a"), make_node("b")}, {backed, verified});
    auto weights = scorer.effective_edge_weights(graph);
    EXPECT_NEAR(weights[0], 1.2, 1e-12);
    EXPECT_NEAR(weights[1], 1.44, 1e-12);
}

// ==========================================
// Determinism, convergence, percentiles
// ==========================================

TEST_F(ReputationScorerTest, RepeatedRunsAreBitIdentical) {
    std::vector<GraphNode> nodes = {
        make_node("a", 120.0), make_node("b", 0.0, 3000.0), make_node("c"), make_node("d", 50.0, 50.0)
    };
    nodes[2].metadata.content_quality = 72.5;
    nodes[2].metadata.verified_endorsements = 4;
    std::vector<GraphEdge> edges = {
        make_edge("a", "b", 0.7, kEpochMs), make_edge("b", "c", 1.3, kEpochMs + 40 * kDayMs),
        make_edge("c", "a", 0.2, kEpochMs + 90 * kDayMs), make_edge("d", "c", 2.0, kEpochMs + 400 * kDayMs),
        make_edge("a", "c", 0.9, kEpochMs + 10 * kDayMs, EdgeType::COLLABORATE)
    };

    ReputationReport first = ReputationScorer().score(nodes, edges);
    ReputationReport second = ReputationScorer().score(nodes, edges);

    for (const auto& [id, s] : first.scores) {
        const auto& t = second.scores.at(id);
        EXPECT_EQ(s.final_score, t.final_score) << id;
        EXPECT_EQ(s.graph_score, t.graph_score) << id;
        EXPECT_EQ(s.percentile, t.percentile) << id;
        EXPECT_EQ(s.explanation, t.explanation) << id;
        EXPECT_EQ(first.sybil.at(id).probability, second.sybil.at(id).probability) << id;
    }
}

TEST_F(ReputationScorerTest, NonConvergenceIsReported) {
    ScorerConfig config;
    config.max_iterations = 1;
    config.tolerance = 1e-15;
    ReputationScorer scorer(config);

    ReputationReport report = scorer.score(hub_graph(false));
    EXPECT_FALSE(report.metadata.converged);
    EXPECT_EQ(report.metadata.iterations, 1);
    EXPECT_GT(report.metadata.final_delta, 0.0);
    EXPECT_EQ(report.scores.at("hub").explanation.back(),
              "PageRank did not converge; score is provisional");
}

TEST_F(ReputationScorerTest, PageRankMassSumsToOne) {
    ReputationScorer scorer(precise);
    PageRankResult result = scorer.compute_pagerank(hub_graph(true));

    double total = 0.0;
    for (double r : result.ranks) total += r;
    EXPECT_NEAR(total, 1.0, 1e-9);
    EXPECT_TRUE(result.converged);
}

TEST_F(ReputationScorerTest, TiedScoresShareAveragePercentile) {
    ReputationScorer scorer;
    TrustGraph graph(
        {make_node("a"), make_node("b"), make_node("c"), make_node("d"), make_node("e")},
        {make_edge("a", "c"), make_edge("b", "c")});

    ReputationReport report = scorer.score(graph);
    EXPECT_DOUBLE_EQ(report.scores.at("c").percentile, 100.0);
    for (const char* id : {"a", "b", "d", "e"}) {
        EXPECT_DOUBLE_EQ(report.scores.at(id).percentile, 50.0) << id;
    }
    EXPECT_DOUBLE_EQ(percentile_sum(report), 50.0 * 6);
}

TEST(PercentileTest, AverageRankOfTiedGroup) {
    std::map<std::string, ReputationScore> scores;
    for (const auto& [id, value] : std::vector<std::pair<std::string, double>>{
             {"a", 1.0}, {"b", 2.0}, {"c", 2.0}, {"d", 3.0}}) {
        ReputationScore s;
        s.node_id = id;
        s.final_score = value;
        scores[id] = s;
    }

    ReputationScorer::assign_percentiles(scores);
    EXPECT_DOUBLE_EQ(scores["a"].percentile, 25.0);
    EXPECT_DOUBLE_EQ(scores["b"].percentile, 62.5);
    EXPECT_DOUBLE_EQ(scores["c"].percentile, 62.5);
    EXPECT_DOUBLE_EQ(scores["d"].percentile, 100.0);
}

TEST_F(ReputationScorerTest, HybridDisabledUsesGraphScore) {
    ScorerConfig config;
    config.hybrid_enabled = false;
    ReputationScorer scorer(config);

    std::vector<GraphNode> nodes = {make_node("a", 9000.0), make_node("b")};
    ReputationReport report = scorer.score(nodes, {make_edge("a", "b")});
    for (const auto& [id, s] : report.scores) {
        EXPECT_EQ(s.final_score, s.graph_score) << id;
    }
}

// ==========================================
// Fairness
// ==========================================

TEST(GiniTest, KnownValues) {
    EXPECT_DOUBLE_EQ(ReputationScorer::gini_coefficient({}), 0.0);
    EXPECT_DOUBLE_EQ(ReputationScorer::gini_coefficient({5.0, 5.0, 5.0}), 0.0);
    EXPECT_DOUBLE_EQ(ReputationScorer::gini_coefficient({0.0, 0.0, 0.0}), 0.0);
    EXPECT_DOUBLE_EQ(ReputationScorer::gini_coefficient({0.0, 0.0, 0.0, 1.0}), 0.75);
}

class FairnessTest : public ::testing::Test {
protected:
    // n8 and n9 are minority nodes without stake
    TrustGraph graph() const {
        std::vector<GraphNode> nodes;
        std::vector<GraphEdge> edges;
        for (int i = 0; i < 10; ++i) {
            std::string id = "n" + std::to_string(i);
            GraphNode node = i < 8 ? make_node(id, 10000.0, 10000.0) : make_node(id);
            if (i >= 8) node.metadata.minority_group = true;
            nodes.push_back(node);
            edges.push_back(make_edge(id, "n" + std::to_string((i + 1) % 10)));
        }
        return TrustGraph(nodes, edges);
    }
};

TEST_F(FairnessTest, MetricsDetectUnderRepresentation) {
    ReputationReport report = ReputationScorer().score(graph());

    ASSERT_TRUE(report.fairness.has_value());
    EXPECT_DOUBLE_EQ(report.fairness->minority_representation, 0.0);
    EXPECT_DOUBLE_EQ(report.fairness->bias_score, 0.5);
    EXPECT_GT(report.fairness->gini_coefficient, 0.0);
    EXPECT_FALSE(report.fairness_after_adjustment.has_value());
}

TEST_F(FairnessTest, AdjustmentBoostsMinorityAndPreservesTotal) {
    ReputationReport base = ReputationScorer().score(graph());

    ScorerConfig config;
    config.apply_fairness_adjustments = true;
    ReputationReport adjusted = ReputationScorer(config).score(graph());

    EXPECT_TRUE(adjusted.metadata.fairness_adjusted);
    EXPECT_TRUE(adjusted.fairness_after_adjustment.has_value());
    EXPECT_GT(adjusted.scores.at("n8").final_score, base.scores.at("n8").final_score);
    EXPECT_LT(adjusted.scores.at("n0").final_score, base.scores.at("n0").final_score);
    EXPECT_NEAR(total_final(adjusted), total_final(base), 1e-9 * total_final(base));
    EXPECT_NEAR(percentile_sum(adjusted), 50.0 * 11, 1e-9);
    EXPECT_EQ(adjusted.scores.at("n9").explanation.back().rfind("Fairness adjustment", 0), 0);
}

// ==========================================
// Sybil estimation and communities
// ==========================================

TEST_F(ReputationScorerTest, DenseZeroStakeCliqueLooksSybil) {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
    for (int i = 0; i < 6; ++i) nodes.push_back(make_node("c" + std::to_string(i)));
    for (int i = 0; i < 8; ++i) nodes.push_back(make_node("r" + std::to_string(i), 5000.0, 5000.0));
    for (int i = 0; i < 6; ++i) {
        for (int j = 0; j < 6; ++j) {
            if (i != j) edges.push_back(make_edge("c" + std::to_string(i), "c" + std::to_string(j)));
        }
    }
    for (int i = 0; i < 8; ++i) {
        edges.push_back(make_edge("r" + std::to_string(i), "r" + std::to_string((i + 1) % 8)));
    }

    ReputationReport report = ReputationScorer().score(nodes, edges);
    const auto& clique = report.sybil.at("c0");
    const auto& ring = report.sybil.at("r0");

    EXPECT_DOUBLE_EQ(clique.clustering_coefficient, 1.0);
    EXPECT_DOUBLE_EQ(ring.clustering_coefficient, 0.0);
    EXPECT_TRUE(clique.closed_community);
    EXPECT_TRUE(contains(clique.signals, "dense_local_clustering"));
    EXPECT_TRUE(contains(clique.signals, "closed_community"));
    EXPECT_GT(clique.probability, ring.probability);

    for (const auto& [id, p] : report.sybil_probabilities()) {
        EXPECT_GE(p, 0.0) << id;
        EXPECT_LE(p, 1.0) << id;
    }
}

TEST_F(ReputationScorerTest, LabelPropagationSeparatesComponents) {
    TrustGraph graph(
        {make_node("a"), make_node("b"), make_node("c"), make_node("d"), make_node("e"), make_node("f")},
        {make_edge("a", "b"), make_edge("b", "c"), make_edge("c", "a"),
         make_edge("d", "e"), make_edge("e", "f"), make_edge("f", "d")});

    auto labels = ReputationScorer().detect_communities(graph);
    EXPECT_EQ(labels, (std::vector<size_t>{0, 0, 0, 1, 1, 1}));
}

TEST_F(ReputationScorerTest, DeceptiveOpinionFilter) {
    // Burst: one source endorsing 12 accounts within minutes
    std::vector<GraphNode> nodes = {make_node("s")};
    std::vector<GraphEdge> edges;
    for (int i = 0; i < 12; ++i) {
        nodes.push_back(make_node("t" + std::to_string(i)));
        edges.push_back(make_edge("s", "t" + std::to_string(i), 0.5, kEpochMs + i * 60000));
    }
    edges.push_back(make_edge("s", "t0", 0.5, kEpochMs, EdgeType::FOLLOW));

    auto burst = ReputationScorer().detect_deceptive_opinions(TrustGraph(nodes, edges));
    EXPECT_EQ(burst.size(), 12);
    EXPECT_DOUBLE_EQ(burst.at("s->t0#0"), 0.3);
    EXPECT_EQ(burst.count("s->t0#12"), 0);

    // Self-promotion: strong endorsements inside a small community
    TrustGraph triangle(
        {make_node("x"), make_node("y"), make_node("z")},
        {make_edge("x", "y", 0.9), make_edge("y", "z", 0.9), make_edge("z", "x", 0.9)});
    auto promo = ReputationScorer().detect_deceptive_opinions(triangle);
    EXPECT_DOUBLE_EQ(promo.at("x->y#0"), 0.4);
}

// ==========================================
// Sensitivity audit
// ==========================================

class AuditTest : public ::testing::Test {
protected:
    TrustGraph graph() const {
        return TrustGraph(
            {make_node("a", 1000.0), make_node("b"), make_node("c"), make_node("t")},
            {make_edge("a", "t"), make_edge("b", "t"), make_edge("c", "b"),
             make_edge("c", "t"), make_edge("t", "c")});
    }
};

TEST_F(AuditTest, LeaveOneOutImpactsAreNegativeForEndorsements) {
    ScorerConfig config;
    config.tolerance = 1e-12;
    config.max_iterations = 1000;
    ReputationScorer scorer(config);

    SensitivityAudit audit = scorer.audit_sensitivity(graph(), "t");
    EXPECT_EQ(audit.node_id, "t");
    EXPECT_GT(audit.base_score, 0.0);

    ASSERT_EQ(audit.edge_sensitivity.size(), 3);
    EXPECT_EQ(audit.edge_sensitivity[0].edge_index, 0);
    EXPECT_EQ(audit.edge_sensitivity[1].edge_index, 1);
    EXPECT_EQ(audit.edge_sensitivity[2].edge_index, 3);
    for (const auto& e : audit.edge_sensitivity) {
        EXPECT_LT(e.impact, 0.0) << e.source << "->" << e.target;
        EXPECT_EQ(e.target, "t");
    }

    ASSERT_EQ(audit.top_influencing_edges.size(), 3);
    for (size_t i = 1; i < audit.top_influencing_edges.size(); ++i) {
        EXPECT_GE(std::abs(audit.top_influencing_edges[i - 1].impact),
                  std::abs(audit.top_influencing_edges[i].impact));
    }
}

TEST_F(AuditTest, TopKLimitsInfluencingEdges) {
    ScorerConfig config;
    config.audit_top_k = 1;
    SensitivityAudit audit = ReputationScorer(config).audit_sensitivity(graph(), "t");
    EXPECT_EQ(audit.edge_sensitivity.size(), 3);
    EXPECT_EQ(audit.top_influencing_edges.size(), 1);
}

TEST_F(AuditTest, RequestSelectsTopNodes) {
    ScoringRequest request;
    request.audit_nodes = {"b"};
    request.audit_top_n = 2;

    ReputationReport report = ReputationScorer().score(graph(), request);
    auto ranked = report.ranked_node_ids();

    std::vector<std::string> audited;
    for (const auto& a : report.audits) audited.push_back(a.node_id);
    EXPECT_EQ(audited.front(), "b");
    EXPECT_TRUE(contains(audited, ranked[0]));
    EXPECT_TRUE(contains(audited, ranked[1]));
    EXPECT_LE(audited.size(), 3);
}

TEST_F(AuditTest, UnknownOrExcessiveAuditRejected) {
    ScoringRequest unknown;
    unknown.audit_nodes = {"nobody"};
    EXPECT_THROW(ReputationScorer().score(graph(), unknown), ValidationError);

    ScorerConfig config;
    config.max_audited_nodes = 1;
    ScoringRequest too_many;
    too_many.audit_nodes = {"a", "b"};
    EXPECT_THROW(ReputationScorer(config).score(graph(), too_many), ValidationError);
}

// ==========================================
// Smoothing and configuration
// ==========================================

TEST(SmoothingTest, DecayedRollingAverage) {
    std::map<std::string, double> current = {{"a", 10.0}, {"b", 4.0}};
    std::vector<std::map<std::string, double>> history = {
        {{"a", 0.0}},
        {{"a", 5.0}, {"b", 4.0}}
    };

    auto smoothed = ReputationScorer::smooth_scores(current, history, 5, 0.5);
    EXPECT_NEAR(smoothed["a"], 12.5 / 1.75, 1e-12);
    EXPECT_NEAR(smoothed["b"], 4.0, 1e-12);

    auto recent_only = ReputationScorer::smooth_scores(current, history, 1, 0.5);
    EXPECT_NEAR(recent_only["a"], 12.5 / 1.5, 1e-12);
}

TEST(ScorerConfigTest, PartialJsonKeepsDefaults) {
    auto j = nlohmann::json::parse(R"({
        "damping_factor": 0.9,
        "hybrid": {"enabled": false, "graph_weight": 1.0},
        "sybil": {"burst_weight": 0.5}
    })");

    ScorerConfig config = ScorerConfig::from_json(j);
    EXPECT_DOUBLE_EQ(config.damping_factor, 0.9);
    EXPECT_FALSE(config.hybrid_enabled);
    EXPECT_DOUBLE_EQ(config.graph_weight, 1.0);
    EXPECT_DOUBLE_EQ(config.quality_weight, 0.25);
    EXPECT_DOUBLE_EQ(config.sybil.burst_weight, 0.5);
    EXPECT_DOUBLE_EQ(config.sybil.clustering_weight, 0.25);

    ScorerConfig reloaded = ScorerConfig::from_json(config.to_json());
    EXPECT_DOUBLE_EQ(reloaded.damping_factor, 0.9);
    EXPECT_FALSE(reloaded.hybrid_enabled);
}

TEST(ReportTest, JsonListsScoresByRank) {
    ReputationReport report = ReputationScorer().score(ring_graph(4));
    nlohmann::json j = report.to_json();

    ASSERT_TRUE(j.contains("scores"));
    EXPECT_EQ(j["scores"].size(), 4);
    EXPECT_TRUE(j["metadata"]["converged"].get<bool>());
    EXPECT_TRUE(j.contains("fairness"));
    EXPECT_TRUE(j.contains("sybil"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
