#pragma once

#include "graph/trust_graph.hpp"
#include "reputation/reputation_types.hpp"
#include <map>
#include <string>
#include <vector>

namespace tg {

/**
 * @brief Temporal, economically weighted PageRank with hybrid scoring
 *
 * A scorer is a caller-owned value configured at construction. Every
 * computation is a pure function of the snapshot and the configuration:
 * no wall clock, no randomness, iteration in node/edge input order. Running
 * the same snapshot twice yields bit-identical scores.
 *
 * Pipeline of score():
 *  1. effective edge weights (metadata boosts, recency-blended decay)
 *  2. PageRank with a stake/payment-biased teleport vector
 *  3. graph/quality/stake/payment sub-scores and the hybrid final score
 *  4. percentiles (average rank of tied groups)
 *  5. optional fairness metrics and adjustment
 *  6. optional Sybil estimates
 *  7. optional leave-one-out sensitivity audits
 */
class ReputationScorer {
public:
    /**
     * @throws std::invalid_argument when the configuration does not validate
     */
    explicit ReputationScorer(const ScorerConfig& config = {});

    const ScorerConfig& config() const { return config_; }
    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    // ==========================================
    // Full runs
    // ==========================================

    ReputationReport score(const TrustGraph& graph, const ScoringRequest& request = {}) const;

    /**
     * @brief Validate a raw node/edge list, then score it
     * @throws ValidationError naming the offending node or edge
     */
    ReputationReport score(std::vector<GraphNode> nodes,
                           std::vector<GraphEdge> edges,
                           const ScoringRequest& request = {}) const;

    // ==========================================
    // Individual stages
    // ==========================================

    /**
     * @brief Per-edge weight after metadata boosts and temporal decay
     *
     * Age is measured from the newest edge timestamp of the snapshot.
     */
    std::vector<double> effective_edge_weights(const TrustGraph& graph) const;

    /**
     * @brief Restart distribution biased toward stake and payment history
     */
    std::vector<double> teleport_distribution(const TrustGraph& graph) const;

    PageRankResult compute_pagerank(const TrustGraph& graph) const;

    /**
     * @brief Sub-scores, final scores and percentiles from a PageRank run
     */
    std::map<std::string, ReputationScore> compute_hybrid_scores(
        const TrustGraph& graph,
        const PageRankResult& pagerank) const;

    FairnessMetrics compute_fairness_metrics(
        const TrustGraph& graph,
        const std::map<std::string, ReputationScore>& scores) const;

    /**
     * @brief Boost under-represented minority scores, preserving total mass
     *
     * A bias-mitigation heuristic, not a correctness requirement. Percentiles
     * are recomputed afterwards.
     * @return true if any score changed
     */
    bool apply_fairness_adjustments(
        const TrustGraph& graph,
        std::map<std::string, ReputationScore>& scores) const;

    std::map<std::string, SybilEstimate> estimate_sybil_probabilities(
        const TrustGraph& graph,
        const std::map<std::string, ReputationScore>& scores) const;

    /**
     * @brief Leave-one-out influence of each incoming edge on graph_score
     *
     * Costs one PageRank run per incoming edge; callers bound the audited set.
     * @throws ValidationError for an unknown node id
     */
    SensitivityAudit audit_sensitivity(const TrustGraph& graph, const std::string& node_id) const;

    /**
     * @brief Label-propagation communities, one label per node index
     *
     * Nodes are visited in index order; ties go to the smallest label.
     */
    std::vector<size_t> detect_communities(const TrustGraph& graph) const;

    /**
     * @brief Deception probability of ENDORSE/REVIEW edges
     *
     * Flags self-promotion inside small communities, coordinated
     * bad-mouthing from one community, and bursts from a single source.
     * Keys are "source->target#index".
     */
    std::map<std::string, double> detect_deceptive_opinions(const TrustGraph& graph) const;

    // ==========================================
    // Helpers
    // ==========================================

    /**
     * @brief Monotone map of a PageRank mass onto [0, 1000)
     */
    static double graph_score_from_rank(double rank, size_t num_nodes);

    /**
     * @brief Percentile = 100 * averageRank / N, ranks ascending by score
     *
     * Exactly equal scores share the mean of the ranks they occupy, so
     * the percentiles of a run always sum to 50 * (N + 1).
     */
    static void assign_percentiles(std::map<std::string, ReputationScore>& scores);

    /**
     * @brief Gini coefficient of non-negative values (0 when the sum is 0)
     */
    static double gini_coefficient(std::vector<double> values);

    /**
     * @brief Exponentially decayed rolling average over a score history
     *
     * The current scores get weight 1, the most recent historical map
     * decay_factor, the one before decay_factor^2, and so on, over the last
     * `window_size` maps.
     */
    static std::map<std::string, double> smooth_scores(
        const std::map<std::string, double>& current,
        const std::vector<std::map<std::string, double>>& history,
        size_t window_size = 5,
        double decay_factor = 0.8);

private:
    ScorerConfig config_;
    ProgressCallback progress_cb_;

    void report_progress(const std::string& stage, int current, int total) const;

    std::vector<std::string> select_audit_nodes(
        const TrustGraph& graph,
        const ReputationReport& report,
        const ScoringRequest& request) const;
};

} // namespace tg
