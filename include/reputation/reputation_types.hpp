#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Weights and thresholds of the Sybil-probability heuristic
 *
 * Each signal is in [0, 1]; the probability is the clamped weighted sum.
 */
struct SybilConfig {
    int64_t recent_window_ms = 7LL * 24 * 60 * 60 * 1000;  ///< "Very recent" edge age
    double endorsement_saturation = 10.0;      ///< Endorsement volume treated as "a lot"
    size_t suspicious_community_min_size = 5;  ///< Smallest community that can be closed
    double suspicious_external_ratio = 0.1;    ///< Below this share of external edges
    size_t spam_out_degree = 20;               ///< Out-degree flagged when in-degree < 2
    size_t sink_in_degree = 10;                ///< In-degree flagged when out-degree < 2

    double clustering_weight = 0.25;
    double burst_weight = 0.2;
    double economic_weight = 0.25;
    double community_weight = 0.3;
    double degree_anomaly_weight = 0.2;

    nlohmann::json to_json() const;
    static SybilConfig from_json(const nlohmann::json& j);
};

/**
 * @brief Configuration for the reputation scorer
 */
struct ScorerConfig {
    // PageRank
    double damping_factor = 0.85;          ///< Probability of following an edge
    int max_iterations = 100;              ///< Power-iteration cap
    double tolerance = 1e-6;               ///< L1 convergence threshold

    // Temporal weighting
    double temporal_decay = 0.1;           ///< Decay rate per year of edge age
    double recency_weight = 0.3;           ///< Share of edge weight exempt from decay

    // Edge metadata boosts
    double stake_edge_boost = 0.2;         ///< Multiplier bonus for stake-backed edges
    double payment_edge_boost = 0.15;      ///< Max multiplier bonus for payment-backed edges
    double verified_edge_boost = 0.2;      ///< Multiplier bonus for verified edges

    // Teleport bias toward economically committed nodes
    double teleport_stake_bias = 1.0;
    double teleport_payment_bias = 1.0;

    // Sub-score transforms (all sub-scores live on [0, 1000])
    double stake_scale = 100.0;
    double payment_scale = 1000.0;
    double log_multiplier = 200.0;
    double endorsement_quality_share = 0.2; ///< Part of quality taken from verified endorsements

    // Hybrid mix
    bool hybrid_enabled = true;
    double graph_weight = 0.5;
    double quality_weight = 0.25;
    double stake_weight = 0.15;
    double payment_weight = 0.1;

    // Fairness
    bool compute_fairness = true;
    bool apply_fairness_adjustments = false;
    double fairness_adjustment_strength = 0.2;

    // Sybil estimation
    bool compute_sybil = true;
    SybilConfig sybil;

    // Sensitivity audit
    size_t max_audited_nodes = 25;         ///< Hard cap on audited nodes per run
    size_t audit_top_k = 10;               ///< Edges kept in top_influencing_edges

    static ScorerConfig from_json(const nlohmann::json& j);
    static ScorerConfig from_json_file(const std::string& path);
    nlohmann::json to_json() const;
    void to_json_file(const std::string& path) const;

    bool validate(std::string& error_message) const;
};

/**
 * @brief Per-call options for ReputationScorer::score
 *
 * The audited set is the union of `audit_nodes` and the top `audit_top_n`
 * nodes by final score. It must stay within ScorerConfig::max_audited_nodes.
 */
struct ScoringRequest {
    std::vector<std::string> audit_nodes;
    size_t audit_top_n = 0;
};

// ============================================================================
// Results
// ============================================================================

struct ReputationScore {
    std::string node_id;
    double final_score = 0.0;
    double percentile = 0.0;               // 0-100, average rank of tied group
    double graph_score = 0.0;
    double quality_score = 0.0;
    double stake_score = 0.0;
    double payment_score = 0.0;
    std::vector<std::string> explanation;

    nlohmann::json to_json() const;
};

/**
 * @brief Distribution diagnostics; never used to gate access on their own
 */
struct FairnessMetrics {
    double gini_coefficient = 0.0;
    double minority_representation = 1.0;  // Top-decile share / population share
    double top_decile_diversity = 1.0;
    double bias_score = 0.0;

    nlohmann::json to_json() const;
};

struct EdgeImpact {
    size_t edge_index = 0;
    std::string source;
    std::string target;
    double impact = 0.0;                   // Score without the edge minus base score
    double relative_impact = 0.0;          // Percent of base score

    nlohmann::json to_json() const;
};

struct SensitivityAudit {
    std::string node_id;
    double base_score = 0.0;
    std::vector<EdgeImpact> edge_sensitivity;      // Incoming edges, input order
    std::vector<EdgeImpact> top_influencing_edges; // By |impact| descending

    nlohmann::json to_json() const;
};

/**
 * @brief Heuristic Sybil signal for one node
 *
 * `probability` is a ranked signal for a separate policy threshold. It is
 * not a verdict and must not be the sole gate for an irreversible action.
 */
struct SybilEstimate {
    double probability = 0.0;
    double clustering_coefficient = 0.0;
    double recent_edge_excess = 0.0;
    double economic_mismatch = 0.0;
    bool closed_community = false;
    bool degree_anomaly = false;
    std::vector<std::string> signals;

    nlohmann::json to_json() const;
};

struct PageRankResult {
    std::vector<double> ranks;             // Indexed like TrustGraph nodes, sums to 1
    int iterations = 0;
    bool converged = true;
    double final_delta = 0.0;
};

struct RunMetadata {
    bool converged = true;
    int iterations = 0;
    double final_delta = 0.0;
    size_t num_nodes = 0;
    size_t num_edges = 0;
    bool fairness_adjusted = false;

    nlohmann::json to_json() const;
};

struct ReputationReport {
    std::map<std::string, ReputationScore> scores;
    std::optional<FairnessMetrics> fairness;
    std::optional<FairnessMetrics> fairness_after_adjustment;
    std::map<std::string, SybilEstimate> sybil;
    std::vector<SensitivityAudit> audits;
    RunMetadata metadata;

    bool empty() const { return scores.empty(); }

    /**
     * @brief Node id -> Sybil probability
     */
    std::map<std::string, double> sybil_probabilities() const;

    /**
     * @brief Node ids by final score descending, ties by id
     */
    std::vector<std::string> ranked_node_ids() const;

    nlohmann::json to_json() const;
    void export_to_json(const std::string& filename) const;
};

} // namespace tg
