#include "reputation/reputation_types.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace tg {

// ============================================================================
// SybilConfig
// ============================================================================

json SybilConfig::to_json() const {
    json j;
    j["recent_window_ms"] = recent_window_ms;
    j["endorsement_saturation"] = endorsement_saturation;
    j["suspicious_community_min_size"] = suspicious_community_min_size;
    j["suspicious_external_ratio"] = suspicious_external_ratio;
    j["spam_out_degree"] = spam_out_degree;
    j["sink_in_degree"] = sink_in_degree;
    j["clustering_weight"] = clustering_weight;
    j["burst_weight"] = burst_weight;
    j["economic_weight"] = economic_weight;
    j["community_weight"] = community_weight;
    j["degree_anomaly_weight"] = degree_anomaly_weight;
    return j;
}

SybilConfig SybilConfig::from_json(const json& j) {
    SybilConfig config;
    if (j.contains("recent_window_ms")) config.recent_window_ms = j["recent_window_ms"];
    if (j.contains("endorsement_saturation")) config.endorsement_saturation = j["endorsement_saturation"];
    if (j.contains("suspicious_community_min_size")) {
        config.suspicious_community_min_size = j["suspicious_community_min_size"];
    }
    if (j.contains("suspicious_external_ratio")) config.suspicious_external_ratio = j["suspicious_external_ratio"];
    if (j.contains("spam_out_degree")) config.spam_out_degree = j["spam_out_degree"];
    if (j.contains("sink_in_degree")) config.sink_in_degree = j["sink_in_degree"];
    if (j.contains("clustering_weight")) config.clustering_weight = j["clustering_weight"];
    if (j.contains("burst_weight")) config.burst_weight = j["burst_weight"];
    if (j.contains("economic_weight")) config.economic_weight = j["economic_weight"];
    if (j.contains("community_weight")) config.community_weight = j["community_weight"];
    if (j.contains("degree_anomaly_weight")) config.degree_anomaly_weight = j["degree_anomaly_weight"];
    return config;
}

// ============================================================================
// ScorerConfig
// ============================================================================

ScorerConfig ScorerConfig::from_json(const json& j) {
    ScorerConfig config;

    // PageRank
    if (j.contains("damping_factor")) config.damping_factor = j["damping_factor"];
    if (j.contains("max_iterations")) config.max_iterations = j["max_iterations"];
    if (j.contains("tolerance")) config.tolerance = j["tolerance"];

    // Temporal weighting
    if (j.contains("temporal_decay")) config.temporal_decay = j["temporal_decay"];
    if (j.contains("recency_weight")) config.recency_weight = j["recency_weight"];

    // Edge boosts
    if (j.contains("stake_edge_boost")) config.stake_edge_boost = j["stake_edge_boost"];
    if (j.contains("payment_edge_boost")) config.payment_edge_boost = j["payment_edge_boost"];
    if (j.contains("verified_edge_boost")) config.verified_edge_boost = j["verified_edge_boost"];

    // Teleport bias
    if (j.contains("teleport_stake_bias")) config.teleport_stake_bias = j["teleport_stake_bias"];
    if (j.contains("teleport_payment_bias")) config.teleport_payment_bias = j["teleport_payment_bias"];

    // Sub-score transforms
    if (j.contains("stake_scale")) config.stake_scale = j["stake_scale"];
    if (j.contains("payment_scale")) config.payment_scale = j["payment_scale"];
    if (j.contains("log_multiplier")) config.log_multiplier = j["log_multiplier"];
    if (j.contains("endorsement_quality_share")) config.endorsement_quality_share = j["endorsement_quality_share"];

    // Hybrid mix - accept both a nested "hybrid" object and flat keys
    const json& hybrid = j.contains("hybrid") ? j["hybrid"] : j;
    if (hybrid.contains("hybrid_enabled")) config.hybrid_enabled = hybrid["hybrid_enabled"];
    if (hybrid.contains("enabled")) config.hybrid_enabled = hybrid["enabled"];
    if (hybrid.contains("graph_weight")) config.graph_weight = hybrid["graph_weight"];
    if (hybrid.contains("quality_weight")) config.quality_weight = hybrid["quality_weight"];
    if (hybrid.contains("stake_weight")) config.stake_weight = hybrid["stake_weight"];
    if (hybrid.contains("payment_weight")) config.payment_weight = hybrid["payment_weight"];

    // Fairness
    if (j.contains("compute_fairness")) config.compute_fairness = j["compute_fairness"];
    if (j.contains("apply_fairness_adjustments")) config.apply_fairness_adjustments = j["apply_fairness_adjustments"];
    if (j.contains("fairness_adjustment_strength")) {
        config.fairness_adjustment_strength = j["fairness_adjustment_strength"];
    }

    // Sybil
    if (j.contains("compute_sybil")) config.compute_sybil = j["compute_sybil"];
    if (j.contains("sybil")) config.sybil = SybilConfig::from_json(j["sybil"]);

    // Audit
    if (j.contains("max_audited_nodes")) config.max_audited_nodes = j["max_audited_nodes"];
    if (j.contains("audit_top_k")) config.audit_top_k = j["audit_top_k"];

    return config;
}

ScorerConfig ScorerConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    // Allow a combined config file with a "scorer" section
    if (j.contains("scorer")) {
        return from_json(j["scorer"]);
    }
    return from_json(j);
}

json ScorerConfig::to_json() const {
    json j;

    j["damping_factor"] = damping_factor;
    j["max_iterations"] = max_iterations;
    j["tolerance"] = tolerance;

    j["temporal_decay"] = temporal_decay;
    j["recency_weight"] = recency_weight;

    j["stake_edge_boost"] = stake_edge_boost;
    j["payment_edge_boost"] = payment_edge_boost;
    j["verified_edge_boost"] = verified_edge_boost;

    j["teleport_stake_bias"] = teleport_stake_bias;
    j["teleport_payment_bias"] = teleport_payment_bias;

    j["stake_scale"] = stake_scale;
    j["payment_scale"] = payment_scale;
    j["log_multiplier"] = log_multiplier;
    j["endorsement_quality_share"] = endorsement_quality_share;

    j["hybrid"] = {
        {"enabled", hybrid_enabled},
        {"graph_weight", graph_weight},
        {"quality_weight", quality_weight},
        {"stake_weight", stake_weight},
        {"payment_weight", payment_weight}
    };

    j["compute_fairness"] = compute_fairness;
    j["apply_fairness_adjustments"] = apply_fairness_adjustments;
    j["fairness_adjustment_strength"] = fairness_adjustment_strength;

    j["compute_sybil"] = compute_sybil;
    j["sybil"] = sybil.to_json();

    j["max_audited_nodes"] = max_audited_nodes;
    j["audit_top_k"] = audit_top_k;

    return j;
}

void ScorerConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

bool ScorerConfig::validate(std::string& error_message) const {
    if (!(damping_factor > 0.0 && damping_factor < 1.0)) {
        error_message = "Damping factor must be in (0, 1)";
        return false;
    }

    if (max_iterations <= 0) {
        error_message = "max_iterations must be positive";
        return false;
    }

    if (!(tolerance > 0.0) || !std::isfinite(tolerance)) {
        error_message = "Tolerance must be a positive finite number";
        return false;
    }

    if (!(temporal_decay >= 0.0) || !std::isfinite(temporal_decay)) {
        error_message = "temporal_decay must be non-negative";
        return false;
    }

    if (!(recency_weight >= 0.0 && recency_weight <= 1.0)) {
        error_message = "recency_weight must be between 0.0 and 1.0";
        return false;
    }

    for (double boost : {stake_edge_boost, payment_edge_boost, verified_edge_boost,
                         teleport_stake_bias, teleport_payment_bias}) {
        if (!(boost >= 0.0) || !std::isfinite(boost)) {
            error_message = "Edge boosts and teleport biases must be non-negative";
            return false;
        }
    }

    if (!(stake_scale > 0.0) || !(payment_scale > 0.0) || !(log_multiplier > 0.0)) {
        error_message = "Sub-score scales must be positive";
        return false;
    }

    if (!(endorsement_quality_share >= 0.0 && endorsement_quality_share <= 1.0)) {
        error_message = "endorsement_quality_share must be between 0.0 and 1.0";
        return false;
    }

    if (hybrid_enabled) {
        for (double w : {graph_weight, quality_weight, stake_weight, payment_weight}) {
            if (!(w >= 0.0) || !std::isfinite(w)) {
                error_message = "Hybrid weights must be non-negative";
                return false;
            }
        }
        if (graph_weight + quality_weight + stake_weight + payment_weight <= 0.0) {
            error_message = "Hybrid weights sum to zero";
            return false;
        }
    }

    if (!(fairness_adjustment_strength >= 0.0 && fairness_adjustment_strength <= 1.0)) {
        error_message = "fairness_adjustment_strength must be between 0.0 and 1.0";
        return false;
    }

    if (sybil.recent_window_ms < 0 || !(sybil.endorsement_saturation > 0.0)) {
        error_message = "Sybil recent window must be non-negative and saturation positive";
        return false;
    }

    return true;
}

// ============================================================================
// Result serialization
// ============================================================================

json ReputationScore::to_json() const {
    json j;
    j["node_id"] = node_id;
    j["final_score"] = final_score;
    j["percentile"] = percentile;
    j["graph_score"] = graph_score;
    j["quality_score"] = quality_score;
    j["stake_score"] = stake_score;
    j["payment_score"] = payment_score;
    j["explanation"] = explanation;
    return j;
}

json FairnessMetrics::to_json() const {
    json j;
    j["gini_coefficient"] = gini_coefficient;
    j["minority_representation"] = minority_representation;
    j["top_decile_diversity"] = top_decile_diversity;
    j["bias_score"] = bias_score;
    return j;
}

json EdgeImpact::to_json() const {
    json j;
    j["edge_index"] = edge_index;
    j["source"] = source;
    j["target"] = target;
    j["impact"] = impact;
    j["relative_impact"] = relative_impact;
    return j;
}

json SensitivityAudit::to_json() const {
    json j;
    j["node_id"] = node_id;
    j["base_score"] = base_score;

    json sensitivity = json::array();
    for (const auto& e : edge_sensitivity) sensitivity.push_back(e.to_json());
    j["edge_sensitivity"] = sensitivity;

    json top = json::array();
    for (const auto& e : top_influencing_edges) top.push_back(e.to_json());
    j["top_influencing_edges"] = top;

    return j;
}

json SybilEstimate::to_json() const {
    json j;
    j["probability"] = probability;
    j["clustering_coefficient"] = clustering_coefficient;
    j["recent_edge_excess"] = recent_edge_excess;
    j["economic_mismatch"] = economic_mismatch;
    j["closed_community"] = closed_community;
    j["degree_anomaly"] = degree_anomaly;
    j["signals"] = signals;
    return j;
}

json RunMetadata::to_json() const {
    json j;
    j["converged"] = converged;
    j["iterations"] = iterations;
    j["final_delta"] = final_delta;
    j["num_nodes"] = num_nodes;
    j["num_edges"] = num_edges;
    j["fairness_adjusted"] = fairness_adjusted;
    return j;
}

// ============================================================================
// ReputationReport
// ============================================================================

std::map<std::string, double> ReputationReport::sybil_probabilities() const {
    std::map<std::string, double> result;
    for (const auto& [id, estimate] : sybil) {
        result[id] = estimate.probability;
    }
    return result;
}

std::vector<std::string> ReputationReport::ranked_node_ids() const {
    std::vector<const ReputationScore*> ordered;
    ordered.reserve(scores.size());
    for (const auto& [id, score] : scores) {
        ordered.push_back(&score);
    }

    // std::map iteration is by id, so a stable sort keeps ties in id order
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const ReputationScore* a, const ReputationScore* b) {
            return a->final_score > b->final_score;
        });

    std::vector<std::string> ids;
    ids.reserve(ordered.size());
    for (const auto* s : ordered) ids.push_back(s->node_id);
    return ids;
}

json ReputationReport::to_json() const {
    json j;
    j["metadata"] = metadata.to_json();

    json scores_json = json::array();
    for (const auto& id : ranked_node_ids()) {
        scores_json.push_back(scores.at(id).to_json());
    }
    j["scores"] = scores_json;

    if (fairness) j["fairness"] = fairness->to_json();
    if (fairness_after_adjustment) j["fairness_after_adjustment"] = fairness_after_adjustment->to_json();

    if (!sybil.empty()) {
        json sybil_json = json::object();
        for (const auto& [id, estimate] : sybil) {
            sybil_json[id] = estimate.to_json();
        }
        j["sybil"] = sybil_json;
    }

    json audits_json = json::array();
    for (const auto& audit : audits) audits_json.push_back(audit.to_json());
    j["audits"] = audits_json;

    return j;
}

void ReputationReport::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

} // namespace tg
