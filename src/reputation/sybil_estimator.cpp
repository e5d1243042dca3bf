#include "reputation/reputation_scorer.hpp"
#include "graph/set_metrics.hpp"
#include <algorithm>
#include <cmath>

namespace tg {

namespace {

constexpr int kMaxLabelSweeps = 10;
constexpr int64_t kBurstWindowMs = 24LL * 60 * 60 * 1000;
constexpr size_t kBurstEdgeCount = 10;

bool is_opinion_edge(const GraphEdge& edge) {
    return edge.edge_type == EdgeType::ENDORSE || edge.edge_type == EdgeType::REVIEW;
}

} // namespace

// ==========================================
// Community detection
// ==========================================

std::vector<size_t> ReputationScorer::detect_communities(const TrustGraph& graph) const {
    const size_t n = graph.num_nodes();
    std::vector<size_t> labels(n);
    std::vector<std::vector<size_t>> neighbors(n);
    for (size_t i = 0; i < n; ++i) {
        labels[i] = i;
        neighbors[i] = graph.undirected_neighbors(i);
    }

    for (int sweep = 0; sweep < kMaxLabelSweeps; ++sweep) {
        bool changed = false;

        for (size_t i = 0; i < n; ++i) {
            if (neighbors[i].empty()) continue;

            std::map<size_t, size_t> counts;
            for (size_t nb : neighbors[i]) {
                counts[labels[nb]]++;
            }

            // std::map is ordered, so the first maximum is the smallest label
            size_t best_label = labels[i];
            size_t best_count = 0;
            for (const auto& [label, count] : counts) {
                if (count > best_count) {
                    best_count = count;
                    best_label = label;
                }
            }

            if (best_label != labels[i]) {
                labels[i] = best_label;
                changed = true;
            }
        }

        if (!changed) break;
    }

    // Compact labels in order of first appearance
    std::map<size_t, size_t> compact;
    for (auto& label : labels) {
        auto it = compact.find(label);
        if (it == compact.end()) {
            it = compact.emplace(label, compact.size()).first;
        }
        label = it->second;
    }

    return labels;
}

// ==========================================
// Sybil estimation
// ==========================================

std::map<std::string, SybilEstimate> ReputationScorer::estimate_sybil_probabilities(
    const TrustGraph& graph,
    const std::map<std::string, ReputationScore>& scores) const {

    std::map<std::string, SybilEstimate> estimates;
    const size_t n = graph.num_nodes();
    if (n == 0) return estimates;

    const SybilConfig& sc = config_.sybil;

    std::vector<std::vector<size_t>> neighbors(n);
    for (size_t i = 0; i < n; ++i) {
        neighbors[i] = graph.undirected_neighbors(i);
    }
    auto linked = [&neighbors](size_t a, size_t b) {
        return std::binary_search(neighbors[a].begin(), neighbors[a].end(), b);
    };

    // Share of declared edge weight created inside the recent window
    const int64_t newest = graph.newest_timestamp();
    auto is_recent = [&](const GraphEdge& e) { return newest - e.timestamp <= sc.recent_window_ms; };

    double total_weight = 0.0;
    double recent_weight = 0.0;
    for (const auto& e : graph.edges()) {
        total_weight += e.weight;
        if (is_recent(e)) recent_weight += e.weight;
    }
    const double global_recent_share = total_weight > 0.0 ? recent_weight / total_weight : 0.0;

    // Closed communities: large enough and almost no edges leaving them
    const std::vector<size_t> community = detect_communities(graph);
    std::map<size_t, size_t> community_size;
    std::map<size_t, size_t> internal_edges;
    std::map<size_t, size_t> external_edges;
    for (size_t i = 0; i < n; ++i) community_size[community[i]]++;
    for (size_t e = 0; e < graph.num_edges(); ++e) {
        size_t cs = community[graph.source_index(e)];
        size_t ct = community[graph.target_index(e)];
        if (cs == ct) {
            internal_edges[cs]++;
        } else {
            external_edges[cs]++;
            external_edges[ct]++;
        }
    }
    auto is_closed = [&](size_t c) {
        if (community_size[c] < sc.suspicious_community_min_size) return false;
        double internal = static_cast<double>(internal_edges[c]);
        double external = static_cast<double>(external_edges[c]);
        return external / (internal + external + 1.0) < sc.suspicious_external_ratio;
    };

    // Graph-score z-scores for the low-influence check
    double mean = 0.0;
    for (const auto& [id, s] : scores) mean += s.graph_score;
    mean /= static_cast<double>(std::max<size_t>(1, scores.size()));
    double variance = 0.0;
    for (const auto& [id, s] : scores) variance += (s.graph_score - mean) * (s.graph_score - mean);
    variance /= static_cast<double>(std::max<size_t>(1, scores.size()));
    const double stddev = std::sqrt(variance);

    for (size_t i = 0; i < n; ++i) {
        const GraphNode& node = graph.node(i);
        SybilEstimate est;

        est.clustering_coefficient = local_clustering_coefficient(neighbors[i], linked);

        double node_weight = 0.0;
        double node_recent = 0.0;
        size_t endorse_in = 0;
        for (size_t e : graph.in_edges(i)) {
            const GraphEdge& edge = graph.edge(e);
            node_weight += edge.weight;
            if (is_recent(edge)) node_recent += edge.weight;
            if (edge.edge_type == EdgeType::ENDORSE) endorse_in++;
        }
        if (node_weight > 0.0 && global_recent_share < 1.0) {
            double node_share = node_recent / node_weight;
            est.recent_edge_excess = std::max(0.0, node_share - global_recent_share) / (1.0 - global_recent_share);
        }

        double stake_score = 0.0;
        double payment_score = 0.0;
        double graph_score = mean;
        auto it = scores.find(node.id);
        if (it != scores.end()) {
            stake_score = it->second.stake_score;
            payment_score = it->second.payment_score;
            graph_score = it->second.graph_score;
        }
        double volume = std::max(static_cast<double>(node.metadata.verified_endorsements.value_or(0)),
                                 static_cast<double>(endorse_in));
        double backing = std::max(stake_score, payment_score) / 1000.0;
        est.economic_mismatch = std::min(1.0, volume / sc.endorsement_saturation) * (1.0 - backing);

        est.closed_community = is_closed(community[i]);

        size_t in_degree = graph.in_edges(i).size();
        size_t out_degree = graph.out_edges(i).size();
        double z = stddev > 0.0 ? (graph_score - mean) / stddev : 0.0;
        est.degree_anomaly = (out_degree > sc.spam_out_degree && in_degree < 2) ||
                             (in_degree > sc.sink_in_degree && out_degree < 2) ||
                             (z < -1.0 && in_degree > 5);

        double p = sc.clustering_weight * est.clustering_coefficient
                 + sc.burst_weight * est.recent_edge_excess
                 + sc.economic_weight * est.economic_mismatch
                 + sc.community_weight * (est.closed_community ? 1.0 : 0.0)
                 + sc.degree_anomaly_weight * (est.degree_anomaly ? 1.0 : 0.0);
        est.probability = std::max(0.0, std::min(1.0, p));

        if (est.clustering_coefficient > 0.5) est.signals.push_back("dense_local_clustering");
        if (est.recent_edge_excess > 0.5) est.signals.push_back("recent_edge_burst");
        if (est.economic_mismatch > 0.5) est.signals.push_back("unbacked_endorsements");
        if (est.closed_community) est.signals.push_back("closed_community");
        if (est.degree_anomaly) est.signals.push_back("degree_anomaly");

        estimates.emplace(node.id, std::move(est));
    }

    return estimates;
}

// ==========================================
// Deceptive opinion filter
// ==========================================

std::map<std::string, double> ReputationScorer::detect_deceptive_opinions(const TrustGraph& graph) const {
    std::map<std::string, double> result;
    if (graph.num_edges() == 0) return result;

    const std::vector<size_t> community = detect_communities(graph);
    std::map<size_t, size_t> community_size;
    for (size_t c : community) community_size[c]++;

    // Weak edges per (source community, target)
    std::map<std::pair<size_t, size_t>, size_t> weak_from_community;
    for (size_t e = 0; e < graph.num_edges(); ++e) {
        if (graph.edge(e).weight < 0.3) {
            weak_from_community[{community[graph.source_index(e)], graph.target_index(e)}]++;
        }
    }

    for (size_t e = 0; e < graph.num_edges(); ++e) {
        const GraphEdge& edge = graph.edge(e);
        if (!is_opinion_edge(edge)) continue;

        size_t src = graph.source_index(e);
        size_t tgt = graph.target_index(e);
        double p = 0.0;

        // Self-promotion inside a small tight community
        size_t size = community_size[community[src]];
        if (community[src] == community[tgt] && size >= 3 && size <= 20 && edge.weight > 0.8) {
            p += 0.4;
        }

        // Coordinated bad-mouthing
        if (edge.weight < 0.2 && weak_from_community[{community[src], tgt}] >= 3) {
            p += 0.4;
        }

        // Burst of edges from the same source
        size_t burst = 0;
        for (size_t other : graph.out_edges(src)) {
            int64_t gap = graph.edge(other).timestamp - edge.timestamp;
            if (gap >= -kBurstWindowMs && gap <= kBurstWindowMs) burst++;
        }
        if (burst > kBurstEdgeCount) {
            p += 0.3;
        }

        result[describe_edge(edge, e)] = std::min(1.0, p);
    }

    return result;
}

} // namespace tg
