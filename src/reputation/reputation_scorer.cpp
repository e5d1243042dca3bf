#include "reputation/reputation_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace tg {

namespace {

constexpr double kMsPerYear = 365.0 * 24.0 * 60.0 * 60.0 * 1000.0;
constexpr double kMaxSubScore = 1000.0;

std::string format_factor(const std::string& label, double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << label << ": " << value;
    return oss.str();
}

double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

} // namespace

ReputationScorer::ReputationScorer(const ScorerConfig& config)
    : config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid scorer configuration: " + error);
    }
}

void ReputationScorer::report_progress(const std::string& stage, int current, int total) const {
    if (progress_cb_) {
        progress_cb_(stage, current, total);
    }
}

// ==========================================
// Full runs
// ==========================================

ReputationReport ReputationScorer::score(std::vector<GraphNode> nodes,
                                         std::vector<GraphEdge> edges,
                                         const ScoringRequest& request) const {
    TrustGraph graph(std::move(nodes), std::move(edges));
    return score(graph, request);
}

ReputationReport ReputationScorer::score(const TrustGraph& graph, const ScoringRequest& request) const {
    ReputationReport report;
    report.metadata.num_nodes = graph.num_nodes();
    report.metadata.num_edges = graph.num_edges();

    if (graph.empty()) {
        if (!request.audit_nodes.empty()) {
            throw ValidationError("Audit requested on an empty graph", request.audit_nodes.front());
        }
        return report;
    }

    report_progress("Computing PageRank", 0, 100);
    PageRankResult pagerank = compute_pagerank(graph);
    report.metadata.converged = pagerank.converged;
    report.metadata.iterations = pagerank.iterations;
    report.metadata.final_delta = pagerank.final_delta;

    report_progress("Computing hybrid scores", 30, 100);
    report.scores = compute_hybrid_scores(graph, pagerank);

    if (config_.compute_fairness) {
        report_progress("Computing fairness metrics", 45, 100);
        report.fairness = compute_fairness_metrics(graph, report.scores);

        if (config_.apply_fairness_adjustments) {
            report.metadata.fairness_adjusted = apply_fairness_adjustments(graph, report.scores);
            if (report.metadata.fairness_adjusted) {
                report.fairness_after_adjustment = compute_fairness_metrics(graph, report.scores);
            }
        }
    }

    if (config_.compute_sybil) {
        report_progress("Estimating Sybil probabilities", 60, 100);
        report.sybil = estimate_sybil_probabilities(graph, report.scores);
    }

    std::vector<std::string> audited = select_audit_nodes(graph, report, request);
    for (size_t i = 0; i < audited.size(); ++i) {
        report_progress("Sensitivity audit", static_cast<int>(i), static_cast<int>(audited.size()));
        report.audits.push_back(audit_sensitivity(graph, audited[i]));
    }

    report_progress("Scoring complete", 100, 100);
    return report;
}

std::vector<std::string> ReputationScorer::select_audit_nodes(
    const TrustGraph& graph,
    const ReputationReport& report,
    const ScoringRequest& request) const {

    std::vector<std::string> selected;
    std::set<std::string> seen;

    for (const auto& id : request.audit_nodes) {
        if (!graph.has_node(id)) {
            throw ValidationError("Audit requested for unknown node", id);
        }
        if (seen.insert(id).second) {
            selected.push_back(id);
        }
    }

    if (request.audit_top_n > 0) {
        std::vector<std::string> ranked = report.ranked_node_ids();
        size_t n = std::min(request.audit_top_n, ranked.size());
        for (size_t i = 0; i < n; ++i) {
            if (seen.insert(ranked[i]).second) {
                selected.push_back(ranked[i]);
            }
        }
    }

    if (selected.size() > config_.max_audited_nodes) {
        throw ValidationError(
            "Audit set of " + std::to_string(selected.size()) +
            " nodes exceeds max_audited_nodes=" + std::to_string(config_.max_audited_nodes),
            selected[config_.max_audited_nodes]);
    }

    return selected;
}

// ==========================================
// Edge weights and teleport vector
// ==========================================

std::vector<double> ReputationScorer::effective_edge_weights(const TrustGraph& graph) const {
    std::vector<double> weights;
    weights.reserve(graph.num_edges());

    const int64_t newest = graph.newest_timestamp();

    for (const auto& edge : graph.edges()) {
        double w = edge.weight;

        if (edge.metadata.endorsement_strength) {
            // Strength in [0, 1] scales the edge between half and full weight
            w *= 0.5 + 0.5 * clamp01(*edge.metadata.endorsement_strength);
        }
        if (edge.metadata.stake_backed) {
            w *= 1.0 + config_.stake_edge_boost;
        }
        if (edge.metadata.payment_amount && *edge.metadata.payment_amount > 0.0) {
            double saturation = std::min(1.0, std::log1p(*edge.metadata.payment_amount / config_.payment_scale) / 10.0);
            w *= 1.0 + config_.payment_edge_boost * saturation;
        }
        if (edge.metadata.verified) {
            w *= 1.0 + config_.verified_edge_boost;
        }

        double age_years = static_cast<double>(newest - edge.timestamp) / kMsPerYear;
        double decay = std::exp(-config_.temporal_decay * age_years);
        w *= config_.recency_weight + (1.0 - config_.recency_weight) * decay;

        weights.push_back(w);
    }

    return weights;
}

std::vector<double> ReputationScorer::teleport_distribution(const TrustGraph& graph) const {
    std::vector<double> teleport(graph.num_nodes(), 0.0);
    double total = 0.0;

    for (size_t i = 0; i < graph.num_nodes(); ++i) {
        const auto& meta = graph.node(i).metadata;
        double mass = 1.0
            + config_.teleport_stake_bias * std::log1p(meta.stake_or_zero() / config_.stake_scale)
            + config_.teleport_payment_bias * std::log1p(meta.payment_or_zero() / config_.payment_scale);
        teleport[i] = mass;
        total += mass;
    }

    if (total > 0.0) {
        for (auto& t : teleport) t /= total;
    }
    return teleport;
}

// ==========================================
// PageRank
// ==========================================

PageRankResult ReputationScorer::compute_pagerank(const TrustGraph& graph) const {
    PageRankResult result;
    const size_t n = graph.num_nodes();
    if (n == 0) {
        return result;
    }

    const std::vector<double> weights = effective_edge_weights(graph);
    const std::vector<double> teleport = teleport_distribution(graph);
    const double d = config_.damping_factor;

    std::vector<double> out_weight(n, 0.0);
    for (size_t e = 0; e < graph.num_edges(); ++e) {
        out_weight[graph.source_index(e)] += weights[e];
    }

    std::vector<double> rank(n, 1.0 / static_cast<double>(n));
    std::vector<double> next(n, 0.0);

    result.converged = false;
    for (int iter = 1; iter <= config_.max_iterations; ++iter) {
        double dangling = 0.0;
        for (size_t i = 0; i < n; ++i) {
            if (out_weight[i] <= 0.0) dangling += rank[i];
        }

        for (size_t i = 0; i < n; ++i) {
            next[i] = (1.0 - d) * teleport[i] + d * dangling * teleport[i];
        }

        for (size_t e = 0; e < graph.num_edges(); ++e) {
            size_t src = graph.source_index(e);
            if (out_weight[src] <= 0.0) continue;
            next[graph.target_index(e)] += d * rank[src] * weights[e] / out_weight[src];
        }

        double delta = 0.0;
        for (size_t i = 0; i < n; ++i) {
            delta += std::abs(next[i] - rank[i]);
        }

        rank.swap(next);
        result.iterations = iter;
        result.final_delta = delta;

        if (delta < config_.tolerance) {
            result.converged = true;
            break;
        }
    }

    result.ranks = std::move(rank);
    return result;
}

double ReputationScorer::graph_score_from_rank(double rank, size_t num_nodes) {
    // rank * n is 1 for a node holding exactly the average mass
    double x = std::max(0.0, rank * static_cast<double>(num_nodes));
    return kMaxSubScore * x / (1.0 + x);
}

// ==========================================
// Hybrid scores
// ==========================================

std::map<std::string, ReputationScore> ReputationScorer::compute_hybrid_scores(
    const TrustGraph& graph,
    const PageRankResult& pagerank) const {

    std::map<std::string, ReputationScore> scores;
    const size_t n = graph.num_nodes();
    if (pagerank.ranks.size() != n) {
        throw std::invalid_argument("PageRank result does not match the graph size");
    }

    const double weight_sum = config_.graph_weight + config_.quality_weight +
                              config_.stake_weight + config_.payment_weight;

    for (size_t i = 0; i < n; ++i) {
        const GraphNode& node = graph.node(i);
        const NodeMetadata& meta = node.metadata;

        ReputationScore s;
        s.node_id = node.id;
        s.graph_score = graph_score_from_rank(pagerank.ranks[i], n);

        double content = meta.content_quality.value_or(0.0) * 10.0;
        double endorsements = std::min(kMaxSubScore,
            250.0 * std::log1p(static_cast<double>(meta.verified_endorsements.value_or(0))));
        s.quality_score = (1.0 - config_.endorsement_quality_share) * content +
                          config_.endorsement_quality_share * endorsements;

        s.stake_score = std::min(kMaxSubScore,
            config_.log_multiplier * std::log1p(meta.stake_or_zero() / config_.stake_scale));
        s.payment_score = std::min(kMaxSubScore,
            config_.log_multiplier * std::log1p(meta.payment_or_zero() / config_.payment_scale));

        if (config_.hybrid_enabled) {
            std::vector<std::pair<double, std::string>> factors = {
                {config_.graph_weight * s.graph_score, format_factor("Graph influence", s.graph_score)},
                {config_.quality_weight * s.quality_score, format_factor("Content quality", s.quality_score)},
                {config_.stake_weight * s.stake_score, format_factor("Stake commitment", s.stake_score)},
                {config_.payment_weight * s.payment_score, format_factor("Payment history", s.payment_score)}
            };

            double weighted = 0.0;
            for (const auto& f : factors) weighted += f.first;
            s.final_score = weighted / weight_sum;

            // Largest contribution first; equal contributions keep the order above
            std::stable_sort(factors.begin(), factors.end(),
                [](const auto& a, const auto& b) { return a.first > b.first; });
            for (const auto& f : factors) {
                if (f.first > 0.0) s.explanation.push_back(f.second);
            }
        } else {
            s.final_score = s.graph_score;
            s.explanation.push_back(format_factor("Graph influence", s.graph_score));
        }

        if (!pagerank.converged) {
            s.explanation.push_back("PageRank did not converge; score is provisional");
        }

        scores.emplace(node.id, std::move(s));
    }

    assign_percentiles(scores);
    return scores;
}

void ReputationScorer::assign_percentiles(std::map<std::string, ReputationScore>& scores) {
    if (scores.empty()) return;

    std::vector<ReputationScore*> ordered;
    ordered.reserve(scores.size());
    for (auto& [id, s] : scores) ordered.push_back(&s);

    std::sort(ordered.begin(), ordered.end(),
        [](const ReputationScore* a, const ReputationScore* b) {
            if (a->final_score != b->final_score) return a->final_score < b->final_score;
            return a->node_id < b->node_id;
        });

    const double n = static_cast<double>(ordered.size());
    size_t start = 0;
    while (start < ordered.size()) {
        size_t end = start;
        while (end + 1 < ordered.size() && ordered[end + 1]->final_score == ordered[start]->final_score) {
            end++;
        }

        // 1-based ranks start+1 .. end+1
        double avg_rank = (static_cast<double>(start + 1) + static_cast<double>(end + 1)) / 2.0;
        double percentile = 100.0 * avg_rank / n;
        for (size_t k = start; k <= end; ++k) {
            ordered[k]->percentile = percentile;
        }
        start = end + 1;
    }
}

// ==========================================
// Sensitivity audit
// ==========================================

SensitivityAudit ReputationScorer::audit_sensitivity(const TrustGraph& graph, const std::string& node_id) const {
    auto index = graph.index_of(node_id);
    if (!index) {
        throw ValidationError("Audit requested for unknown node", node_id);
    }

    SensitivityAudit audit;
    audit.node_id = node_id;

    const size_t n = graph.num_nodes();
    PageRankResult base = compute_pagerank(graph);
    audit.base_score = graph_score_from_rank(base.ranks[*index], n);

    for (size_t e : graph.in_edges(*index)) {
        TrustGraph reduced = graph.without_edge(e);
        PageRankResult without = compute_pagerank(reduced);

        EdgeImpact impact;
        impact.edge_index = e;
        impact.source = graph.edge(e).source;
        impact.target = graph.edge(e).target;
        impact.impact = graph_score_from_rank(without.ranks[*index], n) - audit.base_score;
        impact.relative_impact = audit.base_score > 0.0 ? impact.impact / audit.base_score * 100.0 : 0.0;
        audit.edge_sensitivity.push_back(impact);
    }

    audit.top_influencing_edges = audit.edge_sensitivity;
    std::sort(audit.top_influencing_edges.begin(), audit.top_influencing_edges.end(),
        [](const EdgeImpact& a, const EdgeImpact& b) {
            double ia = std::abs(a.impact);
            double ib = std::abs(b.impact);
            if (ia != ib) return ia > ib;
            return a.edge_index < b.edge_index;
        });
    if (audit.top_influencing_edges.size() > config_.audit_top_k) {
        audit.top_influencing_edges.resize(config_.audit_top_k);
    }

    return audit;
}

// ==========================================
// Rolling-average smoothing
// ==========================================

std::map<std::string, double> ReputationScorer::smooth_scores(
    const std::map<std::string, double>& current,
    const std::vector<std::map<std::string, double>>& history,
    size_t window_size,
    double decay_factor) {

    std::map<std::string, double> smoothed;
    const size_t window = std::min(window_size, history.size());

    for (const auto& [id, value] : current) {
        double weighted = value;
        double total_weight = 1.0;
        double w = 1.0;

        // history.back() is the most recent previous run
        for (size_t k = 0; k < window; ++k) {
            w *= decay_factor;
            const auto& past = history[history.size() - 1 - k];
            auto it = past.find(id);
            if (it == past.end()) continue;
            weighted += w * it->second;
            total_weight += w;
        }

        smoothed[id] = weighted / total_weight;
    }

    return smoothed;
}

} // namespace tg
