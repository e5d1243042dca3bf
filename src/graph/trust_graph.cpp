#include "graph/trust_graph.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>

namespace tg {

namespace {

void require_finite(double value, const std::string& field, const std::string& subject) {
    if (!std::isfinite(value)) {
        throw ValidationError("Non-finite value for " + field, subject);
    }
}

void require_non_negative(double value, const std::string& field, const std::string& subject) {
    require_finite(value, field, subject);
    if (value < 0.0) {
        throw ValidationError("Negative value for " + field, subject);
    }
}

} // namespace

EdgeType string_to_edge_type(const std::string& s) {
    if (s == "follow") return EdgeType::FOLLOW;
    if (s == "endorse") return EdgeType::ENDORSE;
    if (s == "collaborate") return EdgeType::COLLABORATE;
    if (s == "review") return EdgeType::REVIEW;
    if (s == "payment") return EdgeType::PAYMENT;
    if (s == "stake") return EdgeType::STAKE;
    if (s == "trust") return EdgeType::TRUST;
    throw std::invalid_argument("Unknown edge type: " + s);
}

std::string describe_edge(const GraphEdge& edge, size_t edge_index) {
    return edge.key() + "#" + std::to_string(edge_index);
}

// ==========================================
// GraphNode Implementation
// ==========================================

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;

    nlohmann::json meta = nlohmann::json::object();
    if (metadata.stake) meta["stake"] = *metadata.stake;
    if (metadata.payment_history) meta["payment_history"] = *metadata.payment_history;
    if (metadata.verified_endorsements) meta["verified_endorsements"] = *metadata.verified_endorsements;
    if (metadata.content_quality) meta["content_quality"] = *metadata.content_quality;
    if (metadata.activity_recency) meta["activity_recency"] = *metadata.activity_recency;
    if (metadata.minority_group) meta["minority_group"] = *metadata.minority_group;
    if (!metadata.extensions.empty()) meta["extensions"] = metadata.extensions;
    j["metadata"] = meta;

    return j;
}

GraphNode GraphNode::from_json(const nlohmann::json& j) {
    GraphNode node;
    node.id = j.at("id").get<std::string>();

    if (j.contains("metadata")) {
        const auto& meta = j["metadata"];
        if (meta.contains("stake")) node.metadata.stake = meta["stake"].get<double>();
        if (meta.contains("payment_history")) node.metadata.payment_history = meta["payment_history"].get<double>();
        if (meta.contains("verified_endorsements")) {
            node.metadata.verified_endorsements = meta["verified_endorsements"].get<int>();
        }
        if (meta.contains("content_quality")) node.metadata.content_quality = meta["content_quality"].get<double>();
        if (meta.contains("activity_recency")) {
            node.metadata.activity_recency = meta["activity_recency"].get<int64_t>();
        }
        if (meta.contains("minority_group")) node.metadata.minority_group = meta["minority_group"].get<bool>();
        if (meta.contains("extensions")) {
            node.metadata.extensions = meta["extensions"].get<std::map<std::string, std::string>>();
        }
    }

    return node;
}

// ==========================================
// GraphEdge Implementation
// ==========================================

nlohmann::json GraphEdge::to_json() const {
    nlohmann::json j;
    j["source"] = source;
    j["target"] = target;
    j["weight"] = weight;
    j["edge_type"] = edge_type_to_string(edge_type);
    j["timestamp"] = timestamp;

    nlohmann::json meta = nlohmann::json::object();
    if (metadata.endorsement_strength) meta["endorsement_strength"] = *metadata.endorsement_strength;
    if (metadata.payment_amount) meta["payment_amount"] = *metadata.payment_amount;
    if (metadata.stake_backed) meta["stake_backed"] = true;
    if (metadata.verified) meta["verified"] = true;
    if (!metadata.extensions.empty()) meta["extensions"] = metadata.extensions;
    j["metadata"] = meta;

    return j;
}

GraphEdge GraphEdge::from_json(const nlohmann::json& j) {
    GraphEdge edge;
    edge.source = j.at("source").get<std::string>();
    edge.target = j.at("target").get<std::string>();
    edge.weight = j.value("weight", 1.0);
    edge.edge_type = string_to_edge_type(j.value("edge_type", std::string("endorse")));
    edge.timestamp = j.value("timestamp", static_cast<int64_t>(0));

    if (j.contains("metadata")) {
        const auto& meta = j["metadata"];
        if (meta.contains("endorsement_strength")) {
            edge.metadata.endorsement_strength = meta["endorsement_strength"].get<double>();
        }
        if (meta.contains("payment_amount")) edge.metadata.payment_amount = meta["payment_amount"].get<double>();
        edge.metadata.stake_backed = meta.value("stake_backed", false);
        edge.metadata.verified = meta.value("verified", false);
        if (meta.contains("extensions")) {
            edge.metadata.extensions = meta["extensions"].get<std::map<std::string, std::string>>();
        }
    }

    return edge;
}

// ==========================================
// GraphStatistics Implementation
// ==========================================

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_edges"] = num_edges;
    j["num_dangling_nodes"] = num_dangling_nodes;
    j["num_isolated_nodes"] = num_isolated_nodes;
    j["avg_in_degree"] = avg_in_degree;
    j["max_in_degree"] = max_in_degree;
    j["max_out_degree"] = max_out_degree;
    j["oldest_timestamp"] = oldest_timestamp;
    j["newest_timestamp"] = newest_timestamp;
    j["edge_type_counts"] = edge_type_counts;
    return j;
}

// ==========================================
// TrustGraph Implementation
// ==========================================

TrustGraph::TrustGraph(std::vector<GraphNode> nodes,
                       std::vector<GraphEdge> edges,
                       const GraphOptions& options)
    : nodes_(std::move(nodes)), edges_(std::move(edges)), options_(options) {
    validate_and_index();
}

void TrustGraph::validate_node(const GraphNode& node) const {
    if (node.id.empty()) {
        throw ValidationError("Node with empty id", "node#" + std::to_string(node_index_.size()));
    }

    const auto& meta = node.metadata;
    if (meta.stake) require_non_negative(*meta.stake, "stake", node.id);
    if (meta.payment_history) require_non_negative(*meta.payment_history, "payment_history", node.id);
    if (meta.verified_endorsements && *meta.verified_endorsements < 0) {
        throw ValidationError("Negative value for verified_endorsements", node.id);
    }
    if (meta.content_quality) {
        require_finite(*meta.content_quality, "content_quality", node.id);
        if (*meta.content_quality < 0.0 || *meta.content_quality > 100.0) {
            throw ValidationError("content_quality must be within [0, 100]", node.id);
        }
    }
}

void TrustGraph::validate_edge(const GraphEdge& edge, size_t edge_index) const {
    const std::string subject = describe_edge(edge, edge_index);

    if (node_index_.find(edge.source) == node_index_.end()) {
        throw ValidationError("Edge references unknown source node '" + edge.source + "'", subject);
    }
    if (node_index_.find(edge.target) == node_index_.end()) {
        throw ValidationError("Edge references unknown target node '" + edge.target + "'", subject);
    }
    if (edge.is_self_loop() && !options_.allow_self_loops) {
        throw ValidationError("Self-loop edges are not allowed", subject);
    }

    require_non_negative(edge.weight, "weight", subject);
    if (edge.metadata.endorsement_strength) {
        require_finite(*edge.metadata.endorsement_strength, "endorsement_strength", subject);
    }
    if (edge.metadata.payment_amount) {
        require_non_negative(*edge.metadata.payment_amount, "payment_amount", subject);
    }
}

void TrustGraph::validate_and_index() {
    node_index_.clear();
    for (size_t i = 0; i < nodes_.size(); ++i) {
        validate_node(nodes_[i]);
        if (!node_index_.emplace(nodes_[i].id, i).second) {
            throw ValidationError("Duplicate node id", nodes_[i].id);
        }
    }

    in_edges_.assign(nodes_.size(), {});
    out_edges_.assign(nodes_.size(), {});
    edge_endpoints_.clear();
    edge_endpoints_.reserve(edges_.size());
    newest_timestamp_ = 0;

    for (size_t e = 0; e < edges_.size(); ++e) {
        const auto& edge = edges_[e];
        validate_edge(edge, e);

        size_t src = node_index_.at(edge.source);
        size_t tgt = node_index_.at(edge.target);
        edge_endpoints_.emplace_back(src, tgt);
        out_edges_[src].push_back(e);
        in_edges_[tgt].push_back(e);

        if (e == 0 || edge.timestamp > newest_timestamp_) {
            newest_timestamp_ = edge.timestamp;
        }
    }
}

bool TrustGraph::has_node(const std::string& node_id) const {
    return node_index_.find(node_id) != node_index_.end();
}

const GraphNode* TrustGraph::get_node(const std::string& node_id) const {
    auto it = node_index_.find(node_id);
    return it != node_index_.end() ? &nodes_[it->second] : nullptr;
}

std::optional<size_t> TrustGraph::index_of(const std::string& node_id) const {
    auto it = node_index_.find(node_id);
    if (it == node_index_.end()) return std::nullopt;
    return it->second;
}

std::vector<size_t> TrustGraph::undirected_neighbors(size_t node_index) const {
    std::set<size_t> neighbors;
    for (size_t e : out_edges_.at(node_index)) {
        size_t other = edge_endpoints_[e].second;
        if (other != node_index) neighbors.insert(other);
    }
    for (size_t e : in_edges_.at(node_index)) {
        size_t other = edge_endpoints_[e].first;
        if (other != node_index) neighbors.insert(other);
    }
    return std::vector<size_t>(neighbors.begin(), neighbors.end());
}

TrustGraph TrustGraph::without_edge(size_t edge_index) const {
    if (edge_index >= edges_.size()) {
        throw std::out_of_range("Edge index out of range: " + std::to_string(edge_index));
    }

    std::vector<GraphEdge> remaining;
    remaining.reserve(edges_.size() - 1);
    for (size_t e = 0; e < edges_.size(); ++e) {
        if (e != edge_index) remaining.push_back(edges_[e]);
    }
    return TrustGraph(nodes_, std::move(remaining), options_);
}

GraphStatistics TrustGraph::compute_statistics() const {
    GraphStatistics stats;
    stats.num_nodes = nodes_.size();
    stats.num_edges = edges_.size();

    if (nodes_.empty()) return stats;

    for (size_t i = 0; i < nodes_.size(); ++i) {
        size_t in_deg = in_edges_[i].size();
        size_t out_deg = out_edges_[i].size();
        stats.max_in_degree = std::max(stats.max_in_degree, in_deg);
        stats.max_out_degree = std::max(stats.max_out_degree, out_deg);
        if (out_deg == 0) stats.num_dangling_nodes++;
        if (in_deg == 0 && out_deg == 0) stats.num_isolated_nodes++;
    }
    stats.avg_in_degree = static_cast<double>(edges_.size()) / nodes_.size();

    if (!edges_.empty()) {
        stats.oldest_timestamp = std::numeric_limits<int64_t>::max();
        for (const auto& edge : edges_) {
            stats.oldest_timestamp = std::min(stats.oldest_timestamp, edge.timestamp);
            stats.edge_type_counts[edge_type_to_string(edge.edge_type)]++;
        }
        stats.newest_timestamp = newest_timestamp_;
    }

    return stats;
}

nlohmann::json TrustGraph::to_json() const {
    nlohmann::json j;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes_) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& edge : edges_) {
        edges_json.push_back(edge.to_json());
    }
    j["edges"] = edges_json;

    j["metadata"] = {
        {"num_nodes", nodes_.size()},
        {"num_edges", edges_.size()},
        {"allow_self_loops", options_.allow_self_loops}
    };

    return j;
}

TrustGraph TrustGraph::from_json(const nlohmann::json& j, const GraphOptions& options) {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;

    if (j.contains("nodes")) {
        for (const auto& node_json : j["nodes"]) {
            nodes.push_back(GraphNode::from_json(node_json));
        }
    }
    if (j.contains("edges")) {
        for (const auto& edge_json : j["edges"]) {
            edges.push_back(GraphEdge::from_json(edge_json));
        }
    }

    return TrustGraph(std::move(nodes), std::move(edges), options);
}

TrustGraph TrustGraph::load_from_json(const std::string& filename, const GraphOptions& options) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open graph file: " + filename);
    }

    nlohmann::json j;
    file >> j;
    return from_json(j, options);
}

void TrustGraph::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

} // namespace tg
