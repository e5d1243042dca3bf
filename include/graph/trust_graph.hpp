#ifndef TG_TRUST_GRAPH_HPP
#define TG_TRUST_GRAPH_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace tg {

// Progress callback shared by the scorer and the clustering engine
using ProgressCallback = std::function<void(const std::string& stage, int current, int total)>;

/**
 * @brief Raised when an input snapshot or configuration cannot be processed
 *
 * The subject names the offending element (an edge key such as "a->b#3",
 * a node id or an account id) so the caller can locate and fix the input.
 */
class ValidationError : public std::invalid_argument {
public:
    ValidationError(const std::string& message, std::string subject)
        : std::invalid_argument(message + " [" + subject + "]"),
          subject_(std::move(subject)) {}

    const std::string& subject() const { return subject_; }

private:
    std::string subject_;
};

// Interaction types carried by graph edges
enum class EdgeType {
    FOLLOW,
    ENDORSE,
    COLLABORATE,
    REVIEW,
    PAYMENT,
    STAKE,
    TRUST
};

inline std::string edge_type_to_string(EdgeType type) {
    switch (type) {
        case EdgeType::FOLLOW: return "follow";
        case EdgeType::ENDORSE: return "endorse";
        case EdgeType::COLLABORATE: return "collaborate";
        case EdgeType::REVIEW: return "review";
        case EdgeType::PAYMENT: return "payment";
        case EdgeType::STAKE: return "stake";
        case EdgeType::TRUST: return "trust";
        default: return "unknown";
    }
}

/**
 * @brief Parse an edge type name
 * @throws std::invalid_argument for unrecognised names
 */
EdgeType string_to_edge_type(const std::string& s);

/**
 * @brief Typed node attributes
 *
 * Every field is optional; absent economic fields count as zero when scoring.
 * `extensions` holds attributes consumed only by pluggable feature extractors
 * (for example "emailDomain" when building clustering accounts).
 */
struct NodeMetadata {
    std::optional<double> stake;                       // Economic commitment
    std::optional<double> payment_history;             // Cumulative verified payment volume
    std::optional<int> verified_endorsements;          // Count
    std::optional<double> content_quality;             // 0-100
    std::optional<int64_t> activity_recency;           // Last activity (ms)
    std::optional<bool> minority_group;                // Fairness auditing flag
    std::map<std::string, std::string> extensions;

    double stake_or_zero() const { return stake.value_or(0.0); }
    double payment_or_zero() const { return payment_history.value_or(0.0); }
    bool is_minority() const { return minority_group.value_or(false); }
};

/**
 * @brief Account in the interaction graph
 */
struct GraphNode {
    std::string id;
    NodeMetadata metadata;

    nlohmann::json to_json() const;
    static GraphNode from_json(const nlohmann::json& j);
};

struct EdgeMetadata {
    std::optional<double> endorsement_strength;
    std::optional<double> payment_amount;
    bool stake_backed = false;
    bool verified = false;
    std::map<std::string, std::string> extensions;
};

/**
 * @brief Directed endorsement/interaction between two nodes
 *
 * Parallel edges between the same ordered pair are kept; each one
 * contributes to scoring independently.
 */
struct GraphEdge {
    std::string source;
    std::string target;
    double weight = 1.0;                               // Non-negative strength
    EdgeType edge_type = EdgeType::ENDORSE;
    int64_t timestamp = 0;                             // Creation time (ms)
    EdgeMetadata metadata;

    /**
     * @brief "source->target" key used in reports and opinion filtering
     */
    std::string key() const { return source + "->" + target; }

    bool is_self_loop() const { return source == target; }

    nlohmann::json to_json() const;
    static GraphEdge from_json(const nlohmann::json& j);
};

/**
 * @brief Options controlling snapshot validation
 */
struct GraphOptions {
    bool allow_self_loops = false;
};

/**
 * @brief Statistics about the snapshot structure
 */
struct GraphStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;
    size_t num_dangling_nodes = 0;                     // No outgoing edges
    size_t num_isolated_nodes = 0;                     // No edges at all

    double avg_in_degree = 0.0;
    size_t max_in_degree = 0;
    size_t max_out_degree = 0;

    int64_t oldest_timestamp = 0;
    int64_t newest_timestamp = 0;

    std::map<std::string, size_t> edge_type_counts;

    nlohmann::json to_json() const;
};

/**
 * @brief Immutable, validated node/edge snapshot
 *
 * Construction validates the whole input: duplicate or empty node ids,
 * edges referencing unknown nodes, disallowed self-loops, and negative or
 * non-finite numbers are rejected with a ValidationError. A TrustGraph that
 * exists is therefore always safe to score.
 *
 * Nodes keep their input order; node indices are positions in that order and
 * edge indices are positions in the edge list.
 */
class TrustGraph {
public:
    TrustGraph() = default;

    TrustGraph(std::vector<GraphNode> nodes,
               std::vector<GraphEdge> edges,
               const GraphOptions& options = {});

    // ==========================================
    // Accessors
    // ==========================================

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    const std::vector<GraphEdge>& edges() const { return edges_; }

    const GraphNode& node(size_t index) const { return nodes_.at(index); }
    const GraphEdge& edge(size_t index) const { return edges_.at(index); }

    bool has_node(const std::string& node_id) const;
    const GraphNode* get_node(const std::string& node_id) const;

    /**
     * @brief Index of a node id, if present
     */
    std::optional<size_t> index_of(const std::string& node_id) const;

    size_t source_index(size_t edge_index) const { return edge_endpoints_.at(edge_index).first; }
    size_t target_index(size_t edge_index) const { return edge_endpoints_.at(edge_index).second; }

    // Edge indices, in input order
    const std::vector<size_t>& in_edges(size_t node_index) const { return in_edges_.at(node_index); }
    const std::vector<size_t>& out_edges(size_t node_index) const { return out_edges_.at(node_index); }

    /**
     * @brief Distinct neighbor indices ignoring direction, sorted ascending
     */
    std::vector<size_t> undirected_neighbors(size_t node_index) const;

    /**
     * @brief Newest edge timestamp (0 for an edgeless graph)
     */
    int64_t newest_timestamp() const { return newest_timestamp_; }

    const GraphOptions& options() const { return options_; }

    // ==========================================
    // Derived snapshots
    // ==========================================

    /**
     * @brief Copy of this snapshot with one edge instance removed
     *
     * Parallel edges between the same pair are left in place.
     */
    TrustGraph without_edge(size_t edge_index) const;

    GraphStatistics compute_statistics() const;

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;

    /**
     * @brief Build a validated snapshot from {"nodes": [...], "edges": [...]}
     */
    static TrustGraph from_json(const nlohmann::json& j, const GraphOptions& options = {});

    static TrustGraph load_from_json(const std::string& filename, const GraphOptions& options = {});

    void export_to_json(const std::string& filename) const;

private:
    std::vector<GraphNode> nodes_;
    std::vector<GraphEdge> edges_;
    GraphOptions options_;

    std::map<std::string, size_t> node_index_;
    std::vector<std::pair<size_t, size_t>> edge_endpoints_;
    std::vector<std::vector<size_t>> in_edges_;
    std::vector<std::vector<size_t>> out_edges_;
    int64_t newest_timestamp_ = 0;

    void validate_and_index();
    void validate_node(const GraphNode& node) const;
    void validate_edge(const GraphEdge& edge, size_t edge_index) const;
};

/**
 * @brief Edge key with its position, e.g. "a->b#3"
 */
std::string describe_edge(const GraphEdge& edge, size_t edge_index);

} // namespace tg

#endif // TG_TRUST_GRAPH_HPP
