#pragma once

#include "clustering/account.hpp"
#include "clustering/similarity.hpp"
#include "graph/trust_graph.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

enum class ClusteringMethod {
    DBSCAN,
    CONNECTIVITY,
    HIERARCHICAL,
    SIMILARITY
};

std::string clustering_method_to_string(ClusteringMethod method);
ClusteringMethod string_to_clustering_method(const std::string& s);

/**
 * @brief What to do with a component larger than max_cluster_size
 */
enum class OversizePolicy {
    RECLUSTER,   // Re-cluster at a stricter threshold until pieces fit
    TRUNCATE,    // Keep the most central max_cluster_size members
    REJECT       // Drop the component
};

std::string oversize_policy_to_string(OversizePolicy policy);
OversizePolicy string_to_oversize_policy(const std::string& s);

/**
 * @brief Configuration for the clustering engine
 */
struct ClusteringConfig {
    ClusteringMethod method = ClusteringMethod::CONNECTIVITY;

    double min_similarity = 0.3;           // Pair threshold (connectivity, hierarchical, similarity)
    size_t min_cluster_size = 2;
    size_t max_cluster_size = 1000;

    // DBSCAN
    double dbscan_eps = 0.5;               // Minimum similarity of an eps-neighbor
    size_t dbscan_min_pts = 2;             // Neighbors needed for a core account

    FeatureWeights feature_weights;

    OversizePolicy oversize_policy = OversizePolicy::RECLUSTER;
    double oversize_step = 0.05;           // Threshold increase per re-cluster round

    // Risk heuristics
    double low_reputation_threshold = 10.0;
    size_t large_cluster_size = 10;
    double sybil_risk_threshold = 0.5;

    size_t num_threads = 1;                // Workers for pairwise similarity

    static ClusteringConfig from_json(const nlohmann::json& j);
    static ClusteringConfig from_json_file(const std::string& path);
    nlohmann::json to_json() const;
    void to_json_file(const std::string& path) const;

    bool validate(std::string& error_message) const;
};

struct TuningPoint {
    double threshold = 0.0;
    size_t num_clusters = 0;
    double avg_cluster_size = 0.0;
    double avg_density = 0.0;
    double silhouette = 0.0;
    double score = 0.0;                    // Silhouette after the fragmentation penalty

    nlohmann::json to_json() const;
};

struct TuningResult {
    double optimal_similarity = 0.0;
    double best_score = 0.0;
    std::vector<TuningPoint> metrics;      // One entry per swept threshold

    nlohmann::json to_json() const;
};

/**
 * @brief Finds groups of accounts with coordinated behavior
 *
 * All four methods share SimilarityFunction. Accounts are sorted by id before
 * any pass, so results do not depend on input order. Clusters are returned
 * sorted by their first account id and numbered "cluster-0", "cluster-1", ...
 *
 * Cluster risk is a heuristic ranking signal, never a verdict.
 */
class ClusteringEngine {
public:
    /**
     * @throws std::invalid_argument when the configuration does not validate
     */
    explicit ClusteringEngine(const ClusteringConfig& config = {});

    const ClusteringConfig& config() const { return config_; }
    const SimilarityFunction& similarity_function() const { return similarity_; }

    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    /**
     * @brief Run the configured method
     *
     * Fewer than two accounts yields an empty list.
     * @throws ValidationError for empty or duplicate account ids and
     *         non-finite numeric fields
     */
    std::vector<Cluster> find_clusters(const std::vector<Account>& accounts) const;

    AccountPair calculate_similarity(const Account& a, const Account& b) const;

    /**
     * @brief Sweep the pair threshold and pick the best silhouette
     *
     * Sweeps dbscan_eps for DBSCAN and min_similarity otherwise, from
     * `min_threshold` to `max_threshold` inclusive. Each step costs a full
     * clustering run: an offline tuning tool, not a per-request call.
     */
    TuningResult find_optimal_parameters(const std::vector<Account>& accounts,
                                         double min_threshold = 0.1,
                                         double max_threshold = 0.9,
                                         double step = 0.05) const;

    /**
     * @brief Mean silhouette of the clustered accounts (distance = 1 - similarity)
     */
    double silhouette_score(const std::vector<Account>& accounts,
                            const std::vector<Cluster>& clusters) const;

private:
    ClusteringConfig config_;
    SimilarityFunction similarity_;
    ProgressCallback progress_cb_;

    void report_progress(const std::string& stage, int current, int total) const;

    std::vector<const Account*> prepare_accounts(const std::vector<Account>& accounts) const;

    // Candidate member lists (indices into the sorted account order)
    std::vector<std::vector<size_t>> run_method(const SimilarityMatrix& matrix,
                                                const ClusteringConfig& config) const;

    std::vector<std::vector<size_t>> dbscan(const SimilarityMatrix& matrix,
                                            const ClusteringConfig& config) const;
    std::vector<std::vector<size_t>> connectivity(const SimilarityMatrix& matrix,
                                                  const ClusteringConfig& config) const;
    std::vector<std::vector<size_t>> hierarchical(const SimilarityMatrix& matrix,
                                                  const ClusteringConfig& config) const;
    std::vector<std::vector<size_t>> similarity_components(const SimilarityMatrix& matrix,
                                                           const ClusteringConfig& config) const;

    std::vector<std::vector<size_t>> enforce_size_bounds(std::vector<std::vector<size_t>> candidates,
                                                         const SimilarityMatrix& matrix,
                                                         const ClusteringConfig& config) const;

    std::vector<Cluster> assemble_clusters(const std::vector<std::vector<size_t>>& candidates,
                                           const std::vector<const Account*>& accounts,
                                           const SimilarityMatrix& matrix) const;

    Cluster build_cluster(const std::vector<size_t>& members,
                          const std::vector<const Account*>& accounts,
                          const SimilarityMatrix& matrix) const;

    double silhouette(const std::vector<std::vector<size_t>>& candidates,
                      const SimilarityMatrix& matrix) const;
};

} // namespace tg
