#include "clustering/clustering_engine.hpp"
#include "graph/union_find.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <set>
#include <stack>
#include <stdexcept>

using json = nlohmann::json;

namespace tg {

namespace {

void require_finite(const std::optional<double>& value, const std::string& field, const std::string& account_id) {
    if (value && !std::isfinite(*value)) {
        throw ValidationError("Non-finite value for " + field, account_id);
    }
}

double method_threshold(const ClusteringConfig& config) {
    return config.method == ClusteringMethod::DBSCAN ? config.dbscan_eps : config.min_similarity;
}

// Members ordered by mean similarity to the rest of the group, most central first
std::vector<size_t> most_central(const std::vector<size_t>& members,
                                 const SimilarityMatrix& matrix,
                                 size_t keep) {
    std::vector<std::pair<double, size_t>> ranked;
    ranked.reserve(members.size());
    for (size_t m : members) {
        double total = 0.0;
        for (size_t other : members) {
            if (other != m) total += matrix.at(m, other);
        }
        ranked.push_back({total / static_cast<double>(members.size() - 1), m});
    }
    std::sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) {
            if (a.first != b.first) return a.first > b.first;
            return a.second < b.second;
        });

    std::vector<size_t> kept;
    for (size_t i = 0; i < keep && i < ranked.size(); ++i) {
        kept.push_back(ranked[i].second);
    }
    std::sort(kept.begin(), kept.end());
    return kept;
}

// Connected pieces of `members` over pairs at or above `threshold`
std::vector<std::vector<size_t>> split_at(const std::vector<size_t>& members,
                                          const SimilarityMatrix& matrix,
                                          double threshold) {
    UnionFind uf(members.size());
    for (size_t a = 0; a < members.size(); ++a) {
        for (size_t b = a + 1; b < members.size(); ++b) {
            if (matrix.at(members[a], members[b]) >= threshold) uf.unite(a, b);
        }
    }

    std::vector<std::vector<size_t>> pieces;
    for (const auto& group : uf.groups()) {
        std::vector<size_t> piece;
        for (size_t local : group) piece.push_back(members[local]);
        pieces.push_back(std::move(piece));
    }
    return pieces;
}

} // namespace

// ==========================================
// Enum conversions
// ==========================================

std::string clustering_method_to_string(ClusteringMethod method) {
    switch (method) {
        case ClusteringMethod::DBSCAN: return "dbscan";
        case ClusteringMethod::CONNECTIVITY: return "connectivity";
        case ClusteringMethod::HIERARCHICAL: return "hierarchical";
        case ClusteringMethod::SIMILARITY: return "similarity";
        default: return "unknown";
    }
}

ClusteringMethod string_to_clustering_method(const std::string& s) {
    if (s == "dbscan") return ClusteringMethod::DBSCAN;
    if (s == "connectivity") return ClusteringMethod::CONNECTIVITY;
    if (s == "hierarchical") return ClusteringMethod::HIERARCHICAL;
    if (s == "similarity") return ClusteringMethod::SIMILARITY;
    throw std::invalid_argument("Unknown clustering method: " + s);
}

std::string oversize_policy_to_string(OversizePolicy policy) {
    switch (policy) {
        case OversizePolicy::RECLUSTER: return "recluster";
        case OversizePolicy::TRUNCATE: return "truncate";
        case OversizePolicy::REJECT: return "reject";
        default: return "unknown";
    }
}

OversizePolicy string_to_oversize_policy(const std::string& s) {
    if (s == "recluster") return OversizePolicy::RECLUSTER;
    if (s == "truncate") return OversizePolicy::TRUNCATE;
    if (s == "reject") return OversizePolicy::REJECT;
    throw std::invalid_argument("Unknown oversize policy: " + s);
}

// ==========================================
// ClusteringConfig
// ==========================================

ClusteringConfig ClusteringConfig::from_json(const json& j) {
    ClusteringConfig config;

    if (j.contains("method")) config.method = string_to_clustering_method(j["method"].get<std::string>());
    if (j.contains("min_similarity")) config.min_similarity = j["min_similarity"];
    if (j.contains("min_cluster_size")) config.min_cluster_size = j["min_cluster_size"];
    if (j.contains("max_cluster_size")) config.max_cluster_size = j["max_cluster_size"];
    if (j.contains("dbscan_eps")) config.dbscan_eps = j["dbscan_eps"];
    if (j.contains("dbscan_min_pts")) config.dbscan_min_pts = j["dbscan_min_pts"];
    if (j.contains("feature_weights")) config.feature_weights = FeatureWeights::from_json(j["feature_weights"]);
    if (j.contains("oversize_policy")) {
        config.oversize_policy = string_to_oversize_policy(j["oversize_policy"].get<std::string>());
    }
    if (j.contains("oversize_step")) config.oversize_step = j["oversize_step"];
    if (j.contains("low_reputation_threshold")) config.low_reputation_threshold = j["low_reputation_threshold"];
    if (j.contains("large_cluster_size")) config.large_cluster_size = j["large_cluster_size"];
    if (j.contains("sybil_risk_threshold")) config.sybil_risk_threshold = j["sybil_risk_threshold"];
    if (j.contains("num_threads")) config.num_threads = j["num_threads"];

    return config;
}

ClusteringConfig ClusteringConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    if (j.contains("clustering")) {
        return from_json(j["clustering"]);
    }
    return from_json(j);
}

json ClusteringConfig::to_json() const {
    json j;
    j["method"] = clustering_method_to_string(method);
    j["min_similarity"] = min_similarity;
    j["min_cluster_size"] = min_cluster_size;
    j["max_cluster_size"] = max_cluster_size;
    j["dbscan_eps"] = dbscan_eps;
    j["dbscan_min_pts"] = dbscan_min_pts;
    j["feature_weights"] = feature_weights.to_json();
    j["oversize_policy"] = oversize_policy_to_string(oversize_policy);
    j["oversize_step"] = oversize_step;
    j["low_reputation_threshold"] = low_reputation_threshold;
    j["large_cluster_size"] = large_cluster_size;
    j["sybil_risk_threshold"] = sybil_risk_threshold;
    j["num_threads"] = num_threads;
    return j;
}

void ClusteringConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

bool ClusteringConfig::validate(std::string& error_message) const {
    if (!(min_similarity >= 0.0 && min_similarity <= 1.0)) {
        error_message = "min_similarity must be between 0.0 and 1.0";
        return false;
    }

    if (!(dbscan_eps >= 0.0 && dbscan_eps <= 1.0)) {
        error_message = "dbscan_eps must be between 0.0 and 1.0";
        return false;
    }

    if (min_cluster_size < 2) {
        error_message = "min_cluster_size must be at least 2";
        return false;
    }

    if (max_cluster_size < min_cluster_size) {
        error_message = "max_cluster_size must be >= min_cluster_size";
        return false;
    }

    if (dbscan_min_pts == 0) {
        error_message = "dbscan_min_pts must be positive";
        return false;
    }

    if (!(oversize_step > 0.0) || !std::isfinite(oversize_step)) {
        error_message = "oversize_step must be positive";
        return false;
    }

    if (num_threads == 0) {
        error_message = "num_threads must be positive";
        return false;
    }

    return feature_weights.validate(error_message);
}

// ==========================================
// Tuning results
// ==========================================

json TuningPoint::to_json() const {
    json j;
    j["threshold"] = threshold;
    j["num_clusters"] = num_clusters;
    j["avg_cluster_size"] = avg_cluster_size;
    j["avg_density"] = avg_density;
    j["silhouette"] = silhouette;
    j["score"] = score;
    return j;
}

json TuningResult::to_json() const {
    json j;
    j["optimal_similarity"] = optimal_similarity;
    j["best_score"] = best_score;
    json arr = json::array();
    for (const auto& m : metrics) arr.push_back(m.to_json());
    j["metrics"] = arr;
    return j;
}

// ==========================================
// ClusteringEngine
// ==========================================

ClusteringEngine::ClusteringEngine(const ClusteringConfig& config)
    : config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid clustering configuration: " + error);
    }
    similarity_ = SimilarityFunction(config_.feature_weights);
}

void ClusteringEngine::report_progress(const std::string& stage, int current, int total) const {
    if (progress_cb_) {
        progress_cb_(stage, current, total);
    }
}

std::vector<const Account*> ClusteringEngine::prepare_accounts(const std::vector<Account>& accounts) const {
    std::vector<const Account*> sorted;
    sorted.reserve(accounts.size());

    for (const auto& account : accounts) {
        if (account.account_id.empty()) {
            throw ValidationError("Account id must not be empty", "<empty>");
        }
        require_finite(account.reputation, "reputation", account.account_id);
        require_finite(account.sybil_probability, "sybil_probability", account.account_id);
        require_finite(account.metadata.activity_level, "activity_level", account.account_id);
        require_finite(account.metadata.stake, "stake", account.account_id);
        require_finite(account.metadata.payment_history, "payment_history", account.account_id);
        for (const auto& c : account.connections) {
            if (!std::isfinite(c.weight) || c.weight < 0.0) {
                throw ValidationError("Connection weight to " + c.target + " must be non-negative and finite",
                                      account.account_id);
            }
        }
        sorted.push_back(&account);
    }

    std::sort(sorted.begin(), sorted.end(),
        [](const Account* a, const Account* b) { return a->account_id < b->account_id; });

    for (size_t i = 1; i < sorted.size(); ++i) {
        if (sorted[i]->account_id == sorted[i - 1]->account_id) {
            throw ValidationError("Duplicate account id", sorted[i]->account_id);
        }
    }

    return sorted;
}

AccountPair ClusteringEngine::calculate_similarity(const Account& a, const Account& b) const {
    return similarity_.compare(a, b);
}

std::vector<Cluster> ClusteringEngine::find_clusters(const std::vector<Account>& accounts) const {
    std::vector<const Account*> sorted = prepare_accounts(accounts);
    if (sorted.size() < 2) {
        return {};
    }

    report_progress("Computing similarities", 0, 100);
    SimilarityMatrix matrix(sorted, similarity_, config_.num_threads);

    report_progress("Clustering (" + clustering_method_to_string(config_.method) + ")", 50, 100);
    std::vector<std::vector<size_t>> candidates = run_method(matrix, config_);

    report_progress("Assembling clusters", 90, 100);
    std::vector<Cluster> clusters = assemble_clusters(candidates, sorted, matrix);

    report_progress("Clustering complete", 100, 100);
    return clusters;
}

std::vector<std::vector<size_t>> ClusteringEngine::run_method(const SimilarityMatrix& matrix,
                                                              const ClusteringConfig& config) const {
    std::vector<std::vector<size_t>> candidates;
    switch (config.method) {
        case ClusteringMethod::DBSCAN:
            candidates = dbscan(matrix, config);
            break;
        case ClusteringMethod::CONNECTIVITY:
            candidates = connectivity(matrix, config);
            break;
        case ClusteringMethod::HIERARCHICAL:
            candidates = hierarchical(matrix, config);
            break;
        case ClusteringMethod::SIMILARITY:
            candidates = similarity_components(matrix, config);
            break;
    }

    for (auto& c : candidates) {
        std::sort(c.begin(), c.end());
    }
    return enforce_size_bounds(std::move(candidates), matrix, config);
}

// ==========================================
// Method A: DBSCAN
// ==========================================

std::vector<std::vector<size_t>> ClusteringEngine::dbscan(const SimilarityMatrix& matrix,
                                                          const ClusteringConfig& config) const {
    const size_t n = matrix.size();
    std::vector<std::vector<size_t>> neighbors(n);
    for (size_t i = 0; i < n; ++i) {
        neighbors[i] = matrix.neighbors(i, config.dbscan_eps);
    }

    std::vector<bool> visited(n, false);
    std::vector<bool> assigned(n, false);
    std::vector<std::vector<size_t>> clusters;

    for (size_t i = 0; i < n; ++i) {
        if (visited[i]) continue;
        visited[i] = true;

        // Not a core account; may still join a later cluster as a border point
        if (neighbors[i].size() < config.dbscan_min_pts) continue;

        std::vector<size_t> cluster = {i};
        assigned[i] = true;

        std::vector<size_t> seeds = neighbors[i];
        for (size_t k = 0; k < seeds.size(); ++k) {
            size_t current = seeds[k];

            if (!assigned[current]) {
                assigned[current] = true;
                cluster.push_back(current);
            }
            if (visited[current]) continue;
            visited[current] = true;

            if (neighbors[current].size() >= config.dbscan_min_pts) {
                for (size_t nb : neighbors[current]) {
                    if (!visited[nb] || !assigned[nb]) seeds.push_back(nb);
                }
            }
        }

        clusters.push_back(std::move(cluster));
    }

    return clusters;
}

// ==========================================
// Method B: Connectivity (union-find)
// ==========================================

std::vector<std::vector<size_t>> ClusteringEngine::connectivity(const SimilarityMatrix& matrix,
                                                                const ClusteringConfig& config) const {
    const size_t n = matrix.size();
    UnionFind uf(n);

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (matrix.at(i, j) >= config.min_similarity) {
                uf.unite(i, j);
            }
        }
    }

    return uf.groups();
}

// ==========================================
// Method C: Hierarchical (average linkage)
// ==========================================

std::vector<std::vector<size_t>> ClusteringEngine::hierarchical(const SimilarityMatrix& matrix,
                                                                const ClusteringConfig& config) const {
    const size_t n = matrix.size();

    std::vector<std::vector<size_t>> members(n);
    std::vector<bool> active(n, true);
    std::vector<std::vector<double>> linkage(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        members[i] = {i};
        for (size_t j = 0; j < n; ++j) {
            linkage[i][j] = matrix.at(i, j);
        }
    }

    while (true) {
        double best = -1.0;
        size_t best_i = n;
        size_t best_j = n;

        for (size_t i = 0; i < n; ++i) {
            if (!active[i]) continue;
            for (size_t j = i + 1; j < n; ++j) {
                if (!active[j]) continue;
                if (members[i].size() + members[j].size() > config.max_cluster_size) continue;
                if (linkage[i][j] >= config.min_similarity && linkage[i][j] > best) {
                    best = linkage[i][j];
                    best_i = i;
                    best_j = j;
                }
            }
        }

        if (best_i == n) break;

        // Lance-Williams update for average linkage
        double size_i = static_cast<double>(members[best_i].size());
        double size_j = static_cast<double>(members[best_j].size());
        for (size_t k = 0; k < n; ++k) {
            if (!active[k] || k == best_i || k == best_j) continue;
            double merged = (size_i * linkage[best_i][k] + size_j * linkage[best_j][k]) / (size_i + size_j);
            linkage[best_i][k] = merged;
            linkage[k][best_i] = merged;
        }

        members[best_i].insert(members[best_i].end(), members[best_j].begin(), members[best_j].end());
        members[best_j].clear();
        active[best_j] = false;
    }

    std::vector<std::vector<size_t>> clusters;
    for (size_t i = 0; i < n; ++i) {
        if (active[i]) clusters.push_back(members[i]);
    }
    return clusters;
}

// ==========================================
// Method D: Similarity-graph components
// ==========================================

std::vector<std::vector<size_t>> ClusteringEngine::similarity_components(const SimilarityMatrix& matrix,
                                                                         const ClusteringConfig& config) const {
    const size_t n = matrix.size();
    std::vector<std::vector<size_t>> adjacency(n);
    for (size_t i = 0; i < n; ++i) {
        adjacency[i] = matrix.neighbors(i, config.min_similarity);
    }

    std::vector<bool> visited(n, false);
    std::vector<std::vector<size_t>> components;

    for (size_t start = 0; start < n; ++start) {
        if (visited[start]) continue;

        // DFS to find connected component
        std::vector<size_t> component;
        std::stack<size_t> stack;
        stack.push(start);

        while (!stack.empty()) {
            size_t current = stack.top();
            stack.pop();

            if (visited[current]) continue;

            visited[current] = true;
            component.push_back(current);

            for (size_t neighbor : adjacency[current]) {
                if (!visited[neighbor]) {
                    stack.push(neighbor);
                }
            }
        }

        components.push_back(std::move(component));
    }

    return components;
}

// ==========================================
// Size bounds
// ==========================================

std::vector<std::vector<size_t>> ClusteringEngine::enforce_size_bounds(
    std::vector<std::vector<size_t>> candidates,
    const SimilarityMatrix& matrix,
    const ClusteringConfig& config) const {

    std::vector<std::vector<size_t>> result;

    // Work items carry the threshold they were produced at
    std::vector<std::pair<std::vector<size_t>, double>> pending;
    for (auto& c : candidates) {
        pending.push_back({std::move(c), method_threshold(config)});
    }

    while (!pending.empty()) {
        auto [members, threshold] = std::move(pending.back());
        pending.pop_back();

        if (members.size() < config.min_cluster_size) continue;
        if (members.size() <= config.max_cluster_size) {
            result.push_back(std::move(members));
            continue;
        }

        switch (config.oversize_policy) {
            case OversizePolicy::REJECT:
                break;
            case OversizePolicy::TRUNCATE:
                result.push_back(most_central(members, matrix, config.max_cluster_size));
                break;
            case OversizePolicy::RECLUSTER: {
                double stricter = threshold + config.oversize_step;
                if (stricter > 1.0) {
                    result.push_back(most_central(members, matrix, config.max_cluster_size));
                    break;
                }
                std::vector<std::vector<size_t>> pieces = split_at(members, matrix, stricter);
                bool any_viable = std::any_of(pieces.begin(), pieces.end(),
                    [&config](const std::vector<size_t>& p) { return p.size() >= config.min_cluster_size; });

                // A group too uniform to split keeps its core instead of dissolving
                if (!any_viable) {
                    result.push_back(most_central(members, matrix, config.max_cluster_size));
                    break;
                }
                for (auto& piece : pieces) {
                    pending.push_back({std::move(piece), stricter});
                }
                break;
            }
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

// ==========================================
// Cluster assembly
// ==========================================

std::vector<Cluster> ClusteringEngine::assemble_clusters(const std::vector<std::vector<size_t>>& candidates,
                                                         const std::vector<const Account*>& accounts,
                                                         const SimilarityMatrix& matrix) const {
    std::vector<Cluster> clusters;
    for (const auto& members : candidates) {
        clusters.push_back(build_cluster(members, accounts, matrix));
    }

    std::sort(clusters.begin(), clusters.end(),
        [](const Cluster& a, const Cluster& b) { return a.accounts.front() < b.accounts.front(); });

    for (size_t i = 0; i < clusters.size(); ++i) {
        clusters[i].cluster_id = "cluster-" + std::to_string(i);
    }
    return clusters;
}

Cluster ClusteringEngine::build_cluster(const std::vector<size_t>& members,
                                        const std::vector<const Account*>& accounts,
                                        const SimilarityMatrix& matrix) const {
    Cluster cluster;
    const size_t n = members.size();

    std::map<std::string, size_t> position;
    for (size_t k = 0; k < n; ++k) {
        cluster.accounts.push_back(accounts[members[k]]->account_id);
        position[accounts[members[k]]->account_id] = k;
    }

    cluster.density = matrix.mean_pairwise(members);

    // Internal links: directed (account, target) pairs and the unordered pairs they touch
    std::set<std::pair<size_t, size_t>> directed;
    std::set<std::pair<size_t, size_t>> undirected;
    for (size_t k = 0; k < n; ++k) {
        for (const auto& conn : accounts[members[k]]->connections) {
            auto it = position.find(conn.target);
            if (it == position.end() || it->second == k) continue;
            directed.insert({k, it->second});
            undirected.insert({std::min(k, it->second), std::max(k, it->second)});
        }
    }
    double possible = static_cast<double>(n) * static_cast<double>(n - 1) / 2.0;
    cluster.cohesion = possible > 0.0 ? static_cast<double>(undirected.size()) / possible : 0.0;

    double reputation_total = 0.0;
    double sybil_total = 0.0;
    size_t sybil_count = 0;
    std::set<std::string> email_domains;
    for (size_t m : members) {
        const Account* a = accounts[m];
        reputation_total += a->reputation.value_or(0.0);
        if (a->sybil_probability) {
            sybil_total += *a->sybil_probability;
            sybil_count++;
        }
        if (a->metadata.email_domain) email_domains.insert(*a->metadata.email_domain);
    }
    const double avg_reputation = reputation_total / static_cast<double>(n);
    const bool low_reputation = avg_reputation < config_.low_reputation_threshold;
    const bool large = n > config_.large_cluster_size;
    const bool shared_domain = email_domains.size() == 1;
    const bool sybil_signals = sybil_count > 0 &&
        sybil_total / static_cast<double>(sybil_count) >= config_.sybil_risk_threshold;

    double risk = 0.0;
    if (cluster.density > 0.7 && cluster.cohesion > 0.5) risk += 0.3;
    if (large) risk += 0.2;
    if (low_reputation) risk += 0.2;
    if (shared_domain && n > 3) risk += 0.3;
    if (sybil_signals) risk += 0.2;
    cluster.risk_score = std::min(1.0, risk);

    if (shared_domain) cluster.patterns.push_back("shared_email_domain");
    if (low_reputation) cluster.patterns.push_back("low_reputation");
    if (large) cluster.patterns.push_back("large_cluster");
    if (static_cast<double>(directed.size()) / static_cast<double>(n) > 2.0) {
        cluster.patterns.push_back("high_connectivity");
    }
    if (sybil_signals) cluster.patterns.push_back("sybil_signals");

    return cluster;
}

// ==========================================
// Silhouette and tuning
// ==========================================

double ClusteringEngine::silhouette(const std::vector<std::vector<size_t>>& candidates,
                                    const SimilarityMatrix& matrix) const {
    if (candidates.empty()) return 0.0;

    double total = 0.0;
    size_t count = 0;

    for (size_t c = 0; c < candidates.size(); ++c) {
        for (size_t i : candidates[c]) {
            double a = 0.0;
            size_t a_count = 0;
            for (size_t other : candidates[c]) {
                if (other == i) continue;
                a += 1.0 - matrix.at(i, other);
                a_count++;
            }
            a = a_count > 0 ? a / static_cast<double>(a_count) : 0.0;

            double b = std::numeric_limits<double>::infinity();
            for (size_t d = 0; d < candidates.size(); ++d) {
                if (d == c || candidates[d].empty()) continue;
                double dist = 0.0;
                for (size_t other : candidates[d]) {
                    dist += 1.0 - matrix.at(i, other);
                }
                b = std::min(b, dist / static_cast<double>(candidates[d].size()));
            }
            if (std::isinf(b)) b = 1.0;  // No other cluster: maximal distance

            double max_dist = std::max(a, b);
            total += max_dist > 0.0 ? (b - a) / max_dist : 0.0;
            count++;
        }
    }

    return count > 0 ? total / static_cast<double>(count) : 0.0;
}

double ClusteringEngine::silhouette_score(const std::vector<Account>& accounts,
                                          const std::vector<Cluster>& clusters) const {
    std::vector<const Account*> sorted = prepare_accounts(accounts);
    if (sorted.empty() || clusters.empty()) return 0.0;

    std::map<std::string, size_t> index;
    for (size_t i = 0; i < sorted.size(); ++i) {
        index[sorted[i]->account_id] = i;
    }

    std::vector<std::vector<size_t>> candidates;
    for (const auto& cluster : clusters) {
        std::vector<size_t> members;
        for (const auto& id : cluster.accounts) {
            auto it = index.find(id);
            if (it == index.end()) {
                throw ValidationError("Cluster " + cluster.cluster_id + " references unknown account", id);
            }
            members.push_back(it->second);
        }
        candidates.push_back(std::move(members));
    }

    SimilarityMatrix matrix(sorted, similarity_, config_.num_threads);
    return silhouette(candidates, matrix);
}

TuningResult ClusteringEngine::find_optimal_parameters(const std::vector<Account>& accounts,
                                                       double min_threshold,
                                                       double max_threshold,
                                                       double step) const {
    if (!(step > 0.0) || !(min_threshold >= 0.0) || !(max_threshold <= 1.0) || min_threshold > max_threshold) {
        throw std::invalid_argument("Invalid tuning range: need 0 <= min <= max <= 1 and step > 0");
    }

    TuningResult result;
    result.optimal_similarity = method_threshold(config_);

    std::vector<const Account*> sorted = prepare_accounts(accounts);
    if (sorted.size() < 2) return result;

    SimilarityMatrix matrix(sorted, similarity_, config_.num_threads);
    const double n = static_cast<double>(sorted.size());
    const int steps = static_cast<int>(std::floor((max_threshold - min_threshold) / step + 1e-9)) + 1;

    bool have_best = false;
    for (int k = 0; k < steps; ++k) {
        report_progress("Tuning", k, steps);

        ClusteringConfig trial = config_;
        double threshold = min_threshold + static_cast<double>(k) * step;
        if (trial.method == ClusteringMethod::DBSCAN) {
            trial.dbscan_eps = threshold;
        } else {
            trial.min_similarity = threshold;
        }

        std::vector<std::vector<size_t>> candidates = run_method(matrix, trial);

        TuningPoint point;
        point.threshold = threshold;
        point.num_clusters = candidates.size();
        if (!candidates.empty()) {
            double size_total = 0.0;
            double density_total = 0.0;
            for (const auto& c : candidates) {
                size_total += static_cast<double>(c.size());
                density_total += matrix.mean_pairwise(c);
            }
            double count = static_cast<double>(candidates.size());
            point.avg_cluster_size = size_total / count;
            point.avg_density = density_total / count;
            point.silhouette = silhouette(candidates, matrix);
            point.score = point.silhouette * (1.0 - 0.3 * std::min(1.0, count / n));

            if (!have_best || point.score > result.best_score) {
                have_best = true;
                result.best_score = point.score;
                result.optimal_similarity = threshold;
            }
        }

        result.metrics.push_back(point);
    }

    report_progress("Tuning", steps, steps);
    return result;
}

} // namespace tg
