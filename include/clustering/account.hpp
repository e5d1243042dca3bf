#pragma once

#include "graph/trust_graph.hpp"
#include "reputation/reputation_types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

/**
 * @brief Timestamped activity record of an account
 */
struct Contribution {
    int64_t timestamp = 0;                 // ms
    std::optional<int64_t> block;          // Chain block height, if anchored
    std::string type;

    nlohmann::json to_json() const;
    static Contribution from_json(const nlohmann::json& j);
};

struct Connection {
    std::string target;
    double weight = 1.0;
};

/**
 * @brief Typed profile attributes compared by the metadata feature
 *
 * String fields match exactly (or by the part after '@'), numeric fields
 * by relative difference. `extensions` entries are compared as strings.
 */
struct AccountMetadata {
    std::optional<std::string> email_domain;
    std::optional<int64_t> registration_date;  // ms
    std::optional<double> activity_level;
    std::optional<double> stake;
    std::optional<double> payment_history;
    std::map<std::string, std::string> extensions;

    bool empty() const {
        return !email_domain && !registration_date && !activity_level &&
               !stake && !payment_history && extensions.empty();
    }
};

/**
 * @brief Clustering input record
 *
 * Built by merging profile data with reputation output. Owned by the
 * caller; the engine only reads it.
 */
struct Account {
    std::string account_id;
    std::optional<double> reputation;
    std::optional<double> sybil_probability;
    std::vector<Contribution> contributions;
    std::vector<Connection> connections;
    AccountMetadata metadata;

    /**
     * @brief True if this account lists `other_id` among its connections
     */
    bool connects_to(const std::string& other_id) const;

    nlohmann::json to_json() const;
    static Account from_json(const nlohmann::json& j);
};

// ==========================================
// Pair and cluster results
// ==========================================

/**
 * @brief Raw feature values for one account pair
 */
struct PairFeatures {
    size_t shared_connections = 0;
    double connection_overlap = 0.0;       // Jaccard of connection targets
    double temporal_similarity = 0.0;      // Jaccard of 24h activity buckets
    double metadata_similarity = 0.0;
    int graph_distance = -1;               // 1 when directly connected, -1 unknown

    nlohmann::json to_json() const;
};

struct AccountPair {
    std::string account_a;
    std::string account_b;
    double similarity = 0.0;
    PairFeatures features;

    nlohmann::json to_json() const;
};

/**
 * @brief Group of accounts found by one clustering run
 *
 * `risk_score` is a heuristic ranking signal in [0, 1], never a verdict.
 */
struct Cluster {
    std::string cluster_id;
    std::vector<std::string> accounts;     // Ascending account ids
    double density = 0.0;                  // Mean pairwise similarity
    double cohesion = 0.0;                 // Connected pairs / possible pairs
    double risk_score = 0.0;
    std::vector<std::string> patterns;

    size_t size() const { return accounts.size(); }

    bool has_pattern(const std::string& pattern) const;

    nlohmann::json to_json() const;
};

// ==========================================
// Account ingestion
// ==========================================

/**
 * @brief Build clustering accounts from a scored snapshot
 *
 * Each node becomes an account carrying its final score as reputation, its
 * Sybil probability (if estimated), its outgoing edges as connections and
 * one contribution per incident edge timestamp. `emailDomain`,
 * `registrationDate` and `activityLevel` are read from node extensions.
 */
std::vector<Account> build_accounts(const TrustGraph& graph, const ReputationReport& report);

/**
 * @brief Load accounts from a JSON array or {"accounts": [...]}
 */
std::vector<Account> load_accounts_from_json(const std::string& filename);

nlohmann::json clusters_to_json(const std::vector<Cluster>& clusters);

} // namespace tg
