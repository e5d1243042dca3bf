#include "clustering/account.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace tg {

namespace {

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

std::optional<int64_t> parse_int_extension(const std::map<std::string, std::string>& ext,
                                           const std::string& key,
                                           const std::string& node_id) {
    auto it = ext.find(key);
    if (it == ext.end()) return std::nullopt;
    try {
        size_t pos = 0;
        int64_t value = std::stoll(it->second, &pos);
        if (pos != it->second.size()) {
            throw std::invalid_argument(key);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ValidationError("Extension '" + key + "' is not an integer: " + it->second, node_id);
    }
}

std::optional<double> parse_double_extension(const std::map<std::string, std::string>& ext,
                                             const std::string& key,
                                             const std::string& node_id) {
    auto it = ext.find(key);
    if (it == ext.end()) return std::nullopt;
    try {
        size_t pos = 0;
        double value = std::stod(it->second, &pos);
        if (pos != it->second.size()) {
            throw std::invalid_argument(key);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ValidationError("Extension '" + key + "' is not a number: " + it->second, node_id);
    }
}

} // namespace

// ==========================================
// Contribution / Account
// ==========================================

json Contribution::to_json() const {
    json j;
    j["timestamp"] = timestamp;
    if (block) j["block"] = *block;
    if (!type.empty()) j["type"] = type;
    return j;
}

Contribution Contribution::from_json(const json& j) {
    Contribution c;
    c.timestamp = j.at("timestamp").get<int64_t>();
    read_optional(j, "block", c.block);
    c.type = j.value("type", std::string());
    return c;
}

bool Account::connects_to(const std::string& other_id) const {
    return std::any_of(connections.begin(), connections.end(),
                       [&other_id](const Connection& c) { return c.target == other_id; });
}

json Account::to_json() const {
    json j;
    j["account_id"] = account_id;
    if (reputation) j["reputation"] = *reputation;
    if (sybil_probability) j["sybil_probability"] = *sybil_probability;

    json contribs = json::array();
    for (const auto& c : contributions) contribs.push_back(c.to_json());
    j["contributions"] = contribs;

    json conns = json::array();
    for (const auto& c : connections) {
        conns.push_back({{"target", c.target}, {"weight", c.weight}});
    }
    j["connections"] = conns;

    json meta = json::object();
    if (metadata.email_domain) meta["email_domain"] = *metadata.email_domain;
    if (metadata.registration_date) meta["registration_date"] = *metadata.registration_date;
    if (metadata.activity_level) meta["activity_level"] = *metadata.activity_level;
    if (metadata.stake) meta["stake"] = *metadata.stake;
    if (metadata.payment_history) meta["payment_history"] = *metadata.payment_history;
    if (!metadata.extensions.empty()) meta["extensions"] = metadata.extensions;
    j["metadata"] = meta;

    return j;
}

Account Account::from_json(const json& j) {
    Account a;
    a.account_id = j.at("account_id").get<std::string>();
    read_optional(j, "reputation", a.reputation);
    read_optional(j, "sybil_probability", a.sybil_probability);

    if (j.contains("contributions")) {
        for (const auto& c : j["contributions"]) {
            a.contributions.push_back(Contribution::from_json(c));
        }
    }

    if (j.contains("connections")) {
        for (const auto& c : j["connections"]) {
            Connection conn;
            conn.target = c.at("target").get<std::string>();
            conn.weight = c.value("weight", 1.0);
            a.connections.push_back(conn);
        }
    }

    if (j.contains("metadata")) {
        const auto& meta = j["metadata"];
        read_optional(meta, "email_domain", a.metadata.email_domain);
        read_optional(meta, "registration_date", a.metadata.registration_date);
        read_optional(meta, "activity_level", a.metadata.activity_level);
        read_optional(meta, "stake", a.metadata.stake);
        read_optional(meta, "payment_history", a.metadata.payment_history);
        if (meta.contains("extensions")) {
            a.metadata.extensions = meta["extensions"].get<std::map<std::string, std::string>>();
        }
    }

    return a;
}

// ==========================================
// Pair / Cluster serialization
// ==========================================

json PairFeatures::to_json() const {
    json j;
    j["shared_connections"] = shared_connections;
    j["connection_overlap"] = connection_overlap;
    j["temporal_similarity"] = temporal_similarity;
    j["metadata_similarity"] = metadata_similarity;
    j["graph_distance"] = graph_distance;
    return j;
}

json AccountPair::to_json() const {
    json j;
    j["account_a"] = account_a;
    j["account_b"] = account_b;
    j["similarity"] = similarity;
    j["features"] = features.to_json();
    return j;
}

bool Cluster::has_pattern(const std::string& pattern) const {
    return std::find(patterns.begin(), patterns.end(), pattern) != patterns.end();
}

json Cluster::to_json() const {
    json j;
    j["cluster_id"] = cluster_id;
    j["accounts"] = accounts;
    j["size"] = size();
    j["density"] = density;
    j["cohesion"] = cohesion;
    j["risk_score"] = risk_score;
    j["patterns"] = patterns;
    return j;
}

json clusters_to_json(const std::vector<Cluster>& clusters) {
    json arr = json::array();
    for (const auto& c : clusters) arr.push_back(c.to_json());
    return arr;
}

// ==========================================
// Account ingestion
// ==========================================

std::vector<Account> build_accounts(const TrustGraph& graph, const ReputationReport& report) {
    std::vector<Account> accounts;
    accounts.reserve(graph.num_nodes());

    for (size_t i = 0; i < graph.num_nodes(); ++i) {
        const GraphNode& node = graph.node(i);
        Account account;
        account.account_id = node.id;

        auto score_it = report.scores.find(node.id);
        if (score_it != report.scores.end()) {
            account.reputation = score_it->second.final_score;
        }
        auto sybil_it = report.sybil.find(node.id);
        if (sybil_it != report.sybil.end()) {
            account.sybil_probability = sybil_it->second.probability;
        }

        for (size_t e : graph.out_edges(i)) {
            const GraphEdge& edge = graph.edge(e);
            account.connections.push_back({edge.target, edge.weight});
        }

        // One contribution per incident edge, in edge order
        std::vector<size_t> incident = graph.out_edges(i);
        incident.insert(incident.end(), graph.in_edges(i).begin(), graph.in_edges(i).end());
        std::sort(incident.begin(), incident.end());
        incident.erase(std::unique(incident.begin(), incident.end()), incident.end());
        for (size_t e : incident) {
            Contribution c;
            c.timestamp = graph.edge(e).timestamp;
            c.type = edge_type_to_string(graph.edge(e).edge_type);
            account.contributions.push_back(c);
        }

        const auto& ext = node.metadata.extensions;
        auto email = ext.find("emailDomain");
        if (email != ext.end()) account.metadata.email_domain = email->second;
        account.metadata.registration_date = parse_int_extension(ext, "registrationDate", node.id);
        account.metadata.activity_level = parse_double_extension(ext, "activityLevel", node.id);
        account.metadata.stake = node.metadata.stake;
        account.metadata.payment_history = node.metadata.payment_history;

        for (const auto& [key, value] : ext) {
            if (key == "emailDomain" || key == "registrationDate" || key == "activityLevel") continue;
            account.metadata.extensions[key] = value;
        }

        accounts.push_back(std::move(account));
    }

    return accounts;
}

std::vector<Account> load_accounts_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }

    json j;
    file >> j;

    const json& arr = j.is_array() ? j : j.at("accounts");
    std::vector<Account> accounts;
    for (const auto& item : arr) {
        accounts.push_back(Account::from_json(item));
    }
    return accounts;
}

} // namespace tg
