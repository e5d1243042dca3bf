#include "clustering/similarity.hpp"
#include "graph/set_metrics.hpp"
#include <algorithm>
#include <cmath>
#include <future>

using json = nlohmann::json;

namespace tg {

namespace {

int64_t floor_div(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) q--;
    return q;
}

double numeric_match(double a, double b) {
    double scale = std::max({std::abs(a), std::abs(b), 1.0});
    return std::max(0.0, 1.0 - std::abs(a - b) / scale);
}

double string_match(const std::string& a, const std::string& b) {
    if (a == b) return 1.0;
    auto at_a = a.find('@');
    auto at_b = b.find('@');
    if (at_a != std::string::npos && at_b != std::string::npos &&
        a.substr(at_a + 1) == b.substr(at_b + 1)) {
        return 0.5;
    }
    return 0.0;
}

// Accumulates one field: skipped when absent on both sides
struct FieldTally {
    double matches = 0.0;
    size_t total = 0;

    template <typename T, typename MatchFn>
    void add(const std::optional<T>& a, const std::optional<T>& b, MatchFn match) {
        if (!a && !b) return;
        total++;
        if (a && b) matches += match(*a, *b);
    }
};

} // namespace

// ==========================================
// FeatureWeights
// ==========================================

bool FeatureWeights::validate(std::string& error_message) const {
    for (double w : {shared_connections, connection_overlap, temporal_similarity,
                     metadata_similarity, graph_distance}) {
        if (!(w >= 0.0) || !std::isfinite(w)) {
            error_message = "Feature weights must be non-negative finite numbers";
            return false;
        }
    }
    return true;
}

json FeatureWeights::to_json() const {
    json j;
    j["shared_connections"] = shared_connections;
    j["connection_overlap"] = connection_overlap;
    j["temporal_similarity"] = temporal_similarity;
    j["metadata_similarity"] = metadata_similarity;
    j["graph_distance"] = graph_distance;
    return j;
}

FeatureWeights FeatureWeights::from_json(const json& j) {
    FeatureWeights w;
    if (j.contains("shared_connections")) w.shared_connections = j["shared_connections"];
    if (j.contains("connection_overlap")) w.connection_overlap = j["connection_overlap"];
    if (j.contains("temporal_similarity")) w.temporal_similarity = j["temporal_similarity"];
    if (j.contains("metadata_similarity")) w.metadata_similarity = j["metadata_similarity"];
    if (j.contains("graph_distance")) w.graph_distance = j["graph_distance"];
    return w;
}

// ==========================================
// SimilarityFunction
// ==========================================

SimilarityFunction::SimilarityFunction(const FeatureWeights& weights)
    : weights_(weights) {
    std::string error;
    if (!weights_.validate(error)) {
        throw std::invalid_argument("Invalid feature weights: " + error);
    }
}

AccountProfile SimilarityFunction::profile(const Account& account) {
    AccountProfile p;
    p.account = &account;
    for (const auto& c : account.connections) {
        p.neighbors.insert(c.target);
    }
    for (const auto& c : account.contributions) {
        p.activity_days.insert(floor_div(c.timestamp, kActivityWindowMs));
    }
    return p;
}

PairFeatures SimilarityFunction::features(const AccountProfile& a, const AccountProfile& b) const {
    PairFeatures f;
    f.shared_connections = intersection_size(a.neighbors, b.neighbors);
    f.connection_overlap = jaccard_similarity(a.neighbors, b.neighbors);

    if (!a.activity_days.empty() && !b.activity_days.empty()) {
        f.temporal_similarity = jaccard_similarity(a.activity_days, b.activity_days);
    }

    f.metadata_similarity = metadata_similarity(a.account->metadata, b.account->metadata);

    // Either direction counts as a direct link
    const std::string& id_a = a.account->account_id;
    const std::string& id_b = b.account->account_id;
    if (a.neighbors.count(id_b) > 0 || b.neighbors.count(id_a) > 0) {
        f.graph_distance = 1;
    }

    return f;
}

double SimilarityFunction::combine(const PairFeatures& f) const {
    double distance_term = f.graph_distance < 0
        ? 0.0
        : std::max(0.0, 1.0 - static_cast<double>(f.graph_distance) / kMaxGraphDistance);

    double s = weights_.shared_connections *
                   std::min(1.0, static_cast<double>(f.shared_connections) / kSharedConnectionSaturation)
             + weights_.connection_overlap * f.connection_overlap
             + weights_.temporal_similarity * f.temporal_similarity
             + weights_.metadata_similarity * f.metadata_similarity
             + weights_.graph_distance * distance_term;

    return std::max(0.0, std::min(1.0, s));
}

AccountPair SimilarityFunction::compare(const Account& a, const Account& b) const {
    AccountProfile pa = profile(a);
    AccountProfile pb = profile(b);

    AccountPair pair;
    pair.account_a = a.account_id;
    pair.account_b = b.account_id;
    pair.features = features(pa, pb);
    pair.similarity = combine(pair.features);
    return pair;
}

double SimilarityFunction::metadata_similarity(const AccountMetadata& a, const AccountMetadata& b) {
    FieldTally tally;

    tally.add(a.email_domain, b.email_domain, string_match);
    tally.add(a.registration_date, b.registration_date, [](int64_t x, int64_t y) {
        return numeric_match(static_cast<double>(x), static_cast<double>(y));
    });
    tally.add(a.activity_level, b.activity_level, numeric_match);
    tally.add(a.stake, b.stake, numeric_match);
    tally.add(a.payment_history, b.payment_history, numeric_match);

    std::set<std::string> keys;
    for (const auto& [k, v] : a.extensions) keys.insert(k);
    for (const auto& [k, v] : b.extensions) keys.insert(k);
    for (const auto& key : keys) {
        auto ia = a.extensions.find(key);
        auto ib = b.extensions.find(key);
        std::optional<std::string> va;
        std::optional<std::string> vb;
        if (ia != a.extensions.end()) va = ia->second;
        if (ib != b.extensions.end()) vb = ib->second;
        tally.add(va, vb, string_match);
    }

    return tally.total > 0 ? tally.matches / static_cast<double>(tally.total) : 0.0;
}

// ==========================================
// SimilarityMatrix
// ==========================================

SimilarityMatrix::SimilarityMatrix(const std::vector<const Account*>& accounts,
                                   const SimilarityFunction& function,
                                   size_t num_threads)
    : n_(accounts.size()), values_(accounts.size() * accounts.size(), 0.0) {

    std::vector<AccountProfile> profiles;
    profiles.reserve(n_);
    for (const Account* a : accounts) {
        profiles.push_back(SimilarityFunction::profile(*a));
    }

    auto fill_row = [this, &profiles, &function](size_t i) {
        for (size_t j = i + 1; j < n_; ++j) {
            double s = function.similarity(profiles[i], profiles[j]);
            values_[i * n_ + j] = s;
            values_[j * n_ + i] = s;
        }
    };

    const size_t workers = std::max<size_t>(1, std::min(num_threads, n_));
    if (workers <= 1) {
        for (size_t i = 0; i < n_; ++i) fill_row(i);
        return;
    }

    // Rows are striped so the triangular workload stays balanced
    std::vector<std::future<void>> futures;
    for (size_t t = 0; t < workers; ++t) {
        futures.push_back(std::async(std::launch::async, [t, workers, this, &fill_row]() {
            for (size_t i = t; i < n_; i += workers) fill_row(i);
        }));
    }
    for (auto& f : futures) {
        f.get();
    }
}

std::vector<size_t> SimilarityMatrix::neighbors(size_t i, double threshold) const {
    std::vector<size_t> result;
    for (size_t j = 0; j < n_; ++j) {
        if (j != i && values_[i * n_ + j] >= threshold) result.push_back(j);
    }
    return result;
}

double SimilarityMatrix::mean_pairwise(const std::vector<size_t>& members) const {
    double total = 0.0;
    size_t pairs = 0;
    for (size_t a = 0; a < members.size(); ++a) {
        for (size_t b = a + 1; b < members.size(); ++b) {
            total += at(members[a], members[b]);
            pairs++;
        }
    }
    return pairs > 0 ? total / static_cast<double>(pairs) : 0.0;
}

} // namespace tg
