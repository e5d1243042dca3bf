#pragma once

#include "clustering/account.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

/**
 * @brief Weights of the five pair features
 *
 * Need not sum to 1; the combined similarity is clamped to [0, 1].
 */
struct FeatureWeights {
    double shared_connections = 0.30;
    double connection_overlap = 0.25;
    double temporal_similarity = 0.20;
    double metadata_similarity = 0.15;
    double graph_distance = 0.10;

    bool validate(std::string& error_message) const;

    nlohmann::json to_json() const;
    static FeatureWeights from_json(const nlohmann::json& j);
};

/**
 * @brief Per-account sets precomputed once per run
 */
struct AccountProfile {
    const Account* account = nullptr;
    std::set<std::string> neighbors;       // Connection targets
    std::set<int64_t> activity_days;       // floor(timestamp / 24h)
};

/**
 * @brief Weighted five-feature similarity shared by every clustering method
 *
 * Symmetric by construction: every feature is symmetric in its arguments.
 */
class SimilarityFunction {
public:
    static constexpr int64_t kActivityWindowMs = 24LL * 60 * 60 * 1000;
    static constexpr double kSharedConnectionSaturation = 10.0;
    static constexpr double kMaxGraphDistance = 10.0;

    explicit SimilarityFunction(const FeatureWeights& weights = {});

    const FeatureWeights& weights() const { return weights_; }

    static AccountProfile profile(const Account& account);

    PairFeatures features(const AccountProfile& a, const AccountProfile& b) const;

    /**
     * @brief Weighted sum of normalised features, clamped to [0, 1]
     */
    double combine(const PairFeatures& features) const;

    double similarity(const AccountProfile& a, const AccountProfile& b) const {
        return combine(features(a, b));
    }

    AccountPair compare(const Account& a, const Account& b) const;

    /**
     * @brief Mean per-field match over the fields present on either side
     *
     * A field present on one side only counts as a mismatch; a field absent
     * on both is skipped. Returns 0 when nothing was compared.
     */
    static double metadata_similarity(const AccountMetadata& a, const AccountMetadata& b);

private:
    FeatureWeights weights_;
};

/**
 * @brief Dense symmetric similarity matrix over a fixed account order
 */
class SimilarityMatrix {
public:
    SimilarityMatrix() = default;

    /**
     * @brief Evaluate every pair; rows are split across `num_threads` workers
     *
     * Each cell is written by exactly one worker, so the result does not
     * depend on the thread count.
     */
    SimilarityMatrix(const std::vector<const Account*>& accounts,
                     const SimilarityFunction& function,
                     size_t num_threads = 1);

    size_t size() const { return n_; }

    double at(size_t i, size_t j) const {
        return i == j ? 1.0 : values_[i * n_ + j];
    }

    /**
     * @brief Indices j != i with similarity >= threshold, ascending
     */
    std::vector<size_t> neighbors(size_t i, double threshold) const;

    /**
     * @brief Mean similarity over all unordered pairs of `members`
     */
    double mean_pairwise(const std::vector<size_t>& members) const;

private:
    size_t n_ = 0;
    std::vector<double> values_;
};

} // namespace tg
