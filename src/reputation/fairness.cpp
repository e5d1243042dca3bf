#include "reputation/reputation_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tg {

double ReputationScorer::gini_coefficient(std::vector<double> values) {
    if (values.empty()) return 0.0;

    std::sort(values.begin(), values.end());

    double sum = 0.0;
    double weighted = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        sum += values[i];
        weighted += static_cast<double>(i + 1) * values[i];
    }
    if (sum <= 0.0) return 0.0;

    const double n = static_cast<double>(values.size());
    double gini = (2.0 * weighted) / (n * sum) - (n + 1.0) / n;
    return std::max(0.0, std::min(1.0, gini));
}

FairnessMetrics ReputationScorer::compute_fairness_metrics(
    const TrustGraph& graph,
    const std::map<std::string, ReputationScore>& scores) const {

    FairnessMetrics metrics;
    if (scores.empty()) return metrics;

    std::vector<double> finals;
    finals.reserve(scores.size());
    for (const auto& [id, s] : scores) finals.push_back(s.final_score);
    metrics.gini_coefficient = gini_coefficient(finals);

    // Top decile by final score descending, ties by id
    std::vector<const ReputationScore*> ranked;
    for (const auto& [id, s] : scores) ranked.push_back(&s);
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const ReputationScore* a, const ReputationScore* b) {
            return a->final_score > b->final_score;
        });

    const size_t n = ranked.size();
    const size_t top = std::max<size_t>(1, n / 10);

    auto is_minority = [&graph](const std::string& id) {
        const GraphNode* node = graph.get_node(id);
        return node != nullptr && node->metadata.is_minority();
    };

    size_t minority_total = 0;
    for (const auto* s : ranked) {
        if (is_minority(s->node_id)) minority_total++;
    }
    size_t minority_top = 0;
    for (size_t i = 0; i < top; ++i) {
        if (is_minority(ranked[i]->node_id)) minority_top++;
    }

    if (minority_total > 0) {
        double population_share = static_cast<double>(minority_total) / static_cast<double>(n);
        double top_share = static_cast<double>(minority_top) / static_cast<double>(top);
        metrics.minority_representation = top_share / population_share;
    }

    // Normalised entropy of the two groups inside the top decile
    if (minority_total > 0 && minority_total < n) {
        size_t groups_possible = std::min<size_t>(2, top);
        if (groups_possible >= 2) {
            double entropy = 0.0;
            for (size_t count : {minority_top, top - minority_top}) {
                if (count == 0) continue;
                double p = static_cast<double>(count) / static_cast<double>(top);
                entropy -= p * std::log2(p);
            }
            metrics.top_decile_diversity = entropy / std::log2(static_cast<double>(groups_possible));
        }
    }

    double representation_deficit = 1.0 - std::min(1.0, metrics.minority_representation);
    double diversity_deficit = 1.0 - metrics.top_decile_diversity;
    metrics.bias_score = std::max(0.0, std::min(1.0,
        0.5 * representation_deficit + 0.5 * diversity_deficit));

    return metrics;
}

bool ReputationScorer::apply_fairness_adjustments(
    const TrustGraph& graph,
    std::map<std::string, ReputationScore>& scores) const {

    if (scores.empty() || config_.fairness_adjustment_strength <= 0.0) return false;

    double total = 0.0;
    double minority_total = 0.0;
    size_t minority_count = 0;
    for (const auto& [id, s] : scores) {
        total += s.final_score;
        const GraphNode* node = graph.get_node(id);
        if (node != nullptr && node->metadata.is_minority()) {
            minority_total += s.final_score;
            minority_count++;
        }
    }

    if (minority_count == 0 || minority_count == scores.size()) return false;

    const double mean = total / static_cast<double>(scores.size());
    const double minority_mean = minority_total / static_cast<double>(minority_count);
    if (!(minority_mean > 0.0) || minority_mean >= mean) return false;

    const double boost = (mean / minority_mean - 1.0) * config_.fairness_adjustment_strength;

    double adjusted_total = 0.0;
    for (auto& [id, s] : scores) {
        const GraphNode* node = graph.get_node(id);
        if (node != nullptr && node->metadata.is_minority()) {
            s.final_score *= 1.0 + boost;
        }
        adjusted_total += s.final_score;
    }

    // Rescale so the run keeps its original total score mass
    const double scale = adjusted_total > 0.0 ? total / adjusted_total : 1.0;
    std::ostringstream note;
    note << std::fixed << std::setprecision(2)
         << "Fairness adjustment: minority boost " << (boost * 100.0) << "%";

    for (auto& [id, s] : scores) {
        s.final_score *= scale;
        const GraphNode* node = graph.get_node(id);
        if (node != nullptr && node->metadata.is_minority()) {
            s.explanation.push_back(note.str());
        }
    }

    assign_percentiles(scores);
    return true;
}

} // namespace tg
