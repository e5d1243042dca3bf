#include "cli/cli.hpp"
#include "graph/trust_graph.hpp"
#include "reputation/reputation_scorer.hpp"
#include "clustering/account.hpp"
#include "clustering/clustering_engine.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

using namespace tg;

const std::vector<std::string> kMethods = {"dbscan", "connectivity", "hierarchical", "similarity"};
const std::vector<std::string> kOversizePolicies = {"recluster", "truncate", "reject"};

// ============== Helper Functions ==============

// Generate timestamp-based run ID
std::string generate_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << "run_" << std::put_time(std::gmtime(&time), "%Y%m%d_%H%M%S");
    return ss.str();
}

void write_json(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << j.dump(2);
}

ProgressCallback verbose_progress(bool verbose) {
    if (!verbose) return nullptr;
    return [](const std::string& stage, int current, int total) {
        std::cerr << "  [" << current << "/" << total << "] " << stage << "\n";
    };
}

ScorerConfig load_scorer_config(const ParsedOptions& args) {
    ScorerConfig config;
    if (args.has("config")) {
        config = ScorerConfig::from_json_file(args.require("config"));
    }

    // Command-line overrides
    if (args.has("damping")) config.damping_factor = args.get("damping").as_double();
    if (args.has("max-iterations")) config.max_iterations = args.get("max-iterations").as_int();
    if (args.has("decay")) config.temporal_decay = args.get("decay").as_double();
    if (args.has("no-hybrid")) config.hybrid_enabled = false;
    if (args.has("fair")) config.apply_fairness_adjustments = true;
    return config;
}

ClusteringConfig load_clustering_config(const ParsedOptions& args) {
    ClusteringConfig config;
    if (args.has("config")) {
        config = ClusteringConfig::from_json_file(args.require("config"));
    }

    if (args.has("method")) config.method = string_to_clustering_method(args.require("method"));
    if (args.has("min-similarity")) config.min_similarity = args.get("min-similarity").as_double();
    if (args.has("min-size")) config.min_cluster_size = args.get("min-size").as_size();
    if (args.has("max-size")) config.max_cluster_size = args.get("max-size").as_size();
    if (args.has("eps")) config.dbscan_eps = args.get("eps").as_double();
    if (args.has("min-pts")) config.dbscan_min_pts = args.get("min-pts").as_size();
    if (args.has("oversize")) config.oversize_policy = string_to_oversize_policy(args.require("oversize"));
    if (args.has("threads")) config.num_threads = args.get("threads").as_size();
    return config;
}

void warn_if_not_converged(const ReputationReport& report) {
    if (!report.metadata.converged) {
        std::cerr << "Warning: PageRank did not converge after " << report.metadata.iterations
                  << " iterations (final delta " << report.metadata.final_delta
                  << "); scores are provisional\n";
    }
}

void print_top_scores(const ReputationReport& report, size_t top) {
    auto ranked = report.ranked_node_ids();
    std::cout << "\nTop " << std::min(top, ranked.size()) << " nodes:\n";
    for (size_t i = 0; i < ranked.size() && i < top; ++i) {
        const auto& s = report.scores.at(ranked[i]);
        std::cout << "  " << std::left << std::setw(20) << s.node_id << std::right
                  << std::fixed << std::setprecision(2)
                  << " final " << std::setw(8) << s.final_score
                  << "  pct " << std::setw(6) << s.percentile;
        auto sybil = report.sybil.find(s.node_id);
        if (sybil != report.sybil.end()) {
            std::cout << "  sybil " << sybil->second.probability;
        }
        std::cout << "\n";
    }
}

void print_clusters(const std::vector<Cluster>& clusters) {
    std::cout << "\nClusters found: " << clusters.size() << "\n";
    for (const auto& c : clusters) {
        std::cout << "  " << c.cluster_id << ": " << c.size() << " accounts"
                  << std::fixed << std::setprecision(3)
                  << ", density " << c.density
                  << ", cohesion " << c.cohesion
                  << ", risk " << c.risk_score;
        if (!c.patterns.empty()) {
            std::cout << " [";
            for (size_t i = 0; i < c.patterns.size(); ++i) {
                if (i > 0) std::cout << ", ";
                std::cout << c.patterns[i];
            }
            std::cout << "]";
        }
        std::cout << "\n";
    }
}

// ============== tg score ==============
int cmd_score(const ParsedOptions& args) {
    std::string input_path = args.require("input");
    bool verbose = args.has("verbose");

    GraphOptions options;
    options.allow_self_loops = args.has("allow-self-loops");

    std::cout << "Loading graph from: " << input_path << "\n";
    TrustGraph graph = TrustGraph::load_from_json(input_path, options);
    std::cout << "  " << graph.num_nodes() << " nodes, " << graph.num_edges() << " edges\n";

    ReputationScorer scorer(load_scorer_config(args));
    scorer.set_progress_callback(verbose_progress(verbose));

    ScoringRequest request;
    request.audit_nodes = args.get("audit").as_list();
    request.audit_top_n = args.get("audit-top", "0").as_size();

    ReputationReport report = scorer.score(graph, request);
    warn_if_not_converged(report);

    print_top_scores(report, args.get("top", "10").as_size());

    if (report.fairness) {
        std::cout << "\nFairness:\n";
        std::cout << "  Gini: " << report.fairness->gini_coefficient << "\n";
        std::cout << "  Minority representation: " << report.fairness->minority_representation << "\n";
        std::cout << "  Bias score: " << report.fairness->bias_score << "\n";
    }

    for (const auto& audit : report.audits) {
        std::cout << "\nAudit " << audit.node_id << " (graph score " << audit.base_score << "):\n";
        for (const auto& e : audit.top_influencing_edges) {
            std::cout << "  " << e.source << " -> " << e.target << " #" << e.edge_index
                      << "  impact " << e.impact << " (" << e.relative_impact << "%)\n";
        }
    }

    if (args.has("output")) {
        std::string output = args.require("output");
        report.export_to_json(output);
        std::cout << "\nReport written to: " << output << "\n";
    }

    return 0;
}

// ============== tg cluster ==============
int cmd_cluster(const ParsedOptions& args) {
    std::string input_path = args.require("input");

    std::cout << "Loading accounts from: " << input_path << "\n";
    std::vector<Account> accounts = load_accounts_from_json(input_path);
    std::cout << "  " << accounts.size() << " accounts\n";

    ClusteringEngine engine(load_clustering_config(args));
    engine.set_progress_callback(verbose_progress(args.has("verbose")));

    std::cout << "Method: " << clustering_method_to_string(engine.config().method) << "\n";
    std::vector<Cluster> clusters = engine.find_clusters(accounts);
    print_clusters(clusters);

    if (args.has("output")) {
        std::string output = args.require("output");
        write_json(output, clusters_to_json(clusters));
        std::cout << "\nClusters written to: " << output << "\n";
    }

    return 0;
}

// ============== tg tune ==============
int cmd_tune(const ParsedOptions& args) {
    std::string input_path = args.require("input");

    std::vector<Account> accounts = load_accounts_from_json(input_path);
    ClusteringEngine engine(load_clustering_config(args));
    engine.set_progress_callback(verbose_progress(args.has("verbose")));

    double min_t = args.get("min", "0.1").as_double();
    double max_t = args.get("max", "0.9").as_double();
    double step = args.get("step", "0.05").as_double();

    std::cout << "Sweeping thresholds " << min_t << " .. " << max_t << " (step " << step << ") over "
              << accounts.size() << " accounts\n";

    TuningResult result = engine.find_optimal_parameters(accounts, min_t, max_t, step);

    std::cout << "\n  threshold  clusters  silhouette  score\n";
    for (const auto& m : result.metrics) {
        std::cout << std::fixed << std::setprecision(3)
                  << "  " << std::setw(9) << m.threshold
                  << "  " << std::setw(8) << m.num_clusters
                  << "  " << std::setw(10) << m.silhouette
                  << "  " << std::setw(6) << m.score << "\n";
    }
    std::cout << "\nOptimal threshold: " << result.optimal_similarity << "\n";

    if (args.has("output")) {
        write_json(args.require("output"), result.to_json());
    }

    return 0;
}

// ============== tg stats ==============
int cmd_stats(const ParsedOptions& args) {
    std::string input_path = args.require("input");

    GraphOptions options;
    options.allow_self_loops = args.has("allow-self-loops");

    std::cout << "Loading graph from: " << input_path << "\n";
    TrustGraph graph = TrustGraph::load_from_json(input_path, options);

    auto stats = graph.compute_statistics();

    std::cout << "\nGraph Statistics:\n";
    std::cout << "  Nodes: " << stats.num_nodes << "\n";
    std::cout << "  Edges: " << stats.num_edges << "\n";
    std::cout << "  Dangling nodes: " << stats.num_dangling_nodes << "\n";
    std::cout << "  Isolated nodes: " << stats.num_isolated_nodes << "\n";
    std::cout << "  Avg in-degree: " << stats.avg_in_degree << "\n";
    std::cout << "  Max in-degree: " << stats.max_in_degree << "\n";
    std::cout << "  Max out-degree: " << stats.max_out_degree << "\n";
    std::cout << "  Timestamp span: " << stats.oldest_timestamp << " .. " << stats.newest_timestamp << "\n";

    std::cout << "\nEdge types:\n";
    for (const auto& [type, count] : stats.edge_type_counts) {
        std::cout << "  " << type << ": " << count << "\n";
    }

    return 0;
}

// ============== tg run (score + cluster) ==============
int cmd_run(const ParsedOptions& args) {
    std::string input_path = args.require("input");
    std::string output_base = args.get("output", "runs/").text;
    bool verbose = args.has("verbose");

    std::string run_dir = (fs::path(output_base) / generate_run_id()).string();
    fs::create_directories(run_dir);
    std::cout << "Run directory: " << run_dir << "\n";

    // Stage 1: scoring
    std::cout << "\n[1/2] Scoring " << input_path << "\n";
    TrustGraph graph = TrustGraph::load_from_json(input_path);
    ReputationScorer scorer(load_scorer_config(args));
    scorer.set_progress_callback(verbose_progress(verbose));

    ScoringRequest request;
    request.audit_top_n = args.get("audit-top", "0").as_size();
    ReputationReport report = scorer.score(graph, request);
    warn_if_not_converged(report);
    report.export_to_json((fs::path(run_dir) / "report.json").string());
    print_top_scores(report, 5);

    // Stage 2: clustering
    std::cout << "\n[2/2] Clustering accounts\n";
    std::vector<Account> accounts = build_accounts(graph, report);
    nlohmann::json accounts_json = nlohmann::json::array();
    for (const auto& a : accounts) accounts_json.push_back(a.to_json());
    write_json((fs::path(run_dir) / "accounts.json").string(), accounts_json);

    ClusteringEngine engine(load_clustering_config(args));
    engine.set_progress_callback(verbose_progress(verbose));
    std::vector<Cluster> clusters = engine.find_clusters(accounts);
    print_clusters(clusters);
    write_json((fs::path(run_dir) / "clusters.json").string(), clusters_to_json(clusters));

    std::cout << "\nOutputs written to: " << run_dir << "\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CommandLine cli("tg", "1.0.0", "Trust graph reputation and Sybil cluster detection");

    // tg score
    cli.add({
        "score",
        "Compute reputation scores for a trust graph",
        {
            {"input", "i", "Input graph JSON file ({nodes, edges})", "", true, false},
            {"config", "c", "Scorer config JSON file", "", false, false},
            {"output", "o", "Output path for the report JSON", "", false, false},
            {"audit", "a", "Comma-separated node ids to audit", "", false, false},
            {"audit-top", "n", "Also audit the top N nodes by score", "0", false, false},
            {"top", "t", "Number of top nodes to print", "10", false, false},
            {"damping", "d", "PageRank damping factor", "", false, false},
            {"max-iterations", "", "Maximum PageRank iterations", "", false, false},
            {"decay", "", "Temporal decay rate per year", "", false, false},
            {"no-hybrid", "", "Use the graph score alone as final score", "", false, true},
            {"fair", "f", "Apply fairness adjustments", "", false, true},
            {"allow-self-loops", "", "Accept self-loop edges", "", false, true},
            {"verbose", "v", "Print progress to stderr", "", false, true}
        },
        cmd_score
    });

    // tg cluster
    cli.add({
        "cluster",
        "Find clusters of coordinated accounts",
        {
            {"input", "i", "Input accounts JSON file", "", true, false},
            {"config", "c", "Clustering config JSON file", "", false, false},
            {"output", "o", "Output path for clusters JSON", "", false, false},
            {"method", "m", "Clustering method", "", false, false, kMethods},
            {"min-similarity", "s", "Pair similarity threshold", "", false, false},
            {"min-size", "", "Minimum cluster size", "", false, false},
            {"max-size", "", "Maximum cluster size", "", false, false},
            {"eps", "e", "DBSCAN neighbor similarity", "", false, false},
            {"min-pts", "p", "DBSCAN core neighbor count", "", false, false},
            {"oversize", "", "Policy for components above --max-size", "", false, false, kOversizePolicies},
            {"threads", "j", "Worker threads for pairwise similarity", "", false, false},
            {"verbose", "v", "Print progress to stderr", "", false, true}
        },
        cmd_cluster
    });

    // tg tune
    cli.add({
        "tune",
        "Sweep the similarity threshold and report silhouette scores",
        {
            {"input", "i", "Input accounts JSON file", "", true, false},
            {"config", "c", "Clustering config JSON file", "", false, false},
            {"output", "o", "Output path for tuning JSON", "", false, false},
            {"method", "m", "Clustering method", "", false, false, kMethods},
            {"min", "", "Lowest threshold", "0.1", false, false},
            {"max", "", "Highest threshold", "0.9", false, false},
            {"step", "", "Threshold step", "0.05", false, false},
            {"threads", "j", "Worker threads for pairwise similarity", "", false, false},
            {"verbose", "v", "Print progress to stderr", "", false, true}
        },
        cmd_tune
    });

    // tg stats
    cli.add({
        "stats",
        "Print statistics about a trust graph",
        {
            {"input", "i", "Input graph JSON file", "", true, false},
            {"allow-self-loops", "", "Accept self-loop edges", "", false, true}
        },
        cmd_stats
    });

    // tg run
    cli.add({
        "run",
        "Score a graph, build accounts and cluster them",
        {
            {"input", "i", "Input graph JSON file", "", true, false},
            {"config", "c", "Combined config JSON ({scorer, clustering})", "", false, false},
            {"output", "o", "Base output directory", "runs/", false, false},
            {"audit-top", "n", "Audit the top N nodes by score", "0", false, false},
            {"method", "m", "Clustering method", "", false, false, kMethods},
            {"min-similarity", "s", "Pair similarity threshold", "", false, false},
            {"fair", "f", "Apply fairness adjustments", "", false, true},
            {"verbose", "v", "Print progress to stderr", "", false, true}
        },
        cmd_run
    });

    return cli.run(argc, argv);
}
