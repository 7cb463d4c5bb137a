/// @file src/main.cpp
/// @brief tkg_cli entry point.
///
/// Usage:
///   tkg_cli --analyze <entities.csv> [--relations <csv>] [--config <yaml>] [--now <ts>]
///   tkg_cli --help
///
/// Without `--now`, the analysis clock is pinned to the latest entity
/// timestamp so historical files analyse the same way on every run.

#include "tkg/config.hpp"
#include "tkg/entity_loader.hpp"
#include "tkg/knowledge_graph.hpp"
#include "tkg/logging.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  tkg_cli --analyze <entities.csv> [options]   Run the full analysis\n"
        "  tkg_cli --help                               Show this help\n"
        "\n"
        "Options:\n"
        "  --relations <csv>   Explicit relations to ingest\n"
        "  --config <yaml>     Tuning parameters\n"
        "  --now <seconds>     Analysis time (default: latest entity timestamp)\n"
        "\n"
        "Entity CSV format (header required):\n"
        "  id,kind,timestamp,duration,confidence,source,properties\n"
    );
}

struct CliArgs {
    std::string                entities_path;
    std::optional<std::string> relations_path;
    std::optional<std::string> config_path;
    std::optional<double>      now;
};

std::optional<double> parse_seconds(const std::string& s) {
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (s.empty() || end != s.c_str() + s.size()) {
        return std::nullopt;
    }
    return v;
}

/// Parse options following `--analyze <file>`. Returns nullopt after
/// printing an error.
std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    args.entities_path = argv[2];
    for (int i = 3; i < argc; ++i) {
        const std::string opt(argv[i]);
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", opt);
            return std::nullopt;
        }
        const std::string value(argv[++i]);
        if (opt == "--relations") {
            args.relations_path = value;
        } else if (opt == "--config") {
            args.config_path = value;
        } else if (opt == "--now") {
            args.now = parse_seconds(value);
            if (!args.now) {
                fmt::print(stderr, "Error: --now expects seconds, got '{}'\n", value);
                return std::nullopt;
            }
        } else {
            fmt::print(stderr, "Unknown option: {}\n", opt);
            return std::nullopt;
        }
    }
    return args;
}

int run_analysis(const CliArgs& args) {
    tkg::config::AppConfig cfg;
    if (args.config_path) {
        auto loaded = tkg::config::load_config_file(*args.config_path);
        if (!loaded) {
            fmt::print(stderr, "Error: invalid config '{}'\n", *args.config_path);
            return 1;
        }
        cfg = std::move(*loaded);
    }
    if (!tkg::logging::init(cfg.logging)) {
        return 1;
    }

    auto entities = tkg::io::EntityLoader::load_entities_csv(args.entities_path);
    if (!entities) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", args.entities_path);
        return 1;
    }
    if (entities->empty()) {
        fmt::print(stderr, "Error: no valid entities loaded from '{}'\n", args.entities_path);
        return 1;
    }

    tkg::Timestamp now = entities->front().timestamp;
    if (args.now) {
        now = *args.now;
    } else {
        for (const auto& e : *entities) {
            now = std::max(now, e.timestamp);
        }
    }

    tkg::TemporalKnowledgeGraph graph(cfg.graph, [now] { return now; });

    std::size_t accepted = 0;
    for (auto& e : *entities) {
        const std::string id = e.id;
        const auto status = graph.add_entity(std::move(e));
        if (status == tkg::IngestStatus::Ok) {
            ++accepted;
        } else {
            fmt::print(stderr, "Rejected entity '{}': {}\n", id, tkg::to_string(status));
        }
    }
    fmt::print("Loaded {} of {} entities from '{}'\n",
               accepted, entities->size(), args.entities_path);

    if (args.relations_path) {
        auto relations = tkg::io::EntityLoader::load_relations_csv(*args.relations_path);
        if (!relations) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", *args.relations_path);
            return 1;
        }
        for (auto& r : *relations) {
            const std::string id = r.id;
            const auto status = graph.add_relation(std::move(r));
            if (status != tkg::IngestStatus::Ok) {
                fmt::print(stderr, "Rejected relation '{}': {}\n", id, tkg::to_string(status));
            }
        }
    }

    const auto hypotheses = graph.discover_causal_relationships(cfg.run.discovery_window);
    if (!hypotheses) {
        fmt::print(stderr, "Error: invalid discovery window {}\n", cfg.run.discovery_window);
        return 1;
    }
    fmt::print("\n== Causal hypotheses ({}) ==\n", hypotheses->size());
    for (const auto& h : *hypotheses) {
        fmt::print("{}\n", h.to_string());
    }

    const auto budget = cfg.run.chain_timeout_ms > 0
        ? tkg::chain::BuildBudget::with_timeout(
              std::chrono::milliseconds(cfg.run.chain_timeout_ms))
        : tkg::chain::BuildBudget{};
    const auto built = graph.build_causal_chains(cfg.run.max_chain_length, budget);
    fmt::print("\n== Causal chains ({}{}) ==\n",
               built.chains.size(), built.truncated ? ", truncated" : "");
    for (const auto& c : built.chains) {
        fmt::print("{}\n", c.to_string());
    }

    const auto patterns = graph.discover_temporal_patterns();
    fmt::print("\n== Temporal patterns ({}) ==\n", patterns.size());
    for (const auto& p : patterns) {
        fmt::print("{}\n", p.to_string());
    }

    const auto predictions = graph.predict_future_events(cfg.run.horizon);
    if (!predictions) {
        fmt::print(stderr, "Error: invalid prediction horizon {}\n", cfg.run.horizon);
        return 1;
    }
    fmt::print("\n== Predictions ({}) ==\n", predictions->size());
    for (const auto& p : *predictions) {
        fmt::print("{}\n", p.to_string());
    }

    fmt::print("\n{}\n", graph.get_statistics().to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--analyze") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --analyze requires a CSV file path\n");
            print_usage();
            return 1;
        }
        auto args = parse_args(argc, argv);
        if (!args) {
            print_usage();
            return 1;
        }
        return run_analysis(*args);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
