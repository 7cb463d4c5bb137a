/**
 * @file  fuzz_entity_loader.cpp
 * @brief libFuzzer target for the CSV loaders and ingestion path
 *
 * Build:
 *   cmake -DTKG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_entity_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_entity_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed entity has a non-empty id and finite timestamp,
 *      duration and confidence.
 *   3. Every parsed property key is non-empty.
 *   4. Ingesting the parsed rows never leaves the store larger than the
 *      number of rows, and discovery over the result stays in [0, 1].
 *
 * The same bytes are fed to both the entity and the relation parser.
 * Invariants are checked with `require`, which traps in every build type,
 * so a Release configuration (NDEBUG) still reports violations.
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include <spdlog/spdlog.h>

#include "tkg/entity_loader.hpp"
#include "tkg/knowledge_graph.hpp"

using namespace tkg;

namespace {

inline void require(bool ok) {
    if (!ok) __builtin_trap();
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const bool quiet = [] {
        spdlog::set_level(spdlog::level::off);
        return true;
    }();
    (void)quiet;

    const std::string input(reinterpret_cast<const char*>(data), size);

    auto entities  = io::EntityLoader::parse_entity_csv_string(input);
    auto relations = io::EntityLoader::parse_relation_csv_string(input);

    Timestamp now = 0.0;
    for (const auto& e : entities) {
        require(!e.id.empty());
        require(std::isfinite(e.timestamp));
        require(std::isfinite(e.duration));
        require(std::isfinite(e.confidence));
        for (const auto& [key, value] : e.properties) {
            require(!key.empty());
            (void)value;
        }
        now = e.timestamp > now ? e.timestamp : now;
    }

    TemporalKnowledgeGraph graph(config::GraphConfig{}, [now] { return now; });
    const std::size_t rows = entities.size();
    for (auto& e : entities) {
        (void)graph.add_entity(std::move(e));
    }
    for (auto& r : relations) {
        (void)graph.add_relation(std::move(r));
    }
    require(graph.get_statistics().entity_count <= rows);

    if (auto hyps = graph.discover_causal_relationships(3600.0)) {
        for (const auto& h : *hyps) {
            require(h.strength >= 0.0 && h.strength <= 1.0);
        }
    }
    return 0;
}
