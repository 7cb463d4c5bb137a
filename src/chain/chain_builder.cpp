/// @file src/chain/chain_builder.cpp
/// @brief ChainBuilder implementation.

#include "tkg/chain_builder.hpp"

#include "../core/hash.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <map>
#include <utility>

namespace tkg::chain {

namespace {

// ─── Scratch graph ────────────────────────────────────────────────────────────

struct Node {
    EntityId   id;
    Timestamp  timestamp;
    EntityKind kind;
};

struct Edge {
    std::size_t to;
    double      strength;
};

struct ScratchGraph {
    std::vector<Node>              nodes;  ///< Sorted by id
    std::vector<std::vector<Edge>> out;    ///< Sorted by target id
};

ScratchGraph build_scratch_graph(std::span<const causal::CausalHypothesis> hypotheses,
                                 double threshold) {
    std::map<EntityId, Node> node_map;
    std::map<std::pair<EntityId, EntityId>, double> edge_map;

    for (const auto& h : hypotheses) {
        if (!(h.strength > threshold) || h.cause_id == h.effect_id) continue;

        node_map.try_emplace(h.cause_id,  Node{h.cause_id,  h.cause_time,  h.cause_kind});
        node_map.try_emplace(h.effect_id, Node{h.effect_id, h.effect_time, h.effect_kind});

        auto [it, inserted] = edge_map.try_emplace({h.cause_id, h.effect_id}, h.strength);
        if (!inserted) {
            it->second = std::max(it->second, h.strength);
        }
    }

    ScratchGraph g;
    std::map<EntityId, std::size_t> index;
    for (auto& [id, node] : node_map) {
        index.emplace(id, g.nodes.size());
        g.nodes.push_back(std::move(node));
    }
    g.out.resize(g.nodes.size());

    // edge_map iterates in (source, target) order, so each list is sorted.
    for (const auto& [key, strength] : edge_map) {
        g.out[index.at(key.first)].push_back(Edge{index.at(key.second), strength});
    }
    return g;
}

/// Strict ranking order: score descending, then id ascending.
bool ranks_before(const CausalChain& a, const CausalChain& b) noexcept {
    const double sa = a.rank_score();
    const double sb = b.rank_score();
    if (sa != sb) return sa > sb;
    return a.id < b.id;
}

/// Keep the best `keep` chains of `chains`, ranked.
void rank_and_trim(std::vector<CausalChain>& chains, std::size_t keep) {
    if (chains.size() > keep) {
        std::nth_element(chains.begin(), chains.begin() + static_cast<std::ptrdiff_t>(keep),
                         chains.end(), ranks_before);
        chains.resize(keep);
    }
    std::sort(chains.begin(), chains.end(), ranks_before);
}

/// Deadline checks read the clock only every this many expansions.
constexpr std::size_t CLOCK_CHECK_INTERVAL = 256;

}  // namespace

// ─── CausalChain ──────────────────────────────────────────────────────────────

std::string CausalChain::to_string() const {
    return fmt::format("{} [{}] strength={:.4f} confidence={:.4f} span={:.0f}s power={:.4f}",
                       id, fmt::join(entities, " -> "),
                       total_strength, chain_confidence, temporal_span, prediction_power);
}

// ─── BuildBudget ──────────────────────────────────────────────────────────────

BuildBudget BuildBudget::with_timeout(std::chrono::milliseconds timeout) {
    BuildBudget budget;
    budget.deadline = std::chrono::steady_clock::now() + timeout;
    return budget;
}

// ─── ChainBuilder ─────────────────────────────────────────────────────────────

ChainBuilder::ChainBuilder(ChainBuilderConfig config)
    : config_(std::move(config))
{}

std::string ChainBuilder::chain_id(std::span<const EntityId> path) {
    std::uint64_t h = detail::FNV_OFFSET_BASIS;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) h = detail::fnv1a64("->", h);
        h = detail::fnv1a64(path[i], h);
    }
    return fmt::format("chain_{:016x}", h);
}

ChainBuildResult
ChainBuilder::build(std::span<const causal::CausalHypothesis> hypotheses,
                    std::size_t max_chain_length,
                    const BuildBudget& budget) const {
    ChainBuildResult result;
    if (max_chain_length == 0 || config_.max_retained == 0) {
        return result;
    }

    const ScratchGraph g = build_scratch_graph(hypotheses, config_.edge_strength_threshold);

    std::size_t expansions = 0;
    auto exhausted = [&]() {
        if (budget.stop.stop_requested()) return true;
        if (budget.max_expansions != 0 && expansions >= budget.max_expansions) return true;
        if (budget.deadline && expansions % CLOCK_CHECK_INTERVAL == 0 &&
            std::chrono::steady_clock::now() >= *budget.deadline) {
            return true;
        }
        return false;
    };

    // Emit the chain for the current path (≥ 2 nodes).
    auto emit = [&](const std::vector<std::size_t>& path, double total_strength) {
        CausalChain c;
        c.entities.reserve(path.size());
        if (config_.link_promoted_relations) c.relations.reserve(path.size() - 1);

        Timestamp lo = std::numeric_limits<double>::infinity();
        Timestamp hi = -std::numeric_limits<double>::infinity();
        for (std::size_t i = 0; i < path.size(); ++i) {
            const Node& n = g.nodes[path[i]];
            c.entities.push_back(n.id);
            lo = std::min(lo, n.timestamp);
            hi = std::max(hi, n.timestamp);
            if (i > 0 && config_.link_promoted_relations) {
                c.relations.push_back(fmt::format("rel:{}->{}", g.nodes[path[i - 1]].id, n.id));
            }
        }

        c.id               = chain_id(c.entities);
        c.terminal_kind    = g.nodes[path.back()].kind;
        c.total_strength   = total_strength;
        c.chain_confidence = total_strength / static_cast<double>(path.size());
        c.temporal_span    = hi - lo;
        c.prediction_power = c.chain_confidence * config_.prediction_multiplier;
        result.chains.push_back(std::move(c));
        ++result.paths_enumerated;

        // Bound memory on dense graphs.
        if (result.chains.size() >= 4 * config_.max_retained) {
            rank_and_trim(result.chains, config_.max_retained);
        }
    };

    struct Frame {
        std::size_t node;
        std::size_t next_edge;
    };

    std::vector<std::size_t> path;
    std::vector<double>      prefix_strength;
    std::vector<bool>        on_path(g.nodes.size(), false);
    std::vector<Frame>       stack;

    for (std::size_t source = 0; source < g.nodes.size() && !result.truncated; ++source) {
        if (g.out[source].empty()) continue;

        path.assign(1, source);
        prefix_strength.assign(1, 1.0);
        on_path[source] = true;
        stack.assign(1, Frame{source, 0});

        while (!stack.empty()) {
            Frame& top = stack.back();
            const bool at_limit = path.size() - 1 >= max_chain_length;
            if (at_limit || top.next_edge >= g.out[top.node].size()) {
                on_path[top.node] = false;
                path.pop_back();
                prefix_strength.pop_back();
                stack.pop_back();
                continue;
            }

            const Edge e = g.out[top.node][top.next_edge++];
            if (on_path[e.to]) continue;  // would revisit a cause

            // Budget applies to expansions only; popping is always allowed.
            if (exhausted()) {
                result.truncated = true;
                break;
            }
            ++expansions;
            path.push_back(e.to);
            prefix_strength.push_back(prefix_strength.back() * e.strength);
            on_path[e.to] = true;

            emit(path, prefix_strength.back());
            stack.push_back(Frame{e.to, 0});
        }

        // Leave on_path clean if the budget interrupted mid-path.
        for (std::size_t n : path) on_path[n] = false;
    }

    rank_and_trim(result.chains, config_.max_retained);

    if (result.truncated) {
        spdlog::warn("build: enumeration stopped by budget after {} paths, keeping {}",
                     result.paths_enumerated, result.chains.size());
    } else {
        spdlog::info("build: {} nodes, {} paths, {} chains retained",
                     g.nodes.size(), result.paths_enumerated, result.chains.size());
    }
    return result;
}

}  // namespace tkg::chain
