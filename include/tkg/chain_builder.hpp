#pragma once

/// @file include/tkg/chain_builder.hpp
/// @brief ChainBuilder: ranked multi-hop causal chains from hypotheses.
///
/// # Module: Chain Builder
///
/// ## Responsibility
/// Promote strong hypotheses (strength > 0.6) into a scratch directed graph,
/// enumerate every simple path of 1..max_chain_length edges, score each path
/// and keep the top 100.
///
/// ## Scoring
///   total_strength   = Π edge.strength          (≤ min edge strength)
///   chain_confidence = total_strength / |nodes|  (penalises length)
///   temporal_span    = max(ts) − min(ts) over path nodes
///   prediction_power = chain_confidence · prediction_multiplier
///
/// `prediction_multiplier` (default 0.8) is a tunable constant, not a
/// calibrated model.
///
/// Chains are ordered by `total_strength · chain_confidence` descending with
/// the chain id as the final tie-breaker, so rebuilding from the same input
/// yields the same ids in the same order.
///
/// ## Cancellation
/// Enumeration is an explicit-stack DFS. Between path expansions it checks a
/// `BuildBudget` (stop token, deadline, expansion cap); when any trips, the
/// chains found so far are ranked and returned with `truncated = true`.
///
/// ## Guarantees
/// - Never reads the entity store: node timestamps come from the hypotheses
/// - A chain never repeats a node
/// - Never throws

#include "tkg/causal_discovery.hpp"
#include "tkg/constants.hpp"
#include "tkg/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace tkg::chain {

// ─── CausalChain ──────────────────────────────────────────────────────────────

/// A simple path of causal edges. Owns copies of the ids it references.
struct CausalChain {
    std::string           id;
    std::vector<EntityId> entities;          ///< Path, cause first
    std::vector<std::string> relations;      ///< Promoted relation id per edge, if linked
    EntityKind            terminal_kind    = EntityKind::MarketEvent;  ///< Kind of the last entity
    double                total_strength   = 0.0;
    double                chain_confidence = 0.0;
    Duration              temporal_span    = 0.0;
    double                prediction_power = 0.0;

    /// Number of edges.
    [[nodiscard]] std::size_t length() const noexcept {
        return entities.empty() ? 0 : entities.size() - 1;
    }

    /// Ranking key: total_strength · chain_confidence.
    [[nodiscard]] double rank_score() const noexcept {
        return total_strength * chain_confidence;
    }

    [[nodiscard]] std::string to_string() const;
};

// ─── Configuration ────────────────────────────────────────────────────────────

struct ChainBuilderConfig {
    double      edge_strength_threshold = constants::CHAIN_EDGE_THRESHOLD;
    std::size_t max_retained            = constants::MAX_RETAINED_CHAINS;
    double      prediction_multiplier   = constants::PREDICTION_MULTIPLIER;

    /// Fill `CausalChain::relations` with `rel:<from>-><to>` ids. Only
    /// meaningful when validated hypotheses are promoted to relations; the
    /// facade clears it when promotion is off. An id may still be absent from
    /// the relation graph if its promotion failed or its endpoint was evicted.
    bool        link_promoted_relations = true;
};

/// Cooperative limits for one enumeration run. Default: unlimited.
struct BuildBudget {
    std::stop_token                                      stop;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::size_t                                          max_expansions = 0;  ///< 0 = no cap

    /// Budget that expires `timeout` from now.
    [[nodiscard]] static BuildBudget with_timeout(std::chrono::milliseconds timeout);
};

/// Outcome of one enumeration run.
struct ChainBuildResult {
    std::vector<CausalChain> chains;             ///< Ranked, at most max_retained
    std::size_t              paths_enumerated = 0;
    bool                     truncated        = false;  ///< Budget tripped
};

// ─── ChainBuilder ─────────────────────────────────────────────────────────────

class ChainBuilder {
public:
    explicit ChainBuilder(ChainBuilderConfig config = ChainBuilderConfig{});

    /// Build ranked chains from validated hypotheses.
    ///
    /// Duplicate (cause, effect) pairs keep the strongest hypothesis.
    /// `max_chain_length == 0` yields no chains.
    [[nodiscard]] ChainBuildResult
    build(std::span<const causal::CausalHypothesis> hypotheses,
          std::size_t max_chain_length,
          const BuildBudget& budget = BuildBudget{}) const;

    /// Deterministic chain id from its path: "chain_" + 16 hex digits of
    /// FNV-1a over the ids joined by "->".
    [[nodiscard]] static std::string chain_id(std::span<const EntityId> path);

    [[nodiscard]] const ChainBuilderConfig& config() const noexcept { return config_; }

private:
    ChainBuilderConfig config_;
};

}  // namespace tkg::chain
