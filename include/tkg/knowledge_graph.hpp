#pragma once

/// @file include/tkg/knowledge_graph.hpp
/// @brief TemporalKnowledgeGraph: thread-safe facade over store and analytics.
///
/// # Module: Knowledge Graph
///
/// ## Responsibility
/// Own the EntityStore and RelationGraph behind one reader/writer lock,
/// expose the ingestion and query boundaries, and publish analytics results
/// as immutable snapshots.
///
/// ## Pipeline
///   add_entity / add_relation  →  EntityStore / RelationGraph
///   discover_causal_relationships  →  validated hypotheses (accumulated,
///                                     optionally promoted to `causes` edges)
///   build_causal_chains            →  ranked CausalChains
///   predict_future_events          →  Predictions from active chains
///   discover_temporal_patterns     →  TemporalPatterns (independent)
///
/// ## Concurrency
/// - Writers (ingestion, eviction, relation promotion) hold the data lock
///   exclusively for one call.
/// - Analytics hold it shared for their whole scan, release it, then swap
///   their output in under a separate results lock. Readers of
///   `current_chains()` etc. always see a complete set.
/// - Each analytics kind is single-flight: a second concurrent call of the
///   same kind waits for the first to finish.
/// - Lock order is data before results. Discovery merges its hypotheses
///   under both and drops any whose endpoint was evicted meanwhile, so the
///   accumulated set never references an evicted entity.
/// - Eviction may run between discovery and chain building; chains are
///   built from hypothesis copies and never dereference evicted ids.
///
/// ## Time
/// Every analytics call reads `now` once from the injected clock.
///
/// ## Usage
/// ```cpp
/// tkg::TemporalKnowledgeGraph graph;
/// if (graph.add_entity(entity) != tkg::IngestStatus::Ok) { ... }
/// graph.discover_causal_relationships(3600.0);
/// auto chains = graph.build_causal_chains(5);
/// auto preds  = graph.predict_future_events(4 * 3600.0);
/// ```

#include "tkg/causal_discovery.hpp"
#include "tkg/chain_builder.hpp"
#include "tkg/config.hpp"
#include "tkg/entity_store.hpp"
#include "tkg/pattern_miner.hpp"
#include "tkg/predictor.hpp"
#include "tkg/relation_graph.hpp"
#include "tkg/types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace tkg {

// ─── GraphStats ───────────────────────────────────────────────────────────────

struct GraphStats {
    std::size_t                         entity_count     = 0;
    std::size_t                         relation_count   = 0;
    std::size_t                         chain_count      = 0;
    std::size_t                         pattern_count    = 0;
    std::size_t                         hypothesis_count = 0;
    double                              graph_density    = 0.0;  ///< See RelationGraph::density
    std::size_t                         strongly_connected_components = 0;
    std::map<EntityKind, std::size_t>   entity_kind_histogram;
    std::map<RelationKind, std::size_t> relation_kind_histogram;

    [[nodiscard]] std::string to_string() const;
};

// ─── TemporalKnowledgeGraph ───────────────────────────────────────────────────

class TemporalKnowledgeGraph {
public:
    using Clock = std::function<Timestamp()>;

    /// Wall-clock seconds since the Unix epoch.
    [[nodiscard]] static Timestamp system_now() noexcept;

    explicit TemporalKnowledgeGraph(config::GraphConfig config = config::GraphConfig{},
                                    Clock clock = &TemporalKnowledgeGraph::system_now);

    TemporalKnowledgeGraph(const TemporalKnowledgeGraph&)            = delete;
    TemporalKnowledgeGraph& operator=(const TemporalKnowledgeGraph&) = delete;

    // ── Ingestion ─────────────────────────────────────────────────────────────

    [[nodiscard]] IngestStatus add_entity(TemporalEntity entity);
    [[nodiscard]] IngestStatus add_relation(TemporalRelation relation);

    /// Evict entities with `timestamp < cutoff`, cascade to their relations,
    /// and drop accumulated hypotheses that reference them.
    /// Returns the evicted entity ids.
    std::vector<EntityId> evict_before(Timestamp cutoff);

    /// `evict_before(now − retention_window)`.
    std::vector<EntityId> enforce_retention();

    // ── Point queries (copies) ────────────────────────────────────────────────

    [[nodiscard]] std::optional<TemporalEntity>   get_entity(const EntityId& id) const;
    [[nodiscard]] std::optional<TemporalRelation> get_relation(const RelationId& id) const;

    /// Snapshot of entities with `start <= timestamp <= end`, timestamp order.
    [[nodiscard]] std::vector<TemporalEntity>
    entities_in_window(Timestamp start, Timestamp end) const;

    [[nodiscard]] std::vector<RelationId> neighbors_out(const EntityId& id) const;
    [[nodiscard]] std::vector<RelationId> neighbors_in(const EntityId& id) const;

    // ── Analytics ─────────────────────────────────────────────────────────────

    /// Discover and validate hypotheses among entities in `[now − window, now]`.
    /// Survivors are merged into the accumulated hypothesis set (latest wins
    /// per cause/effect pair) and, if configured, promoted to relations.
    ///
    /// # Returns
    /// This run's validated hypotheses, or `nullopt` for an invalid window.
    [[nodiscard]] std::optional<std::vector<causal::CausalHypothesis>>
    discover_causal_relationships(Duration window);

    /// Rebuild chains from the accumulated hypotheses and publish them.
    [[nodiscard]] chain::ChainBuildResult
    build_causal_chains(std::size_t max_length,
                        const chain::BuildBudget& budget = chain::BuildBudget{});

    /// Project events from the published chains.
    /// `nullopt` for an invalid horizon.
    [[nodiscard]] std::optional<std::vector<predict::Prediction>>
    predict_future_events(Duration horizon);

    /// Rebuild and publish periodic patterns.
    [[nodiscard]] std::vector<pattern::TemporalPattern> discover_temporal_patterns();

    // ── Published results ─────────────────────────────────────────────────────

    [[nodiscard]] std::shared_ptr<const std::vector<causal::CausalHypothesis>>
    current_hypotheses() const;
    [[nodiscard]] std::shared_ptr<const std::vector<chain::CausalChain>>
    current_chains() const;
    [[nodiscard]] std::shared_ptr<const std::vector<pattern::TemporalPattern>>
    current_patterns() const;

    [[nodiscard]] GraphStats get_statistics() const;

    [[nodiscard]] Timestamp now() const { return clock_(); }
    [[nodiscard]] const config::GraphConfig& config() const noexcept { return config_; }

private:
    using HypothesisKey = std::pair<EntityId, EntityId>;

    /// Add `causes` relations for validated hypotheses (exclusive lock).
    void promote(const std::vector<causal::CausalHypothesis>& validated);

    /// Rebuild `hypotheses_` from `hypothesis_index_`; results lock held.
    void republish_hypotheses();

    config::GraphConfig            config_;
    Clock                          clock_;

    causal::CausalDiscoveryEngine  discovery_;
    chain::ChainBuilder            chain_builder_;
    pattern::PatternMiner          pattern_miner_;
    predict::Predictor             predictor_;

    // Data: guarded by data_mutex_.
    mutable std::shared_mutex      data_mutex_;
    store::EntityStore             store_;
    store::RelationGraph           graph_{store_};

    // Published results: guarded by results_mutex_.
    mutable std::mutex                                             results_mutex_;
    std::map<HypothesisKey, causal::CausalHypothesis>              hypothesis_index_;
    std::shared_ptr<const std::vector<causal::CausalHypothesis>>   hypotheses_;
    std::shared_ptr<const std::vector<chain::CausalChain>>         chains_;
    std::shared_ptr<const std::vector<pattern::TemporalPattern>>   patterns_;

    // Single-flight per analytics kind.
    std::mutex discovery_flight_;
    std::mutex chains_flight_;
    std::mutex patterns_flight_;
    std::mutex predict_flight_;
};

}  // namespace tkg
