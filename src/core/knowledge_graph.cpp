/// @file src/core/knowledge_graph.cpp
/// @brief TemporalKnowledgeGraph: locking, result publication and eviction.

#include "tkg/knowledge_graph.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <unordered_set>

namespace tkg {

namespace {

template <typename T>
std::shared_ptr<const std::vector<T>> empty_snapshot() {
    return std::make_shared<const std::vector<T>>();
}

/// Chain ids only name relations that promotion actually creates.
chain::ChainBuilderConfig chain_config(const config::GraphConfig& config) {
    chain::ChainBuilderConfig cc = config.chains;
    cc.link_promoted_relations =
        cc.link_promoted_relations && config.discovery.promote_validated;
    return cc;
}

/// Relation id for a promoted hypothesis.
std::string promoted_id(const causal::CausalHypothesis& h) {
    return fmt::format("rel:{}->{}", h.cause_id, h.effect_id);
}

}  // namespace

// ─── GraphStats ───────────────────────────────────────────────────────────────

std::string GraphStats::to_string() const {
    std::string out = fmt::format(
        "GraphStats{{entities={} relations={} hypotheses={} chains={} patterns={} "
        "density={:.4f} scc={}",
        entity_count, relation_count, hypothesis_count, chain_count, pattern_count,
        graph_density, strongly_connected_components);
    for (const auto& [kind, count] : entity_kind_histogram) {
        out += fmt::format(" {}={}", tkg::to_string(kind), count);
    }
    for (const auto& [kind, count] : relation_kind_histogram) {
        out += fmt::format(" rel:{}={}", tkg::to_string(kind), count);
    }
    out += '}';
    return out;
}

// ─── Construction ─────────────────────────────────────────────────────────────

Timestamp TemporalKnowledgeGraph::system_now() noexcept {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

TemporalKnowledgeGraph::TemporalKnowledgeGraph(config::GraphConfig config, Clock clock)
    : config_(std::move(config))
    , clock_(clock ? std::move(clock) : Clock(&TemporalKnowledgeGraph::system_now))
    , discovery_(config_.discovery)
    , chain_builder_(chain_config(config_))
    , pattern_miner_(config_.patterns)
    , predictor_(config_.prediction)
    , hypotheses_(empty_snapshot<causal::CausalHypothesis>())
    , chains_(empty_snapshot<chain::CausalChain>())
    , patterns_(empty_snapshot<pattern::TemporalPattern>()) {}

// ─── Ingestion ────────────────────────────────────────────────────────────────

IngestStatus TemporalKnowledgeGraph::add_entity(TemporalEntity entity) {
    std::unique_lock lock(data_mutex_);
    const IngestStatus status = store_.add_entity(std::move(entity));
    if (status != IngestStatus::Ok) {
        spdlog::debug("tkg: entity rejected ({})", tkg::to_string(status));
    }
    return status;
}

IngestStatus TemporalKnowledgeGraph::add_relation(TemporalRelation relation) {
    std::unique_lock lock(data_mutex_);
    const IngestStatus status = graph_.add_relation(std::move(relation));
    if (status != IngestStatus::Ok) {
        spdlog::debug("tkg: relation rejected ({})", tkg::to_string(status));
    }
    return status;
}

std::vector<EntityId> TemporalKnowledgeGraph::evict_before(Timestamp cutoff) {
    std::vector<EntityId> evicted;
    std::size_t relations_removed = 0;
    {
        std::unique_lock lock(data_mutex_);
        evicted = store_.evict_before(cutoff);
        for (const auto& id : evicted) {
            relations_removed += graph_.remove_entity_cascade(id).size();
        }
    }
    if (evicted.empty()) {
        return evicted;
    }

    const std::unordered_set<EntityId> gone(evicted.begin(), evicted.end());
    std::size_t hypotheses_removed = 0;
    {
        std::lock_guard lock(results_mutex_);
        for (auto it = hypothesis_index_.begin(); it != hypothesis_index_.end();) {
            if (gone.count(it->first.first) != 0 || gone.count(it->first.second) != 0) {
                it = hypothesis_index_.erase(it);
                ++hypotheses_removed;
            } else {
                ++it;
            }
        }
        if (hypotheses_removed > 0) {
            republish_hypotheses();
        }
    }

    spdlog::info("tkg: evicted {} entities before {:.3f} ({} relations, {} hypotheses)",
                 evicted.size(), cutoff, relations_removed, hypotheses_removed);
    return evicted;
}

std::vector<EntityId> TemporalKnowledgeGraph::enforce_retention() {
    return evict_before(clock_() - config_.retention_window);
}

// ─── Point queries ────────────────────────────────────────────────────────────

std::optional<TemporalEntity> TemporalKnowledgeGraph::get_entity(const EntityId& id) const {
    std::shared_lock lock(data_mutex_);
    return store_.get_entity(id);
}

std::optional<TemporalRelation>
TemporalKnowledgeGraph::get_relation(const RelationId& id) const {
    std::shared_lock lock(data_mutex_);
    return graph_.get_relation(id);
}

std::vector<TemporalEntity>
TemporalKnowledgeGraph::entities_in_window(Timestamp start, Timestamp end) const {
    std::shared_lock lock(data_mutex_);
    const auto view = store_.entities_in_window(start, end);
    return std::vector<TemporalEntity>(view.begin(), view.end());
}

std::vector<RelationId> TemporalKnowledgeGraph::neighbors_out(const EntityId& id) const {
    std::shared_lock lock(data_mutex_);
    return graph_.neighbors_out(id);
}

std::vector<RelationId> TemporalKnowledgeGraph::neighbors_in(const EntityId& id) const {
    std::shared_lock lock(data_mutex_);
    return graph_.neighbors_in(id);
}

// ─── Analytics ────────────────────────────────────────────────────────────────

std::optional<std::vector<causal::CausalHypothesis>>
TemporalKnowledgeGraph::discover_causal_relationships(Duration window) {
    std::lock_guard flight(discovery_flight_);
    const Timestamp now = clock_();

    std::vector<causal::CausalHypothesis> validated;
    {
        std::shared_lock lock(data_mutex_);
        auto candidates = discovery_.discover(store_, window, now);
        if (!candidates) {
            return std::nullopt;
        }
        validated = discovery_.validate(*candidates, store_);
    }

    if (config_.discovery.promote_validated && !validated.empty()) {
        promote(validated);
    }

    // Lock order: data, then results. Endpoints are rechecked here because an
    // eviction may have run since validate released the data lock.
    {
        std::shared_lock data(data_mutex_);
        std::lock_guard  lock(results_mutex_);
        const auto stale = std::remove_if(validated.begin(), validated.end(),
            [this](const causal::CausalHypothesis& h) {
                return !store_.contains(h.cause_id) || !store_.contains(h.effect_id);
            });
        if (stale != validated.end()) {
            spdlog::debug("tkg: {} hypotheses dropped, endpoint evicted during discovery",
                          std::distance(stale, validated.end()));
            validated.erase(stale, validated.end());
        }
        for (const auto& h : validated) {
            hypothesis_index_.insert_or_assign(HypothesisKey{h.cause_id, h.effect_id}, h);
        }
        republish_hypotheses();
    }
    return validated;
}

void TemporalKnowledgeGraph::promote(const std::vector<causal::CausalHypothesis>& validated) {
    std::unique_lock lock(data_mutex_);
    std::size_t added = 0;
    for (const auto& h : validated) {
        TemporalRelation rel;
        rel.id            = promoted_id(h);
        rel.source_entity = h.cause_id;
        rel.target_entity = h.effect_id;
        rel.kind          = RelationKind::Causes;
        rel.start_time    = h.cause_time;
        rel.end_time      = h.effect_time;
        rel.strength      = h.strength;
        rel.confidence    = h.strength;
        rel.causal_lag    = h.effect_time - h.cause_time;
        rel.evidence      = h.evidence;
        rel.metadata["mechanism"] = causal::to_string(h.mechanism);

        const IngestStatus status = graph_.add_relation(std::move(rel));
        switch (status) {
        case IngestStatus::Ok:
            ++added;
            break;
        case IngestStatus::DuplicateId:
            // Promoted on an earlier pass.
            break;
        case IngestStatus::UnknownEntity:
        case IngestStatus::InvalidEntity:
        case IngestStatus::InvalidRelation:
            // An endpoint may have been evicted since the scan.
            spdlog::warn("tkg: could not promote {} ({})",
                         promoted_id(h), tkg::to_string(status));
            break;
        }
    }
    spdlog::debug("tkg: promoted {} of {} hypotheses to relations", added, validated.size());
}

void TemporalKnowledgeGraph::republish_hypotheses() {
    std::vector<causal::CausalHypothesis> snapshot;
    snapshot.reserve(hypothesis_index_.size());
    for (const auto& [key, h] : hypothesis_index_) {
        snapshot.push_back(h);
    }
    hypotheses_ = std::make_shared<const std::vector<causal::CausalHypothesis>>(
        std::move(snapshot));
}

chain::ChainBuildResult
TemporalKnowledgeGraph::build_causal_chains(std::size_t max_length,
                                            const chain::BuildBudget& budget) {
    std::lock_guard flight(chains_flight_);
    const auto hypotheses = current_hypotheses();

    chain::ChainBuildResult result = chain_builder_.build(*hypotheses, max_length, budget);

    auto published = std::make_shared<const std::vector<chain::CausalChain>>(result.chains);
    {
        std::lock_guard lock(results_mutex_);
        chains_ = std::move(published);
    }
    return result;
}

std::optional<std::vector<predict::Prediction>>
TemporalKnowledgeGraph::predict_future_events(Duration horizon) {
    std::lock_guard flight(predict_flight_);
    const Timestamp now    = clock_();
    const auto      chains = current_chains();

    std::shared_lock lock(data_mutex_);
    return predictor_.predict(*chains, store_, horizon, now);
}

std::vector<pattern::TemporalPattern> TemporalKnowledgeGraph::discover_temporal_patterns() {
    std::lock_guard flight(patterns_flight_);

    std::vector<pattern::TemporalPattern> patterns;
    {
        std::shared_lock lock(data_mutex_);
        patterns = pattern_miner_.discover_patterns(store_);
    }

    auto published = std::make_shared<const std::vector<pattern::TemporalPattern>>(patterns);
    {
        std::lock_guard lock(results_mutex_);
        patterns_ = std::move(published);
    }
    return patterns;
}

// ─── Published results ────────────────────────────────────────────────────────

std::shared_ptr<const std::vector<causal::CausalHypothesis>>
TemporalKnowledgeGraph::current_hypotheses() const {
    std::lock_guard lock(results_mutex_);
    return hypotheses_;
}

std::shared_ptr<const std::vector<chain::CausalChain>>
TemporalKnowledgeGraph::current_chains() const {
    std::lock_guard lock(results_mutex_);
    return chains_;
}

std::shared_ptr<const std::vector<pattern::TemporalPattern>>
TemporalKnowledgeGraph::current_patterns() const {
    std::lock_guard lock(results_mutex_);
    return patterns_;
}

GraphStats TemporalKnowledgeGraph::get_statistics() const {
    GraphStats stats;
    {
        std::shared_lock lock(data_mutex_);
        stats.entity_count            = store_.size();
        stats.relation_count          = graph_.size();
        stats.entity_kind_histogram   = store_.kind_histogram();
        stats.relation_kind_histogram = graph_.kind_histogram();
        stats.graph_density           = graph_.density();
        stats.strongly_connected_components = graph_.strongly_connected_components();
    }
    {
        std::lock_guard lock(results_mutex_);
        stats.hypothesis_count = hypotheses_->size();
        stats.chain_count      = chains_->size();
        stats.pattern_count    = patterns_->size();
    }
    return stats;
}

}  // namespace tkg
