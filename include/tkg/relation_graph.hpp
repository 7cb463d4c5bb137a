#pragma once

/// @file include/tkg/relation_graph.hpp
/// @brief RelationGraph: directed typed edges over stored entities.
///
/// # Module: Relation Graph
///
/// ## Responsibility
/// Own every TemporalRelation and the adjacency lists (entity id → incident
/// relation ids) used for traversal. Adjacency lists are lookup-only
/// back-references; they own nothing.
///
/// ## Guarantees
/// - `add_relation` succeeds only if both endpoints are present in the bound
///   EntityStore at call time (not revalidated later)
/// - `remove_entity_cascade` leaves no relation referencing the removed id
/// - Cycles are allowed; chain enumeration excludes them itself
/// - Edge listing is O(1) expected time per entity
/// - Density and component counts are computed on demand, O(V + E)
///
/// ## NOT Responsible For
/// - Synchronisation (see TemporalKnowledgeGraph)

#include "tkg/entity_store.hpp"
#include "tkg/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tkg::store {

class RelationGraph {
public:
    /// Bind to the store used for endpoint validation. The store must outlive
    /// the graph.
    explicit RelationGraph(const EntityStore& entities) noexcept;

    /// Insert a relation.
    ///
    /// # Returns
    /// - `Ok` on success
    /// - `UnknownEntity` if either endpoint is absent from the entity store
    /// - `DuplicateId` if the relation id is already present
    /// - `InvalidRelation` for an empty id, non-finite times,
    ///   `end_time < start_time`, strength or confidence outside [0, 1], or a
    ///   negative/non-finite causal lag
    [[nodiscard]] IngestStatus add_relation(TemporalRelation relation);

    /// Relation ids leaving `id`, in insertion order. Empty for unknown ids.
    [[nodiscard]] std::vector<RelationId> neighbors_out(const EntityId& id) const;

    /// Relation ids entering `id`, in insertion order. Empty for unknown ids.
    [[nodiscard]] std::vector<RelationId> neighbors_in(const EntityId& id) const;

    /// Drop every relation incident to `id`. Returns the removed relation ids.
    std::vector<RelationId> remove_entity_cascade(const EntityId& id);

    [[nodiscard]] std::optional<TemporalRelation> get_relation(const RelationId& id) const;
    [[nodiscard]] bool contains(const RelationId& id) const noexcept;

    [[nodiscard]] std::size_t out_degree(const EntityId& id) const noexcept;
    [[nodiscard]] std::size_t in_degree(const EntityId& id) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return relations_.size(); }

    /// Relation count per kind (kinds with zero relations are omitted).
    [[nodiscard]] std::map<RelationKind, std::size_t> kind_histogram() const;

    /// Distinct linked (source, target) pairs over n·(n − 1), n = stored
    /// entities. Parallel relations count once, self-loops not at all.
    /// Zero with fewer than two entities.
    [[nodiscard]] double density() const;

    /// Strongly connected components over every stored entity (iterative
    /// Tarjan). An entity with no cycle through it is its own component.
    [[nodiscard]] std::size_t strongly_connected_components() const;

private:
    /// Remove `rel_id` from `list` (linear in the entity's degree).
    static void unlink(std::vector<RelationId>& list, const RelationId& rel_id);

    const EntityStore&                                      entities_;
    std::unordered_map<RelationId, TemporalRelation>        relations_;
    std::unordered_map<EntityId, std::vector<RelationId>>   out_;
    std::unordered_map<EntityId, std::vector<RelationId>>   in_;
};

}  // namespace tkg::store
