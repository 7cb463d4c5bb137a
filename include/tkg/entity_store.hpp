#pragma once

/// @file include/tkg/entity_store.hpp
/// @brief EntityStore: ownership and temporal indexing of TemporalEntity.
///
/// # Module: Entity Store
///
/// ## Responsibility
/// Own every TemporalEntity and a timestamp → id index. Answer point lookups
/// and ordered time-window scans; evict by age.
///
/// ## Guarantees
/// - Ids are unique: a second insert with a reused id fails with
///   `IngestStatus::DuplicateId` and leaves the store unchanged
/// - Stored entities are never mutated
/// - Window views are lazy, ordered by (timestamp, id) and restartable:
///   calling `begin()` again replays the scan from the start
///
/// ## NOT Responsible For
/// - Synchronisation. The store is not thread-safe; `TemporalKnowledgeGraph`
///   wraps it in a reader/writer lock. Views are invalidated by any insert
///   or eviction.
/// - Relation cleanup on eviction (see RelationGraph::remove_entity_cascade)

#include "tkg/types.hpp"

#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tkg::store {

class EntityStore {
    using TimeKey = std::pair<Timestamp, EntityId>;

    /// Orders (timestamp, id) keys; also compares a key against a bare
    /// timestamp so window bounds need no sentinel id.
    struct TimeKeyLess {
        using is_transparent = void;
        bool operator()(const TimeKey& a, const TimeKey& b) const { return a < b; }
        bool operator()(const TimeKey& a, Timestamp t) const { return a.first < t; }
        bool operator()(Timestamp t, const TimeKey& b) const { return t < b.first; }
    };

    /// Values point into `entities_`; unordered_map nodes never move.
    using TimeIndex = std::map<TimeKey, const TemporalEntity*, TimeKeyLess>;

public:
    // ─── WindowView ───────────────────────────────────────────────────────────

    /// Forward iterator over entities in timestamp order.
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = TemporalEntity;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const TemporalEntity*;
        using reference         = const TemporalEntity&;

        const_iterator() = default;

        reference operator*() const { return *it_->second; }
        pointer   operator->() const { return it_->second; }

        const_iterator& operator++() { ++it_; return *this; }
        const_iterator  operator++(int) { auto tmp = *this; ++it_; return tmp; }

        bool operator==(const const_iterator& o) const noexcept { return it_ == o.it_; }
        bool operator!=(const const_iterator& o) const noexcept { return it_ != o.it_; }

    private:
        friend class EntityStore;
        explicit const_iterator(TimeIndex::const_iterator it) : it_(it) {}

        TimeIndex::const_iterator it_;
    };

    /// A [start, end] slice of the time index. Cheap to copy.
    class WindowView {
    public:
        [[nodiscard]] const_iterator begin() const { return first_; }
        [[nodiscard]] const_iterator end()   const { return last_; }
        [[nodiscard]] bool empty() const { return first_ == last_; }

        /// Number of entities in the view (linear).
        [[nodiscard]] std::size_t size() const;

    private:
        friend class EntityStore;
        WindowView(const_iterator first, const_iterator last)
            : first_(first), last_(last) {}

        const_iterator first_;
        const_iterator last_;
    };

    // ─── Mutation ─────────────────────────────────────────────────────────────

    /// Insert an entity.
    ///
    /// # Returns
    /// - `Ok` on success
    /// - `DuplicateId` if the id is already stored (store unchanged)
    /// - `InvalidEntity` for an empty id, non-finite timestamp or duration,
    ///   negative duration or confidence outside [0, 1]
    [[nodiscard]] IngestStatus add_entity(TemporalEntity entity);

    /// Remove every entity with `timestamp < cutoff`.
    ///
    /// Pure with respect to scheduling: the caller decides when to evict.
    /// Returns the evicted ids in timestamp order.
    std::vector<EntityId> evict_before(Timestamp cutoff);

    // ─── Queries ──────────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<TemporalEntity> get_entity(const EntityId& id) const;

    /// Borrowing lookup, valid until the next mutation.
    [[nodiscard]] const TemporalEntity* find(const EntityId& id) const noexcept;

    [[nodiscard]] bool contains(const EntityId& id) const noexcept;

    /// Entities with `start <= timestamp <= end`, ordered by timestamp.
    /// An inverted range yields an empty view.
    [[nodiscard]] WindowView entities_in_window(Timestamp start, Timestamp end) const;

    /// Every stored entity, ordered by timestamp.
    [[nodiscard]] WindowView all_entities() const;

    [[nodiscard]] std::size_t size() const noexcept { return entities_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entities_.empty(); }

    /// Entity count per kind (kinds with zero entities are omitted).
    [[nodiscard]] std::map<EntityKind, std::size_t> kind_histogram() const;

private:
    std::unordered_map<EntityId, TemporalEntity> entities_;
    TimeIndex                                    by_time_;
};

}  // namespace tkg::store
