/// @file src/store/entity_store.cpp
/// @brief EntityStore implementation.

#include "tkg/entity_store.hpp"

#include <cmath>
#include <iterator>

namespace tkg::store {

// ─── WindowView ───────────────────────────────────────────────────────────────

std::size_t EntityStore::WindowView::size() const {
    return static_cast<std::size_t>(std::distance(first_, last_));
}

// ─── EntityStore::add_entity ──────────────────────────────────────────────────

IngestStatus EntityStore::add_entity(TemporalEntity entity) {
    if (entity.id.empty()                  ||
        !std::isfinite(entity.timestamp)   ||
        !std::isfinite(entity.duration)    ||
        entity.duration < 0.0              ||
        !std::isfinite(entity.confidence)  ||
        entity.confidence < 0.0            ||
        entity.confidence > 1.0) {
        return IngestStatus::InvalidEntity;
    }

    // try_emplace leaves `entity` untouched when the key exists.
    const EntityId id = entity.id;
    auto [it, inserted] = entities_.try_emplace(id, std::move(entity));
    if (!inserted) {
        return IngestStatus::DuplicateId;
    }

    by_time_.emplace(TimeKey{it->second.timestamp, id}, &it->second);
    return IngestStatus::Ok;
}

// ─── EntityStore::evict_before ────────────────────────────────────────────────

std::vector<EntityId> EntityStore::evict_before(Timestamp cutoff) {
    std::vector<EntityId> evicted;

    // Everything strictly older than the cutoff sits before lower_bound(cutoff).
    const auto stop = by_time_.lower_bound(cutoff);
    for (auto it = by_time_.begin(); it != stop; ++it) {
        evicted.push_back(it->first.second);
    }
    by_time_.erase(by_time_.begin(), stop);

    for (const auto& id : evicted) {
        entities_.erase(id);
    }
    return evicted;
}

// ─── Queries ──────────────────────────────────────────────────────────────────

std::optional<TemporalEntity> EntityStore::get_entity(const EntityId& id) const {
    const auto* e = find(id);
    if (e == nullptr) {
        return std::nullopt;
    }
    return *e;
}

const TemporalEntity* EntityStore::find(const EntityId& id) const noexcept {
    const auto it = entities_.find(id);
    return it == entities_.end() ? nullptr : &it->second;
}

bool EntityStore::contains(const EntityId& id) const noexcept {
    return entities_.find(id) != entities_.end();
}

EntityStore::WindowView
EntityStore::entities_in_window(Timestamp start, Timestamp end) const {
    if (!(start <= end)) {
        // Inverted or NaN bounds.
        return WindowView{const_iterator{by_time_.end()}, const_iterator{by_time_.end()}};
    }
    return WindowView{const_iterator{by_time_.lower_bound(start)},
                      const_iterator{by_time_.upper_bound(end)}};
}

EntityStore::WindowView EntityStore::all_entities() const {
    return WindowView{const_iterator{by_time_.begin()}, const_iterator{by_time_.end()}};
}

std::map<EntityKind, std::size_t> EntityStore::kind_histogram() const {
    std::map<EntityKind, std::size_t> hist;
    for (const auto& [id, e] : entities_) {
        ++hist[e.kind];
    }
    return hist;
}

}  // namespace tkg::store
