/// @file src/store/relation_graph.cpp
/// @brief RelationGraph implementation.

#include "tkg/relation_graph.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <utility>

namespace tkg::store {

namespace {

[[nodiscard]] bool unit_interval(double x) noexcept {
    return std::isfinite(x) && x >= 0.0 && x <= 1.0;
}

}  // namespace

RelationGraph::RelationGraph(const EntityStore& entities) noexcept
    : entities_(entities)
{}

// ─── RelationGraph::add_relation ──────────────────────────────────────────────

IngestStatus RelationGraph::add_relation(TemporalRelation relation) {
    if (relation.id.empty()                     ||
        !std::isfinite(relation.start_time)     ||
        !unit_interval(relation.strength)       ||
        !unit_interval(relation.confidence)     ||
        !std::isfinite(relation.causal_lag)     ||
        relation.causal_lag < 0.0) {
        return IngestStatus::InvalidRelation;
    }
    if (relation.end_time &&
        (!std::isfinite(*relation.end_time) || *relation.end_time < relation.start_time)) {
        return IngestStatus::InvalidRelation;
    }

    if (!entities_.contains(relation.source_entity) ||
        !entities_.contains(relation.target_entity)) {
        return IngestStatus::UnknownEntity;
    }

    if (relations_.find(relation.id) != relations_.end()) {
        return IngestStatus::DuplicateId;
    }

    out_[relation.source_entity].push_back(relation.id);
    in_[relation.target_entity].push_back(relation.id);
    const RelationId id = relation.id;
    relations_.emplace(id, std::move(relation));
    return IngestStatus::Ok;
}

// ─── Adjacency ────────────────────────────────────────────────────────────────

std::vector<RelationId> RelationGraph::neighbors_out(const EntityId& id) const {
    const auto it = out_.find(id);
    return it == out_.end() ? std::vector<RelationId>{} : it->second;
}

std::vector<RelationId> RelationGraph::neighbors_in(const EntityId& id) const {
    const auto it = in_.find(id);
    return it == in_.end() ? std::vector<RelationId>{} : it->second;
}

std::size_t RelationGraph::out_degree(const EntityId& id) const noexcept {
    const auto it = out_.find(id);
    return it == out_.end() ? 0 : it->second.size();
}

std::size_t RelationGraph::in_degree(const EntityId& id) const noexcept {
    const auto it = in_.find(id);
    return it == in_.end() ? 0 : it->second.size();
}

// ─── RelationGraph::remove_entity_cascade ─────────────────────────────────────

void RelationGraph::unlink(std::vector<RelationId>& list, const RelationId& rel_id) {
    list.erase(std::remove(list.begin(), list.end(), rel_id), list.end());
}

std::vector<RelationId> RelationGraph::remove_entity_cascade(const EntityId& id) {
    std::vector<RelationId> removed;

    if (auto it = out_.find(id); it != out_.end()) {
        for (const auto& rel_id : it->second) {
            const auto rel = relations_.find(rel_id);
            if (rel == relations_.end()) continue;
            // Self-loops also sit in this entity's own in-list, erased below.
            if (rel->second.target_entity != id) {
                if (auto in = in_.find(rel->second.target_entity); in != in_.end()) {
                    unlink(in->second, rel_id);
                    if (in->second.empty()) in_.erase(in);
                }
            }
            removed.push_back(rel_id);
            relations_.erase(rel);
        }
        out_.erase(it);
    }

    if (auto it = in_.find(id); it != in_.end()) {
        for (const auto& rel_id : it->second) {
            const auto rel = relations_.find(rel_id);
            if (rel == relations_.end()) continue;  // self-loop, already gone
            if (auto out = out_.find(rel->second.source_entity); out != out_.end()) {
                unlink(out->second, rel_id);
                if (out->second.empty()) out_.erase(out);
            }
            removed.push_back(rel_id);
            relations_.erase(rel);
        }
        in_.erase(it);
    }

    return removed;
}

// ─── Queries ──────────────────────────────────────────────────────────────────

std::optional<TemporalRelation> RelationGraph::get_relation(const RelationId& id) const {
    const auto it = relations_.find(id);
    if (it == relations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool RelationGraph::contains(const RelationId& id) const noexcept {
    return relations_.find(id) != relations_.end();
}

std::map<RelationKind, std::size_t> RelationGraph::kind_histogram() const {
    std::map<RelationKind, std::size_t> hist;
    for (const auto& [id, r] : relations_) {
        ++hist[r.kind];
    }
    return hist;
}

// ─── Structure ────────────────────────────────────────────────────────────────

double RelationGraph::density() const {
    const std::size_t n = entities_.size();
    if (n < 2) {
        return 0.0;
    }
    std::set<std::pair<EntityId, EntityId>> linked;
    for (const auto& [id, r] : relations_) {
        if (r.source_entity != r.target_entity) {
            linked.emplace(r.source_entity, r.target_entity);
        }
    }
    return static_cast<double>(linked.size()) /
           (static_cast<double>(n) * static_cast<double>(n - 1));
}

std::size_t RelationGraph::strongly_connected_components() const {
    std::unordered_map<EntityId, std::size_t> index;
    for (const auto& e : entities_.all_entities()) {
        index.emplace(e.id, index.size());
    }
    const std::size_t n = index.size();

    std::vector<std::vector<std::size_t>> adj(n);
    for (const auto& [source, rel_ids] : out_) {
        const auto s = index.find(source);
        if (s == index.end()) continue;
        for (const auto& rel_id : rel_ids) {
            const auto rel = relations_.find(rel_id);
            if (rel == relations_.end()) continue;
            const auto t = index.find(rel->second.target_entity);
            if (t != index.end()) adj[s->second].push_back(t->second);
        }
    }

    constexpr std::size_t UNVISITED = std::numeric_limits<std::size_t>::max();
    std::vector<std::size_t> order(n, UNVISITED);
    std::vector<std::size_t> low(n, 0);
    std::vector<bool>        on_stack(n, false);
    std::vector<std::size_t> stack;

    struct Frame {
        std::size_t node;
        std::size_t next_edge;
    };
    std::vector<Frame> calls;

    std::size_t counter    = 0;
    std::size_t components = 0;

    auto visit = [&](std::size_t v) {
        order[v] = low[v] = counter++;
        stack.push_back(v);
        on_stack[v] = true;
        calls.push_back(Frame{v, 0});
    };

    for (std::size_t root = 0; root < n; ++root) {
        if (order[root] != UNVISITED) continue;
        visit(root);

        while (!calls.empty()) {
            Frame& f = calls.back();
            if (f.next_edge < adj[f.node].size()) {
                const std::size_t w = adj[f.node][f.next_edge++];
                if (order[w] == UNVISITED) {
                    visit(w);  // invalidates f
                } else if (on_stack[w]) {
                    low[f.node] = std::min(low[f.node], order[w]);
                }
                continue;
            }

            const std::size_t v = f.node;
            calls.pop_back();
            if (!calls.empty()) {
                const std::size_t u = calls.back().node;
                low[u] = std::min(low[u], low[v]);
            }
            if (low[v] == order[v]) {
                ++components;
                std::size_t w = 0;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                } while (w != v);
            }
        }
    }
    return components;
}

}  // namespace tkg::store
