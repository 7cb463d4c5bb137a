/// @file src/pattern/pattern_miner.cpp
/// @brief PatternMiner implementation.

#include "tkg/pattern_miner.hpp"
#include "tkg/statistics.hpp"

#include "../core/hash.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace tkg::pattern {

std::string TemporalPattern::to_string() const {
    return fmt::format("{} {} entities={} frequency={:.6f}Hz accuracy={:.3f} next={}",
                       id, pattern_type, entities_involved.size(), frequency,
                       predictive_accuracy,
                       next_predicted ? fmt::format("{:.0f}", *next_predicted)
                                      : std::string("-"));
}

PatternMiner::PatternMiner(PatternMinerConfig config)
    : config_(std::move(config))
{}

std::optional<TemporalPattern>
PatternMiner::analyze(EntityKind kind,
                      const std::vector<const TemporalEntity*>& ordered) const {
    if (ordered.size() < config_.min_group_size || ordered.size() < 2) {
        return std::nullopt;
    }

    std::vector<double> intervals;
    intervals.reserve(ordered.size() - 1);
    for (std::size_t i = 1; i < ordered.size(); ++i) {
        intervals.push_back(ordered[i]->timestamp - ordered[i - 1]->timestamp);
    }

    const auto mu    = stats::mean(intervals);
    const auto sigma = stats::population_stddev(intervals);
    if (!mu || !sigma || *mu <= constants::FLOAT_EPSILON) {
        spdlog::debug("patterns: {} skipped, degenerate intervals", tkg::to_string(kind));
        return std::nullopt;
    }

    const double cv = *sigma / *mu;
    if (!(cv < config_.max_variation)) {
        return std::nullopt;
    }

    TemporalPattern p;
    p.kind         = kind;
    p.pattern_type = fmt::format("periodic_{}", tkg::to_string(kind));

    // Id from the interval sequence: same history, same id.
    std::uint64_t h = detail::FNV_OFFSET_BASIS;
    for (double iv : intervals) {
        h = detail::fnv1a64(fmt::format("{};", iv), h);
    }
    p.id = fmt::format("pattern_{}_{:08x}", tkg::to_string(kind),
                       static_cast<std::uint32_t>(h ^ (h >> 32)));

    p.entities_involved.reserve(ordered.size());
    for (const auto* e : ordered) {
        p.entities_involved.push_back(e->id);
    }

    p.signature = TemporalSignature{
        .mean_interval   = *mu,
        .stddev_interval = *sigma,
        .frequency       = 1.0 / *mu,
        .consistency     = 1.0 - cv,
    };
    p.frequency           = p.signature.frequency;
    p.predictive_accuracy = std::min(config_.max_accuracy, p.signature.consistency);
    p.last_occurrence     = ordered.back()->timestamp;
    p.next_predicted      = p.last_occurrence + *mu;
    return p;
}

std::vector<TemporalPattern>
PatternMiner::discover_patterns(const store::EntityStore& entities) const {
    // Window views are timestamp-ordered, so each group is too.
    std::map<EntityKind, std::vector<const TemporalEntity*>> groups;
    for (const auto& e : entities.all_entities()) {
        groups[e.kind].push_back(&e);
    }

    std::vector<TemporalPattern> patterns;
    for (const auto& [kind, members] : groups) {
        if (auto p = analyze(kind, members)) {
            patterns.push_back(std::move(*p));
        }
    }

    spdlog::info("patterns: {} kinds scanned, {} periodic", groups.size(), patterns.size());
    return patterns;
}

}  // namespace tkg::pattern
