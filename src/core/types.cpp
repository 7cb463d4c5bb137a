/// @file src/core/types.cpp
/// @brief Kind names, parsing and property helpers.

#include "tkg/types.hpp"

#include <fmt/format.h>

#include <cmath>
#include <type_traits>

namespace tkg {

// ─── EntityKind ───────────────────────────────────────────────────────────────

const char* to_string(EntityKind k) noexcept {
    switch (k) {
        case EntityKind::MarketEvent:        return "market_event";
        case EntityKind::PriceMovement:      return "price_movement";
        case EntityKind::VolumeSpike:        return "volume_spike";
        case EntityKind::NewsEvent:          return "news_event";
        case EntityKind::TechnicalIndicator: return "technical_indicator";
        case EntityKind::TradingSignal:      return "trading_signal";
        case EntityKind::StrategyOutput:     return "strategy_output";
        case EntityKind::EconomicData:       return "economic_data";
    }
    return "unknown";
}

const std::vector<EntityKind>& all_entity_kinds() {
    static const std::vector<EntityKind> kinds = {
        EntityKind::MarketEvent,   EntityKind::PriceMovement,
        EntityKind::VolumeSpike,   EntityKind::NewsEvent,
        EntityKind::TechnicalIndicator, EntityKind::TradingSignal,
        EntityKind::StrategyOutput, EntityKind::EconomicData,
    };
    return kinds;
}

std::optional<EntityKind> parse_entity_kind(std::string_view s) noexcept {
    for (EntityKind k : all_entity_kinds()) {
        if (s == to_string(k)) return k;
    }
    return std::nullopt;
}

// ─── RelationKind ─────────────────────────────────────────────────────────────

const char* to_string(RelationKind k) noexcept {
    switch (k) {
        case RelationKind::Causes:     return "causes";
        case RelationKind::Precedes:   return "precedes";
        case RelationKind::Correlates: return "correlates";
        case RelationKind::Influences: return "influences";
        case RelationKind::Triggers:   return "triggers";
        case RelationKind::Inhibits:   return "inhibits";
        case RelationKind::Amplifies:  return "amplifies";
        case RelationKind::Follows:    return "follows";
    }
    return "unknown";
}

std::optional<RelationKind> parse_relation_kind(std::string_view s) noexcept {
    static constexpr RelationKind kinds[] = {
        RelationKind::Causes,   RelationKind::Precedes,  RelationKind::Correlates,
        RelationKind::Influences, RelationKind::Triggers, RelationKind::Inhibits,
        RelationKind::Amplifies, RelationKind::Follows,
    };
    for (RelationKind k : kinds) {
        if (s == to_string(k)) return k;
    }
    return std::nullopt;
}

// ─── PropertyValue ────────────────────────────────────────────────────────────

std::optional<double> numeric_value(const PropertyValue& v) noexcept {
    if (const auto* d = std::get_if<double>(&v)) {
        if (!std::isfinite(*d)) return std::nullopt;
        return *d;
    }
    if (const auto* i = std::get_if<std::int64_t>(&v)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

std::string to_string(const PropertyValue& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else {
            return fmt::format("{}", x);
        }
    }, v);
}

// ─── IngestStatus ─────────────────────────────────────────────────────────────

const char* to_string(IngestStatus s) noexcept {
    switch (s) {
        case IngestStatus::Ok:              return "ok";
        case IngestStatus::DuplicateId:     return "duplicate_id";
        case IngestStatus::UnknownEntity:   return "unknown_entity";
        case IngestStatus::InvalidEntity:   return "invalid_entity";
        case IngestStatus::InvalidRelation: return "invalid_relation";
    }
    return "unknown";
}

}  // namespace tkg
