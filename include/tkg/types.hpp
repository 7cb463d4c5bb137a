#pragma once

/// @file include/tkg/types.hpp
/// @brief Shared value types for the temporal causal knowledge graph (TKG).
///
/// Every module includes this file. It defines the closed entity and relation
/// kind enumerations, the property value type, the two stored record types
/// (TemporalEntity, TemporalRelation) and the ingestion status codes.
///
/// Time is measured in `double` seconds throughout: timestamps are Unix epoch
/// seconds, durations are second counts.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tkg {

// ─── Time ─────────────────────────────────────────────────────────────────────

/// Point in time, Unix epoch seconds.
using Timestamp = double;

/// Length of time, seconds.
using Duration = double;

using EntityId   = std::string;
using RelationId = std::string;

// ─── Kinds ────────────────────────────────────────────────────────────────────

/// Closed set of entity kinds. Adding a kind is a compile-time-checked change:
/// the compatibility and mechanism tables switch exhaustively over it.
enum class EntityKind {
    MarketEvent,
    PriceMovement,
    VolumeSpike,
    NewsEvent,
    TechnicalIndicator,
    TradingSignal,
    StrategyOutput,
    EconomicData,
};

/// Number of EntityKind enumerators.
inline constexpr std::size_t ENTITY_KIND_COUNT = 8;

/// Closed set of directed relation kinds.
enum class RelationKind {
    Causes,
    Precedes,
    Correlates,
    Influences,
    Triggers,
    Inhibits,
    Amplifies,
    Follows,
};

/// Snake-case name of an entity kind, e.g. "news_event".
[[nodiscard]] const char* to_string(EntityKind k) noexcept;

/// Snake-case name of a relation kind, e.g. "causes".
[[nodiscard]] const char* to_string(RelationKind k) noexcept;

/// Parse a snake-case entity kind name. Returns `nullopt` for unknown names.
[[nodiscard]] std::optional<EntityKind> parse_entity_kind(std::string_view s) noexcept;

/// Parse a snake-case relation kind name. Returns `nullopt` for unknown names.
[[nodiscard]] std::optional<RelationKind> parse_relation_kind(std::string_view s) noexcept;

/// All entity kinds in declaration order.
[[nodiscard]] const std::vector<EntityKind>& all_entity_kinds();

// ─── Properties ───────────────────────────────────────────────────────────────

/// Scalar property value. Only `double` and `std::int64_t` count as numeric;
/// booleans and strings are carried but never correlated.
using PropertyValue = std::variant<double, std::int64_t, bool, std::string>;

/// Property map. Ordered so that iteration (and therefore every derived
/// score) is deterministic.
using PropertyMap = std::map<std::string, PropertyValue>;

/// Opaque producer metadata.
using MetadataMap = std::map<std::string, std::string>;

/// Numeric view of a property value, `nullopt` for bool/string or non-finite.
[[nodiscard]] std::optional<double> numeric_value(const PropertyValue& v) noexcept;

/// Render a property value for display and CSV round-trips.
[[nodiscard]] std::string to_string(const PropertyValue& v);

// ─── Stored records ───────────────────────────────────────────────────────────

/// A timestamped fact. Never mutated after insertion.
struct TemporalEntity {
    EntityId    id;                ///< Unique for the lifetime of the store
    EntityKind  kind       = EntityKind::MarketEvent;
    PropertyMap properties;
    Timestamp   timestamp  = 0.0;
    Duration    duration   = 0.0;
    double      confidence = 1.0;  ///< In [0, 1]
    std::string source;            ///< Producer identifier
    MetadataMap metadata;
};

/// A directed, typed, weighted edge between two stored entities.
struct TemporalRelation {
    RelationId               id;
    EntityId                 source_entity;
    EntityId                 target_entity;
    RelationKind             kind       = RelationKind::Causes;
    Timestamp                start_time = 0.0;
    std::optional<Timestamp> end_time;          ///< Open-ended when absent
    double                   strength   = 0.0;  ///< In [0, 1]
    double                   confidence = 0.0;  ///< In [0, 1]
    Duration                 causal_lag = 0.0;
    std::vector<std::string> evidence;
    MetadataMap              metadata;
};

// ─── Ingestion status ─────────────────────────────────────────────────────────

/// Outcome of an ingestion call. Only structural violations are reported;
/// property semantics are never validated.
enum class IngestStatus {
    Ok,
    DuplicateId,      ///< Entity or relation id already present
    UnknownEntity,    ///< Relation endpoint absent from the entity store
    InvalidEntity,    ///< Empty id, non-finite time, confidence outside [0,1]
    InvalidRelation,  ///< Inverted interval, weight outside [0,1], negative lag
};

[[nodiscard]] const char* to_string(IngestStatus s) noexcept;

}  // namespace tkg
