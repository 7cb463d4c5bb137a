#pragma once

/// @file include/tkg/entity_loader.hpp
/// @brief CSV loaders for temporal entities and relations.
///
/// # Module: EntityLoader
///
/// ## Responsibility
/// Parse CSV text into `TemporalEntity` / `TemporalRelation` records for
/// bulk ingestion. Malformed rows are skipped with a warning; the loader
/// never crashes on bad input.
///
/// ## Entity CSV Format
/// ```
/// id,kind,timestamp,duration,confidence,source,properties
/// n1,news_event,1700000000,0,0.95,reuters,value=1.5;headline=rate cut
/// p1,price_movement,1700000300,60,1.0,feed,price=101.2;volume=1200
/// ```
///
/// ## Relation CSV Format
/// ```
/// id,source,target,kind,start_time,end_time,strength,confidence,causal_lag,evidence
/// r1,n1,p1,causes,1700000000,1700000300,0.8,0.9,300,analyst;backtest
/// ```
/// An empty `end_time` means the relation is open-ended. `evidence` and
/// `properties` are `;`-separated; each property is `key=value` where the
/// value is typed as bool (`true`/`false`), integer, float, or string, in
/// that order.
///
/// The first non-empty, non-`#` line is the header and is skipped.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when a file cannot be opened
/// - Parsing does not validate ranges; the store does that on ingest
///
/// ## NOT Responsible For
/// - Quoted fields or embedded commas

#include "tkg/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tkg::io {

class EntityLoader {
public:
    [[nodiscard]] static std::optional<std::vector<TemporalEntity>>
    load_entities_csv(const std::string& filepath);

    [[nodiscard]] static std::optional<std::vector<TemporalRelation>>
    load_relations_csv(const std::string& filepath);

    /// Parse entity rows from CSV text (header line required).
    [[nodiscard]] static std::vector<TemporalEntity>
    parse_entity_csv_string(const std::string& csv_content);

    /// Parse relation rows from CSV text (header line required).
    [[nodiscard]] static std::vector<TemporalRelation>
    parse_relation_csv_string(const std::string& csv_content);

    /// Parse `k=v;k=v`. Returns `nullopt` if any non-empty item lacks a key
    /// or an `=`.
    [[nodiscard]] static std::optional<PropertyMap>
    parse_property_map(std::string_view text);

    /// Type a raw property value: bool, then int64, then double, then string.
    [[nodiscard]] static PropertyValue parse_property_value(std::string_view text);

private:
    [[nodiscard]] static std::optional<TemporalEntity>
    parse_entity_row(const std::string& line);

    [[nodiscard]] static std::optional<TemporalRelation>
    parse_relation_row(const std::string& line);
};

}  // namespace tkg::io
