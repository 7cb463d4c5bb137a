/// @file src/io/entity_loader.cpp
/// @brief CSV EntityLoader for entities and relations.

#include "tkg/entity_loader.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tkg::io {

namespace {

constexpr std::size_t ENTITY_MIN_FIELDS   = 6;
constexpr std::size_t ENTITY_MAX_FIELDS   = 7;
constexpr std::size_t RELATION_MIN_FIELDS = 9;
constexpr std::size_t RELATION_MAX_FIELDS = 10;

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.push_back(trim(s.substr(start)));
            return out;
        }
        out.push_back(trim(s.substr(start, pos - start)));
        start = pos + 1;
    }
}

/// Whole-token finite double.
std::optional<double> parse_double(std::string_view token) {
    if (token.empty()) {
        return std::nullopt;
    }
    const std::string buf(token);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(buf.c_str(), &end);
    if (errno == ERANGE || end != buf.c_str() + buf.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

/// Whole-token base-10 integer.
std::optional<std::int64_t> parse_int(std::string_view token) {
    if (token.empty()) {
        return std::nullopt;
    }
    const std::string buf(token);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(buf.c_str(), &end, 10);
    if (errno == ERANGE || end != buf.c_str() + buf.size()) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(v);
}

std::vector<std::string> parse_list(std::string_view text) {
    std::vector<std::string> out;
    if (text.empty()) {
        return out;
    }
    for (auto item : split(text, ';')) {
        if (!item.empty()) {
            out.emplace_back(item);
        }
    }
    return out;
}

std::optional<std::string> read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::warn("loader: cannot open '{}'", filepath);
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

/// Apply `parse_row` to every data line after the header.
template <typename Record, typename ParseRow>
std::vector<Record> parse_rows(const std::string& csv_content, ParseRow parse_row,
                               const char* what) {
    std::vector<Record> records;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;
    std::size_t line_no = 0;
    std::size_t skipped = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty() || line[0] == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        if (auto record = parse_row(line)) {
            records.push_back(std::move(*record));
        } else {
            spdlog::warn("loader: skipping malformed {} row at line {}", what, line_no);
            ++skipped;
        }
    }

    if (skipped > 0) {
        spdlog::info("loader: {} {} rows parsed, {} skipped", records.size(), what, skipped);
    }
    return records;
}

}  // namespace

// ─── Properties ───────────────────────────────────────────────────────────────

PropertyValue EntityLoader::parse_property_value(std::string_view text) {
    if (text == "true") {
        return true;
    }
    if (text == "false") {
        return false;
    }
    if (auto i = parse_int(text)) {
        return *i;
    }
    if (auto d = parse_double(text)) {
        return *d;
    }
    return std::string(text);
}

std::optional<PropertyMap> EntityLoader::parse_property_map(std::string_view text) {
    PropertyMap props;
    if (trim(text).empty()) {
        return props;
    }
    for (auto item : split(text, ';')) {
        if (item.empty()) {
            continue;
        }
        const auto eq = item.find('=');
        if (eq == std::string_view::npos) {
            return std::nullopt;
        }
        const auto key = trim(item.substr(0, eq));
        if (key.empty()) {
            return std::nullopt;
        }
        props.insert_or_assign(std::string(key),
                               parse_property_value(trim(item.substr(eq + 1))));
    }
    return props;
}

// ─── Rows ─────────────────────────────────────────────────────────────────────

std::optional<TemporalEntity> EntityLoader::parse_entity_row(const std::string& line) {
    const auto fields = split(line, ',');
    if (fields.size() < ENTITY_MIN_FIELDS || fields.size() > ENTITY_MAX_FIELDS) {
        return std::nullopt;
    }

    const auto kind       = parse_entity_kind(fields[1]);
    const auto timestamp  = parse_double(fields[2]);
    const auto duration   = fields[3].empty() ? std::optional<double>(0.0)
                                              : parse_double(fields[3]);
    const auto confidence = fields[4].empty() ? std::optional<double>(1.0)
                                              : parse_double(fields[4]);
    if (fields[0].empty() || !kind || !timestamp || !duration || !confidence) {
        return std::nullopt;
    }

    TemporalEntity e;
    e.id         = std::string(fields[0]);
    e.kind       = *kind;
    e.timestamp  = *timestamp;
    e.duration   = *duration;
    e.confidence = *confidence;
    e.source     = std::string(fields[5]);

    if (fields.size() == ENTITY_MAX_FIELDS) {
        auto props = parse_property_map(fields[6]);
        if (!props) {
            return std::nullopt;
        }
        e.properties = std::move(*props);
    }
    return e;
}

std::optional<TemporalRelation> EntityLoader::parse_relation_row(const std::string& line) {
    const auto fields = split(line, ',');
    if (fields.size() < RELATION_MIN_FIELDS || fields.size() > RELATION_MAX_FIELDS) {
        return std::nullopt;
    }

    const auto kind       = parse_relation_kind(fields[3]);
    const auto start      = parse_double(fields[4]);
    const auto strength   = parse_double(fields[6]);
    const auto confidence = parse_double(fields[7]);
    const auto lag        = parse_double(fields[8]);
    if (fields[0].empty() || !kind || !start || !strength || !confidence || !lag) {
        return std::nullopt;
    }

    TemporalRelation r;
    r.id            = std::string(fields[0]);
    r.source_entity = std::string(fields[1]);
    r.target_entity = std::string(fields[2]);
    r.kind          = *kind;
    r.start_time    = *start;
    if (!fields[5].empty()) {
        const auto end = parse_double(fields[5]);
        if (!end) {
            return std::nullopt;
        }
        r.end_time = *end;
    }
    r.strength   = *strength;
    r.confidence = *confidence;
    r.causal_lag = *lag;
    if (fields.size() == RELATION_MAX_FIELDS) {
        r.evidence = parse_list(fields[9]);
    }
    return r;
}

// ─── String / file entry points ───────────────────────────────────────────────

std::vector<TemporalEntity>
EntityLoader::parse_entity_csv_string(const std::string& csv_content) {
    return parse_rows<TemporalEntity>(csv_content, &EntityLoader::parse_entity_row, "entity");
}

std::vector<TemporalRelation>
EntityLoader::parse_relation_csv_string(const std::string& csv_content) {
    return parse_rows<TemporalRelation>(csv_content, &EntityLoader::parse_relation_row,
                                        "relation");
}

std::optional<std::vector<TemporalEntity>>
EntityLoader::load_entities_csv(const std::string& filepath) {
    auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_entity_csv_string(*contents);
}

std::optional<std::vector<TemporalRelation>>
EntityLoader::load_relations_csv(const std::string& filepath) {
    auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_relation_csv_string(*contents);
}

}  // namespace tkg::io
