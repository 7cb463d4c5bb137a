/// @file src/core/config_loader.cpp
/// @brief YAML → AppConfig.

#include "tkg/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cmath>

namespace tkg::config {

namespace {

/// Overwrite `out` with `node[key]` when present.
template <typename T>
void read(const YAML::Node& node, const char* key, T& out) {
    const YAML::Node value = node[key];
    if (value && !value.IsNull()) {
        out = value.as<T>();
    }
}

[[nodiscard]] bool unit(double x) noexcept {
    return std::isfinite(x) && x >= 0.0 && x <= 1.0;
}

[[nodiscard]] bool positive(double x) noexcept {
    return std::isfinite(x) && x > 0.0;
}

AppConfig from_yaml(const YAML::Node& root) {
    AppConfig cfg;
    if (!root || root.IsNull()) {
        return cfg;
    }

    read(root, "retention_window", cfg.graph.retention_window);

    if (const YAML::Node d = root["discovery"]) {
        auto& dc = cfg.graph.discovery;
        read(d, "window",               cfg.run.discovery_window);
        read(d, "max_lag",              dc.max_lag);
        read(d, "temporal_weight",      dc.temporal_weight);
        read(d, "compatibility_weight", dc.compatibility_weight);
        read(d, "property_weight",      dc.property_weight);
        read(d, "hypothesis_threshold", dc.hypothesis_threshold);
        read(d, "max_p_value",          dc.max_p_value);
        read(d, "min_correlation",      dc.min_correlation);
        read(d, "min_series_length",    dc.min_series_length);
        read(d, "promote_validated",    dc.promote_validated);
    }

    if (const YAML::Node c = root["chains"]) {
        auto& cc = cfg.graph.chains;
        read(c, "max_chain_length",        cfg.run.max_chain_length);
        read(c, "edge_strength_threshold", cc.edge_strength_threshold);
        read(c, "max_retained",            cc.max_retained);
        read(c, "prediction_multiplier",   cc.prediction_multiplier);
        read(c, "timeout_ms",              cfg.run.chain_timeout_ms);
    }

    if (const YAML::Node p = root["patterns"]) {
        read(p, "min_group_size", cfg.graph.patterns.min_group_size);
        read(p, "max_variation",  cfg.graph.patterns.max_variation);
        read(p, "max_accuracy",   cfg.graph.patterns.max_accuracy);
    }

    if (const YAML::Node p = root["prediction"]) {
        auto& pc = cfg.graph.prediction;
        read(p, "horizon",              cfg.run.horizon);
        read(p, "min_prediction_power", pc.min_prediction_power);
        read(p, "activity_window",      pc.activity_window);
        read(p, "activity_threshold",   pc.activity_threshold);
        read(p, "max_predictions",      pc.max_predictions);
    }

    if (const YAML::Node l = root["logging"]) {
        read(l, "level",   cfg.logging.level);
        read(l, "pattern", cfg.logging.pattern);
    }

    return cfg;
}

}  // namespace

// ─── validate ─────────────────────────────────────────────────────────────────

bool validate(const AppConfig& c) noexcept {
    const auto& d = c.graph.discovery;
    const auto& ch = c.graph.chains;
    const auto& p = c.graph.patterns;
    const auto& pr = c.graph.prediction;

    return positive(c.graph.retention_window)
        && positive(d.max_lag)
        && unit(d.temporal_weight)
        && unit(d.compatibility_weight)
        && unit(d.property_weight)
        && unit(d.hypothesis_threshold)
        && unit(d.max_p_value)
        && unit(d.min_correlation)
        && d.min_series_length >= 2
        && unit(ch.edge_strength_threshold)
        && positive(ch.prediction_multiplier)
        && p.min_group_size >= 3
        && positive(p.max_variation)
        && unit(p.max_accuracy)
        && unit(pr.min_prediction_power)
        && positive(pr.activity_window)
        && unit(pr.activity_threshold)
        && positive(c.run.discovery_window)
        && positive(c.run.horizon)
        && logging::is_valid_level(c.logging.level);
}

// ─── Entry points ─────────────────────────────────────────────────────────────

std::optional<AppConfig> parse_config_string(const std::string& yaml) {
    try {
        AppConfig cfg = from_yaml(YAML::Load(yaml));
        if (!validate(cfg)) {
            spdlog::warn("config: value out of range");
            return std::nullopt;
        }
        return cfg;
    } catch (const YAML::Exception& e) {
        spdlog::warn("config: {}", e.what());
        return std::nullopt;
    }
}

std::optional<AppConfig> load_config_file(const std::string& path) {
    try {
        AppConfig cfg = from_yaml(YAML::LoadFile(path));
        if (!validate(cfg)) {
            spdlog::warn("config: value out of range in '{}'", path);
            return std::nullopt;
        }
        return cfg;
    } catch (const YAML::Exception& e) {
        spdlog::warn("config: cannot load '{}': {}", path, e.what());
        return std::nullopt;
    }
}

}  // namespace tkg::config
