/// @file src/core/logging.cpp
/// @brief spdlog default-logger configuration.

#include "tkg/logging.hpp"

#include <spdlog/spdlog.h>

namespace tkg::logging {

bool is_valid_level(const std::string& level) noexcept {
    // from_str maps unknown names to `off`, so "off" must be matched by name.
    return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
}

bool init(const LoggingConfig& config) {
    if (!is_valid_level(config.level)) {
        spdlog::warn("logging: unknown level '{}', keeping current", config.level);
        return false;
    }
    spdlog::set_level(spdlog::level::from_str(config.level));
    spdlog::set_pattern(config.pattern);
    return true;
}

}  // namespace tkg::logging
