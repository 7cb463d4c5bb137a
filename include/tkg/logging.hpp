#pragma once

/// @file include/tkg/logging.hpp
/// @brief Process-wide logging setup on top of spdlog's default logger.
///
/// Library code logs through `spdlog::info/debug/warn` directly; this header
/// only configures level and pattern for hosts such as the CLI.

#include <string>

namespace tkg::logging {

struct LoggingConfig {
    /// One of trace, debug, info, warn, error, critical, off.
    std::string level   = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

/// True if `level` names a spdlog level.
[[nodiscard]] bool is_valid_level(const std::string& level) noexcept;

/// Apply `config` to the default logger. Returns false (and leaves the
/// logger untouched) for an unknown level name.
bool init(const LoggingConfig& config);

}  // namespace tkg::logging
