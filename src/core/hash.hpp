#pragma once

/// @file src/core/hash.hpp
/// @brief FNV-1a hashing for deterministic analytics ids.

#include <cstdint>
#include <string_view>

namespace tkg::detail {

inline constexpr std::uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
inline constexpr std::uint64_t FNV_PRIME        = 1099511628211ULL;

/// Fold `bytes` into a running 64-bit FNV-1a state.
[[nodiscard]] constexpr std::uint64_t
fnv1a64(std::string_view bytes, std::uint64_t state = FNV_OFFSET_BASIS) noexcept {
    for (const char c : bytes) {
        state ^= static_cast<std::uint8_t>(c);
        state *= FNV_PRIME;
    }
    return state;
}

}  // namespace tkg::detail
