#pragma once

// Deterministic lattice noise for procedural tile content.
// Values depend only on (seed, level, x, y), so two tiles that share a
// border sample always see the same noise there.

#include <cstdint>

namespace PlanetLod {
namespace TileNoise {

inline uint32_t hashLattice(uint32_t seed, int32_t level, int32_t x, int32_t y) {
    uint32_t h = seed * 0x9E3779B9u;
    h ^= static_cast<uint32_t>(level) + 0x7F4A7C15u + (h << 6) + (h >> 2);
    h ^= static_cast<uint32_t>(x) * 0x85EBCA6Bu;
    h = (h << 13) | (h >> 19);
    h ^= static_cast<uint32_t>(y) * 0xC2B2AE35u;
    h ^= h >> 16;
    h *= 0x85EBCA6Bu;
    h ^= h >> 13;
    h *= 0xC2B2AE35u;
    h ^= h >> 16;
    return h;
}

// Value in [0, 1]
inline float hashValue(uint32_t seed, int32_t level, int32_t x, int32_t y) {
    return static_cast<float>(hashLattice(seed, level, x, y) & 0x00FFFFFFu) / 16777215.0f;
}

// Value in [-1, 1]
inline float hashSigned(uint32_t seed, int32_t level, int32_t x, int32_t y) {
    return hashValue(seed, level, x, y) * 2.0f - 1.0f;
}

} // namespace TileNoise
} // namespace PlanetLod
