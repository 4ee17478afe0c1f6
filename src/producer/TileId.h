#pragma once

// Keys used to address tiles in caches and producers

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace PlanetLod {

// Tile coordinates within one producer's namespace.
// Ordered coarse-to-fine by level only.
struct Id {
    int level = 0;
    int tx = 0;
    int ty = 0;

    bool operator==(const Id& other) const {
        return level == other.level && tx == other.tx && ty == other.ty;
    }

    bool operator!=(const Id& other) const {
        return !(*this == other);
    }

    std::string toString() const {
        return "(" + std::to_string(level) + "," + std::to_string(tx) + "," + std::to_string(ty) + ")";
    }
};

// Coarse-to-fine ordering for sorted containers of Ids
struct IdLevelLess {
    bool operator()(const Id& a, const Id& b) const {
        return a.level < b.level;
    }
};

// Key that is unique across every producer sharing a cache
struct TileId {
    int producerId = 0;
    int level = 0;
    int tx = 0;
    int ty = 0;

    Id localId() const { return Id{level, tx, ty}; }

    bool operator==(const TileId& other) const {
        return producerId == other.producerId && level == other.level &&
               tx == other.tx && ty == other.ty;
    }

    bool operator!=(const TileId& other) const {
        return !(*this == other);
    }

    std::string toString() const {
        return "(" + std::to_string(producerId) + "," + std::to_string(level) + "," +
               std::to_string(tx) + "," + std::to_string(ty) + ")";
    }
};

} // namespace PlanetLod

// Hash functions so Ids can key unordered containers
namespace std {
template <>
struct hash<PlanetLod::Id> {
    size_t operator()(const PlanetLod::Id& id) const noexcept {
        size_t h = 23;
        h = h * 37 + std::hash<int>()(id.level);
        h = h * 37 + std::hash<int>()(id.tx);
        h = h * 37 + std::hash<int>()(id.ty);
        return h;
    }
};

template <>
struct hash<PlanetLod::TileId> {
    size_t operator()(const PlanetLod::TileId& id) const noexcept {
        size_t h = 23;
        h = h * 37 + std::hash<int>()(id.producerId);
        h = h * 37 + std::hash<int>()(id.level);
        h = h * 37 + std::hash<int>()(id.tx);
        h = h * 37 + std::hash<int>()(id.ty);
        return h;
    }
};
} // namespace std
