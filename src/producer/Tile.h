#pragma once

#include "CreateTileTask.h"
#include "TileId.h"
#include <cstddef>
#include <tuple>
#include <utility>

namespace PlanetLod {

/**
 * Cache entry binding a TileId to one slot per storage of its cache and
 * to the task that fills those slots.
 *
 * The users count is adjusted by the cache; a tile with no users stays
 * valid (its data is kept) until the cache reclaims its slots.
 */
template <typename... SlotTs>
class Tile {
public:
    using Slots = std::tuple<SlotTs*...>;

    Tile(const TileId& id, const Slots& slots, CreateTileTask task)
        : id_(id), slots_(slots), task_(std::move(task)) {}

    Tile(const Tile&) = delete;
    Tile& operator=(const Tile&) = delete;

    const TileId& id() const { return id_; }
    Id localId() const { return id_.localId(); }
    int level() const { return id_.level; }
    int tx() const { return id_.tx; }
    int ty() const { return id_.ty; }

    template <std::size_t I>
    auto& slot() const { return *std::get<I>(slots_); }

    const Slots& slots() const { return slots_; }

    int users() const { return users_; }
    void incrementUsers() { ++users_; }
    void decrementUsers() {
        if (users_ > 0) --users_;
    }

    bool isDone() const { return task_.isDone(); }
    const CreateTileTask& task() const { return task_; }

    // Run the fill task; no-op once it has completed
    void createTile() { task_.run(); }

private:
    TileId id_;
    Slots slots_;
    CreateTileTask task_;
    int users_ = 0;
};

} // namespace PlanetLod
