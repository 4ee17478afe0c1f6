#pragma once

#include "Tile.h"
#include "TileStorage.h"
#include "core/LodErrors.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <array>
#include <exception>
#include <list>
#include <memory>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>

namespace PlanetLod {

// Interface through which a cache asks a registered producer for the
// task that fills a newly allocated tile
template <typename... SlotTs>
class ITileTaskSource {
public:
    virtual ~ITileTaskSource() = default;
    virtual CreateTileTask createTask(int level, int tx, int ty, SlotTs&... slots) = 0;
};

/**
 * TileCache maps TileIds to tiles backed by a fixed pool of slots.
 *
 * The cache owns one storage per slot type; every tile holds one slot from
 * each of them. Tiles with users are "used"; tiles whose user count dropped
 * to zero stay in an LRU list of "unused" tiles and keep their data until
 * their slots are needed for a new tile. When no free slot remains, the
 * least recently unused tile is evicted. If every tile is still in use the
 * request fails with CacheCapacityError.
 *
 * Several producers may share one cache; tile keys embed the producer id.
 */
template <typename... SlotTs>
class TileCache {
public:
    static_assert(sizeof...(SlotTs) > 0, "TileCache needs at least one storage");

    using TileType = Tile<SlotTs...>;
    using TaskSource = ITileTaskSource<SlotTs...>;
    using Slots = typename TileType::Slots;

    TileCache(std::string name, std::unique_ptr<TileStorage<SlotTs>>... storages)
        : name_(std::move(name)), storages_(std::move(storages)...) {
        storageViews_ = std::apply([](auto&... s) {
            return std::array<TileStorageBase*, sizeof...(SlotTs)>{s.get()...};
        }, storages_);

        for (TileStorageBase* storage : storageViews_) {
            if (storage == nullptr) {
                raise<InvalidParameterError>("TileCache " + name_ + ": null storage");
            }
        }
        capacity_ = storageViews_[0]->capacity();
        for (TileStorageBase* storage : storageViews_) {
            if (storage->capacity() != capacity_) {
                raise<InvalidParameterError>("TileCache " + name_ +
                                             ": all storages must have the same capacity");
            }
        }
        SDL_Log("TileCache %s: Created with %zu storage(s), capacity %d, tile size %d",
                name_.c_str(), sizeof...(SlotTs), capacity_, storageViews_[0]->tileSize());
    }

    ~TileCache() {
        SDL_Log("TileCache %s: Max used tiles %zu of %d", name_.c_str(), maxUsedTiles_, capacity_);
    }

    TileCache(const TileCache&) = delete;
    TileCache& operator=(const TileCache&) = delete;

    const std::string& name() const { return name_; }
    int capacity() const { return capacity_; }

    template <std::size_t I>
    auto& storage() { return *std::get<I>(storages_); }

    template <std::size_t I>
    const auto& storage() const { return *std::get<I>(storages_); }

    // Runtime-indexed view of a storage, nullptr when out of range
    const TileStorageBase* storageAt(int i) const {
        if (i < 0 || i >= static_cast<int>(storageViews_.size())) return nullptr;
        return storageViews_[i];
    }

    // Id the next registered producer will receive
    int nextProducerId() const { return nextProducerId_; }

    // Register a producer and return its local id in this cache
    int insertProducer(TaskSource& producer) {
        int id = nextProducerId_++;
        producers_[id] = &producer;
        return id;
    }

    void removeProducer(int producerId) {
        producers_.erase(producerId);
    }

    /**
     * Acquire the tile (producerId, level, tx, ty), creating it if needed.
     * A new tile has users == 1 and a task that has not run yet.
     * Throws CacheCapacityError if no slot can be freed for a new tile.
     */
    TileType* getTile(int producerId, int level, int tx, int ty) {
        TileId id{producerId, level, tx, ty};

        auto used = usedTiles_.find(id);
        if (used != usedTiles_.end()) {
            used->second->incrementUsers();
            return used->second.get();
        }

        auto unused = unusedIndex_.find(id);
        if (unused != unusedIndex_.end()) {
            std::unique_ptr<TileType> tile = std::move(*unused->second);
            unusedTiles_.erase(unused->second);
            unusedIndex_.erase(unused);
            tile->incrementUsers();
            return markUsed(std::move(tile));
        }

        auto producer = producers_.find(producerId);
        if (producer == producers_.end()) {
            raise<InvalidParameterError>("TileCache " + name_ + ": unknown producer id " +
                                         std::to_string(producerId));
        }

        Slots slots;
        if (!allocateSlots(slots, std::index_sequence_for<SlotTs...>{})) {
            if (unusedTiles_.empty()) {
                raise<CacheCapacityError>("TileCache " + name_ + ": capacity " +
                                          std::to_string(capacity_) +
                                          " exhausted, all tiles in use while requesting " +
                                          id.toString());
            }
            // Reclaim the slots of the least recently unused tile
            std::unique_ptr<TileType> victim = std::move(unusedTiles_.front());
            unusedTiles_.pop_front();
            unusedIndex_.erase(victim->id());
            slots = victim->slots();
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "TileCache %s: Evicted tile %s for %s",
                         name_.c_str(), victim->id().toString().c_str(), id.toString().c_str());
        }

        std::unique_ptr<TileType> tile;
        try {
            CreateTileTask task = std::apply([&](SlotTs*... s) {
                return producer->second->createTask(level, tx, ty, *s...);
            }, slots);
            tile = std::make_unique<TileType>(id, slots, std::move(task));
        } catch (const std::exception&) {
            // No tile owns the slots yet, give them back before propagating
            releaseSlots(slots, std::index_sequence_for<SlotTs...>{});
            throw;
        }
        tile->incrementUsers();
        return markUsed(std::move(tile));
    }

    /**
     * Release one use of a tile obtained from getTile(). When the user count
     * reaches zero the tile becomes the most recently unused one. Its data
     * stays valid until its slots are reclaimed.
     */
    void putTile(TileType* tile) {
        if (tile == nullptr) return;

        auto used = usedTiles_.find(tile->id());
        if (used == usedTiles_.end() || used->second.get() != tile) {
            raise<LodError>("TileCache " + name_ + ": put of tile " + tile->id().toString() +
                            " which is not in use");
        }

        tile->decrementUsers();
        if (tile->users() == 0) {
            unusedTiles_.push_back(std::move(used->second));
            usedTiles_.erase(used);
            auto last = std::prev(unusedTiles_.end());
            unusedIndex_[tile->id()] = last;
        }
    }

    // Pure lookup. Unused tiles are only returned when includeUnused is set.
    TileType* findTile(int producerId, int level, int tx, int ty, bool includeUnused) const {
        TileId id{producerId, level, tx, ty};
        auto used = usedTiles_.find(id);
        if (used != usedTiles_.end()) {
            return used->second.get();
        }
        if (includeUnused) {
            auto unused = unusedIndex_.find(id);
            if (unused != unusedIndex_.end()) {
                return unused->second->get();
            }
        }
        return nullptr;
    }

    size_t usedTilesCount() const { return usedTiles_.size(); }
    size_t unusedTilesCount() const { return unusedTiles_.size(); }
    size_t maxUsedTiles() const { return maxUsedTiles_; }

private:
    TileType* markUsed(std::unique_ptr<TileType> tile) {
        TileType* result = tile.get();
        usedTiles_.emplace(tile->id(), std::move(tile));
        maxUsedTiles_ = std::max(maxUsedTiles_, usedTiles_.size());
        return result;
    }

    // Take one slot from every storage; on failure hand back the ones taken
    template <std::size_t... Is>
    bool allocateSlots(Slots& slots, std::index_sequence<Is...>) {
        ((std::get<Is>(slots) = std::get<Is>(storages_)->newSlot()), ...);
        bool allocated = ((std::get<Is>(slots) != nullptr) && ...);
        if (!allocated) {
            ((std::get<Is>(slots) != nullptr ? std::get<Is>(storages_)->deleteSlot(std::get<Is>(slots))
                                             : void()), ...);
        }
        return allocated;
    }

    template <std::size_t... Is>
    void releaseSlots(const Slots& slots, std::index_sequence<Is...>) {
        (std::get<Is>(storages_)->deleteSlot(std::get<Is>(slots)), ...);
    }

    std::string name_;
    std::tuple<std::unique_ptr<TileStorage<SlotTs>>...> storages_;
    std::array<TileStorageBase*, sizeof...(SlotTs)> storageViews_{};
    int capacity_ = 0;

    std::unordered_map<int, TaskSource*> producers_;
    int nextProducerId_ = 0;

    std::unordered_map<TileId, std::unique_ptr<TileType>> usedTiles_;
    // Front is the least recently unused tile
    std::list<std::unique_ptr<TileType>> unusedTiles_;
    std::unordered_map<TileId, typename std::list<std::unique_ptr<TileType>>::iterator> unusedIndex_;
    size_t maxUsedTiles_ = 0;
};

} // namespace PlanetLod
