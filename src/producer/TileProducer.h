#pragma once

#include "TileCache.h"
#include "core/LodErrors.h"
#include <SDL3/SDL_log.h>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace PlanetLod {

/**
 * Slot-type independent view of a producer, used by samplers and by the
 * draw list builder which only need to know which tiles exist and whether
 * they are ready.
 */
class ProducerBase {
public:
    virtual ~ProducerBase() = default;

    virtual int id() const = 0;
    virtual const std::string& name() const = 0;

    // Number of duplicated neighbour samples around each tile
    virtual int border() const = 0;

    virtual bool hasTile(int level, int tx, int ty) const = 0;

    virtual bool hasChildren(int level, int tx, int ty) const {
        return hasTile(level + 1, 2 * tx, 2 * ty);
    }

    // True when the tile is in use by someone and its task has run
    virtual bool isTileReady(int level, int tx, int ty) const = 0;

    // Tile width of storage i, border included
    virtual int getTileSize(int i) const = 0;

    // Tile width of the first storage
    int tileSize() const { return getTileSize(0); }

    int getTileSizeMinBorder(int i) const {
        return getTileSize(i) - 2 * border();
    }

    // Channels per sample of storage i
    virtual int getChannels(int i) const = 0;
};

template <typename... SlotTs>
class TileProducer;

/**
 * Strategy that fills the slots of one tile. Each producer kind
 * (elevation, normals, imagery, host callbacks) implements this once and
 * is bound to a TileProducer at construction.
 */
template <typename... SlotTs>
class TileFiller {
public:
    virtual ~TileFiller() = default;

    virtual int border() const { return 0; }
    virtual bool hasTile(int level, int tx, int ty) const {
        (void)level; (void)tx; (void)ty;
        return true;
    }

    // Fail fast on configuration the filler cannot work with
    virtual void validate(const TileProducer<SlotTs...>& producer) const { (void)producer; }

    virtual void createTile(const TileProducer<SlotTs...>& producer, int level, int tx, int ty,
                            SlotTs&... slots) = 0;
};

// Filler that forwards to a host supplied function
template <typename... SlotTs>
class CallbackFiller : public TileFiller<SlotTs...> {
public:
    using Callback = std::function<void(int level, int tx, int ty, SlotTs&... slots)>;

    explicit CallbackFiller(Callback callback, int border = 0)
        : callback_(std::move(callback)), border_(border) {}

    int border() const override { return border_; }

    void createTile(const TileProducer<SlotTs...>& producer, int level, int tx, int ty,
                    SlotTs&... slots) override {
        (void)producer;
        callback_(level, tx, ty, slots...);
    }

private:
    Callback callback_;
    int border_;
};

/**
 * TileProducer asks its cache for tiles and builds the tasks that fill them.
 *
 * The slot types are fixed at compile time by the cache the producer is
 * bound to, so fillers receive correctly typed slots without casts.
 * A producer that depends on another producer's tiles must look them up
 * with findTile(..., done = true) and raise MissingTileError when absent.
 */
template <typename... SlotTs>
class TileProducer : public ProducerBase, public ITileTaskSource<SlotTs...> {
public:
    using CacheType = TileCache<SlotTs...>;
    using TileType = Tile<SlotTs...>;
    using FillerType = TileFiller<SlotTs...>;

    TileProducer(std::string name, CacheType& cache, std::unique_ptr<FillerType> filler)
        : name_(std::move(name)), cache_(cache), filler_(std::move(filler)) {
        if (!filler_) {
            raise<InvalidParameterError>("TileProducer " + name_ + ": no tile filler");
        }
        filler_->validate(*this);
        id_ = cache_.insertProducer(*this);
        SDL_Log("TileProducer %s: Registered with cache %s as id %d", name_.c_str(),
                cache_.name().c_str(), id_);
    }

    ~TileProducer() override {
        cache_.removeProducer(id_);
    }

    TileProducer(const TileProducer&) = delete;
    TileProducer& operator=(const TileProducer&) = delete;

    int id() const override { return id_; }
    const std::string& name() const override { return name_; }
    int border() const override { return filler_->border(); }

    bool hasTile(int level, int tx, int ty) const override {
        return filler_->hasTile(level, tx, ty);
    }

    bool isTileReady(int level, int tx, int ty) const override {
        return findTile(level, tx, ty, false, true) != nullptr;
    }

    int getTileSize(int i) const override { return storageAt(i).tileSize(); }
    int getChannels(int i) const override { return storageAt(i).channels(); }

    CacheType& cache() { return cache_; }
    const CacheType& cache() const { return cache_; }
    const FillerType& filler() const { return *filler_; }

    TileType* getTile(int level, int tx, int ty) {
        return cache_.getTile(id_, level, tx, ty);
    }

    void putTile(TileType* tile) {
        cache_.putTile(tile);
    }

    // With done set, tiles whose task has not run are treated as absent
    TileType* findTile(int level, int tx, int ty, bool includeUnused, bool done) const {
        TileType* tile = cache_.findTile(id_, level, tx, ty, includeUnused);
        if (done && tile != nullptr && !tile->isDone()) {
            return nullptr;
        }
        return tile;
    }

    CreateTileTask createTask(int level, int tx, int ty, SlotTs&... slots) override {
        std::string description = name_ + " tile (" + std::to_string(level) + "," +
                                  std::to_string(tx) + "," + std::to_string(ty) + ")";
        std::tuple<SlotTs*...> targets(&slots...);
        return CreateTileTask(std::move(description), [this, level, tx, ty, targets]() {
            std::apply([&](SlotTs*... s) {
                filler_->createTile(*this, level, tx, ty, *s...);
            }, targets);
        });
    }

private:
    const TileStorageBase& storageAt(int i) const {
        const TileStorageBase* storage = cache_.storageAt(i);
        if (storage == nullptr) {
            raise<InvalidParameterError>("TileProducer " + name_ + ": no storage " + std::to_string(i));
        }
        return *storage;
    }

    std::string name_;
    CacheType& cache_;
    std::unique_ptr<FillerType> filler_;
    int id_ = -1;
};

} // namespace PlanetLod
