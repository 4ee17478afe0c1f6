#pragma once

#include "Slot.h"
#include "core/LodErrors.h"
#include <SDL3/SDL_log.h>
#include <list>
#include <memory>
#include <string>
#include <vector>

namespace PlanetLod {

// Slot-type independent view of a storage pool
class TileStorageBase {
public:
    virtual ~TileStorageBase() = default;

    TileStorageBase(const TileStorageBase&) = delete;
    TileStorageBase& operator=(const TileStorageBase&) = delete;

    // Width of one (square) tile in samples, border included
    int tileSize() const { return tileSize_; }
    int capacity() const { return capacity_; }
    // Values (or texel components) per sample
    int channels() const { return channels_; }
    virtual int freeSlots() const = 0;

protected:
    TileStorageBase(int tileSize, int channels, int capacity)
        : tileSize_(tileSize), channels_(channels), capacity_(capacity) {
        if (tileSize <= 0 || capacity <= 0) {
            raise<InvalidParameterError>("TileStorage: tile size (" + std::to_string(tileSize) +
                                         ") and capacity (" + std::to_string(capacity) +
                                         ") must be positive");
        }
        if (channels <= 0) {
            raise<InvalidParameterError>("TileStorage: channel count must be positive");
        }
    }

private:
    int tileSize_;
    int channels_;
    int capacity_;
};

/**
 * Fixed-capacity pool of slots of one concrete type.
 *
 * All slots are created up front and start on the free list. newSlot()
 * takes from the head of the free list and deleteSlot() appends to its
 * tail, so free + allocated == capacity at all times.
 */
template <typename SlotT>
class TileStorage : public TileStorageBase {
public:
    using SlotType = SlotT;

    ~TileStorage() override { release(); }

    // Remove and return the head of the free list, or nullptr if exhausted
    SlotT* newSlot() {
        if (freeSlots_.empty()) {
            return nullptr;
        }
        SlotT* slot = freeSlots_.front();
        freeSlots_.pop_front();
        return slot;
    }

    // Return a slot to the free list. The slot must have been obtained
    // from this storage and must not already be free.
    void deleteSlot(SlotT* slot) {
        freeSlots_.push_back(slot);
    }

    int freeSlots() const override { return static_cast<int>(freeSlots_.size()); }
    int allocatedSlots() const { return capacity() - freeSlots(); }

    // Release every slot's underlying resource
    void release() {
        if (released_) return;
        for (auto& slot : slots_) {
            slot->release();
        }
        released_ = true;
    }

protected:
    TileStorage(int tileSize, int channels, int capacity) : TileStorageBase(tileSize, channels, capacity) {
        slots_.reserve(capacity);
    }

    void addSlot(std::unique_ptr<SlotT> slot) {
        freeSlots_.push_back(slot.get());
        slots_.push_back(std::move(slot));
    }

private:
    std::vector<std::unique_ptr<SlotT>> slots_;
    std::list<SlotT*> freeSlots_;
    bool released_ = false;
};

// Storage of CPU arrays holding tileSize * tileSize * channels values of T
template <typename T>
class CPUTileStorage : public TileStorage<CPUSlot<T>> {
public:
    CPUTileStorage(int tileSize, int channels, int capacity)
        : TileStorage<CPUSlot<T>>(tileSize, channels, capacity) {
        size_t size = static_cast<size_t>(tileSize) * tileSize * channels;
        for (int i = 0; i < capacity; ++i) {
            this->addSlot(std::make_unique<CPUSlot<T>>(*this, size));
        }
        SDL_Log("CPUTileStorage: Created %d slots of %dx%dx%d", capacity, tileSize, tileSize, channels);
    }
};

// Storage of host renderer textures (or buffers) of tileSize x tileSize texels
class SurfaceTileStorage : public TileStorage<SurfaceSlot> {
public:
    SurfaceTileStorage(ISurfaceAllocator& allocator, int tileSize, int capacity,
                       SurfaceFormat format, SurfaceKind kind = SurfaceKind::Texture2D)
        : TileStorage<SurfaceSlot>(tileSize, channelCount(format), capacity) {
        desc_.kind = kind;
        desc_.format = format;
        desc_.width = static_cast<uint32_t>(tileSize);
        desc_.height = kind == SurfaceKind::Texture2D ? static_cast<uint32_t>(tileSize) : 1u;
        if (kind == SurfaceKind::Buffer) {
            desc_.width = static_cast<uint32_t>(tileSize * tileSize);
        }
        for (int i = 0; i < capacity; ++i) {
            addSlot(std::make_unique<SurfaceSlot>(*this, allocator, desc_));
        }
        SDL_Log("SurfaceTileStorage: Created %d %s slots of %dx%d", capacity,
                kind == SurfaceKind::Texture2D ? "texture" : "buffer", tileSize, tileSize);
    }

    const SurfaceDesc& desc() const { return desc_; }

private:
    SurfaceDesc desc_;
};

} // namespace PlanetLod
