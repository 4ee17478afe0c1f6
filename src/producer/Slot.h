#pragma once

#include "ISurfaceAllocator.h"
#include <algorithm>
#include <cstddef>
#include <vector>

namespace PlanetLod {

class TileStorageBase;

/**
 * One fixed-size storage unit inside a TileStorage pool.
 *
 * A slot is lent to at most one Tile at a time. Ownership only changes
 * through TileStorage::newSlot() and TileStorage::deleteSlot().
 */
class Slot {
public:
    explicit Slot(TileStorageBase& owner) : owner_(owner) {}
    virtual ~Slot() = default;

    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;

    TileStorageBase& owner() const { return owner_; }

    // Free the underlying resource at storage teardown
    virtual void release() = 0;

private:
    TileStorageBase& owner_;
};

// Slot backed by a CPU array of tileSize * tileSize * channels values
template <typename T>
class CPUSlot : public Slot {
public:
    using ValueType = T;

    CPUSlot(TileStorageBase& owner, size_t size) : Slot(owner), data_(size, T{}) {}

    T* data() { return data_.data(); }
    const T* data() const { return data_.data(); }
    size_t size() const { return data_.size(); }

    T& operator[](size_t i) { return data_[i]; }
    const T& operator[](size_t i) const { return data_[i]; }

    void clear() { std::fill(data_.begin(), data_.end(), T{}); }

    void release() override {
        data_.clear();
        data_.shrink_to_fit();
    }

private:
    std::vector<T> data_;
};

// Slot backed by a host renderer texture or buffer
class SurfaceSlot : public Slot {
public:
    SurfaceSlot(TileStorageBase& owner, ISurfaceAllocator& allocator, const SurfaceDesc& desc)
        : Slot(owner), allocator_(allocator), desc_(desc), handle_(allocator.create(desc)) {}

    SurfaceHandle handle() const { return handle_; }
    const SurfaceDesc& desc() const { return desc_; }

    void upload(const void* data, size_t bytes) {
        allocator_.upload(handle_, data, bytes);
    }

    void release() override {
        if (handle_ != 0) {
            allocator_.release(handle_);
            handle_ = 0;
        }
    }

private:
    ISurfaceAllocator& allocator_;
    SurfaceDesc desc_;
    SurfaceHandle handle_ = 0;
};

// Copy a filled CPU tile into a host surface
template <typename T>
void uploadSlot(const CPUSlot<T>& src, SurfaceSlot& dst) {
    dst.upload(src.data(), src.size() * sizeof(T));
}

} // namespace PlanetLod
