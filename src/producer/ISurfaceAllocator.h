#pragma once

#include <cstddef>
#include <cstdint>

namespace PlanetLod {

enum class SurfaceKind {
    Texture2D,
    Buffer
};

enum class SurfaceFormat {
    R32Float,
    RGBA32Float,
    RGBA8
};

struct SurfaceDesc {
    SurfaceKind kind = SurfaceKind::Texture2D;
    SurfaceFormat format = SurfaceFormat::RGBA8;
    uint32_t width = 0;
    uint32_t height = 0;
};

using SurfaceHandle = uint64_t;

inline size_t bytesPerTexel(SurfaceFormat format) {
    switch (format) {
        case SurfaceFormat::R32Float: return 4;
        case SurfaceFormat::RGBA32Float: return 16;
        case SurfaceFormat::RGBA8: return 4;
    }
    return 0;
}

inline int channelCount(SurfaceFormat format) {
    switch (format) {
        case SurfaceFormat::R32Float: return 1;
        case SurfaceFormat::RGBA32Float: return 4;
        case SurfaceFormat::RGBA8: return 4;
    }
    return 0;
}

/**
 * Interface for the host renderer's texture/buffer allocation.
 *
 * Tile storages that live on the GPU hold opaque handles obtained here;
 * the LOD core never talks to a graphics API directly.
 */
class ISurfaceAllocator {
public:
    virtual ~ISurfaceAllocator() = default;

    // Returned handles are non-zero
    virtual SurfaceHandle create(const SurfaceDesc& desc) = 0;
    virtual void upload(SurfaceHandle handle, const void* data, size_t bytes) = 0;
    virtual void release(SurfaceHandle handle) = 0;
};

} // namespace PlanetLod
