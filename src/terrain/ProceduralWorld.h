#pragma once

#include "ElevationProducer.h"
#include "NormalProducer.h"
#include "OrthoProducer.h"
#include "TerrainWorld.h"
#include "config/LodConfig.h"
#include "producer/TileCache.h"
#include "producer/TileProducer.h"
#include <memory>
#include <vector>

namespace PlanetLod {

using ElevationProducer = TileProducer<CPUSlot<float>>;
using NormalProducer = TileProducer<CPUSlot<float>>;
using OrthoProducer = TileProducer<CPUSlot<uint8_t>>;

using FloatTileCache = TileCache<CPUSlot<float>>;
using ByteTileCache = TileCache<CPUSlot<uint8_t>>;

/**
 * A TerrainWorld populated from a LodConfig: one terrain node per face,
 * each with its own elevation, normal and colour producers sampled on the
 * CPU. The three caches are shared by all faces.
 */
class ProceduralWorld {
public:
    explicit ProceduralWorld(const LodConfig& config);
    ~ProceduralWorld();

    ProceduralWorld(const ProceduralWorld&) = delete;
    ProceduralWorld& operator=(const ProceduralWorld&) = delete;

    void update(const FrameView& view) { world_->update(view); }

    const LodConfig& config() const { return config_; }
    const WorldContext& context() const { return context_; }
    TerrainWorld& world() { return *world_; }
    const TerrainWorld& world() const { return *world_; }

    const FloatTileCache& elevationCache() const { return *elevationCache_; }
    const FloatTileCache& normalCache() const { return *normalCache_; }
    const ByteTileCache& orthoCache() const { return *orthoCache_; }

    size_t faceCount() const { return faces_.size(); }
    const ElevationProducer& elevation(size_t face) const { return *faces_[face].elevation; }
    const NormalProducer& normals(size_t face) const { return *faces_[face].normals; }
    const OrthoProducer& ortho(size_t face) const { return *faces_[face].ortho; }

    const TerrainNode& node(size_t face) const { return *faces_[face].node; }

    // Height of the finest ready elevation data under a local point of a
    // face, 0 when no tile covers it
    double groundHeight(size_t face, const glm::dvec2& localPt) const;

    // Ground height under the camera of the last update
    double cameraGroundHeight() const;

private:
    struct Face {
        TerrainNode* node = nullptr;
        std::unique_ptr<ElevationProducer> elevation;
        std::unique_ptr<NormalProducer> normals;
        std::unique_ptr<OrthoProducer> ortho;
    };

    LodConfig config_;
    WorldContext context_;

    // Caches outlive producers, which outlive the world and its samplers
    std::unique_ptr<FloatTileCache> elevationCache_;
    std::unique_ptr<FloatTileCache> normalCache_;
    std::unique_ptr<ByteTileCache> orthoCache_;
    std::vector<Face> faces_;
    std::unique_ptr<TerrainWorld> world_;
};

} // namespace PlanetLod
