#include "ProceduralWorld.h"
#include "producer/TileStorage.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>

namespace PlanetLod {

ProceduralWorld::ProceduralWorld(const LodConfig& config)
    : config_(config)
    , context_(config.world) {
    config_.validate();

    elevationCache_ = std::make_unique<FloatTileCache>(
        "elevation",
        std::make_unique<CPUTileStorage<float>>(config_.elevationCache.tileSize, config_.elevationCache.channels,
                                                config_.elevationCache.capacity));
    normalCache_ = std::make_unique<FloatTileCache>(
        "normals",
        std::make_unique<CPUTileStorage<float>>(config_.normalCache.tileSize, config_.normalCache.channels,
                                                config_.normalCache.capacity));
    orthoCache_ = std::make_unique<ByteTileCache>(
        "ortho",
        std::make_unique<CPUTileStorage<uint8_t>>(config_.orthoCache.tileSize, config_.orthoCache.channels,
                                                  config_.orthoCache.capacity));

    world_ = std::make_unique<TerrainWorld>(context_);

    for (int faceId : config_.terrainFaces()) {
        Face face;

        TerrainNodeConfig nodeConfig = config_.terrain;
        nodeConfig.face = faceId;
        nodeConfig.name = config_.terrain.name + std::to_string(faceId);
        face.node = &world_->addTerrainNode(nodeConfig);

        ElevationSettings elevation = config_.elevation;
        elevation.rootLength = config_.rootLength();
        elevation.seed = config_.elevation.seed + static_cast<uint32_t>(faceId) * 7919u;
        face.elevation = std::make_unique<ElevationProducer>(
            "elevation" + std::to_string(faceId), *elevationCache_,
            std::make_unique<ElevationFiller<>>(context_, elevation));

        NormalSettings normals;
        normals.rootLength = config_.rootLength();
        normals.border = face.elevation->border();
        face.normals = std::make_unique<NormalProducer>(
            "normals" + std::to_string(faceId), *normalCache_,
            std::make_unique<NormalFiller<ElevationProducer>>(context_, *face.elevation, normals));

        OrthoSettings ortho = config_.ortho;
        ortho.seed = config_.ortho.seed + static_cast<uint32_t>(faceId) * 7919u;
        face.ortho = std::make_unique<OrthoProducer>(
            "ortho" + std::to_string(faceId), *orthoCache_,
            std::make_unique<OrthoFiller<>>(ortho));

        TileSamplerConfig elevationSampler = config_.elevationSampler;
        elevationSampler.name = face.elevation->name();
        world_->addSampler(*face.elevation, *face.node, elevationSampler);

        TileSamplerConfig normalSampler = config_.normalSampler;
        normalSampler.name = face.normals->name();
        world_->addSampler(*face.normals, *face.node, normalSampler);

        TileSamplerConfig orthoSampler = config_.orthoSampler;
        orthoSampler.name = face.ortho->name();
        world_->addSampler(*face.ortho, *face.node, orthoSampler);

        faces_.push_back(std::move(face));
    }

    SDL_Log("ProceduralWorld: Built %zu terrain face(s)", faces_.size());
}

ProceduralWorld::~ProceduralWorld() {
    // Samplers return their tiles before producers unregister from caches
    world_.reset();
    faces_.clear();
}

double ProceduralWorld::groundHeight(size_t face, const glm::dvec2& localPt) const {
    const ElevationProducer& producer = *faces_[face].elevation;
    const double D = config_.rootLength();
    const double R = D / 2.0;
    const int W = producer.getTileSize(0);
    const int B = producer.border();
    const int ts = W - 1 - 2 * B;

    for (int level = config_.terrain.maxLevel; level >= 0; --level) {
        int n = 1 << level;
        double fx = (localPt.x + R) / std::ldexp(D, -level);
        double fy = (localPt.y + R) / std::ldexp(D, -level);
        if (!(fx >= 0.0 && fy >= 0.0 && fx <= n && fy <= n)) {
            return 0.0;
        }
        int tx = std::min(static_cast<int>(fx), n - 1);
        int ty = std::min(static_cast<int>(fy), n - 1);

        const auto* tile = producer.findTile(level, tx, ty, true, true);
        if (tile == nullptr) {
            continue;
        }

        const CPUSlot<float>& data = tile->slot<0>();
        int channels = static_cast<int>(data.size() / (static_cast<size_t>(W) * W));
        double u = (fx - tx) * ts + B;
        double v = (fy - ty) * ts + B;
        int i = std::min(static_cast<int>(u), W - 2);
        int j = std::min(static_cast<int>(v), W - 2);
        double du = u - i;
        double dv = v - j;

        auto at = [&](int x, int y) { return static_cast<double>(data[(x + y * W) * channels]); };
        double z0 = at(i, j) * (1.0 - du) + at(i + 1, j) * du;
        double z1 = at(i, j + 1) * (1.0 - du) + at(i + 1, j + 1) * du;
        return z0 * (1.0 - dv) + z1 * dv;
    }
    return 0.0;
}

double ProceduralWorld::cameraGroundHeight() const {
    const double R = config_.rootLength() / 2.0;
    for (size_t i = 0; i < faces_.size(); ++i) {
        const glm::dvec3& camera = faces_[i].node->localCameraPos();
        if (isFinite(camera) && std::abs(camera.x) <= R && std::abs(camera.y) <= R) {
            return groundHeight(i, glm::dvec2(camera));
        }
    }
    return 0.0;
}

} // namespace PlanetLod
