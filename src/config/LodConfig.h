#pragma once

#include "terrain/ElevationProducer.h"
#include "terrain/OrthoProducer.h"
#include "terrain/TerrainNode.h"
#include "terrain/TileSampler.h"
#include "terrain/WorldContext.h"
#include <string>
#include <vector>

namespace PlanetLod {

struct CacheConfig {
    // Tile width in samples, border included
    int tileSize = 101;
    int capacity = 512;
    int channels = 1;
};

/**
 * Complete description of a procedural world: planet or flat terrain,
 * quadtree parameters, tile caches and producer settings.
 *
 * Missing keys keep the defaults below. Unparsable documents and invalid
 * values raise InvalidParameterError; values that can be fixed are clamped
 * with a warning.
 */
struct LodConfig {
    WorldContext world;
    TerrainNodeConfig terrain;
    // Terrain faces to build; empty means all six for planets, face 0 otherwise
    std::vector<int> faces;

    CacheConfig elevationCache{101, 512, 2};
    CacheConfig normalCache{101, 512, 4};
    CacheConfig orthoCache{100, 512, 4};

    TileSamplerConfig elevationSampler{"elevation", true, true, false, -1};
    TileSamplerConfig normalSampler{"normals", true, false, false, 0};
    TileSamplerConfig orthoSampler{"ortho", true, true, false, -1};

    ElevationSettings elevation;
    OrthoSettings ortho;

    // Side of the root quad of every terrain node
    double rootLength() const {
        return world.deformed ? 2.0 * world.radius : 2.0 * terrain.size;
    }

    // Faces actually built, after applying the empty-list default
    std::vector<int> terrainFaces() const;

    // Raise InvalidParameterError for values that cannot be clamped, and for
    // sampler settings under which a producer cannot find the tiles it
    // reads: elevation and ortho keep leaf and parent tiles, normals update
    // after elevation and keep no invisible tile that elevation drops.
    void validate() const;

    static LodConfig loadFromJsonString(const std::string& jsonString);
    static LodConfig loadFromJsonFile(const std::string& jsonPath);
};

} // namespace PlanetLod
