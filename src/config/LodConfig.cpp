#include "LodConfig.h"
#include "core/LodErrors.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace PlanetLod {

namespace {

constexpr int MAX_LEVEL_LIMIT = 22;

CacheConfig parseCache(const json& j, const CacheConfig& defaults) {
    CacheConfig cache = defaults;
    cache.tileSize = j.value("tileSize", defaults.tileSize);
    cache.capacity = j.value("capacity", defaults.capacity);
    cache.channels = j.value("channels", defaults.channels);
    return cache;
}

TileSamplerConfig parseSampler(const json& j, const TileSamplerConfig& defaults) {
    TileSamplerConfig sampler = defaults;
    sampler.storeLeaf = j.value("storeLeaf", defaults.storeLeaf);
    sampler.storeParent = j.value("storeParent", defaults.storeParent);
    sampler.storeInvisible = j.value("storeInvisible", defaults.storeInvisible);
    sampler.priority = j.value("priority", defaults.priority);
    return sampler;
}

glm::vec4 parseColor(const json& j, const glm::vec4& defaults) {
    if (!j.is_array() || j.size() < 3) {
        return defaults;
    }
    glm::vec4 color = defaults;
    for (size_t i = 0; i < std::min<size_t>(j.size(), 4); ++i) {
        color[static_cast<int>(i)] = j[i].get<float>();
    }
    return color;
}

} // namespace

std::vector<int> LodConfig::terrainFaces() const {
    if (!faces.empty()) {
        return faces;
    }
    if (world.deformed) {
        return {1, 2, 3, 4, 5, 6};
    }
    return {0};
}

void LodConfig::validate() const {
    if (world.gridResolution < 2) {
        raise<InvalidParameterError>("LodConfig: gridResolution must be at least 2");
    }
    if (world.deformed && !(world.radius > 0.0)) {
        raise<InvalidParameterError>("LodConfig: radius must be positive");
    }
    if (!world.deformed && !(terrain.size > 0.0)) {
        raise<InvalidParameterError>("LodConfig: terrain size must be positive");
    }
    if (terrain.zmin > terrain.zmax) {
        raise<InvalidParameterError>("LodConfig: terrain zmin is above zmax");
    }
    for (int face : faces) {
        int minFace = world.deformed ? 1 : 0;
        if (face < minFace || face > 6) {
            raise<InvalidParameterError>("LodConfig: invalid terrain face " + std::to_string(face));
        }
    }
    for (const CacheConfig* cache : {&elevationCache, &normalCache, &orthoCache}) {
        if (cache->tileSize <= 0 || cache->capacity <= 0 || cache->channels <= 0) {
            raise<InvalidParameterError>("LodConfig: cache tile size, capacity and channels must be positive");
        }
    }

    // Elevation and ortho tiles are refined from their parent tile
    for (const TileSamplerConfig* sampler : {&elevationSampler, &orthoSampler}) {
        if (!sampler->storeLeaf || !sampler->storeParent) {
            raise<InvalidParameterError>("LodConfig: " + sampler->name +
                                         " sampler must store leaf and parent tiles");
        }
    }
    // Normal tiles read the elevation tile of the same quad
    if (normalSampler.priority < elevationSampler.priority) {
        raise<InvalidParameterError>("LodConfig: normals sampler priority " +
                                     std::to_string(normalSampler.priority) +
                                     " is below elevation priority " +
                                     std::to_string(elevationSampler.priority));
    }
    if (normalSampler.storeInvisible && !elevationSampler.storeInvisible) {
        raise<InvalidParameterError>("LodConfig: normals sampler stores invisible tiles but elevation does not");
    }
}

LodConfig LodConfig::loadFromJsonFile(const std::string& jsonPath) {
    std::ifstream file(jsonPath);
    if (!file.is_open()) {
        raise<InvalidParameterError>("LodConfig: Failed to open config file: " + jsonPath);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return loadFromJsonString(content);
}

LodConfig LodConfig::loadFromJsonString(const std::string& jsonString) {
    LodConfig config;

    try {
        json j = json::parse(jsonString);

        if (j.contains("world")) {
            const auto& world = j["world"];
            config.world.radius = world.value("radius", config.world.radius);
            config.world.deformed = world.value("deformed", config.world.deformed);
            config.world.gridResolution = world.value("gridResolution", config.world.gridResolution);
        }

        if (j.contains("terrain")) {
            const auto& terrain = j["terrain"];
            config.terrain.name = terrain.value("name", config.terrain.name);
            config.terrain.size = terrain.value("size", config.terrain.size);
            config.terrain.zmin = terrain.value("zmin", config.terrain.zmin);
            config.terrain.zmax = terrain.value("zmax", config.terrain.zmax);
            config.terrain.splitFactor = terrain.value("splitFactor", config.terrain.splitFactor);
            config.terrain.maxLevel = terrain.value("maxLevel", config.terrain.maxLevel);
            config.terrain.horizonCulling = terrain.value("horizonCulling", config.terrain.horizonCulling);
            config.terrain.splitInvisibleQuads =
                terrain.value("splitInvisibleQuads", config.terrain.splitInvisibleQuads);
            if (terrain.contains("faces")) {
                config.faces = terrain["faces"].get<std::vector<int>>();
            }
        }

        if (j.contains("caches")) {
            const auto& caches = j["caches"];
            if (caches.contains("elevation")) {
                config.elevationCache = parseCache(caches["elevation"], config.elevationCache);
            }
            if (caches.contains("normals")) {
                config.normalCache = parseCache(caches["normals"], config.normalCache);
            }
            if (caches.contains("ortho")) {
                config.orthoCache = parseCache(caches["ortho"], config.orthoCache);
            }
        }

        if (j.contains("samplers")) {
            const auto& samplers = j["samplers"];
            if (samplers.contains("elevation")) {
                config.elevationSampler = parseSampler(samplers["elevation"], config.elevationSampler);
            }
            if (samplers.contains("normals")) {
                config.normalSampler = parseSampler(samplers["normals"], config.normalSampler);
            }
            if (samplers.contains("ortho")) {
                config.orthoSampler = parseSampler(samplers["ortho"], config.orthoSampler);
            }
        }

        if (j.contains("elevation")) {
            const auto& elevation = j["elevation"];
            config.elevation.seed = elevation.value("seed", config.elevation.seed);
            if (elevation.contains("noiseAmp")) {
                config.elevation.noiseAmp = elevation["noiseAmp"].get<std::vector<float>>();
            }
        }

        if (j.contains("ortho")) {
            const auto& ortho = j["ortho"];
            config.ortho.seed = ortho.value("seed", config.ortho.seed);
            config.ortho.maxLevel = ortho.value("maxLevel", config.ortho.maxLevel);
            config.ortho.hsv = ortho.value("hsv", config.ortho.hsv);
            if (ortho.contains("noiseAmp")) {
                config.ortho.noiseAmp = ortho["noiseAmp"].get<std::vector<float>>();
            }
            if (ortho.contains("noiseColor")) {
                config.ortho.noiseColor = parseColor(ortho["noiseColor"], config.ortho.noiseColor);
            }
            if (ortho.contains("rootNoiseColor")) {
                config.ortho.rootNoiseColor = parseColor(ortho["rootNoiseColor"], config.ortho.rootNoiseColor);
            }
        }
    } catch (const json::exception& e) {
        raise<InvalidParameterError>(std::string("LodConfig: JSON parse error: ") + e.what());
    }

    // Recoverable values are clamped
    if (config.terrain.maxLevel > MAX_LEVEL_LIMIT || config.terrain.maxLevel < 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "LodConfig: maxLevel %d clamped to [0, %d]",
                    config.terrain.maxLevel, MAX_LEVEL_LIMIT);
        config.terrain.maxLevel = std::clamp(config.terrain.maxLevel, 0, MAX_LEVEL_LIMIT);
    }
    if (config.terrain.splitFactor <= 1.0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "LodConfig: splitFactor %.3f raised to 1.1",
                    config.terrain.splitFactor);
        config.terrain.splitFactor = 1.1;
    }

    config.validate();

    config.elevation.rootLength = config.rootLength();

    SDL_Log("LodConfig: Loaded %s world, %zu face(s), max level %d, split factor %.2f",
            config.world.deformed ? "planet" : "flat", config.terrainFaces().size(),
            config.terrain.maxLevel, config.terrain.splitFactor);

    return config;
}

} // namespace PlanetLod
