#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "config/LodConfig.h"
#include "core/LodErrors.h"

using namespace PlanetLod;

TEST_SUITE("LodConfig") {
    TEST_CASE("empty document keeps the defaults") {
        LodConfig config = LodConfig::loadFromJsonString("{}");
        CHECK_FALSE(config.world.deformed);
        CHECK(config.world.gridResolution == 25);
        CHECK(config.terrain.size == doctest::Approx(50000.0));
        CHECK(config.terrain.maxLevel == 16);
        CHECK(config.terrain.splitFactor == doctest::Approx(2.0));
        CHECK(config.elevationCache.tileSize == 101);
        CHECK(config.elevationCache.channels == 2);
        CHECK(config.normalCache.channels == 4);
        CHECK(config.orthoCache.tileSize == 100);
        CHECK(config.normalSampler.priority == 0);
        CHECK_FALSE(config.normalSampler.storeParent);

        // Elevation noise covers the whole root quad
        CHECK(config.rootLength() == doctest::Approx(100000.0));
        CHECK(config.elevation.rootLength == doctest::Approx(100000.0));
    }

    TEST_CASE("keys override the defaults") {
        LodConfig config = LodConfig::loadFromJsonString(R"({
            "world": { "deformed": true, "radius": 1000.0, "gridResolution": 9 },
            "terrain": { "name": "moon", "zmin": -10, "zmax": 20, "splitFactor": 3.0,
                         "maxLevel": 8, "horizonCulling": false, "faces": [1, 3] },
            "caches": { "elevation": { "tileSize": 25, "capacity": 64 } },
            "samplers": { "ortho": { "storeInvisible": true, "priority": 2 } },
            "elevation": { "seed": 42, "noiseAmp": [100.0, 50.0] },
            "ortho": { "maxLevel": 4, "hsv": false, "noiseColor": [0.1, 0.2, 0.3] }
        })");

        CHECK(config.world.deformed);
        CHECK(config.world.radius == doctest::Approx(1000.0));
        CHECK(config.world.gridResolution == 9);
        CHECK(config.terrain.name == "moon");
        CHECK(config.terrain.zmin == doctest::Approx(-10.0));
        CHECK(config.terrain.zmax == doctest::Approx(20.0));
        CHECK(config.terrain.splitFactor == doctest::Approx(3.0));
        CHECK(config.terrain.maxLevel == 8);
        CHECK_FALSE(config.terrain.horizonCulling);
        std::vector<int> expectedFaces{1, 3};
        CHECK(config.terrainFaces() == expectedFaces);

        CHECK(config.elevationCache.tileSize == 25);
        CHECK(config.elevationCache.capacity == 64);
        CHECK(config.elevationCache.channels == 2);

        CHECK(config.orthoSampler.storeInvisible);
        CHECK(config.orthoSampler.priority == 2);
        CHECK(config.orthoSampler.storeParent);

        CHECK(config.elevation.seed == 42u);
        REQUIRE(config.elevation.noiseAmp.size() == 2);
        CHECK(config.elevation.noiseAmp[1] == doctest::Approx(50.0f));

        CHECK(config.ortho.maxLevel == 4);
        CHECK_FALSE(config.ortho.hsv);
        CHECK(config.ortho.noiseColor.g == doctest::Approx(0.2f));
        CHECK(config.ortho.noiseColor.a == doctest::Approx(1.0f));

        CHECK(config.rootLength() == doctest::Approx(2000.0));
        CHECK(config.elevation.rootLength == doctest::Approx(2000.0));
    }

    TEST_CASE("recoverable values are clamped") {
        LodConfig config = LodConfig::loadFromJsonString(
            R"({ "terrain": { "maxLevel": 40, "splitFactor": 0.5 } })");
        CHECK(config.terrain.maxLevel == 22);
        CHECK(config.terrain.splitFactor == doctest::Approx(1.1));

        config = LodConfig::loadFromJsonString(R"({ "terrain": { "maxLevel": -3 } })");
        CHECK(config.terrain.maxLevel == 0);
    }

    TEST_CASE("default faces depend on the world kind") {
        LodConfig flat = LodConfig::loadFromJsonString("{}");
        std::vector<int> flatFaces{0};
        CHECK(flat.terrainFaces() == flatFaces);

        LodConfig planet = LodConfig::loadFromJsonString(R"({ "world": { "deformed": true } })");
        std::vector<int> cubeFaces{1, 2, 3, 4, 5, 6};
        CHECK(planet.terrainFaces() == cubeFaces);
        CHECK(planet.rootLength() == doctest::Approx(2.0 * 6360000.0));
    }

    TEST_CASE("invalid documents are rejected") {
        CHECK_THROWS_AS(LodConfig::loadFromJsonString("{ not json"), InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "terrain": { "maxLevel": "deep" } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "world": { "gridResolution": 1 } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "world": { "deformed": true, "radius": 0 } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "terrain": { "size": -1 } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "terrain": { "zmin": 10, "zmax": 5 } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "terrain": { "faces": [0, 7] } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(
                            R"({ "world": { "deformed": true }, "terrain": { "faces": [0] } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "caches": { "normals": { "capacity": 0 } } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "caches": { "ortho": { "tileSize": -4 } } })"),
                        InvalidParameterError);
    }

    TEST_CASE("sampler settings must let producers find their inputs") {
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "samplers": { "elevation": { "storeParent": false } } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "samplers": { "elevation": { "storeLeaf": false } } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "samplers": { "ortho": { "storeParent": false } } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "samplers": { "normals": { "priority": -2 } } })"),
                        InvalidParameterError);
        CHECK_THROWS_AS(LodConfig::loadFromJsonString(R"({ "samplers": { "normals": { "storeInvisible": true } } })"),
                        InvalidParameterError);

        // Same priority as elevation is allowed, elevation is registered first
        CHECK_NOTHROW(LodConfig::loadFromJsonString(R"({ "samplers": { "normals": { "priority": -1 } } })"));
        CHECK_NOTHROW(LodConfig::loadFromJsonString(R"({ "samplers": {
            "elevation": { "storeInvisible": true },
            "normals": { "storeInvisible": true, "storeParent": true } } })"));

        LodConfig config;
        CHECK_NOTHROW(config.validate());
        config.normalSampler.priority = config.elevationSampler.priority - 1;
        CHECK_THROWS_AS(config.validate(), InvalidParameterError);
    }

    TEST_CASE("config files are read from disk") {
        CHECK_THROWS_AS(LodConfig::loadFromJsonFile("/nonexistent/planetlod/config.json"),
                        InvalidParameterError);

        std::filesystem::path path = std::filesystem::temp_directory_path() / "planetlod_test_config.json";
        {
            std::ofstream out(path);
            out << R"({ "terrain": { "size": 1234.0, "maxLevel": 5 } })";
        }
        LodConfig config = LodConfig::loadFromJsonFile(path.string());
        std::filesystem::remove(path);

        CHECK(config.terrain.size == doctest::Approx(1234.0));
        CHECK(config.terrain.maxLevel == 5);
        CHECK(config.rootLength() == doctest::Approx(2468.0));
    }
}
