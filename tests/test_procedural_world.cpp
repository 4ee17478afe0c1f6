#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <cmath>
#include <string>

#include "config/LodConfig.h"
#include "core/LodErrors.h"
#include "terrain/ProceduralWorld.h"
#include "view/PlanetView.h"
#include "view/TerrainView.h"

using namespace PlanetLod;

namespace {

// Small tiles: 24 cells per tile, one grid cell per sample
const char* SMALL_CACHES = R"(
    "caches": {
        "elevation": { "tileSize": 29, "capacity": 1024 },
        "normals": { "tileSize": 29, "capacity": 1024 },
        "ortho": { "tileSize": 28, "capacity": 1024 }
    })";

LodConfig flatConfig(const std::string& extra = "") {
    std::string json = R"({ "terrain": { "size": 50000, "maxLevel": 6 }, )" + std::string(SMALL_CACHES);
    if (!extra.empty()) {
        json += ", " + extra;
    }
    json += " }";
    return LodConfig::loadFromJsonString(json);
}

void frame(ProceduralWorld& world, TerrainView& view) {
    view.setGroundHeight(world.cameraGroundHeight());
    view.updateView();
    world.update(view.frameView());
}

} // namespace

TEST_SUITE("ProceduralWorld") {
    TEST_CASE("flat world builds a single face") {
        ProceduralWorld world(flatConfig());
        REQUIRE(world.faceCount() == 1);
        CHECK(world.node(0).config().face == 0);
        CHECK(world.world().samplers().size() == 3);
        CHECK(world.elevation(0).border() == world.normals(0).border());
    }

    TEST_CASE("flythrough draws ready quads with all three tiles") {
        ProceduralWorld world(flatConfig());
        TerrainView view;
        view.position().theta = 0.5;
        view.position().distance = 3000.0;

        for (int i = 0; i < 4; ++i) {
            frame(world, view);

            const std::vector<DrawableQuad>& drawList = world.world().drawList();
            REQUIRE_FALSE(drawList.empty());
            CHECK(world.world().stats().drawnQuads == static_cast<int>(drawList.size()));
            CHECK(world.world().stats().maxDepth <= 6);

            for (const DrawableQuad& quad : drawList) {
                CHECK(quad.node == &world.node(0));
                CHECK(quad.level <= 6);
                // Every producer runs synchronously so leaves are always ready
                CHECK(quad.childMask == 0);
                CHECK(quad.tiles.size() == 3);
            }

            view.moveForward(500.0);
            view.turn(0.1);
        }

        CHECK(world.elevationCache().usedTilesCount() > 0);
        CHECK(world.normalCache().usedTilesCount() > 0);
        CHECK(world.orthoCache().usedTilesCount() > 0);
        CHECK(world.world().stats().maxDepth > 0);
    }

    TEST_CASE("ground height follows the elevation tiles") {
        ProceduralWorld world(flatConfig());
        TerrainView view;
        view.position().theta = 0.0;
        view.position().distance = 2000.0;
        frame(world, view);

        const glm::dvec3& camera = world.node(0).localCameraPos();
        double h = world.groundHeight(0, glm::dvec2(camera.x, camera.y));
        CHECK(std::isfinite(h));
        CHECK(std::abs(h) < 20000.0);
        CHECK(world.cameraGroundHeight() == doctest::Approx(h));

        // Outside the root quad there is no data
        CHECK(world.groundHeight(0, glm::dvec2(1e6, 0.0)) == 0.0);
    }

    TEST_CASE("zero noise gives a flat ground") {
        ProceduralWorld world(flatConfig(R"("elevation": { "noiseAmp": [0.0] })"));
        TerrainView view;
        view.position().distance = 1500.0;
        frame(world, view);

        CHECK(world.cameraGroundHeight() == 0.0);
        CHECK(world.groundHeight(0, glm::dvec2(1234.0, -567.0)) == 0.0);
    }

    TEST_CASE("grid resolution must fit the tile size") {
        LodConfig config = flatConfig();
        config.world.gridResolution = 7;
        CHECK_NOTHROW(ProceduralWorld{config});

        config.world.gridResolution = 10;
        CHECK_THROWS_AS(ProceduralWorld{config}, InvalidParameterError);
    }

    TEST_CASE("sampler dependencies are checked before any tile is produced") {
        LodConfig config = flatConfig();
        config.elevationSampler.storeParent = false;
        CHECK_THROWS_AS(ProceduralWorld{config}, InvalidParameterError);

        config = flatConfig();
        config.orthoSampler.storeLeaf = false;
        CHECK_THROWS_AS(ProceduralWorld{config}, InvalidParameterError);

        config = flatConfig();
        config.normalSampler.priority = -5;
        CHECK_THROWS_AS(ProceduralWorld{config}, InvalidParameterError);

        config = flatConfig();
        config.normalSampler.storeInvisible = true;
        CHECK_THROWS_AS(ProceduralWorld{config}, InvalidParameterError);
        config.elevationSampler.storeInvisible = true;
        CHECK_NOTHROW(ProceduralWorld{config});
    }

    TEST_CASE("planet builds six faces") {
        LodConfig config = LodConfig::loadFromJsonString(
            R"({ "world": { "deformed": true }, "terrain": { "maxLevel": 3 }, )" + std::string(SMALL_CACHES) + " }");
        ProceduralWorld world(config);
        REQUIRE(world.faceCount() == 6);
        for (size_t i = 0; i < world.faceCount(); ++i) {
            CHECK(world.node(i).config().face == static_cast<int>(i) + 1);
        }

        PlanetView view(config.world.radius);
        view.position().theta = 0.0;
        view.position().distance = 2.0 * config.world.radius;
        frame(world, view);

        const std::vector<DrawableQuad>& drawList = world.world().drawList();
        REQUIRE_FALSE(drawList.empty());
        for (const DrawableQuad& quad : drawList) {
            CHECK(quad.level <= 3);
            CHECK(quad.tiles.size() == 3);
        }
        CHECK(world.world().stats().maxDepth <= 3);
    }
}
