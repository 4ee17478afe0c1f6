#include <doctest/doctest.h>
#include <memory>
#include <unordered_map>

#include "producer/ISurfaceAllocator.h"
#include "producer/TileCache.h"
#include "producer/TileStorage.h"
#include "terrain/ElevationProducer.h"
#include "terrain/NormalProducer.h"
#include "terrain/OrthoProducer.h"

using namespace PlanetLod;

namespace {

using FloatCache = TileCache<CPUSlot<float>>;
using ByteCache = TileCache<CPUSlot<uint8_t>>;
using FloatProducer = TileProducer<CPUSlot<float>>;
using ByteProducer = TileProducer<CPUSlot<uint8_t>>;

// 5 x 5 grid meshes, so tiles of 21 samples have 16 cells
WorldContext smallWorld() {
    WorldContext world;
    world.gridResolution = 5;
    return world;
}

constexpr int TILE = 21;
constexpr int B = 2;

ElevationSettings flatSettings() {
    ElevationSettings settings;
    settings.rootLength = 1000.0;
    settings.noiseAmp.clear();
    return settings;
}

ElevationSettings noisySettings() {
    ElevationSettings settings;
    settings.rootLength = 1000.0;
    settings.seed = 42;
    settings.noiseAmp = {-100.0f, -50.0f, -25.0f, 10.0f};
    return settings;
}

std::unique_ptr<FloatCache> floatCache(int tileSize, int channels, int capacity = 16) {
    return std::make_unique<FloatCache>("float", std::make_unique<CPUTileStorage<float>>(tileSize, channels, capacity));
}

std::unique_ptr<ByteCache> byteCache(int tileSize, int channels, int capacity = 16) {
    return std::make_unique<ByteCache>("byte", std::make_unique<CPUTileStorage<uint8_t>>(tileSize, channels, capacity));
}

FloatProducer::TileType* produce(FloatProducer& producer, int level, int tx, int ty) {
    auto* tile = producer.getTile(level, tx, ty);
    tile->createTile();
    return tile;
}

float sample(const CPUSlot<float>& data, int i, int j, int channels, int c = 0) {
    return data[(i + j * TILE) * channels + c];
}

class RecordingAllocator : public ISurfaceAllocator {
public:
    SurfaceHandle create(const SurfaceDesc& desc) override {
        (void)desc;
        return ++lastHandle;
    }

    void upload(SurfaceHandle handle, const void* data, size_t bytes) override {
        (void)data;
        uploads[handle] = bytes;
    }

    void release(SurfaceHandle handle) override {
        (void)handle;
        ++released;
    }

    SurfaceHandle lastHandle = 0;
    std::unordered_map<SurfaceHandle, size_t> uploads;
    int released = 0;
};

} // namespace

TEST_SUITE("ElevationProducer") {
    TEST_CASE("tile size must fit the grid mesh") {
        WorldContext world = smallWorld();
        auto good = floatCache(TILE, 2);
        CHECK_NOTHROW(FloatProducer("elevation", *good, std::make_unique<ElevationFiller<>>(world, flatSettings())));

        auto bad = floatCache(TILE + 1, 2);
        CHECK_THROWS_AS(FloatProducer("elevation", *bad, std::make_unique<ElevationFiller<>>(world, flatSettings())),
                        InvalidParameterError);
    }

    TEST_CASE("child tiles need their parent") {
        WorldContext world = smallWorld();
        auto cache = floatCache(TILE, 2);
        FloatProducer producer("elevation", *cache, std::make_unique<ElevationFiller<>>(world, noisySettings()));

        auto* child = producer.getTile(1, 0, 0);
        CHECK_THROWS_AS(child->createTile(), MissingTileError);
        CHECK_FALSE(child->isDone());

        produce(producer, 0, 0, 0);
        child->createTile();
        CHECK(child->isDone());
    }

    TEST_CASE("zero amplitude keeps a flat terrain flat") {
        WorldContext world = smallWorld();
        auto cache = floatCache(TILE, 2);
        FloatProducer producer("elevation", *cache, std::make_unique<ElevationFiller<>>(world, flatSettings()));

        produce(producer, 0, 0, 0);
        auto* tile = produce(producer, 1, 1, 0);
        for (size_t i = 0; i < tile->slot<0>().size(); ++i) {
            CHECK(tile->slot<0>()[i] == 0.0f);
        }
    }

    TEST_CASE("neighbouring tiles agree on shared samples") {
        WorldContext world = smallWorld();
        auto cache = floatCache(TILE, 2);
        FloatProducer producer("elevation", *cache, std::make_unique<ElevationFiller<>>(world, noisySettings()));

        produce(producer, 0, 0, 0);
        auto* left = produce(producer, 1, 0, 0);
        auto* right = produce(producer, 1, 1, 0);
        const int ts = TILE - 1 - 2 * B;

        for (int j = 0; j < TILE; ++j) {
            CHECK(sample(left->slot<0>(), ts + B, j, 2) == doctest::Approx(sample(right->slot<0>(), B, j, 2)));
        }
    }

    TEST_CASE("coarse channel holds the upsampled parent") {
        WorldContext world = smallWorld();
        auto cache = floatCache(TILE, 2);
        FloatProducer producer("elevation", *cache, std::make_unique<ElevationFiller<>>(world, noisySettings()));

        auto* root = produce(producer, 0, 0, 0);
        auto* child = produce(producer, 1, 1, 1);
        const int ts = TILE - 1 - 2 * B;

        // Even child samples fall exactly on parent samples
        CHECK(sample(child->slot<0>(), B, B, 2, 1) ==
              doctest::Approx(sample(root->slot<0>(), B + ts / 2, B + ts / 2, 2)));
        CHECK(sample(child->slot<0>(), B + 2, B + 4, 2, 1) ==
              doctest::Approx(sample(root->slot<0>(), B + ts / 2 + 1, B + ts / 2 + 2, 2)));
        // The root tile has no parent, both channels agree
        CHECK(sample(root->slot<0>(), 5, 7, 2, 1) == sample(root->slot<0>(), 5, 7, 2, 0));
    }

    TEST_CASE("same seed gives the same terrain") {
        WorldContext world = smallWorld();
        auto cacheA = floatCache(TILE, 1);
        auto cacheB = floatCache(TILE, 1);
        FloatProducer a("a", *cacheA, std::make_unique<ElevationFiller<>>(world, noisySettings()));
        FloatProducer b("b", *cacheB, std::make_unique<ElevationFiller<>>(world, noisySettings()));

        auto* ta = produce(a, 0, 0, 0);
        auto* tb = produce(b, 0, 0, 0);
        bool anyNonZero = false;
        for (size_t i = 0; i < ta->slot<0>().size(); ++i) {
            CHECK(ta->slot<0>()[i] == tb->slot<0>()[i]);
            anyNonZero = anyNonZero || ta->slot<0>()[i] != 0.0f;
        }
        CHECK(anyNonZero);
    }

    TEST_CASE("surface slots receive a copy of each tile") {
        WorldContext world = smallWorld();
        RecordingAllocator allocator;
        {
            using GpuCache = TileCache<CPUSlot<float>, SurfaceSlot>;
            GpuCache cache("gpu", std::make_unique<CPUTileStorage<float>>(TILE, 2, 4),
                           std::make_unique<SurfaceTileStorage>(allocator, TILE, 4, SurfaceFormat::RGBA32Float));
            TileProducer<CPUSlot<float>, SurfaceSlot> producer(
                "elevation", cache, std::make_unique<ElevationFiller<SurfaceSlot>>(world, noisySettings()));

            auto* tile = producer.getTile(0, 0, 0);
            tile->createTile();
            SurfaceHandle handle = tile->slot<1>().handle();
            CHECK(handle != 0);
            REQUIRE(allocator.uploads.count(handle) == 1);
            CHECK(allocator.uploads[handle] == static_cast<size_t>(TILE) * TILE * 2 * sizeof(float));
            CHECK(allocator.uploads.size() == 1);
        }
        CHECK(allocator.lastHandle == 4);
        CHECK(allocator.released == 4);
    }
}

TEST_SUITE("NormalProducer") {
    TEST_CASE("flat terrain has vertical normals") {
        WorldContext world = smallWorld();
        auto elevationCache = floatCache(TILE, 2);
        auto normalCache = floatCache(TILE, 4);
        FloatProducer elevation("elevation", *elevationCache,
                                std::make_unique<ElevationFiller<>>(world, flatSettings()));
        NormalSettings settings{1000.0, ElevationFiller<>::BORDER};
        FloatProducer normals("normals", *normalCache,
                              std::make_unique<NormalFiller<FloatProducer>>(world, elevation, settings));

        produce(elevation, 0, 0, 0);
        auto* tile = produce(normals, 0, 0, 0);
        for (int j = 0; j < TILE; j += 5) {
            for (int i = 0; i < TILE; i += 5) {
                CHECK(sample(tile->slot<0>(), i, j, 4, 0) == doctest::Approx(0.0));
                CHECK(sample(tile->slot<0>(), i, j, 4, 1) == doctest::Approx(0.0));
                CHECK(sample(tile->slot<0>(), i, j, 4, 2) == doctest::Approx(1.0));
                CHECK(sample(tile->slot<0>(), i, j, 4, 3) == doctest::Approx(0.0));
            }
        }
    }

    TEST_CASE("normals are unit vectors on noisy terrain") {
        WorldContext world = smallWorld();
        auto elevationCache = floatCache(TILE, 2);
        auto normalCache = floatCache(TILE, 4);
        FloatProducer elevation("elevation", *elevationCache,
                                std::make_unique<ElevationFiller<>>(world, noisySettings()));
        FloatProducer normals("normals", *normalCache,
                              std::make_unique<NormalFiller<FloatProducer>>(world, elevation,
                                                                            NormalSettings{1000.0, 2}));

        auto* height = produce(elevation, 0, 0, 0);
        auto* tile = produce(normals, 0, 0, 0);
        for (int j = 0; j < TILE; j += 3) {
            for (int i = 0; i < TILE; i += 3) {
                glm::dvec3 n(sample(tile->slot<0>(), i, j, 4, 0), sample(tile->slot<0>(), i, j, 4, 1),
                             sample(tile->slot<0>(), i, j, 4, 2));
                CHECK(glm::length(n) == doctest::Approx(1.0).epsilon(1e-5));
                CHECK(n.z > 0.0);
                CHECK(sample(tile->slot<0>(), i, j, 4, 3) == sample(height->slot<0>(), i, j, 2));
            }
        }
    }

    TEST_CASE("missing elevation tile is an ordering error") {
        WorldContext world = smallWorld();
        auto elevationCache = floatCache(TILE, 2);
        auto normalCache = floatCache(TILE, 4);
        FloatProducer elevation("elevation", *elevationCache,
                                std::make_unique<ElevationFiller<>>(world, flatSettings()));
        FloatProducer normals("normals", *normalCache,
                              std::make_unique<NormalFiller<FloatProducer>>(world, elevation, NormalSettings{1000.0, 2}));

        auto* tile = normals.getTile(0, 0, 0);
        CHECK_THROWS_AS(tile->createTile(), MissingTileError);
        CHECK_FALSE(tile->isDone());

        // An acquired but not yet created elevation tile does not count
        elevation.getTile(0, 0, 0);
        CHECK_THROWS_AS(tile->createTile(), MissingTileError);
    }

    TEST_CASE("mismatched tile sizes and borders fail at construction") {
        WorldContext world = smallWorld();
        auto elevationCache = floatCache(TILE, 2);
        FloatProducer elevation("elevation", *elevationCache,
                                std::make_unique<ElevationFiller<>>(world, flatSettings()));

        auto wrongSize = floatCache(TILE + 4, 4);
        CHECK_THROWS_AS(FloatProducer("normals", *wrongSize,
                                      std::make_unique<NormalFiller<FloatProducer>>(world, elevation,
                                                                                    NormalSettings{1000.0, 2})),
                        InvalidParameterError);

        auto rightSize = floatCache(TILE, 4);
        CHECK_THROWS_AS(FloatProducer("normals", *rightSize,
                                      std::make_unique<NormalFiller<FloatProducer>>(world, elevation,
                                                                                    NormalSettings{1000.0, 1})),
                        InvalidParameterError);
    }

    TEST_CASE("normal slots need three channels") {
        WorldContext world = smallWorld();
        auto elevationCache = floatCache(TILE, 2);
        auto normalCache = floatCache(TILE, 2);
        FloatProducer elevation("elevation", *elevationCache,
                                std::make_unique<ElevationFiller<>>(world, flatSettings()));
        CHECK_THROWS_AS(FloatProducer("normals", *normalCache,
                                      std::make_unique<NormalFiller<FloatProducer>>(world, elevation,
                                                                                    NormalSettings{1000.0, 2})),
                        InvalidParameterError);
        // Rejected before registering with the cache
        CHECK(normalCache->nextProducerId() == 0);
        CHECK(normalCache->storage<0>().freeSlots() == normalCache->capacity());

        auto threeChannels = floatCache(TILE, 3);
        FloatProducer normals("normals", *threeChannels,
                              std::make_unique<NormalFiller<FloatProducer>>(world, elevation, NormalSettings{1000.0, 2}));
        CHECK(normals.getChannels(0) == 3);
        CHECK(elevation.getChannels(0) == 2);
    }

    TEST_CASE("coverage follows the elevation producer") {
        WorldContext world = smallWorld();
        auto elevationCache = floatCache(TILE, 2);
        auto normalCache = floatCache(TILE, 4);
        FloatProducer elevation("elevation", *elevationCache,
                                std::make_unique<ElevationFiller<>>(world, flatSettings()));
        FloatProducer normals("normals", *normalCache,
                              std::make_unique<NormalFiller<FloatProducer>>(world, elevation, NormalSettings{1000.0, 2}));
        CHECK(normals.hasTile(7, 3, 4));
        CHECK(normals.border() == elevation.border());
        CHECK(normals.tileSize() == TILE);
        CHECK(normals.getTileSizeMinBorder(0) == TILE - 2 * B);
    }
}

TEST_SUITE("OrthoProducer") {
    TEST_CASE("root tile is the root colour") {
        auto cache = byteCache(20, 4);
        ByteProducer ortho("ortho", *cache, std::make_unique<OrthoFiller<>>(OrthoSettings{}));

        auto* tile = ortho.getTile(0, 0, 0);
        tile->createTile();
        for (size_t i = 0; i < tile->slot<0>().size(); ++i) {
            CHECK(tile->slot<0>()[i] == 128);
        }
    }

    TEST_CASE("finer tiles add colour noise") {
        auto cache = byteCache(20, 4);
        ByteProducer ortho("ortho", *cache, std::make_unique<OrthoFiller<>>(OrthoSettings{}));

        ortho.getTile(0, 0, 0)->createTile();
        auto* child = ortho.getTile(1, 0, 1);
        child->createTile();
        bool varied = false;
        for (size_t i = 4; i < child->slot<0>().size(); i += 4) {
            varied = varied || child->slot<0>()[i] != child->slot<0>()[0];
        }
        CHECK(varied);
    }

    TEST_CASE("max level limits coverage") {
        auto cache = byteCache(20, 4);
        OrthoSettings settings;
        settings.maxLevel = 2;
        ByteProducer ortho("ortho", *cache, std::make_unique<OrthoFiller<>>(settings));
        CHECK(ortho.hasTile(2, 3, 3));
        CHECK_FALSE(ortho.hasTile(3, 0, 0));
        CHECK(ortho.hasChildren(1, 0, 0));
        CHECK_FALSE(ortho.hasChildren(2, 0, 0));
    }

    TEST_CASE("child tiles need their parent") {
        auto cache = byteCache(20, 4);
        ByteProducer ortho("ortho", *cache, std::make_unique<OrthoFiller<>>(OrthoSettings{}));
        CHECK_THROWS_AS(ortho.getTile(2, 1, 1)->createTile(), MissingTileError);
    }

    TEST_CASE("slots must be RGBA8") {
        auto rgb = byteCache(20, 3);
        CHECK_THROWS_AS(ByteProducer("ortho", *rgb, std::make_unique<OrthoFiller<>>(OrthoSettings{})),
                        InvalidParameterError);
        CHECK(rgb->nextProducerId() == 0);

        auto rgba = byteCache(20, 4);
        ByteProducer ortho("ortho", *rgba, std::make_unique<OrthoFiller<>>(OrthoSettings{}));
        CHECK(ortho.getChannels(0) == 4);
    }

    TEST_CASE("tiles must be larger than their border") {
        auto cache = byteCache(4, 4);
        CHECK_THROWS_AS(ByteProducer("ortho", *cache, std::make_unique<OrthoFiller<>>(OrthoSettings{})),
                        InvalidParameterError);
    }
}
