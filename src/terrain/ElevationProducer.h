#pragma once

#include "WorldContext.h"
#include "core/LodErrors.h"
#include "producer/TileProducer.h"
#include "producer/TileStorage.h"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace PlanetLod {

// Noise amplitude per level, in meters. Negative values add noise
// everywhere, positive values only on steep slopes, zero only upsamples.
std::vector<float> defaultElevationNoiseAmp();

struct ElevationSettings {
    // Side of the root quad in local units (2 * size, or 2 * radius for planets)
    double rootLength = 100000.0;
    uint32_t seed = 1234567;
    std::vector<float> noiseAmp = defaultElevationNoiseAmp();
};

// Fill one elevation tile of tileWidth x tileWidth samples, `channels`
// floats each. Channel 0 receives the final height, channel 1 (if present)
// the height upsampled from the parent before noise was added, so a
// renderer can morph between levels. parent is the parent tile's data with
// the same layout, or nullptr at level 0.
void fillElevationTile(const ElevationSettings& settings, int tileWidth, int border, int channels,
                       int level, int tx, int ty, const float* parent, float* out);

/**
 * Procedural elevation tiles.
 *
 * Level 0 is pure noise; every finer tile upsamples its parent and adds
 * level-dependent noise on the global sample lattice, so neighbouring
 * tiles agree on their shared border samples. Tiles carry a border of two
 * samples on each side and have tileSize - 2 * border - 1 grid cells,
 * which must be a multiple of the grid mesh cells.
 *
 * Extra slots after the CPU one are host surfaces receiving a copy of the
 * CPU data.
 */
template <typename... ExtraSlots>
class ElevationFiller : public TileFiller<CPUSlot<float>, ExtraSlots...> {
public:
    static constexpr int BORDER = 2;

    using ProducerType = TileProducer<CPUSlot<float>, ExtraSlots...>;

    ElevationFiller(const WorldContext& world, ElevationSettings settings)
        : gridResolution_(world.gridResolution), settings_(std::move(settings)) {}

    int border() const override { return BORDER; }

    const ElevationSettings& settings() const { return settings_; }

    void validate(const ProducerType& producer) const override {
        int tileWidth = producer.getTileSize(0);
        int cells = tileWidth - 2 * BORDER - 1;
        if (gridResolution_ < 2 || cells <= 0 || cells % (gridResolution_ - 1) != 0) {
            raise<InvalidParameterError>("ElevationFiller: tile size " + std::to_string(tileWidth) +
                                         " minus border must be a multiple of grid resolution " +
                                         std::to_string(gridResolution_) + " - 1, plus 1");
        }
        if (!(settings_.rootLength > 0.0)) {
            raise<InvalidParameterError>("ElevationFiller: root length must be positive");
        }
    }

    void createTile(const ProducerType& producer, int level, int tx, int ty,
                    CPUSlot<float>& data, ExtraSlots&... extra) override {
        int tileWidth = producer.getTileSize(0);
        int channels = producer.getChannels(0);

        const float* parent = nullptr;
        if (level > 0) {
            auto* parentTile = producer.findTile(level - 1, tx / 2, ty / 2, false, true);
            if (parentTile == nullptr) {
                raise<MissingTileError>("ElevationFiller: parent of tile (" + std::to_string(level) + "," +
                                        std::to_string(tx) + "," + std::to_string(ty) + ") is not ready");
            }
            parent = parentTile->template slot<0>().data();
        }

        fillElevationTile(settings_, tileWidth, BORDER, channels, level, tx, ty, parent, data.data());
        (uploadSlot(data, extra), ...);
    }

private:
    int gridResolution_;
    ElevationSettings settings_;
};

} // namespace PlanetLod
