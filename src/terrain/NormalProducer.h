#pragma once

#include "Deformation.h"
#include "SphericalDeformation.h"
#include "WorldContext.h"
#include "core/LodErrors.h"
#include "producer/TileProducer.h"
#include <memory>
#include <string>

namespace PlanetLod {

struct NormalSettings {
    // Must match the elevation producer's root length and border
    double rootLength = 100000.0;
    int border = 2;
};

// Fill one normal tile from the elevation tile with the same coordinates.
// Normals are expressed in the tangent frame at the tile center, in the
// first three of `channels` floats per sample; a fourth channel, if
// present, receives the height.
void fillNormalTile(const Deformation& deform, double rootLength, int tileWidth, int border,
                    const float* elevation, int elevationChannels,
                    int level, int tx, int ty, float* out, int channels);

/**
 * Surface normals derived from an elevation producer.
 *
 * A normal tile exists wherever the elevation tile exists, and the
 * elevation tile must be created first: the sampler of the elevation
 * producer has to run before the normal one.
 */
template <typename ElevationProducerT, typename... ExtraSlots>
class NormalFiller : public TileFiller<CPUSlot<float>, ExtraSlots...> {
public:
    using ProducerType = TileProducer<CPUSlot<float>, ExtraSlots...>;

    NormalFiller(const WorldContext& world, const ElevationProducerT& elevation, NormalSettings settings)
        : elevation_(elevation), settings_(settings) {
        if (world.deformed) {
            deform_ = std::make_unique<SphericalDeformation>(world.radius);
        } else {
            deform_ = std::make_unique<Deformation>();
        }
    }

    int border() const override { return settings_.border; }

    bool hasTile(int level, int tx, int ty) const override {
        return elevation_.hasTile(level, tx, ty);
    }

    void validate(const ProducerType& producer) const override {
        if (producer.getTileSize(0) != elevation_.getTileSize(0)) {
            raise<InvalidParameterError>("NormalFiller: tile size of " + producer.name() +
                                         " must be equal to elevation tile size");
        }
        if (settings_.border != elevation_.border()) {
            raise<InvalidParameterError>("NormalFiller: border of " + producer.name() +
                                         " must be equal to elevation border");
        }
        if (producer.getChannels(0) < 3) {
            raise<InvalidParameterError>("NormalFiller: " + producer.name() + " needs at least 3 channels");
        }
    }

    void createTile(const ProducerType& producer, int level, int tx, int ty,
                    CPUSlot<float>& data, ExtraSlots&... extra) override {
        auto* elevationTile = elevation_.findTile(level, tx, ty, false, true);
        if (elevationTile == nullptr) {
            raise<MissingTileError>("NormalFiller: elevation tile (" + std::to_string(level) + "," +
                                    std::to_string(tx) + "," + std::to_string(ty) + ") is not ready for " +
                                    producer.name());
        }

        const auto& elevationData = elevationTile->template slot<0>();
        fillNormalTile(*deform_, settings_.rootLength, producer.getTileSize(0), settings_.border,
                       elevationData.data(), elevation_.getChannels(0), level, tx, ty,
                       data.data(), producer.getChannels(0));
        (uploadSlot(data, extra), ...);
    }

private:
    const ElevationProducerT& elevation_;
    NormalSettings settings_;
    std::unique_ptr<Deformation> deform_;
};

} // namespace PlanetLod
