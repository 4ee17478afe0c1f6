#pragma once

#include "core/LodErrors.h"
#include "producer/TileProducer.h"
#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace PlanetLod {

// Colour noise amplitude per level, 0-255
std::vector<float> defaultOrthoNoiseAmp();

struct OrthoSettings {
    uint32_t seed = 0;
    // Finest level with tiles, -1 for no limit
    int maxLevel = -1;
    // Add the noise in HSV space instead of RGB
    bool hsv = true;
    std::vector<float> noiseAmp = defaultOrthoNoiseAmp();
    glm::vec4 noiseColor{1.0f, 1.0f, 1.0f, 1.0f};
    // Colour of the root tile
    glm::vec4 rootNoiseColor{0.5f, 0.5f, 0.5f, 0.5f};
};

// Fill one RGBA8 colour tile of tileWidth x tileWidth pixels (4 bytes each)
// from its parent (nullptr at level 0) plus level-dependent colour noise.
// Pixels are cell centered: the tile holds tileWidth - 2 * border pixels of
// its own and a border of neighbour pixels on each side.
void fillOrthoTile(const OrthoSettings& settings, int tileWidth, int border,
                   int level, int tx, int ty, const uint8_t* parent, uint8_t* out);

/**
 * Procedural colour tiles, refined level by level from a uniform root.
 * Each tile needs its parent tile, so the sampler must store parents.
 */
template <typename... ExtraSlots>
class OrthoFiller : public TileFiller<CPUSlot<uint8_t>, ExtraSlots...> {
public:
    static constexpr int BORDER = 2;
    static constexpr int CHANNELS = 4;

    using ProducerType = TileProducer<CPUSlot<uint8_t>, ExtraSlots...>;

    explicit OrthoFiller(OrthoSettings settings) : settings_(std::move(settings)) {}

    int border() const override { return BORDER; }

    bool hasTile(int level, int tx, int ty) const override {
        (void)tx; (void)ty;
        return settings_.maxLevel == -1 || level <= settings_.maxLevel;
    }

    const OrthoSettings& settings() const { return settings_; }

    void validate(const ProducerType& producer) const override {
        if (producer.getTileSize(0) <= 2 * BORDER) {
            raise<InvalidParameterError>("OrthoFiller: tile size of " + producer.name() +
                                         " must exceed twice the border");
        }
        if (producer.getChannels(0) != CHANNELS) {
            raise<InvalidParameterError>("OrthoFiller: " + producer.name() + " needs RGBA8 slots");
        }
    }

    void createTile(const ProducerType& producer, int level, int tx, int ty,
                    CPUSlot<uint8_t>& data, ExtraSlots&... extra) override {
        int tileWidth = producer.getTileSize(0);
        const uint8_t* parent = nullptr;
        if (level > 0) {
            auto* parentTile = producer.findTile(level - 1, tx / 2, ty / 2, false, true);
            if (parentTile == nullptr) {
                raise<MissingTileError>("OrthoFiller: parent of tile (" + std::to_string(level) + "," +
                                        std::to_string(tx) + "," + std::to_string(ty) + ") is not ready");
            }
            parent = parentTile->template slot<0>().data();
        }

        fillOrthoTile(settings_, tileWidth, BORDER, level, tx, ty, parent, data.data());
        (uploadSlot(data, extra), ...);
    }

private:
    OrthoSettings settings_;
};

} // namespace PlanetLod
