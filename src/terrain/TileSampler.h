#pragma once

#include "QuadTree.h"
#include "TerrainNode.h"
#include "TerrainQuad.h"
#include "producer/TileProducer.h"
#include <glm/glm.hpp>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace PlanetLod {

struct TileSamplerConfig {
    std::string name;
    // Keep tiles for leaf quads
    bool storeLeaf = true;
    // Keep tiles for non-leaf quads too (needed to upsample children)
    bool storeParent = true;
    // Keep tiles for quads outside the frustum
    bool storeInvisible = false;
    // Lower priorities are updated first
    int priority = -1;
};

// Where to sample a quad's data: the tile holding it (the quad's own or
// the nearest ancestor's) and the texture coordinate transform into it.
struct TileMapping {
    TileId tile;
    // (u, v) of the quad's lower corner in the tile, third component is the layer
    glm::dvec3 coords{0.0};
    // (u extent, v extent, extent in texels)
    glm::dvec3 size{0.0};
};

// Slot-type independent view of a sampler, used by TerrainWorld
class ITileSampler {
public:
    virtual ~ITileSampler() = default;

    virtual const std::string& name() const = 0;
    virtual void update() = 0;
    virtual int priority() const = 0;
    virtual bool storeLeaf() const = 0;
    virtual const ProducerBase& producer() const = 0;
    virtual const TerrainNode& node() const = 0;

    // Mapping for quad (level, tx, ty), nullopt if neither it nor any
    // ancestor holds a tile
    virtual std::optional<TileMapping> tileMapping(int level, int tx, int ty) const = 0;
};

/**
 * Keeps the tiles of one producer in sync with the quads of one terrain.
 *
 * update() first returns the tiles that are no longer needed (quads merged,
 * hidden, or no longer leaves when only leaves are stored), then acquires
 * tiles for the new ones. Tiles are created synchronously on first request.
 */
template <typename... SlotTs>
class TileSampler : public ITileSampler {
public:
    using ProducerType = TileProducer<SlotTs...>;
    using TileType = Tile<SlotTs...>;
    using TreeType = QuadTree<TileType>;

    TileSampler(ProducerType& producer, const TerrainNode& node, TileSamplerConfig config = {})
        : producer_(producer), node_(node), config_(std::move(config)) {
        if (config_.name.empty()) {
            config_.name = producer_.name();
        }
    }

    ~TileSampler() override {
        if (root_) {
            root_->recursiveDelete(producer_);
        }
    }

    TileSampler(const TileSampler&) = delete;
    TileSampler& operator=(const TileSampler&) = delete;

    const std::string& name() const override { return config_.name; }
    int priority() const override { return config_.priority; }
    bool storeLeaf() const override { return config_.storeLeaf; }
    bool storeParent() const { return config_.storeParent; }
    const ProducerBase& producer() const override { return producer_; }
    const TerrainNode& node() const override { return node_; }
    const TreeType* root() const { return root_.get(); }

    void update() override {
        const TerrainQuad& quad = node_.root();
        putTiles(root_.get(), quad);
        getTiles(nullptr, root_, quad);
    }

    // Tile acquired for quad (level, tx, ty) by this sampler, if any
    TileType* findTile(int level, int tx, int ty) const {
        const TreeType* t = root_.get();
        int tl = 0;
        while (t != nullptr && tl < level) {
            int shift = level - tl - 1;
            t = t->children[childIndex(tx, ty, shift)].get();
            ++tl;
        }
        return t != nullptr ? t->tile : nullptr;
    }

    std::optional<TileMapping> tileMapping(int level, int tx, int ty) const override {
        const TreeType* t = root_.get();
        if (t == nullptr) {
            return std::nullopt;
        }

        int tl = 0;
        while (tl < level && !t->isLeaf()) {
            const TreeType* child = t->children[childIndex(tx, ty, level - tl - 1)].get();
            if (child == nullptr) break;
            t = child;
            ++tl;
        }

        // Offset of the requested quad inside the tree node reached, in
        // units of the requested quad
        double dx = 0.0;
        double dy = 0.0;
        double dd = 1.0;
        while (level > tl) {
            dx += (tx % 2) * dd;
            dy += (ty % 2) * dd;
            dd *= 2.0;
            --level;
            tx /= 2;
            ty /= 2;
        }
        while (t->tile == nullptr && t->parent != nullptr) {
            dx += (tx % 2) * dd;
            dy += (ty % 2) * dd;
            dd *= 2.0;
            --level;
            tx /= 2;
            ty /= 2;
            t = t->parent;
        }
        if (t->tile == nullptr) {
            return std::nullopt;
        }

        int s = producer_.tileSize();
        int b = producer_.border();
        double w = static_cast<double>(s);

        double ds0 = (s / 2) * 2.0 - 2.0 * b;
        dx = dx * ds0 / dd;
        dy = dy * ds0 / dd;
        double ds = ds0 / dd;

        TileMapping mapping;
        mapping.tile = t->tile->id();
        if (s % 2 == 0) {
            mapping.coords = glm::dvec3((dx + b) / w, (dy + b) / w, 0.0);
        } else {
            mapping.coords = glm::dvec3((dx + b + 0.5) / w, (dy + b + 0.5) / w, 0.0);
        }
        mapping.size = glm::dvec3(ds / w, ds / w, ds0);
        return mapping;
    }

private:
    static int childIndex(int tx, int ty, int shift) {
        return ((tx >> shift) & 1) | (((ty >> shift) & 1) << 1);
    }

    bool needTile(const TerrainQuad& quad) const {
        bool need = config_.storeLeaf;
        if (!config_.storeParent && !quad.isLeaf() && producer_.hasChildren(quad.level(), quad.tx(), quad.ty())) {
            need = false;
        }
        if (!config_.storeInvisible && !quad.isVisible()) {
            need = false;
        }
        return need;
    }

    void putTiles(TreeType* t, const TerrainQuad& quad) {
        if (t == nullptr) {
            return;
        }

        t->needTile = needTile(quad);
        if (!t->needTile && t->tile != nullptr) {
            producer_.putTile(t->tile);
            t->tile = nullptr;
        }

        if (quad.isLeaf()) {
            if (!t->isLeaf()) {
                t->recursiveDeleteChildren(producer_);
            }
        } else if (producer_.hasChildren(quad.level(), quad.tx(), quad.ty())) {
            for (int i = 0; i < 4; ++i) {
                putTiles(t->children[i].get(), *quad.child(i));
            }
        }
    }

    void getTiles(TreeType* parent, std::unique_ptr<TreeType>& t, const TerrainQuad& quad) {
        if (!t) {
            t = std::make_unique<TreeType>(parent);
            t->needTile = needTile(quad);
        }

        if (t->needTile && t->tile == nullptr) {
            TileType* tile = producer_.getTile(quad.level(), quad.tx(), quad.ty());
            if (!tile->isDone()) {
                try {
                    tile->createTile();
                } catch (const std::exception&) {
                    // Leave the node unbound so the next update retries the fill
                    producer_.putTile(tile);
                    throw;
                }
            }
            t->tile = tile;
        }

        if (!quad.isLeaf() && producer_.hasChildren(quad.level(), quad.tx(), quad.ty())) {
            for (int i = 0; i < 4; ++i) {
                getTiles(t.get(), t->children[i], *quad.child(i));
            }
        }
    }

    ProducerType& producer_;
    const TerrainNode& node_;
    TileSamplerConfig config_;
    std::unique_ptr<TreeType> root_;
};

} // namespace PlanetLod
