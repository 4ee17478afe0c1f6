#pragma once

#include <array>
#include <memory>

namespace PlanetLod {

/**
 * Sampler-side mirror of a TerrainQuad tree.
 *
 * Each node holds the producer tile acquired for the matching quad, if any.
 * The tree is kept in lock-step with the quads: nodes are created when the
 * quad is first visited and dropped (returning their tiles) when the quad
 * is merged back into a leaf.
 */
template <typename TileT>
struct QuadTree {
    explicit QuadTree(QuadTree* parent) : parent(parent) {}

    QuadTree(const QuadTree&) = delete;
    QuadTree& operator=(const QuadTree&) = delete;

    bool isLeaf() const { return children[0] == nullptr; }

    // Return this node's tile and every descendant's tile to the producer
    template <typename ProducerT>
    void recursiveDelete(ProducerT& producer) {
        if (tile != nullptr) {
            producer.putTile(tile);
            tile = nullptr;
        }
        recursiveDeleteChildren(producer);
    }

    template <typename ProducerT>
    void recursiveDeleteChildren(ProducerT& producer) {
        for (auto& child : children) {
            if (child) {
                child->recursiveDelete(producer);
                child.reset();
            }
        }
    }

    QuadTree* parent;
    TileT* tile = nullptr;
    bool needTile = false;
    std::array<std::unique_ptr<QuadTree>, 4> children;
};

} // namespace PlanetLod
