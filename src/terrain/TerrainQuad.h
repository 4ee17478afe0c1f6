#pragma once

#include "core/Frustum.h"
#include "core/LodMath.h"
#include <array>
#include <memory>

namespace PlanetLod {

class TerrainNode;

// Child visiting order, nearest first, for a camera at (camX, camY) and a
// quad centered at (cx, cy). Children are numbered 0 = (x0,y0),
// 1 = (x1,y0), 2 = (x0,y1), 3 = (x1,y1).
inline std::array<int, 4> nearToFarOrder(double camX, double camY, double cx, double cy) {
    if (camY < cy) {
        return camX < cx ? std::array<int, 4>{0, 1, 2, 3} : std::array<int, 4>{1, 0, 3, 2};
    }
    return camX < cx ? std::array<int, 4>{2, 0, 3, 1} : std::array<int, 4>{3, 1, 2, 0};
}

/**
 * Node of the view-dependent terrain quadtree.
 *
 * A quad covers [ox, ox + length] x [oy, oy + length] in local space with
 * elevations in [zmin, zmax]. update() decides each frame whether the quad
 * is split into four children or merged back into a leaf, based on the
 * camera distance, frustum visibility and horizon occlusion maintained by
 * the owning TerrainNode. Children are always created and released as a
 * group of four.
 */
class TerrainQuad {
public:
    TerrainQuad(TerrainNode& owner, const TerrainQuad* parent, int tx, int ty,
                double ox, double oy, double length, double zmin, double zmax);

    TerrainQuad(const TerrainQuad&) = delete;
    TerrainQuad& operator=(const TerrainQuad&) = delete;

    // Recompute visibility and occlusion, then subdivide or merge.
    // Children are updated in near-to-far order so that occluders are
    // registered front to back.
    void update();

    int level() const { return level_; }
    int tx() const { return tx_; }
    int ty() const { return ty_; }
    double ox() const { return ox_; }
    double oy() const { return oy_; }
    double length() const { return length_; }
    double zmin() const { return zmin_; }
    double zmax() const { return zmax_; }
    const Box3d& localBox() const { return localBox_; }

    const TerrainNode& owner() const { return owner_; }
    const TerrainQuad* parent() const { return parent_; }

    bool isLeaf() const { return children_[0] == nullptr; }
    const TerrainQuad* child(int i) const { return children_[i].get(); }
    TerrainQuad* child(int i) { return children_[i].get(); }

    FrustumVisibility visibility() const { return visible_; }
    bool isVisible() const { return visible_ != FrustumVisibility::Invisible; }
    bool isOccluded() const { return occluded_; }

    // Set by the draw list builder: all data needed to draw this quad is ready
    bool isDrawable() const { return drawable_; }
    void setDrawable(bool drawable) { drawable_ = drawable; }

    // Number of quads in this subtree
    int size() const;
    // Deepest level in this subtree
    int depth() const;

    // Deformed corners at zmin (0-3) and zmax (4-7) for debug outlines
    std::array<glm::dvec3, 8> deformedCorners() const;

private:
    void subdivide();
    void release();

    TerrainNode& owner_;
    const TerrainQuad* parent_;
    int level_;
    int tx_;
    int ty_;
    double ox_;
    double oy_;
    double length_;
    double zmin_;
    double zmax_;
    Box3d localBox_;

    FrustumVisibility visible_ = FrustumVisibility::Partially;
    bool occluded_ = false;
    bool drawable_ = false;

    std::array<std::unique_ptr<TerrainQuad>, 4> children_;
};

} // namespace PlanetLod
