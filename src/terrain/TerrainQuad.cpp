#include "TerrainQuad.h"
#include "TerrainNode.h"
#include <algorithm>

namespace PlanetLod {

TerrainQuad::TerrainQuad(TerrainNode& owner, const TerrainQuad* parent, int tx, int ty,
                         double ox, double oy, double length, double zmin, double zmax)
    : owner_(owner)
    , parent_(parent)
    , level_(parent == nullptr ? 0 : parent->level() + 1)
    , tx_(tx)
    , ty_(ty)
    , ox_(ox)
    , oy_(oy)
    , length_(length)
    , zmin_(zmin)
    , zmax_(zmax)
    , localBox_(ox, ox + length, oy, oy + length, zmin, zmax) {
}

int TerrainQuad::size() const {
    if (isLeaf()) return 1;
    return 1 + children_[0]->size() + children_[1]->size() +
           children_[2]->size() + children_[3]->size();
}

int TerrainQuad::depth() const {
    if (isLeaf()) return level_;
    return std::max(std::max(children_[0]->depth(), children_[1]->depth()),
                    std::max(children_[2]->depth(), children_[3]->depth()));
}

void TerrainQuad::update() {
    // Only re-test against the frustum when the parent straddles it
    FrustumVisibility v = parent_ == nullptr ? FrustumVisibility::Partially : parent_->visibility();
    if (v == FrustumVisibility::Partially) {
        visible_ = owner_.getVisibility(localBox_);
    } else {
        visible_ = v;
    }

    // A quad found unoccluded last frame is assumed to still be so; an
    // occluded one is tested again against this frame's horizon
    if (visible_ != FrustumVisibility::Invisible && occluded_) {
        occluded_ = owner_.isOccluded(localBox_);
        if (occluded_) {
            visible_ = FrustumVisibility::Invisible;
        }
    }

    double ground = owner_.groundHeight();
    double dist = owner_.getCameraDist(Box3d(ox_, ox_ + length_, oy_, oy_ + length_,
                                             std::min(0.0, ground), std::max(0.0, ground)));

    if ((owner_.splitInvisibleQuads() || visible_ != FrustumVisibility::Invisible) &&
        dist < length_ * owner_.splitDist() && level_ < owner_.maxLevel()) {
        if (isLeaf()) {
            subdivide();
        }

        const glm::dvec3& camera = owner_.localCameraPos();
        std::array<int, 4> order = nearToFarOrder(camera.x, camera.y,
                                                  ox_ + length_ / 2.0, oy_ + length_ / 2.0);
        for (int i : order) {
            children_[i]->update();
        }

        // More precise occlusion for the next frame
        occluded_ = children_[0]->isOccluded() && children_[1]->isOccluded() &&
                    children_[2]->isOccluded() && children_[3]->isOccluded();
    } else {
        if (visible_ != FrustumVisibility::Invisible) {
            occluded_ = owner_.addOccluder(localBox_);
            if (occluded_) {
                visible_ = FrustumVisibility::Invisible;
            }
        }
        if (!isLeaf()) {
            release();
        }
    }
}

void TerrainQuad::subdivide() {
    double hl = length_ / 2.0;
    children_[0] = std::make_unique<TerrainQuad>(owner_, this, 2 * tx_, 2 * ty_, ox_, oy_, hl, zmin_, zmax_);
    children_[1] = std::make_unique<TerrainQuad>(owner_, this, 2 * tx_ + 1, 2 * ty_, ox_ + hl, oy_, hl, zmin_, zmax_);
    children_[2] = std::make_unique<TerrainQuad>(owner_, this, 2 * tx_, 2 * ty_ + 1, ox_, oy_ + hl, hl, zmin_, zmax_);
    children_[3] = std::make_unique<TerrainQuad>(owner_, this, 2 * tx_ + 1, 2 * ty_ + 1, ox_ + hl, oy_ + hl, hl, zmin_, zmax_);
}

void TerrainQuad::release() {
    for (auto& child : children_) {
        child.reset();
    }
}

std::array<glm::dvec3, 8> TerrainQuad::deformedCorners() const {
    const Deformation& deform = owner_.deformation();
    return {
        deform.localToDeformed(glm::dvec3(ox_, oy_, zmin_)),
        deform.localToDeformed(glm::dvec3(ox_ + length_, oy_, zmin_)),
        deform.localToDeformed(glm::dvec3(ox_, oy_ + length_, zmin_)),
        deform.localToDeformed(glm::dvec3(ox_ + length_, oy_ + length_, zmin_)),
        deform.localToDeformed(glm::dvec3(ox_, oy_, zmax_)),
        deform.localToDeformed(glm::dvec3(ox_ + length_, oy_, zmax_)),
        deform.localToDeformed(glm::dvec3(ox_, oy_ + length_, zmax_)),
        deform.localToDeformed(glm::dvec3(ox_ + length_, oy_ + length_, zmax_))
    };
}

} // namespace PlanetLod
