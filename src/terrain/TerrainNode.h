#pragma once

#include "Deformation.h"
#include "TerrainQuad.h"
#include "WorldContext.h"
#include <array>
#include <memory>
#include <string>

namespace PlanetLod {

struct TerrainNodeConfig {
    std::string name = "terrain";
    // Half size of the root quad for flat terrains (planets use the radius)
    double size = 50000.0;
    double zmin = -5000.0;
    double zmax = 5000.0;
    // Quads are split when closer than splitFactor times their size,
    // scaled by viewport width and field of view
    double splitFactor = 2.0;
    int maxLevel = 16;
    // Cube face 1-6 for planets, 0 for a flat terrain
    int face = 0;
    bool horizonCulling = true;
    bool splitInvisibleQuads = false;
};

/**
 * A view-dependent quadtree of terrain quads.
 *
 * Every frame update() derives the camera position and frustum in local
 * and deformed space, the split distance, and resets the horizon buffer
 * used for occlusion culling, then updates the root quad.
 */
class TerrainNode {
public:
    static constexpr int HORIZON_SIZE = 256;

    TerrainNode(const WorldContext& world, const TerrainNodeConfig& config);

    TerrainNode(const TerrainNode&) = delete;
    TerrainNode& operator=(const TerrainNode&) = delete;

    void update(const FrameView& view);

    const std::string& name() const { return config_.name; }
    const TerrainNodeConfig& config() const { return config_; }
    const WorldContext& world() const { return world_; }

    const TerrainQuad& root() const { return *root_; }
    TerrainQuad& root() { return *root_; }
    const Deformation& deformation() const { return *deform_; }

    const TerrainFrameState& frameState() const { return frame_; }
    const TerrainDeformParams& deformParams() const { return deformParams_; }
    QuadDeformParams quadParams(const TerrainQuad& quad) const;

    const glm::dvec3& localCameraPos() const { return frame_.localCameraPos; }
    const glm::dvec3& deformedCameraPos() const { return frame_.deformedCameraPos; }
    const FrustumPlanes& deformedFrustumPlanes() const { return frame_.deformedFrustumPlanes; }
    const glm::dmat4& localToWorld() const { return frame_.localToWorld; }
    const glm::dmat4& faceToLocal() const { return faceToLocal_; }
    const glm::dmat2& localCameraDir() const { return localCameraDir_; }

    double splitDist() const { return frame_.splitDist; }
    double distFactor() const { return frame_.distFactor; }
    double groundHeight() const { return frame_.groundHeight; }
    int maxLevel() const { return config_.maxLevel; }
    int face() const { return config_.face; }
    bool splitInvisibleQuads() const { return config_.splitInvisibleQuads; }
    bool horizonCulling() const { return config_.horizonCulling; }

    FrustumVisibility getVisibility(const Box3d& localBox) const;

    // True if the box is hidden behind the horizon line accumulated so far
    bool isOccluded(const Box3d& box) const;

    // Test the box against the horizon line, then raise the line with the
    // box's own silhouette if it was not occluded. Returns the occlusion.
    bool addOccluder(const Box3d& occluder);

    // Distance from the camera to a local box, with the vertical component
    // rescaled by the deformation's distance factor
    double getCameraDist(const Box3d& localBox) const;

    // Rotation of cube face 1-6 into the planet frame; identity otherwise
    static glm::dmat4 calculateFaceToLocal(int face);

private:
    bool horizonActive() const;

    const WorldContext& world_;
    TerrainNodeConfig config_;
    std::unique_ptr<Deformation> deform_;
    std::unique_ptr<TerrainQuad> root_;

    glm::dmat4 faceToLocal_{1.0};
    glm::dmat2 localCameraDir_{1.0};
    TerrainFrameState frame_;
    TerrainDeformParams deformParams_;
    std::array<float, HORIZON_SIZE> horizon_{};
};

} // namespace PlanetLod
