#pragma once

#include "core/Frustum.h"
#include "core/LodMath.h"
#include <glm/glm.hpp>

namespace PlanetLod {

class TerrainQuad;

// Per-frame camera state of a terrain node, in the spaces a deformation
// needs to evaluate visibility and placement
struct TerrainFrameState {
    glm::dmat4 localToWorld{1.0};
    glm::dmat4 localToCamera{1.0};
    glm::dmat4 localToScreen{1.0};
    glm::dvec3 worldCameraPos{0.0};
    glm::dvec3 deformedCameraPos{0.0};
    glm::dvec3 localCameraPos{0.0};
    FrustumPlanes deformedFrustumPlanes{};
    double groundHeight = 0.0;
    double splitDist = 1.1;
    double distFactor = 1.0;
};

// Terrain-wide placement data a renderer needs to draw a node
struct TerrainDeformParams {
    // (splitDist + 1, splitDist - 1): morph range for geomorphing
    glm::dvec2 blending{0.0};
    glm::dmat4 localToWorld{1.0};
    glm::dmat4 localToScreen{1.0};
    glm::dmat3 localToTangent{1.0};
    double radius = 0.0;
};

// Placement of one quad: where its grid lands on screen and in the
// tangent frame of the camera
struct QuadDeformParams {
    // (ox, oy, length, level)
    glm::dvec4 offset{0.0};
    // Camera position relative to the quad, in quad units
    glm::dvec4 camera{0.0};
    glm::dmat3 tileToTangent{1.0};
    // Columns are the four corners (ox,oy), (ox+l,oy), (ox,oy+l), (ox+l,oy+l)
    glm::dmat4 screenQuadCorners{0.0};
    glm::dmat4 screenQuadVerticals{0.0};
    glm::dvec4 screenQuadCornerNorms{0.0};
    glm::dmat3 tangentFrameToWorld{1.0};
};

/**
 * Mapping from flat local terrain space to deformed (rendered) space.
 *
 * The base class is the identity mapping used for flat terrains.
 * SphericalDeformation maps the plane onto a sphere.
 */
class Deformation {
public:
    virtual ~Deformation() = default;

    virtual glm::dvec3 localToDeformed(const glm::dvec3& localPt) const;

    // Linear approximation of localToDeformed around localPt.
    // With clamp, x and y are first wrapped into the root quad.
    virtual glm::dmat4 localToDeformedDifferential(const glm::dvec3& localPt, bool clamp = false) const;

    // Inverse mapping. Points without a local representation map to +infinity.
    virtual glm::dvec3 deformedToLocal(const glm::dvec3& deformedPt) const;

    // Local bounding box of a deformed sphere. Empty when the center has no
    // local representation.
    virtual Box2d deformedToLocalBounds(const glm::dvec3& deformedCenter, double deformedRadius) const;

    // Tangent frame at a deformed point (origin at the point, z up)
    virtual glm::dmat4 deformedToTangentFrame(const glm::dvec3& deformedPt) const;

    // Distance in local space between a point and a box, using the
    // per-axis metric the subdivision criterion relies on
    virtual double getLocalDist(const glm::dvec3& localPt, const Box3d& localBox) const;

    virtual FrustumVisibility getVisibility(const TerrainFrameState& frame, const Box3d& localBox) const;

    virtual TerrainDeformParams terrainParams(const TerrainFrameState& frame) const;

    QuadDeformParams quadParams(const TerrainFrameState& frame, const TerrainDeformParams& terrain,
                                const TerrainQuad& quad) const;

    virtual double radius() const { return 0.0; }

protected:
    virtual void setScreenParams(const TerrainFrameState& frame, const TerrainDeformParams& terrain,
                                 const TerrainQuad& quad, QuadDeformParams& params) const;
};

} // namespace PlanetLod
