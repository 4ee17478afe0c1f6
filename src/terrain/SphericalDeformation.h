#pragma once

#include "Deformation.h"
#include <array>

namespace PlanetLod {

/**
 * Deformation of the plane z = 0 onto a sphere of radius R centered at
 * the origin. The plane z = h maps to the sphere of radius R + h.
 *
 * A local point p = (x, y, z) maps to (R + z) * P / |P| with P = (x, y, R),
 * so the root quad [-R, R]^2 covers one face of a cube-sphere. Six terrain
 * nodes, each rotated by its face transform, cover the whole planet.
 */
class SphericalDeformation : public Deformation {
public:
    explicit SphericalDeformation(double radius);

    glm::dvec3 localToDeformed(const glm::dvec3& localPt) const override;
    glm::dmat4 localToDeformedDifferential(const glm::dvec3& localPt, bool clamp = false) const override;
    glm::dvec3 deformedToLocal(const glm::dvec3& deformedPt) const override;
    Box2d deformedToLocalBounds(const glm::dvec3& deformedCenter, double deformedRadius) const override;
    glm::dmat4 deformedToTangentFrame(const glm::dvec3& deformedPt) const override;

    FrustumVisibility getVisibility(const TerrainFrameState& frame, const Box3d& localBox) const override;

    double radius() const override { return radius_; }

    // Classify four deformed corners against a plane. f scales the corners
    // radially to account for the bulge of the curved box between them.
    static FrustumVisibility classifyCorners(const glm::dvec4& clip, const std::array<glm::dvec3, 4>& b, double f);

protected:
    void setScreenParams(const TerrainFrameState& frame, const TerrainDeformParams& terrain,
                         const TerrainQuad& quad, QuadDeformParams& params) const override;

private:
    double radius_;
};

} // namespace PlanetLod
