#include "Deformation.h"
#include "TerrainQuad.h"
#include <algorithm>
#include <cmath>

namespace PlanetLod {

glm::dvec3 Deformation::localToDeformed(const glm::dvec3& localPt) const {
    return localPt;
}

glm::dmat4 Deformation::localToDeformedDifferential(const glm::dvec3& localPt, bool clamp) const {
    (void)clamp;
    return translation(glm::dvec3(localPt.x, localPt.y, 0.0));
}

glm::dvec3 Deformation::deformedToLocal(const glm::dvec3& deformedPt) const {
    return deformedPt;
}

Box2d Deformation::deformedToLocalBounds(const glm::dvec3& deformedCenter, double deformedRadius) const {
    return Box2d(deformedCenter.x - deformedRadius, deformedCenter.x + deformedRadius,
                 deformedCenter.y - deformedRadius, deformedCenter.y + deformedRadius);
}

glm::dmat4 Deformation::deformedToTangentFrame(const glm::dvec3& deformedPt) const {
    return translation(glm::dvec3(-deformedPt.x, -deformedPt.y, 0.0));
}

double Deformation::getLocalDist(const glm::dvec3& localPt, const Box3d& localBox) const {
    return std::max(std::abs(localPt.z - localBox.max.z),
                    std::max(std::min(std::abs(localPt.x - localBox.min.x), std::abs(localPt.x - localBox.max.x)),
                             std::min(std::abs(localPt.y - localBox.min.y), std::abs(localPt.y - localBox.max.y))));
}

FrustumVisibility Deformation::getVisibility(const TerrainFrameState& frame, const Box3d& localBox) const {
    // Local and deformed spaces coincide, so the box can be tested directly
    return PlanetLod::getVisibility(frame.deformedFrustumPlanes, localBox);
}

TerrainDeformParams Deformation::terrainParams(const TerrainFrameState& frame) const {
    TerrainDeformParams params;

    double d1 = frame.splitDist + 1.0;
    double d2 = 2.0 * frame.splitDist;
    params.blending = glm::dvec2(d1, d2 - d1);

    params.localToWorld = frame.localToWorld;
    params.localToScreen = frame.localToScreen;
    params.radius = radius();

    glm::dmat4 a = localToDeformedDifferential(frame.localCameraPos);
    glm::dmat4 b = deformedToTangentFrame(frame.worldCameraPos);
    glm::dmat4 ltot = b * frame.localToWorld * a;

    params.localToTangent = mat3FromRows(entry(ltot, 0, 0), entry(ltot, 0, 1), entry(ltot, 0, 3),
                                         entry(ltot, 1, 0), entry(ltot, 1, 1), entry(ltot, 1, 3),
                                         entry(ltot, 3, 0), entry(ltot, 3, 1), entry(ltot, 3, 3));
    return params;
}

QuadDeformParams Deformation::quadParams(const TerrainFrameState& frame, const TerrainDeformParams& terrain,
                                         const TerrainQuad& quad) const {
    QuadDeformParams params;

    double ox = quad.ox();
    double oy = quad.oy();
    double l = quad.length();
    const glm::dvec3& c = frame.localCameraPos;

    params.offset = glm::dvec4(ox, oy, l, static_cast<double>(quad.level()));
    params.camera = glm::dvec4((c.x - ox) / l, (c.y - oy) / l,
                               (c.z - frame.groundHeight) / (l * frame.distFactor), c.z);

    params.tileToTangent = terrain.localToTangent * mat3FromRows(l, 0.0, ox - c.x,
                                                                 0.0, l, oy - c.y,
                                                                 0.0, 0.0, 1.0);

    setScreenParams(frame, terrain, quad, params);
    return params;
}

void Deformation::setScreenParams(const TerrainFrameState& frame, const TerrainDeformParams& terrain,
                                  const TerrainQuad& quad, QuadDeformParams& params) const {
    (void)terrain;
    double ox = quad.ox();
    double oy = quad.oy();
    double l = quad.length();

    glm::dmat4 corners = mat4FromRows(ox, ox + l, ox, ox + l,
                                      oy, oy, oy + l, oy + l,
                                      0.0, 0.0, 0.0, 0.0,
                                      1.0, 1.0, 1.0, 1.0);
    params.screenQuadCorners = frame.localToScreen * corners;

    glm::dmat4 verticals = mat4FromRows(0.0, 0.0, 0.0, 0.0,
                                        0.0, 0.0, 0.0, 0.0,
                                        1.0, 1.0, 1.0, 1.0,
                                        0.0, 0.0, 0.0, 0.0);
    params.screenQuadVerticals = frame.localToScreen * verticals;
}

} // namespace PlanetLod
