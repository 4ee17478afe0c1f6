#include "SphericalDeformation.h"
#include "TerrainQuad.h"
#include "core/LodErrors.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace PlanetLod {

SphericalDeformation::SphericalDeformation(double radius) : radius_(radius) {
    if (!(radius > 0.0)) {
        raise<InvalidParameterError>("SphericalDeformation: radius must be positive");
    }
}

glm::dvec3 SphericalDeformation::localToDeformed(const glm::dvec3& localPt) const {
    glm::dvec3 p(localPt.x, localPt.y, radius_);
    return p * ((localPt.z + radius_) / glm::length(p));
}

glm::dmat4 SphericalDeformation::localToDeformedDifferential(const glm::dvec3& localPt, bool clamp) const {
    if (!isFinite(localPt)) {
        return glm::dmat4(1.0);
    }

    const double R = radius_;
    glm::dvec3 pt = localPt;
    if (clamp) {
        pt.x = pt.x - std::floor((pt.x + R) / (2.0 * R)) * 2.0 * R;
        pt.y = pt.y - std::floor((pt.y + R) / (2.0 * R)) * 2.0 * R;
    }

    double l = pt.x * pt.x + pt.y * pt.y + R * R;
    double c0 = 1.0 / std::sqrt(l);
    double c1 = c0 * R / l;

    return mat4FromRows((pt.y * pt.y + R * R) * c1, -pt.x * pt.y * c1, pt.x * c0, R * pt.x * c0,
                        -pt.x * pt.y * c1, (pt.x * pt.x + R * R) * c1, pt.y * c0, R * pt.y * c0,
                        -pt.x * R * c1, -pt.y * R * c1, R * c0, (R * R) * c0,
                        0.0, 0.0, 0.0, 1.0);
}

glm::dvec3 SphericalDeformation::deformedToLocal(const glm::dvec3& p) const {
    const double R = radius_;
    const double inf = std::numeric_limits<double>::infinity();
    double l = glm::length(p);

    // One branch per cube face, selected by the dominant axis
    if (p.z >= std::abs(p.x) && p.z >= std::abs(p.y)) {
        return glm::dvec3(p.x / p.z * R, p.y / p.z * R, l - R);
    }
    if (p.z <= -std::abs(p.x) && p.z <= -std::abs(p.y)) {
        return glm::dvec3(inf);
    }
    if (p.y >= std::abs(p.x) && p.y >= std::abs(p.z)) {
        return glm::dvec3(p.x / p.y * R, (2.0 - p.z / p.y) * R, l - R);
    }
    if (p.y <= -std::abs(p.x) && p.y <= -std::abs(p.z)) {
        return glm::dvec3(-p.x / p.y * R, (-2.0 - p.z / p.y) * R, l - R);
    }
    if (p.x >= std::abs(p.y) && p.x >= std::abs(p.z)) {
        return glm::dvec3((2.0 - p.z / p.x) * R, p.y / p.x * R, l - R);
    }
    if (p.x <= -std::abs(p.y) && p.x <= -std::abs(p.z)) {
        return glm::dvec3((-2.0 - p.z / p.x) * R, -p.y / p.x * R, l - R);
    }
    // Only reachable with NaN components
    return glm::dvec3(inf);
}

Box2d SphericalDeformation::deformedToLocalBounds(const glm::dvec3& deformedCenter, double deformedRadius) const {
    const double R = radius_;
    glm::dvec3 p = deformedToLocal(deformedCenter);
    double r = deformedRadius;

    if (std::isinf(p.x) || std::isinf(p.y)) {
        return Box2d();
    }

    // Intersect the cone through the sphere cap of radius r with the plane z = R
    double k = (1.0 - r * r / (2.0 * R * R)) * glm::length(glm::dvec3(p.x, p.y, R));
    double A = k * k - p.x * p.x;
    double B = k * k - p.y * p.y;
    double C = -2.0 * p.x * p.y;
    double D = -2.0 * R * R * p.x;
    double E = -2.0 * R * R * p.y;
    double F = R * R * (k * k - R * R);

    double a = C * C - 4.0 * A * B;
    double b = 2.0 * C * E - 4.0 * B * D;
    double c = E * E - 4.0 * B * F;
    double d = std::sqrt(b * b - 4.0 * a * c);
    double x1 = (-b - d) / (2.0 * a);
    double x2 = (-b + d) / (2.0 * a);

    b = 2.0 * C * D - 4.0 * A * E;
    c = D * D - 4.0 * A * F;
    d = std::sqrt(b * b - 4.0 * a * c);
    double y1 = (-b - d) / (2.0 * a);
    double y2 = (-b + d) / (2.0 * a);

    return Box2d(std::min(x1, x2), std::max(x1, x2), std::min(y1, y2), std::max(y1, y2));
}

glm::dmat4 SphericalDeformation::deformedToTangentFrame(const glm::dvec3& deformedPt) const {
    glm::dvec3 uz = glm::normalize(deformedPt);
    glm::dvec3 ux = glm::normalize(glm::cross(glm::dvec3(0.0, 1.0, 0.0), uz));
    glm::dvec3 uy = glm::cross(uz, ux);

    return mat4FromRows(ux.x, ux.y, ux.z, 0.0,
                        uy.x, uy.y, uy.z, 0.0,
                        uz.x, uz.y, uz.z, -radius_,
                        0.0, 0.0, 0.0, 1.0);
}

FrustumVisibility SphericalDeformation::getVisibility(const TerrainFrameState& frame, const Box3d& localBox) const {
    const double R = radius_;
    std::array<glm::dvec3, 4> deformedBox = {
        localToDeformed(glm::dvec3(localBox.min.x, localBox.min.y, localBox.min.z)),
        localToDeformed(glm::dvec3(localBox.max.x, localBox.min.y, localBox.min.z)),
        localToDeformed(glm::dvec3(localBox.max.x, localBox.max.y, localBox.min.z)),
        localToDeformed(glm::dvec3(localBox.min.x, localBox.max.y, localBox.min.z))
    };

    double a = (localBox.max.z + R) / (localBox.min.z + R);
    double dx = (localBox.max.x - localBox.min.x) / 2.0 * a;
    double dy = (localBox.max.y - localBox.min.y) / 2.0 * a;
    double dz = localBox.max.z + R;
    double f = std::sqrt(dx * dx + dy * dy + dz * dz) / (localBox.min.z + R);

    bool fully = true;
    for (int i = 0; i < 5; ++i) {
        FrustumVisibility v = classifyCorners(frame.deformedFrustumPlanes[i], deformedBox, f);
        if (v == FrustumVisibility::Invisible) {
            return FrustumVisibility::Invisible;
        }
        fully = fully && v == FrustumVisibility::Fully;
    }

    // Plane tangent to the horizon seen from the camera: the box is hidden
    // behind the planet when it lies entirely beyond it
    const glm::dvec3& c = frame.deformedCameraPos;
    double lSq = glm::dot(c, c);
    double rm = R + std::min(0.0, localBox.min.z);
    double rM = R + localBox.max.z;
    double rmSq = rm * rm;
    double rMSq = rM * rM;
    glm::dvec4 farPlane(c.x, c.y, c.z, std::sqrt((lSq - rmSq) * (rMSq - rmSq)) - rmSq);

    FrustumVisibility v5 = classifyCorners(farPlane, deformedBox, f);
    if (v5 == FrustumVisibility::Invisible) {
        return FrustumVisibility::Invisible;
    }
    fully = fully && v5 == FrustumVisibility::Fully;

    return fully ? FrustumVisibility::Fully : FrustumVisibility::Partially;
}

FrustumVisibility SphericalDeformation::classifyCorners(const glm::dvec4& clip, const std::array<glm::dvec3, 4>& b,
                                                        double f) {
    glm::dvec3 n(clip);
    double o = glm::dot(b[0], n);
    bool p = o + clip.w > 0.0;

    if ((o * f + clip.w > 0.0) != p) {
        return FrustumVisibility::Partially;
    }
    for (int i = 1; i < 4; ++i) {
        o = glm::dot(b[i], n);
        if ((o + clip.w > 0.0) != p || (o * f + clip.w > 0.0) != p) {
            return FrustumVisibility::Partially;
        }
    }
    return p ? FrustumVisibility::Fully : FrustumVisibility::Invisible;
}

void SphericalDeformation::setScreenParams(const TerrainFrameState& frame, const TerrainDeformParams& terrain,
                                           const TerrainQuad& quad, QuadDeformParams& params) const {
    const double R = radius_;
    double ox = quad.ox();
    double oy = quad.oy();
    double l = quad.length();

    glm::dvec3 p0(ox, oy, R);
    glm::dvec3 p1(ox + l, oy, R);
    glm::dvec3 p2(ox, oy + l, R);
    glm::dvec3 p3(ox + l, oy + l, R);
    glm::dvec3 pc = (p0 + p3) * 0.5;

    glm::dvec3 v0 = glm::normalize(p0);
    glm::dvec3 v1 = glm::normalize(p1);
    glm::dvec3 v2 = glm::normalize(p2);
    glm::dvec3 v3 = glm::normalize(p3);

    glm::dmat4 deformedCorners(glm::dvec4(v0 * R, 1.0), glm::dvec4(v1 * R, 1.0),
                               glm::dvec4(v2 * R, 1.0), glm::dvec4(v3 * R, 1.0));
    params.screenQuadCorners = frame.localToScreen * deformedCorners;

    glm::dmat4 deformedVerticals(glm::dvec4(v0, 0.0), glm::dvec4(v1, 0.0),
                                 glm::dvec4(v2, 0.0), glm::dvec4(v3, 0.0));
    params.screenQuadVerticals = frame.localToScreen * deformedVerticals;
    params.screenQuadCornerNorms = glm::dvec4(glm::length(p0), glm::length(p1), glm::length(p2), glm::length(p3));

    glm::dvec3 uz = glm::normalize(pc);
    glm::dvec3 ux = glm::normalize(glm::cross(glm::dvec3(0.0, 1.0, 0.0), uz));
    glm::dvec3 uy = glm::cross(uz, ux);

    glm::dmat3 tangentFrame(ux, uy, uz);
    params.tangentFrameToWorld = glm::dmat3(terrain.localToWorld) * tangentFrame;
}

} // namespace PlanetLod
