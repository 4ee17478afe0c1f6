#pragma once

#include "LodMath.h"
#include <glm/glm.hpp>
#include <array>

namespace PlanetLod {

// Classification of a bounding volume against a frustum.
// Values match the bit layout used when combining per-plane verdicts.
enum class FrustumVisibility {
    Fully = 0,
    Partially = 1,
    Invisible = 3
};

// Planes in left, right, bottom, top, near, far order.
// A point p is inside a plane when dot(plane.xyz, p) + plane.w > 0.
using FrustumPlanes = std::array<glm::dvec4, 6>;

// Gribb/Hartmann plane extraction from a (local or world) to screen matrix
FrustumPlanes extractFrustumPlanes(const glm::dmat4& toScreen);

// Test of a box against planes 0-4. The far plane is ignored so that
// distant terrain is never culled by the projection's far distance.
FrustumVisibility getVisibility(const FrustumPlanes& planes, const Box3d& box);

// Test of the eight box corners against a single plane
FrustumVisibility getVisibility(const glm::dvec4& plane, const Box3d& box);

} // namespace PlanetLod
