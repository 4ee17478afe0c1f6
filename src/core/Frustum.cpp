#include "Frustum.h"

namespace PlanetLod {

FrustumPlanes extractFrustumPlanes(const glm::dmat4& toScreen) {
    // GLM is column-major, so transpose to get row access
    glm::dmat4 m = glm::transpose(toScreen);

    FrustumPlanes planes;
    // Left plane: row3 + row0
    planes[0] = m[3] + m[0];
    // Right plane: row3 - row0
    planes[1] = m[3] - m[0];
    // Bottom plane: row3 + row1
    planes[2] = m[3] + m[1];
    // Top plane: row3 - row1
    planes[3] = m[3] - m[1];
    // Near plane: row3 + row2
    planes[4] = m[3] + m[2];
    // Far plane: row3 - row2
    planes[5] = m[3] - m[2];

    for (auto& plane : planes) {
        double len = glm::length(glm::dvec3(plane));
        if (len > 0.0) {
            plane /= len;
        }
    }
    return planes;
}

FrustumVisibility getVisibility(const glm::dvec4& plane, const Box3d& box) {
    double x0 = box.min.x * plane.x;
    double x1 = box.max.x * plane.x;
    double y0 = box.min.y * plane.y;
    double y1 = box.max.y * plane.y;
    double z0 = box.min.z * plane.z + plane.w;
    double z1 = box.max.z * plane.z + plane.w;

    const double corners[8] = {
        x0 + y0 + z0, x1 + y0 + z0, x1 + y1 + z0, x0 + y1 + z0,
        x0 + y0 + z1, x1 + y0 + z1, x1 + y1 + z1, x0 + y1 + z1
    };

    bool allOutside = true;
    bool allInside = true;
    for (double d : corners) {
        if (d > 0.0) {
            allOutside = false;
        } else {
            allInside = false;
        }
    }

    if (allOutside) return FrustumVisibility::Invisible;
    if (allInside) return FrustumVisibility::Fully;
    return FrustumVisibility::Partially;
}

FrustumVisibility getVisibility(const FrustumPlanes& planes, const Box3d& box) {
    bool fully = true;
    for (int i = 0; i < 5; ++i) {
        FrustumVisibility v = getVisibility(planes[i], box);
        if (v == FrustumVisibility::Invisible) {
            return FrustumVisibility::Invisible;
        }
        fully = fully && v == FrustumVisibility::Fully;
    }
    return fully ? FrustumVisibility::Fully : FrustumVisibility::Partially;
}

} // namespace PlanetLod
