#pragma once

// Double precision geometry helpers shared by the quadtree and deformations.
// Planet radii are ~6e6 m while quads at the deepest level are a few meters
// wide, so everything on the CPU side stays in double.

#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace PlanetLod {

// Axis aligned box in the plane. Default constructed boxes are empty.
struct Box2d {
    glm::dvec2 min{std::numeric_limits<double>::infinity()};
    glm::dvec2 max{-std::numeric_limits<double>::infinity()};

    Box2d() = default;
    Box2d(double xmin, double xmax, double ymin, double ymax)
        : min(xmin, ymin), max(xmax, ymax) {}
    Box2d(const glm::dvec2& a, const glm::dvec2& b) : min(a), max(b) {}

    bool isEmpty() const { return min.x > max.x || min.y > max.y; }
    glm::dvec2 center() const { return (min + max) * 0.5; }
    glm::dvec2 extent() const { return max - min; }

    bool contains(const glm::dvec2& p) const {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }
};

// Axis aligned box in local terrain space (x, y horizontal, z up)
struct Box3d {
    glm::dvec3 min{std::numeric_limits<double>::infinity()};
    glm::dvec3 max{-std::numeric_limits<double>::infinity()};

    Box3d() = default;
    Box3d(double xmin, double xmax, double ymin, double ymax, double zmin, double zmax)
        : min(xmin, ymin, zmin), max(xmax, ymax, zmax) {}

    bool isEmpty() const { return min.x > max.x || min.y > max.y || min.z > max.z; }
    glm::dvec3 center() const { return (min + max) * 0.5; }

    void enlarge(const glm::dvec3& p) {
        min = glm::min(min, p);
        max = glm::max(max, p);
    }
};

// GLM stores matrices column-major and indexes them m[col][row].
// These helpers let the geometry code be written with row-major literals.
inline glm::dmat4 mat4FromRows(double m00, double m01, double m02, double m03,
                               double m10, double m11, double m12, double m13,
                               double m20, double m21, double m22, double m23,
                               double m30, double m31, double m32, double m33) {
    return glm::transpose(glm::dmat4(m00, m01, m02, m03,
                                     m10, m11, m12, m13,
                                     m20, m21, m22, m23,
                                     m30, m31, m32, m33));
}

inline glm::dmat3 mat3FromRows(double m00, double m01, double m02,
                               double m10, double m11, double m12,
                               double m20, double m21, double m22) {
    return glm::transpose(glm::dmat3(m00, m01, m02,
                                     m10, m11, m12,
                                     m20, m21, m22));
}

inline glm::dmat2 mat2FromRows(double m00, double m01, double m10, double m11) {
    return glm::transpose(glm::dmat2(m00, m01, m10, m11));
}

// Row/column access into a GLM matrix
inline double entry(const glm::dmat4& m, int row, int col) {
    return m[col][row];
}

inline glm::dmat4 translation(const glm::dvec3& t) {
    glm::dmat4 m(1.0);
    m[3] = glm::dvec4(t, 1.0);
    return m;
}

// Homogeneous transform of a point (w = 1) with perspective divide skipped
inline glm::dvec3 transformPoint(const glm::dmat4& m, const glm::dvec3& p) {
    return glm::dvec3(m * glm::dvec4(p, 1.0));
}

inline bool isFinite(double v) {
    return std::isfinite(v);
}

inline bool isFinite(const glm::dvec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

inline double safeAcos(double v) {
    return std::acos(std::clamp(v, -1.0, 1.0));
}

inline double safeAsin(double v) {
    return std::asin(std::clamp(v, -1.0, 1.0));
}

inline glm::dvec3 safeNormalize(const glm::dvec3& v) {
    double len = glm::length(v);
    return len > 0.0 ? v / len : v;
}

} // namespace PlanetLod
