#pragma once

#include "terrain/WorldContext.h"
#include <glm/glm.hpp>
#include <string>

namespace PlanetLod {

// Camera placement around a look-at point: (x0, y0) is the look-at point
// (longitude and latitude in radians for planets), theta the tilt from the
// vertical, phi the heading and distance the distance to the look-at point.
struct ViewPosition {
    double x0 = 0.0;
    double y0 = 0.0;
    double theta = 0.0;
    double phi = 0.0;
    double distance = 0.0;

    std::string toString() const;
};

/**
 * Double precision camera over a flat terrain.
 *
 * updateView() clamps the position, keeps the camera at least 10 units
 * above the ground and computes the view and projection matrices that
 * frameView() hands to the terrain nodes.
 */
class TerrainView {
public:
    TerrainView();
    virtual ~TerrainView() = default;

    ViewPosition& position() { return position_; }
    const ViewPosition& position() const { return position_; }
    void setPosition(const ViewPosition& position) { position_ = position; }

    double groundHeight() const { return groundHeight_; }
    void setGroundHeight(double height) { groundHeight_ = height; }

    // Vertical field of view in radians
    void setFieldOfView(double fovy) { fovy_ = fovy; }
    double fieldOfView() const { return fovy_; }

    void setViewport(int width, int height);
    int viewportWidth() const { return viewportWidth_; }
    int viewportHeight() const { return viewportHeight_; }

    // Camera altitude above the zero level
    virtual double height() const { return worldCameraPos_.z; }
    virtual glm::dvec3 lookAtPos() const;

    virtual void constrain();

    void updateView();

    FrameView frameView() const;

    const glm::dmat4& worldToCamera() const { return worldToCamera_; }
    const glm::dmat4& cameraToWorld() const { return cameraToWorld_; }
    const glm::dmat4& cameraToScreen() const { return cameraToScreen_; }
    const glm::dvec3& worldCameraPos() const { return worldCameraPos_; }
    const glm::dvec3& cameraDir() const { return cameraDir_; }

    virtual void moveForward(double distance);
    virtual void turn(double angle);

    // Move part of the way from one position to another. Returns the
    // interpolation parameter actually used, 1 once the target is reached.
    virtual double interpolate(const ViewPosition& from, const ViewPosition& to, double t);

protected:
    virtual void setWorldToCameraMatrix();
    void setProjectionMatrix();

    // World to camera transform of a camera at worldPos with axes cx, cy, cz
    static glm::dmat4 cameraFrame(const glm::dvec3& cx, const glm::dvec3& cy, const glm::dvec3& cz,
                                  const glm::dvec3& worldPos);

    // Interpolate two directions given as (longitude, latitude) angles
    static void interpolateDirection(double slon, double slat, double elon, double elat, double t,
                                     double& lon, double& lat);

    ViewPosition position_;
    double groundHeight_ = 0.0;
    double fovy_;
    int viewportWidth_ = 1024;
    int viewportHeight_ = 768;

    glm::dmat4 worldToCamera_{1.0};
    glm::dmat4 cameraToWorld_{1.0};
    glm::dmat4 cameraToScreen_{1.0};
    glm::dvec3 worldCameraPos_{0.0};
    glm::dvec3 cameraDir_{0.0};
};

} // namespace PlanetLod
