#pragma once

#include "TerrainView.h"

namespace PlanetLod {

/**
 * Camera around a spherical planet centered at the origin.
 * The look-at point is given by x0 = longitude and y0 = latitude in
 * radians; the camera never gets closer than 10 units above the ground.
 */
class PlanetView : public TerrainView {
public:
    explicit PlanetView(double radius);

    double radius() const { return radius_; }

    double height() const override;
    glm::dvec3 lookAtPos() const override;
    void constrain() override;

    void moveForward(double distance) override;

    // Great circle interpolation with a rise in altitude in the middle of
    // long trips. t advances by at least 5000 units along the ground per call.
    double interpolate(const ViewPosition& from, const ViewPosition& to, double t) override;

protected:
    void setWorldToCameraMatrix() override;

private:
    double radius_;
};

} // namespace PlanetLod
