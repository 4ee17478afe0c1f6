#include "PlanetView.h"
#include "core/LodErrors.h"
#include "core/LodMath.h"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace PlanetLod {

PlanetView::PlanetView(double radius) : radius_(radius) {
    if (!(radius > 0.0)) {
        raise<InvalidParameterError>("PlanetView: radius must be positive");
    }
}

double PlanetView::height() const {
    return glm::length(worldCameraPos_) - radius_;
}

glm::dvec3 PlanetView::lookAtPos() const {
    double co = std::cos(position_.x0);
    double so = std::sin(position_.x0);
    double ca = std::cos(position_.y0);
    double sa = std::sin(position_.y0);
    return glm::dvec3(co * ca, so * ca, sa) * radius_;
}

void PlanetView::constrain() {
    const double halfPi = glm::half_pi<double>();
    position_.y0 = std::max(-halfPi, std::min(halfPi, position_.y0));
    position_.theta = std::max(0.1, std::min(glm::pi<double>(), position_.theta));
    position_.distance = std::max(0.1, position_.distance);
}

void PlanetView::setWorldToCameraMatrix() {
    double co = std::cos(position_.x0);
    double so = std::sin(position_.x0);
    double ca = std::cos(position_.y0);
    double sa = std::sin(position_.y0);

    glm::dvec3 po = glm::dvec3(co * ca, so * ca, sa) * radius_;
    glm::dvec3 px(-so, co, 0.0);
    glm::dvec3 py(-co * sa, -so * sa, ca);
    glm::dvec3 pz(co * ca, so * ca, sa);

    double ct = std::cos(position_.theta);
    double st = std::sin(position_.theta);
    double cp = std::cos(position_.phi);
    double sp = std::sin(position_.phi);

    glm::dvec3 cx = px * cp + py * sp;
    glm::dvec3 cy = -px * sp * ct + py * cp * ct + pz * st;
    glm::dvec3 cz = px * sp * st - py * cp * st + pz * ct;

    glm::dvec3 worldPos = po + cz * position_.distance;
    double minRadius = radius_ + 10.0 + groundHeight_;
    double l = glm::length(worldPos);
    if (l < minRadius) {
        worldPos *= minRadius / l;
    }

    worldToCamera_ = cameraFrame(cx, cy, cz, worldPos);
    cameraToWorld_ = glm::inverse(worldToCamera_);
    worldCameraPos_ = worldPos;
}

void PlanetView::moveForward(double distance) {
    double co = std::cos(position_.x0);
    double so = std::sin(position_.x0);
    double ca = std::cos(position_.y0);
    double sa = std::sin(position_.y0);

    glm::dvec3 po = glm::dvec3(co * ca, so * ca, sa) * radius_;
    glm::dvec3 px(-so, co, 0.0);
    glm::dvec3 py(-co * sa, -so * sa, ca);
    glm::dvec3 pd = safeNormalize(po - px * std::sin(position_.phi) * distance +
                                  py * std::cos(position_.phi) * distance);

    position_.x0 = std::atan2(pd.y, pd.x);
    position_.y0 = safeAsin(pd.z);
}

double PlanetView::interpolate(const ViewPosition& from, const ViewPosition& to, double t) {
    glm::dvec3 s(std::cos(from.x0) * std::cos(from.y0), std::sin(from.x0) * std::cos(from.y0), std::sin(from.y0));
    glm::dvec3 e(std::cos(to.x0) * std::cos(to.y0), std::sin(to.x0) * std::cos(to.y0), std::sin(to.y0));
    double dist = std::max(safeAcos(glm::dot(s, e)) * radius_, 1e-3);

    t = std::min(t + std::min(0.1, 5000.0 / dist), 1.0);
    double T = 0.5 * std::atan(4.0 * (t - 0.5)) / std::atan(4.0 * 0.5) + 0.5;

    interpolateDirection(from.x0, from.y0, to.x0, to.y0, T, position_.x0, position_.y0);
    interpolateDirection(from.phi, from.theta, to.phi, to.theta, T, position_.phi, position_.theta);

    const double W = 10.0;
    position_.distance = from.distance * (1.0 - t) + to.distance * t +
                         dist * (std::exp(-W * (t - 0.5) * (t - 0.5)) - std::exp(-W * 0.25));
    return t;
}

} // namespace PlanetLod
