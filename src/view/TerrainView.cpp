#include "TerrainView.h"
#include "core/LodMath.h"
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace PlanetLod {

std::string ViewPosition::toString() const {
    char buffer[160];
    std::snprintf(buffer, sizeof(buffer), "x0=%.6f y0=%.6f theta=%.4f phi=%.4f distance=%.2f",
                  x0, y0, theta, phi, distance);
    return buffer;
}

TerrainView::TerrainView()
    : fovy_(glm::radians(60.0)) {
}

void TerrainView::setViewport(int width, int height) {
    viewportWidth_ = std::max(width, 1);
    viewportHeight_ = std::max(height, 1);
}

glm::dvec3 TerrainView::lookAtPos() const {
    return glm::dvec3(position_.x0, position_.y0, 0.0);
}

void TerrainView::constrain() {
    position_.theta = std::max(0.0001, std::min(glm::pi<double>(), position_.theta));
    position_.distance = std::max(0.1, position_.distance);
}

void TerrainView::updateView() {
    constrain();
    setWorldToCameraMatrix();
    setProjectionMatrix();
    cameraDir_ = safeNormalize(worldCameraPos_ - lookAtPos());
}

FrameView TerrainView::frameView() const {
    FrameView view;
    view.worldToCamera = worldToCamera_;
    view.cameraToScreen = cameraToScreen_;
    view.worldCameraPos = worldCameraPos_;
    view.groundHeight = groundHeight_;
    view.viewportWidth = static_cast<double>(viewportWidth_);
    return view;
}

glm::dmat4 TerrainView::cameraFrame(const glm::dvec3& cx, const glm::dvec3& cy, const glm::dvec3& cz,
                                    const glm::dvec3& worldPos) {
    glm::dmat4 view = mat4FromRows(cx.x, cx.y, cx.z, 0.0,
                                   cy.x, cy.y, cy.z, 0.0,
                                   cz.x, cz.y, cz.z, 0.0,
                                   0.0, 0.0, 0.0, 1.0);
    return view * translation(-worldPos);
}

void TerrainView::setWorldToCameraMatrix() {
    glm::dvec3 po(position_.x0, position_.y0, 0.0);
    glm::dvec3 px(1.0, 0.0, 0.0);
    glm::dvec3 py(0.0, 1.0, 0.0);
    glm::dvec3 pz(0.0, 0.0, 1.0);

    double ct = std::cos(position_.theta);
    double st = std::sin(position_.theta);
    double cp = std::cos(position_.phi);
    double sp = std::sin(position_.phi);

    glm::dvec3 cx = px * cp + py * sp;
    glm::dvec3 cy = -px * sp * ct + py * cp * ct + pz * st;
    glm::dvec3 cz = px * sp * st - py * cp * st + pz * ct;

    glm::dvec3 worldPos = po + cz * position_.distance;
    if (worldPos.z < groundHeight_ + 10.0) {
        worldPos.z = groundHeight_ + 10.0;
    }

    worldToCamera_ = cameraFrame(cx, cy, cz, worldPos);
    cameraToWorld_ = glm::inverse(worldToCamera_);
    worldCameraPos_ = worldPos;
}

void TerrainView::setProjectionMatrix() {
    double h = std::max(height() - groundHeight_, 1.0);
    double aspect = static_cast<double>(viewportWidth_) / static_cast<double>(viewportHeight_);
    cameraToScreen_ = glm::perspective(fovy_, aspect, 0.1 * h, 1e6 * h);
}

void TerrainView::moveForward(double distance) {
    position_.x0 -= std::sin(position_.phi) * distance;
    position_.y0 += std::cos(position_.phi) * distance;
}

void TerrainView::turn(double angle) {
    position_.phi += angle;
}

double TerrainView::interpolate(const ViewPosition& from, const ViewPosition& to, double t) {
    t = std::clamp(t, 0.0, 1.0);
    position_.x0 = from.x0 * (1.0 - t) + to.x0 * t;
    position_.y0 = from.y0 * (1.0 - t) + to.y0 * t;
    position_.theta = from.theta * (1.0 - t) + to.theta * t;
    position_.phi = from.phi * (1.0 - t) + to.phi * t;
    position_.distance = from.distance * (1.0 - t) + to.distance * t;
    return t;
}

void TerrainView::interpolateDirection(double slon, double slat, double elon, double elat, double t,
                                       double& lon, double& lat) {
    glm::dvec3 s(std::cos(slon) * std::cos(slat), std::sin(slon) * std::cos(slat), std::sin(slat));
    glm::dvec3 e(std::cos(elon) * std::cos(elat), std::sin(elon) * std::cos(elat), std::sin(elat));
    glm::dvec3 v = safeNormalize(s * (1.0 - t) + e * t);
    lat = safeAsin(v.z);
    lon = std::atan2(v.y, v.x);
}

} // namespace PlanetLod
