#include "TerrainNode.h"
#include "SphericalDeformation.h"
#include "core/LodErrors.h"
#include <SDL3/SDL_log.h>
#include <glm/gtc/quaternion.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace PlanetLod {

TerrainNode::TerrainNode(const WorldContext& world, const TerrainNodeConfig& config)
    : world_(world)
    , config_(config) {
    if (config_.maxLevel < 0) {
        raise<InvalidParameterError>("TerrainNode: maxLevel must not be negative for " + config_.name);
    }
    if (!(config_.splitFactor > 1.0)) {
        raise<InvalidParameterError>("TerrainNode: splitFactor must be greater than 1 for " + config_.name);
    }
    if (config_.zmin > config_.zmax) {
        raise<InvalidParameterError>("TerrainNode: zmin is above zmax for " + config_.name);
    }
    if (config_.face < 0 || config_.face > 6) {
        raise<InvalidParameterError>("TerrainNode: face must be in 0-6 for " + config_.name);
    }

    if (world_.deformed) {
        config_.size = world_.radius;
        deform_ = std::make_unique<SphericalDeformation>(world_.radius);
    } else {
        if (!(config_.size > 0.0)) {
            raise<InvalidParameterError>("TerrainNode: size must be positive for " + config_.name);
        }
        deform_ = std::make_unique<Deformation>();
    }

    faceToLocal_ = calculateFaceToLocal(config_.face);
    root_ = std::make_unique<TerrainQuad>(*this, nullptr, 0, 0, -config_.size, -config_.size,
                                          2.0 * config_.size, config_.zmin, config_.zmax);
    horizon_.fill(-std::numeric_limits<float>::infinity());

    SDL_Log("TerrainNode: %s created (face %d, size %.1f, max level %d%s)",
            config_.name.c_str(), config_.face, config_.size, config_.maxLevel,
            world_.deformed ? ", spherical" : "");
}

glm::dmat4 TerrainNode::calculateFaceToLocal(int face) {
    // Euler angles in degrees (x, y, z) for faces 1-6
    static const glm::dvec3 faceAngles[6] = {
        {0.0, 0.0, 0.0},
        {90.0, 0.0, 0.0},
        {90.0, 90.0, 0.0},
        {90.0, 180.0, 0.0},
        {90.0, 270.0, 0.0},
        {0.0, 180.0, 180.0}
    };

    if (face < 1 || face > 6) {
        return glm::dmat4(1.0);
    }

    glm::dvec3 a = glm::radians(faceAngles[face - 1]);
    glm::dquat qx = glm::angleAxis(a.x, glm::dvec3(1.0, 0.0, 0.0));
    glm::dquat qy = glm::angleAxis(a.y, glm::dvec3(0.0, 1.0, 0.0));
    glm::dquat qz = glm::angleAxis(a.z, glm::dvec3(0.0, 0.0, 1.0));
    return glm::mat4_cast(qz * qy * qx);
}

void TerrainNode::update(const FrameView& view) {
    frame_.localToWorld = faceToLocal_;
    frame_.localToCamera = view.worldToCamera * frame_.localToWorld;
    frame_.localToScreen = view.cameraToScreen * frame_.localToCamera;
    frame_.worldCameraPos = view.worldCameraPos;
    frame_.groundHeight = view.groundHeight;

    glm::dmat4 invLocalToCamera = glm::inverse(frame_.localToCamera);
    frame_.deformedCameraPos = transformPoint(invLocalToCamera, glm::dvec3(0.0));
    frame_.deformedFrustumPlanes = extractFrustumPlanes(frame_.localToScreen);
    frame_.localCameraPos = deform_->deformedToLocal(frame_.deformedCameraPos);

    glm::dmat4 m = deform_->localToDeformedDifferential(frame_.localCameraPos, true);
    frame_.distFactor = std::max(glm::length(glm::dvec3(m[0])), glm::length(glm::dvec3(m[1])));

    glm::dvec3 left = glm::normalize(glm::dvec3(frame_.deformedFrustumPlanes[0]));
    glm::dvec3 right = glm::normalize(glm::dvec3(frame_.deformedFrustumPlanes[1]));
    double fov = safeAcos(-glm::dot(left, right));
    frame_.splitDist = config_.splitFactor * view.viewportWidth / 1024.0 *
                       std::tan(glm::radians(40.0)) / std::tan(fov / 2.0);
    if (frame_.splitDist < 1.1 || !isFinite(frame_.splitDist)) {
        frame_.splitDist = 1.1;
    }

    deformParams_ = deform_->terrainParams(frame_);

    if (horizonActive()) {
        glm::dvec3 deformedDir = transformPoint(invLocalToCamera, glm::dvec3(0.0, 0.0, 1.0));
        glm::dvec2 localDir = glm::dvec2(deform_->deformedToLocal(deformedDir) - frame_.localCameraPos);
        double len = glm::length(localDir);
        localDir = len > 0.0 ? localDir / len : glm::dvec2(0.0, 1.0);
        localCameraDir_ = mat2FromRows(localDir.y, -localDir.x, -localDir.x, -localDir.y);
        horizon_.fill(-std::numeric_limits<float>::infinity());
    }

    root_->update();
}

QuadDeformParams TerrainNode::quadParams(const TerrainQuad& quad) const {
    return deform_->quadParams(frame_, deformParams_, quad);
}

FrustumVisibility TerrainNode::getVisibility(const Box3d& localBox) const {
    return deform_->getVisibility(frame_, localBox);
}

bool TerrainNode::horizonActive() const {
    return config_.horizonCulling && frame_.localCameraPos.z <= root_->zmax();
}

bool TerrainNode::isOccluded(const Box3d& box) const {
    if (!horizonActive()) {
        return false;
    }

    const glm::dvec3& cam = frame_.localCameraPos;
    glm::dvec2 corners[4] = {
        localCameraDir_ * (glm::dvec2(box.min.x, box.min.y) - glm::dvec2(cam)),
        localCameraDir_ * (glm::dvec2(box.max.x, box.min.y) - glm::dvec2(cam)),
        localCameraDir_ * (glm::dvec2(box.min.x, box.max.y) - glm::dvec2(cam)),
        localCameraDir_ * (glm::dvec2(box.max.x, box.max.y) - glm::dvec2(cam))
    };
    // Boxes reaching behind the camera are never occluded
    for (const glm::dvec2& c : corners) {
        if (c.y <= 0.0) {
            return false;
        }
    }

    double dz = box.max.z - cam.z;
    double xmin = std::numeric_limits<double>::infinity();
    double xmax = -std::numeric_limits<double>::infinity();
    double zmax = -std::numeric_limits<double>::infinity();
    for (const glm::dvec2& c : corners) {
        double x = c.x / c.y * 0.33 + 0.5;
        xmin = std::min(xmin, x);
        xmax = std::max(xmax, x);
        zmax = std::max(zmax, dz / c.y);
    }

    int imin = std::max(static_cast<int>(std::floor(std::clamp(xmin * HORIZON_SIZE, -1.0, double(HORIZON_SIZE)))), 0);
    int imax = std::min(static_cast<int>(std::ceil(std::clamp(xmax * HORIZON_SIZE, -1.0, double(HORIZON_SIZE)))),
                        HORIZON_SIZE - 1);
    for (int i = imin; i <= imax; ++i) {
        if (zmax > horizon_[i]) {
            return false;
        }
    }
    return imax >= imin;
}

bool TerrainNode::addOccluder(const Box3d& occluder) {
    if (!horizonActive()) {
        return false;
    }

    const glm::dvec3& cam = frame_.localCameraPos;
    glm::dvec2 corners[4] = {
        localCameraDir_ * (glm::dvec2(occluder.min.x, occluder.min.y) - glm::dvec2(cam)),
        localCameraDir_ * (glm::dvec2(occluder.max.x, occluder.min.y) - glm::dvec2(cam)),
        localCameraDir_ * (glm::dvec2(occluder.min.x, occluder.max.y) - glm::dvec2(cam)),
        localCameraDir_ * (glm::dvec2(occluder.max.x, occluder.max.y) - glm::dvec2(cam))
    };
    for (const glm::dvec2& c : corners) {
        if (c.y <= 0.0) {
            return false;
        }
    }

    double dzmin = occluder.min.z - cam.z;
    double dzmax = occluder.max.z - cam.z;
    double xmin = std::numeric_limits<double>::infinity();
    double xmax = -std::numeric_limits<double>::infinity();
    double zmin = std::numeric_limits<double>::infinity();
    double zmax = -std::numeric_limits<double>::infinity();
    for (const glm::dvec2& c : corners) {
        double x = c.x / c.y * 0.33 + 0.5;
        xmin = std::min(xmin, x);
        xmax = std::max(xmax, x);
        zmin = std::min(zmin, dzmin / c.y);
        zmax = std::max(zmax, dzmax / c.y);
    }

    int imin = std::max(static_cast<int>(std::floor(std::clamp(xmin * HORIZON_SIZE, -1.0, double(HORIZON_SIZE)))), 0);
    int imax = std::min(static_cast<int>(std::ceil(std::clamp(xmax * HORIZON_SIZE, -1.0, double(HORIZON_SIZE)))),
                        HORIZON_SIZE - 1);
    bool occluded = imax >= imin;
    for (int i = imin; i <= imax; ++i) {
        if (zmax > horizon_[i]) {
            occluded = false;
            break;
        }
    }

    if (!occluded) {
        // Only bins fully covered by the box raise the horizon
        imin = std::max(static_cast<int>(std::ceil(std::clamp(xmin * HORIZON_SIZE, -1.0, double(HORIZON_SIZE)))), 0);
        imax = std::min(static_cast<int>(std::floor(std::clamp(xmax * HORIZON_SIZE, -1.0, double(HORIZON_SIZE)))),
                        HORIZON_SIZE - 1);
        for (int i = imin; i <= imax; ++i) {
            horizon_[i] = std::max(horizon_[i], static_cast<float>(zmin));
        }
    }
    return occluded;
}

double TerrainNode::getCameraDist(const Box3d& localBox) const {
    const glm::dvec3& c = frame_.localCameraPos;
    return std::max(std::abs(c.z - localBox.max.z) / frame_.distFactor,
                    std::max(std::min(std::abs(c.x - localBox.min.x), std::abs(c.x - localBox.max.x)),
                             std::min(std::abs(c.y - localBox.min.y), std::abs(c.y - localBox.max.y))));
}

} // namespace PlanetLod
