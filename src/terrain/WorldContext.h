#pragma once

#include <glm/glm.hpp>

namespace PlanetLod {

// Settings shared by every terrain node and producer of one world.
// Built first and passed by reference to everything that needs it.
struct WorldContext {
    // Planet radius, used when the world is deformed into a sphere
    double radius = 6360000.0;
    bool deformed = false;
    // Vertices per side of the grid mesh drawn for each quad
    int gridResolution = 25;
};

// Viewpoint consumed once per frame by the terrain nodes
struct FrameView {
    glm::dmat4 worldToCamera{1.0};
    glm::dmat4 cameraToScreen{1.0};
    glm::dvec3 worldCameraPos{0.0};
    // Terrain height under the camera
    double groundHeight = 0.0;
    // Viewport width in pixels, scales the split distance
    double viewportWidth = 1024.0;
};

} // namespace PlanetLod
