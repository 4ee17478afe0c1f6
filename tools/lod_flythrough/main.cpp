#include "config/LodConfig.h"
#include "core/LodErrors.h"
#include "terrain/ProceduralWorld.h"
#include "view/PlanetView.h"
#include "view/TerrainView.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <memory>
#include <string>

void printUsage(const char* programName) {
    SDL_Log("Terrain LOD flythrough");
    SDL_Log("Usage: %s [options]", programName);
    SDL_Log("");
    SDL_Log("Options:");
    SDL_Log("  --config <path>     JSON world description (default: built-in flat terrain)");
    SDL_Log("  --planet            Use a planet instead of a flat terrain when no config is given");
    SDL_Log("  --frames <n>        Number of frames to simulate (default: 120)");
    SDL_Log("  --speed <f>         Forward motion per frame, in units (default: 500)");
    SDL_Log("  --turn <f>          Heading change per frame, in radians (default: 0.01)");
    SDL_Log("  --altitude <f>      Camera distance to the look-at point (default: 2000)");
    SDL_Log("  --tilt <f>          Camera tilt from the vertical, in radians (default: 1.2)");
    SDL_Log("  --width <n>         Viewport width in pixels (default: 1024)");
    SDL_Log("  --height <n>        Viewport height in pixels (default: 768)");
    SDL_Log("  --verbose           Log per-frame draw lists");
    SDL_Log("  --help              Show this help message");
}

struct FlythroughOptions {
    std::string configPath;
    bool planet = false;
    int frames = 120;
    double speed = 500.0;
    double turn = 0.01;
    double altitude = 2000.0;
    double tilt = 1.2;
    int width = 1024;
    int height = 768;
    bool verbose = false;
};

bool parseArguments(int argc, char* argv[], FlythroughOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        else if (arg == "--config" && i + 1 < argc) {
            opts.configPath = argv[++i];
        }
        else if (arg == "--planet") {
            opts.planet = true;
        }
        else if (arg == "--frames" && i + 1 < argc) {
            opts.frames = std::stoi(argv[++i]);
        }
        else if (arg == "--speed" && i + 1 < argc) {
            opts.speed = std::stod(argv[++i]);
        }
        else if (arg == "--turn" && i + 1 < argc) {
            opts.turn = std::stod(argv[++i]);
        }
        else if (arg == "--altitude" && i + 1 < argc) {
            opts.altitude = std::stod(argv[++i]);
        }
        else if (arg == "--tilt" && i + 1 < argc) {
            opts.tilt = std::stod(argv[++i]);
        }
        else if (arg == "--width" && i + 1 < argc) {
            opts.width = std::stoi(argv[++i]);
        }
        else if (arg == "--height" && i + 1 < argc) {
            opts.height = std::stoi(argv[++i]);
        }
        else if (arg == "--verbose") {
            opts.verbose = true;
        }
        else {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown argument: %s", arg.c_str());
            return false;
        }
    }

    if (opts.frames <= 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "--frames must be positive");
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    FlythroughOptions opts;

    if (!parseArguments(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        PlanetLod::LodConfig config;
        if (!opts.configPath.empty()) {
            config = PlanetLod::LodConfig::loadFromJsonFile(opts.configPath);
        } else if (opts.planet) {
            config.world.deformed = true;
        }

        PlanetLod::ProceduralWorld world(config);

        std::unique_ptr<PlanetLod::TerrainView> view;
        if (config.world.deformed) {
            view = std::make_unique<PlanetLod::PlanetView>(config.world.radius);
        } else {
            view = std::make_unique<PlanetLod::TerrainView>();
        }
        view->setViewport(opts.width, opts.height);
        view->position().theta = opts.tilt;
        view->position().distance = opts.altitude;

        SDL_Log("=== Terrain LOD flythrough ===");
        SDL_Log("World:   %s", config.world.deformed ? "planet" : "flat terrain");
        SDL_Log("Faces:   %zu", world.faceCount());
        SDL_Log("Frames:  %d", opts.frames);

        size_t maxDrawn = 0;
        for (int frame = 0; frame < opts.frames; ++frame) {
            view->setGroundHeight(world.cameraGroundHeight());
            view->updateView();
            world.update(view->frameView());

            const PlanetLod::WorldFrameStats& stats = world.world().stats();
            maxDrawn = std::max(maxDrawn, world.world().drawList().size());

            SDL_Log("Frame %3d: %s ground %.1f | quads %d depth %d drawn %d | tiles elev %zu/%zu normals %zu/%zu ortho %zu/%zu",
                    frame, view->position().toString().c_str(), view->groundHeight(),
                    stats.quads, stats.maxDepth, stats.drawnQuads,
                    world.elevationCache().usedTilesCount(), world.elevationCache().unusedTilesCount(),
                    world.normalCache().usedTilesCount(), world.normalCache().unusedTilesCount(),
                    world.orthoCache().usedTilesCount(), world.orthoCache().unusedTilesCount());

            if (opts.verbose) {
                for (const PlanetLod::DrawableQuad& quad : world.world().drawList()) {
                    SDL_Log("  %s quad (%d,%d,%d) length %.1f, %zu tile binding(s)",
                            quad.node->name().c_str(), quad.level, quad.tx, quad.ty, quad.length,
                            quad.tiles.size());
                }
            }

            view->moveForward(opts.speed);
            view->turn(opts.turn);
        }

        SDL_Log("Done: at most %zu quads drawn, max used tiles elev %zu normals %zu ortho %zu",
                maxDrawn, world.elevationCache().maxUsedTiles(), world.normalCache().maxUsedTiles(),
                world.orthoCache().maxUsedTiles());
    } catch (const PlanetLod::LodError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Flythrough failed: %s", e.what());
        return 1;
    }

    return 0;
}
