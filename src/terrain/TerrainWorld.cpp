#include "TerrainWorld.h"
#include <SDL3/SDL_log.h>

namespace PlanetLod {

namespace {

// True when every leaf-storing producer that has data for the quad has it ready
bool hasReadyTiles(const TerrainQuad& quad, const std::vector<const ITileSampler*>& samplers) {
    for (const ITileSampler* sampler : samplers) {
        if (!sampler->storeLeaf()) continue;
        const ProducerBase& producer = sampler->producer();
        if (producer.hasTile(quad.level(), quad.tx(), quad.ty()) &&
            !producer.isTileReady(quad.level(), quad.tx(), quad.ty())) {
            return false;
        }
    }
    return true;
}

} // namespace

TerrainWorld::TerrainWorld(const WorldContext& context)
    : context_(context) {
    if (context_.gridResolution < 2) {
        raise<InvalidParameterError>("TerrainWorld: grid resolution must be at least 2");
    }
    if (context_.deformed && !(context_.radius > 0.0)) {
        raise<InvalidParameterError>("TerrainWorld: planet radius must be positive");
    }
}

TerrainWorld::~TerrainWorld() {
    // Samplers hand their tiles back before the nodes go away
    samplers_.clear();
    nodes_.clear();
}

TerrainNode& TerrainWorld::addTerrainNode(const TerrainNodeConfig& config) {
    nodes_.push_back(std::make_unique<TerrainNode>(context_, config));
    return *nodes_.back();
}

bool TerrainWorld::ownsNode(const TerrainNode& node) const {
    return std::any_of(nodes_.begin(), nodes_.end(),
                       [&](const std::unique_ptr<TerrainNode>& n) { return n.get() == &node; });
}

std::vector<const ITileSampler*> TerrainWorld::samplers() const {
    std::vector<const ITileSampler*> result;
    result.reserve(samplers_.size());
    for (const auto& sampler : samplers_) {
        result.push_back(sampler.get());
    }
    return result;
}

std::vector<const ITileSampler*> TerrainWorld::samplersFor(const TerrainNode& node) const {
    std::vector<const ITileSampler*> result;
    for (const auto& sampler : samplers_) {
        if (&sampler->node() == &node) {
            result.push_back(sampler.get());
        }
    }
    return result;
}

void TerrainWorld::update(const FrameView& view) {
    for (auto& node : nodes_) {
        node->update(view);
    }

    for (auto& sampler : samplers_) {
        sampler->update();
    }

    drawList_.clear();
    stats_ = WorldFrameStats{};
    for (auto& node : nodes_) {
        std::vector<const ITileSampler*> samplers = samplersFor(*node);
        findDrawableQuads(node->root(), samplers);
        collectDrawList(*node, node->root(), samplers);

        stats_.quads += node->root().size();
        stats_.maxDepth = std::max(stats_.maxDepth, node->root().depth());
    }
    stats_.drawnQuads = static_cast<int>(drawList_.size());

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "TerrainWorld: %d quads, depth %d, %d drawn",
                 stats_.quads, stats_.maxDepth, stats_.drawnQuads);
}

void TerrainWorld::findDrawableQuads(TerrainQuad& quad, const std::vector<const ITileSampler*>& samplers) {
    quad.setDrawable(false);

    // Invisible quads never block their parent from being drawn
    if (!quad.isVisible()) {
        quad.setDrawable(true);
        return;
    }

    if (quad.isLeaf()) {
        quad.setDrawable(hasReadyTiles(quad, samplers));
        return;
    }

    int drawableChildren = 0;
    for (int i = 0; i < 4; ++i) {
        TerrainQuad* child = quad.child(i);
        findDrawableQuads(*child, samplers);
        if (child->isDrawable()) {
            ++drawableChildren;
        }
    }

    // A parent standing in for undrawable children needs its own data
    if (drawableChildren < 4) {
        quad.setDrawable(hasReadyTiles(quad, samplers));
    } else {
        quad.setDrawable(true);
    }
}

void TerrainWorld::collectDrawList(const TerrainNode& node, const TerrainQuad& quad,
                                   const std::vector<const ITileSampler*>& samplers) {
    if (!quad.isVisible() || !quad.isDrawable()) {
        return;
    }

    if (quad.isLeaf()) {
        emit(node, quad, 0, samplers);
        return;
    }

    const glm::dvec3& camera = node.localCameraPos();
    std::array<int, 4> order = nearToFarOrder(camera.x, camera.y,
                                              quad.ox() + quad.length() / 2.0,
                                              quad.oy() + quad.length() / 2.0);
    int done = 0;
    for (int i : order) {
        const TerrainQuad* child = quad.child(i);
        if (!child->isVisible()) {
            done |= 1 << i;
        } else if (child->isDrawable()) {
            collectDrawList(node, *child, samplers);
            done |= 1 << i;
        }
    }

    if (done < 15) {
        emit(node, quad, done, samplers);
    }
}

void TerrainWorld::emit(const TerrainNode& node, const TerrainQuad& quad, int childMask,
                        const std::vector<const ITileSampler*>& samplers) {
    DrawableQuad drawable;
    drawable.node = &node;
    drawable.level = quad.level();
    drawable.tx = quad.tx();
    drawable.ty = quad.ty();
    drawable.ox = quad.ox();
    drawable.oy = quad.oy();
    drawable.length = quad.length();
    drawable.visibility = quad.visibility();
    drawable.childMask = childMask;
    drawable.deform = node.quadParams(quad);

    for (const ITileSampler* sampler : samplers) {
        std::optional<TileMapping> mapping = sampler->tileMapping(quad.level(), quad.tx(), quad.ty());
        if (mapping) {
            drawable.tiles.push_back({sampler, *mapping});
        }
    }
    drawList_.push_back(std::move(drawable));
}

} // namespace PlanetLod
