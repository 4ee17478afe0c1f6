#pragma once

#include "TerrainNode.h"
#include "TileSampler.h"
#include "WorldContext.h"
#include "core/LodErrors.h"
#include <algorithm>
#include <memory>
#include <vector>

namespace PlanetLod {

// Data of one sampler bound to a quad in the draw list
struct SamplerBinding {
    const ITileSampler* sampler = nullptr;
    TileMapping mapping;
};

// A quad ready to be drawn this frame, in near-to-far order per node
struct DrawableQuad {
    const TerrainNode* node = nullptr;
    int level = 0;
    int tx = 0;
    int ty = 0;
    double ox = 0.0;
    double oy = 0.0;
    double length = 0.0;
    FrustumVisibility visibility = FrustumVisibility::Partially;
    // Bit i set when child i was handled on its own (drawn or invisible).
    // 0 for leaves; for a parent drawn in place of children, the renderer
    // only needs the quarters whose bit is clear.
    int childMask = 0;
    QuadDeformParams deform;
    std::vector<SamplerBinding> tiles;
};

struct WorldFrameStats {
    int quads = 0;
    int maxDepth = 0;
    int drawnQuads = 0;
};

/**
 * Runs one frame of the terrain LOD pipeline over all terrain nodes:
 * quadtree update, then tile samplers in ascending priority, then the draw
 * list of quads whose leaf data is ready.
 *
 * The world owns its nodes and samplers. Producers and caches are owned by
 * the caller and must outlive the world.
 */
class TerrainWorld {
public:
    explicit TerrainWorld(const WorldContext& context);
    ~TerrainWorld();

    TerrainWorld(const TerrainWorld&) = delete;
    TerrainWorld& operator=(const TerrainWorld&) = delete;

    const WorldContext& context() const { return context_; }

    TerrainNode& addTerrainNode(const TerrainNodeConfig& config);

    // Attach a producer to a node of this world. Samplers with equal
    // priority keep their insertion order.
    template <typename... SlotTs>
    TileSampler<SlotTs...>& addSampler(TileProducer<SlotTs...>& producer, const TerrainNode& node,
                                       TileSamplerConfig config = {}) {
        if (!ownsNode(node)) {
            raise<InvalidParameterError>("TerrainWorld: sampler for " + producer.name() +
                                         " attached to a foreign terrain node");
        }
        auto sampler = std::make_unique<TileSampler<SlotTs...>>(producer, node, std::move(config));
        TileSampler<SlotTs...>& result = *sampler;
        samplers_.push_back(std::move(sampler));
        std::stable_sort(samplers_.begin(), samplers_.end(),
                         [](const std::unique_ptr<ITileSampler>& a, const std::unique_ptr<ITileSampler>& b) {
                             return a->priority() < b->priority();
                         });
        return result;
    }

    void update(const FrameView& view);

    const std::vector<DrawableQuad>& drawList() const { return drawList_; }
    const WorldFrameStats& stats() const { return stats_; }

    size_t nodeCount() const { return nodes_.size(); }
    TerrainNode& node(size_t i) { return *nodes_[i]; }
    const TerrainNode& node(size_t i) const { return *nodes_[i]; }

    // Samplers in update order
    std::vector<const ITileSampler*> samplers() const;

    // Samplers attached to a node, in update order
    std::vector<const ITileSampler*> samplersFor(const TerrainNode& node) const;

private:
    bool ownsNode(const TerrainNode& node) const;

    void findDrawableQuads(TerrainQuad& quad, const std::vector<const ITileSampler*>& samplers);
    void collectDrawList(const TerrainNode& node, const TerrainQuad& quad,
                         const std::vector<const ITileSampler*>& samplers);
    void emit(const TerrainNode& node, const TerrainQuad& quad, int childMask,
              const std::vector<const ITileSampler*>& samplers);

    const WorldContext& context_;
    // Declared before samplers_ so that samplers, which refer to nodes,
    // are destroyed first
    std::vector<std::unique_ptr<TerrainNode>> nodes_;
    std::vector<std::unique_ptr<ITileSampler>> samplers_;
    std::vector<DrawableQuad> drawList_;
    WorldFrameStats stats_;
};

} // namespace PlanetLod
