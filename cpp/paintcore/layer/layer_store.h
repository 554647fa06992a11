#pragma once

#include "paintcore/core/types.h"
#include "paintcore/stroke/stroke.h"

#include <cstdint>
#include <string>
#include <vector>

enum class LayerPropMask : std::uint32_t {
    Name = 1 << 0,
    Visible = 1 << 1,
    Locked = 1 << 2,
    Opacity = 1 << 3,
    BlendMode = 1 << 4,
};

inline std::uint32_t operator|(LayerPropMask a, LayerPropMask b) {
    return static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b);
}

inline std::uint32_t operator|(std::uint32_t a, LayerPropMask b) {
    return a | static_cast<std::uint32_t>(b);
}

inline bool hasProp(std::uint32_t mask, LayerPropMask bit) {
    return (mask & static_cast<std::uint32_t>(bit)) != 0;
}

// Partial property update; only fields named in mask are applied.
struct LayerProps {
    std::uint32_t mask{0};
    std::string name;
    bool visible{true};
    bool locked{false};
    float opacity{1.0f};
    BlendMode blendMode{BlendMode::Normal};
};

struct LayerStats {
    std::uint32_t strokeCount{0};
    std::uint64_t pointCount{0};
};

struct Layer {
    std::uint32_t id{0};
    std::string name;
    LayerKind kind{LayerKind::Raster};
    std::vector<StrokePtr> strokes;
    float opacity{1.0f};
    BlendMode blendMode{BlendMode::Normal};
    bool visible{true};
    bool locked{false};
    std::uint32_t order{0};
    LayerStats stats{};
};

// Owns the layer list in paint order (index 0 is the bottom) and the active
// layer id. The list is never empty.
class LayerStore {
public:
    static constexpr std::uint32_t kDefaultLayerId = 1;

    LayerStore();

    // Drops every layer and recreates the single default layer.
    void reset();

    const Layer& addLayer(const std::string& name);
    EngineError deleteLayer(std::uint32_t id);
    EngineError setActiveLayer(std::uint32_t id);
    EngineError updateProperties(std::uint32_t id, const LayerProps& props);
    EngineError commitStroke(StrokePtr stroke);
    EngineError reorder(const std::vector<std::uint32_t>& bottomToTop);
    EngineError clearLayer(std::uint32_t id, std::vector<StrokePtr>& removed);

    // Restoration primitives for undo/redo. They bypass lock checks.
    void insertLayer(Layer layer, std::size_t index);
    bool removeLayerAt(std::size_t index);
    bool popStroke(std::uint32_t layerId, std::uint32_t strokeId);
    bool pushStroke(std::uint32_t layerId, StrokePtr stroke);
    bool restoreStrokes(std::uint32_t layerId, std::vector<StrokePtr> strokes);
    void restoreActive(std::uint32_t id);
    void loadLayers(std::vector<Layer> layers, std::uint32_t activeId, std::uint32_t nextLayerId);

    const Layer* find(std::uint32_t id) const;
    std::size_t indexOf(std::uint32_t id) const;
    const std::vector<Layer>& layers() const noexcept { return layers_; }
    std::vector<std::uint32_t> orderIds() const;
    std::size_t size() const noexcept { return layers_.size(); }
    std::uint32_t activeLayerId() const noexcept { return activeId_; }
    std::uint32_t nextLayerId() const noexcept { return nextLayerId_; }
    bool isLayerLocked(std::uint32_t id) const;

    // Snapshot of the property fields of a layer, all mask bits set.
    static LayerProps captureProps(const Layer& layer);

private:
    Layer* findMutable(std::uint32_t id);
    void renumber();
    static void recomputeStats(Layer& layer);

    std::vector<Layer> layers_;
    std::uint32_t activeId_{kDefaultLayerId};
    std::uint32_t nextLayerId_{kDefaultLayerId};
};
