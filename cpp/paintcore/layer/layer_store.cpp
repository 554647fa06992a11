#include "paintcore/layer/layer_store.h"
#include "paintcore/core/logging.h"
#include "paintcore/core/numeric.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

LayerStore::LayerStore() {
    reset();
}

void LayerStore::reset() {
    layers_.clear();
    nextLayerId_ = kDefaultLayerId;
    addLayer(std::string());
}

const Layer& LayerStore::addLayer(const std::string& name) {
    Layer layer;
    layer.id = nextLayerId_++;
    layer.name = name.empty() ? "Layer " + std::to_string(layers_.size() + 1) : name;
    layer.kind = LayerKind::Raster;
    layers_.push_back(std::move(layer));
    renumber();
    activeId_ = layers_.back().id;
    return layers_.back();
}

EngineError LayerStore::deleteLayer(std::uint32_t id) {
    const std::size_t index = indexOf(id);
    if (index == layers_.size()) return EngineError::LayerNotFound;
    if (layers_.size() == 1) return EngineError::LastLayer;
    removeLayerAt(index);
    return EngineError::Ok;
}

bool LayerStore::removeLayerAt(std::size_t index) {
    if (index >= layers_.size() || layers_.size() == 1) return false;
    const bool wasActive = layers_[index].id == activeId_;
    layers_.erase(layers_.begin() + static_cast<std::ptrdiff_t>(index));
    renumber();
    if (wasActive) {
        // The top-most remaining layer takes over.
        activeId_ = layers_.back().id;
    }
    return true;
}

void LayerStore::insertLayer(Layer layer, std::size_t index) {
    index = std::min(index, layers_.size());
    nextLayerId_ = std::max(nextLayerId_, layer.id + 1);
    layers_.insert(layers_.begin() + static_cast<std::ptrdiff_t>(index), std::move(layer));
    renumber();
}

EngineError LayerStore::setActiveLayer(std::uint32_t id) {
    if (!find(id)) return EngineError::LayerNotFound;
    activeId_ = id;
    return EngineError::Ok;
}

void LayerStore::restoreActive(std::uint32_t id) {
    if (find(id)) activeId_ = id;
}

EngineError LayerStore::updateProperties(std::uint32_t id, const LayerProps& props) {
    Layer* layer = findMutable(id);
    if (!layer) return EngineError::LayerNotFound;
    if (hasProp(props.mask, LayerPropMask::Opacity) && !std::isfinite(props.opacity)) {
        return EngineError::InvalidArgument;
    }
    if (hasProp(props.mask, LayerPropMask::BlendMode) && static_cast<std::uint8_t>(props.blendMode) >= kBlendModeCount) {
        return EngineError::InvalidArgument;
    }

    if (hasProp(props.mask, LayerPropMask::Name)) layer->name = props.name;
    if (hasProp(props.mask, LayerPropMask::Visible)) layer->visible = props.visible;
    if (hasProp(props.mask, LayerPropMask::Locked)) layer->locked = props.locked;
    if (hasProp(props.mask, LayerPropMask::Opacity)) layer->opacity = paintcore::clamp01(props.opacity);
    if (hasProp(props.mask, LayerPropMask::BlendMode)) layer->blendMode = props.blendMode;
    return EngineError::Ok;
}

EngineError LayerStore::commitStroke(StrokePtr stroke) {
    if (!stroke) return EngineError::InvalidArgument;
    Layer* layer = findMutable(stroke->layerId);
    if (!layer) return EngineError::LayerNotFound;
    if (layer->locked) {
        PAINTCORE_LOG_WARN("commitStroke rejected: layer %u is locked", layer->id);
        return EngineError::LayerLocked;
    }
    layer->stats.strokeCount += 1;
    layer->stats.pointCount += stroke->points.size();
    layer->strokes.push_back(std::move(stroke));
    return EngineError::Ok;
}

bool LayerStore::pushStroke(std::uint32_t layerId, StrokePtr stroke) {
    Layer* layer = findMutable(layerId);
    if (!layer || !stroke) return false;
    layer->stats.strokeCount += 1;
    layer->stats.pointCount += stroke->points.size();
    layer->strokes.push_back(std::move(stroke));
    return true;
}

bool LayerStore::popStroke(std::uint32_t layerId, std::uint32_t strokeId) {
    Layer* layer = findMutable(layerId);
    if (!layer || layer->strokes.empty()) return false;
    if (layer->strokes.back()->id != strokeId) return false;
    layer->stats.strokeCount -= 1;
    layer->stats.pointCount -= layer->strokes.back()->points.size();
    layer->strokes.pop_back();
    return true;
}

EngineError LayerStore::clearLayer(std::uint32_t id, std::vector<StrokePtr>& removed) {
    Layer* layer = findMutable(id);
    if (!layer) return EngineError::LayerNotFound;
    if (layer->locked) return EngineError::LayerLocked;
    removed.swap(layer->strokes);
    layer->strokes.clear();
    recomputeStats(*layer);
    return EngineError::Ok;
}

bool LayerStore::restoreStrokes(std::uint32_t layerId, std::vector<StrokePtr> strokes) {
    Layer* layer = findMutable(layerId);
    if (!layer) return false;
    layer->strokes = std::move(strokes);
    recomputeStats(*layer);
    return true;
}

EngineError LayerStore::reorder(const std::vector<std::uint32_t>& bottomToTop) {
    if (bottomToTop.size() != layers_.size()) return EngineError::InvalidPermutation;
    std::unordered_set<std::uint32_t> seen;
    seen.reserve(bottomToTop.size());
    for (const std::uint32_t id : bottomToTop) {
        if (!find(id) || !seen.insert(id).second) return EngineError::InvalidPermutation;
    }

    std::vector<Layer> next;
    next.reserve(layers_.size());
    for (const std::uint32_t id : bottomToTop) {
        next.push_back(std::move(*findMutable(id)));
    }
    layers_ = std::move(next);
    renumber();
    return EngineError::Ok;
}

void LayerStore::loadLayers(std::vector<Layer> layers, std::uint32_t activeId, std::uint32_t nextLayerId) {
    if (layers.empty()) {
        reset();
        return;
    }
    layers_ = std::move(layers);
    std::uint32_t maxId = 0;
    for (auto& layer : layers_) {
        recomputeStats(layer);
        maxId = std::max(maxId, layer.id);
    }
    renumber();
    nextLayerId_ = std::max(nextLayerId, maxId + 1);
    activeId_ = find(activeId) ? activeId : layers_.back().id;
}

const Layer* LayerStore::find(std::uint32_t id) const {
    for (const auto& layer : layers_) {
        if (layer.id == id) return &layer;
    }
    return nullptr;
}

Layer* LayerStore::findMutable(std::uint32_t id) {
    for (auto& layer : layers_) {
        if (layer.id == id) return &layer;
    }
    return nullptr;
}

std::size_t LayerStore::indexOf(std::uint32_t id) const {
    for (std::size_t i = 0; i < layers_.size(); ++i) {
        if (layers_[i].id == id) return i;
    }
    return layers_.size();
}

std::vector<std::uint32_t> LayerStore::orderIds() const {
    std::vector<std::uint32_t> out;
    out.reserve(layers_.size());
    for (const auto& layer : layers_) out.push_back(layer.id);
    return out;
}

bool LayerStore::isLayerLocked(std::uint32_t id) const {
    const Layer* layer = find(id);
    return layer && layer->locked;
}

LayerProps LayerStore::captureProps(const Layer& layer) {
    LayerProps p;
    p.mask = LayerPropMask::Name | LayerPropMask::Visible | LayerPropMask::Locked
        | LayerPropMask::Opacity | LayerPropMask::BlendMode;
    p.name = layer.name;
    p.visible = layer.visible;
    p.locked = layer.locked;
    p.opacity = layer.opacity;
    p.blendMode = layer.blendMode;
    return p;
}

void LayerStore::renumber() {
    for (std::size_t i = 0; i < layers_.size(); ++i) {
        layers_[i].order = static_cast<std::uint32_t>(i);
    }
}

void LayerStore::recomputeStats(Layer& layer) {
    layer.stats = LayerStats{};
    for (const auto& s : layer.strokes) {
        layer.stats.strokeCount += 1;
        layer.stats.pointCount += s->points.size();
    }
}
