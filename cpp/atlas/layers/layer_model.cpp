#include "atlas/layers/layer_model.h"
#include <algorithm>
#include <utility>

LayerModel::LayerModel(std::vector<MapLayer>& layers)
    : layers_(layers) {}

const MapLayer* LayerModel::findLayer(std::uint32_t id) const {
    if (id == kNoLayer) return nullptr;
    for (const MapLayer& layer : layers_) {
        if (layer.id == id) return &layer;
    }
    return nullptr;
}

MapLayer* LayerModel::findLayer(std::uint32_t id) {
    if (id == kNoLayer) return nullptr;
    for (MapLayer& layer : layers_) {
        if (layer.id == id) return &layer;
    }
    return nullptr;
}

bool LayerModel::isLayerVisible(std::uint32_t id) const {
    const MapLayer* layer = findLayer(id);
    return layer && layer->isVisible;
}

bool LayerModel::addLayer(std::uint32_t id, std::string name, LayerType type) {
    if (id == kNoLayer || findLayer(id)) return false;
    MapLayer layer;
    layer.id = id;
    layer.name = name.empty() ? defaultLayerName(layers_.size() + 1) : std::move(name);
    layer.type = type;
    layer.isVisible = true;
    layers_.push_back(std::move(layer));
    activeLayerId_ = id;
    return true;
}

bool LayerModel::removeLayer(std::uint32_t id, std::vector<std::uint32_t>* removedObjectIds) {
    const auto it = std::find_if(layers_.begin(), layers_.end(), [id](const MapLayer& layer) {
        return layer.id == id;
    });
    if (it == layers_.end()) return false;

    if (removedObjectIds) {
        for (const MapObject& obj : it->objects) {
            removedObjectIds->push_back(obj.id);
        }
    }
    layers_.erase(it);

    if (activeLayerId_ == id) {
        activeLayerId_ = kNoLayer;
    }
    return true;
}

bool LayerModel::toggleVisibility(std::uint32_t id) {
    MapLayer* layer = findLayer(id);
    if (!layer) return false;
    layer->isVisible = !layer->isVisible;
    return true;
}

bool LayerModel::renameLayer(std::uint32_t id, const std::string& name) {
    MapLayer* layer = findLayer(id);
    if (!layer) return false;
    layer->name = name;
    return true;
}

bool LayerModel::setLayerType(std::uint32_t id, LayerType type) {
    MapLayer* layer = findLayer(id);
    if (!layer) return false;
    layer->type = type;
    return true;
}

bool LayerModel::setActiveLayer(std::uint32_t id) {
    if (id != kNoLayer && !findLayer(id)) return false;
    activeLayerId_ = id;
    return true;
}

bool LayerModel::reconcileActiveLayer() {
    if (activeLayerId_ != kNoLayer && !findLayer(activeLayerId_)) {
        activeLayerId_ = kNoLayer;
        return true;
    }
    if (activeLayerId_ == kNoLayer && !layers_.empty()) {
        activeLayerId_ = layers_.back().id;
        return true;
    }
    return false;
}

std::string LayerModel::defaultLayerName(std::size_t layerCount) {
    return "New Layer " + std::to_string(layerCount);
}
