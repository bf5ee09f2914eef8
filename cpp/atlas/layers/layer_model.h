#pragma once

#include "atlas/core/types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Ordered layer list of the open map. Index order is z-order: the last layer draws on top.
// The model edits the document's layers in place; persisting them is the caller's job.
class LayerModel {
public:
    static constexpr std::uint32_t kNoLayer = 0;

    explicit LayerModel(std::vector<MapLayer>& layers);

    const std::vector<MapLayer>& layers() const noexcept { return layers_; }
    std::vector<MapLayer>& mutableLayers() noexcept { return layers_; }
    std::size_t layerCount() const noexcept { return layers_.size(); }

    const MapLayer* findLayer(std::uint32_t id) const;
    MapLayer* findLayer(std::uint32_t id);
    bool isLayerVisible(std::uint32_t id) const;

    std::uint32_t activeLayerId() const noexcept { return activeLayerId_; }
    const MapLayer* activeLayer() const { return findLayer(activeLayerId_); }

    // Appends a visible, empty layer and makes it the active one.
    bool addLayer(std::uint32_t id, std::string name, LayerType type = LayerType::Location);
    // Removes the layer with every object on it. Clears the active layer if it was this one.
    bool removeLayer(std::uint32_t id, std::vector<std::uint32_t>* removedObjectIds = nullptr);
    bool toggleVisibility(std::uint32_t id);
    bool renameLayer(std::uint32_t id, const std::string& name);
    bool setLayerType(std::uint32_t id, LayerType type);

    // kNoLayer clears the selection. Unknown ids are rejected.
    bool setActiveLayer(std::uint32_t id);

    // With nothing active and at least one layer, activates the top-most layer.
    bool reconcileActiveLayer();

    // Called after the layer vector is replaced wholesale (map load).
    void resetActiveLayer() noexcept { activeLayerId_ = kNoLayer; }

    static std::string defaultLayerName(std::size_t layerCount);

private:
    std::vector<MapLayer>& layers_;
    std::uint32_t activeLayerId_{kNoLayer};
};
