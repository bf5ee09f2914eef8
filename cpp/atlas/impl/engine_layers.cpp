// MapEngine layer operations. Every accepted change re-persists the layers array.

#include "atlas/engine.h"
#include "atlas/core/logging.h"

#include <utility>

std::uint32_t MapEngine::addLayer(const std::string& name) {
    const std::uint32_t id = allocateId();
    const std::string layerName = name.empty() ? LayerModel::defaultLayerName(layers_.layerCount() + 1) : name;
    if (!layers_.addLayer(id, layerName, LayerType::Location)) {
        setError(EngineError::InvalidOperation);
        return 0;
    }
    clearError();
    generation_++;
    recordLayerChanged(id, static_cast<std::uint32_t>(ChangeMask::Layer) | static_cast<std::uint32_t>(ChangeMask::Order));
    persistLayers();
    return id;
}

bool MapEngine::requestDeleteLayer(std::uint32_t layerId) {
    const MapLayer* layer = layers_.findLayer(layerId);
    if (!layer || !modalService_) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();

    ModalRequest request;
    request.type = ModalType::Confirmation;
    request.title = "Delete Layer?";
    request.message = "Are you sure you want to delete this layer and all objects on it? This action cannot be undone.";
    request.isDanger = true;
    const std::uint32_t session = session_;
    showModal(request, [this, layerId, session](const ModalResult& result) {
        if (!result.confirmed) return;
        if (session != session_) {
            ATLAS_LOG_DEBUG("layer %u delete confirmed after map reload, ignoring", layerId);
            return;
        }
        deleteLayer(layerId);
    });
    return true;
}

bool MapEngine::deleteLayer(std::uint32_t layerId) {
    std::vector<std::uint32_t> removed;
    if (!layers_.removeLayer(layerId, &removed)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();

    // A pending candidate aimed at this layer has nowhere to go.
    if (const PendingLink* pending = linking_.pending()) {
        if (pending->candidate.layerId == layerId) {
            linking_.cancel();
        }
    }

    generation_++;
    for (const std::uint32_t id : removed) {
        recordObjectDeleted(id);
    }
    recordLayerChanged(layerId, static_cast<std::uint32_t>(ChangeMask::Layer) | static_cast<std::uint32_t>(ChangeMask::Order));
    selectionManager_.prune();
    persistLayers();
    return true;
}

bool MapEngine::toggleLayerVisibility(std::uint32_t layerId) {
    if (!layers_.toggleVisibility(layerId)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    generation_++;
    recordLayerChanged(layerId, static_cast<std::uint32_t>(ChangeMask::Visibility));
    persistLayers();
    return true;
}

bool MapEngine::setActiveLayer(std::uint32_t layerId) {
    if (!layers_.setActiveLayer(layerId)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    return true;
}

bool MapEngine::ensureActiveLayer() {
    return layers_.reconcileActiveLayer();
}

bool MapEngine::renameLayer(std::uint32_t layerId, const std::string& name) {
    if (!layers_.renameLayer(layerId, name)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    generation_++;
    recordLayerChanged(layerId, static_cast<std::uint32_t>(ChangeMask::Props));
    persistLayers();
    return true;
}

bool MapEngine::setLayerType(std::uint32_t layerId, LayerType type) {
    if (!layers_.setLayerType(layerId, type)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    generation_++;
    recordLayerChanged(layerId, static_cast<std::uint32_t>(ChangeMask::Props));
    persistLayers();
    return true;
}
