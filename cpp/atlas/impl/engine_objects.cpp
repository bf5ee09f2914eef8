// MapEngine object, linking and selection operations.

#include "atlas/engine.h"
#include "atlas/core/logging.h"
#include "atlas/core/string_utils.h"

#include <utility>

std::uint32_t MapEngine::addMarker(std::uint32_t layerId, float worldX, float worldY, LinkKind kind) {
    if (!layers_.findLayer(layerId) || kind == LinkKind::None || linking_.hasPending()) {
        setError(EngineError::InvalidOperation);
        return 0;
    }
    const std::uint32_t id = allocateId();
    if (!linking_.begin(makeMarkerObject(id, layerId, worldX, worldY), kind)) {
        setError(EngineError::InvalidOperation);
        return 0;
    }
    clearError();
    return id;
}

bool MapEngine::commitLinkedMarker(MapObject candidate) {
    const std::uint32_t id = candidate.id;
    const std::uint32_t layerId = candidate.layerId;
    if (!objects_.insertObject(std::move(candidate))) {
        ATLAS_LOG_WARN("linked marker %u could not be added to layer %u", id, layerId);
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    generation_++;
    recordObjectCreated(id, static_cast<std::uint32_t>(MapObjectKind::Marker));
    recordLayerChanged(layerId, static_cast<std::uint32_t>(ChangeMask::Geometry));
    persistLayers();
    return true;
}

std::uint32_t MapEngine::addZone(std::uint32_t layerId, const std::vector<Point2>& points) {
    if (!layers_.findLayer(layerId) || points.size() < GeometryObjectStore::kMinZonePoints) {
        setError(EngineError::InvalidOperation);
        return 0;
    }
    const std::uint32_t id = allocateId();
    if (!objects_.addZone(id, layerId, points, options_.defaultZoneColor)) {
        setError(EngineError::InvalidOperation);
        return 0;
    }
    clearError();
    generation_++;
    recordObjectCreated(id, static_cast<std::uint32_t>(MapObjectKind::Zone));
    recordLayerChanged(layerId, static_cast<std::uint32_t>(ChangeMask::Geometry));
    persistLayers();
    return id;
}

bool MapEngine::moveObject(std::uint32_t id, float x, float y) {
    if (!objects_.moveObject(id, x, y)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    generation_++;
    recordObjectChanged(id, static_cast<std::uint32_t>(ChangeMask::Geometry));
    persistLayers();
    return true;
}

bool MapEngine::deleteObject(std::uint32_t id) {
    std::uint32_t layerId = 0;
    if (!objects_.deleteObject(id, &layerId)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    generation_++;
    recordObjectDeleted(id);
    recordLayerChanged(layerId, static_cast<std::uint32_t>(ChangeMask::Geometry));
    selectionManager_.prune();
    persistLayers();
    return true;
}

bool MapEngine::setZoneProps(std::uint32_t id, const std::string& name, std::uint32_t colorRGBA) {
    if (!objects_.setZoneProps(id, name, colorRGBA)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    generation_++;
    recordObjectChanged(id, static_cast<std::uint32_t>(ChangeMask::Props));
    persistLayers();
    return true;
}

bool MapEngine::confirmPendingLink(std::uint32_t entityId) {
    if (!linking_.confirm(entityId)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    return true;
}

bool MapEngine::cancelPendingLink() {
    return linking_.cancel();
}

bool MapEngine::createAndLink(const std::string& name, const std::string& description) {
    if (!linking_.createAndLink(name, description)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    return true;
}

bool MapEngine::listLinkCandidates(const std::string& filter, LinkingWorkflow::CandidateCallback done) {
    return linking_.listCandidates(filter, std::move(done));
}

bool MapEngine::selectObject(std::uint32_t id) {
    if (!selectionManager_.select(id)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    return true;
}

void MapEngine::clearSelection() {
    selectionManager_.clearSelection();
}

bool MapEngine::deleteSelected() {
    const std::uint32_t id = selectionManager_.selectedId();
    if (id == 0) return false;
    return deleteObject(id);
}

bool MapEngine::setMapImage(const std::string& imageDataUrl) {
    if (!mapLoaded_) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    map_.imageDataUrl = imageDataUrl;
    generation_++;
    recordDocChanged(static_cast<std::uint32_t>(ChangeMask::MapInfo));

    MapPatch patch;
    patch.imageDataUrl = imageDataUrl;
    persistPatch(std::move(patch));
    return true;
}

bool MapEngine::setMapDetails(const std::string& name, const std::string& description) {
    if (!mapLoaded_ || atlas::isBlank(name)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    map_.name = name;
    map_.description = description;
    generation_++;
    recordDocChanged(static_cast<std::uint32_t>(ChangeMask::MapInfo));

    MapPatch patch;
    patch.name = name;
    patch.description = description;
    persistPatch(std::move(patch));
    return true;
}
