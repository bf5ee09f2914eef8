// MapEngine session, services and tool/viewport state.
// Input dispatch, layers, objects, persistence, events, render and snapshot live in atlas/impl/.

#include "atlas/engine.h"
#include "atlas/core/logging.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

MapEngine::MapEngine()
    : layers_(map_.layers),
      objects_(layers_),
      viewport_(options_),
      pickSystem_(options_),
      linking_(*this),
      selectionManager_(*this) {
    eventQueue_.resize(kMaxEvents);
}

MapEngine::~MapEngine() {
    alive_.reset();
}

void MapEngine::setServices(MapStore* mapStore, EntityStore* locations, EntityStore* quests, ModalService* modals) {
    mapStore_ = mapStore;
    locationStore_ = locations;
    questStore_ = quests;
    modalService_ = modals;
}

void MapEngine::setOptions(const EditorOptions& options) {
    if (!std::isfinite(options.minZoom) || !std::isfinite(options.maxZoom)
        || !(options.minZoom > 0.0f) || options.maxZoom < options.minZoom
        || !std::isfinite(options.zoomStepFactor) || !(options.zoomStepFactor > 0.0f)) {
        setError(EngineError::InvalidOperation);
        return;
    }
    clearError();
    options_ = options;
    const Point2 pan = viewport_.pan();
    // Re-clamp the current zoom into the new bounds.
    if (viewport_.zoom() != std::clamp(viewport_.zoom(), options_.minZoom, options_.maxZoom)) {
        viewport_.setState(pan.x, pan.y, viewport_.zoom());
        recordViewportChanged();
    }
}

void MapEngine::resetSession() {
    session_++;
    linking_.reset();
    selectionManager_.clear();
    tools_.resetZone();
    viewport_.endPan();
    inFlightWrites_ = 0;
    lastPersistStatus_ = StoreStatus::Ok;
    diverged_ = false;
    layers_.resetActiveLayer();
    clearEventState();
    clearError();
}

void MapEngine::loadMap(const MapDocument& map) {
    resetSession();
    map_ = map;
    mapLoaded_ = true;

    // Objects always live on the layer that holds them.
    for (MapLayer& layer : map_.layers) {
        for (MapObject& obj : layer.objects) {
            obj.layerId = layer.id;
        }
    }

    nextId_ = 1;
    trackNextId(objects_.maxAssignedId());
    layers_.reconcileActiveLayer();

    generation_++;
    recordDocChanged(static_cast<std::uint32_t>(ChangeMask::MapInfo) | static_cast<std::uint32_t>(ChangeMask::Layer));
    recordSelectionChanged();
    recordInspectorChanged();
    ATLAS_LOG_DEBUG("loaded map %u with %zu layers", map_.id, map_.layers.size());
}

bool MapEngine::openMap(std::uint32_t mapId) {
    if (!mapStore_) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    clearError();
    const std::uint32_t request = ++openRequest_;
    mapStore_->getMap(mapId, [this, alive = lifetime(), request, mapId](StoreStatus status, const MapDocument& doc) {
        if (alive.expired()) return;
        if (request != openRequest_) {
            ATLAS_LOG_DEBUG("dropping stale load of map %u", mapId);
            return;
        }
        if (status != StoreStatus::Ok) {
            ATLAS_LOG_WARN("failed to load map %u (%s)", mapId, storeStatusName(status));
            return;
        }
        loadMap(doc);
    });
    return true;
}

std::uint32_t MapEngine::allocateId() {
    return nextId_++;
}

void MapEngine::trackNextId(std::uint32_t id) {
    if (id >= nextId_) nextId_ = id + 1;
}

EntityStore* MapEngine::entityStoreFor(LinkKind kind) const {
    switch (kind) {
        case LinkKind::Location: return locationStore_;
        case LinkKind::Quest: return questStore_;
        case LinkKind::None: break;
    }
    return nullptr;
}

void MapEngine::showModal(const ModalRequest& request, ModalService::ResultCallback onClose) {
    if (!modalService_) {
        ATLAS_LOG_WARN("no modal service for \"%s\"", request.title.c_str());
        return;
    }
    modalService_->showModal(request, [alive = lifetime(), onClose = std::move(onClose)](const ModalResult& result) {
        if (alive.expired()) {
            ATLAS_LOG_DEBUG("dialog closed after the editor was destroyed");
            return;
        }
        onClose(result);
    });
}

void MapEngine::showAlert(const std::string& title, const std::string& message) {
    ModalRequest request;
    request.type = ModalType::Alert;
    request.title = title;
    request.message = message;
    showModal(request, [](const ModalResult&) {});
}

namespace {
const char* placedObjectNoun(Tool tool) {
    switch (tool) {
        case Tool::AddQuest: return "a quest";
        case Tool::DrawZone: return "a zone";
        default: return "a location";
    }
}
} // namespace

bool MapEngine::requireActiveLayer() {
    if (layers_.activeLayer()) return true;
    setError(EngineError::NoActiveLayer);
    showAlert("No Layer Selected",
        std::string("Please select a layer in the sidebar before adding ") + placedObjectNoun(tools_.activeTool()) + ".");
    return false;
}

bool MapEngine::setTool(Tool tool) {
    if (!tools_.setTool(tool)) return false;
    viewport_.endPan();
    recordToolChanged();
    return true;
}

bool MapEngine::cancelZoneDraft() {
    if (tools_.zonePhase() == ZoneDraftPhase::Idle) return false;
    tools_.resetZone();
    return true;
}

bool MapEngine::zoomIn() {
    if (!viewport_.zoomIn()) return false;
    recordViewportChanged();
    return true;
}

bool MapEngine::zoomOut() {
    if (!viewport_.zoomOut()) return false;
    recordViewportChanged();
    return true;
}

void MapEngine::resetView() {
    viewport_.reset();
    recordViewportChanged();
}

MapEngine::CanvasCursor MapEngine::getCursor() const noexcept {
    if (viewport_.isPanning()) return CanvasCursor::Grabbing;
    switch (tools_.activeTool()) {
        case Tool::Pan: return CanvasCursor::Grab;
        case Tool::AddLocation:
        case Tool::AddQuest:
        case Tool::DrawZone:
            return CanvasCursor::Crosshair;
        case Tool::Select: break;
    }
    return CanvasCursor::Default;
}

std::uint32_t MapEngine::pick(float x, float y) const {
    return pickSystem_.pickId(layers_.layers(), viewport_, x, y);
}

PickResult MapEngine::pickEx(float x, float y) const {
    return pickSystem_.pick(layers_.layers(), viewport_, x, y);
}
