#include "atlas/selection/selection_manager.h"
#include "atlas/core/logging.h"
#include "atlas/engine.h"
#include <utility>

SelectionManager::SelectionManager(MapEngine& engine)
    : engine_(engine) {}

bool SelectionManager::select(std::uint32_t objectId) {
    if (objectId == 0) {
        clearSelection();
        return true;
    }
    if (!engine_.findObject(objectId)) return false;
    if (objectId == selectedId_) return true;

    selectedId_ = objectId;
    generation_++;
    engine_.recordSelectionChanged();
    resolveInspector();
    return true;
}

void SelectionManager::clearSelection() {
    if (selectedId_ == 0) return;
    selectedId_ = 0;
    generation_++;
    engine_.recordSelectionChanged();
    resolveInspector();
}

void SelectionManager::prune() {
    if (selectedId_ == 0) return;
    if (engine_.findObject(selectedId_)) return;
    clearSelection();
}

void SelectionManager::clear() {
    selectedId_ = 0;
    generation_ = 0;
    fetchGeneration_++;
    inspector_ = InspectorState{};
}

void SelectionManager::setInspector(InspectorState state) {
    inspector_ = std::move(state);
    engine_.recordInspectorChanged();
}

void SelectionManager::resolveInspector() {
    // Any fetch still in flight now belongs to an older selection.
    const std::uint32_t fetch = ++fetchGeneration_;

    const MapObject* obj = selectedId_ ? engine_.findObject(selectedId_) : nullptr;
    if (!obj) {
        setInspector(InspectorState{});
        return;
    }

    InspectorState state;
    state.objectId = obj->id;
    state.objectKind = obj->kind();

    const MarkerShape* marker = obj->marker();
    if (!marker || !marker->link.isLinked()) {
        state.status = InspectorStatus::NoLinkedData;
        setInspector(std::move(state));
        return;
    }

    state.linkKind = marker->link.kind;
    EntityStore* store = engine_.entityStoreFor(marker->link.kind);
    if (!store) {
        state.status = InspectorStatus::NoLinkedData;
        setInspector(std::move(state));
        return;
    }

    const std::uint32_t objectId = obj->id;
    const LinkKind linkKind = marker->link.kind;
    const std::uint32_t entityId = marker->link.id;
    state.status = InspectorStatus::Loading;
    setInspector(std::move(state));

    store->getById(entityId, [this, alive = engine_.lifetime(), fetch, objectId, linkKind](StoreStatus status, const std::optional<EntityRecord>& record) {
        if (alive.expired()) return;
        if (fetch != fetchGeneration_ || objectId != selectedId_) {
            ATLAS_LOG_DEBUG("dropping late inspector fetch for object %u", objectId);
            return;
        }
        InspectorState loaded;
        loaded.objectId = objectId;
        loaded.objectKind = MapObjectKind::Marker;
        loaded.linkKind = linkKind;
        if (status == StoreStatus::Ok && record) {
            loaded.status = InspectorStatus::Loaded;
            loaded.entity = *record;
        } else {
            if (status != StoreStatus::Ok && status != StoreStatus::NotFound) {
                ATLAS_LOG_WARN("inspector fetch for object %u failed (%s)", objectId, storeStatusName(status));
            }
            loaded.status = InspectorStatus::NoLinkedData;
        }
        setInspector(std::move(loaded));
    });
}
