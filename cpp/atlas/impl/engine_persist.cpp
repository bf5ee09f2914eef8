// MapEngine persistence: optimistic whole-layers writes through the MapStore.

#include "atlas/engine.h"
#include "atlas/core/logging.h"

#include <utility>

void MapEngine::persistLayers() {
    if (!mapStore_ || !mapLoaded_) {
        ATLAS_LOG_DEBUG("no map store bound, change kept in memory only");
        return;
    }
    MapPatch patch;
    patch.layers = map_.layers;
    persistPatch(std::move(patch));
}

void MapEngine::persistPatch(MapPatch patch) {
    if (!mapStore_ || !mapLoaded_) {
        ATLAS_LOG_DEBUG("no map store bound, change kept in memory only");
        return;
    }

    const std::uint32_t revision = ++revision_;
    const std::uint32_t session = session_;
    patch.revision = revision;
    inFlightWrites_++;

    mapStore_->updateMap(map_.id, patch, [this, alive = lifetime(), session, revision](StoreStatus status) {
        if (alive.expired()) {
            ATLAS_LOG_DEBUG("write %u finished after the editor was destroyed (%s)", revision, storeStatusName(status));
            return;
        }
        onPersistResult(session, revision, status);
    });
}

void MapEngine::onPersistResult(std::uint32_t session, std::uint32_t revision, StoreStatus status) {
    if (session != session_) {
        ATLAS_LOG_DEBUG("write %u finished after map reload (%s)", revision, storeStatusName(status));
        return;
    }
    if (inFlightWrites_ > 0) inFlightWrites_--;
    lastPersistStatus_ = status;
    if (status == StoreStatus::Ok) return;

    // Local state is kept; it may now differ from what the store holds.
    ATLAS_LOG_WARN("map %u write %u failed (%s)", map_.id, revision, storeStatusName(status));
    diverged_ = true;
    recordPersistFailed(revision, status);
}
