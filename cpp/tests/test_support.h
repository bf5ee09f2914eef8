#pragma once

#include <gtest/gtest.h>
#include "atlas/engine.h"
#include "atlas/services/entity_store.h"
#include "atlas/services/map_store.h"
#include "atlas/services/modal_service.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace atlas_test {

// Captures every write. Writes complete immediately with `status` unless `deferWrites` is set.
class FakeMapStore : public MapStore {
public:
    struct Write {
        std::uint32_t mapId;
        MapPatch patch;
        UpdateCallback done;
    };

    void getMap(std::uint32_t mapId, GetMapCallback done) override {
        getRequests.push_back(mapId);
        pendingGets.push_back(std::move(done));
        if (!deferGets) completeGets(getStatus);
    }

    void updateMap(std::uint32_t mapId, const MapPatch& patch, UpdateCallback done) override {
        writes.push_back(Write{mapId, patch, done});
        if (!deferWrites) done(status);
    }

    void completeGets(StoreStatus result) {
        std::vector<GetMapCallback> gets;
        gets.swap(pendingGets);
        for (auto& cb : gets) cb(result, document);
    }

    const MapPatch& lastPatch() const { return writes.back().patch; }

    MapDocument document{};
    StoreStatus status{StoreStatus::Ok};
    StoreStatus getStatus{StoreStatus::Ok};
    bool deferWrites{false};
    bool deferGets{false};
    std::vector<std::uint32_t> getRequests;
    std::vector<GetMapCallback> pendingGets;
    std::vector<Write> writes;
};

class FakeEntityStore : public EntityStore {
public:
    void listForWorld(std::uint32_t worldId, ListCallback done) override {
        std::vector<EntityRecord> out;
        for (const auto& kv : entities) {
            if (kv.second.worldId == worldId) out.push_back(kv.second);
        }
        done(listStatus, out);
    }

    void create(const EntityDraft& draft, CreateCallback done) override {
        drafts.push_back(draft);
        if (createStatus != StoreStatus::Ok) {
            done(createStatus, 0);
            return;
        }
        const std::uint32_t id = nextId++;
        entities[id] = EntityRecord{id, draft.worldId, draft.name, draft.description};
        done(StoreStatus::Ok, id);
    }

    void getById(std::uint32_t id, GetCallback done) override {
        getRequests.push_back(id);
        if (deferGets) {
            pendingGets.emplace_back(id, std::move(done));
            return;
        }
        respond(id, done);
    }

    // Completes the deferred lookup at index; lookups may be answered out of order.
    void completeGet(std::size_t index) {
        auto entry = pendingGets.at(index);
        respond(entry.first, entry.second);
    }

    void add(std::uint32_t id, std::uint32_t worldId, const std::string& name, const std::string& description = std::string()) {
        entities[id] = EntityRecord{id, worldId, name, description};
        if (id >= nextId) nextId = id + 1;
    }

    std::map<std::uint32_t, EntityRecord> entities;
    std::vector<EntityDraft> drafts;
    std::vector<std::uint32_t> getRequests;
    std::vector<std::pair<std::uint32_t, GetCallback>> pendingGets;
    StoreStatus listStatus{StoreStatus::Ok};
    StoreStatus createStatus{StoreStatus::Ok};
    bool deferGets{false};
    std::uint32_t nextId{100};

private:
    void respond(std::uint32_t id, const GetCallback& done) {
        const auto it = entities.find(id);
        if (it == entities.end()) {
            done(StoreStatus::NotFound, std::nullopt);
            return;
        }
        done(StoreStatus::Ok, it->second);
    }
};

// Dialogs stay open until the test answers them.
class FakeModalService : public ModalService {
public:
    struct Shown {
        ModalRequest request;
        ResultCallback onClose;
    };

    void showModal(const ModalRequest& request, ResultCallback onClose) override {
        shown.push_back(Shown{request, std::move(onClose)});
    }

    const ModalRequest& last() const { return shown.back().request; }

    void answer(std::size_t index, bool confirmed, std::uint32_t entityId = 0) {
        shown.at(index).onClose(ModalResult{confirmed, entityId});
    }

    void answerLast(bool confirmed, std::uint32_t entityId = 0) {
        answer(shown.size() - 1, confirmed, entityId);
    }

    std::vector<Shown> shown;
};

inline MapLayer makeLayer(std::uint32_t id, const std::string& name, bool visible = true) {
    MapLayer layer;
    layer.id = id;
    layer.name = name;
    layer.isVisible = visible;
    return layer;
}

inline std::vector<Point2> triangle(float x, float y, float size) {
    return {Point2{x, y}, Point2{x + size, y}, Point2{x, y + size}};
}

inline std::vector<Point2> square(float x, float y, float size) {
    return {Point2{x, y}, Point2{x + size, y}, Point2{x + size, y + size}, Point2{x, y + size}};
}

// Map 7 in world 3 with two empty layers (ids 1 and 2).
inline MapDocument makeTwoLayerMap() {
    MapDocument map;
    map.id = 7;
    map.worldId = 3;
    map.name = "Coast";
    map.layers.push_back(makeLayer(1, "Towns"));
    map.layers.push_back(makeLayer(2, "Regions"));
    return map;
}

struct EditorHarness {
    EditorHarness() {
        engine.setServices(&mapStore, &locations, &quests, &modals);
    }

    FakeMapStore mapStore;
    FakeEntityStore locations;
    FakeEntityStore quests;
    FakeModalService modals;
    MapEngine engine;
};

inline std::vector<MapEngine::EngineEvent> drainEvents(MapEngine& engine) {
    const auto meta = engine.pollEvents(4096);
    const auto* events = reinterpret_cast<const MapEngine::EngineEvent*>(meta.ptr);
    if (!events) return {};
    return std::vector<MapEngine::EngineEvent>(events, events + meta.count);
}

inline bool hasEvent(const std::vector<MapEngine::EngineEvent>& events, MapEngine::EventType type) {
    for (const auto& ev : events) {
        if (ev.type == static_cast<std::uint16_t>(type)) return true;
    }
    return false;
}

} // namespace atlas_test
