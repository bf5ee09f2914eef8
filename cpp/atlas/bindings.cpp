#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the engine public API header for bindings.
#include "atlas/engine.h"
#include "atlas/core/logging.h"

#ifdef EMSCRIPTEN
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {

using emscripten::val;

std::uint32_t u32Field(const val& obj, const char* key) {
    const val v = obj[key];
    return v.isUndefined() || v.isNull() ? 0u : v.as<std::uint32_t>();
}

float f32Field(const val& obj, const char* key) {
    const val v = obj[key];
    return v.isUndefined() || v.isNull() ? 0.0f : v.as<float>();
}

std::string stringField(const val& obj, const char* key) {
    const val v = obj[key];
    return v.isString() ? v.as<std::string>() : std::string();
}

val pointsToVal(const std::vector<Point2>& points) {
    val arr = val::array();
    for (const Point2& p : points) {
        val pt = val::object();
        pt.set("x", p.x);
        pt.set("y", p.y);
        arr.call<void>("push", pt);
    }
    return arr;
}

val layersToVal(const std::vector<MapLayer>& layers) {
    val arr = val::array();
    for (const MapLayer& layer : layers) {
        val l = val::object();
        l.set("id", layer.id);
        l.set("name", layer.name);
        l.set("type", static_cast<std::uint32_t>(layer.type));
        l.set("isVisible", layer.isVisible);
        val objects = val::array();
        for (const MapObject& obj : layer.objects) {
            val o = val::object();
            o.set("id", obj.id);
            o.set("layerId", obj.layerId);
            o.set("kind", static_cast<std::uint32_t>(obj.kind()));
            if (const MarkerShape* marker = obj.marker()) {
                o.set("x", marker->x);
                o.set("y", marker->y);
                o.set("linkKind", static_cast<std::uint32_t>(marker->link.kind));
                o.set("linkId", marker->link.id);
            } else if (const ZoneShape* zone = obj.zone()) {
                o.set("points", pointsToVal(zone->points));
                o.set("name", zone->name);
                o.set("color", zone->colorRGBA);
            }
            objects.call<void>("push", o);
        }
        l.set("objects", objects);
        arr.call<void>("push", l);
    }
    return arr;
}

MapDocument documentFromVal(const val& doc) {
    MapDocument map;
    map.id = u32Field(doc, "id");
    map.worldId = u32Field(doc, "worldId");
    map.name = stringField(doc, "name");
    map.description = stringField(doc, "description");
    map.imageDataUrl = stringField(doc, "imageDataUrl");
    const val grid = doc["gridSize"];
    if (!grid.isUndefined() && !grid.isNull()) {
        map.gridSize.width = u32Field(grid, "width");
        map.gridSize.height = u32Field(grid, "height");
    }

    const val layers = doc["layers"];
    const std::uint32_t layerCount = layers.isUndefined() ? 0u : layers["length"].as<std::uint32_t>();
    for (std::uint32_t i = 0; i < layerCount; ++i) {
        const val l = layers[i];
        MapLayer layer;
        layer.id = u32Field(l, "id");
        layer.name = stringField(l, "name");
        const std::uint32_t type = u32Field(l, "type");
        layer.type = type <= static_cast<std::uint32_t>(LayerType::Quest) ? static_cast<LayerType>(type) : LayerType::Location;
        layer.isVisible = l["isVisible"].isUndefined() ? true : l["isVisible"].as<bool>();

        const val objects = l["objects"];
        const std::uint32_t objectCount = objects.isUndefined() ? 0u : objects["length"].as<std::uint32_t>();
        for (std::uint32_t k = 0; k < objectCount; ++k) {
            const val o = objects[k];
            const std::uint32_t kind = u32Field(o, "kind");
            if (kind == static_cast<std::uint32_t>(MapObjectKind::Zone)) {
                const val pts = o["points"];
                const std::uint32_t n = pts.isUndefined() ? 0u : pts["length"].as<std::uint32_t>();
                std::vector<Point2> points;
                points.reserve(n);
                for (std::uint32_t p = 0; p < n; ++p) {
                    points.push_back(Point2{f32Field(pts[p], "x"), f32Field(pts[p], "y")});
                }
                if (points.size() < GeometryObjectStore::kMinZonePoints) {
                    ATLAS_LOG_WARN("dropping zone %u with %zu points", u32Field(o, "id"), points.size());
                    continue;
                }
                MapObject obj = makeZoneObject(u32Field(o, "id"), layer.id, std::move(points));
                obj.zone()->name = stringField(o, "name");
                if (!o["color"].isUndefined()) obj.zone()->colorRGBA = u32Field(o, "color");
                layer.objects.push_back(std::move(obj));
                continue;
            }
            const std::uint32_t linkKind = u32Field(o, "linkKind");
            EntityLink link{};
            if (linkKind <= static_cast<std::uint32_t>(LinkKind::Quest)) {
                link = EntityLink{static_cast<LinkKind>(linkKind), u32Field(o, "linkId")};
            }
            layer.objects.push_back(makeMarkerObject(u32Field(o, "id"), layer.id, f32Field(o, "x"), f32Field(o, "y"), link));
        }
        map.layers.push_back(std::move(layer));
    }
    return map;
}

val entityToVal(const EntityRecord& record) {
    val e = val::object();
    e.set("id", record.id);
    e.set("worldId", record.worldId);
    e.set("name", record.name);
    e.set("description", record.description);
    return e;
}

EntityRecord entityFromVal(const val& e) {
    EntityRecord record;
    record.id = u32Field(e, "id");
    record.worldId = u32Field(e, "worldId");
    record.name = stringField(e, "name");
    record.description = stringField(e, "description");
    return record;
}

// Requests are forwarded to JS with a request id; JS answers through the
// matching resolve* call on HostAdapters.
class JsMapStore : public MapStore {
public:
    explicit JsMapStore(val host) : host_(std::move(host)) {}

    void getMap(std::uint32_t mapId, GetMapCallback done) override {
        const std::uint32_t requestId = nextRequest_++;
        getRequests_.emplace(requestId, std::move(done));
        host_.call<void>("getMap", requestId, mapId);
    }

    void updateMap(std::uint32_t mapId, const MapPatch& patch, UpdateCallback done) override {
        const std::uint32_t requestId = nextRequest_++;
        updateRequests_.emplace(requestId, std::move(done));
        val p = val::object();
        if (patch.name) p.set("name", *patch.name);
        if (patch.description) p.set("description", *patch.description);
        if (patch.imageDataUrl) p.set("imageDataUrl", *patch.imageDataUrl);
        if (patch.gridSize) {
            val grid = val::object();
            grid.set("width", patch.gridSize->width);
            grid.set("height", patch.gridSize->height);
            p.set("gridSize", grid);
        }
        if (patch.layers) p.set("layers", layersToVal(*patch.layers));
        p.set("revision", patch.revision);
        host_.call<void>("updateMap", requestId, mapId, p);
    }

    void resolveGet(std::uint32_t requestId, std::uint32_t status, const val& doc) {
        const auto it = getRequests_.find(requestId);
        if (it == getRequests_.end()) return;
        GetMapCallback done = std::move(it->second);
        getRequests_.erase(it);
        const MapDocument map = status == 0 ? documentFromVal(doc) : MapDocument{};
        done(static_cast<StoreStatus>(status), map);
    }

    void resolveUpdate(std::uint32_t requestId, std::uint32_t status) {
        const auto it = updateRequests_.find(requestId);
        if (it == updateRequests_.end()) return;
        UpdateCallback done = std::move(it->second);
        updateRequests_.erase(it);
        done(static_cast<StoreStatus>(status));
    }

private:
    val host_;
    std::uint32_t nextRequest_{1};
    std::unordered_map<std::uint32_t, GetMapCallback> getRequests_;
    std::unordered_map<std::uint32_t, UpdateCallback> updateRequests_;
};

class JsEntityStore : public EntityStore {
public:
    JsEntityStore(val host, std::string kind) : host_(std::move(host)), kind_(std::move(kind)) {}

    void listForWorld(std::uint32_t worldId, ListCallback done) override {
        const std::uint32_t requestId = nextRequest_++;
        listRequests_.emplace(requestId, std::move(done));
        host_.call<void>("listEntities", kind_, requestId, worldId);
    }

    void create(const EntityDraft& draft, CreateCallback done) override {
        const std::uint32_t requestId = nextRequest_++;
        createRequests_.emplace(requestId, std::move(done));
        val d = val::object();
        d.set("worldId", draft.worldId);
        d.set("name", draft.name);
        d.set("description", draft.description);
        host_.call<void>("createEntity", kind_, requestId, d);
    }

    void getById(std::uint32_t id, GetCallback done) override {
        const std::uint32_t requestId = nextRequest_++;
        getRequests_.emplace(requestId, std::move(done));
        host_.call<void>("getEntity", kind_, requestId, id);
    }

    void resolveList(std::uint32_t requestId, std::uint32_t status, const val& list) {
        const auto it = listRequests_.find(requestId);
        if (it == listRequests_.end()) return;
        ListCallback done = std::move(it->second);
        listRequests_.erase(it);
        std::vector<EntityRecord> records;
        if (status == 0 && !list.isUndefined() && !list.isNull()) {
            const std::uint32_t n = list["length"].as<std::uint32_t>();
            records.reserve(n);
            for (std::uint32_t i = 0; i < n; ++i) records.push_back(entityFromVal(list[i]));
        }
        done(static_cast<StoreStatus>(status), records);
    }

    void resolveCreate(std::uint32_t requestId, std::uint32_t status, std::uint32_t entityId) {
        const auto it = createRequests_.find(requestId);
        if (it == createRequests_.end()) return;
        CreateCallback done = std::move(it->second);
        createRequests_.erase(it);
        done(static_cast<StoreStatus>(status), entityId);
    }

    void resolveGet(std::uint32_t requestId, std::uint32_t status, const val& entity) {
        const auto it = getRequests_.find(requestId);
        if (it == getRequests_.end()) return;
        GetCallback done = std::move(it->second);
        getRequests_.erase(it);
        std::optional<EntityRecord> record;
        if (status == 0 && !entity.isUndefined() && !entity.isNull()) record = entityFromVal(entity);
        done(static_cast<StoreStatus>(status), record);
    }

private:
    val host_;
    std::string kind_;
    std::uint32_t nextRequest_{1};
    std::unordered_map<std::uint32_t, ListCallback> listRequests_;
    std::unordered_map<std::uint32_t, CreateCallback> createRequests_;
    std::unordered_map<std::uint32_t, GetCallback> getRequests_;
};

class JsModalService : public ModalService {
public:
    explicit JsModalService(val host) : host_(std::move(host)) {}

    void showModal(const ModalRequest& request, ResultCallback onClose) override {
        const std::uint32_t requestId = nextRequest_++;
        requests_.emplace(requestId, std::move(onClose));
        val r = val::object();
        r.set("type", static_cast<std::uint32_t>(request.type));
        r.set("title", request.title);
        r.set("message", request.message);
        r.set("isDanger", request.isDanger);
        host_.call<void>("showModal", requestId, r);
    }

    void resolve(std::uint32_t requestId, bool confirmed, std::uint32_t entityId) {
        const auto it = requests_.find(requestId);
        if (it == requests_.end()) return;
        ResultCallback done = std::move(it->second);
        requests_.erase(it);
        done(ModalResult{confirmed, entityId});
    }

private:
    val host_;
    std::uint32_t nextRequest_{1};
    std::unordered_map<std::uint32_t, ResultCallback> requests_;
};

// JS-backed services for one MapEngine. Must stay alive while the engine is used.
class HostAdapters {
public:
    explicit HostAdapters(val host)
        : mapStore_(host),
          locations_(host, "location"),
          quests_(host, "quest"),
          modals_(host) {}

    void attach(MapEngine& engine) {
        engine.setServices(&mapStore_, &locations_, &quests_, &modals_);
    }

    void resolveGetMap(std::uint32_t requestId, std::uint32_t status, val doc) { mapStore_.resolveGet(requestId, status, doc); }
    void resolveUpdateMap(std::uint32_t requestId, std::uint32_t status) { mapStore_.resolveUpdate(requestId, status); }
    void resolveListEntities(const std::string& kind, std::uint32_t requestId, std::uint32_t status, val list) {
        store(kind).resolveList(requestId, status, list);
    }
    void resolveCreateEntity(const std::string& kind, std::uint32_t requestId, std::uint32_t status, std::uint32_t entityId) {
        store(kind).resolveCreate(requestId, status, entityId);
    }
    void resolveGetEntity(const std::string& kind, std::uint32_t requestId, std::uint32_t status, val entity) {
        store(kind).resolveGet(requestId, status, entity);
    }
    void resolveModal(std::uint32_t requestId, bool confirmed, std::uint32_t entityId) {
        modals_.resolve(requestId, confirmed, entityId);
    }

private:
    JsEntityStore& store(const std::string& kind) { return kind == "quest" ? quests_ : locations_; }

    JsMapStore mapStore_;
    JsEntityStore locations_;
    JsEntityStore quests_;
    JsModalService modals_;
};

void loadMapFromVal(MapEngine& engine, val doc) {
    engine.loadMap(documentFromVal(doc));
}

val getLayers(const MapEngine& engine) {
    return layersToVal(engine.layers());
}

val getInspector(const MapEngine& engine) {
    const InspectorState& state = engine.getInspector();
    val out = val::object();
    out.set("status", static_cast<std::uint32_t>(state.status));
    out.set("objectId", state.objectId);
    out.set("objectKind", static_cast<std::uint32_t>(state.objectKind));
    out.set("linkKind", static_cast<std::uint32_t>(state.linkKind));
    out.set("entity", entityToVal(state.entity));
    return out;
}

bool listLinkCandidates(MapEngine& engine, const std::string& filter, val callback) {
    return engine.listLinkCandidates(filter, [callback](const std::vector<EntityRecord>& records) {
        val arr = val::array();
        for (const EntityRecord& record : records) arr.call<void>("push", entityToVal(record));
        callback(arr);
    });
}

std::uint32_t addZoneFromVal(MapEngine& engine, std::uint32_t layerId, val points) {
    const std::uint32_t n = points["length"].as<std::uint32_t>();
    std::vector<Point2> pts;
    pts.reserve(n);
    for (std::uint32_t i = 0; i < n; ++i) pts.push_back(Point2{f32Field(points[i], "x"), f32Field(points[i], "y")});
    return engine.addZone(layerId, pts);
}

} // namespace

EMSCRIPTEN_BINDINGS(atlas_engine_module) {
    emscripten::enum_<Tool>("Tool")
        .value("Pan", Tool::Pan)
        .value("Select", Tool::Select)
        .value("AddLocation", Tool::AddLocation)
        .value("AddQuest", Tool::AddQuest)
        .value("DrawZone", Tool::DrawZone);

    emscripten::enum_<LayerType>("LayerType")
        .value("Zone", LayerType::Zone)
        .value("Location", LayerType::Location)
        .value("Quest", LayerType::Quest);

    emscripten::enum_<LinkKind>("LinkKind")
        .value("None", LinkKind::None)
        .value("Location", LinkKind::Location)
        .value("Quest", LinkKind::Quest);

    emscripten::enum_<Key>("Key")
        .value("Unknown", Key::Unknown)
        .value("Enter", Key::Enter)
        .value("Escape", Key::Escape)
        .value("Delete", Key::Delete);

    emscripten::enum_<EngineError>("EngineError")
        .value("Ok", EngineError::Ok)
        .value("InvalidMagic", EngineError::InvalidMagic)
        .value("UnsupportedVersion", EngineError::UnsupportedVersion)
        .value("BufferTruncated", EngineError::BufferTruncated)
        .value("InvalidPayloadSize", EngineError::InvalidPayloadSize)
        .value("InvalidOperation", EngineError::InvalidOperation)
        .value("NoActiveLayer", EngineError::NoActiveLayer);

    emscripten::enum_<MapEngine::PointerButton>("PointerButton")
        .value("Primary", MapEngine::PointerButton::Primary)
        .value("Middle", MapEngine::PointerButton::Middle)
        .value("Secondary", MapEngine::PointerButton::Secondary);

    emscripten::enum_<MapEngine::CanvasCursor>("CanvasCursor")
        .value("Default", MapEngine::CanvasCursor::Default)
        .value("Grab", MapEngine::CanvasCursor::Grab)
        .value("Grabbing", MapEngine::CanvasCursor::Grabbing)
        .value("Crosshair", MapEngine::CanvasCursor::Crosshair);

    emscripten::value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    emscripten::value_object<PickResult>("PickResult")
        .field("id", &PickResult::id)
        .field("layerId", &PickResult::layerId)
        .field("kind", &PickResult::kind)
        .field("subTarget", &PickResult::subTarget)
        .field("distance", &PickResult::distance)
        .field("hitX", &PickResult::hitX)
        .field("hitY", &PickResult::hitY);

    emscripten::value_object<MapEngine::RenderBufferMeta>("RenderBufferMeta")
        .field("generation", &MapEngine::RenderBufferMeta::generation)
        .field("primitiveCount", &MapEngine::RenderBufferMeta::primitiveCount)
        .field("floatCount", &MapEngine::RenderBufferMeta::floatCount)
        .field("primitivesPtr", &MapEngine::RenderBufferMeta::primitivesPtr)
        .field("dataPtr", &MapEngine::RenderBufferMeta::dataPtr);

    emscripten::value_object<MapEngine::EventBufferMeta>("EventBufferMeta")
        .field("generation", &MapEngine::EventBufferMeta::generation)
        .field("count", &MapEngine::EventBufferMeta::count)
        .field("ptr", &MapEngine::EventBufferMeta::ptr);

    emscripten::value_object<MapEngine::ByteBufferMeta>("ByteBufferMeta")
        .field("generation", &MapEngine::ByteBufferMeta::generation)
        .field("byteCount", &MapEngine::ByteBufferMeta::byteCount)
        .field("ptr", &MapEngine::ByteBufferMeta::ptr);

    emscripten::value_object<MapEngine::PersistState>("PersistState")
        .field("revision", &MapEngine::PersistState::revision)
        .field("inFlight", &MapEngine::PersistState::inFlight)
        .field("lastStatus", &MapEngine::PersistState::lastStatus)
        .field("diverged", &MapEngine::PersistState::diverged);

    emscripten::enum_<StoreStatus>("StoreStatus")
        .value("Ok", StoreStatus::Ok)
        .value("NotFound", StoreStatus::NotFound)
        .value("Rejected", StoreStatus::Rejected)
        .value("Conflict", StoreStatus::Conflict)
        .value("Unavailable", StoreStatus::Unavailable);

    emscripten::class_<HostAdapters>("HostAdapters")
        .constructor<emscripten::val>()
        .function("attach", &HostAdapters::attach)
        .function("resolveGetMap", &HostAdapters::resolveGetMap)
        .function("resolveUpdateMap", &HostAdapters::resolveUpdateMap)
        .function("resolveListEntities", &HostAdapters::resolveListEntities)
        .function("resolveCreateEntity", &HostAdapters::resolveCreateEntity)
        .function("resolveGetEntity", &HostAdapters::resolveGetEntity)
        .function("resolveModal", &HostAdapters::resolveModal);

    emscripten::class_<MapEngine>("MapEngine")
        .constructor<>()
        .function("loadMap", &loadMapFromVal)
        .function("openMap", &MapEngine::openMap)
        .function("hasMap", &MapEngine::hasMap)
        .function("getGeneration", &MapEngine::getGeneration)
        .function("getLastError", &MapEngine::getLastError)
        .function("activeTool", &MapEngine::activeTool)
        .function("setTool", &MapEngine::setTool)
        .function("cancelZoneDraft", &MapEngine::cancelZoneDraft)
        .function("zoomIn", &MapEngine::zoomIn)
        .function("zoomOut", &MapEngine::zoomOut)
        .function("resetView", &MapEngine::resetView)
        .function("screenToWorld", &MapEngine::screenToWorld)
        .function("worldToScreen", &MapEngine::worldToScreen)
        .function("onPointerDown", &MapEngine::onPointerDown)
        .function("onPointerMove", &MapEngine::onPointerMove)
        .function("onPointerUp", &MapEngine::onPointerUp)
        .function("onPointerLeave", &MapEngine::onPointerLeave)
        .function("onClick", &MapEngine::onClick)
        .function("onDoubleClick", &MapEngine::onDoubleClick)
        .function("onWheel", &MapEngine::onWheel)
        .function("onKeyDown", &MapEngine::onKeyDown)
        .function("getCursor", &MapEngine::getCursor)
        .function("getLayers", &getLayers)
        .function("activeLayerId", &MapEngine::activeLayerId)
        .function("addLayer", &MapEngine::addLayer)
        .function("requestDeleteLayer", &MapEngine::requestDeleteLayer)
        .function("deleteLayer", &MapEngine::deleteLayer)
        .function("toggleLayerVisibility", &MapEngine::toggleLayerVisibility)
        .function("setActiveLayer", &MapEngine::setActiveLayer)
        .function("ensureActiveLayer", &MapEngine::ensureActiveLayer)
        .function("renameLayer", &MapEngine::renameLayer)
        .function("setLayerType", &MapEngine::setLayerType)
        .function("addMarker", &MapEngine::addMarker)
        .function("addZone", &addZoneFromVal)
        .function("moveObject", &MapEngine::moveObject)
        .function("deleteObject", &MapEngine::deleteObject)
        .function("setZoneProps", &MapEngine::setZoneProps)
        .function("hasPendingLink", &MapEngine::hasPendingLink)
        .function("confirmPendingLink", &MapEngine::confirmPendingLink)
        .function("cancelPendingLink", &MapEngine::cancelPendingLink)
        .function("createAndLink", &MapEngine::createAndLink)
        .function("listLinkCandidates", &listLinkCandidates)
        .function("selectObject", &MapEngine::selectObject)
        .function("clearSelection", &MapEngine::clearSelection)
        .function("getSelectedId", &MapEngine::getSelectedId)
        .function("getSelectionGeneration", &MapEngine::getSelectionGeneration)
        .function("getInspector", &getInspector)
        .function("deleteSelected", &MapEngine::deleteSelected)
        .function("pick", &MapEngine::pick)
        .function("pickEx", &MapEngine::pickEx)
        .function("setMapImage", &MapEngine::setMapImage)
        .function("setMapDetails", &MapEngine::setMapDetails)
        .function("getPersistState", &MapEngine::getPersistState)
        .function("buildRenderBuffers", &MapEngine::buildRenderBuffers)
        .function("pollEvents", &MapEngine::pollEvents)
        .function("ackResync", &MapEngine::ackResync)
        .function("saveSnapshot", &MapEngine::saveSnapshot)
        .function("loadSnapshotFromPtr", &MapEngine::loadSnapshotFromPtr);
}
#endif
