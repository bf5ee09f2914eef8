#include "atlas/layers/object_store.h"
#include <algorithm>
#include <cmath>
#include <utility>

GeometryObjectStore::GeometryObjectStore(LayerModel& layers)
    : layers_(layers) {}

const MapObject* GeometryObjectStore::findObject(std::uint32_t id) const {
    if (id == 0) return nullptr;
    for (const MapLayer& layer : layers_.layers()) {
        for (const MapObject& obj : layer.objects) {
            if (obj.id == id) return &obj;
        }
    }
    return nullptr;
}

MapObject* GeometryObjectStore::findObject(std::uint32_t id) {
    const GeometryObjectStore& self = *this;
    return const_cast<MapObject*>(self.findObject(id));
}

std::size_t GeometryObjectStore::objectCount() const {
    std::size_t count = 0;
    for (const MapLayer& layer : layers_.layers()) count += layer.objects.size();
    return count;
}

bool GeometryObjectStore::insertObject(MapObject obj) {
    if (obj.id == 0 || findObject(obj.id)) return false;
    MapLayer* layer = layers_.findLayer(obj.layerId);
    if (!layer) return false;

    if (const ZoneShape* zone = obj.zone()) {
        if (zone->points.size() < kMinZonePoints) return false;
    } else if (const MarkerShape* marker = obj.marker()) {
        if (!std::isfinite(marker->x) || !std::isfinite(marker->y)) return false;
    }

    layer->objects.push_back(std::move(obj));
    return true;
}

bool GeometryObjectStore::addZone(std::uint32_t id, std::uint32_t layerId, std::vector<Point2> points, std::uint32_t colorRGBA) {
    MapObject obj = makeZoneObject(id, layerId, std::move(points));
    obj.zone()->colorRGBA = colorRGBA;
    return insertObject(std::move(obj));
}

bool GeometryObjectStore::moveObject(std::uint32_t id, float x, float y) {
    if (!std::isfinite(x) || !std::isfinite(y)) return false;
    MapObject* obj = findObject(id);
    if (!obj) return false;
    MarkerShape* marker = obj->marker();
    if (!marker) return false;
    marker->x = x;
    marker->y = y;
    return true;
}

bool GeometryObjectStore::deleteObject(std::uint32_t id, std::uint32_t* outLayerId) {
    if (id == 0) return false;
    for (MapLayer& layer : layers_.mutableLayers()) {
        auto& objects = layer.objects;
        const auto it = std::find_if(objects.begin(), objects.end(), [id](const MapObject& obj) {
            return obj.id == id;
        });
        if (it == objects.end()) continue;
        if (outLayerId) *outLayerId = layer.id;
        objects.erase(it);
        return true;
    }
    return false;
}

bool GeometryObjectStore::setZoneProps(std::uint32_t id, const std::string& name, std::uint32_t colorRGBA) {
    MapObject* obj = findObject(id);
    if (!obj) return false;
    ZoneShape* zone = obj->zone();
    if (!zone) return false;
    zone->name = name;
    zone->colorRGBA = colorRGBA;
    return true;
}

std::uint32_t GeometryObjectStore::maxAssignedId() const {
    std::uint32_t maxId = 0;
    for (const MapLayer& layer : layers_.layers()) {
        maxId = std::max(maxId, layer.id);
        for (const MapObject& obj : layer.objects) {
            maxId = std::max(maxId, obj.id);
        }
    }
    return maxId;
}
