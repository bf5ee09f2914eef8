#pragma once

#include "atlas/core/types.h"
#include "atlas/layers/layer_model.h"
#include <cstdint>
#include <string>
#include <vector>

// Markers and zones held inside the layers of a LayerModel.
// Lookup is a linear scan over every layer; maps are small enough that no index is kept.
class GeometryObjectStore {
public:
    static constexpr std::size_t kMinZonePoints = 3;

    explicit GeometryObjectStore(LayerModel& layers);

    const MapObject* findObject(std::uint32_t id) const;
    MapObject* findObject(std::uint32_t id);
    std::size_t objectCount() const;

    // Appends to the layer named by obj.layerId. Rejects id 0, duplicate ids,
    // unknown layers and zones below kMinZonePoints.
    bool insertObject(MapObject obj);
    bool addZone(std::uint32_t id, std::uint32_t layerId, std::vector<Point2> points, std::uint32_t colorRGBA = kDefaultZoneColor);

    // Markers only. Zones keep their vertices.
    bool moveObject(std::uint32_t id, float x, float y);
    bool deleteObject(std::uint32_t id, std::uint32_t* outLayerId = nullptr);
    bool setZoneProps(std::uint32_t id, const std::string& name, std::uint32_t colorRGBA);

    // Largest layer or object id present, 0 for an empty document.
    std::uint32_t maxAssignedId() const;

private:
    LayerModel& layers_;
};
