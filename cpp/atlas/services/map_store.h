#pragma once

#include "atlas/core/types.h"
#include "atlas/services/store_status.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Partial map update. Layer or object edits always carry the complete layers array.
struct MapPatch {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> imageDataUrl;
    std::optional<GridSize> gridSize;
    std::optional<std::vector<MapLayer>> layers;
    // Session revision this write was produced at; stores may use it to reject stale writes.
    std::uint32_t revision{0};
};

class MapStore {
public:
    using GetMapCallback = std::function<void(StoreStatus, const MapDocument&)>;
    using UpdateCallback = std::function<void(StoreStatus)>;

    virtual ~MapStore() = default;

    virtual void getMap(std::uint32_t mapId, GetMapCallback done) = 0;
    virtual void updateMap(std::uint32_t mapId, const MapPatch& patch, UpdateCallback done) = 0;
};
