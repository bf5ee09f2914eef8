#ifndef ATLAS_CORE_TYPES_H
#define ATLAS_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// Map document model shared by the editor, the stores and the snapshot codec.

struct Point2 { float x; float y; };

enum class EngineError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    InvalidOperation = 5,
    NoActiveLayer = 6,
};

enum class Tool : std::uint8_t {
    Pan = 0,
    Select = 1,
    AddLocation = 2,
    AddQuest = 3,
    DrawZone = 4,
};

enum class LayerType : std::uint8_t {
    Zone = 0,
    Location = 1,
    Quest = 2,
};

enum class MapObjectKind : std::uint8_t { Marker = 1, Zone = 2 };

enum class LinkKind : std::uint8_t { None = 0, Location = 1, Quest = 2 };

// Semi-transparent blue, packed 0xRRGGBBAA.
static constexpr std::uint32_t kDefaultZoneColor = 0x3B82F666u;

struct EntityLink {
    LinkKind kind{LinkKind::None};
    std::uint32_t id{0};

    bool isLinked() const noexcept { return kind != LinkKind::None && id != 0; }
};

struct MarkerShape {
    float x{0.0f};
    float y{0.0f};
    EntityLink link{};
};

struct ZoneShape {
    std::vector<Point2> points;
    std::string name;
    std::uint32_t colorRGBA{kDefaultZoneColor};
};

// A map object is either a point marker or a polygon zone, never both.
struct MapObject {
    std::uint32_t id{0};
    std::uint32_t layerId{0};
    std::variant<MarkerShape, ZoneShape> shape;

    MapObjectKind kind() const noexcept {
        return std::holds_alternative<ZoneShape>(shape) ? MapObjectKind::Zone : MapObjectKind::Marker;
    }

    const MarkerShape* marker() const noexcept { return std::get_if<MarkerShape>(&shape); }
    MarkerShape* marker() noexcept { return std::get_if<MarkerShape>(&shape); }
    const ZoneShape* zone() const noexcept { return std::get_if<ZoneShape>(&shape); }
    ZoneShape* zone() noexcept { return std::get_if<ZoneShape>(&shape); }
};

inline MapObject makeMarkerObject(std::uint32_t id, std::uint32_t layerId, float x, float y, EntityLink link = {}) {
    MapObject obj;
    obj.id = id;
    obj.layerId = layerId;
    obj.shape = MarkerShape{x, y, link};
    return obj;
}

inline MapObject makeZoneObject(std::uint32_t id, std::uint32_t layerId, std::vector<Point2> points) {
    MapObject obj;
    obj.id = id;
    obj.layerId = layerId;
    ZoneShape zone;
    zone.points = std::move(points);
    obj.shape = std::move(zone);
    return obj;
}

struct MapLayer {
    std::uint32_t id{0};
    std::string name;
    LayerType type{LayerType::Location};
    bool isVisible{true};
    std::vector<MapObject> objects;
};

struct GridSize {
    std::uint32_t width{0};
    std::uint32_t height{0};
};

struct MapDocument {
    std::uint32_t id{0};
    std::uint32_t worldId{0};
    std::string name;
    std::string description;
    std::string imageDataUrl;
    GridSize gridSize{};
    std::vector<MapLayer> layers;
};

#endif // ATLAS_CORE_TYPES_H
