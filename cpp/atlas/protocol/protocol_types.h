/**
 * @file protocol_types.h
 * @brief POD types shared between MapEngine and its host.
 *
 * Buffers handed to the host are laid out as plain structs so the WASM side
 * can read them straight out of linear memory. Field order is part of the ABI.
 */

#ifndef ATLAS_PROTOCOL_TYPES_H
#define ATLAS_PROTOCOL_TYPES_H

#include <cstdint>

namespace atlas {
namespace protocol {

// =============================================================================
// Render primitives
// =============================================================================

enum class OverlayKind : std::uint16_t {
    Polyline = 1,
    Polygon = 2,
    Segment = 3,
    Point = 5,
};

enum class PrimitiveFlags : std::uint16_t {
    Selected = 1 << 0,
    LocationMarker = 1 << 1,
    QuestMarker = 1 << 2,
    Unlinked = 1 << 3,
    Preview = 1 << 4,
};

struct RenderPrimitive {
    std::uint16_t kind;
    std::uint16_t flags;
    std::uint32_t count;   // number of points
    std::uint32_t offset;  // float offset into data buffer
    std::uint32_t objectId; // 0 for preview geometry
    std::uint32_t colorRGBA;
};

struct RenderBufferMeta {
    std::uint32_t generation;
    std::uint32_t primitiveCount;
    std::uint32_t floatCount;
    std::uintptr_t primitivesPtr;
    std::uintptr_t dataPtr;
};

// =============================================================================
// Event Stream Types
// =============================================================================

enum class EventType : std::uint16_t {
    Overflow = 1,
    DocChanged = 2,
    LayerChanged = 3,
    ObjectCreated = 4,
    ObjectChanged = 5,
    ObjectDeleted = 6,
    SelectionChanged = 7,
    ViewportChanged = 8,
    ToolChanged = 9,
    InspectorChanged = 10,
    PersistFailed = 11,
};

enum class ChangeMask : std::uint32_t {
    Geometry = 1 << 0,
    Link = 1 << 1,
    Layer = 1 << 2,
    Visibility = 1 << 3,
    Order = 1 << 4,
    Props = 1 << 5,
    MapInfo = 1 << 6,
};

struct EngineEvent {
    std::uint16_t type;
    std::uint16_t flags;
    std::uint32_t a;
    std::uint32_t b;
    std::uint32_t c;
    std::uint32_t d;
};

struct EventBufferMeta {
    std::uint32_t generation;
    std::uint32_t count;
    std::uintptr_t ptr;
};

struct ByteBufferMeta {
    std::uint32_t generation;
    std::uint32_t byteCount;
    std::uintptr_t ptr;
};

// =============================================================================
// Canvas cursor
// =============================================================================

enum class CanvasCursor : std::uint8_t {
    Default = 0,
    Grab = 1,
    Grabbing = 2,
    Crosshair = 3,
};

} // namespace protocol
} // namespace atlas

#endif // ATLAS_PROTOCOL_TYPES_H
