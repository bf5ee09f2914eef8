#include "atlas/render/render.h"

namespace atlas {

namespace {

std::uint16_t markerFlags(const MarkerShape& marker) {
    std::uint16_t flags = 0;
    switch (marker.link.kind) {
        case LinkKind::Location:
            flags |= static_cast<std::uint16_t>(protocol::PrimitiveFlags::LocationMarker);
            break;
        case LinkKind::Quest:
            flags |= static_cast<std::uint16_t>(protocol::PrimitiveFlags::QuestMarker);
            break;
        case LinkKind::None:
            break;
    }
    if (!marker.link.isLinked()) {
        flags |= static_cast<std::uint16_t>(protocol::PrimitiveFlags::Unlinked);
    }
    return flags;
}

void pushScreenPoint(const Viewport& viewport, float wx, float wy, std::vector<float>& data) {
    const Point2 s = viewport.toScreen(wx, wy);
    data.push_back(s.x);
    data.push_back(s.y);
}

} // namespace

void buildMapRenderBuffers(
    const std::vector<MapLayer>& layers,
    const Viewport& viewport,
    std::uint32_t selectedId,
    const ZonePreview* zonePreview,
    RenderBuffers& out
) {
    out.clear();

    auto pushPrimitive = [&](protocol::OverlayKind kind, std::uint16_t flags, std::uint32_t count,
                             std::uint32_t objectId, std::uint32_t color) {
        const std::uint32_t offset = static_cast<std::uint32_t>(out.data.size());
        out.primitives.push_back(protocol::RenderPrimitive{
            static_cast<std::uint16_t>(kind),
            flags,
            count,
            offset,
            objectId,
            color,
        });
    };

    for (const MapLayer& layer : layers) {
        if (!layer.isVisible) continue;

        for (const MapObject& obj : layer.objects) {
            const std::uint16_t selectedFlag = obj.id == selectedId
                ? static_cast<std::uint16_t>(protocol::PrimitiveFlags::Selected)
                : 0;

            if (const MarkerShape* marker = obj.marker()) {
                pushPrimitive(protocol::OverlayKind::Point, markerFlags(*marker) | selectedFlag, 1, obj.id, 0);
                pushScreenPoint(viewport, marker->x, marker->y, out.data);
                continue;
            }

            const ZoneShape* zone = obj.zone();
            if (!zone || zone->points.empty()) continue;
            pushPrimitive(protocol::OverlayKind::Polygon, selectedFlag,
                static_cast<std::uint32_t>(zone->points.size()), obj.id, zone->colorRGBA);
            for (const Point2& pt : zone->points) {
                pushScreenPoint(viewport, pt.x, pt.y, out.data);
            }
        }
    }

    if (!zonePreview || zonePreview->vertices.empty()) return;

    const std::uint16_t previewFlag = static_cast<std::uint16_t>(protocol::PrimitiveFlags::Preview);
    const std::vector<Point2>& vertices = zonePreview->vertices;
    pushPrimitive(protocol::OverlayKind::Polyline, previewFlag,
        static_cast<std::uint32_t>(vertices.size()), 0, 0);
    for (const Point2& pt : vertices) {
        pushScreenPoint(viewport, pt.x, pt.y, out.data);
    }

    if (zonePreview->hasCursor) {
        const Point2& last = vertices.back();
        pushPrimitive(protocol::OverlayKind::Segment, previewFlag, 2, 0, 0);
        pushScreenPoint(viewport, last.x, last.y, out.data);
        pushScreenPoint(viewport, zonePreview->cursor.x, zonePreview->cursor.y, out.data);
    }
}

} // namespace atlas
