#include "atlas/interaction/pick_system.h"
#include <algorithm>
#include <cmath>
#include <limits>

// Math helpers
static float distSq(float x1, float y1, float x2, float y2) {
    float dx = x1 - x2;
    float dy = y1 - y2;
    return dx*dx + dy*dy;
}

static float distToSegmentSq(float px, float py, float x1, float y1, float x2, float y2) {
    float l2 = distSq(x1, y1, x2, y2);
    if (l2 == 0) return distSq(px, py, x1, y1);
    float t = ((px - x1) * (x2 - x1) + (py - y1) * (y2 - y1)) / l2;
    t = std::max(0.0f, std::min(1.0f, t));
    return distSq(px, py, x1 + t * (x2 - x1), y1 + t * (y2 - y1));
}

static PickResult emptyPick() {
    return PickResult{0, 0, 0, static_cast<std::uint8_t>(PickSubTarget::None), std::numeric_limits<float>::infinity(), 0.0f, 0.0f};
}

PickSystem::PickSystem(const EditorOptions& options)
    : options_(options) {}

bool PickSystem::pointInPolygon(const std::vector<Point2>& poly, float x, float y) {
    // Even-odd rule.
    bool inside = false;
    const std::size_t n = poly.size();
    if (n < 3) return false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2& a = poly[i];
        const Point2& b = poly[j];
        if ((a.y > y) != (b.y > y)) {
            const float xCross = (b.x - a.x) * (y - a.y) / (b.y - a.y) + a.x;
            if (x < xCross) inside = !inside;
        }
    }
    return inside;
}

float PickSystem::distanceToPolygonEdges(const std::vector<Point2>& poly, float x, float y) {
    const std::size_t n = poly.size();
    if (n == 0) return std::numeric_limits<float>::infinity();
    if (n == 1) return std::sqrt(distSq(x, y, poly[0].x, poly[0].y));
    float best = std::numeric_limits<float>::infinity();
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& a = poly[i];
        const Point2& b = poly[(i + 1) % n];
        best = std::min(best, distToSegmentSq(x, y, a.x, a.y, b.x, b.y));
    }
    return std::sqrt(best);
}

PickResult PickSystem::pick(const std::vector<MapLayer>& layers, const Viewport& viewport, float screenX, float screenY) const {
    PickResult result = emptyPick();
    if (!std::isfinite(screenX) || !std::isfinite(screenY)) return result;

    const float zoom = viewport.zoom();
    const Point2 world = viewport.toWorld(screenX, screenY);
    const float markerRadius = options_.markerPickRadiusPx / zoom;
    const float edgeTolerance = options_.zoneEdgeTolerancePx / zoom;

    for (auto layerIt = layers.rbegin(); layerIt != layers.rend(); ++layerIt) {
        const MapLayer& layer = *layerIt;
        if (!layer.isVisible) continue;

        for (auto objIt = layer.objects.rbegin(); objIt != layer.objects.rend(); ++objIt) {
            const MapObject& obj = *objIt;

            if (const MarkerShape* marker = obj.marker()) {
                const float d = std::sqrt(distSq(world.x, world.y, marker->x, marker->y));
                if (d <= markerRadius) {
                    result.id = obj.id;
                    result.layerId = layer.id;
                    result.kind = static_cast<std::uint16_t>(MapObjectKind::Marker);
                    result.subTarget = static_cast<std::uint8_t>(PickSubTarget::Body);
                    result.distance = d * zoom;
                    result.hitX = world.x;
                    result.hitY = world.y;
                    return result;
                }
                continue;
            }

            const ZoneShape* zone = obj.zone();
            if (!zone) continue;
            if (pointInPolygon(zone->points, world.x, world.y)) {
                result.id = obj.id;
                result.layerId = layer.id;
                result.kind = static_cast<std::uint16_t>(MapObjectKind::Zone);
                result.subTarget = static_cast<std::uint8_t>(PickSubTarget::Body);
                result.distance = 0.0f;
                result.hitX = world.x;
                result.hitY = world.y;
                return result;
            }
            const float edgeDist = distanceToPolygonEdges(zone->points, world.x, world.y);
            if (edgeDist <= edgeTolerance) {
                result.id = obj.id;
                result.layerId = layer.id;
                result.kind = static_cast<std::uint16_t>(MapObjectKind::Zone);
                result.subTarget = static_cast<std::uint8_t>(PickSubTarget::Edge);
                result.distance = edgeDist * zoom;
                result.hitX = world.x;
                result.hitY = world.y;
                return result;
            }
        }
    }
    return result;
}
