#pragma once

#include "atlas/core/options.h"
#include "atlas/core/types.h"
#include "atlas/viewport/viewport.h"
#include <cstdint>
#include <vector>

enum class PickSubTarget : std::uint8_t {
    None = 0,
    Body = 1,
    Edge = 2,
};

// Return struct for picking
struct PickResult {
    std::uint32_t id;        // 0 when nothing was hit
    std::uint32_t layerId;
    std::uint16_t kind;      // MapObjectKind
    std::uint8_t subTarget;  // PickSubTarget
    float distance;          // screen pixels
    float hitX, hitY;        // world hit point
};

// Hit-testing of visible map objects. Tolerances are given in screen pixels and
// converted through the current zoom so picking feels the same at every scale.
class PickSystem {
public:
    explicit PickSystem(const EditorOptions& options);

    // Top-most hit: later layers first, and within a layer later objects first.
    PickResult pick(const std::vector<MapLayer>& layers, const Viewport& viewport, float screenX, float screenY) const;
    std::uint32_t pickId(const std::vector<MapLayer>& layers, const Viewport& viewport, float screenX, float screenY) const {
        return pick(layers, viewport, screenX, screenY).id;
    }

    static bool pointInPolygon(const std::vector<Point2>& poly, float x, float y);
    static float distanceToPolygonEdges(const std::vector<Point2>& poly, float x, float y);

private:
    const EditorOptions& options_;
};
