#pragma once

#include "atlas/core/types.h"
#include <cstddef>
#include <cstdint>
#include <vector>

enum class ZoneDraftPhase : std::uint8_t {
    Idle = 0,
    Accumulating = 1,
};

enum class ZoneCompletion : std::uint8_t {
    None = 0,
    Committed = 1,
    Discarded = 2,
};

// Render-only feedback for an in-progress zone.
struct ZonePreview {
    std::vector<Point2> vertices;
    bool hasCursor{false};
    Point2 cursor{0.0f, 0.0f};
};

inline bool isPlacementTool(Tool tool) noexcept {
    return tool == Tool::AddLocation || tool == Tool::AddQuest;
}

inline LinkKind linkKindForTool(Tool tool) noexcept {
    switch (tool) {
        case Tool::AddLocation: return LinkKind::Location;
        case Tool::AddQuest: return LinkKind::Quest;
        default: return LinkKind::None;
    }
}

class ToolStateMachine {
public:
    static constexpr std::size_t kMinZoneVertices = 3;
    static constexpr float kDuplicateVertexEpsilon = 1e-4f;

    Tool activeTool() const noexcept { return tool_; }

    // Plain assignment; leaving DrawZone drops any pending vertices.
    bool setTool(Tool tool);

    ZoneDraftPhase zonePhase() const noexcept { return phase_; }
    const std::vector<Point2>& zoneVertices() const noexcept { return vertices_; }
    ZoneCompletion lastCompletion() const noexcept { return lastCompletion_; }

    // Appends a world-space vertex. A vertex equal to the previous one is ignored so
    // that the two clicks preceding a double-click only contribute once.
    bool appendZoneVertex(const Point2& world);
    void updateZoneCursor(const Point2& world);

    // Moves the draft to Committed (>= kMinZoneVertices, points moved into outPoints)
    // or Discarded. Either way the draft returns to Idle.
    ZoneCompletion completeZone(std::vector<Point2>& outPoints);
    void resetZone();

    ZonePreview zonePreview() const;

private:
    Tool tool_{Tool::Pan};
    ZoneDraftPhase phase_{ZoneDraftPhase::Idle};
    std::vector<Point2> vertices_;
    bool hasCursor_{false};
    Point2 cursor_{0.0f, 0.0f};
    ZoneCompletion lastCompletion_{ZoneCompletion::None};
};
