// MapEngine canvas input: pointer, wheel and keyboard dispatch by active tool.

#include "atlas/engine.h"
#include "atlas/core/logging.h"

#include <utility>

void MapEngine::onPointerDown(float x, float y, PointerButton button) {
    if (button != PointerButton::Primary) return;
    if (tools_.activeTool() != Tool::Pan) return;
    viewport_.beginPan(x, y);
}

void MapEngine::onPointerMove(float x, float y) {
    if (viewport_.isPanning()) {
        if (viewport_.panTo(x, y)) {
            recordViewportChanged();
        }
        return;
    }
    if (tools_.activeTool() == Tool::DrawZone) {
        tools_.updateZoneCursor(viewport_.toWorld(x, y));
    }
}

void MapEngine::onPointerUp(float x, float y, PointerButton button) {
    (void)x;
    (void)y;
    if (button != PointerButton::Primary) return;
    viewport_.endPan();
}

void MapEngine::onPointerLeave() {
    viewport_.endPan();
}

void MapEngine::onClick(float x, float y) {
    switch (tools_.activeTool()) {
        case Tool::Pan:
            return;
        case Tool::Select:
            handleSelectClick(x, y);
            return;
        case Tool::AddLocation:
        case Tool::AddQuest:
            handlePlacementClick(x, y);
            return;
        case Tool::DrawZone:
            handleZoneClick(x, y);
            return;
    }
}

void MapEngine::onDoubleClick(float x, float y) {
    (void)x;
    (void)y;
    // The two clicks of a double-click arrive first through onClick; the second
    // one lands on the previous vertex and is dropped by the duplicate check.
    if (tools_.activeTool() != Tool::DrawZone) return;
    completeZoneDraft();
}

void MapEngine::onWheel(float deltaY) {
    if (viewport_.zoomBy(deltaY)) {
        recordViewportChanged();
    }
}

void MapEngine::onKeyDown(Key key) {
    if (key == options_.confirmKey) {
        if (tools_.activeTool() == Tool::DrawZone && !tools_.zoneVertices().empty()) {
            completeZoneDraft();
        }
        return;
    }
    if (key == Key::Escape) {
        cancelZoneDraft();
        return;
    }
    if (key == Key::Delete && tools_.activeTool() == Tool::Select) {
        deleteSelected();
    }
}

void MapEngine::handleSelectClick(float x, float y) {
    const std::uint32_t hit = pick(x, y);
    if (hit == 0) {
        clearSelection();
        return;
    }
    selectObject(hit);
}

void MapEngine::handlePlacementClick(float x, float y) {
    if (!requireActiveLayer()) return;
    if (linking_.hasPending()) {
        ATLAS_LOG_DEBUG("placement ignored while a link is pending");
        return;
    }
    const Point2 world = viewport_.toWorld(x, y);
    addMarker(layers_.activeLayerId(), world.x, world.y, linkKindForTool(tools_.activeTool()));
}

void MapEngine::handleZoneClick(float x, float y) {
    if (tools_.zonePhase() == ZoneDraftPhase::Idle && !requireActiveLayer()) return;
    const Point2 world = viewport_.toWorld(x, y);
    tools_.appendZoneVertex(world);
    tools_.updateZoneCursor(world);
}

void MapEngine::completeZoneDraft() {
    std::vector<Point2> points;
    const ZoneCompletion result = tools_.completeZone(points);
    if (result == ZoneCompletion::Discarded) {
        ATLAS_LOG_DEBUG("zone discarded, fewer than %zu vertices", ToolStateMachine::kMinZoneVertices);
        return;
    }
    if (result != ZoneCompletion::Committed) return;

    if (!layers_.activeLayer()) {
        requireActiveLayer();
        return;
    }
    addZone(layers_.activeLayerId(), points);
}
