#include "atlas/interaction/tool_state.h"
#include <cmath>
#include <utility>

bool ToolStateMachine::setTool(Tool tool) {
    if (tool == tool_) return false;
    if (tool_ == Tool::DrawZone) {
        resetZone();
    }
    tool_ = tool;
    return true;
}

bool ToolStateMachine::appendZoneVertex(const Point2& world) {
    if (tool_ != Tool::DrawZone) return false;
    if (!std::isfinite(world.x) || !std::isfinite(world.y)) return false;
    if (!vertices_.empty()) {
        const Point2& last = vertices_.back();
        if (std::fabs(last.x - world.x) <= kDuplicateVertexEpsilon
            && std::fabs(last.y - world.y) <= kDuplicateVertexEpsilon) {
            return false;
        }
    }
    vertices_.push_back(world);
    phase_ = ZoneDraftPhase::Accumulating;
    return true;
}

void ToolStateMachine::updateZoneCursor(const Point2& world) {
    if (phase_ != ZoneDraftPhase::Accumulating) return;
    cursor_ = world;
    hasCursor_ = true;
}

ZoneCompletion ToolStateMachine::completeZone(std::vector<Point2>& outPoints) {
    outPoints.clear();
    if (phase_ != ZoneDraftPhase::Accumulating) {
        return ZoneCompletion::None;
    }

    if (vertices_.size() >= kMinZoneVertices) {
        outPoints = std::move(vertices_);
        lastCompletion_ = ZoneCompletion::Committed;
    } else {
        lastCompletion_ = ZoneCompletion::Discarded;
    }

    vertices_.clear();
    phase_ = ZoneDraftPhase::Idle;
    hasCursor_ = false;
    return lastCompletion_;
}

void ToolStateMachine::resetZone() {
    vertices_.clear();
    phase_ = ZoneDraftPhase::Idle;
    hasCursor_ = false;
}

ZonePreview ToolStateMachine::zonePreview() const {
    ZonePreview preview;
    if (phase_ != ZoneDraftPhase::Accumulating) return preview;
    preview.vertices = vertices_;
    preview.hasCursor = hasCursor_;
    preview.cursor = cursor_;
    return preview;
}
