// MapEngine render buffers.

#include "atlas/engine.h"

MapEngine::RenderBufferMeta MapEngine::buildRenderBuffers() {
    const bool drafting = tools_.activeTool() == Tool::DrawZone
        && tools_.zonePhase() == ZoneDraftPhase::Accumulating;
    const ZonePreview preview = drafting ? tools_.zonePreview() : ZonePreview{};

    atlas::buildMapRenderBuffers(
        layers_.layers(),
        viewport_,
        selectionManager_.selectedId(),
        drafting ? &preview : nullptr,
        renderBuffers_);

    return RenderBufferMeta{
        generation_,
        static_cast<std::uint32_t>(renderBuffers_.primitives.size()),
        static_cast<std::uint32_t>(renderBuffers_.data.size()),
        reinterpret_cast<std::uintptr_t>(renderBuffers_.primitives.data()),
        reinterpret_cast<std::uintptr_t>(renderBuffers_.data.data()),
    };
}
