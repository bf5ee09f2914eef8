#ifndef ATLAS_RENDER_H
#define ATLAS_RENDER_H

#include "atlas/core/types.h"
#include "atlas/interaction/tool_state.h"
#include "atlas/protocol/protocol_types.h"
#include "atlas/viewport/viewport.h"
#include <cstdint>
#include <vector>

namespace atlas {

struct RenderBuffers {
    std::vector<protocol::RenderPrimitive> primitives;
    std::vector<float> data; // screen-space x,y pairs

    void clear() {
        primitives.clear();
        data.clear();
    }
};

// Rebuild the screen-space primitives for every visible layer, bottom layer first.
// Markers become Point primitives, zones Polygon primitives. The zone draft, when
// present, is appended last so it draws over the document.
void buildMapRenderBuffers(
    const std::vector<MapLayer>& layers,
    const Viewport& viewport,
    std::uint32_t selectedId,
    const ZonePreview* zonePreview,
    RenderBuffers& out
);

} // namespace atlas

#endif // ATLAS_RENDER_H
