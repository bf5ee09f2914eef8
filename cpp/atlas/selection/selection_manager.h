#pragma once

#include "atlas/core/types.h"
#include "atlas/services/entity_store.h"
#include <cstdint>

class MapEngine; // Forward declaration

enum class InspectorStatus : std::uint8_t {
    Empty = 0,
    Loading = 1,
    Loaded = 2,
    NoLinkedData = 3,
};

// What the side panel shows for the selected object.
struct InspectorState {
    InspectorStatus status{InspectorStatus::Empty};
    std::uint32_t objectId{0};
    MapObjectKind objectKind{MapObjectKind::Marker};
    LinkKind linkKind{LinkKind::None};
    EntityRecord entity{};
};

// Single-object selection plus the inspector content resolved for it.
// Selection is independent of the active tool.
class SelectionManager {
public:
    explicit SelectionManager(MapEngine& engine);

    bool select(std::uint32_t objectId);
    void clearSelection();

    std::uint32_t selectedId() const noexcept { return selectedId_; }
    std::uint32_t getGeneration() const noexcept { return generation_; }
    const InspectorState& inspector() const noexcept { return inspector_; }

    // Drops the selection if the selected object no longer exists.
    void prune();
    void clear(); // Resets state without events

private:
    void resolveInspector();
    void setInspector(InspectorState state);

    MapEngine& engine_;
    std::uint32_t selectedId_{0};
    std::uint32_t generation_{0};
    std::uint32_t fetchGeneration_{0};
    InspectorState inspector_{};
};
