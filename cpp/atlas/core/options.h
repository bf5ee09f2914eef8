#pragma once

#include "atlas/core/types.h"
#include <cstdint>

enum class Key : std::uint32_t {
    Unknown = 0,
    Enter = 1,
    Escape = 2,
    Delete = 3,
};

// Editor tuning knobs. Defaults reproduce the behaviour of the web editor.
struct EditorOptions {
    float zoomSensitivity = 0.001f;
    float minZoom = 0.1f;
    float maxZoom = 5.0f;
    float zoomStepFactor = 1.2f;
    float markerPickRadiusPx = 12.0f;
    float zoneEdgeTolerancePx = 4.0f;
    std::uint32_t defaultZoneColor = kDefaultZoneColor;
    Key confirmKey = Key::Enter;
};
