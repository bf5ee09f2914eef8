#pragma once

#include "atlas/core/options.h"
#include "atlas/core/types.h"

// Pan offset and zoom factor mapping canvas pixels to world space:
//   world = (screen - pan) / zoom
// Zoom is always kept inside [options.minZoom, options.maxZoom].
class Viewport {
public:
    explicit Viewport(const EditorOptions& options);

    const Point2& pan() const noexcept { return pan_; }
    float zoom() const noexcept { return zoom_; }
    bool isPanning() const noexcept { return panning_; }

    // Wheel zoom, anchored at the canvas origin (pan is left untouched).
    bool zoomBy(float deltaY);
    bool zoomStep(float factor);
    bool zoomIn();
    bool zoomOut();

    // Drag panning: each move repositions absolutely relative to the recorded start.
    void beginPan(float pointerX, float pointerY);
    bool panTo(float pointerX, float pointerY);
    void endPan() noexcept { panning_ = false; }

    void reset();
    void setState(float panX, float panY, float zoom);

    Point2 toWorld(float screenX, float screenY) const noexcept;
    Point2 toScreen(float worldX, float worldY) const noexcept;

private:
    float clampZoom(float z) const noexcept;
    bool applyZoom(float z);

    const EditorOptions& options_;
    Point2 pan_{0.0f, 0.0f};
    float zoom_{1.0f};
    bool panning_{false};
    Point2 panStart_{0.0f, 0.0f};
};
