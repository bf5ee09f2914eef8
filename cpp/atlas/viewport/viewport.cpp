#include "atlas/viewport/viewport.h"
#include <algorithm>
#include <cmath>

Viewport::Viewport(const EditorOptions& options)
    : options_(options) {}

float Viewport::clampZoom(float z) const noexcept {
    return std::clamp(z, options_.minZoom, options_.maxZoom);
}

bool Viewport::applyZoom(float z) {
    if (!std::isfinite(z)) return false;
    const float next = clampZoom(z);
    if (next == zoom_) return false;
    zoom_ = next;
    return true;
}

bool Viewport::zoomBy(float deltaY) {
    return applyZoom(zoom_ - deltaY * options_.zoomSensitivity);
}

bool Viewport::zoomStep(float factor) {
    if (!(factor > 0.0f)) return false;
    return applyZoom(zoom_ * factor);
}

bool Viewport::zoomIn() {
    return zoomStep(options_.zoomStepFactor);
}

bool Viewport::zoomOut() {
    return zoomStep(1.0f / options_.zoomStepFactor);
}

void Viewport::beginPan(float pointerX, float pointerY) {
    panning_ = true;
    panStart_ = Point2{pointerX - pan_.x, pointerY - pan_.y};
}

bool Viewport::panTo(float pointerX, float pointerY) {
    if (!panning_) return false;
    const Point2 next{pointerX - panStart_.x, pointerY - panStart_.y};
    if (next.x == pan_.x && next.y == pan_.y) return false;
    pan_ = next;
    return true;
}

void Viewport::reset() {
    pan_ = Point2{0.0f, 0.0f};
    zoom_ = 1.0f;
    panning_ = false;
}

void Viewport::setState(float panX, float panY, float zoom) {
    if (std::isfinite(panX) && std::isfinite(panY)) {
        pan_ = Point2{panX, panY};
    }
    applyZoom(zoom);
}

Point2 Viewport::toWorld(float screenX, float screenY) const noexcept {
    return Point2{(screenX - pan_.x) / zoom_, (screenY - pan_.y) / zoom_};
}

Point2 Viewport::toScreen(float worldX, float worldY) const noexcept {
    return Point2{worldX * zoom_ + pan_.x, worldY * zoom_ + pan_.y};
}
