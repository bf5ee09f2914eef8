// MapEngine event stream: coalesced change records flushed into a bounded queue.

#include "atlas/engine.h"

#include <algorithm>

void MapEngine::clearPendingEvents() {
    pendingObjectChanges_.clear();
    pendingObjectCreates_.clear();
    pendingObjectDeletes_.clear();
    pendingLayerChanges_.clear();
    pendingPersistFailures_.clear();
    pendingDocMask_ = 0;
    pendingSelectionChanged_ = false;
    pendingInspectorChanged_ = false;
    pendingViewportChanged_ = false;
    pendingToolChanged_ = false;
}

void MapEngine::clearEventState() {
    eventHead_ = 0;
    eventTail_ = 0;
    eventCount_ = 0;
    eventOverflowed_ = false;
    eventOverflowGeneration_ = 0;
    clearPendingEvents();
}

void MapEngine::recordDocChanged(std::uint32_t mask) {
    if (eventOverflowed_) return;
    pendingDocMask_ |= mask;
}

void MapEngine::recordObjectChanged(std::uint32_t id, std::uint32_t mask) {
    if (eventOverflowed_) return;
    if (pendingObjectDeletes_.find(id) != pendingObjectDeletes_.end()) return;
    pendingObjectChanges_[id] |= mask;
    recordDocChanged(mask);
}

void MapEngine::recordObjectCreated(std::uint32_t id, std::uint32_t kind) {
    if (eventOverflowed_) return;
    pendingObjectDeletes_.erase(id);
    pendingObjectChanges_.erase(id);
    pendingObjectCreates_[id] = kind;
    recordDocChanged(
        static_cast<std::uint32_t>(ChangeMask::Geometry)
        | static_cast<std::uint32_t>(ChangeMask::Layer)
    );
}

void MapEngine::recordObjectDeleted(std::uint32_t id) {
    if (eventOverflowed_) return;
    pendingObjectChanges_.erase(id);
    // Created and deleted within one poll: the host never saw it.
    if (pendingObjectCreates_.erase(id) == 0) {
        pendingObjectDeletes_.insert(id);
    }
    recordDocChanged(
        static_cast<std::uint32_t>(ChangeMask::Geometry)
        | static_cast<std::uint32_t>(ChangeMask::Layer)
    );
}

void MapEngine::recordLayerChanged(std::uint32_t layerId, std::uint32_t mask) {
    if (eventOverflowed_) return;
    pendingLayerChanges_[layerId] |= mask;
    recordDocChanged(static_cast<std::uint32_t>(ChangeMask::Layer));
}

void MapEngine::recordSelectionChanged() {
    if (eventOverflowed_) return;
    pendingSelectionChanged_ = true;
}

void MapEngine::recordInspectorChanged() {
    if (eventOverflowed_) return;
    pendingInspectorChanged_ = true;
}

void MapEngine::recordViewportChanged() {
    if (eventOverflowed_) return;
    pendingViewportChanged_ = true;
}

void MapEngine::recordToolChanged() {
    if (eventOverflowed_) return;
    pendingToolChanged_ = true;
}

void MapEngine::recordPersistFailed(std::uint32_t revision, StoreStatus status) {
    if (eventOverflowed_) return;
    pendingPersistFailures_.push_back(EngineEvent{
        static_cast<std::uint16_t>(EventType::PersistFailed),
        0,
        revision,
        static_cast<std::uint32_t>(status),
        0,
        0,
    });
}

bool MapEngine::pushEvent(const EngineEvent& ev) {
    if (eventOverflowed_) return false;
    if (eventCount_ >= kMaxEvents) {
        eventOverflowed_ = true;
        eventOverflowGeneration_ = generation_;
        eventHead_ = 0;
        eventTail_ = 0;
        eventCount_ = 0;
        return false;
    }
    eventQueue_[eventTail_] = ev;
    eventTail_ = (eventTail_ + 1) % kMaxEvents;
    eventCount_++;
    return true;
}

void MapEngine::flushPendingEvents() {
    if (eventOverflowed_) {
        clearPendingEvents();
        return;
    }

    auto pushOrOverflow = [&](const EngineEvent& ev) -> bool {
        if (!pushEvent(ev)) {
            clearPendingEvents();
            return false;
        }
        return true;
    };

    auto pushSorted = [&](EventType type, const std::unordered_map<std::uint32_t, std::uint32_t>& pending) -> bool {
        std::vector<std::uint32_t> ids;
        ids.reserve(pending.size());
        for (const auto& kv : pending) ids.push_back(kv.first);
        std::sort(ids.begin(), ids.end());
        for (const std::uint32_t id : ids) {
            if (!pushOrOverflow(EngineEvent{
                    static_cast<std::uint16_t>(type),
                    0,
                    id,
                    pending.at(id),
                    0,
                    0,
                })) {
                return false;
            }
        }
        return true;
    };

    if (pendingDocMask_ != 0) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::DocChanged),
                0,
                pendingDocMask_,
                generation_,
                0,
                0,
            })) {
            return;
        }
    }

    if (!pushSorted(EventType::LayerChanged, pendingLayerChanges_)) return;
    if (!pushSorted(EventType::ObjectCreated, pendingObjectCreates_)) return;
    if (!pushSorted(EventType::ObjectChanged, pendingObjectChanges_)) return;

    if (!pendingObjectDeletes_.empty()) {
        std::vector<std::uint32_t> ids(pendingObjectDeletes_.begin(), pendingObjectDeletes_.end());
        std::sort(ids.begin(), ids.end());
        for (const std::uint32_t id : ids) {
            if (!pushOrOverflow(EngineEvent{
                    static_cast<std::uint16_t>(EventType::ObjectDeleted),
                    0,
                    id,
                    0,
                    0,
                    0,
                })) {
                return;
            }
        }
    }

    if (pendingSelectionChanged_) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::SelectionChanged),
                0,
                selectionManager_.getGeneration(),
                selectionManager_.selectedId(),
                0,
                0,
            })) {
            return;
        }
    }

    if (pendingInspectorChanged_) {
        const InspectorState& inspector = selectionManager_.inspector();
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::InspectorChanged),
                0,
                inspector.objectId,
                static_cast<std::uint32_t>(inspector.status),
                inspector.entity.id,
                0,
            })) {
            return;
        }
    }

    if (pendingViewportChanged_) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::ViewportChanged),
                0,
                generation_,
                0,
                0,
                0,
            })) {
            return;
        }
    }

    if (pendingToolChanged_) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::ToolChanged),
                0,
                static_cast<std::uint32_t>(tools_.activeTool()),
                0,
                0,
                0,
            })) {
            return;
        }
    }

    for (const EngineEvent& ev : pendingPersistFailures_) {
        if (!pushOrOverflow(ev)) return;
    }

    clearPendingEvents();
}

MapEngine::EventBufferMeta MapEngine::pollEvents(std::uint32_t maxEvents) {
    flushPendingEvents();

    eventBuffer_.clear();
    if (eventOverflowed_) {
        eventBuffer_.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::Overflow),
            0,
            eventOverflowGeneration_,
            0,
            0,
            0,
        });
        return EventBufferMeta{
            generation_,
            static_cast<std::uint32_t>(eventBuffer_.size()),
            reinterpret_cast<std::uintptr_t>(eventBuffer_.data()),
        };
    }

    if (eventCount_ == 0 || maxEvents == 0) {
        return EventBufferMeta{generation_, 0, 0};
    }

    const std::size_t count = std::min<std::size_t>(maxEvents, eventCount_);
    eventBuffer_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        eventBuffer_.push_back(eventQueue_[eventHead_]);
        eventHead_ = (eventHead_ + 1) % kMaxEvents;
        eventCount_--;
    }

    return EventBufferMeta{
        generation_,
        static_cast<std::uint32_t>(eventBuffer_.size()),
        reinterpret_cast<std::uintptr_t>(eventBuffer_.data()),
    };
}

void MapEngine::ackResync(std::uint32_t resyncGeneration) {
    if (!eventOverflowed_) return;
    if (resyncGeneration < eventOverflowGeneration_) return;
    clearEventState();
}
