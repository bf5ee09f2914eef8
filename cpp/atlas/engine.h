#pragma once

#include "atlas/core/options.h"
#include "atlas/core/types.h"
#include "atlas/interaction/pick_system.h"
#include "atlas/interaction/tool_state.h"
#include "atlas/layers/layer_model.h"
#include "atlas/layers/object_store.h"
#include "atlas/linking/linking_workflow.h"
#include "atlas/persistence/map_snapshot.h"
#include "atlas/protocol/protocol_types.h"
#include "atlas/render/render.h"
#include "atlas/selection/selection_manager.h"
#include "atlas/services/entity_store.h"
#include "atlas/services/map_store.h"
#include "atlas/services/modal_service.h"
#include "atlas/services/store_status.h"
#include "atlas/viewport/viewport.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Editing session for one map. Receives canvas input, dispatches it by the active
// tool, keeps the document in memory and writes every structural change through
// the MapStore. The host reads back render buffers and polls coalesced events.
class MapEngine {
    friend class SelectionManager;
    friend class LinkingWorkflow;
    friend class MapEngineTestAccessor;
public:
    using EngineEvent = atlas::protocol::EngineEvent;
    using EventType = atlas::protocol::EventType;
    using ChangeMask = atlas::protocol::ChangeMask;
    using EventBufferMeta = atlas::protocol::EventBufferMeta;
    using RenderBufferMeta = atlas::protocol::RenderBufferMeta;
    using ByteBufferMeta = atlas::protocol::ByteBufferMeta;
    using CanvasCursor = atlas::protocol::CanvasCursor;

    enum class PointerButton : std::uint32_t {
        Primary = 0,
        Middle = 1,
        Secondary = 2,
    };

    struct PersistState {
        std::uint32_t revision;
        std::uint32_t inFlight;
        StoreStatus lastStatus;
        bool diverged;
    };

    MapEngine();
    // Store and dialog results that arrive after destruction are dropped.
    ~MapEngine();
    MapEngine(const MapEngine&) = delete;
    MapEngine& operator=(const MapEngine&) = delete;

    // Services are borrowed; they must outlive the engine or be reset to nullptr.
    // Callbacks they still hold may safely fire after the engine is gone.
    void setServices(MapStore* mapStore, EntityStore* locations, EntityStore* quests, ModalService* modals);
    void setOptions(const EditorOptions& options);
    const EditorOptions& options() const noexcept { return options_; }

    // Session
    void loadMap(const MapDocument& map);
    bool openMap(std::uint32_t mapId);
    bool hasMap() const noexcept { return mapLoaded_; }
    const MapDocument& map() const noexcept { return map_; }
    std::uint32_t getGeneration() const noexcept { return generation_; }
    EngineError getLastError() const noexcept { return lastError; }

    // Tools
    Tool activeTool() const noexcept { return tools_.activeTool(); }
    bool setTool(Tool tool);
    ZoneDraftPhase zoneDraftPhase() const noexcept { return tools_.zonePhase(); }
    const std::vector<Point2>& zoneDraftVertices() const noexcept { return tools_.zoneVertices(); }
    bool cancelZoneDraft();

    // Viewport
    const Viewport& viewport() const noexcept { return viewport_; }
    bool zoomIn();
    bool zoomOut();
    void resetView();
    Point2 screenToWorld(float x, float y) const noexcept { return viewport_.toWorld(x, y); }
    Point2 worldToScreen(float x, float y) const noexcept { return viewport_.toScreen(x, y); }

    // Canvas input. Coordinates are canvas-relative screen pixels.
    void onPointerDown(float x, float y, PointerButton button);
    void onPointerMove(float x, float y);
    void onPointerUp(float x, float y, PointerButton button);
    void onPointerLeave();
    void onClick(float x, float y);
    void onDoubleClick(float x, float y);
    void onWheel(float deltaY);
    void onKeyDown(Key key);
    CanvasCursor getCursor() const noexcept;

    // Layers
    const std::vector<MapLayer>& layers() const noexcept { return layers_.layers(); }
    const MapLayer* findLayer(std::uint32_t layerId) const { return layers_.findLayer(layerId); }
    std::uint32_t activeLayerId() const noexcept { return layers_.activeLayerId(); }
    std::uint32_t addLayer(const std::string& name = std::string());
    // Asks the modal service for confirmation, then deletes.
    bool requestDeleteLayer(std::uint32_t layerId);
    bool deleteLayer(std::uint32_t layerId);
    bool toggleLayerVisibility(std::uint32_t layerId);
    bool setActiveLayer(std::uint32_t layerId);
    bool ensureActiveLayer();
    bool renameLayer(std::uint32_t layerId, const std::string& name);
    bool setLayerType(std::uint32_t layerId, LayerType type);

    // Objects
    const MapObject* findObject(std::uint32_t id) const { return objects_.findObject(id); }
    // Places an unlinked marker and routes it to the link dialog. Returns the pending id.
    std::uint32_t addMarker(std::uint32_t layerId, float worldX, float worldY, LinkKind kind);
    std::uint32_t addZone(std::uint32_t layerId, const std::vector<Point2>& points);
    bool moveObject(std::uint32_t id, float x, float y);
    bool deleteObject(std::uint32_t id);
    bool setZoneProps(std::uint32_t id, const std::string& name, std::uint32_t colorRGBA);

    // Linking
    const LinkingWorkflow& linking() const noexcept { return linking_; }
    bool hasPendingLink() const noexcept { return linking_.hasPending(); }
    bool confirmPendingLink(std::uint32_t entityId);
    bool cancelPendingLink();
    bool createAndLink(const std::string& name, const std::string& description);
    bool listLinkCandidates(const std::string& filter, LinkingWorkflow::CandidateCallback done);

    // Selection
    bool selectObject(std::uint32_t id);
    void clearSelection();
    std::uint32_t getSelectedId() const noexcept { return selectionManager_.selectedId(); }
    std::uint32_t getSelectionGeneration() const noexcept { return selectionManager_.getGeneration(); }
    const InspectorState& getInspector() const noexcept { return selectionManager_.inspector(); }
    bool deleteSelected();

    // Picking
    std::uint32_t pick(float x, float y) const;
    PickResult pickEx(float x, float y) const;

    // Map details
    bool setMapImage(const std::string& imageDataUrl);
    bool setMapDetails(const std::string& name, const std::string& description);

    // Persistence
    PersistState getPersistState() const noexcept {
        return PersistState{revision_, inFlightWrites_, lastPersistStatus_, diverged_};
    }

    // Rendering
    RenderBufferMeta buildRenderBuffers();
    const atlas::RenderBuffers& renderBuffers() const noexcept { return renderBuffers_; }

    // Events
    EventBufferMeta pollEvents(std::uint32_t maxEvents);
    void ackResync(std::uint32_t resyncGeneration);

    // Snapshot
    ByteBufferMeta saveSnapshot() const;
    const std::vector<std::uint8_t>& snapshotBytes() const noexcept { return snapshotBytes_; }
    EngineError loadSnapshot(const std::uint8_t* src, std::uint32_t byteCount);
    void loadSnapshotFromPtr(std::uintptr_t ptr, std::uint32_t byteCount);

private:
    // Session helpers
    void resetSession();
    std::uint32_t allocateId();
    void trackNextId(std::uint32_t id);
    void showAlert(const std::string& title, const std::string& message);
    void showModal(const ModalRequest& request, ModalService::ResultCallback onClose);
    EntityStore* entityStoreFor(LinkKind kind) const;
    // Expires when the engine is destroyed; async callbacks check it first.
    std::weak_ptr<bool> lifetime() const { return alive_; }
    bool requireActiveLayer();

    // Tool dispatch
    void handleSelectClick(float x, float y);
    void handlePlacementClick(float x, float y);
    void handleZoneClick(float x, float y);
    void completeZoneDraft();

    // Called by LinkingWorkflow once an entity id is known.
    bool commitLinkedMarker(MapObject candidate);

    // Persistence
    void persistLayers();
    void persistPatch(MapPatch patch);
    void onPersistResult(std::uint32_t session, std::uint32_t revision, StoreStatus status);

    // Events
    void clearEventState();
    void recordDocChanged(std::uint32_t mask);
    void recordObjectChanged(std::uint32_t id, std::uint32_t mask);
    void recordObjectCreated(std::uint32_t id, std::uint32_t kind);
    void recordObjectDeleted(std::uint32_t id);
    void recordLayerChanged(std::uint32_t layerId, std::uint32_t mask);
    void recordSelectionChanged();
    void recordInspectorChanged();
    void recordViewportChanged();
    void recordToolChanged();
    void recordPersistFailed(std::uint32_t revision, StoreStatus status);
    bool pushEvent(const EngineEvent& ev);
    void flushPendingEvents();
    void clearPendingEvents();

    void clearError() const { lastError = EngineError::Ok; }
    void setError(EngineError err) const { lastError = err; }

    EditorOptions options_{};
    MapDocument map_{};
    bool mapLoaded_{false};
    LayerModel layers_;
    GeometryObjectStore objects_;
    Viewport viewport_;
    ToolStateMachine tools_{};
    PickSystem pickSystem_;
    LinkingWorkflow linking_;
    SelectionManager selectionManager_;

    MapStore* mapStore_{nullptr};
    EntityStore* locationStore_{nullptr};
    EntityStore* questStore_{nullptr};
    ModalService* modalService_{nullptr};

    std::uint32_t nextId_{1};
    std::uint32_t generation_{0};
    std::uint32_t session_{0};
    std::uint32_t openRequest_{0};

    std::uint32_t revision_{0};
    std::uint32_t inFlightWrites_{0};
    StoreStatus lastPersistStatus_{StoreStatus::Ok};
    bool diverged_{false};

    atlas::RenderBuffers renderBuffers_{};
    mutable std::vector<std::uint8_t> snapshotBytes_{};

    static constexpr std::size_t kMaxEvents = 2048;
    std::vector<EngineEvent> eventQueue_{};
    std::size_t eventHead_{0};
    std::size_t eventTail_{0};
    std::size_t eventCount_{0};
    bool eventOverflowed_{false};
    std::uint32_t eventOverflowGeneration_{0};
    std::vector<EngineEvent> eventBuffer_{};

    std::unordered_map<std::uint32_t, std::uint32_t> pendingObjectChanges_{};
    std::unordered_map<std::uint32_t, std::uint32_t> pendingObjectCreates_{};
    std::unordered_set<std::uint32_t> pendingObjectDeletes_{};
    std::unordered_map<std::uint32_t, std::uint32_t> pendingLayerChanges_{};
    std::vector<EngineEvent> pendingPersistFailures_{};
    std::uint32_t pendingDocMask_{0};
    bool pendingSelectionChanged_{false};
    bool pendingInspectorChanged_{false};
    bool pendingViewportChanged_{false};
    bool pendingToolChanged_{false};

    mutable EngineError lastError{EngineError::Ok};

    std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};
