#include "tests/test_support.h"
#include "tests/test_accessors.h"
#include <limits>

using namespace atlas_test;
using Cursor = MapEngine::CanvasCursor;
using Button = MapEngine::PointerButton;

TEST(EngineInputTest, PanToolDragsViewport) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());

    h.engine.onPointerDown(100.0f, 100.0f, Button::Primary);
    EXPECT_EQ(h.engine.getCursor(), Cursor::Grabbing);
    h.engine.onPointerMove(150.0f, 80.0f);
    EXPECT_FLOAT_EQ(h.engine.viewport().pan().x, 50.0f);
    EXPECT_FLOAT_EQ(h.engine.viewport().pan().y, -20.0f);
    h.engine.onPointerMove(160.0f, 80.0f);
    EXPECT_FLOAT_EQ(h.engine.viewport().pan().x, 60.0f);

    h.engine.onPointerUp(160.0f, 80.0f, Button::Primary);
    EXPECT_EQ(h.engine.getCursor(), Cursor::Grab);
    h.engine.onPointerMove(300.0f, 300.0f);
    EXPECT_FLOAT_EQ(h.engine.viewport().pan().x, 60.0f);
    EXPECT_TRUE(h.mapStore.writes.empty());
}

TEST(EngineInputTest, SecondaryButtonAndOtherToolsDoNotPan) {
    EditorHarness h;
    h.engine.onPointerDown(0.0f, 0.0f, Button::Secondary);
    EXPECT_FALSE(h.engine.viewport().isPanning());

    h.engine.setTool(Tool::Select);
    h.engine.onPointerDown(0.0f, 0.0f, Button::Primary);
    EXPECT_FALSE(h.engine.viewport().isPanning());
}

TEST(EngineInputTest, PointerLeaveEndsPan) {
    EditorHarness h;
    h.engine.onPointerDown(0.0f, 0.0f, Button::Primary);
    h.engine.onPointerLeave();
    EXPECT_FALSE(h.engine.viewport().isPanning());
}

TEST(EngineInputTest, CursorFollowsTool) {
    EditorHarness h;
    EXPECT_EQ(h.engine.getCursor(), Cursor::Grab);
    h.engine.setTool(Tool::Select);
    EXPECT_EQ(h.engine.getCursor(), Cursor::Default);
    h.engine.setTool(Tool::AddLocation);
    EXPECT_EQ(h.engine.getCursor(), Cursor::Crosshair);
    h.engine.setTool(Tool::AddQuest);
    EXPECT_EQ(h.engine.getCursor(), Cursor::Crosshair);
    h.engine.setTool(Tool::DrawZone);
    EXPECT_EQ(h.engine.getCursor(), Cursor::Crosshair);
}

TEST(EngineInputTest, WheelZoomAnchoredAtOrigin) {
    EditorHarness h;
    h.engine.onWheel(-100.0f);
    EXPECT_NEAR(h.engine.viewport().zoom(), 1.1f, 1e-5f);
    EXPECT_FLOAT_EQ(h.engine.viewport().pan().x, 0.0f);
    h.engine.onWheel(0.0f);
    EXPECT_NEAR(h.engine.viewport().zoom(), 1.1f, 1e-5f);
}

TEST(EngineInputTest, DrawZoneCommitsOnConfirmKey) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    h.engine.setActiveLayer(1);
    h.engine.setTool(Tool::DrawZone);

    h.engine.onClick(0.0f, 0.0f);
    h.engine.onClick(10.0f, 0.0f);
    h.engine.onClick(10.0f, 10.0f);
    EXPECT_EQ(h.engine.zoneDraftVertices().size(), 3u);
    h.engine.onKeyDown(Key::Enter);

    EXPECT_EQ(h.engine.zoneDraftPhase(), ZoneDraftPhase::Idle);
    ASSERT_EQ(h.engine.layers()[0].objects.size(), 1u);
    const MapObject& zone = h.engine.layers()[0].objects[0];
    ASSERT_NE(zone.zone(), nullptr);
    const std::vector<Point2>& points = zone.zone()->points;
    ASSERT_EQ(points.size(), 3u);
    EXPECT_FLOAT_EQ(points[0].x, 0.0f);
    EXPECT_FLOAT_EQ(points[1].x, 10.0f);
    EXPECT_FLOAT_EQ(points[1].y, 0.0f);
    EXPECT_FLOAT_EQ(points[2].x, 10.0f);
    EXPECT_FLOAT_EQ(points[2].y, 10.0f);
    EXPECT_EQ(zone.layerId, 1u);
    ASSERT_EQ(h.mapStore.writes.size(), 1u);
    ASSERT_TRUE(h.mapStore.lastPatch().layers.has_value());
    EXPECT_EQ((*h.mapStore.lastPatch().layers)[0].objects.size(), 1u);
}

TEST(EngineInputTest, DrawZoneUsesWorldCoordinates) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    h.engine.setTool(Tool::DrawZone);
    h.engine.onWheel(-1000.0f); // zoom 2

    h.engine.onClick(20.0f, 20.0f);
    h.engine.onClick(40.0f, 20.0f);
    h.engine.onClick(20.0f, 40.0f);
    h.engine.onKeyDown(Key::Enter);

    const MapLayer& top = h.engine.layers()[1];
    ASSERT_EQ(top.objects.size(), 1u);
    EXPECT_NEAR(top.objects[0].zone()->points[1].x, 20.0f, 1e-4f);
    EXPECT_NEAR(top.objects[0].zone()->points[2].y, 20.0f, 1e-4f);
}

TEST(EngineInputTest, TwoVertexZoneIsDiscarded) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    h.engine.setTool(Tool::DrawZone);
    h.engine.onClick(0.0f, 0.0f);
    h.engine.onClick(10.0f, 0.0f);
    h.engine.onKeyDown(Key::Enter);

    EXPECT_EQ(h.engine.zoneDraftPhase(), ZoneDraftPhase::Idle);
    EXPECT_TRUE(h.engine.zoneDraftVertices().empty());
    EXPECT_TRUE(h.engine.layers()[0].objects.empty());
    EXPECT_TRUE(h.engine.layers()[1].objects.empty());
    EXPECT_TRUE(h.mapStore.writes.empty());
    EXPECT_EQ(MapEngineTestAccessor::tools(h.engine).lastCompletion(), ZoneCompletion::Discarded);
}

TEST(EngineInputTest, DoubleClickAddsOneVertexAndCompletes) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    h.engine.setTool(Tool::DrawZone);

    h.engine.onClick(0.0f, 0.0f);
    h.engine.onClick(10.0f, 0.0f);
    // Browser sequence for a double-click: click, click, dblclick.
    h.engine.onClick(0.0f, 10.0f);
    h.engine.onClick(0.0f, 10.0f);
    h.engine.onDoubleClick(0.0f, 10.0f);

    const MapLayer& top = h.engine.layers()[1];
    ASSERT_EQ(top.objects.size(), 1u);
    EXPECT_EQ(top.objects[0].zone()->points.size(), 3u);
}

TEST(EngineInputTest, LeavingDrawZoneDropsDraft) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    h.engine.setTool(Tool::DrawZone);
    h.engine.onClick(0.0f, 0.0f);
    h.engine.onClick(10.0f, 0.0f);
    h.engine.setTool(Tool::Pan);
    EXPECT_TRUE(h.engine.zoneDraftVertices().empty());
    h.engine.setTool(Tool::DrawZone);
    h.engine.onKeyDown(Key::Enter);
    EXPECT_TRUE(h.mapStore.writes.empty());
}

TEST(EngineInputTest, EscapeCancelsDraft) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    h.engine.setTool(Tool::DrawZone);
    h.engine.onClick(0.0f, 0.0f);
    h.engine.onKeyDown(Key::Escape);
    EXPECT_EQ(h.engine.zoneDraftPhase(), ZoneDraftPhase::Idle);
}

TEST(EngineInputTest, DrawingWithoutActiveLayerAlerts) {
    EditorHarness h;
    MapDocument empty = makeTwoLayerMap();
    empty.layers.clear();
    h.engine.loadMap(empty);

    h.engine.setTool(Tool::DrawZone);
    h.engine.onClick(5.0f, 5.0f);
    EXPECT_EQ(h.engine.zoneDraftPhase(), ZoneDraftPhase::Idle);
    ASSERT_EQ(h.modals.shown.size(), 1u);
    EXPECT_EQ(h.modals.last().type, ModalType::Alert);
    EXPECT_EQ(h.modals.last().title, "No Layer Selected");
    EXPECT_EQ(h.modals.last().message, "Please select a layer in the sidebar before adding a zone.");
    EXPECT_EQ(h.engine.getLastError(), EngineError::NoActiveLayer);

    h.engine.setTool(Tool::AddLocation);
    h.engine.onClick(5.0f, 5.0f);
    EXPECT_FALSE(h.engine.hasPendingLink());
    ASSERT_EQ(h.modals.shown.size(), 2u);
    EXPECT_EQ(h.modals.last().message, "Please select a layer in the sidebar before adding a location.");

    h.engine.setTool(Tool::AddQuest);
    h.engine.onClick(5.0f, 5.0f);
    ASSERT_EQ(h.modals.shown.size(), 3u);
    EXPECT_EQ(h.modals.last().message, "Please select a layer in the sidebar before adding a quest.");
}

TEST(EngineInputTest, SelectClickPicksOrClears) {
    EditorHarness h;
    MapDocument map = makeTwoLayerMap();
    map.layers[0].objects.push_back(makeMarkerObject(10, 1, 50.0f, 50.0f));
    h.engine.loadMap(map);
    h.engine.setTool(Tool::Select);

    h.engine.onClick(52.0f, 49.0f);
    EXPECT_EQ(h.engine.getSelectedId(), 10u);
    h.engine.onClick(300.0f, 300.0f);
    EXPECT_EQ(h.engine.getSelectedId(), 0u);
}

TEST(EngineInputTest, PanToolClickNeverMutates) {
    EditorHarness h;
    MapDocument map = makeTwoLayerMap();
    map.layers[0].objects.push_back(makeMarkerObject(10, 1, 0.0f, 0.0f));
    h.engine.loadMap(map);
    h.engine.onClick(0.0f, 0.0f);
    EXPECT_EQ(h.engine.getSelectedId(), 0u);
    EXPECT_FALSE(h.engine.hasPendingLink());
    EXPECT_TRUE(h.mapStore.writes.empty());
}

TEST(EngineInputTest, DeleteKeyRemovesSelection) {
    EditorHarness h;
    MapDocument map = makeTwoLayerMap();
    map.layers[0].objects.push_back(makeMarkerObject(10, 1, 0.0f, 0.0f));
    h.engine.loadMap(map);
    h.engine.setTool(Tool::Select);
    h.engine.selectObject(10);
    h.engine.onKeyDown(Key::Delete);
    EXPECT_EQ(h.engine.findObject(10), nullptr);
    EXPECT_EQ(h.engine.getSelectedId(), 0u);
}

TEST(EngineInputTest, RenderIncludesZonePreview) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    h.engine.setTool(Tool::DrawZone);
    h.engine.onClick(0.0f, 0.0f);
    h.engine.onPointerMove(30.0f, 40.0f);

    const auto meta = h.engine.buildRenderBuffers();
    ASSERT_EQ(meta.primitiveCount, 2u);
    const auto& prims = h.engine.renderBuffers().primitives;
    EXPECT_EQ(prims[0].kind, static_cast<std::uint16_t>(atlas::protocol::OverlayKind::Polyline));
    EXPECT_EQ(prims[1].kind, static_cast<std::uint16_t>(atlas::protocol::OverlayKind::Segment));

    h.engine.setTool(Tool::Select);
    EXPECT_EQ(h.engine.buildRenderBuffers().primitiveCount, 0u);
}

TEST(EngineInputTest, SetOptionsRejectsNonFiniteBounds) {
    EditorHarness h;
    EditorOptions options;
    options.maxZoom = std::numeric_limits<float>::quiet_NaN();
    h.engine.setOptions(options);
    EXPECT_EQ(h.engine.getLastError(), EngineError::InvalidOperation);
    EXPECT_FLOAT_EQ(h.engine.options().maxZoom, 5.0f);

    options.maxZoom = std::numeric_limits<float>::infinity();
    h.engine.setOptions(options);
    EXPECT_EQ(h.engine.getLastError(), EngineError::InvalidOperation);

    options = EditorOptions{};
    options.zoomStepFactor = std::numeric_limits<float>::quiet_NaN();
    h.engine.setOptions(options);
    EXPECT_EQ(h.engine.getLastError(), EngineError::InvalidOperation);
    EXPECT_FLOAT_EQ(h.engine.options().zoomStepFactor, 1.2f);
}

TEST(EngineInputTest, SetOptionsClampsCurrentZoom) {
    EditorHarness h;
    h.engine.onWheel(-3000.0f); // zoom 4
    EditorOptions options;
    options.maxZoom = 2.0f;
    h.engine.setOptions(options);
    EXPECT_EQ(h.engine.getLastError(), EngineError::Ok);
    EXPECT_FLOAT_EQ(h.engine.viewport().zoom(), 2.0f);
    h.engine.onWheel(-1000.0f);
    EXPECT_FLOAT_EQ(h.engine.viewport().zoom(), 2.0f);
}
