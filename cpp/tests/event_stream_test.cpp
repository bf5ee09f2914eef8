#include "tests/test_support.h"
#include "tests/test_accessors.h"

using namespace atlas_test;
using EventType = MapEngine::EventType;

namespace {

std::size_t countEvents(const std::vector<MapEngine::EngineEvent>& events, EventType type) {
    std::size_t n = 0;
    for (const auto& ev : events) {
        if (ev.type == static_cast<std::uint16_t>(type)) n++;
    }
    return n;
}

} // namespace

TEST(EventStreamTest, LoadEmitsDocSelectionAndInspector) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    const auto events = drainEvents(h.engine);
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events[0].type, static_cast<std::uint16_t>(EventType::DocChanged));
    EXPECT_TRUE(events[0].a & static_cast<std::uint32_t>(MapEngine::ChangeMask::MapInfo));
    EXPECT_TRUE(hasEvent(events, EventType::SelectionChanged));
    EXPECT_TRUE(hasEvent(events, EventType::InspectorChanged));
    EXPECT_TRUE(drainEvents(h.engine).empty());
}

TEST(EventStreamTest, ObjectChangesCoalescePerPoll) {
    EditorHarness h;
    MapDocument map = makeTwoLayerMap();
    map.layers[0].objects.push_back(makeMarkerObject(10, 1, 0.0f, 0.0f));
    h.engine.loadMap(map);
    drainEvents(h.engine);

    h.engine.moveObject(10, 1.0f, 1.0f);
    h.engine.moveObject(10, 2.0f, 2.0f);
    h.engine.moveObject(10, 3.0f, 3.0f);

    const auto events = drainEvents(h.engine);
    EXPECT_EQ(countEvents(events, EventType::ObjectChanged), 1u);
    EXPECT_EQ(countEvents(events, EventType::DocChanged), 1u);
    EXPECT_EQ(events[0].b, h.engine.getGeneration());
}

TEST(EventStreamTest, CreateThenDeleteWithinPollCancels) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    drainEvents(h.engine);

    const std::uint32_t id = h.engine.addZone(1, triangle(0.0f, 0.0f, 10.0f));
    h.engine.deleteObject(id);

    const auto events = drainEvents(h.engine);
    EXPECT_FALSE(hasEvent(events, EventType::ObjectCreated));
    EXPECT_FALSE(hasEvent(events, EventType::ObjectDeleted));
    EXPECT_TRUE(hasEvent(events, EventType::LayerChanged));
}

TEST(EventStreamTest, EventsFlushInFixedOrder) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    drainEvents(h.engine);

    h.engine.setTool(Tool::Select);
    const std::uint32_t zone = h.engine.addZone(2, triangle(0.0f, 0.0f, 10.0f));
    h.engine.selectObject(zone);
    h.engine.zoomIn();

    const auto events = drainEvents(h.engine);
    std::vector<std::uint16_t> types;
    for (const auto& ev : events) types.push_back(ev.type);
    const std::vector<std::uint16_t> expected{
        static_cast<std::uint16_t>(EventType::DocChanged),
        static_cast<std::uint16_t>(EventType::LayerChanged),
        static_cast<std::uint16_t>(EventType::ObjectCreated),
        static_cast<std::uint16_t>(EventType::SelectionChanged),
        static_cast<std::uint16_t>(EventType::InspectorChanged),
        static_cast<std::uint16_t>(EventType::ViewportChanged),
        static_cast<std::uint16_t>(EventType::ToolChanged),
    };
    EXPECT_EQ(types, expected);

    EXPECT_EQ(events[2].a, zone);
    EXPECT_EQ(events[2].b, static_cast<std::uint32_t>(MapObjectKind::Zone));
    EXPECT_EQ(events[3].b, zone);
    EXPECT_EQ(events[4].a, zone);
    EXPECT_EQ(events[4].b, static_cast<std::uint32_t>(InspectorStatus::NoLinkedData));
    EXPECT_EQ(events[6].a, static_cast<std::uint32_t>(Tool::Select));
}

TEST(EventStreamTest, PollRespectsMaxEvents) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    drainEvents(h.engine);
    h.engine.toggleLayerVisibility(1);
    h.engine.toggleLayerVisibility(2);

    auto meta = h.engine.pollEvents(2);
    EXPECT_EQ(meta.count, 2u);
    EXPECT_EQ(MapEngineTestAccessor::queuedEventCount(h.engine), 1u);
    meta = h.engine.pollEvents(10);
    EXPECT_EQ(meta.count, 1u);
    meta = h.engine.pollEvents(10);
    EXPECT_EQ(meta.count, 0u);
    EXPECT_EQ(meta.ptr, 0u);
}

TEST(EventStreamTest, OverflowRequiresResync) {
    MapEngine engine;
    engine.loadMap(makeTwoLayerMap());
    drainEvents(engine);

    for (int i = 0; i < 2100; ++i) {
        ASSERT_NE(engine.addZone(1, triangle(static_cast<float>(i), 0.0f, 5.0f)), 0u);
    }

    auto events = drainEvents(engine);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, static_cast<std::uint16_t>(EventType::Overflow));
    const std::uint32_t overflowGeneration = events[0].a;

    // Nothing new is recorded until the host resyncs.
    engine.zoomIn();
    events = drainEvents(engine);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, static_cast<std::uint16_t>(EventType::Overflow));

    engine.ackResync(overflowGeneration - 1);
    EXPECT_EQ(drainEvents(engine).size(), 1u);

    engine.ackResync(engine.getGeneration());
    EXPECT_TRUE(drainEvents(engine).empty());
    engine.zoomIn();
    events = drainEvents(engine);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, static_cast<std::uint16_t>(EventType::ViewportChanged));
}

TEST(EventStreamTest, ReloadClearsQueue) {
    EditorHarness h;
    h.engine.loadMap(makeTwoLayerMap());
    h.engine.addLayer();
    h.engine.loadMap(makeTwoLayerMap());
    const auto events = drainEvents(h.engine);
    EXPECT_FALSE(hasEvent(events, EventType::LayerChanged));
    EXPECT_TRUE(hasEvent(events, EventType::DocChanged));
}
