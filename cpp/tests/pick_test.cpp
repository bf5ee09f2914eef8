#include <gtest/gtest.h>
#include "atlas/interaction/pick_system.h"

namespace {
MapLayer layerWith(std::uint32_t id, bool visible) {
    MapLayer l;
    l.id = id;
    l.isVisible = visible;
    return l;
}
}

TEST(PickSystemTest, MarkerHitWithinScreenRadius) {
    EditorOptions options;
    Viewport viewport(options);
    PickSystem picker(options);

    std::vector<MapLayer> layers{layerWith(1, true)};
    layers[0].objects.push_back(makeMarkerObject(10, 1, 100.0f, 100.0f));

    EXPECT_EQ(picker.pickId(layers, viewport, 108.0f, 100.0f), 10u);
    EXPECT_EQ(picker.pickId(layers, viewport, 120.0f, 100.0f), 0u);

    // At 2x zoom the world-space radius halves but the screen radius is unchanged.
    viewport.setState(0.0f, 0.0f, 2.0f);
    EXPECT_EQ(picker.pickId(layers, viewport, 210.0f, 200.0f), 10u);
    EXPECT_EQ(picker.pickId(layers, viewport, 215.0f, 200.0f), 0u);
}

TEST(PickSystemTest, ZoneHitInsideAndNearEdge) {
    EditorOptions options;
    Viewport viewport(options);
    PickSystem picker(options);

    std::vector<MapLayer> layers{layerWith(1, true)};
    layers[0].objects.push_back(makeZoneObject(20, 1, {Point2{0, 0}, Point2{100, 0}, Point2{100, 100}, Point2{0, 100}}));

    const PickResult inside = picker.pick(layers, viewport, 50.0f, 50.0f);
    EXPECT_EQ(inside.id, 20u);
    EXPECT_EQ(inside.subTarget, static_cast<std::uint8_t>(PickSubTarget::Body));

    const PickResult edge = picker.pick(layers, viewport, 103.0f, 50.0f);
    EXPECT_EQ(edge.id, 20u);
    EXPECT_EQ(edge.subTarget, static_cast<std::uint8_t>(PickSubTarget::Edge));

    EXPECT_EQ(picker.pickId(layers, viewport, 110.0f, 50.0f), 0u);
}

TEST(PickSystemTest, HiddenLayersAreSkipped) {
    EditorOptions options;
    Viewport viewport(options);
    PickSystem picker(options);

    std::vector<MapLayer> layers{layerWith(1, true), layerWith(2, false)};
    layers[0].objects.push_back(makeMarkerObject(10, 1, 0.0f, 0.0f));
    layers[1].objects.push_back(makeMarkerObject(11, 2, 0.0f, 0.0f));

    EXPECT_EQ(picker.pickId(layers, viewport, 0.0f, 0.0f), 10u);
}

TEST(PickSystemTest, TopMostObjectWins) {
    EditorOptions options;
    Viewport viewport(options);
    PickSystem picker(options);

    std::vector<MapLayer> layers{layerWith(1, true), layerWith(2, true)};
    layers[0].objects.push_back(makeMarkerObject(10, 1, 0.0f, 0.0f));
    layers[1].objects.push_back(makeZoneObject(20, 2, {Point2{-5, -5}, Point2{5, -5}, Point2{0, 5}}));
    layers[1].objects.push_back(makeMarkerObject(21, 2, 0.0f, 0.0f));

    EXPECT_EQ(picker.pickId(layers, viewport, 0.0f, 0.0f), 21u);
    layers[1].objects.pop_back();
    EXPECT_EQ(picker.pickId(layers, viewport, 0.0f, 0.0f), 20u);
}

TEST(PickSystemTest, EvenOddPolygonTest) {
    const std::vector<Point2> concave{
        Point2{0, 0}, Point2{10, 0}, Point2{10, 10}, Point2{5, 5}, Point2{0, 10}};
    EXPECT_TRUE(PickSystem::pointInPolygon(concave, 2.0f, 2.0f));
    EXPECT_FALSE(PickSystem::pointInPolygon(concave, 5.0f, 8.0f));
    EXPECT_FALSE(PickSystem::pointInPolygon({Point2{0, 0}, Point2{1, 1}}, 0.5f, 0.5f));
}
