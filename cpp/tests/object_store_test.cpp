#include <gtest/gtest.h>
#include "atlas/layers/object_store.h"
#include <limits>

namespace {
class ObjectStoreTest : public ::testing::Test {
protected:
    ObjectStoreTest() : model(layers), store(model) {
        model.addLayer(1, "L1");
        model.addLayer(2, "L2");
    }

    std::vector<MapLayer> layers;
    LayerModel model;
    GeometryObjectStore store;
};

std::vector<Point2> tri() {
    return {Point2{0, 0}, Point2{10, 0}, Point2{0, 10}};
}
}

TEST_F(ObjectStoreTest, InsertGoesToNamedLayer) {
    EXPECT_TRUE(store.insertObject(makeMarkerObject(10, 2, 3.0f, 4.0f, EntityLink{LinkKind::Location, 77})));
    EXPECT_TRUE(layers[0].objects.empty());
    ASSERT_EQ(layers[1].objects.size(), 1u);
    EXPECT_EQ(layers[1].objects[0].layerId, 2u);

    const MapObject* found = store.findObject(10);
    ASSERT_NE(found, nullptr);
    ASSERT_NE(found->marker(), nullptr);
    EXPECT_EQ(found->marker()->link.id, 77u);
    EXPECT_EQ(store.objectCount(), 1u);
}

TEST_F(ObjectStoreTest, InsertRejectsBadInput) {
    EXPECT_FALSE(store.insertObject(makeMarkerObject(0, 1, 0, 0)));
    EXPECT_FALSE(store.insertObject(makeMarkerObject(10, 99, 0, 0)));
    EXPECT_FALSE(store.insertObject(makeMarkerObject(10, 1, std::numeric_limits<float>::quiet_NaN(), 0)));
    EXPECT_TRUE(store.insertObject(makeMarkerObject(10, 1, 0, 0)));
    EXPECT_FALSE(store.insertObject(makeMarkerObject(10, 2, 0, 0)));
}

TEST_F(ObjectStoreTest, ZoneNeedsThreePoints) {
    EXPECT_FALSE(store.addZone(20, 1, {Point2{0, 0}, Point2{1, 1}}));
    EXPECT_TRUE(store.addZone(20, 1, tri(), 0x11223344u));
    const MapObject* zone = store.findObject(20);
    ASSERT_NE(zone, nullptr);
    EXPECT_EQ(zone->kind(), MapObjectKind::Zone);
    EXPECT_EQ(zone->zone()->colorRGBA, 0x11223344u);
}

TEST_F(ObjectStoreTest, MoveOnlyAppliesToMarkers) {
    store.insertObject(makeMarkerObject(10, 1, 0, 0));
    store.addZone(20, 1, tri());
    EXPECT_TRUE(store.moveObject(10, 7.0f, 8.0f));
    EXPECT_FLOAT_EQ(store.findObject(10)->marker()->x, 7.0f);
    EXPECT_FALSE(store.moveObject(20, 1.0f, 1.0f));
    EXPECT_FALSE(store.moveObject(30, 1.0f, 1.0f));
}

TEST_F(ObjectStoreTest, DeleteReportsLayer) {
    store.insertObject(makeMarkerObject(10, 2, 0, 0));
    std::uint32_t layerId = 0;
    EXPECT_TRUE(store.deleteObject(10, &layerId));
    EXPECT_EQ(layerId, 2u);
    EXPECT_EQ(store.findObject(10), nullptr);
    EXPECT_FALSE(store.deleteObject(10));
}

TEST_F(ObjectStoreTest, ZonePropsOnlyForZones) {
    store.insertObject(makeMarkerObject(10, 1, 0, 0));
    store.addZone(20, 1, tri());
    EXPECT_TRUE(store.setZoneProps(20, "Marsh", 0xAABBCCDDu));
    EXPECT_EQ(store.findObject(20)->zone()->name, "Marsh");
    EXPECT_FALSE(store.setZoneProps(10, "Nope", 0));
}

TEST_F(ObjectStoreTest, MaxAssignedIdCoversLayersAndObjects) {
    EXPECT_EQ(store.maxAssignedId(), 2u);
    store.insertObject(makeMarkerObject(40, 1, 0, 0));
    EXPECT_EQ(store.maxAssignedId(), 40u);
}
