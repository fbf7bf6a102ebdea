#include <gtest/gtest.h>
#include "core/geodesy.h"
#include "core/geofence_engine.h"
#include "database/zone_dao.h"
#include "test_support.h"
#include <atomic>
#include <cmath>
#include <thread>

using namespace core;
using testing_support::make_fix;
using testing_support::make_zone;

TEST(GeofenceEngineTest, FixAtCenterIsWithinZone) {
    std::vector<db::GeofenceZone> zones{make_zone("HQ", 37.7749, -122.4194, 100.0)};
    ZoneMatch m = GeofenceEngine::match_zone(make_fix(37.7749, -122.4194), zones);
    ASSERT_TRUE(m.zone.has_value());
    EXPECT_EQ(m.zone->name, "HQ");
    EXPECT_NEAR(m.distance_meters, 0.0, 1e-6);
    EXPECT_TRUE(m.within_zone);
}

TEST(GeofenceEngineTest, FixTwoHundredMetersNorthIsOutside) {
    std::vector<db::GeofenceZone> zones{make_zone("HQ", 37.7749, -122.4194, 100.0)};
    ZoneMatch m = GeofenceEngine::match_zone(make_fix(37.7767, -122.4194), zones);
    ASSERT_TRUE(m.zone.has_value());
    EXPECT_GT(m.distance_meters, 190.0);
    EXPECT_FALSE(m.within_zone);
}

TEST(GeofenceEngineTest, BoundaryIsInclusive) {
    db::LocationFix fix = make_fix(37.7767, -122.4194);
    double d = haversine_distance(37.7749, -122.4194, fix.latitude, fix.longitude);

    std::vector<db::GeofenceZone> exact{make_zone("HQ", 37.7749, -122.4194, d)};
    EXPECT_TRUE(GeofenceEngine::match_zone(fix, exact).within_zone);

    std::vector<db::GeofenceZone> shorter{make_zone("HQ", 37.7749, -122.4194, d - 1e-6)};
    EXPECT_FALSE(GeofenceEngine::match_zone(fix, shorter).within_zone);
}

TEST(GeofenceEngineTest, PicksNearestActiveZone) {
    auto far = make_zone("Far", 37.80, -122.4194, 50.0);
    auto near = make_zone("Near", 37.7750, -122.4194, 50.0);
    auto closed = make_zone("Closed", 37.7749, -122.4194, 50.0);
    closed.is_active = false;

    ZoneMatch m = GeofenceEngine::match_zone(make_fix(37.7749, -122.4194), {far, closed, near});
    ASSERT_TRUE(m.zone.has_value());
    EXPECT_EQ(m.zone->name, "Near");
    EXPECT_TRUE(m.within_zone);
}

TEST(GeofenceEngineTest, TiesKeepInsertionOrder) {
    auto first = make_zone("First", 37.7749, -122.4194, 10.0);
    auto second = make_zone("Second", 37.7749, -122.4194, 500.0);

    ZoneMatch m = GeofenceEngine::match_zone(make_fix(37.7760, -122.4194), {first, second});
    ASSERT_TRUE(m.zone.has_value());
    EXPECT_EQ(m.zone->name, "First");
    EXPECT_FALSE(m.within_zone);
}

TEST(GeofenceEngineTest, NoActiveZones) {
    auto closed = make_zone("Closed", 37.7749, -122.4194, 50.0);
    closed.is_active = false;

    ZoneMatch empty = GeofenceEngine::match_zone(make_fix(1.0, 2.0), {});
    EXPECT_FALSE(empty.zone.has_value());
    EXPECT_FALSE(empty.within_zone);
    EXPECT_TRUE(std::isinf(empty.distance_meters));

    ZoneMatch inactive = GeofenceEngine::match_zone(make_fix(37.7749, -122.4194), {closed});
    EXPECT_FALSE(inactive.zone.has_value());
    EXPECT_FALSE(inactive.within_zone);
}

TEST(GeofenceEngineTest, MatchDoesNotMutateZones) {
    std::vector<db::GeofenceZone> zones{make_zone("HQ", 37.7749, -122.4194, 100.0)};
    GeofenceEngine::match_zone(make_fix(37.7749, -122.4194), zones);
    EXPECT_EQ(zones.size(), 1u);
    EXPECT_DOUBLE_EQ(zones[0].radius_meters, 100.0);
    EXPECT_TRUE(zones[0].is_active);
}

TEST(GeofenceEngineTest, SnapshotCanBeReplacedWhileMatching) {
    GeofenceEngine engine;
    engine.set_zones({make_zone("A", 37.7749, -122.4194, 100.0)});

    std::atomic<bool> stop{false};
    std::atomic<int> matched{0};
    std::thread reader([&] {
        while (!stop) {
            ZoneMatch m = engine.match(make_fix(37.7749, -122.4194));
            if (m.within_zone) ++matched;
        }
    });
    for (int i = 0; i < 100; ++i) {
        engine.set_zones({make_zone("A" + std::to_string(i), 37.7749, -122.4194, 100.0)});
    }
    stop = true;
    reader.join();

    EXPECT_EQ(engine.zones().size(), 1u);
    EXPECT_EQ(engine.zones()[0].name, "A99");
    EXPECT_GT(matched.load(), 0);
}

class GeofenceEngineDbTest : public testing_support::DatabaseTest {};

TEST_F(GeofenceEngineDbTest, LoadsZonesInInsertionOrder) {
    db::ZoneDao dao;
    auto office = make_zone("Office", 31.2304, 121.4737, 200.0);
    office.allowed_methods = {db::PunchMethod::Face, db::PunchMethod::Gps};
    ASSERT_GT(dao.add_zone(office), 0);
    ASSERT_GT(dao.add_zone(make_zone("Office twin", 31.2304, 121.4737, 300.0)), 0);

    GeofenceEngine engine;
    EXPECT_EQ(engine.load_from_database(), 2u);

    ZoneMatch m = engine.match(make_fix(31.2304, 121.4737));
    ASSERT_TRUE(m.zone.has_value());
    EXPECT_EQ(m.zone->name, "Office");
    EXPECT_EQ(m.zone->allowed_methods.count(db::PunchMethod::Gps), 1u);
}
