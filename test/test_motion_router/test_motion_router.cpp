// Unit tests for MotionRouter and the zone sensor handle.

#include <unity.h>

#include <memory>
#include <string>
#include <vector>

#include "app/motion_router.hpp"

using namespace zone;

static ZoneTable table;
static std::vector<std::string> published;

static void add_zone(const std::string &id, const std::string &name, bool attach)
{
    ZoneRecord rec;
    rec.info = ZoneInfo{id, name};
    rec.sensor.reset(new ZoneMotionSensor("s1", rec.info));
    if (attach)
    {
        rec.sensor->attach([](const ZoneMotionSensor &s)
                           {
                               bool motion = false;
                               s.current_state(motion);
                               published.push_back(s.zone_id() + (motion ? ":1" : ":0"));
                           });
    }
    table.emplace(id, std::move(rec));
}

void setUp(void)
{
    table.clear();
    published.clear();
}

void tearDown(void) {}

void test_first_update_always_notifies()
{
    add_zone("z1", "Hallway", true);
    MotionRouter router(table);

    // Unset state counts as a change, even to false.
    TEST_ASSERT_TRUE(router.update("z1", false));
    TEST_ASSERT_EQUAL(1, static_cast<int>(published.size()));
    TEST_ASSERT_EQUAL_STRING("z1:0", published[0].c_str());
}

void test_same_value_is_deduplicated()
{
    add_zone("z1", "Hallway", true);
    MotionRouter router(table);

    TEST_ASSERT_TRUE(router.update("z1", true));
    TEST_ASSERT_FALSE(router.update("z1", true));
    TEST_ASSERT_FALSE(router.update("z1", true));
    TEST_ASSERT_TRUE(router.update("z1", false));
    TEST_ASSERT_EQUAL(2, static_cast<int>(published.size()));
}

void test_unknown_zone_is_ignored()
{
    add_zone("z1", "Hallway", true);
    MotionRouter router(table);

    TEST_ASSERT_FALSE(router.update("z2", true));
    TEST_ASSERT_EQUAL(0, static_cast<int>(published.size()));
    TEST_ASSERT_FALSE(table.at("z1").sensor->has_state());
}

void test_only_target_zone_changes()
{
    add_zone("z1", "Hallway", true);
    add_zone("z2", "Kitchen", true);
    MotionRouter router(table);

    TEST_ASSERT_TRUE(router.update("z2", true));
    TEST_ASSERT_FALSE(table.at("z1").sensor->has_state());
    bool motion = false;
    TEST_ASSERT_TRUE(table.at("z2").sensor->current_state(motion));
    TEST_ASSERT_TRUE(motion);
}

void test_detached_sensor_still_stores_state()
{
    add_zone("z1", "Hallway", false);
    MotionRouter router(table);

    TEST_ASSERT_TRUE(router.update("z1", true));
    TEST_ASSERT_EQUAL(0, static_cast<int>(published.size()));
    bool motion = false;
    TEST_ASSERT_TRUE(table.at("z1").sensor->current_state(motion));
    TEST_ASSERT_TRUE(motion);
}

void test_router_sees_later_table_changes()
{
    MotionRouter router(table);
    TEST_ASSERT_FALSE(router.update("z1", true));

    add_zone("z1", "Hallway", true);
    TEST_ASSERT_TRUE(router.update("z1", true));
}

void test_sensor_identity()
{
    ZoneMotionSensor sensor("hub", ZoneInfo{"42", "Garage"});
    TEST_ASSERT_EQUAL_STRING("hub_zone_42_motion", sensor.unique_id().c_str());
    TEST_ASSERT_EQUAL_STRING("hub_42", sensor.device_info().identifier.c_str());
    TEST_ASSERT_EQUAL_STRING("TOMMY (Garage)", sensor.device_info().name.c_str());
    TEST_ASSERT_EQUAL_STRING("hub", sensor.device_info().via_device.c_str());
    TEST_ASSERT_FALSE(sensor.is_attached());

    bool motion = true;
    TEST_ASSERT_FALSE(sensor.current_state(motion));
    // Publishing while detached does nothing.
    sensor.publish_state();
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_first_update_always_notifies);
    RUN_TEST(test_same_value_is_deduplicated);
    RUN_TEST(test_unknown_zone_is_ignored);
    RUN_TEST(test_only_target_zone_changes);
    RUN_TEST(test_detached_sensor_still_stores_state);
    RUN_TEST(test_router_sees_later_table_changes);
    RUN_TEST(test_sensor_identity);
    return UNITY_END();
}
