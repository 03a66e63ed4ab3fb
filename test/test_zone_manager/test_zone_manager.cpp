// Unit tests for roster reconciliation in ZoneManager.

#include <unity.h>

#include <algorithm>
#include <string>
#include <vector>

#include "app/zone_manager.hpp"
#include "../fakes.hpp"

using namespace zone;

static const char *kSession = "s1";

static FakeRegistry *registry = nullptr;
static ZoneManager *manager = nullptr;

static bool has_call(const std::string &call)
{
    return std::find(registry->calls.begin(), registry->calls.end(), call) != registry->calls.end();
}

static int index_of(const std::string &call)
{
    auto it = std::find(registry->calls.begin(), registry->calls.end(), call);
    return it == registry->calls.end() ? -1 : static_cast<int>(it - registry->calls.begin());
}

void setUp(void)
{
    registry = new FakeRegistry();
    registry->add_hub(kSession);
    manager = new ZoneManager(*registry, kSession);
    manager->set_entity_sink(registry);
}

void tearDown(void)
{
    delete manager;
    delete registry;
    manager = nullptr;
    registry = nullptr;
}

void test_new_zones_are_created_in_one_batch()
{
    manager->on_zone_config_update({{"z1", "Hallway"}, {"z2", "Kitchen"}});

    TEST_ASSERT_EQUAL(1, registry->add_batches);
    TEST_ASSERT_EQUAL(2, static_cast<int>(manager->zones().size()));
    TEST_ASSERT_EQUAL(0, index_of("add:z1"));
    TEST_ASSERT_EQUAL(1, index_of("add:z2"));

    const ZoneRecord *rec = manager->find("z1");
    TEST_ASSERT_NOT_NULL(rec);
    TEST_ASSERT_EQUAL_STRING("s1_zone_z1_motion", rec->sensor->unique_id().c_str());
    TEST_ASSERT_EQUAL_STRING("s1_z1", rec->sensor->device_info().identifier.c_str());
    TEST_ASSERT_EQUAL_STRING("TOMMY (Hallway)", rec->sensor->device_info().name.c_str());
    TEST_ASSERT_EQUAL_STRING(kSession, rec->sensor->device_info().via_device.c_str());
    TEST_ASSERT_FALSE(rec->sensor->has_state());
}

void test_roster_replay_is_idempotent()
{
    const Roster roster = {{"z1", "Hallway"}, {"z2", "Kitchen"}};
    manager->on_zone_config_update(roster);
    const std::size_t calls = registry->calls.size();

    manager->on_zone_config_update(roster);
    TEST_ASSERT_EQUAL(calls, registry->calls.size());
    TEST_ASSERT_EQUAL(1, registry->add_batches);
    TEST_ASSERT_EQUAL(2, static_cast<int>(manager->zones().size()));
}

void test_missing_zones_are_removed()
{
    manager->on_zone_config_update({{"z1", "Hallway"}, {"z2", "Kitchen"}});
    manager->on_zone_config_update({{"z2", "Kitchen"}});

    TEST_ASSERT_NULL(manager->find("z1"));
    TEST_ASSERT_NOT_NULL(manager->find("z2"));
    TEST_ASSERT_TRUE(has_call("remove_entity:s1_zone_z1_motion"));
    TEST_ASSERT_TRUE(has_call("remove_device:dev_z1"));
    TEST_ASSERT_FALSE(has_call("remove_entity:s1_zone_z2_motion"));
    TEST_ASSERT_EQUAL(1, static_cast<int>(registry->released.size()));
    TEST_ASSERT_EQUAL_STRING("z1", registry->released[0].c_str());
    TEST_ASSERT_EQUAL(1, static_cast<int>(manager->zone_info().size()));
}

void test_hub_device_is_never_removed()
{
    // An empty zone id still maps to "s1_", never to the hub's "s1".
    manager->on_zone_config_update({{"z1", "Hallway"}, {"", "Nameless"}});
    manager->on_zone_config_update({});

    TEST_ASSERT_FALSE(has_call("remove_device:dev_hub"));
    TEST_ASSERT_NOT_NULL(registry->find_device(kSession));
}

void test_rename_only_touches_changed_zone()
{
    manager->on_zone_config_update({{"z1", "Hallway"}, {"z2", "Kitchen"}});
    registry->calls.clear();
    registry->publishes.clear();

    manager->on_zone_config_update({{"z1", "Hall"}, {"z2", "Kitchen"}});

    TEST_ASSERT_EQUAL(1, static_cast<int>(registry->calls.size()));
    TEST_ASSERT_EQUAL_STRING("rename_device:dev_z1:TOMMY (Hall)", registry->calls[0].c_str());

    const ZoneRecord *rec = manager->find("z1");
    TEST_ASSERT_EQUAL_STRING("Hall", rec->info.name.c_str());
    TEST_ASSERT_EQUAL_STRING("Hall", rec->sensor->zone_name().c_str());
    TEST_ASSERT_EQUAL_STRING("TOMMY (Hall)", rec->sensor->device_info().name.c_str());
    // The attached sensor re-publishes under its new name.
    TEST_ASSERT_EQUAL(1, static_cast<int>(registry->publishes.size()));
}

void test_rename_skips_device_already_named()
{
    manager->on_zone_config_update({{"z1", "Hallway"}});
    registry->devices["s1_z1"].name = "TOMMY (Hall)";
    registry->calls.clear();

    manager->on_zone_config_update({{"z1", "Hall"}});
    TEST_ASSERT_FALSE(has_call("rename_device:dev_z1:TOMMY (Hall)"));
    TEST_ASSERT_EQUAL_STRING("Hall", manager->find("z1")->info.name.c_str());
}

void test_rename_clears_entity_name_override()
{
    manager->on_zone_config_update({{"z1", "Hallway"}});
    registry->entities["s1_zone_z1_motion"].name_override = "My label";

    manager->on_zone_config_update({{"z1", "Hall"}});
    TEST_ASSERT_TRUE(has_call("clear_override:s1_zone_z1_motion"));
    TEST_ASSERT_TRUE(registry->entities["s1_zone_z1_motion"].name_override.empty());
}

void test_added_before_removed_before_renamed()
{
    manager->on_zone_config_update({{"a", "A"}, {"b", "B"}});
    registry->calls.clear();

    manager->on_zone_config_update({{"b", "B2"}, {"c", "C"}});

    const int added = index_of("add:c");
    const int removed = index_of("remove_entity:s1_zone_a_motion");
    const int renamed = index_of("rename_device:dev_b:TOMMY (B2)");
    TEST_ASSERT_TRUE(added >= 0);
    TEST_ASSERT_TRUE(removed > added);
    TEST_ASSERT_TRUE(renamed > removed);
}

void test_registry_failure_is_isolated_per_zone()
{
    manager->on_zone_config_update({{"a", "A"}, {"b", "B"}});
    registry->fail_key = "s1_zone_a_motion";

    manager->on_zone_config_update({});

    TEST_ASSERT_TRUE(has_call("remove_entity:s1_zone_a_motion"));
    TEST_ASSERT_TRUE(has_call("remove_entity:s1_zone_b_motion"));
    TEST_ASSERT_TRUE(has_call("remove_device:dev_a"));
    TEST_ASSERT_TRUE(has_call("remove_device:dev_b"));
    TEST_ASSERT_EQUAL(0, static_cast<int>(manager->zones().size()));
    TEST_ASSERT_EQUAL(0, static_cast<int>(manager->zone_info().size()));
}

void test_without_sink_snapshot_still_advances()
{
    ZoneManager bare(*registry, kSession);
    bare.on_zone_config_update({{"z1", "Hallway"}});

    TEST_ASSERT_EQUAL(0, registry->add_batches);
    TEST_ASSERT_EQUAL(0, static_cast<int>(bare.zones().size()));
    TEST_ASSERT_EQUAL(1, static_cast<int>(bare.zone_info().size()));
}

void test_duplicate_ids_last_entry_wins()
{
    manager->on_zone_config_update({{"z1", "First"}, {"z1", "Second"}});

    TEST_ASSERT_EQUAL(1, static_cast<int>(manager->zones().size()));
    TEST_ASSERT_EQUAL(1, static_cast<int>(registry->sensors_added.size()));
    TEST_ASSERT_EQUAL_STRING("Second", manager->zone_info().at("z1").name.c_str());
}

void test_motion_is_routed_and_deduplicated()
{
    manager->on_zone_config_update({{"z1", "Hallway"}});

    manager->on_zone_motion_update("z1", true);
    manager->on_zone_motion_update("z1", true);
    manager->on_zone_motion_update("z1", false);
    manager->on_zone_motion_update("nope", true);

    TEST_ASSERT_EQUAL(2, static_cast<int>(registry->publishes.size()));
    TEST_ASSERT_EQUAL_STRING("z1=on", registry->publishes[0].c_str());
    TEST_ASSERT_EQUAL_STRING("z1=off", registry->publishes[1].c_str());
}

void test_hallway_hall_empty_scenario()
{
    manager->on_zone_config_update({{"z1", "Hallway"}});
    manager->on_zone_motion_update("z1", true);
    TEST_ASSERT_EQUAL_STRING("TOMMY (Hallway)", registry->find_device("s1_z1")->name.c_str());

    manager->on_zone_config_update({{"z1", "Hall"}});
    TEST_ASSERT_EQUAL_STRING("TOMMY (Hall)", registry->find_device("s1_z1")->name.c_str());
    bool motion = false;
    TEST_ASSERT_TRUE(manager->find("z1")->sensor->current_state(motion));
    TEST_ASSERT_TRUE(motion);

    manager->on_zone_config_update({});
    TEST_ASSERT_NULL(manager->find("z1"));
    TEST_ASSERT_NULL(registry->find_entity("s1_zone_z1_motion"));
    TEST_ASSERT_NULL(registry->find_device("s1_z1"));
    TEST_ASSERT_NOT_NULL(registry->find_device(kSession));

    // A removed zone no longer receives motion.
    registry->publishes.clear();
    manager->on_zone_motion_update("z1", false);
    TEST_ASSERT_EQUAL(0, static_cast<int>(registry->publishes.size()));
}

void test_clear_detaches_sensors()
{
    manager->on_zone_config_update({{"z1", "Hallway"}});
    manager->clear();

    TEST_ASSERT_EQUAL(0, static_cast<int>(manager->zones().size()));
    TEST_ASSERT_EQUAL(0, static_cast<int>(manager->zone_info().size()));

    TEST_ASSERT_EQUAL(1, static_cast<int>(registry->released.size()));
    TEST_ASSERT_EQUAL_STRING("z1", registry->released[0].c_str());
    TEST_ASSERT_EQUAL(0, static_cast<int>(registry->sensors_added.size()));

    // Same roster again counts as new.
    manager->on_zone_config_update({{"z1", "Hallway"}});
    TEST_ASSERT_EQUAL(2, registry->add_batches);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_new_zones_are_created_in_one_batch);
    RUN_TEST(test_roster_replay_is_idempotent);
    RUN_TEST(test_missing_zones_are_removed);
    RUN_TEST(test_hub_device_is_never_removed);
    RUN_TEST(test_rename_only_touches_changed_zone);
    RUN_TEST(test_rename_skips_device_already_named);
    RUN_TEST(test_rename_clears_entity_name_override);
    RUN_TEST(test_added_before_removed_before_renamed);
    RUN_TEST(test_registry_failure_is_isolated_per_zone);
    RUN_TEST(test_without_sink_snapshot_still_advances);
    RUN_TEST(test_duplicate_ids_last_entry_wins);
    RUN_TEST(test_motion_is_routed_and_deduplicated);
    RUN_TEST(test_hallway_hall_empty_scenario);
    RUN_TEST(test_clear_detaches_sensors);
    return UNITY_END();
}
