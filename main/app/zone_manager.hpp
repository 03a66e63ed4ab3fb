#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "app/motion_router.hpp"
#include "app/zone_registry.hpp"
#include "app/zone_table.hpp"
#include "app/zone_types.hpp"

namespace zone {

// Keeps the set of TOMMY zones in sync with the rosters received from the
// broker and owns the motion sensor of every zone.
//
// Each roster is the complete zone list. An update creates sensors for new
// ids, tears down ids that disappeared and renames ids whose name changed,
// in that order. Registry failures are logged per zone and never stop the
// rest of the update.
class ZoneManager
{
public:
    ZoneManager(ZoneRegistry &registry, const std::string &session_id);

    ZoneManager(const ZoneManager &) = delete;
    ZoneManager &operator=(const ZoneManager &) = delete;

    // Wire the presentation layer. Until then new zones are not created.
    void set_entity_sink(EntitySink *sink) { sink_ = sink; }

    void on_zone_config_update(const Roster &zones);
    void on_zone_motion_update(const std::string &zone_id, bool motion);

    // Forget every zone (registries are left untouched).
    void clear();

    const ZoneRecord *find(const std::string &zone_id) const;
    const ZoneTable &zones() const { return zones_; }
    const std::unordered_map<std::string, ZoneInfo> &zone_info() const { return zone_info_; }
    const std::string &session_id() const { return session_id_; }

private:
    void create_zones(const std::vector<const ZoneInfo *> &added);
    void remove_zones(const std::vector<std::string> &zone_ids);
    void rename_zone(const ZoneInfo &zone);

    ZoneRegistry &registry_;
    EntitySink *sink_ = nullptr;
    std::string session_id_;

    ZoneTable zones_;
    // Last roster received, keyed by id.
    std::unordered_map<std::string, ZoneInfo> zone_info_;
    MotionRouter router_;
};

} // namespace zone
