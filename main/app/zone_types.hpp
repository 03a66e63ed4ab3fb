#pragma once

#include <string>
#include <vector>

namespace zone {

struct ZoneInfo
{
    std::string id;
    std::string name;
};

// Complete list of zones reported by one message; never a delta.
using Roster = std::vector<ZoneInfo>;

struct ZoneStateEvent
{
    std::string zone_id;
    bool motion = false;
    Roster zones;
};

// "<session>_zone_<zone>_motion"
inline std::string entity_unique_id(const std::string &session_id, const std::string &zone_id)
{
    return session_id + "_zone_" + zone_id + "_motion";
}

// "<session>_<zone>"; the hub itself uses the bare session id.
inline std::string device_identifier(const std::string &session_id, const std::string &zone_id)
{
    return session_id + "_" + zone_id;
}

inline std::string device_name(const std::string &zone_name)
{
    return "TOMMY (" + zone_name + ")";
}

} // namespace zone
