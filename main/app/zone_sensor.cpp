#include "app/zone_sensor.hpp"

#include <utility>

namespace zone {

ZoneMotionSensor::ZoneMotionSensor(const std::string &session_id, const ZoneInfo &zone)
    : zone_id_(zone.id),
      zone_name_(zone.name),
      unique_id_(entity_unique_id(session_id, zone.id))
{
    device_info_.identifier = device_identifier(session_id, zone.id);
    device_info_.name = device_name(zone.name);
    device_info_.via_device = session_id;
}

bool ZoneMotionSensor::current_state(bool &motion) const
{
    if (!has_state_)
        return false;
    motion = motion_;
    return true;
}

void ZoneMotionSensor::set_state(bool motion)
{
    motion_ = motion;
    has_state_ = true;
}

void ZoneMotionSensor::set_name(const std::string &name)
{
    zone_name_ = name;
}

void ZoneMotionSensor::set_device_info(const DeviceInfo &info)
{
    device_info_ = info;
}

void ZoneMotionSensor::attach(Listener listener)
{
    listener_ = std::move(listener);
}

void ZoneMotionSensor::detach()
{
    listener_ = nullptr;
}

void ZoneMotionSensor::publish_state() const
{
    if (listener_)
        listener_(*this);
}

} // namespace zone
