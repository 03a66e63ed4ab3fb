#pragma once

#include <functional>
#include <string>

#include "app/zone_types.hpp"

namespace zone {

struct DeviceInfo
{
    std::string identifier;
    std::string name;
    std::string via_device; // hub identifier
};

// Motion binary sensor of one zone, as handed to the presentation layer.
// Purely reactive: it only changes when the router or the reconciler
// tells it to.
class ZoneMotionSensor
{
public:
    using Listener = std::function<void(const ZoneMotionSensor &)>;

    ZoneMotionSensor(const std::string &session_id, const ZoneInfo &zone);

    const std::string &zone_id() const { return zone_id_; }
    const std::string &zone_name() const { return zone_name_; }
    const std::string &unique_id() const { return unique_id_; }
    const DeviceInfo &device_info() const { return device_info_; }

    // Returns false while no motion update has been received.
    bool current_state(bool &motion) const;
    bool has_state() const { return has_state_; }
    void set_state(bool motion);

    void set_name(const std::string &name);
    void set_device_info(const DeviceInfo &info);

    // Presentation layer hook, installed when the entity is registered.
    void attach(Listener listener);
    void detach();
    bool is_attached() const { return static_cast<bool>(listener_); }

    // Push the current state to the presentation layer (no-op if detached).
    void publish_state() const;

private:
    std::string zone_id_;
    std::string zone_name_;
    std::string unique_id_;
    DeviceInfo device_info_;
    bool has_state_ = false;
    bool motion_ = false;
    Listener listener_;
};

} // namespace zone
