#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <utility>

#include "esp_err.h"
#include "config/config.hpp"
#include "core/work_queue.hpp"
#include "infra/transport/i_transport.hpp"
#include "app/zone_types.hpp"

namespace zone {

class ZoneManager;

using ZoneConfigCallback = std::function<void(const Roster &zones)>;
using ZoneMotionCallback = std::function<void(const std::string &zone_id, bool motion)>;
using LinkCallback = std::function<void(bool connected)>;

// Wires the transport to the decoder and hands every decoded event to the
// roster callback first, then to the motion callback. Only one service may
// be running at a time.
//
// Handlers run on the consumer of `queue`; teardown is executed there as
// well, so callbacks never race with stop(). The service must not be
// destroyed from inside one of its own callbacks.
class ZoneService {
public:
    ZoneService(transport::ITransport &transport, core::WorkQueue &queue,
                const config::ZoneSettings &settings);
    ~ZoneService();

    ZoneService(const ZoneService &) = delete;
    ZoneService &operator=(const ZoneService &) = delete;

    esp_err_t start(ZoneConfigCallback on_config, ZoneMotionCallback on_motion);

    // Drive a ZoneManager; its table is cleared again on stop().
    esp_err_t start(ZoneManager &manager);

    // Safe after a partial or failed start. From another task it returns
    // once the consumer has finished the item in progress and detached the
    // service. From a callback the detach is queued behind that callback.
    void stop();

    bool connected() const;

    // Called on the consumer task whenever the broker link goes up or down.
    void set_link_callback(LinkCallback callback) { link_cb_ = std::move(callback); }

private:
    esp_err_t handle_message(const transport::InboundMessage &msg);
    void detach(ZoneManager *manager);

    transport::ITransport &transport_;
    core::WorkQueue &queue_;
    const config::ZoneSettings &settings_;

    ZoneConfigCallback config_cb_;
    ZoneMotionCallback motion_cb_;
    LinkCallback link_cb_;
    ZoneManager *manager_ = nullptr;

    transport::ITransport::HandlerId handler_ids_[transport::kTopicCount] = {};
    std::atomic<bool> started_{false};
};

} // namespace zone
