#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/semphr.h"
#include "freertos/task.h"

namespace core {

using Work = std::function<void()>;

// FIFO of work items drained by a single consumer task.
// post() may be called from any task; everything posted runs serialized
// on the consumer, in posting order.
class WorkQueue {
public:
    WorkQueue() = default;
    ~WorkQueue();

    WorkQueue(const WorkQueue &) = delete;
    WorkQueue &operator=(const WorkQueue &) = delete;

    // Create the underlying queue (idempotent).
    esp_err_t init(int depth);

    // Spawn the consumer task. init() must have succeeded.
    esp_err_t start(const char *name, std::uint32_t stack_size, UBaseType_t priority);

    // Stop the consumer task and drop pending items. Must not be called from
    // the consumer itself.
    esp_err_t stop();

    // Enqueue a work item; waits at most `wait` ticks for room.
    esp_err_t post(Work work, TickType_t wait = 0);

    // Run `work` in order with everything already queued and wait up to
    // `wait` ticks for it to finish. Without a consumer task it runs inline.
    // Called from inside a work item, it is queued behind the current item
    // and ESP_ERR_NOT_FINISHED is returned.
    esp_err_t run_sync(Work work, TickType_t wait);

    // Run a single queued item on the calling task.
    // Returns false if nothing arrived within `wait` or a stop was requested.
    bool run_one(TickType_t wait);

    // Delete everything still queued; returns the number of dropped items.
    std::size_t discard_pending();

    bool in_consumer() const;
    bool running() const { return task_ != nullptr; }

private:
    static void task_entry(void *arg);

    QueueHandle_t queue_ = nullptr;
    TaskHandle_t task_ = nullptr;
    SemaphoreHandle_t done_ = nullptr;
    volatile bool stop_requested_ = false;
    // An item is executing on the task that called run_one().
    bool draining_ = false;
};

} // namespace core
