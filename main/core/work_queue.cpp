#include "core/work_queue.hpp"

#include <memory>
#include <new>
#include <utility>

#include "esp_log.h"

namespace core {

namespace {
const char *TAG = "work_queue";
constexpr TickType_t kStopTimeout = pdMS_TO_TICKS(2000);
}

WorkQueue::~WorkQueue()
{
    (void)stop();
    if (queue_) {
        vQueueDelete(queue_);
        queue_ = nullptr;
    }
    if (done_) {
        vSemaphoreDelete(done_);
        done_ = nullptr;
    }
}

esp_err_t WorkQueue::init(int depth)
{
    if (queue_) return ESP_OK;
    if (depth <= 0) return ESP_ERR_INVALID_ARG;
    // Items are heap pointers; nullptr is the stop sentinel.
    queue_ = xQueueCreate(depth, sizeof(Work *));
    if (!queue_) return ESP_ERR_NO_MEM;
    return ESP_OK;
}

esp_err_t WorkQueue::start(const char *name, std::uint32_t stack_size, UBaseType_t priority)
{
    if (!queue_) return ESP_ERR_INVALID_STATE;
    if (task_) return ESP_OK;
    if (!done_) {
        done_ = xSemaphoreCreateBinary();
        if (!done_) return ESP_ERR_NO_MEM;
    }
    stop_requested_ = false;
    if (xTaskCreate(&WorkQueue::task_entry, name, stack_size, this, priority, &task_) != pdPASS) {
        task_ = nullptr;
        ESP_LOGE(TAG, "Failed to create consumer task '%s'", name ? name : "?");
        return ESP_FAIL;
    }
    return ESP_OK;
}

esp_err_t WorkQueue::stop()
{
    if (task_) {
        if (in_consumer()) {
            ESP_LOGW(TAG, "stop() called from the consumer task, ignored");
            return ESP_ERR_INVALID_STATE;
        }
        Work *sentinel = nullptr;
        // Jump the line so the task exits even with a full backlog.
        if (xQueueSendToFront(queue_, &sentinel, kStopTimeout) != pdTRUE ||
            xSemaphoreTake(done_, kStopTimeout) != pdTRUE) {
            ESP_LOGE(TAG, "Consumer task did not stop in time");
            return ESP_ERR_TIMEOUT;
        }
        task_ = nullptr;
    }
    std::size_t dropped = discard_pending();
    if (dropped > 0) {
        ESP_LOGI(TAG, "Dropped %u pending item(s)", static_cast<unsigned>(dropped));
    }
    return ESP_OK;
}

esp_err_t WorkQueue::post(Work work, TickType_t wait)
{
    if (!queue_) return ESP_ERR_INVALID_STATE;
    if (!work) return ESP_ERR_INVALID_ARG;

    std::unique_ptr<Work> item(new (std::nothrow) Work(std::move(work)));
    if (!item) return ESP_ERR_NO_MEM;

    Work *raw = item.get();
    if (xQueueSend(queue_, &raw, wait) != pdTRUE) {
        ESP_LOGW(TAG, "Queue full, work item dropped");
        return ESP_ERR_TIMEOUT;
    }
    // The queue owns it now.
    item.release();
    return ESP_OK;
}

namespace {
struct SyncCall {
    Work work;
    SemaphoreHandle_t done = nullptr;

    ~SyncCall()
    {
        if (done) vSemaphoreDelete(done);
    }
};
} // namespace

esp_err_t WorkQueue::run_sync(Work work, TickType_t wait)
{
    if (!queue_) return ESP_ERR_INVALID_STATE;
    if (!work) return ESP_ERR_INVALID_ARG;

    if (in_consumer() || draining_) {
        esp_err_t err = post(std::move(work), 0);
        return err == ESP_OK ? ESP_ERR_NOT_FINISHED : err;
    }
    if (!task_) {
        work();
        return ESP_OK;
    }

    // Shared with the queued item so a timed-out caller leaves nothing dangling.
    auto call = std::make_shared<SyncCall>();
    call->work = std::move(work);
    call->done = xSemaphoreCreateBinary();
    if (!call->done) return ESP_ERR_NO_MEM;

    esp_err_t err = post([call]() {
        call->work();
        xSemaphoreGive(call->done);
    }, wait);
    if (err != ESP_OK) return err;

    if (xSemaphoreTake(call->done, wait) != pdTRUE) {
        ESP_LOGW(TAG, "Synchronous item still pending after timeout");
        return ESP_ERR_TIMEOUT;
    }
    return ESP_OK;
}

bool WorkQueue::run_one(TickType_t wait)
{
    if (!queue_) return false;

    Work *raw = nullptr;
    if (xQueueReceive(queue_, &raw, wait) != pdTRUE) {
        return false;
    }
    if (!raw) {
        stop_requested_ = true;
        return false;
    }
    std::unique_ptr<Work> item(raw);
    draining_ = true;
    (*item)();
    draining_ = false;
    return true;
}

std::size_t WorkQueue::discard_pending()
{
    if (!queue_) return 0;

    std::size_t count = 0;
    Work *raw = nullptr;
    while (xQueueReceive(queue_, &raw, 0) == pdTRUE) {
        if (raw) {
            std::unique_ptr<Work> drop(raw);
            ++count;
        }
    }
    return count;
}

bool WorkQueue::in_consumer() const
{
    return task_ != nullptr && xTaskGetCurrentTaskHandle() == task_;
}

void WorkQueue::task_entry(void *arg)
{
    auto *self = static_cast<WorkQueue *>(arg);
    ESP_LOGI(TAG, "Consumer task running");
    while (!self->stop_requested_) {
        (void)self->run_one(portMAX_DELAY);
    }
    ESP_LOGI(TAG, "Consumer task exiting");
    xSemaphoreGive(self->done_);
    vTaskDelete(nullptr);
}

} // namespace core
