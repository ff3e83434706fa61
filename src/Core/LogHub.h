#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue between producer tasks and the dispatcher.
 */
#include "Core/Services/ILogger.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

/**
 * @brief Bounded queue of log entries.
 *
 * Producers never wait: an entry that does not fit is counted and the count
 * rides on the next entry that gets through (`LogEntry::dropped`).
 */
class LogHub {
public:
    bool init(uint8_t queueLen);

    bool enqueue(const LogEntry& e);
    /** @brief Blocks up to `waitTicks` for the next entry. */
    bool dequeue(LogEntry& out, TickType_t waitTicks);

    /** @brief Total entries lost since boot. */
    uint32_t droppedTotal() const { return droppedTotal_; }

private:
    QueueHandle_t q_ = nullptr;
    portMUX_TYPE mux_ = portMUX_INITIALIZER_UNLOCKED;
    uint16_t droppedPending_ = 0;
    uint32_t droppedTotal_ = 0;
};
