/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

bool LogHub::init(uint8_t queueLen)
{
    if (q_) return true;
    q_ = xQueueCreate(queueLen, sizeof(LogEntry));
    return q_ != nullptr;
}

bool LogHub::enqueue(const LogEntry& e)
{
    if (!q_) return false;

    LogEntry copy = e;
    portENTER_CRITICAL(&mux_);
    copy.dropped = droppedPending_;
    portEXIT_CRITICAL(&mux_);

    if (xQueueSend(q_, &copy, 0) == pdTRUE) {
        portENTER_CRITICAL(&mux_);
        droppedPending_ = (droppedPending_ >= copy.dropped) ? (uint16_t)(droppedPending_ - copy.dropped) : 0;
        portEXIT_CRITICAL(&mux_);
        return true;
    }

    portENTER_CRITICAL(&mux_);
    if (droppedPending_ < UINT16_MAX) ++droppedPending_;
    ++droppedTotal_;
    portEXIT_CRITICAL(&mux_);
    return false;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks)
{
    if (!q_) return false;
    return xQueueReceive(q_, &out, waitTicks) == pdTRUE;
}
