#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue for asynchronous logging.
 */
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"
#include <mutex>

/**
 * @brief Bounded ring shared by log producers and the dispatcher.
 */
class LogHub {
public:
    /** @brief Reset the ring and set its length (clamped to the static capacity). */
    void init(int queueLen = Limits::LogQueueLen);

    /** @brief Enqueue a log entry (non-blocking, drops when full). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue the oldest entry, false when empty. */
    bool dequeue(LogEntry& out);

    /** @brief Entries dropped because the ring was full. */
    uint32_t dropped() const;

private:
    mutable std::mutex mtx_;
    LogEntry ring_[Limits::LogQueueLen]{};
    int len_ = 0;
    int head_ = 0;
    int count_ = 0;
    uint32_t dropped_ = 0;
};
