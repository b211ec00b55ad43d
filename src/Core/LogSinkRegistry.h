#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Registry of log sinks.
 */
#include <mutex>
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"

/**
 * @brief Stores the registered sinks and fans entries out to them.
 *
 * A sink is identified by its (write, ctx) pair and is registered once.
 */
class LogSinkRegistry {
public:
    /** @brief Add a sink, false when full, invalid or already present. */
    bool add(LogSinkService sink);
    /** @brief Number of registered sinks. */
    int count() const;
    /** @brief Write `e` to every sink. @return sinks written. */
    int deliver(const LogEntry& e) const;

private:
    mutable std::mutex mtx_;
    LogSinkService sinks_[Limits::MaxLogSinks]{};
    int n_ = 0;
};
