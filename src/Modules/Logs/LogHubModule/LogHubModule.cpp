/**
 * @file LogHubModule.cpp
 * @brief Implementation file.
 */
#include "LogHubModule.h"
#include "Core/Log.h"
#include "Core/SystemLimits.h"

static LogLevel levelFromByte(uint8_t v)
{
    if (v > (uint8_t)LogLevel::Error) return LogLevel::Error;
    return (LogLevel)v;
}

void LogHubModule::onMinLevelChanged(void* ctx, const uint8_t& value)
{
    (void)ctx;
    Log::setMinLevel(levelFromByte(value));
}

void LogHubModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    hub.init(Limits::LogQueueLen);

    /// expose loghub service
    hubSvc.enqueue = [](void* ctx, const LogEntry& e) -> bool {
        return static_cast<LogHub*>(ctx)->enqueue(e);
    };
    hubSvc.ctx = &hub;

    /// expose sink registry service
    sinksSvc.add = [](void* ctx, LogSinkService sink) -> bool {
        return static_cast<LogSinkRegistry*>(ctx)->add(sink);
    };
    sinksSvc.count = [](void* ctx) -> int {
        return static_cast<LogSinkRegistry*>(ctx)->count();
    };
    sinksSvc.deliver = [](void* ctx, const LogEntry& e) -> int {
        return static_cast<LogSinkRegistry*>(ctx)->deliver(e);
    };
    sinksSvc.ctx = &sinks;

    services.add("loghub", &hubSvc);
    services.add("logsinks", &sinksSvc);

    minLevelVar_.setRange((int32_t)LogLevel::Debug, (int32_t)LogLevel::Error);
    minLevelVar_.addHandler(&LogHubModule::onMinLevelChanged, this);
    cfg.registerVar(minLevelVar_);

    Log::setHub(&hubSvc);
}

void LogHubModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;
    (void)services;
    Log::setMinLevel(levelFromByte(minLevel_));
}
