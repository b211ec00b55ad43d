/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"

void LogDispatcherModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    auto hubSvc = services.get<LogHubService>("loghub");
    _sinkReg = services.get<LogSinkRegistryService>("logsinks");

    /// the hub object travels as the service ctx
    if (!hubSvc || !hubSvc->ctx || !_sinkReg) return;

    _hub = static_cast<LogHub*>(hubSvc->ctx);
}

size_t LogDispatcherModule::pump(size_t maxEntries) {
    if (!_hub || !_sinkReg) return 0;

    LogEntry e;
    size_t delivered = 0;
    while ((maxEntries == 0 || delivered < maxEntries) && _hub->dequeue(e)) {
        _sinkReg->deliver(_sinkReg->ctx, e);
        ++delivered;
    }
    return delivered;
}
