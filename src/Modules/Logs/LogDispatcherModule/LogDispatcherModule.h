#pragma once
/**
 * @file LogDispatcherModule.h
 * @brief Module that dispatches log entries to sinks.
 */
#include <stddef.h>
#include "Core/Module.h"
#include "Core/ServiceRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/LogHub.h"

/**
 * @brief Drains the log hub into every registered sink.
 *
 * The host calls `pump()` from its main loop (or a dedicated thread).
 */
class LogDispatcherModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.dispatcher"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Wire hub and sink registry. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Deliver whatever is still queued. */
    void onShutdown() override { pump(); }

    /**
     * @brief Deliver pending entries to the sinks.
     * @param maxEntries stop after this many entries, 0 = until empty.
     * @return entries delivered.
     */
    size_t pump(size_t maxEntries = 0);

private:
    LogHub* _hub = nullptr;
    const LogSinkRegistryService* _sinkReg = nullptr;
};
