#pragma once
/**
 * @file LogHubModule.h
 * @brief Module that hosts the LogHub and sink registry.
 */
#include "Core/Module.h"
#include "Core/ServiceRegistry.h"
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"
#include "Core/Services/ILogger.h"

/**
 * @brief Wires log hub and sink registry services and owns `log.min_level`.
 */
class LogHubModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "loghub"; }

    /** @brief Initialize log hub and register services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Apply the configured minimum level. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    /** @brief Entries lost because the hub was full. */
    uint32_t dropped() const { return hub.dropped(); }

private:
    static void onMinLevelChanged(void* ctx, const uint8_t& value);

    LogHub hub;
    LogHubService hubSvc{};

    LogSinkRegistry sinks;
    LogSinkRegistryService sinksSvc{};

    uint8_t minLevel_ = (uint8_t)LogLevel::Info;
    ConfigVariable<uint8_t,1> minLevelVar_{"min_level", "log", ConfigType::UInt8, &minLevel_, 0};
};
