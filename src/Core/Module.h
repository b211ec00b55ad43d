#pragma once
/**
 * @file Module.h
 * @brief Base interface for all runtime modules.
 */
#include <stdint.h>
#include "ConfigStore.h"
#include "ServiceRegistry.h"

/**
 * @brief Base class for modules wired by `ModuleManager`.
 *
 * Modules register their config variables and services in `init()`. The host
 * drives any periodic work itself; modules own no threads.
 */
class Module {
public:
    /** @brief Virtual destructor. */
    virtual ~Module() = default;

    /** @brief Unique module identifier (used for dependency wiring). */
    virtual const char* moduleId() const = 0;

    /** @brief Number of declared dependencies. */
    virtual uint8_t dependencyCount() const { return 0; }
    /** @brief Dependency id at index, or nullptr if none. */
    virtual const char* dependency(uint8_t) const { return nullptr; }

    /** @brief Initialize module and register services/config. */
    virtual void init(ConfigStore& cfg, ServiceRegistry& services) = 0;
    /** @brief Called once every module has been initialized. */
    virtual void onConfigLoaded(ConfigStore&, ServiceRegistry&) {}
    /** @brief Called by `ModuleManager::shutdownAll`, dependents first. */
    virtual void onShutdown() {}
};
