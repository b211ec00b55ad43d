#pragma once
/**
 * @file ModuleManager.h
 * @brief Dependency ordering, initialization and shutdown of modules.
 */
#include "Module.h"
#include "Core/SystemLimits.h"

/**
 * @brief Registers modules, resolves dependencies, and initializes them in order.
 *
 * Module ids are unique. `shutdownAll` walks the init order backwards so a
 * module still sees its dependencies while it stops.
 */
class ModuleManager {
public:
    /** @brief Add a module, false when full or when its id is taken. */
    bool add(Module* m);
    /** @brief Initialize all modules in dependency order. */
    bool initAll(ConfigStore& cfg, ServiceRegistry& services);
    /** @brief Call `onShutdown` in reverse init order (no-op before `initAll`). */
    void shutdownAll();

    /** @brief Current module count. */
    uint8_t getCount() const { return count; }
    /** @brief Module registered under `id`, or nullptr. */
    Module* find(const char* id) const;
    /** @brief Module at init position `idx` (valid after `initAll`). */
    Module* getOrdered(uint8_t idx) const {
        if (idx >= orderedCount) return nullptr;
        return ordered[idx];
    }

private:
    Module* modules[Limits::MaxModules]{};
    uint8_t count = 0;

    Module* ordered[Limits::MaxModules]{};
    uint8_t orderedCount = 0;
    bool initialized = false;

    bool buildInitOrder();
    void logInitOrder() const;
};
