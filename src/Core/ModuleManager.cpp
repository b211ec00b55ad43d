/**
 * @file ModuleManager.cpp
 * @brief Implementation file.
 */
#include "ModuleManager.h"
#include "Core/Log.h"
#include <cstring>
#include <stdio.h>

#define LOG_TAG_CORE "ModManag"

bool ModuleManager::add(Module* m) {
    if (!m || !m->moduleId()) return false;
    if (find(m->moduleId())) {
        Log::error(LOG_TAG_CORE, "duplicate module id: %s", m->moduleId());
        return false;
    }
    if (count >= Limits::MaxModules) {
        Log::error(LOG_TAG_CORE, "module table full, dropping %s", m->moduleId());
        return false;
    }
    modules[count++] = m;
    return true;
}

Module* ModuleManager::find(const char* id) const {
    if (!id) return nullptr;
    for (uint8_t i = 0; i < count; ++i)
        if (strcmp(modules[i]->moduleId(), id) == 0) return modules[i];
    return nullptr;
}

void ModuleManager::logInitOrder() const {
    char line[160];
    size_t pos = 0;
    line[0] = '\0';
    for (uint8_t i = 0; i < orderedCount; ++i) {
        const int n = snprintf(line + pos, sizeof(line) - pos, "%s%s",
                               (i > 0) ? " > " : "", ordered[i]->moduleId());
        if (n <= 0 || pos + (size_t)n >= sizeof(line)) break;
        pos += (size_t)n;
    }
    Log::info(LOG_TAG_CORE, "init order: %s", line);
}

bool ModuleManager::buildInitOrder() {
    Log::debug(LOG_TAG_CORE, "buildInitOrder: count=%u", (unsigned)count);
    /// Kahn topo-sort
    bool placed[Limits::MaxModules] = {0};
    orderedCount = 0;

    for (uint8_t pass = 0; pass < count; ++pass) {
        bool progress = false;

        for (uint8_t i = 0; i < count; ++i) {
            Module* m = modules[i];
            if (!m || placed[i]) continue;

            /// Check if all dependencies are already placed
            bool depsOk = true;
            const uint8_t depCount = m->dependencyCount();

            for (uint8_t d = 0; d < depCount; ++d) {
                const char* depId = m->dependency(d);
                if (!depId) continue;

                Module* dep = find(depId);
                if (!dep) {
                    Log::error(LOG_TAG_CORE, "missing dependency: module=%s requires=%s",
                               m->moduleId(), depId);
                    return false;
                }

                bool depPlaced = false;
                for (uint8_t j = 0; j < count; ++j) {
                    if (modules[j] == dep) {
                        depPlaced = placed[j];
                        break;
                    }
                }

                if (!depPlaced) {
                    depsOk = false;
                    break;
                }
            }

            if (depsOk) {
                ordered[orderedCount++] = m;
                placed[i] = true;
                progress = true;
            }
        }

        if (orderedCount == count) break;

        if (!progress) {
            for (uint8_t i = 0; i < count; ++i) {
                if (modules[i] && !placed[i]) {
                    Log::error(LOG_TAG_CORE, "not placed: %s", modules[i]->moduleId());
                }
            }
            Log::error(LOG_TAG_CORE, "cyclic or unresolved deps detected");
            return false;
        }
    }

    Log::debug(LOG_TAG_CORE, "buildInitOrder: success (ordered=%u)", (unsigned)orderedCount);
    return true;
}

bool ModuleManager::initAll(ConfigStore& cfg, ServiceRegistry& services) {
    Log::debug(LOG_TAG_CORE, "initAll: moduleCount=%u", (unsigned)count);

    if (initialized) return true;
    if (!buildInitOrder()) return false;
    logInitOrder();

    for (uint8_t i = 0; i < orderedCount; ++i) {
        Log::debug(LOG_TAG_CORE, "init: %s", ordered[i]->moduleId());
        ordered[i]->init(cfg, services);
    }

    for (uint8_t i = 0; i < orderedCount; ++i) {
        ordered[i]->onConfigLoaded(cfg, services);
    }

    initialized = true;
    Log::debug(LOG_TAG_CORE, "initAll: done");
    return true;
}

void ModuleManager::shutdownAll() {
    if (!initialized) return;
    for (uint8_t i = orderedCount; i > 0; --i) {
        Log::debug(LOG_TAG_CORE, "shutdown: %s", ordered[i - 1]->moduleId());
        ordered[i - 1]->onShutdown();
    }
    initialized = false;
}
