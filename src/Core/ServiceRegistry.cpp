/**
 * @file ServiceRegistry.cpp
 * @brief Implementation file.
 */
#include "ServiceRegistry.h"
#include "Core/Log.h"

#define LOG_TAG_CORE "SvcRegst"

bool ServiceRegistry::addRaw(const char* id, const void* service, ServiceTypeTag type) {
    if (!id || !service || !type) return false;
    if (find(id)) {
        Log::warn(LOG_TAG_CORE, "service already registered: %s", id);
        return false;
    }
    if (count >= Limits::MaxServices) {
        Log::error(LOG_TAG_CORE, "service registry full, dropping %s", id);
        return false;
    }
    entries[count++] = {id, service, type};
    Log::debug(LOG_TAG_CORE, "service registered: %s", id);
    return true;
}

const ServiceEntry* ServiceRegistry::find(const char* id) const {
    if (!id) return nullptr;
    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(entries[i].id, id) == 0)
            return &entries[i];
    }
    return nullptr;
}
