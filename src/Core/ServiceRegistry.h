#pragma once
/**
 * @file ServiceRegistry.h
 * @brief Typed service registry for cross-module access.
 */
#include <stdint.h>
#include <cstring>
#include "Core/SystemLimits.h"

/** @brief Opaque per-type tag, one distinct address per service struct type. */
using ServiceTypeTag = const void*;

template<typename T>
ServiceTypeTag serviceTypeTag() {
    static const char tag = 0;
    return &tag;
}

/** @brief Raw registry entry. */
struct ServiceEntry {
    const char* id;
    const void* ptr;
    ServiceTypeTag type;
};

/**
 * @brief Registry of named services.
 *
 * Each entry remembers the struct type it was registered with; `get<T>`
 * returns nullptr when the id exists under another type.
 */
class ServiceRegistry {
public:
    /** @brief Register a service under a unique id. */
    template<typename T>
    bool add(const char* id, const T* service) {
        return addRaw(id, service, serviceTypeTag<T>());
    }

    /** @brief Fetch a typed service by id. */
    template<typename T>
    const T* get(const char* id) const {
        const ServiceEntry* e = find(id);
        if (!e || e->type != serviceTypeTag<T>()) return nullptr;
        return static_cast<const T*>(e->ptr);
    }

    /** @brief True when `id` is registered, whatever its type. */
    bool has(const char* id) const { return find(id) != nullptr; }
    uint8_t size() const { return count; }

private:
    bool addRaw(const char* id, const void* service, ServiceTypeTag type);
    const ServiceEntry* find(const char* id) const;

    ServiceEntry entries[Limits::MaxServices]{};
    uint8_t count = 0;
};
