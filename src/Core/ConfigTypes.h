#pragma once
/**
 * @file ConfigTypes.h
 * @brief Shared configuration types and metadata.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/SystemLimits.h"

/** @brief Supported config value types. */
enum class ConfigType : uint8_t {
    Int32,
    UInt8,
    Bool,
    CharArray
};

/** @brief Callback signature for config changes. */
template<typename T>
using ConfigCallback = void(*)(void* ctx, const T& value);

/**
 * @brief Declares a config variable and optional change handlers.
 */
template<typename T, size_t MAX_HANDLERS>
struct ConfigVariable {
    const char* jsonName;
    const char* moduleName;
    ConfigType type;
    T* value;
    uint16_t size; // for char[]

    /** @brief Change handler entry. */
    struct Handler { ConfigCallback<T> cb; void* ctx; };
    Handler handlers[MAX_HANDLERS > 0 ? MAX_HANDLERS : 1];
    uint8_t handlerCount = 0;

    // Inclusive bounds for Int32/UInt8 values, checked by ConfigStore.
    bool hasRange = false;
    int32_t minValue = 0;
    int32_t maxValue = 0;

    /** @brief Restrict accepted values to [lo, hi]. Call before registering. */
    void setRange(int32_t lo, int32_t hi) {
        hasRange = true;
        minValue = lo;
        maxValue = hi;
    }

    /** @brief Register a change handler. */
    bool addHandler(ConfigCallback<T> cb, void* ctx) {
        if (handlerCount >= MAX_HANDLERS) return false;
        handlers[handlerCount++] = {cb, ctx};
        return true;
    }

    /** @brief Notify all handlers with the current value. */
    void notify() {
        for (uint8_t i = 0; i < handlerCount; ++i)
            handlers[i].cb(handlers[i].ctx, *value);
    }
};

/** @brief Internal metadata for registered variables. */
struct ConfigMeta {
    const char* module;
    const char* name;
    ConfigType type;
    void* valuePtr;
    uint16_t size;
    bool hasRange;
    int32_t minValue;
    int32_t maxValue;
    void* var;                  // owning ConfigVariable, for change handlers
    void (*notify)(void* var);
};
