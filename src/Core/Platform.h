#pragma once
/**
 * @file Platform.h
 * @brief Host platform helpers (monotonic clock).
 */
#include <stdint.h>
#include <chrono>

/** @brief Milliseconds since an unspecified monotonic epoch (wraps like Arduino `millis()`). */
static inline uint32_t platformMillis() {
    using namespace std::chrono;
    return (uint32_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}
