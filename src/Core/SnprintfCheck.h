#pragma once
/**
 * @file SnprintfCheck.h
 * @brief Checked snprintf helper that logs truncation with source location.
 */

#include "Core/Log.h"
#include "Core/Platform.h"
#include <atomic>
#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

/** @brief Minimum spacing between two truncation warnings. */
constexpr uint32_t EBUSGATE_SNPRINTF_WARN_GAP_MS = 1000;

/** @brief Truncations seen since start, including the ones not warned about. */
inline std::atomic<uint32_t>& snprintfTruncations()
{
    static std::atomic<uint32_t> count{0};
    return count;
}

static inline int ebusgateSnprintfChecked_(const char* tag,
                                           const char* file,
                                           int line,
                                           char* out,
                                           size_t outLen,
                                           const char* fmt,
                                           ...)
{
    va_list ap;
    va_start(ap, fmt);
    const int wrote = vsnprintf(out, outLen, fmt, ap);
    va_end(ap);

    const bool truncated = (wrote < 0) || (outLen == 0) || ((size_t)wrote >= outLen);
    if (!truncated) return wrote;

    static std::atomic<uint32_t> lastWarnMs{0};
    static std::atomic<uint32_t> suppressed{0};
    snprintfTruncations().fetch_add(1, std::memory_order_relaxed);

    const uint32_t now = platformMillis();
    uint32_t last = lastWarnMs.load(std::memory_order_relaxed);
    if (last != 0 && (uint32_t)(now - last) < EBUSGATE_SNPRINTF_WARN_GAP_MS) {
        suppressed.fetch_add(1, std::memory_order_relaxed);
        return wrote;
    }
    if (!lastWarnMs.compare_exchange_strong(last, now == 0 ? 1 : now, std::memory_order_relaxed)) {
        suppressed.fetch_add(1, std::memory_order_relaxed);
        return wrote;
    }

    Log::warn(tag ? tag : "SnprChk",
              "snprintf truncated at %s:%d (len=%u wrote=%d, %lu similar suppressed)",
              file ? file : "?",
              line,
              (unsigned)outLen,
              wrote,
              (unsigned long)suppressed.exchange(0, std::memory_order_relaxed));
    return wrote;
}

#define EBUSGATE_SNPRINTF_CHECKED(TAG, OUT, LEN, FMT, ...) \
    ebusgateSnprintfChecked_((TAG), __FILE__, __LINE__, (OUT), (LEN), (FMT), ##__VA_ARGS__)
