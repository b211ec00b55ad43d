/**
 * @file ModuleLog.h
 * @brief Per-file logging macros bound to `LOG_TAG`.
 *
 * Define `LOG_TAG` (at most 9 characters) before including this header and
 * include it last: it replaces `snprintf` with the checked variant.
 */
#pragma once

#include "Core/Log.h"
#include "Core/SnprintfCheck.h"

#ifndef LOG_TAG
#define LOG_TAG "EbusGate"
#endif

#undef LOGD
#undef LOGI
#undef LOGW
#undef LOGE

// Arguments are not evaluated when the level is filtered out.
#define EBUSGATE_LOG_AT(LVL, FN, ...) \
    do { if (::Log::enabled(LVL)) ::Log::FN(LOG_TAG, __VA_ARGS__); } while (0)

#define LOGD(...) EBUSGATE_LOG_AT(LogLevel::Debug, debug, __VA_ARGS__)
#define LOGI(...) EBUSGATE_LOG_AT(LogLevel::Info, info, __VA_ARGS__)
#define LOGW(...) EBUSGATE_LOG_AT(LogLevel::Warn, warn, __VA_ARGS__)
#define LOGE(...) EBUSGATE_LOG_AT(LogLevel::Error, error, __VA_ARGS__)

#ifndef EBUSGATE_SNPRINTF_WRAP_ACTIVE
#define EBUSGATE_SNPRINTF_WRAP_ACTIVE 1
#undef snprintf
#define snprintf(OUT, LEN, FMT, ...) \
    EBUSGATE_SNPRINTF_CHECKED(LOG_TAG, OUT, LEN, FMT, ##__VA_ARGS__)
#endif
