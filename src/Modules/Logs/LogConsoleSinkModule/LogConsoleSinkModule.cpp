/**
 * @file LogConsoleSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogConsoleSinkModule.h"
#include <stdio.h>
#include "Core/Log.h"

static const char* lvlStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "D";
        case LogLevel::Info:  return "I";
        case LogLevel::Warn:  return "W";
        case LogLevel::Error: return "E";
    }
    return "?";
}

static const char* lvlColor(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "\x1b[90m";
        case LogLevel::Info:  return "\x1b[32m";
        case LogLevel::Warn:  return "\x1b[33m";
        case LogLevel::Error: return "\x1b[31m";
    }
    return "";
}

static const char* colorReset() { return "\x1b[0m"; }

static void formatUptime(char *out, size_t outSize, uint32_t ms)
{
    uint32_t s   = ms / 1000;
    uint32_t m   = s / 60;
    uint32_t h   = m / 60;

    uint32_t hh  = h % 24;
    uint32_t mm  = m % 60;
    uint32_t ss  = s % 60;
    uint32_t mmm = ms % 1000;

    snprintf(out, outSize, "%02lu:%02lu:%02lu.%03lu",
             (unsigned long)hh,
             (unsigned long)mm,
             (unsigned long)ss,
             (unsigned long)mmm);
}

void LogConsoleSinkModule::write(void* ctx, const LogEntry& e) {
    const LogConsoleSinkModule* self = static_cast<const LogConsoleSinkModule*>(ctx);
    const bool color = self ? self->color_ : false;

    char ts[24];
    formatUptime(ts, sizeof(ts), e.ts_ms);

    printf("[%s][%s][%s] %s%s%s\n",
           ts,
           lvlStr(e.lvl),
           e.tag,
           color ? lvlColor(e.lvl) : "",
           e.msg,
           color ? colorReset() : "");
    fflush(stdout);
}

void LogConsoleSinkModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    auto sinks = services.get<LogSinkRegistryService>("logsinks");
    if (!sinks) return;

    LogSinkService sink{};
    sink.write = &LogConsoleSinkModule::write;
    sink.ctx = this;

    if (!sinks->add(sinks->ctx, sink)) {
        Log::warn("LogCons", "console sink not registered (registry full)");
    }
}
