/**
 * @file main.cpp
 * @brief Host entry point and module wiring.
 *
 * Usage: ebusgate <profile.json> [capture|-] [config-patch.json]
 *
 * Raw adapter bytes are read from the capture file (or stdin) and decoded
 * with the profile. Publishes go to stdout as `topic payload` lines; a real
 * broker client registers its own `mqtt` service instead.
 */
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "Core/ConfigStore.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"
#include "Core/Services/Services.h"

#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"
#include "Modules/Logs/LogConsoleSinkModule/LogConsoleSinkModule.h"
#include "Modules/EbusGatewayModule/EbusGatewayModule.h"

#define LOG_TAG "Main"
#include "Core/ModuleLog.h"

static ConfigStore registry;
static ModuleManager moduleManager;
static ServiceRegistry services;

static LogHubModule         logHubModule;
static LogDispatcherModule  logDispatcherModule;
static LogConsoleSinkModule logConsoleSinkModule;
static EbusGatewayModule    gatewayModule;

static ApplianceProfile gProfile;

static bool stdoutPublish(void* ctx, const char* topic, const char* payload, int qos, bool retain)
{
    (void)ctx;
    printf("%s %s%s (qos=%d)\n", topic, payload, retain ? " [retained]" : "", qos);
    return true;
}

static bool stdoutConnected(void* ctx)
{
    (void)ctx;
    return true;
}

static MqttService stdoutMqtt{stdoutPublish, stdoutConnected, nullptr};

static bool readFile(const char* path, char** out, size_t* outLen)
{
    FILE* f = (strcmp(path, "-") == 0) ? stdin : fopen(path, "rb");
    if (!f) return false;

    size_t cap = 4096;
    size_t len = 0;
    char* buf = (char*)malloc(cap + 1);
    if (!buf) {
        if (f != stdin) fclose(f);
        return false;
    }
    for (;;) {
        if (len == cap) {
            cap *= 2;
            char* grown = (char*)realloc(buf, cap + 1);
            if (!grown) {
                free(buf);
                if (f != stdin) fclose(f);
                return false;
            }
            buf = grown;
        }
        const size_t n = fread(buf + len, 1, cap - len, f);
        if (n == 0) break;
        len += n;
    }
    if (f != stdin) fclose(f);
    buf[len] = '\0';
    *out = buf;
    *outLen = len;
    return true;
}

int main(int argc, char** argv)
{
    if (argc < 2) {
        fprintf(stderr, "usage: %s <profile.json> [capture|-] [config-patch.json]\n", argv[0]);
        return 2;
    }

    services.add("mqtt", &stdoutMqtt);

    moduleManager.add(&logHubModule);
    moduleManager.add(&logDispatcherModule);
    moduleManager.add(&logConsoleSinkModule);
    moduleManager.add(&gatewayModule);
    if (!moduleManager.initAll(registry, services)) {
        fprintf(stderr, "module init failed\n");
        return 1;
    }

    if (argc >= 4) {
        char* patch = nullptr;
        size_t patchLen = 0;
        if (!readFile(argv[3], &patch, &patchLen) || !registry.applyJson(patch)) {
            LOGE("config patch %s rejected", argv[3]);
        }
        free(patch);
    }

    char* json = nullptr;
    size_t jsonLen = 0;
    if (!readFile(argv[1], &json, &jsonLen)) {
        LOGE("cannot read profile %s", argv[1]);
        logDispatcherModule.pump();
        return 1;
    }

    ProfileLoadError err;
    const bool loaded = gatewayModule.reloadProfile(json, jsonLen, gProfile, err);
    free(json);
    if (!loaded) {
        char errJson[160];
        writeErrorJson(errJson, sizeof(errJson), err.code, err.where);
        LOGE("profile rejected: %s", errJson);
        logDispatcherModule.pump();
        return 1;
    }

    gatewayModule.publishAutodiscovery();
    logDispatcherModule.pump();

    if (argc >= 3) {
        char* raw = nullptr;
        size_t rawLen = 0;
        if (!readFile(argv[2], &raw, &rawLen)) {
            LOGE("cannot read capture %s", argv[2]);
        } else {
            // drain the log ring between chunks
            const size_t chunk = Limits::Ebus::RxBufLen;
            for (size_t off = 0; off < rawLen; off += chunk) {
                const size_t n = (rawLen - off < chunk) ? (rawLen - off) : chunk;
                gatewayModule.feed((const uint8_t*)raw + off, n);
                logDispatcherModule.pump();
            }
            free(raw);
        }
    }

    LOGI("log dropped=%lu fmt_truncated=%lu",
         (unsigned long)logHubModule.dropped(),
         (unsigned long)snprintfTruncations().load());

    char cfgJson[512];
    if (registry.toJson(cfgJson, sizeof(cfgJson))) LOGD("config %s", cfgJson);

    moduleManager.shutdownAll();
    return 0;
}
