/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

static bool strEquals(const char* a, const char* b) {
    if (!a || !b) return false;
    return strcmp(a, b) == 0;
}

static bool inRange(const ConfigMeta& m, long v) {
    if (!m.hasRange) return true;
    if (v >= m.minValue && v <= m.maxValue) return true;
    Log::warn(LOG_TAG_CORE, "applyJson: %s.%s=%ld outside [%ld, %ld]",
              m.module, m.name, v, (long)m.minValue, (long)m.maxValue);
    return false;
}

const ConfigMeta* ConfigStore::find(const char* module, const char* name) const
{
    if (!module || !name) return nullptr;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        if (strEquals(_meta[i].module, module) && strEquals(_meta[i].name, name)) return &_meta[i];
    }
    return nullptr;
}

int ConfigStore::writeValue_(const ConfigMeta& m, char* out, size_t outLen) const
{
    switch (m.type) {
        case ConfigType::Int32:
            return snprintf(out, outLen, "%ld", (long)*(int32_t*)m.valuePtr);
        case ConfigType::UInt8:
            return snprintf(out, outLen, "%u", (unsigned)*(uint8_t*)m.valuePtr);
        case ConfigType::Bool:
            return snprintf(out, outLen, "%s", (*(bool*)m.valuePtr) ? "true" : "false");
        case ConfigType::CharArray:
            return snprintf(out, outLen, "\"%s\"", (const char*)m.valuePtr);
    }
    return snprintf(out, outLen, "null");
}

bool ConfigStore::toJson(char* out, size_t outLen) const
{
    if (!out || outLen < 3) return false;

    const char* modules[Limits::MaxConfigVars];
    const uint8_t modCount = listModules(modules, (uint8_t)Limits::MaxConfigVars);

    size_t pos = 0;
    out[pos++] = '{';
    for (uint8_t i = 0; i < modCount; ++i) {
        int n = snprintf(out + pos, outLen - pos, "%s\"%s\":", (i > 0) ? "," : "", modules[i]);
        if (n <= 0 || pos + (size_t)n >= outLen) { out[outLen - 1] = '\0'; return false; }
        pos += (size_t)n;

        bool truncated = false;
        toJsonModule(modules[i], out + pos, outLen - pos, &truncated);
        if (truncated) return false;
        pos += strlen(out + pos);
    }

    if (pos + 2 > outLen) { out[outLen - 1] = '\0'; return false; }
    out[pos++] = '}';
    out[pos] = '\0';
    return true;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (!out || outLen == 0) return false;
    if (!module || module[0] == '\0' || outLen < 3) {
        out[0] = '\0';
        return false;
    }

    size_t pos = 0;
    out[pos++] = '{';

    bool any = false;
    bool truncatedLocal = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!strEquals(m.module, module)) continue;

        int n = snprintf(out + pos, outLen - pos, "%s\"%s\":", any ? "," : "", m.name);
        if (n <= 0 || pos + (size_t)n >= outLen) { truncatedLocal = true; break; }
        pos += (size_t)n;

        n = writeValue_(m, out + pos, outLen - pos);
        if (n <= 0 || pos + (size_t)n >= outLen) { truncatedLocal = true; break; }
        pos += (size_t)n;

        any = true;
    }

    if (!truncatedLocal && pos + 2 <= outLen) {
        out[pos++] = '}';
        out[pos] = '\0';
    } else {
        truncatedLocal = true;
        out[outLen - 1] = '\0';
    }

    if (truncated) *truncated = truncatedLocal;
    return any;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (exists) continue;

        if (count < max) {
            out[count++] = m.module;
        } else {
            break;
        }
    }

    return count;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json) return false;

    StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    const DeserializationError err = deserializeJson(doc, json);
    if (err) {
        Log::warn(LOG_TAG_CORE, "applyJson: parse error %s", err.c_str());
        return false;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) {
        Log::warn(LOG_TAG_CORE, "applyJson: root is not an object");
        return false;
    }

    Log::debug(LOG_TAG_CORE, "applyJson: start");
    bool ok = true;
    for (JsonPairConst modKv : root) {
        JsonObjectConst vars = modKv.value().as<JsonObjectConst>();
        if (vars.isNull()) continue;

        for (JsonPairConst kv : vars) {
            const ConfigMeta* cm = find(modKv.key().c_str(), kv.key().c_str());
            if (!cm) {
                Log::debug(LOG_TAG_CORE, "applyJson: unknown %s.%s", modKv.key().c_str(), kv.key().c_str());
                continue;
            }
            ConfigMeta& m = const_cast<ConfigMeta&>(*cm);
            JsonVariantConst v = kv.value();
            bool changed = false;

            switch (m.type) {
            case ConfigType::Int32: {
                if (!v.is<long>() || !inRange(m, v.as<long>())) { ok = false; break; }
                int32_t nv = v.as<int32_t>();
                if (*(int32_t*)m.valuePtr != nv) { *(int32_t*)m.valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::UInt8: {
                if (!v.is<long>() || v.as<long>() < 0 || v.as<long>() > 255 || !inRange(m, v.as<long>())) {
                    ok = false;
                    break;
                }
                uint8_t nv = v.as<uint8_t>();
                if (*(uint8_t*)m.valuePtr != nv) { *(uint8_t*)m.valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::Bool: {
                if (!v.is<bool>()) { ok = false; break; }
                bool nv = v.as<bool>();
                if (*(bool*)m.valuePtr != nv) { *(bool*)m.valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::CharArray: {
                const char* s = v.as<const char*>();
                if (!s || m.size == 0) { ok = false; break; }
                size_t len = strlen(s);
                if (len >= m.size) len = m.size - 1;

                /// compare before writing to avoid spurious handler calls
                if (strncmp((char*)m.valuePtr, s, len) != 0 || ((char*)m.valuePtr)[len] != '\0') {
                    memcpy(m.valuePtr, s, len);
                    ((char*)m.valuePtr)[len] = '\0';
                    changed = true;
                }
                break;
            }
            }

            if (changed) {
                Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m.module, m.name);
                if (m.notify && m.var) m.notify(m.var);
            }
        }
    }
    if (!ok) Log::warn(LOG_TAG_CORE, "applyJson: some values had the wrong type");
    Log::debug(LOG_TAG_CORE, "applyJson: done");
    return ok;
}
