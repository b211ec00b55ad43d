/**
 * @file AutodiscoveryFormatter.cpp
 * @brief Implementation file.
 */
#include "Modules/Ebus/Format/AutodiscoveryFormatter.h"
#include "Modules/Ebus/Format/TopicFormatter.h"
#include "Core/MqttTopics.h"
#include <ArduinoJson.h>
#include <ctype.h>
#include <string.h>

#define LOG_TAG "HADisc"
#include "Core/ModuleLog.h"

void sanitizeId(const char* in, char* out, size_t outLen)
{
    if (!out || outLen == 0) return;
    out[0] = '\0';
    if (!in) return;

    size_t w = 0;
    for (size_t i = 0; in[i] != '\0' && w + 1 < outLen; ++i) {
        char c = in[i];
        if (isalnum((unsigned char)c)) {
            if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
            out[w++] = c;
        } else {
            out[w++] = '_';
        }
    }
    out[w] = '\0';
}

bool buildDiscoveryTopic(const ApplianceProfile& profile,
                         const char* circuit,
                         const char* fieldName,
                         char* out,
                         size_t outLen)
{
    if (!out || outLen == 0 || !circuit || !fieldName) return false;

    char nodeId[Limits::Profile::Buffers::Appliance];
    sanitizeId(profile.appliance, nodeId, sizeof(nodeId));

    char raw[Limits::Ha::ObjectIdBuf];
    const int n = snprintf(raw, sizeof(raw), "%s_%s", circuit, fieldName);
    if (n <= 0 || (size_t)n >= sizeof(raw)) return false;
    char objectId[Limits::Ha::ObjectIdBuf];
    sanitizeId(raw, objectId, sizeof(objectId));

    const char* root = (profile.autodiscovery.topicRoot[0] != '\0')
                           ? profile.autodiscovery.topicRoot
                           : MqttTopics::DefaultDiscoveryRoot;

    const int wrote = snprintf(out, outLen, "%s/%s/%s/%s/%s",
                               root, MqttTopics::ComponentSensor, nodeId, objectId, MqttTopics::SuffixConfig);
    return wrote > 0 && (size_t)wrote < outLen;
}

static bool expandStrings(JsonVariant v, const TemplateContext& ctx)
{
    if (v.is<JsonObject>()) {
        for (JsonPair kv : v.as<JsonObject>()) {
            if (!expandStrings(kv.value(), ctx)) return false;
        }
        return true;
    }
    if (v.is<JsonArray>()) {
        for (JsonVariant item : v.as<JsonArray>()) {
            if (!expandStrings(item, ctx)) return false;
        }
        return true;
    }
    if (!v.is<const char*>()) return true;

    const char* s = v.as<const char*>();
    if (!strchr(s, '<')) return true;

    char buf[Limits::Profile::Buffers::DiscoveryPayload];
    if (!formatTopic(s, ctx, buf, sizeof(buf))) return false;
    // char* (not const char*) makes ArduinoJson copy the text into the pool
    return v.set((char*)buf);
}

bool formatAutodiscovery(const ApplianceProfile& profile,
                         const Circuit& circuit,
                         const FieldMapping& field,
                         DiscoveryDocument& out,
                         ErrorCode& code)
{
    code = ErrorCode::None;
    out.topic[0] = '\0';
    out.payload[0] = '\0';

    if (!buildDiscoveryTopic(profile, circuit.name, field.name, out.topic, sizeof(out.topic))) {
        code = ErrorCode::TopicTruncated;
        LOGW("discovery topic truncated %s/%s", circuit.name, field.name);
        return false;
    }

    StaticJsonDocument<Limits::Ha::JsonDiscoveryDoc> doc;
    const char* tpl = profile.autodiscovery.payloadTemplate[0] != '\0' ? profile.autodiscovery.payloadTemplate : "{}";
    const DeserializationError err = deserializeJson(doc, tpl);
    if (err) {
        code = ErrorCode::BadSchemaJson;
        LOGW("discovery template parse error %s", err.c_str());
        return false;
    }

    TemplateContext ctx;
    ctx.appliance = profile.appliance;
    ctx.bus = profile.bus;
    ctx.circuit = circuit.name;
    ctx.fieldName = field.name;
    ctx.unit = field.unit;

    if (!expandStrings(doc.as<JsonVariant>(), ctx) || doc.overflowed()) {
        code = ErrorCode::CapacityExceeded;
        LOGW("discovery payload too large for %s/%s", circuit.name, field.name);
        return false;
    }

    if (measureJson(doc) >= sizeof(out.payload)) {
        code = ErrorCode::CapacityExceeded;
        LOGW("discovery payload too large for %s/%s", circuit.name, field.name);
        return false;
    }
    serializeJson(doc, out.payload, sizeof(out.payload));
    return true;
}

// The loader allocates fields in visit order, so "earlier" is a lower pool index.
static bool seenBefore(const ApplianceProfile& profile, const Circuit& circuit, uint16_t fieldIndex)
{
    const char* name = profile.fields[fieldIndex].name;
    for (uint16_t i = 0; i < circuit.messageCount; ++i) {
        const MessageDefinition& md = profile.messages[circuit.firstMessage + i];
        const FieldMapRef* maps[2] = {&md.requestMap, &md.responseMap};
        for (const FieldMapRef* r : maps) {
            if (!r->present) continue;
            for (uint16_t f = r->first; f < r->first + r->count && f < fieldIndex; ++f) {
                if (strcmp(profile.fields[f].name, name) == 0) return true;
            }
        }
    }
    return false;
}

uint16_t forEachKnownField(const ApplianceProfile& profile, KnownFieldFn fn, void* ctx)
{
    uint16_t visited = 0;
    for (uint8_t c = 0; c < profile.circuitCount; ++c) {
        const Circuit& circuit = profile.circuits[c];
        for (uint16_t i = 0; i < circuit.messageCount; ++i) {
            const uint16_t msgIndex = (uint16_t)(circuit.firstMessage + i);
            const MessageDefinition& md = profile.messages[msgIndex];
            const FieldMapRef* maps[2] = {&md.requestMap, &md.responseMap};
            for (const FieldMapRef* ref : maps) {
                if (!ref->present) continue;
                for (uint16_t f = ref->first; f < ref->first + ref->count; ++f) {
                    if (seenBefore(profile, circuit, f)) continue;
                    ++visited;
                    if (fn && !fn(ctx, circuit, profile.fields[f])) return visited;
                }
            }
        }
    }
    return visited;
}
