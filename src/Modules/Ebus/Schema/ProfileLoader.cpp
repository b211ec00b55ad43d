/**
 * @file ProfileLoader.cpp
 * @brief Implementation file.
 */
#include "Modules/Ebus/Schema/ProfileLoader.h"
#include <ArduinoJson.h>
#include <string.h>

#define LOG_TAG "Profile"
#include "Core/ModuleLog.h"

namespace {

class Loader {
public:
    Loader(ApplianceProfile& p, ProfileLoadError& e) : p_(p), err_(e) {}

    bool loadRoot(JsonObjectConst root);

private:
    bool fail(ErrorCode code, const char* path, const char* key = nullptr);

    bool copyString(JsonVariantConst v, char* dst, size_t dstLen, const char* path, const char* key, bool required);
    bool readHexText(JsonVariantConst v, char* out, size_t outLen, uint8_t minDigits);

    bool loadPattern(JsonVariantConst v, PatternSpec& out, const char* path);
    bool loadFieldMap(JsonVariantConst v, FieldMapRef& out, const char* path);
    bool loadMessage(JsonObjectConst m, MessageDefinition& out, const char* path);
    bool loadCircuit(JsonObjectConst c, uint8_t index);
    bool loadPresence(JsonVariantConst v);
    bool loadAutodiscovery(JsonVariantConst v);

    ApplianceProfile& p_;
    ProfileLoadError& err_;
};

bool Loader::fail(ErrorCode code, const char* path, const char* key)
{
    err_.code = code;
    if (key && key[0] != '\0') {
        snprintf(err_.where, sizeof(err_.where), "%s%s%s", path, (path[0] != '\0') ? "." : "", key);
    } else {
        snprintf(err_.where, sizeof(err_.where), "%s", (path[0] != '\0') ? path : "$");
    }
    return false;
}

bool Loader::copyString(JsonVariantConst v, char* dst, size_t dstLen, const char* path, const char* key, bool required)
{
    dst[0] = '\0';
    if (v.isNull()) {
        if (required) return fail(ErrorCode::MissingField, path, key);
        return true;
    }
    if (!v.is<const char*>()) return fail(ErrorCode::BadSchemaJson, path, key);
    const char* s = v.as<const char*>();
    const size_t n = strlen(s);
    if (n >= dstLen) return fail(ErrorCode::CapacityExceeded, path, key);
    memcpy(dst, s, n + 1);
    return true;
}

bool Loader::readHexText(JsonVariantConst v, char* out, size_t outLen, uint8_t minDigits)
{
    if (v.is<const char*>()) {
        const char* s = v.as<const char*>();
        if (strlen(s) >= outLen) return false;
        snprintf(out, outLen, "%s", s);
        return true;
    }
    if (v.is<long>()) {
        // 10 is read as hex 0x10: the schema writes hex without quotes
        const long n = v.as<long>();
        if (n < 0) return false;
        char digits[24];
        const int wrote = snprintf(digits, sizeof(digits), "%ld", n);
        if (wrote <= 0) return false;
        int width = (wrote < (int)minDigits) ? (int)minDigits : wrote;
        if (width % 2 != 0) ++width;
        if ((size_t)width >= outLen) return false;
        snprintf(out, outLen, "%0*ld", width, n);
        return true;
    }
    return false;
}

bool Loader::loadPattern(JsonVariantConst v, PatternSpec& out, const char* path)
{
    out = PatternSpec{};
    JsonObjectConst o = v.as<JsonObjectConst>();
    if (o.isNull()) return fail(ErrorCode::BadSchemaJson, path);

    char text[2 * Limits::Profile::MaxPatternBytes + 8];

    JsonVariantConst src = o["src"];
    if (src.isNull()) {
        out.src.setAnyByte();
    } else if (!readHexText(src, text, sizeof(text), 2) || !parseAddressPattern(text, out.src)) {
        return fail(ErrorCode::InvalidHex, path, "src");
    }

    JsonVariantConst dst = o["dst"];
    if (dst.isNull()) {
        out.dst.setAnyByte();
    } else if (!readHexText(dst, text, sizeof(text), 2) || !parseAddressPattern(text, out.dst)) {
        return fail(ErrorCode::InvalidHex, path, "dst");
    }

    JsonVariantConst pbsb = o["pbsb"];
    if (!pbsb.isNull()) {
        if (!readHexText(pbsb, text, sizeof(text), 4) || !parsePbsb(text, out.pbsb)) {
            return fail(ErrorCode::InvalidHex, path, "pbsb");
        }
        out.hasPbsb = true;
    }

    JsonVariantConst data = o["data"];
    if (data.isNull()) {
        out.data.setAnyPayload();
    } else if (!readHexText(data, text, sizeof(text), 2) || !parseBytePattern(text, out.data)) {
        return fail(ErrorCode::InvalidHex, path, "data");
    }
    return true;
}

bool Loader::loadFieldMap(JsonVariantConst v, FieldMapRef& out, const char* path)
{
    out = FieldMapRef{};
    if (v.isNull()) return true;

    JsonArrayConst arr = v.as<JsonArrayConst>();
    if (arr.isNull()) return fail(ErrorCode::BadSchemaJson, path);
    if (arr.size() > Limits::Profile::MaxFieldsPerMap) return fail(ErrorCode::CapacityExceeded, path);
    if (p_.fieldCount + arr.size() > Limits::Profile::MaxFields) return fail(ErrorCode::CapacityExceeded, path);

    out.first = p_.fieldCount;
    out.present = true;

    char fpath[96];
    uint8_t idx = 0;
    for (JsonVariantConst item : arr) {
        snprintf(fpath, sizeof(fpath), "%s[%u]", path, (unsigned)idx);
        JsonObjectConst f = item.as<JsonObjectConst>();
        if (f.isNull()) return fail(ErrorCode::BadSchemaJson, fpath);

        FieldMapping& fm = p_.fields[p_.fieldCount];
        fm = FieldMapping{};

        if (!copyString(f["field_name"], fm.name, sizeof(fm.name), fpath, "field_name", true)) return false;
        if (fm.name[0] == '\0') return fail(ErrorCode::MissingField, fpath, "field_name");
        for (uint16_t j = out.first; j < p_.fieldCount; ++j) {
            if (strcmp(p_.fields[j].name, fm.name) == 0) return fail(ErrorCode::DuplicateName, fpath, "field_name");
        }

        JsonVariantConst off = f["field_offset"];
        if (off.isNull()) return fail(ErrorCode::MissingField, fpath, "field_offset");
        if (!off.is<long>()) return fail(ErrorCode::InvalidOffset, fpath, "field_offset");
        const long offVal = off.as<long>();
        if (offVal < 0 || offVal > 0xFFFF) return fail(ErrorCode::InvalidOffset, fpath, "field_offset");
        fm.offset = (uint16_t)offVal;

        JsonVariantConst dt = f["data_type"];
        if (dt.isNull()) return fail(ErrorCode::MissingField, fpath, "data_type");
        if (!dt.is<const char*>()) return fail(ErrorCode::InvalidDataType, fpath, "data_type");
        fm.type = dataTypeFromName(dt.as<const char*>());
        if (fm.type == DataType::Invalid) return fail(ErrorCode::InvalidDataType, fpath, "data_type");

        JsonVariantConst factor = f["factor"];
        if (!factor.isNull()) {
            // integer literals (`"factor": 1`) are factors too
            if (!factor.is<double>() && !factor.is<long>()) return fail(ErrorCode::BadSchemaJson, fpath, "factor");
            fm.factor = factor.is<long>() ? (double)factor.as<long>() : factor.as<double>();
        }

        if (!copyString(f["unit"], fm.unit, sizeof(fm.unit), fpath, "unit", false)) return false;

        ++p_.fieldCount;
        ++out.count;
        ++idx;
    }
    return true;
}

bool Loader::loadMessage(JsonObjectConst m, MessageDefinition& out, const char* path)
{
    out = MessageDefinition{};

    if (!copyString(m["comment"], out.comment, sizeof(out.comment), path, "comment", false)) return false;

    // mqtt_publish_format, or any other <sink>_publish_format key
    bool haveTopic = false;
    for (JsonPairConst kv : m) {
        const char* key = kv.key().c_str();
        static const char kSuffix[] = "_publish_format";
        const size_t klen = strlen(key);
        const size_t slen = sizeof(kSuffix) - 1;
        if (klen < slen || strcmp(key + klen - slen, kSuffix) != 0) continue;
        if (!copyString(kv.value(), out.topicTemplate, sizeof(out.topicTemplate), path, key, true)) return false;
        haveTopic = true;
        break;
    }
    if (!haveTopic) return fail(ErrorCode::MissingField, path, "mqtt_publish_format");

    char sub[96];
    JsonVariantConst req = m["request_match"];
    if (!req.isNull()) {
        snprintf(sub, sizeof(sub), "%s.request_match", path);
        if (!loadPattern(req, out.request, sub)) return false;
        out.hasRequestPattern = true;
    }
    JsonVariantConst resp = m["response_match"];
    if (!resp.isNull()) {
        snprintf(sub, sizeof(sub), "%s.response_match", path);
        if (!loadPattern(resp, out.response, sub)) return false;
        out.hasResponsePattern = true;
    }
    if (!out.hasRequestPattern && !out.hasResponsePattern) return fail(ErrorCode::EmptyMessage, path, "request_match");

    snprintf(sub, sizeof(sub), "%s.request_map", path);
    if (!loadFieldMap(m["request_map"], out.requestMap, sub)) return false;
    snprintf(sub, sizeof(sub), "%s.response_map", path);
    if (!loadFieldMap(m["response_map"], out.responseMap, sub)) return false;
    if (!out.requestMap.present && !out.responseMap.present) return fail(ErrorCode::EmptyMessage, path, "request_map");

    return true;
}

bool Loader::loadCircuit(JsonObjectConst c, uint8_t index)
{
    char path[32];
    snprintf(path, sizeof(path), "circuits[%u]", (unsigned)index);

    Circuit& circuit = p_.circuits[index];
    circuit = Circuit{};
    if (!copyString(c["name"], circuit.name, sizeof(circuit.name), path, "name", true)) return false;
    if (circuit.name[0] == '\0') return fail(ErrorCode::MissingField, path, "name");
    for (uint8_t i = 0; i < index; ++i) {
        if (strcmp(p_.circuits[i].name, circuit.name) == 0) return fail(ErrorCode::DuplicateName, path, "name");
    }

    JsonVariantConst msgs = c["messages"];
    if (msgs.isNull()) return fail(ErrorCode::MissingField, path, "messages");
    JsonArrayConst arr = msgs.as<JsonArrayConst>();
    if (arr.isNull()) return fail(ErrorCode::BadSchemaJson, path, "messages");

    circuit.firstMessage = p_.messageCount;
    char mpath[64];
    uint16_t idx = 0;
    for (JsonVariantConst item : arr) {
        snprintf(mpath, sizeof(mpath), "%s.messages[%u]", path, (unsigned)idx);
        if (p_.messageCount >= Limits::Profile::MaxMessages) return fail(ErrorCode::CapacityExceeded, mpath);
        JsonObjectConst m = item.as<JsonObjectConst>();
        if (m.isNull()) return fail(ErrorCode::BadSchemaJson, mpath);
        if (!loadMessage(m, p_.messages[p_.messageCount], mpath)) return false;
        ++p_.messageCount;
        ++circuit.messageCount;
        ++idx;
    }
    return true;
}

bool Loader::loadPresence(JsonVariantConst v)
{
    p_.presence = PresenceRule{};
    if (v.isNull()) return true;
    JsonObjectConst o = v.as<JsonObjectConst>();
    if (o.isNull()) return fail(ErrorCode::BadSchemaJson, "presence_detection");

    JsonVariantConst valid = o["valid"];
    if (!valid.isNull() && !valid.is<bool>()) return fail(ErrorCode::BadSchemaJson, "presence_detection", "valid");
    p_.presence.valid = valid | false;

    JsonVariantConst req = o["request"];
    JsonVariantConst resp = o["response"];
    if (p_.presence.valid) {
        if (req.isNull()) return fail(ErrorCode::MissingField, "presence_detection", "request");
        if (resp.isNull()) return fail(ErrorCode::MissingField, "presence_detection", "response");
    }
    if (!req.isNull() && !loadPattern(req, p_.presence.request, "presence_detection.request")) return false;
    if (!resp.isNull() && !loadPattern(resp, p_.presence.response, "presence_detection.response")) return false;
    return true;
}

bool Loader::loadAutodiscovery(JsonVariantConst v)
{
    p_.autodiscovery = AutodiscoveryConfig{};
    if (v.isNull()) return true;
    JsonObjectConst o = v.as<JsonObjectConst>();
    if (o.isNull()) return fail(ErrorCode::BadSchemaJson, "mqtt_autodiscovery");

    JsonVariantConst en = o["enabled"];
    if (!en.isNull() && !en.is<bool>()) return fail(ErrorCode::BadSchemaJson, "mqtt_autodiscovery", "enabled");
    AutodiscoveryConfig& ad = p_.autodiscovery;
    ad.enabled = en | false;

    if (!copyString(o["topic"], ad.topicRoot, sizeof(ad.topicRoot), "mqtt_autodiscovery", "topic", false)) return false;

    JsonVariantConst payload = o["payload"];
    if (payload.isNull()) {
        if (ad.enabled) return fail(ErrorCode::MissingField, "mqtt_autodiscovery", "payload");
        return true;
    }
    if (!payload.is<JsonObjectConst>()) return fail(ErrorCode::BadSchemaJson, "mqtt_autodiscovery", "payload");
    if (measureJson(payload) >= sizeof(ad.payloadTemplate)) {
        return fail(ErrorCode::CapacityExceeded, "mqtt_autodiscovery", "payload");
    }
    serializeJson(payload, ad.payloadTemplate, sizeof(ad.payloadTemplate));
    return true;
}

bool Loader::loadRoot(JsonObjectConst root)
{
    if (!copyString(root["appliance"], p_.appliance, sizeof(p_.appliance), "", "appliance", true)) return false;
    if (!copyString(root["bus"], p_.bus, sizeof(p_.bus), "", "bus", false)) return false;
    if (!loadPresence(root["presence_detection"])) return false;
    if (!loadAutodiscovery(root["mqtt_autodiscovery"])) return false;

    JsonVariantConst circuits = root["circuits"];
    if (circuits.isNull()) return fail(ErrorCode::MissingField, "", "circuits");
    JsonArrayConst arr = circuits.as<JsonArrayConst>();
    if (arr.isNull()) return fail(ErrorCode::BadSchemaJson, "", "circuits");
    if (arr.size() > Limits::Profile::MaxCircuits) return fail(ErrorCode::CapacityExceeded, "", "circuits");

    uint8_t idx = 0;
    for (JsonVariantConst item : arr) {
        JsonObjectConst c = item.as<JsonObjectConst>();
        if (c.isNull()) {
            char path[32];
            snprintf(path, sizeof(path), "circuits[%u]", (unsigned)idx);
            return fail(ErrorCode::BadSchemaJson, path);
        }
        if (!loadCircuit(c, idx)) return false;
        ++idx;
        p_.circuitCount = idx;
    }
    return true;
}

}  // namespace

bool loadApplianceProfile(const char* json, size_t len, ApplianceProfile& out, ProfileLoadError& err)
{
    err = ProfileLoadError{};
    out.clear();

    if (!json || len == 0) {
        err.code = ErrorCode::BadSchemaJson;
        snprintf(err.where, sizeof(err.where), "$");
        LOGW("load failed: empty document");
        return false;
    }

    DynamicJsonDocument doc(Limits::Profile::JsonSchemaDoc);
    const DeserializationError jerr = deserializeJson(doc, json, len);
    if (jerr) {
        err.code = ErrorCode::BadSchemaJson;
        snprintf(err.where, sizeof(err.where), "$");
        LOGW("load failed: parse error %s", jerr.c_str());
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) {
        err.code = ErrorCode::BadSchemaJson;
        snprintf(err.where, sizeof(err.where), "$");
        LOGW("load failed: root is not an object");
        return false;
    }

    Loader loader(out, err);
    if (!loader.loadRoot(root)) {
        LOGW("load failed: %s at %s", errorCodeStr(err.code), err.where);
        out.clear();
        return false;
    }

    LOGI("loaded '%s': circuits=%u messages=%u fields=%u",
         out.appliance, (unsigned)out.circuitCount, (unsigned)out.messageCount, (unsigned)out.fieldCount);
    return true;
}

bool loadApplianceProfile(const char* json, ApplianceProfile& out, ProfileLoadError& err)
{
    return loadApplianceProfile(json, json ? strlen(json) : 0, out, err);
}
