/**
 * @file EbusGatewayModule.cpp
 * @brief Implementation file.
 */
#include "EbusGatewayModule.h"
#include "Modules/Ebus/Match/PatternMatcher.h"
#include "Modules/Ebus/Decode/FieldExtractor.h"
#include "Modules/Ebus/Format/TopicFormatter.h"
#include "Modules/Ebus/Format/AutodiscoveryFormatter.h"

#define LOG_TAG "EbusGw"
#include "Core/ModuleLog.h"

EbusGatewayModule::EbusGatewayModule()
    : parser_(&EbusGatewayModule::onWireTelegram, this)
{
}

void EbusGatewayModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    services_ = &services;

    probeTimeoutVar_.setRange(0, 60000);
    qosVar_.setRange(0, 2);

    cfg.registerVar(masterAddrVar_);
    cfg.registerVar(probeTimeoutVar_);
    cfg.registerVar(qosVar_);
    cfg.registerVar(retainVar_);
    cfg.registerVar(haRetainVar_);
}

void EbusGatewayModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services)
{
    (void)cfg;
    services_ = &services;
    mqttSvc_ = services.get<MqttService>("mqtt");
    busSvc_ = services.get<EbusBusService>("ebusbus");

    if (!mqttSvc_) LOGW("no mqtt service registered, records will not be published");
    if (!busSvc_) LOGI("no ebusbus service registered, presence probing unavailable");
    LOGI("master=%02X probe_timeout=%ldms qos=%u retain=%d ha.retain=%d",
         cfgData.masterAddr, (long)cfgData.probeTimeoutMs, (unsigned)cfgData.mqttQos,
         (int)cfgData.mqttRetain, (int)cfgData.haRetain);
}

void EbusGatewayModule::onShutdown()
{
    const GatewayStats st = stats();
    const WireParserStats& ws = parser_.stats();
    LOGI("telegrams=%lu no_match=%lu decode_err=%lu published=%lu failed=%lu discovery=%lu",
         (unsigned long)st.telegrams, (unsigned long)st.noMatch, (unsigned long)st.decodeErrors,
         (unsigned long)st.published, (unsigned long)st.publishFailed, (unsigned long)st.discoveryPublished);
    LOGI("wire: frames=%lu crc_err=%lu too_long=%lu nack=%lu proto_err=%lu",
         (unsigned long)ws.telegrams, (unsigned long)ws.crcErrors, (unsigned long)ws.tooLong,
         (unsigned long)ws.nacks, (unsigned long)ws.protoErrors);
}

const MqttService* EbusGatewayModule::mqtt()
{
    if (!mqttSvc_ && services_) mqttSvc_ = services_->get<MqttService>("mqtt");
    return mqttSvc_;
}

const EbusBusService* EbusGatewayModule::bus()
{
    if (!busSvc_ && services_) busSvc_ = services_->get<EbusBusService>("ebusbus");
    return busSvc_;
}

void EbusGatewayModule::setProfile(const ApplianceProfile* profile)
{
    profile_.store(profile, std::memory_order_release);
    if (profile) {
        LOGI("active profile '%s' (%u circuits)", profile->appliance, (unsigned)profile->circuitCount);
    } else {
        LOGI("profile cleared, decoding disabled");
    }
}

bool EbusGatewayModule::reloadProfile(const char* json, size_t len, ApplianceProfile& spare, ProfileLoadError& err)
{
    if (&spare == profile()) {
        err.code = ErrorCode::NotReady;
        snprintf(err.where, sizeof(err.where), "$");
        LOGE("reload target is the active profile");
        return false;
    }
    if (!loadApplianceProfile(json, len, spare, err)) {
        LOGW("profile reload rejected (%s at %s), keeping current profile", errorCodeStr(err.code), err.where);
        return false;
    }
    setProfile(&spare);
    return true;
}

namespace {

struct MessageDecode {
    DecodedField fields[Limits::Mqtt::MaxRecordsPerTelegram];
    uint8_t count = 0;
};

// Decode both maps of one message; all or nothing.
bool decodeMessage(const ApplianceProfile& p, const MessageDefinition& m, const Telegram& t,
                   MessageDecode& out, ExtractError& err)
{
    out.count = 0;
    if (m.requestMap.present) {
        uint8_t n = 0;
        if (!extractFields(p.mapFields(m.requestMap), m.requestMap.count, t.data, t.len,
                           out.fields, Limits::Mqtt::MaxRecordsPerTelegram, n, err)) {
            return false;
        }
        out.count = n;
    }
    if (m.responseMap.present && t.hasResponse) {
        uint8_t n = 0;
        if (!extractFields(p.mapFields(m.responseMap), m.responseMap.count, t.resp, t.respLen,
                           out.fields + out.count, (uint8_t)(Limits::Mqtt::MaxRecordsPerTelegram - out.count), n, err)) {
            out.count = 0;
            return false;
        }
        out.count = (uint8_t)(out.count + n);
    }
    return true;
}

}  // namespace

uint8_t EbusGatewayModule::decode(const ApplianceProfile& profile,
                                  const Telegram& t,
                                  PublishRecord* out,
                                  uint8_t outCap,
                                  DecodeReport* report)
{
    DecodeReport local;
    DecodeReport& r = report ? *report : local;
    r = DecodeReport{};
    if (!out || outCap == 0) return 0;

    MatchResult matches[2];
    uint8_t matchCount = 0;

    MatchResult req = findMatch(t, Direction::Request, profile);
    if (req.found) matches[matchCount++] = req;
    MatchResult resp = findMatch(t, Direction::Response, profile);
    if (resp.found && !(req.found && resp.message == req.message)) matches[matchCount++] = resp;

    if (matchCount == 0) {
        r.noMatch = true;
        r.lastError = ErrorCode::NoMatch;
        return 0;
    }
    r.matched = matchCount;

    uint8_t written = 0;
    for (uint8_t i = 0; i < matchCount; ++i) {
        const MatchResult& mr = matches[i];
        MessageDecode md;
        ExtractError err;
        if (!decodeMessage(profile, *mr.message, t, md, err)) {
            ++r.decodeErrors;
            r.lastError = err.code;
            LOGW("%s: field '%s' of '%s' (%s): %s",
                 mr.circuit->name,
                 err.field ? err.field->name : "-",
                 mr.message->comment,
                 directionStr(mr.direction),
                 errorCodeStr(err.code));
            continue;
        }

        for (uint8_t f = 0; f < md.count; ++f) {
            if (written >= outCap) {
                ++r.truncated;
                r.lastError = ErrorCode::CapacityExceeded;
                continue;
            }
            const DecodedField& df = md.fields[f];

            TemplateContext ctx;
            ctx.appliance = profile.appliance;
            ctx.bus = profile.bus;
            ctx.circuit = mr.circuit->name;
            ctx.fieldName = df.name;
            ctx.unit = df.unit;
            ctx.hasValue = true;
            ctx.value = df.value;

            PublishRecord& rec = out[written];
            if (!formatTopic(mr.message->topicTemplate, ctx, rec.topic, sizeof(rec.topic)) ||
                !formatValue(df.value, rec.value, sizeof(rec.value))) {
                ++r.truncated;
                r.lastError = ErrorCode::TopicTruncated;
                LOGW("%s: topic for '%s' truncated", mr.circuit->name, df.name);
                continue;
            }
            rec.numeric = df.value;
            rec.fieldName = df.name;
            rec.unit = df.unit;
            ++written;
        }
    }
    return written;
}

ErrorCode EbusGatewayModule::publish(const char* topic, const char* payload, bool retain)
{
    const MqttService* m = mqtt();
    ErrorCode code = ErrorCode::None;
    if (!m || !m->publish) code = ErrorCode::NotReady;
    else if (m->isConnected && !m->isConnected(m->ctx)) code = ErrorCode::NotReady;
    else if (!m->publish(m->ctx, topic, payload, (int)cfgData.mqttQos, retain)) code = ErrorCode::PublishFailed;

    if (code != ErrorCode::None) {
        publishFailed_.fetch_add(1, std::memory_order_relaxed);
        lastPublishError_.store(code, std::memory_order_relaxed);
        LOGD("publish %s failed: %s", topic, errorCodeStr(code));
    }
    return code;
}

uint8_t EbusGatewayModule::onTelegram(const Telegram& t)
{
    telegrams_.fetch_add(1, std::memory_order_relaxed);

    const ApplianceProfile* p = profile();
    if (!p) {
        LOGD("telegram ignored, no profile loaded");
        return 0;
    }

    PublishRecord records[Limits::Mqtt::MaxRecordsPerTelegram];
    DecodeReport report;
    const uint8_t n = decode(*p, t, records, Limits::Mqtt::MaxRecordsPerTelegram, &report);

    if (report.noMatch) {
        noMatch_.fetch_add(1, std::memory_order_relaxed);
        if (Log::enabled(LogLevel::Debug)) {
            char line[160];
            formatTelegram(t, line, sizeof(line));
            LOGD("no match: %s", line);
        }
        return 0;
    }
    if (report.decodeErrors) decodeErrors_.fetch_add(report.decodeErrors, std::memory_order_relaxed);

    uint8_t sent = 0;
    for (uint8_t i = 0; i < n; ++i) {
        if (publish(records[i].topic, records[i].value, cfgData.mqttRetain) == ErrorCode::None) ++sent;
    }
    published_.fetch_add(sent, std::memory_order_relaxed);
    return sent;
}

void EbusGatewayModule::onWireTelegram(void* ctx, const Telegram& t)
{
    EbusGatewayModule* self = static_cast<EbusGatewayModule*>(ctx);
    if (self) self->onTelegram(t);
}

void EbusGatewayModule::feed(const uint8_t* bytes, size_t n)
{
    parser_.feed(bytes, n);
}

namespace {
struct DiscoveryCtx {
    EbusGatewayModule* self;
    const ApplianceProfile* profile;
    uint16_t sent;
    uint16_t failed;
};
}  // namespace

bool EbusGatewayModule::publishDiscoveryField(void* ctx, const Circuit& circuit, const FieldMapping& field)
{
    DiscoveryCtx* dc = static_cast<DiscoveryCtx*>(ctx);
    DiscoveryDocument doc;
    ErrorCode code = ErrorCode::None;
    if (!formatAutodiscovery(*dc->profile, circuit, field, doc, code)) {
        ++dc->failed;
        LOGW("discovery for %s/%s skipped: %s", circuit.name, field.name, errorCodeStr(code));
        return true;
    }
    if (dc->self->publish(doc.topic, doc.payload, dc->self->cfgData.haRetain) != ErrorCode::None) {
        ++dc->failed;
        return true;
    }
    ++dc->sent;
    return true;
}

uint16_t EbusGatewayModule::publishAutodiscovery()
{
    const ApplianceProfile* p = profile();
    if (!p) {
        LOGW("autodiscovery skipped, no profile loaded");
        return 0;
    }
    if (!p->autodiscovery.enabled) {
        LOGD("autodiscovery disabled by profile");
        return 0;
    }

    DiscoveryCtx dc{this, p, 0, 0};
    forEachKnownField(*p, &EbusGatewayModule::publishDiscoveryField, &dc);
    discoveryPublished_.fetch_add(dc.sent, std::memory_order_relaxed);
    LOGI("autodiscovery: %u published, %u failed", (unsigned)dc.sent, (unsigned)dc.failed);
    return dc.sent;
}

PresenceState EbusGatewayModule::checkPresence(ErrorCode* why)
{
    const ApplianceProfile* p = profile();
    if (!p) {
        if (why) *why = ErrorCode::NotReady;
        return PresenceState::Indeterminate;
    }
    const uint32_t timeout = (cfgData.probeTimeoutMs > 0) ? (uint32_t)cfgData.probeTimeoutMs : 0;
    const PresenceState s = evaluatePresence(p->presence, bus(), cfgData.masterAddr, timeout, why);
    LOGI("presence of '%s': %s", p->appliance, presenceStateStr(s));
    return s;
}

GatewayStats EbusGatewayModule::stats() const
{
    GatewayStats s;
    s.telegrams = telegrams_.load(std::memory_order_relaxed);
    s.noMatch = noMatch_.load(std::memory_order_relaxed);
    s.decodeErrors = decodeErrors_.load(std::memory_order_relaxed);
    s.published = published_.load(std::memory_order_relaxed);
    s.publishFailed = publishFailed_.load(std::memory_order_relaxed);
    s.discoveryPublished = discoveryPublished_.load(std::memory_order_relaxed);
    s.lastPublishError = lastPublishError_.load(std::memory_order_relaxed);
    return s;
}
