#include <unity.h>
#include <string.h>

#include "Core/ConfigStore.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"
#include "Modules/EbusGatewayModule/EbusGatewayModule.h"
#include "Modules/Ebus/Telegram/Crc8.h"
#include "Modules/Ebus/Schema/ProfileLoader.h"

static const char* kSchema = R"JSON({
  "appliance": "Vaillant ecoTEC",
  "bus": "ebus0",
  "presence_detection": {
    "valid": true,
    "request": {"src": "*", "dst": "08", "pbsb": "0704"},
    "response": {"src": "08", "pbsb": "0704", "data": "^B5"}
  },
  "mqtt_autodiscovery": {
    "enabled": true,
    "topic": "homeassistant",
    "payload": {"name": "<field_name>", "state_topic": "ebus/<circuit>/<field_name>", "unit_of_measurement": "<unit>"}
  },
  "circuits": [
    {
      "name": "boiler",
      "messages": [
        {
          "comment": "boiler status",
          "mqtt_publish_format": "ebus/<circuit>/<field_name>",
          "request_match": {"src": "*", "dst": "*", "pbsb": "2000", "data": "^7547"},
          "request_map": [
            {"field_name": "boiler_pressure", "field_offset": 2, "data_type": "u8", "factor": 0.1, "unit": "bar"}
          ]
        },
        {
          "comment": "broken mapping",
          "mqtt_publish_format": "ebus/<circuit>/<field_name>",
          "request_match": {"pbsb": "2001"},
          "request_map": [
            {"field_name": "first", "field_offset": 0, "data_type": "u8"},
            {"field_name": "far_away", "field_offset": 10, "data_type": "u8"}
          ]
        }
      ]
    },
    {
      "name": "hc1",
      "messages": [
        {
          "comment": "flow temperature",
          "mqtt_publish_format": "ebus/<circuit>/<field_name>/<unit>",
          "request_match": {"src": "10", "dst": "08", "pbsb": "B509", "data": "0D2C"},
          "response_map": [
            {"field_name": "flow_temp", "field_offset": 0, "data_type": "i16le", "factor": 0.0625, "unit": "C"}
          ]
        }
      ]
    }
  ]
})JSON";

struct Published {
    char topic[192];
    char payload[1600];
    int qos;
    bool retain;
};

struct FakeMqtt {
    Published items[16];
    int count = 0;
    bool connected = true;
    bool refuse = false;
};

static FakeMqtt mqtt;

static bool fakePublish(void* ctx, const char* topic, const char* payload, int qos, bool retain)
{
    FakeMqtt* m = static_cast<FakeMqtt*>(ctx);
    if (m->refuse || m->count >= 16) return false;
    Published& p = m->items[m->count++];
    strncpy(p.topic, topic, sizeof(p.topic) - 1);
    p.topic[sizeof(p.topic) - 1] = '\0';
    strncpy(p.payload, payload, sizeof(p.payload) - 1);
    p.payload[sizeof(p.payload) - 1] = '\0';
    p.qos = qos;
    p.retain = retain;
    return true;
}

static bool fakeConnected(void* ctx)
{
    return static_cast<FakeMqtt*>(ctx)->connected;
}

static MqttService mqttSvc{fakePublish, fakeConnected, &mqtt};

static ProbeOutcome busOutcome = ProbeOutcome::Timeout;

static ProbeOutcome fakeProbe(void* ctx, const Telegram& request, Telegram& reply, uint32_t timeoutMs)
{
    (void)ctx;
    (void)timeoutMs;
    if (busOutcome != ProbeOutcome::Reply) return busOutcome;
    reply = request;
    const uint8_t resp[] = {0xB5, 0x56};
    reply.setResponse(resp, sizeof(resp));
    return ProbeOutcome::Reply;
}

static EbusBusService busSvc{fakeProbe, nullptr};

struct LogCapture {
    LogEntry entries[32];
    int count = 0;
};

static LogCapture logs;

static void captureSink(void* ctx, const LogEntry& e)
{
    LogCapture* c = static_cast<LogCapture*>(ctx);
    if (c->count < 32) c->entries[c->count++] = e;
}

static bool logged(LogLevel lvl, const char* needle)
{
    for (int i = 0; i < logs.count; ++i) {
        if (logs.entries[i].lvl == lvl && strstr(logs.entries[i].msg, needle)) return true;
    }
    return false;
}

static ConfigStore cfg;
static ServiceRegistry services;
static ModuleManager manager;
static LogHubModule logHub;
static LogDispatcherModule dispatcher;
static EbusGatewayModule gateway;
static ApplianceProfile profile;

static Telegram makeTelegram(uint8_t src, uint8_t dst, uint16_t pbsb, const uint8_t* data, size_t n)
{
    Telegram t;
    t.src = src;
    t.dst = dst;
    t.pbsb = pbsb;
    t.setData(data, n);
    return t;
}

void setUp()
{
    mqtt = FakeMqtt{};
    logs.count = 0;
    busOutcome = ProbeOutcome::Timeout;
    dispatcher.pump();
    logs.count = 0;
}

void tearDown() {}

void test_boiler_status_publishes_pressure()
{
    const uint8_t payload[] = {0x75, 0x47, 0x19, 0x02, 0x03, 0x50};
    const Telegram t = makeTelegram(0x10, 0x08, 0x2000, payload, sizeof(payload));

    PublishRecord records[8];
    DecodeReport report;
    const uint8_t n = EbusGatewayModule::decode(profile, t, records, 8, &report);
    TEST_ASSERT_EQUAL_UINT8(1, n);
    TEST_ASSERT_EQUAL_STRING("ebus/boiler/boiler_pressure", records[0].topic);
    TEST_ASSERT_EQUAL_STRING("2.5", records[0].value);
    TEST_ASSERT_EQUAL_STRING("bar", records[0].unit);
    TEST_ASSERT_EQUAL_STRING("boiler_pressure", records[0].fieldName);

    TEST_ASSERT_EQUAL_UINT8(1, gateway.onTelegram(t));
    TEST_ASSERT_EQUAL_INT(1, mqtt.count);
    TEST_ASSERT_EQUAL_STRING("ebus/boiler/boiler_pressure", mqtt.items[0].topic);
    TEST_ASSERT_EQUAL_STRING("2.5", mqtt.items[0].payload);
    TEST_ASSERT_EQUAL_INT(0, mqtt.items[0].qos);
    TEST_ASSERT_FALSE(mqtt.items[0].retain);
}

void test_response_map_decodes_slave_data()
{
    const uint8_t req[] = {0x0D, 0x2C};
    Telegram t = makeTelegram(0x10, 0x08, 0xB509, req, sizeof(req));
    const uint8_t resp[] = {0x40, 0x01};  // 320 * 0.0625
    t.setResponse(resp, sizeof(resp));

    TEST_ASSERT_EQUAL_UINT8(1, gateway.onTelegram(t));
    TEST_ASSERT_EQUAL_STRING("ebus/hc1/flow_temp/C", mqtt.items[0].topic);
    TEST_ASSERT_EQUAL_STRING("20", mqtt.items[0].payload);
}

void test_unmatched_telegram_is_counted_not_published()
{
    const GatewayStats before = gateway.stats();
    const uint8_t data[] = {0x11};
    TEST_ASSERT_EQUAL_UINT8(0, gateway.onTelegram(makeTelegram(0x10, 0x08, 0x0909, data, 1)));
    TEST_ASSERT_EQUAL_INT(0, mqtt.count);
    TEST_ASSERT_EQUAL_UINT32(before.noMatch + 1, gateway.stats().noMatch);
}

void test_out_of_range_skips_message_and_logs_field()
{
    const GatewayStats before = gateway.stats();
    const uint8_t data[] = {0x01, 0x02};
    TEST_ASSERT_EQUAL_UINT8(0, gateway.onTelegram(makeTelegram(0x10, 0x08, 0x2001, data, sizeof(data))));
    TEST_ASSERT_EQUAL_INT(0, mqtt.count);
    TEST_ASSERT_EQUAL_UINT32(before.decodeErrors + 1, gateway.stats().decodeErrors);

    dispatcher.pump();
    TEST_ASSERT_TRUE(logged(LogLevel::Warn, "far_away"));
    TEST_ASSERT_TRUE(logged(LogLevel::Warn, "broken mapping"));
    TEST_ASSERT_TRUE(logged(LogLevel::Warn, "OutOfRange"));

    // later telegrams are unaffected
    const uint8_t payload[] = {0x75, 0x47, 0x19};
    TEST_ASSERT_EQUAL_UINT8(1, gateway.onTelegram(makeTelegram(0x10, 0x08, 0x2000, payload, sizeof(payload))));
}

void test_config_patch_changes_publish_flags()
{
    TEST_ASSERT_TRUE(cfg.applyJson("{\"mqtt\":{\"qos\":1,\"retain\":true}}"));
    const uint8_t payload[] = {0x75, 0x47, 0x19};
    gateway.onTelegram(makeTelegram(0x10, 0x08, 0x2000, payload, sizeof(payload)));
    TEST_ASSERT_EQUAL_INT(1, mqtt.items[0].qos);
    TEST_ASSERT_TRUE(mqtt.items[0].retain);
    TEST_ASSERT_TRUE(cfg.applyJson("{\"mqtt\":{\"qos\":0,\"retain\":false}}"));
}

void test_disconnected_broker_counts_failures()
{
    mqtt.connected = false;
    const GatewayStats before = gateway.stats();
    const uint8_t payload[] = {0x75, 0x47, 0x19};
    TEST_ASSERT_EQUAL_UINT8(0, gateway.onTelegram(makeTelegram(0x10, 0x08, 0x2000, payload, sizeof(payload))));
    TEST_ASSERT_EQUAL_UINT32(before.publishFailed + 1, gateway.stats().publishFailed);
    TEST_ASSERT_EQUAL(ErrorCode::NotReady, gateway.stats().lastPublishError);

    dispatcher.pump();
    TEST_ASSERT_TRUE(logged(LogLevel::Debug, "NotReady"));
}

void test_refused_publish_reports_publish_failed()
{
    mqtt.refuse = true;
    const GatewayStats before = gateway.stats();
    const uint8_t payload[] = {0x75, 0x47, 0x19};
    TEST_ASSERT_EQUAL_UINT8(0, gateway.onTelegram(makeTelegram(0x10, 0x08, 0x2000, payload, sizeof(payload))));
    TEST_ASSERT_EQUAL_INT(0, mqtt.count);
    TEST_ASSERT_EQUAL_UINT32(before.publishFailed + 1, gateway.stats().publishFailed);
    TEST_ASSERT_EQUAL_UINT32(before.published, gateway.stats().published);
    TEST_ASSERT_EQUAL(ErrorCode::PublishFailed, gateway.stats().lastPublishError);

    dispatcher.pump();
    TEST_ASSERT_TRUE(logged(LogLevel::Debug, "ebus/boiler/boiler_pressure"));
    TEST_ASSERT_TRUE(logged(LogLevel::Debug, "PublishFailed"));
}

static const char* kEnergySchema = R"JSON({
  "appliance": "meter",
  "bus": "ebus0",
  "circuits": [
    {
      "name": "boiler",
      "messages": [
        {
          "mqtt_publish_format": "ebus/<circuit>/<field_name>/<field_value>",
          "request_match": {"pbsb": "2100"},
          "request_map": [
            {"field_name": "energy", "field_offset": 0, "data_type": "u32le", "factor": 1e22}
          ]
        }
      ]
    }
  ]
})JSON";

static ApplianceProfile energyProfile;

void test_huge_scaled_value_expands_in_topic_and_payload()
{
    ProfileLoadError err;
    TEST_ASSERT_TRUE(loadApplianceProfile(kEnergySchema, energyProfile, err));

    const uint8_t data[] = {0xFF, 0xFF, 0xFF, 0xFF};
    PublishRecord records[4];
    DecodeReport report;
    TEST_ASSERT_EQUAL_UINT8(1, EbusGatewayModule::decode(energyProfile, makeTelegram(0x10, 0x08, 0x2100, data, 4),
                                                         records, 4, &report));
    TEST_ASSERT_EQUAL_UINT8(0, report.truncated);
    TEST_ASSERT_EQUAL_STRING("ebus/boiler/energy/4.294967295e+31", records[0].topic);
    TEST_ASSERT_EQUAL_STRING("4.294967295e+31", records[0].value);
}

void test_autodiscovery_publishes_retained_documents()
{
    TEST_ASSERT_EQUAL_UINT16(4, gateway.publishAutodiscovery());
    TEST_ASSERT_EQUAL_INT(4, mqtt.count);
    TEST_ASSERT_EQUAL_STRING("homeassistant/sensor/vaillant_ecotec/boiler_boiler_pressure/config", mqtt.items[0].topic);
    TEST_ASSERT_TRUE(mqtt.items[0].retain);
    TEST_ASSERT_NOT_NULL(strstr(mqtt.items[0].payload, "\"state_topic\":\"ebus/boiler/boiler_pressure\""));
    TEST_ASSERT_NOT_NULL(strstr(mqtt.items[0].payload, "\"unit_of_measurement\":\"bar\""));
    TEST_ASSERT_EQUAL_STRING("homeassistant/sensor/vaillant_ecotec/hc1_flow_temp/config", mqtt.items[3].topic);
}

void test_presence_through_bus_service()
{
    busOutcome = ProbeOutcome::Reply;
    TEST_ASSERT_EQUAL(PresenceState::Present, gateway.checkPresence());
    busOutcome = ProbeOutcome::Timeout;
    TEST_ASSERT_EQUAL(PresenceState::Absent, gateway.checkPresence());
    busOutcome = ProbeOutcome::Cancelled;
    TEST_ASSERT_EQUAL(PresenceState::Indeterminate, gateway.checkPresence());
}

void test_wire_bytes_reach_the_broker()
{
    const uint8_t data[] = {0x75, 0x47, 0x19};
    Telegram t = makeTelegram(0x10, 0x03, 0x2000, data, sizeof(data));
    const uint8_t crc = telegramRequestCrc(t);

    uint8_t raw[32];
    size_t n = 0;
    raw[n++] = 0xC6; raw[n++] = 0xAA;  // SYN as an enhanced pair
    raw[n++] = 0x10;
    raw[n++] = 0x03;
    raw[n++] = 0x20;
    raw[n++] = 0x00;
    raw[n++] = 0x03;
    raw[n++] = 0x75;
    raw[n++] = 0x47;
    raw[n++] = 0x19;
    if (crc < 0x80) {
        raw[n++] = crc;
    } else {
        raw[n++] = (uint8_t)(0xC4 | (crc >> 6));
        raw[n++] = (uint8_t)(0x80 | (crc & 0x3F));
    }
    raw[n++] = 0x00;
    raw[n++] = 0xC6; raw[n++] = 0xAA;

    gateway.feed(raw, n);
    TEST_ASSERT_EQUAL_INT(1, mqtt.count);
    TEST_ASSERT_EQUAL_STRING("2.5", mqtt.items[0].payload);
}

void test_failed_reload_keeps_active_profile()
{
    static ApplianceProfile spare;
    ProfileLoadError err;
    TEST_ASSERT_FALSE(gateway.reloadProfile("{\"appliance\":\"x\"}", 17, spare, err));
    TEST_ASSERT_EQUAL(ErrorCode::MissingField, err.code);
    TEST_ASSERT_EQUAL_PTR(&profile, gateway.profile());

    const uint8_t payload[] = {0x75, 0x47, 0x19};
    TEST_ASSERT_EQUAL_UINT8(1, gateway.onTelegram(makeTelegram(0x10, 0x08, 0x2000, payload, sizeof(payload))));
}

void test_no_profile_means_no_output()
{
    gateway.setProfile(nullptr);
    const uint8_t payload[] = {0x75, 0x47, 0x19};
    TEST_ASSERT_EQUAL_UINT8(0, gateway.onTelegram(makeTelegram(0x10, 0x08, 0x2000, payload, sizeof(payload))));
    TEST_ASSERT_EQUAL(PresenceState::Indeterminate, gateway.checkPresence());
    gateway.setProfile(&profile);
}

int main()
{
    services.add("mqtt", &mqttSvc);
    services.add("ebusbus", &busSvc);
    manager.add(&logHub);
    manager.add(&dispatcher);
    manager.add(&gateway);
    if (!manager.initAll(cfg, services)) return 1;

    const LogSinkRegistryService* sinks = services.get<LogSinkRegistryService>("logsinks");
    sinks->add(sinks->ctx, LogSinkService{captureSink, &logs});
    cfg.applyJson("{\"log\":{\"min_level\":0}}");

    ProfileLoadError err;
    if (!gateway.reloadProfile(kSchema, strlen(kSchema), profile, err)) return 1;

    UNITY_BEGIN();
    RUN_TEST(test_boiler_status_publishes_pressure);
    RUN_TEST(test_response_map_decodes_slave_data);
    RUN_TEST(test_unmatched_telegram_is_counted_not_published);
    RUN_TEST(test_out_of_range_skips_message_and_logs_field);
    RUN_TEST(test_config_patch_changes_publish_flags);
    RUN_TEST(test_disconnected_broker_counts_failures);
    RUN_TEST(test_refused_publish_reports_publish_failed);
    RUN_TEST(test_huge_scaled_value_expands_in_topic_and_payload);
    RUN_TEST(test_autodiscovery_publishes_retained_documents);
    RUN_TEST(test_presence_through_bus_service);
    RUN_TEST(test_wire_bytes_reach_the_broker);
    RUN_TEST(test_failed_reload_keeps_active_profile);
    RUN_TEST(test_no_profile_means_no_output);
    return UNITY_END();
}
