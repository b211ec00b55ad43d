#include <unity.h>
#include <ArduinoJson.h>
#include <stdio.h>
#include <string.h>

#include "Modules/Ebus/Format/AutodiscoveryFormatter.h"
#include "Modules/Ebus/Schema/ProfileLoader.h"

static ApplianceProfile profile;

static const char* kSchema = R"JSON({
  "appliance": "Vaillant ecoTEC",
  "bus": "ebus0",
  "mqtt_autodiscovery": {
    "enabled": true,
    "topic": "homeassistant",
    "payload": {
      "name": "<circuit> <field_name>",
      "state_topic": "ebus/<circuit>/<field_name>",
      "unit_of_measurement": "<unit>",
      "value_template": "{{ <field_value> }}",
      "device": {
        "name": "<appliance>",
        "identifiers": ["<bus>_<appliance>", "fixed"]
      },
      "expire_after": 600
    }
  },
  "circuits": [
    {
      "name": "boiler",
      "messages": [
        {
          "comment": "status",
          "mqtt_publish_format": "ebus/<circuit>/<field_name>",
          "request_match": {"pbsb": "2000", "data": "^7547"},
          "request_map": [
            {"field_name": "boiler_pressure", "field_offset": 2, "data_type": "u8", "factor": 0.1, "unit": "bar"},
            {"field_name": "Flow Temp", "field_offset": 3, "data_type": "u8", "unit": "C"}
          ]
        },
        {
          "comment": "status again",
          "mqtt_publish_format": "ebus/<circuit>/<field_name>",
          "request_match": {"pbsb": "2001"},
          "request_map": [
            {"field_name": "boiler_pressure", "field_offset": 0, "data_type": "u8"}
          ],
          "response_map": [
            {"field_name": "modulation", "field_offset": 0, "data_type": "u8", "unit": "%"}
          ]
        }
      ]
    },
    {
      "name": "hc1",
      "messages": [
        {
          "comment": "hc1 status",
          "mqtt_publish_format": "ebus/<circuit>/<field_name>",
          "request_match": {"pbsb": "B509"},
          "request_map": [
            {"field_name": "boiler_pressure", "field_offset": 0, "data_type": "u8"}
          ]
        }
      ]
    }
  ]
})JSON";

struct Collected {
    char names[16][80];
    uint16_t count;
};

static bool collect(void* ctx, const Circuit& circuit, const FieldMapping& field)
{
    Collected* c = static_cast<Collected*>(ctx);
    snprintf(c->names[c->count], sizeof(c->names[0]), "%s/%s", circuit.name, field.name);
    ++c->count;
    return true;
}

void setUp()
{
    ProfileLoadError err;
    TEST_ASSERT_TRUE(loadApplianceProfile(kSchema, profile, err));
}

void tearDown() {}

void test_sanitize_id_lowercases_and_replaces()
{
    char out[32];
    sanitizeId("Vaillant ecoTEC-2", out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING("vaillant_ecotec_2", out);
}

void test_discovery_topic_layout()
{
    char topic[128];
    TEST_ASSERT_TRUE(buildDiscoveryTopic(profile, "boiler", "Flow Temp", topic, sizeof(topic)));
    TEST_ASSERT_EQUAL_STRING("homeassistant/sensor/vaillant_ecotec/boiler_flow_temp/config", topic);
}

void test_default_root_when_topic_missing()
{
    profile.autodiscovery.topicRoot[0] = '\0';
    char topic[128];
    TEST_ASSERT_TRUE(buildDiscoveryTopic(profile, "hc1", "x", topic, sizeof(topic)));
    TEST_ASSERT_EQUAL_STRING("homeassistant/sensor/vaillant_ecotec/hc1_x/config", topic);
}

void test_payload_strings_expanded_recursively()
{
    const Circuit& boiler = profile.circuits[0];
    const FieldMapping& pressure = profile.fields[0];

    DiscoveryDocument doc;
    ErrorCode code = ErrorCode::None;
    TEST_ASSERT_TRUE(formatAutodiscovery(profile, boiler, pressure, doc, code));

    StaticJsonDocument<1024> parsed;
    TEST_ASSERT_FALSE(deserializeJson(parsed, doc.payload));
    TEST_ASSERT_EQUAL_STRING("boiler boiler_pressure", parsed["name"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("ebus/boiler/boiler_pressure", parsed["state_topic"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("bar", parsed["unit_of_measurement"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("Vaillant ecoTEC", parsed["device"]["name"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("ebus0_Vaillant ecoTEC", parsed["device"]["identifiers"][0].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("fixed", parsed["device"]["identifiers"][1].as<const char*>());
    TEST_ASSERT_EQUAL_INT(600, parsed["expire_after"].as<int>());
}

void test_field_value_placeholder_survives()
{
    DiscoveryDocument doc;
    ErrorCode code = ErrorCode::None;
    TEST_ASSERT_TRUE(formatAutodiscovery(profile, profile.circuits[0], profile.fields[0], doc, code));

    StaticJsonDocument<1024> parsed;
    TEST_ASSERT_FALSE(deserializeJson(parsed, doc.payload));
    TEST_ASSERT_EQUAL_STRING("{{ <field_value> }}", parsed["value_template"].as<const char*>());
}

void test_known_fields_are_distinct_per_circuit()
{
    Collected c{};
    const uint16_t n = forEachKnownField(profile, collect, &c);
    TEST_ASSERT_EQUAL_UINT16(4, n);
    TEST_ASSERT_EQUAL_STRING("boiler/boiler_pressure", c.names[0]);
    TEST_ASSERT_EQUAL_STRING("boiler/Flow Temp", c.names[1]);
    TEST_ASSERT_EQUAL_STRING("boiler/modulation", c.names[2]);
    TEST_ASSERT_EQUAL_STRING("hc1/boiler_pressure", c.names[3]);
}

void test_visitor_can_stop_early()
{
    struct Stop {
        static bool once(void* ctx, const Circuit&, const FieldMapping&)
        {
            ++*static_cast<int*>(ctx);
            return false;
        }
    };
    int calls = 0;
    TEST_ASSERT_EQUAL_UINT16(1, forEachKnownField(profile, &Stop::once, &calls));
    TEST_ASSERT_EQUAL_INT(1, calls);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_sanitize_id_lowercases_and_replaces);
    RUN_TEST(test_discovery_topic_layout);
    RUN_TEST(test_default_root_when_topic_missing);
    RUN_TEST(test_payload_strings_expanded_recursively);
    RUN_TEST(test_field_value_placeholder_survives);
    RUN_TEST(test_known_fields_are_distinct_per_circuit);
    RUN_TEST(test_visitor_can_stop_early);
    return UNITY_END();
}
