#include <unity.h>
#include <string.h>
#include <stdio.h>

#include "Modules/Ebus/Schema/ProfileLoader.h"

static ApplianceProfile profile;
static ProfileLoadError err;

static const char* kGood = R"JSON({
  "appliance": "Vaillant ecoTEC",
  "bus": "ebus0",
  "presence_detection": {
    "valid": true,
    "request": {"src": "*", "dst": "08", "pbsb": "0704"},
    "response": {"src": "08", "pbsb": "0704", "data": "^B5"}
  },
  "mqtt_autodiscovery": {
    "enabled": true,
    "topic": "ha",
    "payload": {"name": "<field_name>", "unit_of_measurement": "<unit>"}
  },
  "circuits": [
    {
      "name": "boiler",
      "messages": [
        {
          "comment": "boiler status",
          "mqtt_publish_format": "ebus/<circuit>/<field_name>",
          "request_match": {"src": "10", "dst": 8, "pbsb": 2000, "data": "^7547"},
          "request_map": [
            {"field_name": "boiler_pressure", "field_offset": 2, "data_type": "u8", "factor": 0.1, "unit": "bar"}
          ]
        },
        {
          "comment": "flow temperature",
          "influx_publish_format": "boiler,field=<field_name>",
          "response_match": {"pbsb": "b509", "data": "*0d"},
          "response_map": [
            {"field_name": "flow", "field_offset": 0, "data_type": "i16le", "factor": 0.0625, "unit": "C"}
          ]
        }
      ]
    },
    {"name": "hc1", "messages": []}
  ]
})JSON";

static bool loadText(const char* json)
{
    return loadApplianceProfile(json, profile, err);
}

void setUp()
{
    err = ProfileLoadError{};
}

void tearDown() {}

void test_good_schema_loads_everything()
{
    TEST_ASSERT_TRUE(loadText(kGood));
    TEST_ASSERT_EQUAL(ErrorCode::None, err.code);
    TEST_ASSERT_EQUAL_STRING("Vaillant ecoTEC", profile.appliance);
    TEST_ASSERT_EQUAL_STRING("ebus0", profile.bus);
    TEST_ASSERT_EQUAL_UINT8(2, profile.circuitCount);
    TEST_ASSERT_EQUAL_UINT16(2, profile.messageCount);
    TEST_ASSERT_EQUAL_UINT16(2, profile.fieldCount);
    TEST_ASSERT_EQUAL_INT(1, profile.findCircuit("hc1"));
    TEST_ASSERT_EQUAL_UINT16(0, profile.circuits[1].messageCount);

    const MessageDefinition& m0 = profile.messages[0];
    TEST_ASSERT_EQUAL_STRING("ebus/<circuit>/<field_name>", m0.topicTemplate);
    TEST_ASSERT_TRUE(m0.hasRequestPattern);
    TEST_ASSERT_FALSE(m0.hasResponsePattern);
    TEST_ASSERT_TRUE(m0.request.hasPbsb);
    TEST_ASSERT_EQUAL_HEX16(0x2000, m0.request.pbsb);
    TEST_ASSERT_TRUE(m0.request.src.matchesByte(0x10));
    TEST_ASSERT_FALSE(m0.request.src.matchesByte(0x11));
    TEST_ASSERT_TRUE(m0.request.dst.matchesByte(0x08));
    TEST_ASSERT_TRUE(m0.request.data.anchored);
    TEST_ASSERT_TRUE(m0.requestMap.present);
    TEST_ASSERT_FALSE(m0.responseMap.present);

    const FieldMapping* f = profile.mapFields(m0.requestMap);
    TEST_ASSERT_NOT_NULL(f);
    TEST_ASSERT_EQUAL_STRING("boiler_pressure", f->name);
    TEST_ASSERT_EQUAL_UINT16(2, f->offset);
    TEST_ASSERT_EQUAL(DataType::U8, f->type);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.1f, (float)f->factor);
    TEST_ASSERT_EQUAL_STRING("bar", f->unit);
}

void test_any_publish_format_key_is_accepted()
{
    TEST_ASSERT_TRUE(loadText(kGood));
    const MessageDefinition& m1 = profile.messages[1];
    TEST_ASSERT_EQUAL_STRING("boiler,field=<field_name>", m1.topicTemplate);
    TEST_ASSERT_TRUE(m1.hasResponsePattern);
    TEST_ASSERT_TRUE(m1.response.src.matchesByte(0x55));
    TEST_ASSERT_EQUAL_HEX16(0xB509, m1.response.pbsb);
    TEST_ASSERT_EQUAL_UINT8(2, m1.response.data.len);
    TEST_ASSERT_TRUE(m1.response.data.wildcard[0]);
}

void test_presence_and_autodiscovery_sections()
{
    TEST_ASSERT_TRUE(loadText(kGood));
    TEST_ASSERT_TRUE(profile.presence.valid);
    TEST_ASSERT_TRUE(profile.presence.request.src.hasWildcard());
    TEST_ASSERT_EQUAL_HEX16(0x0704, profile.presence.request.pbsb);
    TEST_ASSERT_TRUE(profile.autodiscovery.enabled);
    TEST_ASSERT_EQUAL_STRING("ha", profile.autodiscovery.topicRoot);
    TEST_ASSERT_NOT_NULL(strstr(profile.autodiscovery.payloadTemplate, "\"<field_name>\""));
}

void test_missing_sections_default_off()
{
    TEST_ASSERT_TRUE(loadText(R"({"appliance":"x","circuits":[]})"));
    TEST_ASSERT_FALSE(profile.presence.valid);
    TEST_ASSERT_FALSE(profile.autodiscovery.enabled);
    TEST_ASSERT_EQUAL_UINT8(0, profile.circuitCount);
}

void test_malformed_json_is_rejected()
{
    TEST_ASSERT_FALSE(loadText("{\"appliance\": "));
    TEST_ASSERT_EQUAL(ErrorCode::BadSchemaJson, err.code);
    TEST_ASSERT_FALSE(loadText("[1,2]"));
    TEST_ASSERT_EQUAL(ErrorCode::BadSchemaJson, err.code);
    TEST_ASSERT_TRUE(errorCodeIsSchemaInvalid(err.code));
}

void test_unknown_data_type_is_rejected_with_path()
{
    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[
        {"mqtt_publish_format":"t","request_match":{"pbsb":"0700"},
         "request_map":[{"field_name":"a","field_offset":0,"data_type":"u8"},
                        {"field_name":"b","field_offset":1,"data_type":"u24le"}]}]}]})"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidDataType, err.code);
    TEST_ASSERT_EQUAL_STRING("circuits[0].messages[0].request_map[1].data_type", err.where);
    TEST_ASSERT_EQUAL_UINT8(0, profile.circuitCount);
}

void test_bad_hex_is_rejected()
{
    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[
        {"mqtt_publish_format":"t","request_match":{"pbsb":"07"},
         "request_map":[{"field_name":"a","field_offset":0,"data_type":"u8"}]}]}]})"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidHex, err.code);
    TEST_ASSERT_EQUAL_STRING("circuits[0].messages[0].request_match.pbsb", err.where);

    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[
        {"mqtt_publish_format":"t","request_match":{"data":"^75G"},
         "request_map":[{"field_name":"a","field_offset":0,"data_type":"u8"}]}]}]})"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidHex, err.code);
}

void test_negative_offset_is_rejected()
{
    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[
        {"mqtt_publish_format":"t","request_match":{},
         "request_map":[{"field_name":"a","field_offset":-1,"data_type":"u8"}]}]}]})"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidOffset, err.code);
}

void test_duplicate_names_are_rejected()
{
    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[]},{"name":"c","messages":[]}]})"));
    TEST_ASSERT_EQUAL(ErrorCode::DuplicateName, err.code);
    TEST_ASSERT_EQUAL_STRING("circuits[1].name", err.where);

    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[
        {"mqtt_publish_format":"t","request_match":{},
         "request_map":[{"field_name":"a","field_offset":0,"data_type":"u8"},
                        {"field_name":"a","field_offset":1,"data_type":"u8"}]}]}]})"));
    TEST_ASSERT_EQUAL(ErrorCode::DuplicateName, err.code);
}

void test_same_field_name_allowed_across_maps()
{
    TEST_ASSERT_TRUE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[
        {"mqtt_publish_format":"t","request_match":{},
         "request_map":[{"field_name":"a","field_offset":0,"data_type":"u8"}],
         "response_map":[{"field_name":"a","field_offset":0,"data_type":"u8"}]}]}]})"));
}

void test_integer_factor_is_accepted()
{
    TEST_ASSERT_TRUE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[
        {"mqtt_publish_format":"t","request_match":{},
         "request_map":[{"field_name":"a","field_offset":0,"data_type":"u8","factor":1},
                        {"field_name":"b","field_offset":0,"data_type":"u8","factor":-2},
                        {"field_name":"c","field_offset":0,"data_type":"u8"}]}]}]})"));
    TEST_ASSERT_EQUAL(ErrorCode::None, err.code);
    TEST_ASSERT_EQUAL_UINT16(3, profile.fieldCount);
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 1.0, profile.fields[0].factor);
    TEST_ASSERT_FLOAT_WITHIN(1e-9, -2.0, profile.fields[1].factor);
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 1.0, profile.fields[2].factor);

    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[
        {"mqtt_publish_format":"t","request_match":{},
         "request_map":[{"field_name":"a","field_offset":0,"data_type":"u8","factor":"1"}]}]}]})"));
    TEST_ASSERT_EQUAL(ErrorCode::BadSchemaJson, err.code);
    TEST_ASSERT_EQUAL_STRING("circuits[0].messages[0].request_map[0].factor", err.where);
}

void test_message_needs_pattern_and_map()
{
    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[
        {"mqtt_publish_format":"t",
         "request_map":[{"field_name":"a","field_offset":0,"data_type":"u8"}]}]}]})"));
    TEST_ASSERT_EQUAL(ErrorCode::EmptyMessage, err.code);

    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[
        {"mqtt_publish_format":"t","request_match":{"pbsb":"0700"}}]}]})"));
    TEST_ASSERT_EQUAL(ErrorCode::EmptyMessage, err.code);
}

void test_missing_required_fields()
{
    TEST_ASSERT_FALSE(loadText(R"({"circuits":[]})"));
    TEST_ASSERT_EQUAL(ErrorCode::MissingField, err.code);
    TEST_ASSERT_EQUAL_STRING("appliance", err.where);

    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x"})"));
    TEST_ASSERT_EQUAL(ErrorCode::MissingField, err.code);

    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x","circuits":[{"name":"c","messages":[
        {"request_match":{},"request_map":[{"field_name":"a","field_offset":0,"data_type":"u8"}]}]}]})"));
    TEST_ASSERT_EQUAL(ErrorCode::MissingField, err.code);

    TEST_ASSERT_FALSE(loadText(R"({"appliance":"x","presence_detection":{"valid":true},"circuits":[]})"));
    TEST_ASSERT_EQUAL(ErrorCode::MissingField, err.code);
}

void test_too_many_circuits_is_capacity_error()
{
    static char json[4096];
    size_t pos = (size_t)snprintf(json, sizeof(json), "{\"appliance\":\"x\",\"circuits\":[");
    for (int i = 0; i < Limits::Profile::MaxCircuits + 1; ++i) {
        pos += (size_t)snprintf(json + pos, sizeof(json) - pos, "%s{\"name\":\"c%d\",\"messages\":[]}", i ? "," : "", i);
    }
    snprintf(json + pos, sizeof(json) - pos, "]}");

    TEST_ASSERT_FALSE(loadText(json));
    TEST_ASSERT_EQUAL(ErrorCode::CapacityExceeded, err.code);
}

void test_failed_load_leaves_profile_empty()
{
    TEST_ASSERT_TRUE(loadText(kGood));
    TEST_ASSERT_FALSE(loadText("{"));
    TEST_ASSERT_EQUAL_UINT8(0, profile.circuitCount);
    TEST_ASSERT_EQUAL_UINT16(0, profile.messageCount);
}

void test_error_json_payload()
{
    char out[160];
    TEST_ASSERT_TRUE(writeErrorJson(out, sizeof(out), ErrorCode::InvalidHex, "circuits[0].name"));
    TEST_ASSERT_EQUAL_STRING(
        "{\"ok\":false,\"err\":{\"code\":\"InvalidHex\",\"where\":\"circuits[0].name\",\"retryable\":false}}", out);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_good_schema_loads_everything);
    RUN_TEST(test_any_publish_format_key_is_accepted);
    RUN_TEST(test_presence_and_autodiscovery_sections);
    RUN_TEST(test_missing_sections_default_off);
    RUN_TEST(test_malformed_json_is_rejected);
    RUN_TEST(test_unknown_data_type_is_rejected_with_path);
    RUN_TEST(test_bad_hex_is_rejected);
    RUN_TEST(test_negative_offset_is_rejected);
    RUN_TEST(test_duplicate_names_are_rejected);
    RUN_TEST(test_same_field_name_allowed_across_maps);
    RUN_TEST(test_integer_factor_is_accepted);
    RUN_TEST(test_message_needs_pattern_and_map);
    RUN_TEST(test_missing_required_fields);
    RUN_TEST(test_too_many_circuits_is_capacity_error);
    RUN_TEST(test_failed_load_leaves_profile_empty);
    RUN_TEST(test_error_json_payload);
    return UNITY_END();
}
