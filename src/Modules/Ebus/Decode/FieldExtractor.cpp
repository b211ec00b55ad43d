/**
 * @file FieldExtractor.cpp
 * @brief Implementation file.
 */
#include "Modules/Ebus/Decode/FieldExtractor.h"

static uint16_t le16(const uint8_t* b) { return (uint16_t)(b[0] | (b[1] << 8)); }
static uint16_t be16(const uint8_t* b) { return (uint16_t)((b[0] << 8) | b[1]); }
static uint32_t le32(const uint8_t* b)
{
    return (uint32_t)b[0] | ((uint32_t)b[1] << 8) | ((uint32_t)b[2] << 16) | ((uint32_t)b[3] << 24);
}
static uint32_t be32(const uint8_t* b)
{
    return ((uint32_t)b[0] << 24) | ((uint32_t)b[1] << 16) | ((uint32_t)b[2] << 8) | (uint32_t)b[3];
}

bool readRawValue(DataType type, const uint8_t* bytes, int64_t& out)
{
    switch (type) {
    case DataType::U8: out = bytes[0]; return true;
    case DataType::I8: out = (int8_t)bytes[0]; return true;
    case DataType::U16Le: out = le16(bytes); return true;
    case DataType::U16Be: out = be16(bytes); return true;
    case DataType::I16Le: out = (int16_t)le16(bytes); return true;
    case DataType::I16Be: out = (int16_t)be16(bytes); return true;
    case DataType::U32Le: out = le32(bytes); return true;
    case DataType::U32Be: out = be32(bytes); return true;
    case DataType::I32Le: out = (int32_t)le32(bytes); return true;
    case DataType::I32Be: out = (int32_t)be32(bytes); return true;
    case DataType::Invalid: break;
    }
    return false;
}

bool extractField(const FieldMapping& map, const uint8_t* payload, size_t payloadLen, double& value, ErrorCode& code)
{
    const uint8_t width = dataTypeWidth(map.type);
    if (width == 0) {
        code = ErrorCode::UnknownType;
        return false;
    }
    if ((size_t)map.offset + width > payloadLen || !payload) {
        code = ErrorCode::OutOfRange;
        return false;
    }

    int64_t raw = 0;
    if (!readRawValue(map.type, payload + map.offset, raw)) {
        code = ErrorCode::UnknownType;
        return false;
    }
    value = (double)raw * map.factor;
    code = ErrorCode::None;
    return true;
}

bool extractFields(const FieldMapping* maps,
                   uint8_t mapCount,
                   const uint8_t* payload,
                   size_t payloadLen,
                   DecodedField* out,
                   uint8_t outCap,
                   uint8_t& outCount,
                   ExtractError& err)
{
    outCount = 0;
    err = ExtractError{};
    if (mapCount == 0) return true;
    if (!maps || !out) {
        err.code = ErrorCode::NotReady;
        return false;
    }
    if (mapCount > outCap) {
        err.code = ErrorCode::CapacityExceeded;
        return false;
    }

    for (uint8_t i = 0; i < mapCount; ++i) {
        double v = 0.0;
        ErrorCode code = ErrorCode::None;
        if (!extractField(maps[i], payload, payloadLen, v, code)) {
            err.code = code;
            err.field = &maps[i];
            return false;
        }
        out[i].name = maps[i].name;
        out[i].unit = maps[i].unit;
        out[i].value = v;
    }
    outCount = mapCount;
    return true;
}
