#pragma once
/**
 * @file FieldExtractor.h
 * @brief Typed reads of field mappings from a telegram payload.
 */

#include <stddef.h>
#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Modules/Ebus/Schema/ProfileTypes.h"

/** @brief One scaled value, name and unit borrowed from the profile. */
struct DecodedField {
    const char* name = nullptr;
    const char* unit = nullptr;
    double value = 0.0;
};

/** @brief First failing mapping of an extraction. */
struct ExtractError {
    ErrorCode code = ErrorCode::None;
    const FieldMapping* field = nullptr;
};

/**
 * @brief Read the raw integer of `type` at `bytes` (caller checked the width).
 * @return false for an unknown type.
 */
bool readRawValue(DataType type, const uint8_t* bytes, int64_t& out);

/** @brief Decode and scale one mapping. Offset is relative to the payload start. */
bool extractField(const FieldMapping& map, const uint8_t* payload, size_t payloadLen, double& value, ErrorCode& code);

/**
 * @brief Decode a whole mapping list, in order.
 *
 * All or nothing: on the first `OutOfRange` or `UnknownType` nothing is
 * reported in `out` (`outCount` = 0) and `err` names the mapping.
 */
bool extractFields(const FieldMapping* maps,
                   uint8_t mapCount,
                   const uint8_t* payload,
                   size_t payloadLen,
                   DecodedField* out,
                   uint8_t outCap,
                   uint8_t& outCount,
                   ExtractError& err);
