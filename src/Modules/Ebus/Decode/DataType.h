#pragma once
/**
 * @file DataType.h
 * @brief Integer encodings a field mapping can read from a payload.
 */

#include <stddef.h>
#include <stdint.h>

enum class DataType : uint8_t {
    Invalid = 0,
    U8,
    I8,
    U16Le,
    U16Be,
    I16Le,
    I16Be,
    U32Le,
    U32Be,
    I32Le,
    I32Be
};

/** @brief Schema tag (`u16le`, ...) or "invalid". */
const char* dataTypeName(DataType t);
/** @brief Parse a schema tag, exact lower-case match. Returns `Invalid` when unknown. */
DataType dataTypeFromName(const char* name);
/** @brief Width in bytes, 0 for an unknown type. */
uint8_t dataTypeWidth(DataType t);
