/**
 * @file DataType.cpp
 * @brief Implementation file.
 */
#include "Modules/Ebus/Decode/DataType.h"
#include <string.h>

namespace {

struct DataTypeEntry {
    DataType type;
    const char* name;
    uint8_t width;
};

constexpr DataTypeEntry kTypes[] = {
    {DataType::U8, "u8", 1},
    {DataType::I8, "i8", 1},
    {DataType::U16Le, "u16le", 2},
    {DataType::U16Be, "u16be", 2},
    {DataType::I16Le, "i16le", 2},
    {DataType::I16Be, "i16be", 2},
    {DataType::U32Le, "u32le", 4},
    {DataType::U32Be, "u32be", 4},
    {DataType::I32Le, "i32le", 4},
    {DataType::I32Be, "i32be", 4},
};

const DataTypeEntry* findEntry(DataType t)
{
    for (const DataTypeEntry& e : kTypes) {
        if (e.type == t) return &e;
    }
    return nullptr;
}

}  // namespace

const char* dataTypeName(DataType t)
{
    const DataTypeEntry* e = findEntry(t);
    return e ? e->name : "invalid";
}

DataType dataTypeFromName(const char* name)
{
    if (!name) return DataType::Invalid;
    for (const DataTypeEntry& e : kTypes) {
        if (strcmp(e.name, name) == 0) return e.type;
    }
    return DataType::Invalid;
}

uint8_t dataTypeWidth(DataType t)
{
    const DataTypeEntry* e = findEntry(t);
    return e ? e->width : 0;
}
