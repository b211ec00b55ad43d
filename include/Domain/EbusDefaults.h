#pragma once

#include <stdint.h>

namespace EbusDefaults {

constexpr uint8_t Syn = 0xAA;
constexpr uint8_t Ack = 0x00;
constexpr uint8_t Nack = 0xFF;
constexpr uint8_t Broadcast = 0xFE;

// Enhanced protocol (ebusd adapter) framing.
constexpr uint8_t EnhByte1Mask = 0xC0;
constexpr uint8_t EnhByte2Mask = 0x80;

/** @brief Default own master address used when a presence request leaves `src` open. */
constexpr uint8_t MasterAddress = 0x31;

}  // namespace EbusDefaults
