#pragma once
/**
 * @file Crc8.h
 * @brief eBUS CRC-8 (polynomial 0x9B), table driven.
 */

#include <stdint.h>
#include <stddef.h>

struct Telegram;

uint8_t ebusCrcUpdate(uint8_t crc, uint8_t value);
uint8_t ebusCrc(const uint8_t* bytes, size_t n, uint8_t crc = 0);

/** @brief CRC over src, dst, PB, SB, NN and request data. */
uint8_t telegramRequestCrc(const Telegram& t);
/** @brief CRC over NN and response data. */
uint8_t telegramResponseCrc(const Telegram& t);
