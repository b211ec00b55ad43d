#pragma once
/**
 * @file Telegram.h
 * @brief One eBUS telegram: request header and data, optional slave response.
 */

#include <stddef.h>
#include <stdint.h>
#include "Core/SystemLimits.h"

struct Telegram {
    uint8_t src = 0;
    uint8_t dst = 0;
    uint16_t pbsb = 0;
    uint8_t len = 0;
    uint8_t data[Limits::Ebus::MaxDataLen] = {0};

    bool hasResponse = false;
    uint8_t respLen = 0;
    uint8_t resp[Limits::Ebus::MaxDataLen] = {0};

    void clear();
    /** @brief Copy request data, false if longer than an eBUS frame allows. */
    bool setData(const uint8_t* bytes, size_t n);
    /** @brief Copy response data and flag the telegram as master-slave. */
    bool setResponse(const uint8_t* bytes, size_t n);

    uint8_t pb() const { return (uint8_t)(pbsb >> 8); }
    uint8_t sb() const { return (uint8_t)(pbsb & 0xFF); }
    bool isBroadcast() const;
};

/** @brief Render `Req: [src: 10, dest: 08, pbsb: B509, len: 02, data: 0D 2C]` (+ response). */
bool formatTelegram(const Telegram& t, char* out, size_t outLen);
