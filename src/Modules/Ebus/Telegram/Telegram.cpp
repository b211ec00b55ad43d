/**
 * @file Telegram.cpp
 * @brief Implementation file.
 */
#include "Modules/Ebus/Telegram/Telegram.h"
#include "Domain/EbusDefaults.h"
#include <stdio.h>
#include <string.h>

void Telegram::clear()
{
    src = 0;
    dst = 0;
    pbsb = 0;
    len = 0;
    memset(data, 0, sizeof(data));
    hasResponse = false;
    respLen = 0;
    memset(resp, 0, sizeof(resp));
}

bool Telegram::setData(const uint8_t* bytes, size_t n)
{
    if (n > Limits::Ebus::MaxDataLen || (n > 0 && !bytes)) return false;
    if (n > 0) memcpy(data, bytes, n);
    len = (uint8_t)n;
    return true;
}

bool Telegram::setResponse(const uint8_t* bytes, size_t n)
{
    if (n > Limits::Ebus::MaxDataLen || (n > 0 && !bytes)) return false;
    if (n > 0) memcpy(resp, bytes, n);
    respLen = (uint8_t)n;
    hasResponse = true;
    return true;
}

bool Telegram::isBroadcast() const
{
    return dst == EbusDefaults::Broadcast;
}

static size_t appendSpacedHex(const uint8_t* bytes, size_t n, char* out, size_t outLen)
{
    size_t pos = 0;
    for (size_t i = 0; i < n && pos + 4 <= outLen; ++i) {
        pos += (size_t)snprintf(out + pos, outLen - pos, i == 0 ? "%02X" : " %02X", bytes[i]);
    }
    if (pos < outLen) out[pos] = '\0';
    return pos;
}

bool formatTelegram(const Telegram& t, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;

    char reqData[Limits::Ebus::MaxDataLen * 3 + 1] = {0};
    appendSpacedHex(t.data, t.len, reqData, sizeof(reqData));

    int n = snprintf(out, outLen, "Req: [src: %02X, dest: %02X, pbsb: %04X, len: %02X, data: %s]",
                     t.src, t.dst, (unsigned)t.pbsb, t.len, reqData);
    if (n < 0 || (size_t)n >= outLen) return false;
    if (!t.hasResponse) return true;

    char respData[Limits::Ebus::MaxDataLen * 3 + 1] = {0};
    appendSpacedHex(t.resp, t.respLen, respData, sizeof(respData));
    const int m = snprintf(out + n, outLen - (size_t)n, " Resp: [len: %02X, data: %s]", t.respLen, respData);
    return m >= 0 && (size_t)(n + m) < outLen;
}
