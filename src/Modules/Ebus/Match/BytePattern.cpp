/**
 * @file BytePattern.cpp
 * @brief Implementation file.
 */
#include "Modules/Ebus/Match/BytePattern.h"
#include <string.h>

static int hexNibble(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

void BytePattern::clear()
{
    memset(bytes, 0, sizeof(bytes));
    memset(wildcard, 0, sizeof(wildcard));
    len = 0;
    anchored = false;
}

void BytePattern::setAnyByte()
{
    clear();
    wildcard[0] = true;
    len = 1;
}

void BytePattern::setAnyPayload()
{
    clear();
    anchored = true;
}

void BytePattern::setByte(uint8_t b)
{
    clear();
    bytes[0] = b;
    len = 1;
}

bool BytePattern::matches(const uint8_t* candidate, size_t n) const
{
    if (anchored) {
        if (n < len) return false;
    } else if (n != len) {
        return false;
    }
    if (len > 0 && !candidate) return false;

    for (uint8_t i = 0; i < len; ++i) {
        if (wildcard[i]) continue;
        if (candidate[i] != bytes[i]) return false;
    }
    return true;
}

bool BytePattern::hasWildcard() const
{
    for (uint8_t i = 0; i < len; ++i) {
        if (wildcard[i]) return true;
    }
    return false;
}

bool BytePattern::literalByte(uint8_t& out) const
{
    if (len != 1 || wildcard[0] || anchored) return false;
    out = bytes[0];
    return true;
}

bool BytePattern::literalBytes(uint8_t* out, size_t cap, size_t& outLen) const
{
    outLen = 0;
    if (hasWildcard()) return false;
    if (len > cap) return false;
    if (len > 0 && !out) return false;
    memcpy(out, bytes, len);
    outLen = len;
    return true;
}

bool BytePattern::toString(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;
    size_t pos = 0;
    out[0] = '\0';
    if (anchored) {
        if (pos + 1 >= outLen) return false;
        out[pos++] = '^';
    }
    for (uint8_t i = 0; i < len; ++i) {
        if (wildcard[i]) {
            if (pos + 1 >= outLen) { out[pos] = '\0'; return false; }
            out[pos++] = '*';
            continue;
        }
        if (pos + 2 >= outLen) { out[pos] = '\0'; return false; }
        static const char kHex[] = "0123456789ABCDEF";
        out[pos++] = kHex[bytes[i] >> 4];
        out[pos++] = kHex[bytes[i] & 0x0F];
    }
    out[pos] = '\0';
    return true;
}

bool parseBytePattern(const char* text, BytePattern& out)
{
    out.clear();
    if (!text) return true;

    const char* p = text;
    if (*p == '^') {
        out.anchored = true;
        ++p;
    }

    while (*p != '\0') {
        if (out.len >= Limits::Profile::MaxPatternBytes) return false;

        if (*p == '*') {
            out.wildcard[out.len] = true;
            out.bytes[out.len] = 0;
            ++out.len;
            ++p;
            continue;
        }

        const int hi = hexNibble(p[0]);
        if (hi < 0) return false;
        const int lo = hexNibble(p[1]);  // p[1] may be '\0', rejected as non-hex
        if (lo < 0) return false;
        out.bytes[out.len] = (uint8_t)((hi << 4) | lo);
        out.wildcard[out.len] = false;
        ++out.len;
        p += 2;
    }
    return true;
}

bool parseAddressPattern(const char* text, BytePattern& out)
{
    out.clear();
    if (!text) return false;
    if (strcmp(text, "*") == 0) {
        out.setAnyByte();
        return true;
    }
    if (strlen(text) != 2) return false;
    const int hi = hexNibble(text[0]);
    const int lo = hexNibble(text[1]);
    if (hi < 0 || lo < 0) return false;
    out.setByte((uint8_t)((hi << 4) | lo));
    return true;
}

bool parsePbsb(const char* text, uint16_t& out)
{
    if (!text || strlen(text) != 4) return false;
    uint16_t v = 0;
    for (int i = 0; i < 4; ++i) {
        const int n = hexNibble(text[i]);
        if (n < 0) return false;
        v = (uint16_t)((v << 4) | (uint16_t)n);
    }
    out = v;
    return true;
}
