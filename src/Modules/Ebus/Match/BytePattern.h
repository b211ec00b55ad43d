#pragma once
/**
 * @file BytePattern.h
 * @brief Hex byte pattern with `*` wildcards and optional `^` prefix anchor.
 *
 * Grammar: `["^"] { HEX HEX | "*" }`. One `*` stands for exactly one byte.
 * Hex digits are case-insensitive. Without the anchor the candidate must have
 * the same length as the pattern; with it, only the leading bytes are compared.
 */

#include <stddef.h>
#include <stdint.h>
#include "Core/SystemLimits.h"

struct BytePattern {
    uint8_t bytes[Limits::Profile::MaxPatternBytes] = {0};
    bool wildcard[Limits::Profile::MaxPatternBytes] = {false};
    uint8_t len = 0;
    bool anchored = false;

    void clear();
    /** @brief Single wildcard byte (address `*`). */
    void setAnyByte();
    /** @brief Anchored empty pattern: matches every payload. */
    void setAnyPayload();
    /** @brief Exactly one literal byte. */
    void setByte(uint8_t b);

    bool matches(const uint8_t* candidate, size_t n) const;
    /** @brief Convenience for address patterns. */
    bool matchesByte(uint8_t b) const { return matches(&b, 1); }

    bool hasWildcard() const;
    /** @brief True when this is one literal byte (stored in `out`). */
    bool literalByte(uint8_t& out) const;
    /**
     * @brief Copy the literal bytes into `out`.
     * Fails when the pattern holds a wildcard or `cap` is too small.
     */
    bool literalBytes(uint8_t* out, size_t cap, size_t& outLen) const;

    /** @brief Canonical text form (`^75**47`), upper-case hex. */
    bool toString(char* out, size_t outLen) const;
};

/**
 * @brief Parse a payload pattern. `nullptr` or "" give an empty pattern.
 * @return false on odd hex digit count, a non-hex character, a misplaced `^`
 *         or more than `MaxPatternBytes` bytes.
 */
bool parseBytePattern(const char* text, BytePattern& out);

/** @brief Parse an address (`*` or two hex digits) into a one-byte pattern. */
bool parseAddressPattern(const char* text, BytePattern& out);

/** @brief Parse exactly four hex digits (`B509`) into a PB/SB pair. */
bool parsePbsb(const char* text, uint16_t& out);
