#pragma once
/**
 * @file PatternMatcher.h
 * @brief First-match-wins lookup of a telegram in an appliance profile.
 */

#include <stdint.h>
#include "Modules/Ebus/Telegram/Telegram.h"
#include "Modules/Ebus/Schema/ProfileTypes.h"

enum class Direction : uint8_t {
    Request = 0,
    Response = 1
};

const char* directionStr(Direction d);

struct MatchResult {
    bool found = false;
    Direction direction = Direction::Request;
    const Circuit* circuit = nullptr;
    const MessageDefinition* message = nullptr;
    uint16_t messageIndex = 0;
};

/**
 * @brief Test one pattern against one side of a telegram.
 *
 * Request: pattern src/dst against telegram src/dst, payload = request data.
 * Response: pattern src against the responder (telegram dst), pattern dst
 * against the requester (telegram src), payload = response data. A telegram
 * without response never matches in this direction.
 */
bool patternMatches(const PatternSpec& p, const Telegram& t, Direction dir);

/** @brief Walk circuits then messages in declaration order; skip definitions without a pattern for `dir`. */
MatchResult findMatch(const Telegram& t, Direction dir, const ApplianceProfile& profile);
