/**
 * @file PatternMatcher.cpp
 * @brief Implementation file.
 */
#include "Modules/Ebus/Match/PatternMatcher.h"

const char* directionStr(Direction d)
{
    return (d == Direction::Response) ? "response" : "request";
}

bool patternMatches(const PatternSpec& p, const Telegram& t, Direction dir)
{
    // PBSB is the routing key, test it before anything else
    if (p.hasPbsb && p.pbsb != t.pbsb) return false;

    if (dir == Direction::Request) {
        if (!p.src.matchesByte(t.src)) return false;
        if (!p.dst.matchesByte(t.dst)) return false;
        return p.data.matches(t.data, t.len);
    }

    if (!t.hasResponse) return false;
    if (!p.src.matchesByte(t.dst)) return false;
    if (!p.dst.matchesByte(t.src)) return false;
    return p.data.matches(t.resp, t.respLen);
}

MatchResult findMatch(const Telegram& t, Direction dir, const ApplianceProfile& profile)
{
    MatchResult r;
    for (uint8_t c = 0; c < profile.circuitCount; ++c) {
        const Circuit& circuit = profile.circuits[c];
        for (uint16_t i = 0; i < circuit.messageCount; ++i) {
            const uint16_t idx = (uint16_t)(circuit.firstMessage + i);
            const MessageDefinition& m = profile.messages[idx];

            const bool has = (dir == Direction::Request) ? m.hasRequestPattern : m.hasResponsePattern;
            if (!has) continue;
            const PatternSpec& p = (dir == Direction::Request) ? m.request : m.response;
            if (!patternMatches(p, t, dir)) continue;

            r.found = true;
            r.direction = dir;
            r.circuit = &circuit;
            r.message = &m;
            r.messageIndex = idx;
            return r;
        }
    }
    return r;
}
