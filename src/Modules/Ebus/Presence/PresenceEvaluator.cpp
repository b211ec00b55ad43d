/**
 * @file PresenceEvaluator.cpp
 * @brief Implementation file.
 */
#include "Modules/Ebus/Presence/PresenceEvaluator.h"
#include "Modules/Ebus/Match/PatternMatcher.h"

#define LOG_TAG "Presence"
#include "Core/ModuleLog.h"

const char* presenceStateStr(PresenceState s)
{
    switch (s) {
    case PresenceState::Absent: return "absent";
    case PresenceState::Present: return "present";
    case PresenceState::Indeterminate: return "indeterminate";
    }
    return "unknown";
}

bool buildProbeRequest(const PresenceRule& rule, uint8_t masterAddr, Telegram& out)
{
    out.clear();
    const PatternSpec& req = rule.request;

    uint8_t src = 0;
    if (!req.src.literalByte(src)) {
        if (req.src.len != 1 || !req.src.wildcard[0]) return false;
        src = masterAddr;
    }

    uint8_t dst = 0;
    if (!req.dst.literalByte(dst)) return false;
    if (!req.hasPbsb) return false;

    uint8_t data[Limits::Ebus::MaxDataLen];
    size_t len = 0;
    if (!req.data.literalBytes(data, sizeof(data), len)) return false;

    out.src = src;
    out.dst = dst;
    out.pbsb = req.pbsb;
    return out.setData(data, len);
}

static PresenceState indeterminate(ErrorCode code, ErrorCode* why)
{
    if (why) *why = code;
    return PresenceState::Indeterminate;
}

PresenceState evaluatePresence(const PresenceRule& rule,
                               const EbusBusService* bus,
                               uint8_t masterAddr,
                               uint32_t timeoutMs,
                               ErrorCode* why)
{
    if (why) *why = ErrorCode::None;

    if (!rule.valid) {
        LOGD("presence rule disabled");
        return indeterminate(ErrorCode::Disabled, why);
    }

    Telegram request;
    if (!buildProbeRequest(rule, masterAddr, request)) {
        LOGW("presence request pattern cannot be sent as a frame");
        return indeterminate(ErrorCode::ProbeUnbuildable, why);
    }

    if (!bus || !bus->probe) {
        LOGW("no bus transport for presence probe");
        return indeterminate(ErrorCode::NotReady, why);
    }

    Telegram reply;
    const ProbeOutcome outcome = bus->probe(bus->ctx, request, reply, timeoutMs);
    switch (outcome) {
    case ProbeOutcome::Reply:
        if (patternMatches(rule.response, reply, Direction::Response)) {
            LOGI("appliance present (dst=%02X pbsb=%04X)", request.dst, request.pbsb);
            return PresenceState::Present;
        }
        LOGI("appliance reply does not match presence rule");
        if (why) *why = ErrorCode::NoMatch;
        return PresenceState::Absent;
    case ProbeOutcome::Timeout:
        LOGI("presence probe timed out after %lu ms", (unsigned long)timeoutMs);
        if (why) *why = ErrorCode::ProbeTimeout;
        return PresenceState::Absent;
    case ProbeOutcome::Cancelled:
        LOGI("presence probe cancelled");
        return indeterminate(ErrorCode::ProbeCancelled, why);
    }
    return indeterminate(ErrorCode::NotReady, why);
}
