#pragma once
/**
 * @file PresenceEvaluator.h
 * @brief One request/reply probe deciding whether the appliance answers.
 */

#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Core/Services/IEbusBus.h"
#include "Modules/Ebus/Schema/ProfileTypes.h"
#include "Modules/Ebus/Telegram/Telegram.h"

enum class PresenceState : uint8_t {
    Absent = 0,
    Present,
    Indeterminate
};

const char* presenceStateStr(PresenceState s);

/**
 * @brief Turn the rule's request pattern into a concrete frame.
 *
 * `src` is the literal byte, or `masterAddr` when the pattern is `*`.
 * `dst` must be literal, PBSB must be set and the data pattern must hold no
 * wildcard.
 */
bool buildProbeRequest(const PresenceRule& rule, uint8_t masterAddr, Telegram& out);

/**
 * @brief Evaluate the presence rule with one probe.
 *
 * Invalid rule, unbuildable request, missing transport or a cancelled wait
 * give `Indeterminate` (reason in `why` when not null). A reply matching the
 * response pattern gives `Present`; a non-matching reply or a timeout gives
 * `Absent`. The probe is never retried.
 */
PresenceState evaluatePresence(const PresenceRule& rule,
                               const EbusBusService* bus,
                               uint8_t masterAddr,
                               uint32_t timeoutMs,
                               ErrorCode* why = nullptr);
