#pragma once
/**
 * @file IEbusBus.h
 * @brief eBUS transport service interface (probe round-trip).
 */

#include <stdint.h>

struct Telegram;

/** @brief Outcome of one request/reply exchange on the bus. */
enum class ProbeOutcome : uint8_t {
    Reply,      ///< reply written to the out telegram
    Timeout,    ///< nothing arrived before the deadline
    Cancelled   ///< the transport aborted the wait
};

/**
 * @brief Service wrapper for the external bus transport.
 *
 * `probe` sends `request`, waits at most `timeoutMs` and on `Reply` fills
 * `reply` with the request header plus the slave response. The transport
 * owns the pending request handle and releases it before returning.
 */
struct EbusBusService {
    ProbeOutcome (*probe)(void* ctx, const Telegram& request, Telegram& reply, uint32_t timeoutMs);
    void* ctx;
};
