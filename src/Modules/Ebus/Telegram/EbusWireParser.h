#pragma once
/**
 * @file EbusWireParser.h
 * @brief Byte-stream to telegram state machine (enhanced adapter protocol aware).
 */

#include <stddef.h>
#include <stdint.h>
#include "Modules/Ebus/Telegram/Telegram.h"
#include "Core/ErrorCodes.h"

/** @brief Called once per complete telegram. */
typedef void (*TelegramCallback)(void* ctx, const Telegram& t);

/** @brief Enhanced protocol commands sent by the adapter. */
enum class EnhResponse : uint8_t {
    Resetted = 0x00,
    Received = 0x01,
    Started = 0x02,
    Info = 0x03,
    Failed = 0x0A,
    ErrorEbus = 0x0B,
    ErrorHost = 0x0C
};

/** @brief Frame counters, for diagnostics. */
struct WireParserStats {
    uint32_t telegrams = 0;
    uint32_t crcErrors = 0;
    uint32_t tooLong = 0;
    uint32_t nacks = 0;
    uint32_t protoErrors = 0;
};

/**
 * @brief Reassembles telegrams from adapter bytes.
 *
 * Bytes with both top bits set open a two-byte enhanced sequence whose
 * `Received` command carries one bus byte; any other byte is a bus byte.
 * A sequence split across two `feed()` calls is completed on the next call.
 */
class EbusWireParser {
public:
    EbusWireParser() = default;
    EbusWireParser(TelegramCallback cb, void* ctx) : cb_(cb), cbCtx_(ctx) {}

    void setCallback(TelegramCallback cb, void* ctx) { cb_ = cb; cbCtx_ = ctx; }

    /** @brief Consume raw adapter bytes. */
    void feed(const uint8_t* bytes, size_t n);
    /** @brief Drop any partial frame and wait for the next SYN. */
    void reset();

    const WireParserStats& stats() const { return stats_; }
    /** @brief Reason of the most recent frame drop. */
    ErrorCode lastError() const { return lastError_; }

    /** @brief Decode an enhanced pair into (command, data). */
    static void decodeEnhanced(uint8_t b1, uint8_t b2, uint8_t& cmd, uint8_t& data);

private:
    enum class State : uint8_t {
        WaitSyn,
        WaitSrc,
        WaitDst,
        WaitPb,
        WaitSb,
        WaitLen,
        WaitData,
        WaitCrc,
        WaitAck,
        WaitResponse
    };

    void onEnhanced(uint8_t cmd, uint8_t data);
    void onBusByte(uint8_t b);
    void drop(ErrorCode why);
    void complete();

    TelegramCallback cb_ = nullptr;
    void* cbCtx_ = nullptr;

    State state_ = State::WaitSyn;
    Telegram cur_{};
    uint8_t remaining_ = 0;
    bool inResponse_ = false;

    bool enhPending_ = false;
    uint8_t enhFirst_ = 0;

    WireParserStats stats_{};
    ErrorCode lastError_ = ErrorCode::None;
};
