/**
 * @file EbusWireParser.cpp
 * @brief Implementation file.
 */
#include "Modules/Ebus/Telegram/EbusWireParser.h"
#include "Modules/Ebus/Telegram/Crc8.h"
#include "Domain/EbusDefaults.h"

#define LOG_TAG "EbusWire"
#include "Core/ModuleLog.h"

void EbusWireParser::decodeEnhanced(uint8_t b1, uint8_t b2, uint8_t& cmd, uint8_t& data)
{
    // b1 = 11cc ccdd, b2 = 10dd dddd
    cmd = (uint8_t)((b1 >> 2) & 0x0F);
    data = (uint8_t)(((b1 & 0x03) << 6) | (b2 & 0x3F));
}

void EbusWireParser::reset()
{
    state_ = State::WaitSyn;
    cur_.clear();
    remaining_ = 0;
    inResponse_ = false;
    enhPending_ = false;
    enhFirst_ = 0;
}

void EbusWireParser::feed(const uint8_t* bytes, size_t n)
{
    if (!bytes) return;
    for (size_t i = 0; i < n; ++i) {
        const uint8_t b = bytes[i];

        if (enhPending_) {
            enhPending_ = false;
            if ((b & EbusDefaults::EnhByte2Mask) == EbusDefaults::EnhByte2Mask &&
                (b & EbusDefaults::EnhByte1Mask) != EbusDefaults::EnhByte1Mask) {
                uint8_t cmd = 0;
                uint8_t data = 0;
                decodeEnhanced(enhFirst_, b, cmd, data);
                onEnhanced(cmd, data);
                continue;
            }
            // only the dangling first byte is lost, `b` is handled below
            ++stats_.protoErrors;
            lastError_ = ErrorCode::EnhancedProtoError;
            LOGD("enhanced sequence broken: %02X %02X", enhFirst_, b);
        }

        if ((b & EbusDefaults::EnhByte1Mask) == EbusDefaults::EnhByte1Mask) {
            enhPending_ = true;
            enhFirst_ = b;
            continue;
        }

        onBusByte(b);
    }
}

void EbusWireParser::onEnhanced(uint8_t cmd, uint8_t data)
{
    switch ((EnhResponse)cmd) {
        case EnhResponse::Received:
            onBusByte(data);
            return;
        case EnhResponse::Resetted:
            LOGD("adapter reset");
            reset();
            return;
        case EnhResponse::Started:
            LOGD("arbitration started (%02X)", data);
            return;
        case EnhResponse::Info:
            LOGD("adapter info %02X", data);
            return;
        case EnhResponse::Failed:
            LOGD("arbitration failed (%02X)", data);
            return;
        case EnhResponse::ErrorEbus:
            LOGW("adapter reports eBUS error %02X", data);
            drop(ErrorCode::EnhancedProtoError);
            return;
        case EnhResponse::ErrorHost:
            LOGW("adapter reports host error %02X", data);
            drop(ErrorCode::EnhancedProtoError);
            return;
    }
    ++stats_.protoErrors;
    LOGD("unknown enhanced command %02X", cmd);
}

void EbusWireParser::drop(ErrorCode why)
{
    lastError_ = why;
    cur_.clear();
    remaining_ = 0;
    inResponse_ = false;
    state_ = State::WaitSyn;
}

void EbusWireParser::complete()
{
    ++stats_.telegrams;
    if (cb_) cb_(cbCtx_, cur_);
    cur_.clear();
    remaining_ = 0;
    inResponse_ = false;
}

void EbusWireParser::onBusByte(uint8_t b)
{
    switch (state_) {
    case State::WaitSyn:
        if (b == EbusDefaults::Syn) state_ = State::WaitSrc;
        break;

    case State::WaitSrc:
        if (b != EbusDefaults::Syn) {
            cur_.src = b;
            state_ = State::WaitDst;
        }
        break;

    case State::WaitDst:
        cur_.dst = b;
        state_ = State::WaitPb;
        break;

    case State::WaitPb:
        cur_.pbsb = (uint16_t)(b << 8);
        state_ = State::WaitSb;
        break;

    case State::WaitSb:
        cur_.pbsb |= b;
        state_ = State::WaitLen;
        break;

    case State::WaitLen:
        if (b > Limits::Ebus::MaxDataLen) {
            // NN cannot exceed 16, resync on the next SYN
            ++stats_.tooLong;
            LOGD("request NN=%02X too long, dropping", b);
            drop(ErrorCode::FrameTooLong);
            break;
        }
        cur_.len = b;
        remaining_ = b;
        state_ = (b == 0) ? State::WaitCrc : State::WaitData;
        break;

    case State::WaitData:
        if (inResponse_) {
            cur_.resp[cur_.respLen - remaining_] = b;
        } else {
            cur_.data[cur_.len - remaining_] = b;
        }
        if (--remaining_ == 0) state_ = State::WaitCrc;
        break;

    case State::WaitCrc: {
        const uint8_t expected = inResponse_ ? telegramResponseCrc(cur_) : telegramRequestCrc(cur_);
        if (expected != b) {
            ++stats_.crcErrors;
            LOGD("CRC mismatch got=%02X want=%02X", b, expected);
            drop(ErrorCode::CrcMismatch);
            if (b == EbusDefaults::Syn) state_ = State::WaitSrc;
            break;
        }
        state_ = State::WaitAck;
        break;
    }

    case State::WaitAck:
        if (b == EbusDefaults::Ack) {
            if (inResponse_) {
                // master acknowledged the slave response
                complete();
                state_ = State::WaitSyn;
            } else {
                state_ = State::WaitResponse;
            }
        } else if (b == EbusDefaults::Nack) {
            ++stats_.nacks;
            LOGD("NACK, dropping frame");
            drop(ErrorCode::Nack);
        } else if (b == EbusDefaults::Syn && !inResponse_ && cur_.isBroadcast()) {
            // broadcasts are not acknowledged
            complete();
            state_ = State::WaitSrc;
        } else {
            LOGD("unexpected %02X while waiting for ACK", b);
            drop(ErrorCode::Nack);
            if (b == EbusDefaults::Syn) state_ = State::WaitSrc;
        }
        break;

    case State::WaitResponse:
        if (b == EbusDefaults::Syn) {
            // master-master telegram, no slave response
            complete();
            state_ = State::WaitSrc;
            break;
        }
        if (b > Limits::Ebus::MaxDataLen) {
            ++stats_.tooLong;
            LOGD("response NN=%02X too long, dropping", b);
            drop(ErrorCode::FrameTooLong);
            break;
        }
        inResponse_ = true;
        cur_.hasResponse = true;
        cur_.respLen = b;
        remaining_ = b;
        state_ = (b == 0) ? State::WaitCrc : State::WaitData;
        break;
    }
}
