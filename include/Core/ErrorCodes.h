#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and JSON error payload formatting helpers.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

enum class ErrorCode : uint16_t {
    None = 0,
    // Profile loading (SchemaInvalid family)
    BadSchemaJson,
    MissingField,
    InvalidHex,
    InvalidDataType,
    InvalidOffset,
    DuplicateName,
    EmptyMessage,
    CapacityExceeded,
    // Per-telegram decode
    NoMatch,
    OutOfRange,
    UnknownType,
    // Presence probe
    ProbeTimeout,
    ProbeCancelled,
    ProbeUnbuildable,
    // Wire parser frame drops
    CrcMismatch,
    FrameTooLong,
    Nack,
    EnhancedProtoError,
    // Gateway output
    TopicTruncated,
    PublishFailed,
    NotReady,
    Disabled
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None: return "None";
    case ErrorCode::BadSchemaJson: return "BadSchemaJson";
    case ErrorCode::MissingField: return "MissingField";
    case ErrorCode::InvalidHex: return "InvalidHex";
    case ErrorCode::InvalidDataType: return "InvalidDataType";
    case ErrorCode::InvalidOffset: return "InvalidOffset";
    case ErrorCode::DuplicateName: return "DuplicateName";
    case ErrorCode::EmptyMessage: return "EmptyMessage";
    case ErrorCode::CapacityExceeded: return "CapacityExceeded";
    case ErrorCode::NoMatch: return "NoMatch";
    case ErrorCode::OutOfRange: return "OutOfRange";
    case ErrorCode::UnknownType: return "UnknownType";
    case ErrorCode::ProbeTimeout: return "ProbeTimeout";
    case ErrorCode::ProbeCancelled: return "ProbeCancelled";
    case ErrorCode::ProbeUnbuildable: return "ProbeUnbuildable";
    case ErrorCode::CrcMismatch: return "CrcMismatch";
    case ErrorCode::FrameTooLong: return "FrameTooLong";
    case ErrorCode::Nack: return "Nack";
    case ErrorCode::EnhancedProtoError: return "EnhancedProtoError";
    case ErrorCode::TopicTruncated: return "TopicTruncated";
    case ErrorCode::PublishFailed: return "PublishFailed";
    case ErrorCode::NotReady: return "NotReady";
    case ErrorCode::Disabled: return "Disabled";
    default: return "Unknown";
    }
}

/** @brief True for the codes that make a profile load fail. */
static inline bool errorCodeIsSchemaInvalid(ErrorCode code)
{
    switch (code) {
    case ErrorCode::BadSchemaJson:
    case ErrorCode::MissingField:
    case ErrorCode::InvalidHex:
    case ErrorCode::InvalidDataType:
    case ErrorCode::InvalidOffset:
    case ErrorCode::DuplicateName:
    case ErrorCode::EmptyMessage:
    case ErrorCode::CapacityExceeded:
        return true;
    default:
        return false;
    }
}

static inline bool errorCodeRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::ProbeTimeout:
    case ErrorCode::ProbeCancelled:
    case ErrorCode::PublishFailed:
    case ErrorCode::NotReady:
        return true;
    default:
        return false;
    }
}

static inline bool writeErrorJson(char* out, size_t outLen, ErrorCode code, const char* where)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}
