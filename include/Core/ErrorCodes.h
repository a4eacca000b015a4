#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and JSON error payload formatting helpers.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

enum class ErrorCode : uint16_t {
    UnknownCmd = 0,
    BadCmdJson,
    MissingCmd,
    CmdServiceUnavailable,
    ArgsTooLarge,
    CmdHandlerFailed,
    BadCfgJson,
    CfgServiceUnavailable,
    CfgApplyFailed,
    UnknownTopic,
    InternalAckOverflow,
    CfgTruncated,
    MissingArgs,
    MissingZone,
    BadZone,
    UnknownZone,
    MissingValue,
    InvalidValue,
    MissingKind,
    UnknownKind,
    OutOfRange,
    NotReady,
    Disabled,
    InsufficientData,
    IoError,
    Failed
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::UnknownCmd: return "UnknownCmd";
    case ErrorCode::BadCmdJson: return "BadCmdJson";
    case ErrorCode::MissingCmd: return "MissingCmd";
    case ErrorCode::CmdServiceUnavailable: return "CmdServiceUnavailable";
    case ErrorCode::ArgsTooLarge: return "ArgsTooLarge";
    case ErrorCode::CmdHandlerFailed: return "CmdHandlerFailed";
    case ErrorCode::BadCfgJson: return "BadCfgJson";
    case ErrorCode::CfgServiceUnavailable: return "CfgServiceUnavailable";
    case ErrorCode::CfgApplyFailed: return "CfgApplyFailed";
    case ErrorCode::UnknownTopic: return "UnknownTopic";
    case ErrorCode::InternalAckOverflow: return "InternalAckOverflow";
    case ErrorCode::CfgTruncated: return "CfgTruncated";
    case ErrorCode::MissingArgs: return "MissingArgs";
    case ErrorCode::MissingZone: return "MissingZone";
    case ErrorCode::BadZone: return "BadZone";
    case ErrorCode::UnknownZone: return "UnknownZone";
    case ErrorCode::MissingValue: return "MissingValue";
    case ErrorCode::InvalidValue: return "InvalidValue";
    case ErrorCode::MissingKind: return "MissingKind";
    case ErrorCode::UnknownKind: return "UnknownKind";
    case ErrorCode::OutOfRange: return "OutOfRange";
    case ErrorCode::NotReady: return "NotReady";
    case ErrorCode::Disabled: return "Disabled";
    case ErrorCode::InsufficientData: return "InsufficientData";
    case ErrorCode::IoError: return "IoError";
    case ErrorCode::Failed: return "Failed";
    default: return "Unknown";
    }
}

static inline bool errorCodeRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::CmdServiceUnavailable:
    case ErrorCode::CfgServiceUnavailable:
    case ErrorCode::NotReady:
    case ErrorCode::IoError:
    case ErrorCode::InternalAckOverflow:
    case ErrorCode::CfgTruncated:
    case ErrorCode::InsufficientData:
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

static inline bool writeErrorJsonWithZone(char* out, size_t outLen, ErrorCode code, const char* where, uint8_t zone)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"zone\":%u,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        (unsigned)zone,
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}

/** @brief Minimal success reply: `{"ok":true,"where":"..."}`. */
static inline bool writeOkJson(char* out, size_t outLen, const char* where)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(out, outLen, "{\"ok\":true,\"where\":\"%s\"}", w);
    return (wrote > 0) && ((size_t)wrote < outLen);
}
