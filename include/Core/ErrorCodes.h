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
    UnknownCmd,
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
    MissingValue,
    NotReady,
    Disabled,
    Failed,
    InvalidSlot,
    UnusedSlot,
    // Timetable, asset and playback failures
    SourceUnavailable,
    ParseError,
    DataQuality,
    FetchFailed,
    PlaybackFailed,
    PreemptionTimeout,
    InvalidKind,
    MissingUrl,
    Busy
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None: return "None";
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
    case ErrorCode::MissingValue: return "MissingValue";
    case ErrorCode::NotReady: return "NotReady";
    case ErrorCode::Disabled: return "Disabled";
    case ErrorCode::Failed: return "Failed";
    case ErrorCode::InvalidSlot: return "InvalidSlot";
    case ErrorCode::UnusedSlot: return "UnusedSlot";
    case ErrorCode::SourceUnavailable: return "SourceUnavailable";
    case ErrorCode::ParseError: return "ParseError";
    case ErrorCode::DataQuality: return "DataQuality";
    case ErrorCode::FetchFailed: return "FetchFailed";
    case ErrorCode::PlaybackFailed: return "PlaybackFailed";
    case ErrorCode::PreemptionTimeout: return "PreemptionTimeout";
    case ErrorCode::InvalidKind: return "InvalidKind";
    case ErrorCode::MissingUrl: return "MissingUrl";
    case ErrorCode::Busy: return "Busy";
    default: return "Unknown";
    }
}

static inline bool errorCodeRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::CmdServiceUnavailable:
    case ErrorCode::CfgServiceUnavailable:
    case ErrorCode::NotReady:
    case ErrorCode::InternalAckOverflow:
    case ErrorCode::CfgTruncated:
    case ErrorCode::SourceUnavailable:
    case ErrorCode::FetchFailed:
    case ErrorCode::PlaybackFailed:
    case ErrorCode::Busy:
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

static inline bool writeErrorJsonWithSlot(char* out, size_t outLen, ErrorCode code, const char* where, uint8_t slot)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"slot\":%u,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        (unsigned)slot,
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}

static inline bool writeOkJson(char* out, size_t outLen, const char* where)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(out, outLen, "{\"ok\":true,\"where\":\"%s\"}", w);
    return (wrote > 0) && ((size_t)wrote < outLen);
}
