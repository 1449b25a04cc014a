#pragma once

#include <string>

namespace Umbra {

enum class OutcomeKind { Ingested, SkippedAlreadyIngested, SkippedInvalid, Failed };

enum class FailureReason {
    None,
    TransportExhausted,
    NonRetryableStatus,
    OversizedBody,
    EmptyContent,
    StorageFailed,
    RunCancelled
};

enum class TransportKind { Primary, Fallback };

enum class TransportErrorKind {
    None,
    Timeout,
    ConnectionRefused,
    ProtocolError,
    HttpStatus,
    EmptyBody,
    Unknown
};

inline std::string to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Ingested: return "ingested";
        case OutcomeKind::SkippedAlreadyIngested: return "skipped_duplicate";
        case OutcomeKind::SkippedInvalid: return "skipped_invalid";
        case OutcomeKind::Failed: return "failed";
    }
    return "unknown";
}

inline std::string to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::None: return "none";
        case FailureReason::TransportExhausted: return "transport_exhausted";
        case FailureReason::NonRetryableStatus: return "non_retryable_status";
        case FailureReason::OversizedBody: return "oversized_body";
        case FailureReason::EmptyContent: return "empty_content";
        case FailureReason::StorageFailed: return "storage_failed";
        case FailureReason::RunCancelled: return "run_cancelled";
    }
    return "unknown";
}

inline std::string to_string(TransportKind kind) {
    return kind == TransportKind::Primary ? "primary" : "fallback";
}

inline std::string to_string(TransportErrorKind kind) {
    switch (kind) {
        case TransportErrorKind::None: return "none";
        case TransportErrorKind::Timeout: return "timeout";
        case TransportErrorKind::ConnectionRefused: return "connection_refused";
        case TransportErrorKind::ProtocolError: return "protocol_error";
        case TransportErrorKind::HttpStatus: return "http_status";
        case TransportErrorKind::EmptyBody: return "empty_body";
        case TransportErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

}  // namespace Umbra
