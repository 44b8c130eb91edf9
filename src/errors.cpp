#include "errors.hpp"

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::ConnectionFailed: return "connection_failed";
    case ErrorKind::AuthFailed: return "auth_failed";
    case ErrorKind::HandshakeFailed: return "handshake_failed";
    case ErrorKind::PermissionDenied: return "permission_denied";
    case ErrorKind::UnsupportedCapability: return "unsupported_capability";
    case ErrorKind::ValidationError: return "validation_error";
    case ErrorKind::JobNotFound: return "job_not_found";
    case ErrorKind::InvalidJobTransition: return "invalid_job_transition";
    case ErrorKind::TruncatedScan: return "truncated_scan";
    case ErrorKind::TransferFailed: return "transfer_failed";
    case ErrorKind::IoError: return "io_error";
    }
    return "unknown";
}
