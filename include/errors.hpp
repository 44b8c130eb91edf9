/**
 * @file errors.hpp
 * @brief Error taxonomy shared by every SiteMover component.
 *
 * Fallible operations return std::expected<T, ErrorInfo>. The kind is meant for
 * programmatic reactions (disabling a strategy, mapping to an exit code), the
 * message is meant for direct display to the user.
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>
#include <string_view>

/**
 * @brief Categories of failures reported by probes, scans, jobs and transfers.
 */
enum class ErrorKind {
    None,
    ConnectionFailed,       ///< Dial or DNS failure.
    AuthFailed,             ///< Credentials refused.
    HandshakeFailed,        ///< Protocol negotiation failed (SSH kex, FTP greeting, TLS).
    PermissionDenied,       ///< Read, write or list refused by the server.
    UnsupportedCapability,  ///< Protocol feature absent. Never fatal on its own.
    ValidationError,        ///< Malformed config, path or limits.
    JobNotFound,
    InvalidJobTransition,
    TruncatedScan,          ///< Advisory only.
    TransferFailed,
    IoError                 ///< File operation failure other than a permission refusal (local or remote).
};

/**
 * @brief Error value carried by std::expected.
 */
struct ErrorInfo {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

/**
 * @brief Returns the snake_case wire name of an error kind (e.g. "connection_failed").
 */
std::string_view errorKindName(ErrorKind kind);

#endif // ERRORS_HPP
