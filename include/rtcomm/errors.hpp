/**
 * @file errors.hpp
 * @brief Error taxonomy for RTComm
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * All failures that cross a public API boundary are reported as RtcError:
 * - Configuration errors (missing store client, missing user id)
 * - Validation errors (file type/size, chunk set, integrity)
 * - Permission errors (capability check failed)
 * - State errors (illegal call or transfer transition)
 */

#pragma once

#include <stdexcept>
#include <string>

namespace rtcomm {

/**
 * @brief Machine-readable error category
 */
enum class ErrorCode {
    NoClient,              ///< Store adapter could not be obtained
    MissingUserId,         ///< Operation requires an initialized user
    NotConnected,          ///< Router not initialized or already destroyed
    InvalidArgument,       ///< Malformed input
    UnsupportedFileType,   ///< Extension not on the allow-list
    FileTooLarge,          ///< File exceeds configured maximum
    IncompleteChunks,      ///< Chunk index set is not [0, total_chunks)
    IntegrityFailed,       ///< Hash mismatch after reassembly
    NotAnImage,            ///< Image-only operation on another category
    PermissionDenied,      ///< Capability check failed
    InvalidState,          ///< Illegal state transition
    NotFound,              ///< Unknown call, transfer or participant
    FeatureDisabled,       ///< Feature switched off in configuration
    StoreFailure,          ///< Store read/write failed
    Timeout,               ///< Operation timed out
    Cancelled              ///< Operation cancelled while in flight
};

/**
 * @brief Convert ErrorCode to stable string
 */
inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NoClient: return "no_client";
        case ErrorCode::MissingUserId: return "missing_user_id";
        case ErrorCode::NotConnected: return "not_connected";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::UnsupportedFileType: return "unsupported_file_type";
        case ErrorCode::FileTooLarge: return "file_too_large";
        case ErrorCode::IncompleteChunks: return "incomplete_chunks";
        case ErrorCode::IntegrityFailed: return "integrity_failed";
        case ErrorCode::NotAnImage: return "not_an_image";
        case ErrorCode::PermissionDenied: return "permission_denied";
        case ErrorCode::InvalidState: return "invalid_state";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::FeatureDisabled: return "feature_disabled";
        case ErrorCode::StoreFailure: return "store_failure";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Exception thrown by RTComm components
 */
class RtcError : public std::runtime_error {
public:
    RtcError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {}

    /**
     * @brief Error category
     */
    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace rtcomm
