/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

/**
 * @file ErrorCodes.h
 * @brief Error handling types for DavBackup storage operations
 *
 * Defines the storage error taxonomy and the tagged result type returned by
 * every WebDAV, spooling and backup operation.
 */

#pragma once

#include <optional>
#include <string>
#include <stdexcept>

namespace DavBackup {

/**
 * @brief Error codes for storage operations
 *
 * NotFound is reported distinctly so callers can tell "does not exist" apart
 * from "could not check".
 */
enum class StorageError {
    None,                       ///< No error
    NotFound,                   ///< Requested archive, sidecar or folder is absent
    Unauthorized,               ///< Credentials rejected (401/403), never retried
    ConnectivityFailure,        ///< No usable DAV root, or request could not complete
    ProtocolFailure,            ///< Malformed or unexpected server response
    TransferFailure,            ///< Upload or download could not complete
    MetadataCorruption,         ///< Sidecar content is not a valid descriptor
    InvalidParameter,           ///< Invalid parameter or configuration
    IoFailure                   ///< Local staging file could not be written or read
};

/**
 * @brief Convert error code to human-readable string
 * @param error The error code
 * @return Description of the error
 */
inline const char* errorToString(StorageError error) {
    switch (error) {
        case StorageError::None: return "No error";
        case StorageError::NotFound: return "Not found";
        case StorageError::Unauthorized: return "Unauthorized";
        case StorageError::ConnectivityFailure: return "Connectivity failure";
        case StorageError::ProtocolFailure: return "Protocol failure";
        case StorageError::TransferFailure: return "Transfer failure";
        case StorageError::MetadataCorruption: return "Metadata corruption";
        case StorageError::InvalidParameter: return "Invalid parameter";
        case StorageError::IoFailure: return "I/O failure";
        default: return "Unknown error";
    }
}

/**
 * @brief Result type for operations that may fail
 *
 * Encapsulates a value and an error code. Check success() before accessing value.
 *
 * @code
 * auto result = client.stat("ha_backup_abc.tar");
 * if (result.success()) {
 *     useValue(result.value);
 * } else if (result.error == StorageError::NotFound) {
 *     handleMissing();
 * }
 * @endcode
 */
template<typename T>
struct Result {
    T value;                    ///< Result value (valid only if error == None)
    StorageError error;         ///< Error code
    std::string errorMessage;   ///< Optional detailed error message

    /**
     * @brief Check if operation succeeded
     * @return true if no error occurred
     */
    bool success() const {
        return error == StorageError::None;
    }

    /**
     * @brief Check if operation failed
     * @return true if an error occurred
     */
    bool failed() const {
        return error != StorageError::None;
    }

    /**
     * @brief Check if operation failed because the target does not exist
     */
    bool notFound() const {
        return error == StorageError::NotFound;
    }

    /**
     * @brief Message for display, falling back to the error name
     */
    std::string describe() const {
        return errorMessage.empty() ? std::string(errorToString(error)) : errorMessage;
    }

    /**
     * @brief Get the value or throw on error
     * @return The contained value
     * @throws std::runtime_error if operation failed
     */
    T& valueOrThrow() {
        if (failed()) {
            throw std::runtime_error(describe());
        }
        return value;
    }

    /**
     * @brief Create a successful result
     * @param val The result value
     * @return Result with no error
     */
    static Result<T> ok(T val) {
        return Result<T>{std::move(val), StorageError::None, ""};
    }

    /**
     * @brief Create a failed result
     * @param err The error code
     * @param message Optional error message
     * @return Result with error
     */
    static Result<T> err(StorageError err, std::string message = "") {
        return Result<T>{T{}, err, std::move(message)};
    }
};

/**
 * @brief Result specialization for void operations
 */
template<>
struct Result<void> {
    StorageError error;
    std::string errorMessage;

    bool success() const { return error == StorageError::None; }
    bool failed() const { return error != StorageError::None; }
    bool notFound() const { return error == StorageError::NotFound; }

    std::string describe() const {
        return errorMessage.empty() ? std::string(errorToString(error)) : errorMessage;
    }

    void throwOnError() const {
        if (failed()) {
            throw std::runtime_error(describe());
        }
    }

    static Result<void> ok() {
        return Result<void>{StorageError::None, ""};
    }

    static Result<void> err(StorageError err, std::string message = "") {
        return Result<void>{err, std::move(message)};
    }
};

} // namespace DavBackup
