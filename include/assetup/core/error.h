#pragma once

#include <string>

namespace assetup::core {

/// @brief Canonical error codes used across the upload pipeline.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kFileNotFound,
    kIoError,
    kTransportError,
    kSessionCreateError,
    kUrlRefillError,
    kPresignedUrlExhausted,
    kChunkUploadError,
    kMissingProof,
    kReportError,
    kStatusError,
    kAssetError,
    kUploadIncomplete,
    kInvalidResponse,
    kCancelled,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
///
/// `http_status` is 0 when no HTTP response was received. `chunk_index` is 0
/// when the failure is not tied to a chunk.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
    int http_status{0};
    int chunk_index{0};
};

/// @brief Stable upper-case name for an error code (e.g. "CHUNK_UPLOAD_ERROR").
const char* ErrorCodeName(ErrorCode code);

/// @brief One-line rendering used by the CLI and log messages.
std::string Describe(const Error& error);

}  // namespace assetup::core
