#include "assetup/core/error.h"

namespace assetup::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kFileNotFound:
            return "FILE_NOT_FOUND";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kTransportError:
            return "TRANSPORT_ERROR";
        case ErrorCode::kSessionCreateError:
            return "SESSION_CREATE_ERROR";
        case ErrorCode::kUrlRefillError:
            return "URL_REFILL_ERROR";
        case ErrorCode::kPresignedUrlExhausted:
            return "PRESIGNED_URL_EXHAUSTED";
        case ErrorCode::kChunkUploadError:
            return "CHUNK_UPLOAD_ERROR";
        case ErrorCode::kMissingProof:
            return "MISSING_PROOF";
        case ErrorCode::kReportError:
            return "REPORT_ERROR";
        case ErrorCode::kStatusError:
            return "STATUS_ERROR";
        case ErrorCode::kAssetError:
            return "ASSET_ERROR";
        case ErrorCode::kUploadIncomplete:
            return "UPLOAD_INCOMPLETE";
        case ErrorCode::kInvalidResponse:
            return "INVALID_RESPONSE";
        case ErrorCode::kCancelled:
            return "CANCELLED";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "UNKNOWN";
}

std::string Describe(const Error& error) {
    std::string out = std::string(ErrorCodeName(error.code)) + ": " + error.message;
    if (error.chunk_index > 0) {
        out += " (chunk " + std::to_string(error.chunk_index) + ")";
    }
    if (error.http_status > 0) {
        out += " [http " + std::to_string(error.http_status) + "]";
    }
    return out;
}

}  // namespace assetup::core
