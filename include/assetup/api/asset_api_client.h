#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "assetup/core/config.h"
#include "assetup/core/result.h"
#include "assetup/http/http_client.h"

namespace assetup::api {

/// @brief Server-side lifecycle of an upload session.
enum class SessionStatus { kPending, kUploading, kCompleted, kFailed, kUnknown };

SessionStatus ParseSessionStatus(const std::string& value);
const char* SessionStatusName(SessionStatus status);

/// @brief Local view of a server-owned upload session.
struct UploadSession {
    std::string upload_id;
    std::string asset_id;
    int total_chunks{0};
    std::uint64_t chunk_size{0};
    SessionStatus status{SessionStatus::kPending};
};

struct PresignedUrlEntry {
    int chunk_index{0};
    std::string url;
};

/// @brief Session plus the first page of presigned URLs handed out with it.
struct CreatedSession {
    UploadSession session;
    std::vector<PresignedUrlEntry> upload_urls;
};

/// @brief Evidence that the storage endpoint received one chunk.
struct ChunkProof {
    int chunk_index{0};
    std::string proof;
    std::string proof_type{"etag"};
    std::uint64_t chunk_size_bytes{0};
};

/// @brief Response to a batch report; `url` is set once the asset is finalized.
struct CompletionReport {
    int processed_chunks{0};
    int duplicate_chunks{0};
    int total_completed{0};
    std::optional<std::string> url;
};

struct UploadStatus {
    SessionStatus status{SessionStatus::kUnknown};
    std::string raw_status;
    int chunks_completed{0};
    int total_chunks{0};
};

/// @brief Typed wrapper over the multipart upload endpoints of the asset service.
///
/// Every call is a single request with no retry. The API key travels as the
/// `x-api-key` header; each request gets a fresh `X-Request-Id`.
class AssetApiClient {
public:
    AssetApiClient(core::ApiConfig config, std::shared_ptr<http::HttpClient> http);

    /// POST /assets/multipart-uploads. Fails with kSessionCreateError.
    core::Result<CreatedSession> CreateSession(const std::string& filename,
                                               const std::string& asset_type,
                                               std::uint64_t total_size);
    /// POST /assets/multipart-uploads/{id}/presigned-urls. Fails with kUrlRefillError.
    core::Result<std::vector<PresignedUrlEntry>> FetchPresignedUrls(const std::string& upload_id,
                                                                    int page, int limit);
    /// POST /assets/multipart-uploads/{id}. Fails with kReportError.
    core::Result<CompletionReport> ReportChunks(const std::string& upload_id,
                                                const std::vector<ChunkProof>& proofs);
    /// GET /assets/multipart-uploads/{id}?page&limit. Fails with kStatusError.
    core::Result<UploadStatus> GetUploadStatus(const std::string& upload_id, int page, int limit);
    /// GET /assets/{id}, returning its published url. Fails with kAssetError.
    core::Result<std::string> GetAsset(const std::string& asset_id);

    const std::string& base_url() const { return base_url_; }

private:
    core::Result<http::HttpResponse> Call(const std::string& method, const std::string& path,
                                          const std::string& body, core::ErrorCode failure_code,
                                          const std::string& operation);

    core::ApiConfig config_;
    std::string base_url_;
    std::shared_ptr<http::HttpClient> http_;
};

}  // namespace assetup::api
