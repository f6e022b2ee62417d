#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "assetup/api/asset_api_client.h"
#include "assetup/core/cancellation.h"
#include "assetup/core/config.h"
#include "assetup/core/result.h"
#include "assetup/http/http_client.h"

namespace assetup::upload {

struct UploadRequest {
    std::filesystem::path file_path;
    /// Asset name sent to the service; the source file name when empty.
    std::string filename;
    std::string asset_type{"video"};
};

struct UploadOutcome {
    std::string asset_url;
    std::string upload_id;
    std::string asset_id;
    int total_chunks{0};
    int batches_reported{0};
    /// True when a batch report returned the URL, false when status polling resolved it.
    bool completed_early{false};
};

/// @brief End-to-end multipart upload of one local file.
///
/// Negotiates a session, splits the file with the service's chunk size,
/// uploads and reports chunks batch by batch, then falls back to a status
/// check when no report finalized the asset. The chunk scratch directory is
/// removed before Upload() returns, whatever the outcome. Exceptions escaping
/// the collaborators are reported as ErrorCode::kInternal.
class MultipartUploader {
public:
    MultipartUploader(core::Config config, std::shared_ptr<http::HttpClient> http,
                      const core::CancellationToken* cancellation = nullptr);

    core::Result<UploadOutcome> Upload(const UploadRequest& request);

private:
    core::Result<UploadOutcome> RunUpload(const UploadRequest& request);

    core::Config config_;
    std::shared_ptr<http::HttpClient> http_;
    std::shared_ptr<api::AssetApiClient> api_;
    const core::CancellationToken* cancellation_;
};

}  // namespace assetup::upload
