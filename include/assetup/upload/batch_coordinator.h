#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "assetup/api/asset_api_client.h"
#include "assetup/core/cancellation.h"
#include "assetup/core/config.h"
#include "assetup/core/result.h"
#include "assetup/upload/chunk_uploader.h"
#include "assetup/upload/file_chunker.h"
#include "assetup/upload/presigned_url_cache.h"

namespace assetup::upload {

struct BatchRunResult {
    /// Set when a batch report finalized the asset; later batches were skipped.
    std::optional<std::string> asset_url;
    int batches_reported{0};
    int chunks_uploaded{0};
};

/// @brief Uploads and reports chunks batch by batch in ascending index order.
///
/// Per batch: missing URLs are fetched first, then the batch is uploaded on a
/// worker pool of min(batch, max_concurrency) threads that is joined before the
/// proofs are reported. Any chunk failure aborts the run before that batch is
/// reported.
class BatchCoordinator {
public:
    BatchCoordinator(core::UploadConfig config, std::shared_ptr<api::AssetApiClient> api,
                     ChunkUploader uploader,
                     const core::CancellationToken* cancellation = nullptr);

    core::Result<BatchRunResult> Run(const api::UploadSession& session,
                                     const std::vector<ChunkDescriptor>& chunks,
                                     PresignedUrlCache& cache);

    static int WorkerCount(std::size_t batch_chunks, int max_concurrency);

private:
    core::Result<void> EnsureUrls(const std::string& upload_id,
                                  const std::vector<ChunkDescriptor>& batch,
                                  PresignedUrlCache& cache);
    core::Result<std::vector<api::ChunkProof>> UploadBatch(
        const std::vector<ChunkDescriptor>& batch, const PresignedUrlCache& cache);
    bool Cancelled() const { return cancellation_ && cancellation_->cancelled(); }

    core::UploadConfig config_;
    std::shared_ptr<api::AssetApiClient> api_;
    ChunkUploader uploader_;
    const core::CancellationToken* cancellation_;
};

}  // namespace assetup::upload
