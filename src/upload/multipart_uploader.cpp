#include "assetup/upload/multipart_uploader.h"

#include <exception>
#include <string>
#include <system_error>
#include <utility>

#include <Poco/Exception.h>

#include "assetup/core/logger.h"
#include "assetup/upload/batch_coordinator.h"
#include "assetup/upload/chunk_uploader.h"
#include "assetup/upload/completion_resolver.h"
#include "assetup/upload/file_chunker.h"
#include "assetup/upload/presigned_url_cache.h"
#include "assetup/upload/scratch_directory.h"

namespace assetup::upload {

MultipartUploader::MultipartUploader(core::Config config, std::shared_ptr<http::HttpClient> http,
                                     const core::CancellationToken* cancellation)
    : config_(std::move(config)),
      http_(std::move(http)),
      api_(std::make_shared<api::AssetApiClient>(config_.api, http_)),
      cancellation_(cancellation) {}

core::Result<UploadOutcome> MultipartUploader::Upload(const UploadRequest& request) {
    // Worker pools, UUID generation and JSON building can still throw; the
    // scratch guard inside RunUpload unwinds before the error is reported.
    try {
        return RunUpload(request);
    } catch (const Poco::Exception& ex) {
        core::LogError("Upload aborted: " + ex.displayText());
        return core::MakeError(core::ErrorCode::kInternal, ex.displayText());
    } catch (const std::exception& ex) {
        core::LogError(std::string("Upload aborted: ") + ex.what());
        return core::MakeError(core::ErrorCode::kInternal, ex.what());
    }
}

core::Result<UploadOutcome> MultipartUploader::RunUpload(const UploadRequest& request) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(request.file_path, ec)) {
        return core::MakeError(core::ErrorCode::kFileNotFound,
                               "file not found: " + request.file_path.string());
    }
    const auto total_size = std::filesystem::file_size(request.file_path, ec);
    if (ec) {
        return core::MakeError(core::ErrorCode::kIoError,
                               "cannot stat " + request.file_path.string() + ": " + ec.message());
    }
    const auto filename =
        request.filename.empty() ? request.file_path.filename().string() : request.filename;
    core::LogInfo("File size: " + std::to_string(total_size) + " bytes");

    auto created = api_->CreateSession(filename, request.asset_type, total_size);
    if (!created.ok()) {
        return created.error();
    }
    const auto& session = created.value().session;

    // Declared before any chunk is written so every return below unwinds through it.
    ScratchDirectory scratch(FileChunker::ScratchDirectoryFor(request.file_path));
    auto chunks = FileChunker::Split(request.file_path, session.chunk_size, scratch, cancellation_);
    if (!chunks.ok()) {
        return chunks.error();
    }
    if (static_cast<int>(chunks.value().size()) != session.total_chunks) {
        return core::MakeError(core::ErrorCode::kInvalidResponse,
                               "service expects " + std::to_string(session.total_chunks) +
                                   " chunks but the file splits into " +
                                   std::to_string(chunks.value().size()));
    }

    PresignedUrlCache cache;
    cache.Merge(created.value().upload_urls);
    core::LogInfo("Initial URLs available: " + std::to_string(cache.Size()));

    BatchCoordinator coordinator(config_.upload, api_, ChunkUploader(http_), cancellation_);
    auto run = coordinator.Run(session, chunks.value(), cache);
    if (!run.ok()) {
        return run.error();
    }

    UploadOutcome outcome;
    outcome.upload_id = session.upload_id;
    outcome.asset_id = session.asset_id;
    outcome.total_chunks = session.total_chunks;
    outcome.batches_reported = run.value().batches_reported;
    if (run.value().asset_url) {
        outcome.asset_url = *run.value().asset_url;
        outcome.completed_early = true;
        return outcome;
    }

    CompletionResolver resolver(config_.status, api_, cancellation_);
    auto url = resolver.Resolve(session);
    if (!url.ok()) {
        return url.error();
    }
    outcome.asset_url = url.value();
    return outcome;
}

}  // namespace assetup::upload
