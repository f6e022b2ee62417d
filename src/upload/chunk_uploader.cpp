#include "assetup/upload/chunk_uploader.h"

#include <fstream>
#include <iterator>
#include <utility>

#include "assetup/core/logger.h"
#include "assetup/observability/metrics.h"

namespace assetup::upload {

ChunkUploader::ChunkUploader(std::shared_ptr<http::HttpClient> http) : http_(std::move(http)) {}

std::string ChunkUploader::StripQuotes(const std::string& etag) {
    const auto first = etag.find_first_not_of('"');
    if (first == std::string::npos) {
        return "";
    }
    const auto last = etag.find_last_not_of('"');
    return etag.substr(first, last - first + 1);
}

core::Result<api::ChunkProof> ChunkUploader::Upload(const ChunkDescriptor& chunk,
                                                    const std::string& presigned_url) const {
    std::ifstream in(chunk.path, std::ios::binary);
    if (!in.is_open()) {
        return core::MakeError(core::ErrorCode::kIoError,
                               "cannot open chunk file " + chunk.path.string(), 0, chunk.index);
    }

    http::HttpRequest request;
    request.method = "PUT";
    request.url = presigned_url;
    request.content_type = "application/octet-stream";
    request.body.reserve(static_cast<std::size_t>(chunk.size_bytes));
    request.body.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (request.body.size() != chunk.size_bytes) {
        return core::MakeError(core::ErrorCode::kIoError,
                               "chunk file " + chunk.path.string() + " changed size", 0,
                               chunk.index);
    }

    core::LogDebug("Uploading chunk " + std::to_string(chunk.index) + " (" +
                   std::to_string(chunk.size_bytes) + " bytes)");
    auto sent = http_->Send(request);
    if (!sent.ok()) {
        return core::MakeError(core::ErrorCode::kChunkUploadError,
                               "chunk upload failed: " + sent.error().message, 0, chunk.index);
    }
    const auto& response = sent.value();
    if (!response.ok()) {
        return core::MakeError(core::ErrorCode::kChunkUploadError,
                               "storage rejected chunk upload", response.status, chunk.index);
    }

    auto etag = response.Header("ETag");
    const auto proof = etag ? StripQuotes(*etag) : std::string();
    if (proof.empty()) {
        return core::MakeError(core::ErrorCode::kMissingProof,
                               "storage response carried no ETag", response.status, chunk.index);
    }

    observability::RecordChunkUploaded(chunk.size_bytes);
    core::LogInfo("Chunk " + std::to_string(chunk.index) + " uploaded, ETag: " + proof);

    api::ChunkProof result;
    result.chunk_index = chunk.index;
    result.proof = proof;
    result.chunk_size_bytes = chunk.size_bytes;
    return result;
}

}  // namespace assetup::upload
