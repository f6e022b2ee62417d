#pragma once

#include <memory>
#include <string>

#include "assetup/api/asset_api_client.h"
#include "assetup/core/result.h"
#include "assetup/http/http_client.h"
#include "assetup/upload/file_chunker.h"

namespace assetup::upload {

/// @brief PUTs one chunk blob to its presigned URL and returns the storage proof.
///
/// Stateless apart from the shared transport; distinct chunks may be uploaded
/// concurrently from several threads.
class ChunkUploader {
public:
    explicit ChunkUploader(std::shared_ptr<http::HttpClient> http);

    core::Result<api::ChunkProof> Upload(const ChunkDescriptor& chunk,
                                         const std::string& presigned_url) const;

    /// @brief ETag value with surrounding double quotes removed.
    static std::string StripQuotes(const std::string& etag);

private:
    std::shared_ptr<http::HttpClient> http_;
};

}  // namespace assetup::upload
