#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "assetup/api/asset_api_client.h"

namespace assetup::upload {

/// @brief Chunk index -> presigned URL map for one upload session.
///
/// Not synchronized: only the coordinating thread reads or writes it. Workers
/// receive their URL by value before the pool starts.
class PresignedUrlCache {
public:
    std::optional<std::string> Get(int chunk_index) const;
    bool Contains(int chunk_index) const;
    /// @brief Insert entries, replacing any URL already held for the same index.
    void Merge(const std::vector<api::PresignedUrlEntry>& entries);
    /// @brief Drop the URL of a chunk that has been stored; it may be single-use.
    void Consume(int chunk_index);
    std::size_t Size() const { return urls_.size(); }

    /// @brief 1-based page that holds `chunk_index` when pages contain `page_size` entries.
    static int PageFor(int chunk_index, int page_size);

private:
    std::unordered_map<int, std::string> urls_;
};

}  // namespace assetup::upload
