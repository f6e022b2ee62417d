#include "assetup/upload/presigned_url_cache.h"

namespace assetup::upload {

std::optional<std::string> PresignedUrlCache::Get(int chunk_index) const {
    auto it = urls_.find(chunk_index);
    if (it == urls_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PresignedUrlCache::Contains(int chunk_index) const {
    return urls_.find(chunk_index) != urls_.end();
}

void PresignedUrlCache::Merge(const std::vector<api::PresignedUrlEntry>& entries) {
    for (const auto& entry : entries) {
        urls_[entry.chunk_index] = entry.url;
    }
}

void PresignedUrlCache::Consume(int chunk_index) { urls_.erase(chunk_index); }

int PresignedUrlCache::PageFor(int chunk_index, int page_size) {
    if (chunk_index < 1 || page_size < 1) {
        return 1;
    }
    return (chunk_index - 1) / page_size + 1;
}

}  // namespace assetup::upload
