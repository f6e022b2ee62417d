#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "assetup/core/cancellation.h"
#include "assetup/core/result.h"
#include "assetup/upload/scratch_directory.h"

namespace assetup::upload {

/// @brief One contiguous byte range of the source file, materialized as a scratch blob.
struct ChunkDescriptor {
    int index{0};
    std::filesystem::path path;
    std::uint64_t size_bytes{0};
};

/// @brief Splits a file into fixed-size chunk blobs inside a scratch directory.
class FileChunker {
public:
    /// @brief Writes chunk_0001, chunk_0002, ... into `scratch` and returns them in index order.
    ///
    /// Every blob is registered with `scratch` as soon as it is opened, so a
    /// failure part way through still leaves nothing behind once the guard is
    /// released, and chunk_NNNN files already present from an interrupted
    /// run are registered too. An empty source yields no chunks. The token,
    /// when given, is checked before each chunk.
    static core::Result<std::vector<ChunkDescriptor>> Split(
        const std::filesystem::path& source, std::uint64_t chunk_size, ScratchDirectory& scratch,
        const core::CancellationToken* cancellation = nullptr);

    /// @brief `<parent>/<stem>_chunks`: deterministic per source path.
    static std::filesystem::path ScratchDirectoryFor(const std::filesystem::path& source);
    /// @brief ceil(total_size / chunk_size); 0 when chunk_size is 0.
    static std::uint64_t CountChunks(std::uint64_t total_size, std::uint64_t chunk_size);
    static std::string ChunkFileName(int index);
    /// @brief True for names ChunkFileName() produces ("chunk_" and at least four digits).
    static bool IsChunkFileName(const std::string& name);
};

}  // namespace assetup::upload
