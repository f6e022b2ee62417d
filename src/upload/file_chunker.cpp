#include "assetup/upload/file_chunker.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <system_error>

#include "assetup/core/logger.h"

namespace assetup::upload {

namespace {
constexpr std::size_t kBufferSize = 64 * 1024;
constexpr char kChunkPrefix[] = "chunk_";

// Blobs left by an earlier run that died before its cleanup ran.
void AdoptStaleChunks(ScratchDirectory& scratch) {
    std::error_code ec;
    std::filesystem::directory_iterator it(scratch.path(), ec);
    if (ec) {
        core::LogWarning("Cannot scan scratch directory " + scratch.path().string() + ": " +
                         ec.message());
        return;
    }
    std::size_t adopted = 0;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        if (FileChunker::IsChunkFileName(it->path().filename().string())) {
            scratch.Track(it->path());
            ++adopted;
        }
    }
    if (adopted > 0) {
        core::LogWarning("Found " + std::to_string(adopted) + " stale chunk files in " +
                         scratch.path().string() + "; they will be removed");
    }
}
}  // namespace

std::filesystem::path FileChunker::ScratchDirectoryFor(const std::filesystem::path& source) {
    return source.parent_path() / (source.stem().string() + "_chunks");
}

std::uint64_t FileChunker::CountChunks(std::uint64_t total_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return (total_size + chunk_size - 1) / chunk_size;
}

bool FileChunker::IsChunkFileName(const std::string& name) {
    const std::string prefix(kChunkPrefix);
    if (name.size() < prefix.size() + 4 || name.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return std::all_of(name.begin() + static_cast<std::ptrdiff_t>(prefix.size()), name.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string FileChunker::ChunkFileName(int index) {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%04d", index);
    return name;
}

core::Result<std::vector<ChunkDescriptor>> FileChunker::Split(
    const std::filesystem::path& source, std::uint64_t chunk_size, ScratchDirectory& scratch,
    const core::CancellationToken* cancellation) {
    if (chunk_size == 0) {
        return core::MakeError(core::ErrorCode::kInvalidArgument, "chunk size must be positive");
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return core::MakeError(core::ErrorCode::kFileNotFound,
                               "file not found: " + source.string());
    }
    const auto total_size = std::filesystem::file_size(source, ec);
    if (ec) {
        return core::MakeError(core::ErrorCode::kIoError,
                               "cannot stat " + source.string() + ": " + ec.message());
    }

    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        return core::MakeError(core::ErrorCode::kFileNotFound,
                               "cannot open " + source.string());
    }
    if (!scratch.Create()) {
        return core::MakeError(core::ErrorCode::kIoError,
                               "cannot create scratch directory " + scratch.path().string());
    }
    AdoptStaleChunks(scratch);

    core::LogInfo("Splitting " + source.filename().string() + " (" + std::to_string(total_size) +
                  " bytes) into " + std::to_string(chunk_size) + " byte chunks");

    std::vector<ChunkDescriptor> chunks;
    chunks.reserve(static_cast<std::size_t>(CountChunks(total_size, chunk_size)));
    std::array<char, kBufferSize> buffer{};
    std::uint64_t consumed = 0;
    int index = 1;
    while (consumed < total_size) {
        if (cancellation != nullptr && cancellation->cancelled()) {
            return core::MakeError(core::ErrorCode::kCancelled,
                                   "cancelled while splitting " + source.filename().string(), 0,
                                   index);
        }
        ChunkDescriptor chunk;
        chunk.index = index;
        chunk.path = scratch.path() / ChunkFileName(index);

        std::ofstream out(chunk.path, std::ios::binary | std::ios::trunc);
        scratch.Track(chunk.path);
        if (!out.is_open()) {
            return core::MakeError(core::ErrorCode::kIoError,
                                   "cannot create chunk file " + chunk.path.string(), 0, index);
        }

        const auto target = std::min<std::uint64_t>(chunk_size, total_size - consumed);
        while (chunk.size_bytes < target) {
            const auto want = static_cast<std::streamsize>(
                std::min<std::uint64_t>(buffer.size(), target - chunk.size_bytes));
            in.read(buffer.data(), want);
            const std::streamsize got = in.gcount();
            if (got <= 0) {
                return core::MakeError(core::ErrorCode::kIoError,
                                       "unexpected end of " + source.string(), 0, index);
            }
            out.write(buffer.data(), got);
            if (!out) {
                return core::MakeError(core::ErrorCode::kIoError,
                                       "failed to write " + chunk.path.string(), 0, index);
            }
            chunk.size_bytes += static_cast<std::uint64_t>(got);
        }
        out.close();
        if (!out) {
            return core::MakeError(core::ErrorCode::kIoError,
                                   "failed to flush " + chunk.path.string(), 0, index);
        }

        consumed += chunk.size_bytes;
        core::LogDebug("Created chunk " + std::to_string(index) + ": " +
                       std::to_string(chunk.size_bytes) + " bytes");
        chunks.push_back(std::move(chunk));
        ++index;
    }

    core::LogInfo("Split into " + std::to_string(chunks.size()) + " chunks");
    return chunks;
}

}  // namespace assetup::upload
