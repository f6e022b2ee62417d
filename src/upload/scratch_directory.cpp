#include "assetup/upload/scratch_directory.h"

#include <system_error>
#include <utility>

#include "assetup/core/logger.h"

namespace assetup::upload {

ScratchDirectory::ScratchDirectory(std::filesystem::path path) : path_(std::move(path)) {}

ScratchDirectory::~ScratchDirectory() { Cleanup(); }

bool ScratchDirectory::Create() {
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
        core::LogError("Cannot create scratch directory " + path_.string() + ": " + ec.message());
        return false;
    }
    created_ = true;
    return true;
}

void ScratchDirectory::Track(const std::filesystem::path& file) { files_.push_back(file); }

void ScratchDirectory::Cleanup() noexcept {
    if (released_) {
        return;
    }
    released_ = true;
    try {
        std::error_code ec;
        std::size_t failures = 0;
        for (const auto& file : files_) {
            std::filesystem::remove(file, ec);
            if (ec) {
                ++failures;
                core::LogError("Failed to remove chunk file " + file.string() + ": " +
                               ec.message());
            }
        }
        files_.clear();

        if (created_) {
            // remove() only deletes an empty directory; anything left behind stays.
            std::filesystem::remove(path_, ec);
            if (ec) {
                core::LogWarning("Scratch directory " + path_.string() +
                                 " not removed: " + ec.message());
            }
        }
        if (failures == 0) {
            core::LogDebug("Scratch directory " + path_.string() + " cleaned up");
        }
    } catch (const std::exception& ex) {
        core::LogError(std::string("Scratch cleanup failed: ") + ex.what());
    }
}

}  // namespace assetup::upload
