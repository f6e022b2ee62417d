#pragma once

#include <filesystem>
#include <vector>

namespace assetup::upload {

/// @brief Owns the chunk scratch directory for one upload and removes it on every exit path.
///
/// Only files registered with Track() are deleted; the directory itself is
/// removed afterwards if nothing else is left in it. Cleanup failures are logged
/// and never thrown.
class ScratchDirectory {
public:
    explicit ScratchDirectory(std::filesystem::path path);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    /// @brief Creates the directory if missing. Returns false (and logs) on failure.
    bool Create();
    void Track(const std::filesystem::path& file);
    /// @brief Removes tracked files and the empty directory. Safe to call more than once.
    void Cleanup() noexcept;

    const std::filesystem::path& path() const { return path_; }
    std::size_t tracked_count() const { return files_.size(); }

private:
    std::filesystem::path path_;
    std::vector<std::filesystem::path> files_;
    bool created_{false};
    bool released_{false};
};

}  // namespace assetup::upload
