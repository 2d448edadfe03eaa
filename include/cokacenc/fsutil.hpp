#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cokacenc::fsutil {

// Paths created by one unit of work. Anything still tracked when the list is
// destroyed is removed; Release() hands the files over once the unit commits.
class CleanupList {
public:
    CleanupList() = default;
    ~CleanupList();

    CleanupList(const CleanupList&) = delete;
    CleanupList& operator=(const CleanupList&) = delete;

    void Track(const std::filesystem::path& path);
    void Release() noexcept;
    // Removes every tracked path now; returns how many removals failed.
    std::size_t Rollback() noexcept;

    const std::vector<std::filesystem::path>& Paths() const noexcept { return paths_; }

private:
    std::vector<std::filesystem::path> paths_;
};

struct FileAttributes {
    std::uint64_t size = 0;
    std::int64_t modified = 0;     // unix seconds
    std::uint32_t permissions = 0;  // low 12 mode bits
};

FileAttributes ReadAttributes(const std::filesystem::path& path);

// Best effort: returns false and fills `error` instead of throwing.
bool RestoreAttributes(const std::filesystem::path& path,
                       std::int64_t modified,
                       std::uint32_t permissions,
                       std::string* error = nullptr);

bool IsHiddenName(const std::string& name);

// Regular, non-hidden files of `dir` that are not chunk files, sorted by name.
std::vector<std::filesystem::path> ListPackableFiles(const std::filesystem::path& dir);

// A declared original filename must stay inside the target directory.
bool IsPlainFileName(const std::string& name);

std::uint64_t FileSize(const std::filesystem::path& path);

}  // namespace cokacenc::fsutil
