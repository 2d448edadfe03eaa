#include "cokacenc/fsutil.hpp"

#include "cokacenc/errors.hpp"
#include "cokacenc/naming.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace cokacenc::fsutil {

CleanupList::~CleanupList() {
    Rollback();
}

void CleanupList::Track(const std::filesystem::path& path) {
    paths_.push_back(path);
}

void CleanupList::Release() noexcept {
    paths_.clear();
}

std::size_t CleanupList::Rollback() noexcept {
    std::size_t failures = 0;
    for (auto it = paths_.rbegin(); it != paths_.rend(); ++it) {
        std::error_code ec;
        std::filesystem::remove(*it, ec);
        if (ec) {
            ++failures;
        }
    }
    paths_.clear();
    return failures;
}

FileAttributes ReadAttributes(const std::filesystem::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        throw IoError("Failed to stat " + path.string() + ": " + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        throw IoError("Not a regular file: " + path.string());
    }
    FileAttributes attrs;
    attrs.size = static_cast<std::uint64_t>(st.st_size);
    attrs.modified = static_cast<std::int64_t>(st.st_mtime);
    attrs.permissions = static_cast<std::uint32_t>(st.st_mode & 07777);
    return attrs;
}

bool RestoreAttributes(const std::filesystem::path& path,
                       std::int64_t modified,
                       std::uint32_t permissions,
                       std::string* error) {
    bool ok = true;
    std::string message;
    if (::chmod(path.c_str(), static_cast<mode_t>(permissions & 07777)) != 0) {
        ok = false;
        message = std::string("chmod: ") + std::strerror(errno);
    }
    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = static_cast<time_t>(modified);
    times[1].tv_nsec = 0;
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        if (!message.empty()) {
            message += "; ";
        }
        ok = false;
        message += std::string("utimensat: ") + std::strerror(errno);
    }
    if (!ok && error) {
        *error = message;
    }
    return ok;
}

bool IsHiddenName(const std::string& name) {
    return !name.empty() && name.front() == '.';
}

std::vector<std::filesystem::path> ListPackableFiles(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw IoError("Failed to read directory " + dir.string() + ": " + ec.message());
    }
    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (IsHiddenName(name) || naming::HasChunkExtension(name)) {
            continue;
        }
        files.push_back(it->path());
    }
    if (ec) {
        throw IoError("Failed to read directory " + dir.string() + ": " + ec.message());
    }
    std::sort(files.begin(), files.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.filename().string() < rhs.filename().string();
    });
    return files;
}

bool IsPlainFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

std::uint64_t FileSize(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IoError("Failed to stat " + path.string() + ": " + ec.message());
    }
    return static_cast<std::uint64_t>(size);
}

}  // namespace cokacenc::fsutil
