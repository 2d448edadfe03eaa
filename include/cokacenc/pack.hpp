#pragma once

#include "cokacenc/naming.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace cokacenc::pack {

struct Options {
    std::uint64_t split_size = 0;  // bytes per chunk; 0 keeps the file in one chunk
    bool delete_original = false;
    bool compute_hash = false;
};

// Pass-1 result, shared by every chunk's metadata.
struct FileInfo {
    std::uint64_t size = 0;
    std::string md5;  // empty unless Options::compute_hash
    std::int64_t modified = 0;
    std::uint32_t permissions = 0;
};

struct ChunkSpan {
    std::uint64_t offset = 0;
    std::uint64_t data_size = 0;
};

struct PackResult {
    std::filesystem::path source;
    std::string group_id;
    FileInfo info;
    std::vector<std::filesystem::path> chunks;
};

// max(1, ceil(file_size / split_size)); split_size 0 -> 1.
std::uint64_t TotalChunks(std::uint64_t file_size, std::uint64_t split_size);
ChunkSpan PlanChunk(std::uint64_t index, std::uint64_t file_size, std::uint64_t split_size);

FileInfo GatherFileInfo(const std::filesystem::path& source, bool compute_hash);

// Encrypts `source` into chunk files next to it. On any failure every chunk
// created so far is removed and the source is left untouched.
PackResult PackFile(const std::filesystem::path& source, const std::string& password, const Options& options);
PackResult PackFile(const std::filesystem::path& source,
                    const std::string& password,
                    const Options& options,
                    const naming::CandidateSource& next_group_id);

// Packs every regular, non-hidden, non-chunk file of `dir` in name order.
// Stops at the first failing file.
std::vector<PackResult> PackDirectory(const std::filesystem::path& dir,
                                      const std::string& password,
                                      const Options& options,
                                      std::ostream& out = std::cout);

}  // namespace cokacenc::pack
