#pragma once

#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "cokacenc/metadata.hpp"
#include "cokacenc/naming.hpp"

namespace cokacenc::unpack {

struct Options {
    bool delete_chunks = false;
    bool overwrite = false;
};

struct UnpackResult {
    std::string group_id;
    std::filesystem::path output;
    metadata::ChunkMetadata metadata;  // chunk 0's record
    bool hash_verified = false;
};

// Hidden scratch file a group is merged into before the final rename.
std::filesystem::path TempPath(const std::filesystem::path& dir, const std::string& group_id);

// Decrypts and merges one group. `files` must be sorted by sequence index
// (as GroupEncFiles returns them). Nothing is left behind on failure: the
// temp file is removed and no output file appears.
UnpackResult UnpackGroup(const std::filesystem::path& dir,
                         const std::string& group_id,
                         const std::vector<naming::ChunkFileEntry>& files,
                         const std::string& password,
                         const Options& options,
                         std::ostream& out = std::cout);

// Restores every group in `dir` in group_id order. Stops at the first failure.
std::vector<UnpackResult> UnpackDirectory(const std::filesystem::path& dir,
                                          const std::string& password,
                                          const Options& options,
                                          std::ostream& out = std::cout);

}  // namespace cokacenc::unpack
