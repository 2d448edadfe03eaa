#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cokacenc::naming {

// Chunk files are named `<group_id 16hex>_<seq 4 letters>.cokacenc`.

// 0 -> "aaaa", 456975 -> "zzzz". Throws SeqOverflow past the last label.
std::string SeqLabel(std::size_t index);
std::optional<std::size_t> ParseSeqLabel(std::string_view label);

bool IsGroupId(std::string_view text);
bool HasChunkExtension(std::string_view filename);

std::string ChunkFileName(const std::string& group_id, std::size_t index);
std::filesystem::path ChunkPath(const std::filesystem::path& dir, const std::string& group_id, std::size_t index);

struct ChunkFileEntry {
    std::string group_id;
    std::size_t seq_index = 0;
    std::filesystem::path path;
};

// Names outside the grammar yield std::nullopt.
std::optional<ChunkFileEntry> ParseChunkFileName(const std::filesystem::path& path);

// group_id -> chunk files sorted by sequence index.
using GroupMap = std::map<std::string, std::vector<ChunkFileEntry>>;

// Non-recursive; only regular files that match the grammar are considered.
GroupMap GroupEncFiles(const std::filesystem::path& dir);

std::set<std::string> ExistingGroupIds(const std::filesystem::path& dir);

using CandidateSource = std::function<std::string()>;

std::string RandomGroupId();

// Random 8-byte hex id that no chunk in `dir` uses yet. Gives up with
// GroupIdExhaustedError after constants::kGroupIdMaxAttempts candidates.
std::string GenerateGroupId(const std::filesystem::path& dir);
std::string GenerateGroupId(const std::filesystem::path& dir, const CandidateSource& next_candidate);

}  // namespace cokacenc::naming
