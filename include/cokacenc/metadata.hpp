#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "cokacenc/constants.hpp"

namespace cokacenc::metadata {

// Provenance record embedded at the front of every chunk's plaintext. Every
// chunk of a group carries the same file-level fields; only the chunk_* fields
// differ.
struct ChunkMetadata {
    std::uint32_t version = constants::kFormatVersion;
    std::string group_id;
    std::string filename;
    std::uint64_t file_size = 0;
    std::string md5;  // empty = not computed
    std::int64_t modified = 0;
    std::uint32_t permissions = 0;
    std::uint64_t total_chunks = 0;
    std::uint64_t chunk_index = 0;
    std::uint64_t chunk_offset = 0;
    std::uint64_t chunk_data_size = 0;
};

// Serializes to a compact JSON object.
std::string Encode(const ChunkMetadata& meta);

// Parses a JSON object produced by Encode(). Keys this build does not know are
// skipped whatever their type. Throws MetadataInconsistency on malformed input
// or a missing required field.
ChunkMetadata Decode(std::string_view json);

}  // namespace cokacenc::metadata
