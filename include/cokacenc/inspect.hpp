#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "cokacenc/chunk_codec.hpp"
#include "cokacenc/metadata.hpp"

namespace cokacenc::inspect {

struct ChunkInfo {
    std::filesystem::path path;
    std::uint64_t file_size = 0;  // size of the chunk file on disk
    chunk::ChunkHeader header;
    std::uint32_t metadata_len = 0;
    std::string metadata_json;
    metadata::ChunkMetadata metadata;
};

// Decrypts only as far as the metadata record. Read-only.
ChunkInfo InspectChunk(const std::filesystem::path& path, const std::string& password);

}  // namespace cokacenc::inspect
