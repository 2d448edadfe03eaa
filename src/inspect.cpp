#include "cokacenc/inspect.hpp"

#include "cokacenc/crypto.hpp"
#include "cokacenc/errors.hpp"
#include "cokacenc/format.hpp"
#include "cokacenc/fsutil.hpp"

#include <array>
#include <fstream>

namespace cokacenc::inspect {

ChunkInfo InspectChunk(const std::filesystem::path& path, const std::string& password) {
    ChunkInfo info;
    info.path = path;
    info.file_size = fsutil::FileSize(path);

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw IoError("Failed to open chunk: " + path.string());
    }
    info.header = chunk::ReadHeader(input);

    crypto::Bytes key = crypto::DeriveKey(password, info.header.salt);
    chunk::Decryptor decryptor(key, info.header.iv);
    crypto::detail::Cleanse(key);

    format::MetadataDemuxer demuxer;
    std::array<char, 4096> buffer{};
    while (!demuxer.HasMetadata()) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::size_t n = static_cast<std::size_t>(input.gcount());
        if (input.bad()) {
            throw IoError("Failed to read chunk: " + path.string());
        }
        if (n == 0) {
            // Short chunk: the padding check decides between a bad key and truncation.
            demuxer.Feed(decryptor.Finalize());
            break;
        }
        demuxer.Feed(decryptor.Update(reinterpret_cast<const std::uint8_t*>(buffer.data()), n));
    }

    info.metadata_json = demuxer.MetadataJson();
    info.metadata_len = static_cast<std::uint32_t>(info.metadata_json.size());
    info.metadata = demuxer.Metadata();
    return info;
}

}  // namespace cokacenc::inspect
