#include "cokacenc/pack.hpp"

#include "cokacenc/chunk_codec.hpp"
#include "cokacenc/cli_colors.hpp"
#include "cokacenc/constants.hpp"
#include "cokacenc/crypto.hpp"
#include "cokacenc/errors.hpp"
#include "cokacenc/file_stream.hpp"
#include "cokacenc/format.hpp"
#include "cokacenc/fsutil.hpp"
#include "cokacenc/metadata.hpp"
#include "cokacenc/naming.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace cokacenc::pack {

namespace {

std::filesystem::path OutputDir(const std::filesystem::path& source) {
    std::filesystem::path dir = source.parent_path();
    return dir.empty() ? std::filesystem::path(".") : dir;
}

metadata::ChunkMetadata BuildMetadata(const std::string& group_id,
                                      const std::string& filename,
                                      const FileInfo& info,
                                      std::uint64_t total_chunks,
                                      std::uint64_t index,
                                      const ChunkSpan& span) {
    metadata::ChunkMetadata meta;
    meta.group_id = group_id;
    meta.filename = filename;
    meta.file_size = info.size;
    meta.md5 = info.md5;
    meta.modified = info.modified;
    meta.permissions = info.permissions;
    meta.total_chunks = total_chunks;
    meta.chunk_index = index;
    meta.chunk_offset = span.offset;
    meta.chunk_data_size = span.data_size;
    return meta;
}

template<typename Reader>
void WriteChunk(const std::filesystem::path& chunk_path,
                const std::string& password,
                const metadata::ChunkMetadata& meta,
                Reader& reader) {
    chunk::ChunkHeader header = chunk::NewHeader();
    crypto::Bytes key = crypto::DeriveKey(password, header.salt);
    chunk::Encryptor encryptor(key, header.iv);
    crypto::detail::Cleanse(key);

    filestream::BufferedFileWriter<> writer(chunk_path);
    writer.Write(chunk::EncodeHeader(header));
    writer.Write(encryptor.Update(format::FrameMetadata(meta)));

    std::uint64_t remaining = meta.chunk_data_size;
    while (remaining > 0) {
        auto [data, n] = reader.ReadChunk(remaining);
        if (n == 0) {
            throw IoError("Source file shrank while packing: " + reader.Path().string());
        }
        writer.Write(encryptor.Update(data, n));
        remaining -= n;
    }
    writer.Write(encryptor.Finalize());
    writer.Close();
}

}  // namespace

std::uint64_t TotalChunks(std::uint64_t file_size, std::uint64_t split_size) {
    if (split_size == 0 || file_size == 0) {
        return 1;
    }
    return file_size / split_size + (file_size % split_size != 0 ? 1 : 0);
}

ChunkSpan PlanChunk(std::uint64_t index, std::uint64_t file_size, std::uint64_t split_size) {
    ChunkSpan span;
    if (split_size == 0) {
        span.offset = 0;
        span.data_size = file_size;
        return span;
    }
    span.offset = index * split_size;
    span.data_size = span.offset >= file_size ? 0 : std::min(split_size, file_size - span.offset);
    return span;
}

FileInfo GatherFileInfo(const std::filesystem::path& source, bool compute_hash) {
    fsutil::FileAttributes attrs = fsutil::ReadAttributes(source);
    FileInfo info;
    info.size = attrs.size;
    info.modified = attrs.modified;
    info.permissions = attrs.permissions;
    if (!compute_hash) {
        return info;
    }
    crypto::Md5Hasher hasher;
    filestream::BufferedFileReader<> reader(source);
    while (true) {
        auto [data, n] = reader.ReadChunk();
        if (n == 0) {
            break;
        }
        hasher.Update(data, n);
    }
    if (reader.BytesRead() != info.size) {
        throw IoError("Source file changed while hashing: " + source.string());
    }
    info.md5 = hasher.FinalHex();
    return info;
}

PackResult PackFile(const std::filesystem::path& source, const std::string& password, const Options& options) {
    return PackFile(source, password, options, naming::RandomGroupId);
}

PackResult PackFile(const std::filesystem::path& source,
                    const std::string& password,
                    const Options& options,
                    const naming::CandidateSource& next_group_id) {
    const std::filesystem::path out_dir = OutputDir(source);
    const std::string filename = source.filename().string();

    PackResult result;
    result.source = source;
    result.info = GatherFileInfo(source, options.compute_hash);

    const std::uint64_t total_chunks = TotalChunks(result.info.size, options.split_size);
    if (total_chunks > constants::kMaxChunks) {
        throw SeqOverflow(static_cast<std::size_t>(total_chunks - 1));
    }
    result.group_id = naming::GenerateGroupId(out_dir, next_group_id);

    fsutil::CleanupList created;
    filestream::BufferedFileReader<> reader(source);
    for (std::uint64_t index = 0; index < total_chunks; ++index) {
        ChunkSpan span = PlanChunk(index, result.info.size, options.split_size);
        metadata::ChunkMetadata meta =
            BuildMetadata(result.group_id, filename, result.info, total_chunks, index, span);
        std::filesystem::path chunk_path = naming::ChunkPath(out_dir, result.group_id, static_cast<std::size_t>(index));
        std::error_code ec;
        if (std::filesystem::exists(chunk_path, ec)) {
            throw ConfigError("Refusing to overwrite existing chunk " + chunk_path.string());
        }
        created.Track(chunk_path);
        WriteChunk(chunk_path, password, meta, reader);
        result.chunks.push_back(chunk_path);
    }
    if (reader.ReadChunk(1).second != 0) {
        throw IoError("Source file grew while packing: " + source.string());
    }
    created.Release();

    if (options.delete_original) {
        std::error_code ec;
        std::filesystem::remove(source, ec);
        if (ec) {
            throw IoError("Packed, but failed to delete original " + source.string() + ": " + ec.message());
        }
    }
    return result;
}

std::vector<PackResult> PackDirectory(const std::filesystem::path& dir,
                                      const std::string& password,
                                      const Options& options,
                                      std::ostream& out) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        throw IoError("Not a directory: " + dir.string());
    }
    std::vector<PackResult> results;
    std::vector<std::filesystem::path> files = fsutil::ListPackableFiles(dir);
    if (files.empty()) {
        out << "No files to pack in " << dir.string() << "\n";
        return results;
    }
    for (const auto& path : files) {
        cli::Step(out, "Packing", path.filename().string());
        PackResult result = PackFile(path, password, options);
        std::string line = std::to_string(result.chunks.size()) + " chunk(s), group " + result.group_id + ", "
                           + cli::FormatSize(result.info.size);
        if (!result.info.md5.empty()) {
            line += ", MD5 " + result.info.md5;
        }
        cli::Detail(out, line);
        if (options.delete_original) {
            cli::Detail(out, "original deleted");
        }
        results.push_back(std::move(result));
    }
    return results;
}

}  // namespace cokacenc::pack
