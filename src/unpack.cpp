#include "cokacenc/unpack.hpp"

#include "cokacenc/chunk_codec.hpp"
#include "cokacenc/cli_colors.hpp"
#include "cokacenc/constants.hpp"
#include "cokacenc/crypto.hpp"
#include "cokacenc/errors.hpp"
#include "cokacenc/file_stream.hpp"
#include "cokacenc/format.hpp"
#include "cokacenc/fsutil.hpp"

#include <array>
#include <system_error>
#include <utility>

namespace cokacenc::unpack {

namespace {

using filestream::BufferedFileReader;
using filestream::BufferedFileWriter;

chunk::ChunkHeader ReadChunkHeader(BufferedFileReader<>& reader) {
    std::array<std::uint8_t, constants::kHeaderSize> raw{};
    std::size_t have = 0;
    while (have < raw.size()) {
        std::size_t n = reader.ReadChunk(raw.data() + have, raw.size() - have);
        if (n == 0) {
            break;
        }
        have += n;
    }
    if (have < raw.size()) {
        throw FormatError("Chunk header truncated: " + reader.Path().string());
    }
    return chunk::DecodeHeader(raw.data(), raw.size());
}

void RequireSame(bool same, const char* field, const std::filesystem::path& chunk_path) {
    if (!same) {
        throw MetadataInconsistency("Chunk " + chunk_path.filename().string() + " disagrees with its group on "
                                    + field);
    }
}

// Fields every chunk of a group repeats.
void CheckAgainstFirst(const metadata::ChunkMetadata& first,
                       const metadata::ChunkMetadata& meta,
                       const std::filesystem::path& chunk_path) {
    RequireSame(meta.filename == first.filename, "filename", chunk_path);
    RequireSame(meta.md5 == first.md5, "md5", chunk_path);
    RequireSame(meta.file_size == first.file_size, "file_size", chunk_path);
    RequireSame(meta.modified == first.modified, "modified", chunk_path);
    RequireSame(meta.permissions == first.permissions, "permissions", chunk_path);
    RequireSame(meta.total_chunks == first.total_chunks, "total_chunks", chunk_path);
}

void CheckFirstChunk(const std::filesystem::path& dir,
                     const std::string& group_id,
                     const metadata::ChunkMetadata& meta,
                     std::size_t file_count,
                     const Options& options) {
    if (meta.version != constants::kFormatVersion) {
        throw MetadataInconsistency("Group " + group_id + " uses unsupported metadata version "
                                    + std::to_string(meta.version));
    }
    if (!fsutil::IsPlainFileName(meta.filename)) {
        throw MetadataInconsistency("Group " + group_id + " declares an unsafe filename: " + meta.filename);
    }
    if (meta.total_chunks == 0 || meta.total_chunks > constants::kMaxChunks) {
        throw MetadataInconsistency("Group " + group_id + " declares an invalid chunk count");
    }
    if (meta.total_chunks < file_count) {
        throw MetadataInconsistency("Group " + group_id + " has " + std::to_string(file_count)
                                    + " chunk files but declares " + std::to_string(meta.total_chunks));
    }
    if (meta.total_chunks > file_count) {
        throw MissingChunkError(group_id, naming::SeqLabel(file_count));
    }
    std::error_code ec;
    if (!options.overwrite && std::filesystem::exists(dir / meta.filename, ec)) {
        throw ConfigError("Output file already exists: " + (dir / meta.filename).string()
                          + " (use --force to overwrite)");
    }
}

}  // namespace

std::filesystem::path TempPath(const std::filesystem::path& dir, const std::string& group_id) {
    return dir / ("." + group_id + std::string(constants::kUnpackTempSuffix));
}

UnpackResult UnpackGroup(const std::filesystem::path& dir,
                         const std::string& group_id,
                         const std::vector<naming::ChunkFileEntry>& files,
                         const std::string& password,
                         const Options& options,
                         std::ostream& out) {
    if (files.empty()) {
        throw MissingChunkError(group_id, naming::SeqLabel(0));
    }
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (files[i].seq_index != i) {
            throw MissingChunkError(group_id, naming::SeqLabel(i));
        }
    }

    UnpackResult result;
    result.group_id = group_id;

    const std::filesystem::path temp_path = TempPath(dir, group_id);
    fsutil::CleanupList scratch;
    scratch.Track(temp_path);
    BufferedFileWriter<> writer(temp_path);
    crypto::Md5Hasher hasher;
    std::uint64_t merged = 0;

    for (std::size_t i = 0; i < files.size(); ++i) {
        const std::filesystem::path& chunk_path = files[i].path;
        BufferedFileReader<> reader(chunk_path);
        chunk::ChunkHeader header = ReadChunkHeader(reader);
        crypto::Bytes key = crypto::DeriveKey(password, header.salt);
        chunk::Decryptor decryptor(key, header.iv);
        crypto::detail::Cleanse(key);

        format::MetadataDemuxer demuxer([&](const std::uint8_t* data, std::size_t len) {
            writer.Write(data, len);
            hasher.Update(data, len);
        });
        while (true) {
            auto [data, n] = reader.ReadChunk();
            if (n == 0) {
                break;
            }
            demuxer.Feed(decryptor.Update(data, n));
        }
        demuxer.Feed(decryptor.Finalize());

        metadata::ChunkMetadata meta = demuxer.Metadata();
        if (meta.group_id != group_id) {
            throw MetadataInconsistency("Chunk " + chunk_path.filename().string() + " belongs to group "
                                        + meta.group_id);
        }
        if (meta.chunk_index != i) {
            throw MetadataInconsistency("Chunk " + chunk_path.filename().string() + " declares index "
                                        + std::to_string(meta.chunk_index) + ", expected " + std::to_string(i));
        }
        if (i == 0) {
            CheckFirstChunk(dir, group_id, meta, files.size(), options);
            result.metadata = meta;
        } else {
            CheckAgainstFirst(result.metadata, meta, chunk_path);
        }
        if (meta.chunk_offset != merged) {
            throw IntegrityError("Chunk " + chunk_path.filename().string() + " starts at offset "
                                 + std::to_string(meta.chunk_offset) + ", expected " + std::to_string(merged));
        }
        if (demuxer.ForwardedBytes() != meta.chunk_data_size) {
            throw IntegrityError("Chunk " + chunk_path.filename().string() + " carries "
                                 + std::to_string(demuxer.ForwardedBytes()) + " bytes, declares "
                                 + std::to_string(meta.chunk_data_size));
        }
        merged += meta.chunk_data_size;
    }
    writer.Close();

    const metadata::ChunkMetadata& first = result.metadata;
    if (writer.BytesWritten() != first.file_size) {
        throw IntegrityError("Merged size " + std::to_string(writer.BytesWritten()) + " does not match declared size "
                             + std::to_string(first.file_size) + " for " + first.filename);
    }
    std::string digest = hasher.FinalHex();
    if (!first.md5.empty()) {
        if (digest != first.md5) {
            throw IntegrityError("MD5 mismatch for " + first.filename + ": expected " + first.md5 + ", got "
                                 + digest);
        }
        result.hash_verified = true;
    }

    result.output = dir / first.filename;
    std::error_code ec;
    if (!options.overwrite && std::filesystem::exists(result.output, ec)) {
        throw ConfigError("Output file already exists: " + result.output.string() + " (use --force to overwrite)");
    }
    std::filesystem::rename(temp_path, result.output, ec);
    if (ec) {
        throw IoError("Failed to move " + temp_path.string() + " to " + result.output.string() + ": "
                      + ec.message());
    }
    scratch.Release();

    std::string attr_error;
    if (!fsutil::RestoreAttributes(result.output, first.modified, first.permissions, &attr_error)) {
        cli::Warn(out, "could not restore attributes of " + first.filename + ": " + attr_error);
    }

    if (options.delete_chunks) {
        for (const auto& entry : files) {
            std::filesystem::remove(entry.path, ec);
            if (ec) {
                throw IoError("Restored " + first.filename + ", but failed to delete chunk " + entry.path.string()
                              + ": " + ec.message());
            }
        }
    }
    return result;
}

std::vector<UnpackResult> UnpackDirectory(const std::filesystem::path& dir,
                                          const std::string& password,
                                          const Options& options,
                                          std::ostream& out) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        throw IoError("Not a directory: " + dir.string());
    }
    std::vector<UnpackResult> results;
    naming::GroupMap groups = naming::GroupEncFiles(dir);
    if (groups.empty()) {
        out << "No chunk files to unpack in " << dir.string() << "\n";
        return results;
    }
    for (const auto& [group_id, files] : groups) {
        cli::Step(out, "Unpacking", group_id);
        UnpackResult result = UnpackGroup(dir, group_id, files, password, options, out);
        std::string line = result.metadata.filename + " (" + cli::FormatSize(result.metadata.file_size) + ", "
                           + std::to_string(files.size()) + " chunk(s))";
        if (result.hash_verified) {
            line += ", " + cli::Green("MD5 verified", out);
        }
        cli::Detail(out, line);
        if (options.delete_chunks) {
            cli::Detail(out, "chunks deleted");
        }
        results.push_back(std::move(result));
    }
    return results;
}

}  // namespace cokacenc::unpack
