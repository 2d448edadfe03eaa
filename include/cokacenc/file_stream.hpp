#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

#include "cokacenc/constants.hpp"
#include "cokacenc/errors.hpp"

namespace cokacenc::filestream {

constexpr std::size_t kDefaultChunkSize = constants::kStreamBufferSize;

// Sequential binary reader over a fixed-size buffer.
template<std::size_t ChunkSize = kDefaultChunkSize>
class BufferedFileReader {
public:
    explicit BufferedFileReader(const std::filesystem::path& path)
        : path_(path), input_(path, std::ios::binary) {
        if (!input_) {
            throw IoError("Failed to open file for reading: " + path.string());
        }
    }

    // Returns 0 only at end of file.
    std::size_t ReadChunk(std::uint8_t* buffer, std::size_t max_size) {
        if (max_size == 0 || input_.eof()) {
            return 0;
        }
        input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_size));
        std::size_t bytes_read = static_cast<std::size_t>(input_.gcount());
        if (input_.bad() || (input_.fail() && !input_.eof())) {
            throw IoError("Failed to read file: " + path_.string());
        }
        bytes_read_ += bytes_read;
        return bytes_read;
    }

    std::pair<const std::uint8_t*, std::size_t> ReadChunk() {
        std::size_t n = ReadChunk(chunk_.data(), chunk_.size());
        return {chunk_.data(), n};
    }

    // Like ReadChunk() but never crosses `limit` bytes.
    std::pair<const std::uint8_t*, std::size_t> ReadChunk(std::uint64_t limit) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(limit, chunk_.size()));
        std::size_t n = ReadChunk(chunk_.data(), want);
        return {chunk_.data(), n};
    }

    std::uint64_t BytesRead() const noexcept { return bytes_read_; }
    const std::filesystem::path& Path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream input_;
    std::array<std::uint8_t, ChunkSize> chunk_;
    std::uint64_t bytes_read_ = 0;
};

// Buffered binary writer. Nothing is guaranteed on disk until Close()
// returns; a writer destroyed without Close() may drop buffered bytes.
template<std::size_t ChunkSize = kDefaultChunkSize>
class BufferedFileWriter {
public:
    explicit BufferedFileWriter(const std::filesystem::path& path)
        : path_(path), output_(path, std::ios::binary | std::ios::trunc) {
        if (!output_) {
            throw IoError("Failed to open file for writing: " + path.string());
        }
    }

    void Write(const std::uint8_t* data, std::size_t size) {
        std::size_t offset = 0;
        while (offset < size) {
            std::size_t available = chunk_.size() - buffer_pos_;
            std::size_t to_copy = std::min(available, size - offset);

            std::memcpy(chunk_.data() + buffer_pos_, data + offset, to_copy);
            buffer_pos_ += to_copy;
            offset += to_copy;

            if (buffer_pos_ == chunk_.size()) {
                FlushBuffer();
            }
        }
        bytes_written_ += size;
    }

    void Write(const std::vector<std::uint8_t>& data) {
        Write(data.data(), data.size());
    }

    void Flush() {
        FlushBuffer();
        output_.flush();
        if (!output_) {
            throw IoError("Failed to flush file: " + path_.string());
        }
    }

    void Close() {
        Flush();
        output_.close();
        if (output_.fail()) {
            throw IoError("Failed to close file: " + path_.string());
        }
    }

    std::uint64_t BytesWritten() const noexcept { return bytes_written_; }
    const std::filesystem::path& Path() const noexcept { return path_; }

private:
    void FlushBuffer() {
        if (buffer_pos_ > 0) {
            output_.write(reinterpret_cast<const char*>(chunk_.data()),
                          static_cast<std::streamsize>(buffer_pos_));
            if (!output_) {
                throw IoError("Failed to write to file: " + path_.string());
            }
            buffer_pos_ = 0;
        }
    }

    std::filesystem::path path_;
    std::ofstream output_;
    std::array<std::uint8_t, ChunkSize> chunk_;
    std::size_t buffer_pos_ = 0;
    std::uint64_t bytes_written_ = 0;
};

}  // namespace cokacenc::filestream
