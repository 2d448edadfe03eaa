#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "cokacenc/metadata.hpp"

namespace cokacenc::format {

using Bytes = std::vector<std::uint8_t>;

// Receives the file-data phase of a chunk's plaintext.
using DataSink = std::function<void(const std::uint8_t* data, std::size_t len)>;

// [4B metadata length LE][metadata JSON]. File data follows directly after
// this prefix inside the encrypted stream.
Bytes FrameMetadata(const std::string& metadata_json);
Bytes FrameMetadata(const metadata::ChunkMetadata& meta);

// Splits a decrypted chunk stream into its metadata record and file data.
// Input may arrive in spans of any size, down to a single byte.
class MetadataDemuxer {
public:
    enum class State {
        ReadingLength,
        ReadingBody,
        Forwarding
    };

    // An empty sink discards the data phase.
    explicit MetadataDemuxer(DataSink sink = {});

    void Feed(const std::uint8_t* data, std::size_t len);
    void Feed(const Bytes& data) { Feed(data.data(), data.size()); }

    State state() const noexcept { return state_; }
    bool HasMetadata() const noexcept { return state_ == State::Forwarding; }
    std::uint64_t ForwardedBytes() const noexcept { return forwarded_; }

    // Both throw IncompleteMetadataError until the record is complete.
    const std::string& MetadataJson() const;
    metadata::ChunkMetadata Metadata() const;

private:
    DataSink sink_;
    State state_ = State::ReadingLength;
    std::uint8_t length_buf_[4] = {0, 0, 0, 0};
    std::size_t length_have_ = 0;
    std::uint32_t body_len_ = 0;
    std::string body_;
    std::uint64_t forwarded_ = 0;
};

}  // namespace cokacenc::format
