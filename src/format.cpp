#include "cokacenc/format.hpp"

#include "cokacenc/constants.hpp"
#include "cokacenc/errors.hpp"

#include <algorithm>

namespace cokacenc::format {

Bytes FrameMetadata(const std::string& metadata_json) {
    if (metadata_json.size() > constants::kMaxMetadataLen) {
        throw MetadataInconsistency("Chunk metadata exceeds " + std::to_string(constants::kMaxMetadataLen) + " bytes");
    }
    std::uint32_t len = static_cast<std::uint32_t>(metadata_json.size());
    Bytes out;
    out.reserve(constants::kMetaLengthSize + metadata_json.size());
    out.push_back(static_cast<std::uint8_t>(len & 0xFF));
    out.push_back(static_cast<std::uint8_t>((len >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((len >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((len >> 24) & 0xFF));
    out.insert(out.end(), metadata_json.begin(), metadata_json.end());
    return out;
}

Bytes FrameMetadata(const metadata::ChunkMetadata& meta) {
    return FrameMetadata(metadata::Encode(meta));
}

MetadataDemuxer::MetadataDemuxer(DataSink sink) : sink_(std::move(sink)) {}

void MetadataDemuxer::Feed(const std::uint8_t* data, std::size_t len) {
    std::size_t offset = 0;
    while (offset < len) {
        switch (state_) {
            case State::ReadingLength: {
                std::size_t take = std::min(len - offset, constants::kMetaLengthSize - length_have_);
                std::copy(data + offset, data + offset + take, length_buf_ + length_have_);
                length_have_ += take;
                offset += take;
                if (length_have_ == constants::kMetaLengthSize) {
                    body_len_ = static_cast<std::uint32_t>(length_buf_[0])
                                | (static_cast<std::uint32_t>(length_buf_[1]) << 8)
                                | (static_cast<std::uint32_t>(length_buf_[2]) << 16)
                                | (static_cast<std::uint32_t>(length_buf_[3]) << 24);
                    if (body_len_ > constants::kMaxMetadataLen) {
                        throw MetadataInconsistency("Declared metadata length " + std::to_string(body_len_)
                                                    + " exceeds limit (wrong key or corrupted chunk)");
                    }
                    body_.reserve(body_len_);
                    state_ = body_len_ == 0 ? State::Forwarding : State::ReadingBody;
                }
                break;
            }
            case State::ReadingBody: {
                std::size_t take = std::min<std::size_t>(len - offset, body_len_ - body_.size());
                body_.append(reinterpret_cast<const char*>(data + offset), take);
                offset += take;
                if (body_.size() == body_len_) {
                    state_ = State::Forwarding;
                }
                break;
            }
            case State::Forwarding: {
                std::size_t take = len - offset;
                if (sink_) {
                    sink_(data + offset, take);
                }
                forwarded_ += take;
                offset = len;
                break;
            }
        }
    }
}

const std::string& MetadataDemuxer::MetadataJson() const {
    if (state_ != State::Forwarding) {
        throw IncompleteMetadataError("Chunk ended before its metadata record was complete");
    }
    return body_;
}

metadata::ChunkMetadata MetadataDemuxer::Metadata() const {
    return metadata::Decode(MetadataJson());
}

}  // namespace cokacenc::format
