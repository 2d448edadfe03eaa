#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#include "cokacenc/env.hpp"

namespace cokacenc::constants {

inline constexpr std::string_view kMagic = "COKACENC";
inline constexpr std::uint32_t kFormatVersion = 2;
inline constexpr std::size_t kMagicSize = 8;
inline constexpr std::size_t kSaltSize = 16;
inline constexpr std::size_t kIvSize = 16;
inline constexpr std::size_t kHeaderSize = kMagicSize + 4 + kSaltSize + kIvSize;
static_assert(kHeaderSize == 44, "Chunk header must be 44 bytes");

inline constexpr std::size_t kKeySize = 32;
inline constexpr std::size_t kBlockSize = 16;
inline constexpr std::uint32_t kKdfIterations = 100000;

inline constexpr std::size_t kMetaLengthSize = 4;
inline constexpr std::uint32_t kMaxMetadataLen = 1u << 20;

inline constexpr std::string_view kChunkExt = ".cokacenc";
inline constexpr std::size_t kGroupIdBytes = 8;
inline constexpr std::size_t kGroupIdHexLen = kGroupIdBytes * 2;
inline constexpr std::size_t kGroupIdMaxAttempts = 64;
inline constexpr std::size_t kSeqLabelLen = 4;
inline constexpr std::size_t kSeqRadix = 26;
inline constexpr std::size_t kMaxChunks = kSeqRadix * kSeqRadix * kSeqRadix * kSeqRadix;
inline constexpr std::size_t kMaxSeqIndex = kMaxChunks - 1;

inline constexpr std::string_view kUnpackTempSuffix = ".unpacking";

inline constexpr std::size_t kStreamBufferSize = 64u * 1024u;
inline constexpr std::uint64_t kDefaultSplitSizeMb = 1800;
inline constexpr std::uint64_t kBytesPerMb = 1024u * 1024u;
inline constexpr std::size_t kDefaultKeyLength = 64;

// Honors COKACENC_TEST_KDF_ITERS so test suites can run with a cheap KDF.
// Chunks written under an override only open under the same override.
inline std::uint32_t KdfIterations() {
    std::string raw = cokacenc::env::Get("COKACENC_TEST_KDF_ITERS");
    if (raw.empty()) {
        return kKdfIterations;
    }
    try {
        std::uint64_t parsed = static_cast<std::uint64_t>(std::stoull(raw));
        if (parsed == 0) {
            return kKdfIterations;
        }
        if (parsed > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return static_cast<std::uint32_t>(std::numeric_limits<int>::max());
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        return kKdfIterations;
    }
}

}  // namespace cokacenc::constants
