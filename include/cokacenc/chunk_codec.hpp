#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

#include "cokacenc/constants.hpp"
#include "cokacenc/crypto_utils.hpp"

namespace cokacenc::chunk {

using Bytes = std::vector<std::uint8_t>;

// Plaintext preamble of every chunk file:
//   [8B magic "COKACENC"][4B version LE][16B KDF salt][16B AES IV]
struct ChunkHeader {
    std::uint32_t version = constants::kFormatVersion;
    Bytes salt;
    Bytes iv;
};

// Fresh random salt and IV for one chunk.
ChunkHeader NewHeader();

Bytes EncodeHeader(const ChunkHeader& header);
ChunkHeader DecodeHeader(const std::uint8_t* data, std::size_t len);

void WriteHeader(std::ostream& out, const ChunkHeader& header);
ChunkHeader ReadHeader(std::istream& in);

// AES-256-CBC with PKCS#7 padding. Single use: after Finalize() the object
// only accepts destruction.
class Encryptor {
public:
    Encryptor(const Bytes& key, const Bytes& iv);

    Encryptor(const Encryptor&) = delete;
    Encryptor& operator=(const Encryptor&) = delete;

    Bytes Update(const std::uint8_t* data, std::size_t len);
    Bytes Update(const Bytes& data) { return Update(data.data(), data.size()); }
    Bytes Finalize();

private:
    crypto::detail::UniqueCipherCtx ctx_;
    bool finalized_ = false;
};

// Streaming counterpart of Encryptor. Update() withholds the last block so
// Finalize() can validate and strip the padding; a wrong key or a corrupted
// tail throws CryptoError there.
class Decryptor {
public:
    Decryptor(const Bytes& key, const Bytes& iv);

    Decryptor(const Decryptor&) = delete;
    Decryptor& operator=(const Decryptor&) = delete;

    Bytes Update(const std::uint8_t* data, std::size_t len);
    Bytes Update(const Bytes& data) { return Update(data.data(), data.size()); }
    Bytes Finalize();

private:
    crypto::detail::UniqueCipherCtx ctx_;
    bool finalized_ = false;
};

}  // namespace cokacenc::chunk
