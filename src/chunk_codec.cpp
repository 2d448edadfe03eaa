#include "cokacenc/chunk_codec.hpp"

#include "cokacenc/crypto.hpp"
#include "cokacenc/errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

namespace cokacenc::chunk {

namespace {

void PutU32Le(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

std::uint32_t GetU32Le(const std::uint8_t* ptr) {
    return static_cast<std::uint32_t>(ptr[0])
           | (static_cast<std::uint32_t>(ptr[1]) << 8)
           | (static_cast<std::uint32_t>(ptr[2]) << 16)
           | (static_cast<std::uint32_t>(ptr[3]) << 24);
}

void CheckKeyIv(const Bytes& key, const Bytes& iv) {
    if (key.size() != constants::kKeySize) {
        throw CryptoError("AES-256-CBC expects 32-byte key");
    }
    if (iv.size() != constants::kIvSize) {
        throw CryptoError("AES-256-CBC expects 16-byte IV");
    }
}

int CheckedLen(std::size_t len) {
    // Leave room for the block EVP may append to the output.
    if (len > static_cast<std::size_t>(std::numeric_limits<int>::max()) - constants::kBlockSize) {
        throw CryptoError("Cipher update too large");
    }
    return static_cast<int>(len);
}

}  // namespace

ChunkHeader NewHeader() {
    ChunkHeader header;
    header.salt = crypto::RandomBytes(constants::kSaltSize);
    header.iv = crypto::RandomBytes(constants::kIvSize);
    return header;
}

Bytes EncodeHeader(const ChunkHeader& header) {
    if (header.salt.size() != constants::kSaltSize || header.iv.size() != constants::kIvSize) {
        throw FormatError("Chunk header salt/IV must be 16 bytes each");
    }
    Bytes out;
    out.reserve(constants::kHeaderSize);
    out.insert(out.end(), constants::kMagic.begin(), constants::kMagic.end());
    PutU32Le(out, header.version);
    out.insert(out.end(), header.salt.begin(), header.salt.end());
    out.insert(out.end(), header.iv.begin(), header.iv.end());
    return out;
}

ChunkHeader DecodeHeader(const std::uint8_t* data, std::size_t len) {
    if (len < constants::kHeaderSize) {
        throw FormatError("Chunk header truncated");
    }
    if (!std::equal(constants::kMagic.begin(), constants::kMagic.end(), data,
                    [](char lhs, std::uint8_t rhs) { return static_cast<std::uint8_t>(lhs) == rhs; })) {
        throw FormatError("Not a cokacenc chunk (bad magic)");
    }
    ChunkHeader header;
    header.version = GetU32Le(data + constants::kMagicSize);
    if (header.version != constants::kFormatVersion) {
        throw FormatError("Unsupported chunk format version " + std::to_string(header.version));
    }
    const std::uint8_t* salt = data + constants::kMagicSize + 4;
    const std::uint8_t* iv = salt + constants::kSaltSize;
    header.salt.assign(salt, salt + constants::kSaltSize);
    header.iv.assign(iv, iv + constants::kIvSize);
    return header;
}

void WriteHeader(std::ostream& out, const ChunkHeader& header) {
    Bytes encoded = EncodeHeader(header);
    out.write(reinterpret_cast<const char*>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
    if (!out) {
        throw IoError("Failed to write chunk header");
    }
}

ChunkHeader ReadHeader(std::istream& in) {
    std::array<std::uint8_t, constants::kHeaderSize> buffer{};
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    std::size_t got = static_cast<std::size_t>(in.gcount());
    if (got != buffer.size()) {
        throw FormatError("Chunk header truncated (" + std::to_string(got) + " of 44 bytes)");
    }
    return DecodeHeader(buffer.data(), buffer.size());
}

Encryptor::Encryptor(const Bytes& key, const Bytes& iv) : ctx_(EVP_CIPHER_CTX_new()) {
    CheckKeyIv(key, iv);
    if (!ctx_) {
        throw CryptoError("AES-CBC context allocation failed");
    }
    if (EVP_EncryptInit_ex(ctx_.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw CryptoError("AES-CBC encrypt init failed");
    }
}

Bytes Encryptor::Update(const std::uint8_t* data, std::size_t len) {
    if (finalized_) {
        throw std::logic_error("Encryptor used after Finalize");
    }
    if (len == 0) {
        return {};
    }
    Bytes out(len + constants::kBlockSize);
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx_.get(), out.data(), &out_len, data, CheckedLen(len)) != 1) {
        throw CryptoError("AES-CBC encrypt failed");
    }
    out.resize(static_cast<std::size_t>(out_len));
    return out;
}

Bytes Encryptor::Finalize() {
    if (finalized_) {
        throw std::logic_error("Encryptor finalized twice");
    }
    finalized_ = true;
    Bytes out(constants::kBlockSize);
    int out_len = 0;
    if (EVP_EncryptFinal_ex(ctx_.get(), out.data(), &out_len) != 1) {
        throw CryptoError("AES-CBC final failed");
    }
    out.resize(static_cast<std::size_t>(out_len));
    return out;
}

Decryptor::Decryptor(const Bytes& key, const Bytes& iv) : ctx_(EVP_CIPHER_CTX_new()) {
    CheckKeyIv(key, iv);
    if (!ctx_) {
        throw CryptoError("AES-CBC context allocation failed");
    }
    if (EVP_DecryptInit_ex(ctx_.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw CryptoError("AES-CBC decrypt init failed");
    }
}

Bytes Decryptor::Update(const std::uint8_t* data, std::size_t len) {
    if (finalized_) {
        throw std::logic_error("Decryptor used after Finalize");
    }
    if (len == 0) {
        return {};
    }
    Bytes out(len + constants::kBlockSize);
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx_.get(), out.data(), &out_len, data, CheckedLen(len)) != 1) {
        throw CryptoError("AES-CBC decrypt failed");
    }
    out.resize(static_cast<std::size_t>(out_len));
    return out;
}

Bytes Decryptor::Finalize() {
    if (finalized_) {
        throw std::logic_error("Decryptor finalized twice");
    }
    finalized_ = true;
    Bytes out(constants::kBlockSize);
    int out_len = 0;
    if (EVP_DecryptFinal_ex(ctx_.get(), out.data(), &out_len) != 1) {
        throw CryptoError("Decryption failed: bad padding (wrong key or corrupted chunk)");
    }
    out.resize(static_cast<std::size_t>(out_len));
    return out;
}

}  // namespace cokacenc::chunk
