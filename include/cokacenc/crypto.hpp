#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "cokacenc/crypto_utils.hpp"

namespace cokacenc::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);
Bytes Pbkdf2HmacSha512(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length);

// Per-chunk key: PBKDF2-HMAC-SHA512 over the trimmed password and the chunk's salt.
Bytes DeriveKey(const std::string& password, const Bytes& salt);

std::string HexEncode(const std::uint8_t* data, std::size_t len);
std::string HexEncode(const Bytes& data);

// Incremental MD5 used for the end-to-end content hash.
class Md5Hasher {
public:
    Md5Hasher();

    void Update(const std::uint8_t* data, std::size_t len);
    void Update(const Bytes& data) { Update(data.data(), data.size()); }
    std::string FinalHex();

private:
    detail::UniqueMDCtx ctx_;
    bool finalized_ = false;
};

}  // namespace cokacenc::crypto
