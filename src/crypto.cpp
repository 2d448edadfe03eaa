#include "cokacenc/crypto.hpp"

#include "cokacenc/constants.hpp"
#include "cokacenc/errors.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <limits>

namespace cokacenc::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw CryptoError(message);
    }
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(size <= static_cast<std::size_t>(std::numeric_limits<int>::max()), "RAND_bytes request too large");
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

Bytes Pbkdf2HmacSha512(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt.data(),
                             static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha512(),
                             static_cast<int>(out.size()), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

Bytes DeriveKey(const std::string& password, const Bytes& salt) {
    if (salt.size() != constants::kSaltSize) {
        throw CryptoError("Key derivation expects a 16-byte salt");
    }
    return Pbkdf2HmacSha512(password, salt, constants::KdfIterations(), constants::kKeySize);
}

std::string HexEncode(const std::uint8_t* data, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

std::string HexEncode(const Bytes& data) {
    return HexEncode(data.data(), data.size());
}

Md5Hasher::Md5Hasher() : ctx_(EVP_MD_CTX_new()) {
    Ensure(ctx_ != nullptr, "MD5 context allocation failed");
    Ensure(EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) == 1, "MD5 init failed");
}

void Md5Hasher::Update(const std::uint8_t* data, std::size_t len) {
    if (finalized_) {
        throw std::logic_error("Md5Hasher used after FinalHex");
    }
    if (len == 0) {
        return;
    }
    Ensure(EVP_DigestUpdate(ctx_.get(), data, len) == 1, "MD5 update failed");
}

std::string Md5Hasher::FinalHex() {
    if (finalized_) {
        throw std::logic_error("Md5Hasher finalized twice");
    }
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;
    Ensure(EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) == 1, "MD5 final failed");
    finalized_ = true;
    return HexEncode(out.data(), out_len);
}

}  // namespace cokacenc::crypto
