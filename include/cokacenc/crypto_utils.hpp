#pragma once

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace cokacenc::crypto::detail {

// RAII wrappers for OpenSSL resources
struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

struct EVPMDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;
using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, EVPMDCtxDeleter>;

// Best-effort wipe of key material before the buffer is released.
inline void Cleanse(std::vector<std::uint8_t>& buffer) noexcept {
    if (!buffer.empty()) {
        OPENSSL_cleanse(buffer.data(), buffer.size());
    }
}

}  // namespace cokacenc::crypto::detail
