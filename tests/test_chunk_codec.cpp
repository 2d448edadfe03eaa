#include "test_support.hpp"

#include "cokacenc/chunk_codec.hpp"
#include "cokacenc/constants.hpp"
#include "cokacenc/crypto.hpp"
#include "cokacenc/errors.hpp"

#include <sstream>
#include <stdexcept>

namespace chunk = cokacenc::chunk;
using cokacenc::crypto::Bytes;

namespace {

Bytes FromHex(const std::string& hex) {
    Bytes out;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<std::uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

Bytes Concat(Bytes a, const Bytes& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

}  // namespace

TEST(ChunkHeaderTest, LayoutIsFixed) {
    chunk::ChunkHeader header = chunk::NewHeader();
    Bytes encoded = chunk::EncodeHeader(header);
    ASSERT_EQ(encoded.size(), 44u);
    EXPECT_EQ(std::string(encoded.begin(), encoded.begin() + 8), "COKACENC");
    EXPECT_EQ(encoded[8], 2);
    EXPECT_EQ(encoded[9], 0);
    EXPECT_EQ(encoded[10], 0);
    EXPECT_EQ(encoded[11], 0);
    EXPECT_EQ(Bytes(encoded.begin() + 12, encoded.begin() + 28), header.salt);
    EXPECT_EQ(Bytes(encoded.begin() + 28, encoded.end()), header.iv);
}

TEST(ChunkHeaderTest, StreamRoundTrip) {
    chunk::ChunkHeader header = chunk::NewHeader();
    std::stringstream buffer;
    chunk::WriteHeader(buffer, header);
    chunk::ChunkHeader parsed = chunk::ReadHeader(buffer);
    EXPECT_EQ(parsed.version, cokacenc::constants::kFormatVersion);
    EXPECT_EQ(parsed.salt, header.salt);
    EXPECT_EQ(parsed.iv, header.iv);
}

TEST(ChunkHeaderTest, RejectsBadInput) {
    Bytes good = chunk::EncodeHeader(chunk::NewHeader());

    EXPECT_THROW(chunk::DecodeHeader(good.data(), 43), cokacenc::FormatError);

    Bytes bad_magic = good;
    bad_magic[0] = 'X';
    EXPECT_THROW(chunk::DecodeHeader(bad_magic.data(), bad_magic.size()), cokacenc::FormatError);

    Bytes bad_version = good;
    bad_version[8] = 1;
    EXPECT_THROW(chunk::DecodeHeader(bad_version.data(), bad_version.size()), cokacenc::FormatError);

    std::stringstream short_stream(std::string(good.begin(), good.begin() + 20));
    EXPECT_THROW(chunk::ReadHeader(short_stream), cokacenc::FormatError);
}

TEST(CipherTest, MatchesAes256CbcVector) {
    Bytes key = FromHex("603deb1015ca71be2b73aef0857d77811f352c073b6108d72d9810a30914dff4");
    Bytes iv = FromHex("000102030405060708090a0b0c0d0e0f");
    Bytes plain = FromHex("6bc1bee22e409f96e93d7e117393172a");
    chunk::Encryptor enc(key, iv);
    Bytes body = enc.Update(plain);
    Bytes cipher = Concat(body, enc.Finalize());
    ASSERT_EQ(cipher.size(), 32u);
    EXPECT_EQ(cokacenc::crypto::HexEncode(Bytes(cipher.begin(), cipher.begin() + 16)),
              "f58c4c04d6e5f1ba779eabfb5f7bfbd6");
}

TEST(CipherTest, StreamingRoundTripInOddSpans) {
    Bytes key = cokacenc::crypto::RandomBytes(32);
    Bytes iv = cokacenc::crypto::RandomBytes(16);
    std::string text = cokacenc::testing::PatternBytes(1000);
    Bytes plain(text.begin(), text.end());

    chunk::Encryptor enc(key, iv);
    Bytes cipher;
    for (std::size_t off = 0; off < plain.size(); off += 7) {
        std::size_t n = std::min<std::size_t>(7, plain.size() - off);
        cipher = Concat(cipher, enc.Update(plain.data() + off, n));
    }
    cipher = Concat(cipher, enc.Finalize());
    EXPECT_EQ(cipher.size() % 16, 0u);
    EXPECT_GT(cipher.size(), plain.size());

    chunk::Decryptor dec(key, iv);
    Bytes out;
    for (std::size_t off = 0; off < cipher.size(); off += 13) {
        std::size_t n = std::min<std::size_t>(13, cipher.size() - off);
        out = Concat(out, dec.Update(cipher.data() + off, n));
    }
    out = Concat(out, dec.Finalize());
    EXPECT_EQ(out, plain);
}

TEST(CipherTest, EmptyPlaintextIsOnePaddingBlock) {
    Bytes key(32, 0x11);
    Bytes iv(16, 0x22);
    chunk::Encryptor enc(key, iv);
    Bytes cipher = enc.Finalize();
    EXPECT_EQ(cipher.size(), 16u);

    chunk::Decryptor dec(key, iv);
    Bytes head = dec.Update(cipher);
    Bytes out = Concat(head, dec.Finalize());
    EXPECT_TRUE(out.empty());
}

TEST(CipherTest, WrongKeyOrTruncationFails) {
    Bytes key(32, 0x11);
    Bytes iv(16, 0x22);
    chunk::Encryptor enc(key, iv);
    Bytes plain(40, 0x41);
    Bytes body = enc.Update(plain);
    Bytes cipher = Concat(body, enc.Finalize());

    // A wrong key occasionally produces valid padding, never the plaintext.
    Bytes wrong_key(32, 0x12);
    chunk::Decryptor wrong(wrong_key, iv);
    bool rejected = false;
    Bytes out;
    try {
        Bytes head = wrong.Update(cipher);
        out = Concat(head, wrong.Finalize());
    } catch (const cokacenc::CryptoError&) {
        rejected = true;
    }
    EXPECT_TRUE(rejected || out != plain);

    chunk::Decryptor truncated(key, iv);
    truncated.Update(cipher.data(), cipher.size() - 3);
    EXPECT_THROW(truncated.Finalize(), cokacenc::CryptoError);
}

TEST(CipherTest, SingleUse) {
    Bytes key(32, 0x11);
    Bytes iv(16, 0x22);
    chunk::Encryptor enc(key, iv);
    enc.Finalize();
    EXPECT_THROW(enc.Finalize(), std::logic_error);
    EXPECT_THROW(enc.Update(Bytes(1, 0)), std::logic_error);
    EXPECT_THROW(chunk::Encryptor(Bytes(16, 0), iv), cokacenc::CryptoError);
}
