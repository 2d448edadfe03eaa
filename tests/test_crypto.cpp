#include "test_support.hpp"

#include "cokacenc/base64.hpp"
#include "cokacenc/constants.hpp"
#include "cokacenc/crypto.hpp"
#include "cokacenc/errors.hpp"

#include <stdexcept>

namespace crypto = cokacenc::crypto;

namespace {

crypto::Bytes ToBytes(const std::string& text) {
    return crypto::Bytes(text.begin(), text.end());
}

}  // namespace

TEST(Pbkdf2Test, MatchesPublishedVector) {
    crypto::Bytes key = crypto::Pbkdf2HmacSha512("password", ToBytes("salt"), 1, 32);
    EXPECT_EQ(crypto::HexEncode(key), "867f70cf1ade02cff3752599a3a53dc4af34c7a669815ae5d513554e1c8cf252");
}

TEST(DeriveKeyTest, DeterministicPerSalt) {
    cokacenc::testing::UseFastKdf();
    crypto::Bytes salt1(16, 0x01);
    crypto::Bytes salt2(16, 0x02);
    crypto::Bytes a = crypto::DeriveKey("secret", salt1);
    crypto::Bytes b = crypto::DeriveKey("secret", salt1);
    crypto::Bytes c = crypto::DeriveKey("secret", salt2);
    EXPECT_EQ(a.size(), cokacenc::constants::kKeySize);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(DeriveKeyTest, RejectsWrongSaltSize) {
    EXPECT_THROW(crypto::DeriveKey("secret", crypto::Bytes(8, 0)), cokacenc::CryptoError);
}

TEST(KdfIterationsTest, HonorsOverride) {
    ::setenv("COKACENC_TEST_KDF_ITERS", "1234", 1);
    EXPECT_EQ(cokacenc::constants::KdfIterations(), 1234u);
    ::setenv("COKACENC_TEST_KDF_ITERS", "0", 1);
    EXPECT_EQ(cokacenc::constants::KdfIterations(), cokacenc::constants::kKdfIterations);
    ::unsetenv("COKACENC_TEST_KDF_ITERS");
    EXPECT_EQ(cokacenc::constants::KdfIterations(), cokacenc::constants::kKdfIterations);
    cokacenc::testing::UseFastKdf();
}

TEST(RandomBytesTest, SizeAndVariety) {
    crypto::Bytes a = crypto::RandomBytes(32);
    crypto::Bytes b = crypto::RandomBytes(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
}

TEST(Md5HasherTest, KnownDigests) {
    crypto::Md5Hasher empty;
    EXPECT_EQ(empty.FinalHex(), "d41d8cd98f00b204e9800998ecf8427e");

    crypto::Md5Hasher split;
    split.Update(ToBytes("a"));
    split.Update(ToBytes("bc"));
    EXPECT_EQ(split.FinalHex(), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(Md5HasherTest, SingleUse) {
    crypto::Md5Hasher hasher;
    hasher.FinalHex();
    EXPECT_THROW(hasher.Update(ToBytes("x")), std::logic_error);
    EXPECT_THROW(hasher.FinalHex(), std::logic_error);
}

TEST(Base64Test, PaddedStandardAlphabet) {
    EXPECT_EQ(cokacenc::base64::Encode({}), "");
    EXPECT_EQ(cokacenc::base64::Encode(ToBytes("foo")), "Zm9v");
    EXPECT_EQ(cokacenc::base64::Encode(ToBytes("foob")), "Zm9vYg==");
    EXPECT_EQ(cokacenc::base64::Encode(ToBytes("fooba")), "Zm9vYmE=");
    EXPECT_EQ(cokacenc::base64::Encode({0xFB, 0xFF}), "+/8=");
}
