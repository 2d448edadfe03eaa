#include "test_support.hpp"

#include "cokacenc/errors.hpp"
#include "cokacenc/keyfile.hpp"

namespace keyfile = cokacenc::keyfile;
using cokacenc::testing::ReadAll;
using cokacenc::testing::ScratchDirTest;
using cokacenc::testing::WriteAll;

class KeyFileTest : public ScratchDirTest {};

TEST(TrimWhitespaceTest, StripsBothEnds) {
    EXPECT_EQ(keyfile::TrimWhitespace("  secret \r\n"), "secret");
    EXPECT_EQ(keyfile::TrimWhitespace("in ner"), "in ner");
    EXPECT_EQ(keyfile::TrimWhitespace(" \t\n"), "");
}

TEST_F(KeyFileTest, LoadTrimsContents) {
    WriteAll(dir_ / "key", "\n  hunter2\n\n");
    EXPECT_EQ(keyfile::LoadKeyFile(dir_ / "key"), "hunter2");
}

TEST_F(KeyFileTest, LoadFailures) {
    EXPECT_THROW(keyfile::LoadKeyFile(dir_ / "missing"), cokacenc::IoError);
    WriteAll(dir_ / "blank", " \n\t ");
    EXPECT_THROW(keyfile::LoadKeyFile(dir_ / "blank"), cokacenc::ConfigError);
}

TEST_F(KeyFileTest, GenerateWritesBase64) {
    std::string key = keyfile::GenerateKeyFile(dir_ / "gen.key");
    EXPECT_EQ(key.size(), 88u);  // 64 bytes
    EXPECT_EQ(ReadAll(dir_ / "gen.key"), key);
    EXPECT_EQ(keyfile::LoadKeyFile(dir_ / "gen.key"), key);

    std::string other = keyfile::GenerateKeyFile(dir_ / "other.key", 3);
    EXPECT_EQ(other.size(), 4u);
}

TEST_F(KeyFileTest, GenerateRefusesOverwriteWithoutForce) {
    WriteAll(dir_ / "gen.key", "keep me");
    EXPECT_THROW(keyfile::GenerateKeyFile(dir_ / "gen.key"), cokacenc::ConfigError);
    EXPECT_EQ(ReadAll(dir_ / "gen.key"), "keep me");
    std::string key = keyfile::GenerateKeyFile(dir_ / "gen.key", 16, true);
    EXPECT_EQ(ReadAll(dir_ / "gen.key"), key);
}

TEST_F(KeyFileTest, GenerateRejectsZeroLength) {
    EXPECT_THROW(keyfile::GenerateKeyFile(dir_ / "zero.key", 0), cokacenc::ConfigError);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "zero.key"));
}
