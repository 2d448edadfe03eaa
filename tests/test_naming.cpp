#include "test_support.hpp"

#include "cokacenc/constants.hpp"
#include "cokacenc/errors.hpp"
#include "cokacenc/naming.hpp"

namespace naming = cokacenc::naming;
using cokacenc::testing::ScratchDirTest;
using cokacenc::testing::WriteAll;

TEST(SeqLabelTest, KnownLabels) {
    EXPECT_EQ(naming::SeqLabel(0), "aaaa");
    EXPECT_EQ(naming::SeqLabel(1), "aaab");
    EXPECT_EQ(naming::SeqLabel(25), "aaaz");
    EXPECT_EQ(naming::SeqLabel(26), "aaba");
    EXPECT_EQ(naming::SeqLabel(456975), "zzzz");
}

TEST(SeqLabelTest, EveryIndexRoundTrips) {
    for (std::size_t i = 0; i <= cokacenc::constants::kMaxSeqIndex; ++i) {
        auto parsed = naming::ParseSeqLabel(naming::SeqLabel(i));
        ASSERT_TRUE(parsed.has_value());
        ASSERT_EQ(*parsed, i);
    }
}

TEST(SeqLabelTest, OverflowCarriesIndex) {
    try {
        naming::SeqLabel(456976);
        FAIL() << "expected SeqOverflow";
    } catch (const cokacenc::SeqOverflow& err) {
        EXPECT_EQ(err.index(), 456976u);
    }
}

TEST(SeqLabelTest, MalformedLabelsDoNotParse) {
    EXPECT_FALSE(naming::ParseSeqLabel("aaa").has_value());
    EXPECT_FALSE(naming::ParseSeqLabel("aaaaa").has_value());
    EXPECT_FALSE(naming::ParseSeqLabel("aaAa").has_value());
    EXPECT_FALSE(naming::ParseSeqLabel("aa1a").has_value());
}

TEST(ChunkFileNameTest, ComposeAndParse) {
    const std::string gid = "0123456789abcdef";
    EXPECT_EQ(naming::ChunkFileName(gid, 2), "0123456789abcdef_aaac.cokacenc");
    auto entry = naming::ParseChunkFileName("/tmp/x/0123456789abcdef_aaac.cokacenc");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->group_id, gid);
    EXPECT_EQ(entry->seq_index, 2u);
}

TEST(ChunkFileNameTest, RejectsNamesOutsideGrammar) {
    EXPECT_FALSE(naming::ParseChunkFileName("0123456789ABCDEF_aaaa.cokacenc").has_value());
    EXPECT_FALSE(naming::ParseChunkFileName("0123456789abcde_aaaa.cokacenc").has_value());
    EXPECT_FALSE(naming::ParseChunkFileName("0123456789abcdef-aaaa.cokacenc").has_value());
    EXPECT_FALSE(naming::ParseChunkFileName("0123456789abcdef_aaaa.enc").has_value());
    EXPECT_FALSE(naming::ParseChunkFileName("notes.txt").has_value());
    EXPECT_THROW(naming::ChunkFileName("xyz", 0), cokacenc::ConfigError);
}

class GroupingTest : public ScratchDirTest {};

TEST_F(GroupingTest, BucketsAndSortsBySequence) {
    WriteAll(dir_ / "bbbbbbbbbbbbbbbb_aaab.cokacenc", "x");
    WriteAll(dir_ / "aaaaaaaaaaaaaaaa_aaac.cokacenc", "x");
    WriteAll(dir_ / "aaaaaaaaaaaaaaaa_aaaa.cokacenc", "x");
    WriteAll(dir_ / "aaaaaaaaaaaaaaaa_aaab.cokacenc", "x");
    WriteAll(dir_ / "bbbbbbbbbbbbbbbb_aaaa.cokacenc", "x");
    WriteAll(dir_ / "readme.txt", "x");
    std::filesystem::create_directory(dir_ / "cccccccccccccccc_aaaa.cokacenc");

    naming::GroupMap groups = naming::GroupEncFiles(dir_);
    ASSERT_EQ(groups.size(), 2u);
    const auto& first = groups.at("aaaaaaaaaaaaaaaa");
    ASSERT_EQ(first.size(), 3u);
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].seq_index, i);
    }
    EXPECT_EQ(groups.begin()->first, "aaaaaaaaaaaaaaaa");
    EXPECT_EQ(groups.at("bbbbbbbbbbbbbbbb").size(), 2u);
}

TEST_F(GroupingTest, GeneratedIdsAreFreshHex) {
    std::string gid = naming::GenerateGroupId(dir_);
    EXPECT_TRUE(naming::IsGroupId(gid));
}

TEST_F(GroupingTest, GenerationSkipsTakenIds) {
    WriteAll(dir_ / "aaaaaaaaaaaaaaaa_aaaa.cokacenc", "x");
    std::vector<std::string> candidates = {"aaaaaaaaaaaaaaaa", "not-hex", "bbbbbbbbbbbbbbbb"};
    std::size_t next = 0;
    std::string gid = naming::GenerateGroupId(dir_, [&] { return candidates.at(next++); });
    EXPECT_EQ(gid, "bbbbbbbbbbbbbbbb");
    EXPECT_EQ(next, 3u);
}

TEST_F(GroupingTest, GenerationGivesUpAfterBoundedAttempts) {
    WriteAll(dir_ / "aaaaaaaaaaaaaaaa_aaab.cokacenc", "x");
    std::size_t calls = 0;
    auto always_taken = [&] {
        ++calls;
        return std::string("aaaaaaaaaaaaaaaa");
    };
    EXPECT_THROW(naming::GenerateGroupId(dir_, always_taken), cokacenc::GroupIdExhaustedError);
    EXPECT_EQ(calls, cokacenc::constants::kGroupIdMaxAttempts);
}
