#include "test_support.hpp"

#include "cokacenc/errors.hpp"
#include "cokacenc/fsutil.hpp"

namespace fsutil = cokacenc::fsutil;
using cokacenc::testing::ScratchDirTest;
using cokacenc::testing::WriteAll;

class FsUtilTest : public ScratchDirTest {};

TEST_F(FsUtilTest, CleanupListRemovesUnlessReleased) {
    auto a = dir_ / "a.part";
    auto b = dir_ / "b.part";
    WriteAll(a, "x");
    WriteAll(b, "y");
    {
        fsutil::CleanupList list;
        list.Track(a);
    }
    EXPECT_FALSE(std::filesystem::exists(a));
    {
        fsutil::CleanupList list;
        list.Track(b);
        list.Release();
        EXPECT_TRUE(list.Paths().empty());
    }
    EXPECT_TRUE(std::filesystem::exists(b));
}

TEST_F(FsUtilTest, RollbackIgnoresMissingPaths) {
    fsutil::CleanupList list;
    list.Track(dir_ / "never-created");
    EXPECT_EQ(list.Rollback(), 0u);
}

TEST_F(FsUtilTest, AttributesRoundTrip) {
    auto path = dir_ / "data.bin";
    WriteAll(path, "12345");
    ASSERT_TRUE(fsutil::RestoreAttributes(path, 1000000000, 0640));
    fsutil::FileAttributes attrs = fsutil::ReadAttributes(path);
    EXPECT_EQ(attrs.size, 5u);
    EXPECT_EQ(attrs.modified, 1000000000);
    EXPECT_EQ(attrs.permissions, 0640u);
}

TEST_F(FsUtilTest, RestoreReportsFailureWithoutThrowing) {
    std::string error;
    EXPECT_FALSE(fsutil::RestoreAttributes(dir_ / "missing", 0, 0644, &error));
    EXPECT_FALSE(error.empty());
}

TEST_F(FsUtilTest, ReadAttributesRejectsDirectories) {
    EXPECT_THROW(fsutil::ReadAttributes(dir_), cokacenc::IoError);
    EXPECT_THROW(fsutil::ReadAttributes(dir_ / "missing"), cokacenc::IoError);
}

TEST_F(FsUtilTest, ListsPackableFilesByName) {
    WriteAll(dir_ / "b.txt", "b");
    WriteAll(dir_ / "a.txt", "a");
    WriteAll(dir_ / ".hidden", "h");
    WriteAll(dir_ / "0123456789abcdef_aaaa.cokacenc", "c");
    std::filesystem::create_directory(dir_ / "sub");
    auto files = fsutil::ListPackableFiles(dir_);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename().string(), "a.txt");
    EXPECT_EQ(files[1].filename().string(), "b.txt");
}

TEST(PlainFileNameTest, RejectsPathLikeNames) {
    EXPECT_TRUE(fsutil::IsPlainFileName("report.pdf"));
    EXPECT_TRUE(fsutil::IsPlainFileName(".profile"));
    EXPECT_FALSE(fsutil::IsPlainFileName(""));
    EXPECT_FALSE(fsutil::IsPlainFileName("."));
    EXPECT_FALSE(fsutil::IsPlainFileName(".."));
    EXPECT_FALSE(fsutil::IsPlainFileName("../etc/passwd"));
    EXPECT_FALSE(fsutil::IsPlainFileName("/etc/passwd"));
}
