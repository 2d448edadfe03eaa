#include "test_support.hpp"

#include "cokacenc/errors.hpp"
#include "cokacenc/inspect.hpp"
#include "cokacenc/metadata.hpp"
#include "cokacenc/pack.hpp"

namespace inspect = cokacenc::inspect;
using cokacenc::testing::CountFiles;
using cokacenc::testing::PatternBytes;
using cokacenc::testing::ScratchDirTest;
using cokacenc::testing::WriteAll;

class InspectTest : public ScratchDirTest {};

TEST_F(InspectTest, ReportsHeaderAndMetadata) {
    WriteAll(dir_ / "movie.mp4", PatternBytes(300000));
    cokacenc::pack::Options opts;
    opts.split_size = 200000;
    auto packed = cokacenc::pack::PackFile(dir_ / "movie.mp4", "pw", opts);
    const std::size_t before = CountFiles(dir_);

    inspect::ChunkInfo info = inspect::InspectChunk(packed.chunks[1], "pw");
    EXPECT_EQ(info.header.version, 2u);
    EXPECT_EQ(info.header.salt.size(), 16u);
    EXPECT_EQ(info.header.iv.size(), 16u);
    EXPECT_EQ(info.file_size, std::filesystem::file_size(packed.chunks[1]));
    EXPECT_EQ(info.metadata_json, cokacenc::metadata::Encode(info.metadata));
    EXPECT_EQ(info.metadata_len, info.metadata_json.size());
    EXPECT_EQ(info.metadata.group_id, packed.group_id);
    EXPECT_EQ(info.metadata.chunk_index, 1u);
    EXPECT_EQ(info.metadata.chunk_offset, 200000u);
    EXPECT_EQ(info.metadata.chunk_data_size, 100000u);
    EXPECT_EQ(CountFiles(dir_), before);
}

TEST_F(InspectTest, RejectsForeignFiles) {
    WriteAll(dir_ / "fake.cokacenc", "definitely not a chunk header, but long enough to parse");
    EXPECT_THROW(inspect::InspectChunk(dir_ / "fake.cokacenc", "pw"), cokacenc::FormatError);
    EXPECT_THROW(inspect::InspectChunk(dir_ / "missing.cokacenc", "pw"), cokacenc::IoError);
}

TEST_F(InspectTest, WrongPasswordIsAnError) {
    WriteAll(dir_ / "small.txt", "tiny");
    auto packed = cokacenc::pack::PackFile(dir_ / "small.txt", "pw", cokacenc::pack::Options{});
    EXPECT_THROW(inspect::InspectChunk(packed.chunks[0], "other"), cokacenc::Error);
}
