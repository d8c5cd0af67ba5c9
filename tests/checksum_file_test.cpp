#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include "../src/common/common.hpp"
#include "../src/checksum/checksum_file.hpp"

namespace {

class TempFileTest : public ::testing::Test
{
protected:
    fs::path dir;

    void SetUp() override
    {
        const ::testing::TestInfo *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              (std::string("zfs_block_tools_") + info->test_suite_name() + "_" + info->name());
        fs::create_directories(dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string writeFile(const std::string &name, const std::vector<char> &data)
    {
        fs::path path = dir / name;
        std::ofstream out(path, std::ios::binary);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        return path.string();
    }
};

std::vector<char> patternBytes(size_t size)
{
    std::vector<char> out(size);
    uint32_t x = 0x12345678;
    for (auto &b : out)
    {
        x = x * 1103515245u + 12345u;
        b = static_cast<char>(x >> 24);
    }
    return out;
}

} // namespace

using ChecksumFileTest = TempFileTest;
using CommonFileTest = TempFileTest;

TEST_F(ChecksumFileTest, Fletcher4MatchesInMemoryAcrossChunks)
{
    // 読み込みチャンクをまたぎ、端数バイトも残るサイズ
    std::vector<char> data = patternBytes(CHECKSUM_READ_CHUNK_SIZE * 2 + 7);
    std::string path = writeFile("block.bin", data);

    ChecksumTuple checksum;
    ASSERT_TRUE(checksumFile(path, ChecksumMethod::Fletcher4, checksum));
    EXPECT_EQ(checksum, fletcher4(data));
}

TEST_F(ChecksumFileTest, Fletcher2MatchesInMemory)
{
    std::vector<char> data = patternBytes(131072 + 9);
    std::string path = writeFile("block.bin", data);

    ChecksumTuple checksum;
    ASSERT_TRUE(checksumFile(path, ChecksumMethod::Fletcher2, checksum));
    EXPECT_EQ(checksum, fletcher2(data));
}

TEST_F(ChecksumFileTest, EmptyFileIsZero)
{
    std::string path = writeFile("empty.bin", {});

    ChecksumTuple checksum = {1, 1, 1, 1};
    ASSERT_TRUE(checksumFile(path, ChecksumMethod::Fletcher4, checksum));
    EXPECT_EQ(checksum, (ChecksumTuple{0, 0, 0, 0}));
}

TEST_F(ChecksumFileTest, MissingFileFails)
{
    ChecksumTuple checksum;
    EXPECT_FALSE(checksumFile((dir / "missing.bin").string(), ChecksumMethod::Fletcher4, checksum));
    EXPECT_FALSE(checksumFile((dir / "missing.bin").string(), ChecksumMethod::Fletcher2, checksum));
}

TEST_F(ChecksumFileTest, DirectoryFails)
{
    ChecksumTuple checksum;
    EXPECT_FALSE(checksumFile(dir.string(), ChecksumMethod::Fletcher2, checksum));
    EXPECT_FALSE(checksumFile(dir.string(), ChecksumMethod::Fletcher4, checksum));
}

TEST_F(CommonFileTest, ReadFileBytesReadsEverything)
{
    std::vector<char> data = patternBytes(12345);
    std::string path = writeFile("raw.bin", data);

    std::vector<char> read;
    ASSERT_TRUE(readFileBytes(path, read));
    EXPECT_EQ(read, data);
}

TEST_F(CommonFileTest, ReadFileBytesFailsOnMissingFile)
{
    std::vector<char> read;
    EXPECT_FALSE(readFileBytes((dir / "missing.bin").string(), read));
}

TEST_F(CommonFileTest, ReadFileBytesFailsOnDirectory)
{
    std::vector<char> read;
    EXPECT_FALSE(readFileBytes(dir.string(), read));
}

TEST(ParsePositiveSizeTest, AcceptsPositiveIntegers)
{
    size_t value = 0;
    ASSERT_TRUE(parsePositiveSize("131072", value));
    EXPECT_EQ(value, 131072u);
    ASSERT_TRUE(parsePositiveSize("1", value));
    EXPECT_EQ(value, 1u);
}

TEST(ParsePositiveSizeTest, RejectsZeroNegativeAndGarbage)
{
    size_t value = 7;
    EXPECT_FALSE(parsePositiveSize("0", value));
    EXPECT_FALSE(parsePositiveSize("-5", value));
    EXPECT_FALSE(parsePositiveSize("12k", value));
    EXPECT_FALSE(parsePositiveSize("", value));
    EXPECT_FALSE(parsePositiveSize("99999999999999999999999", value));
    EXPECT_EQ(value, 7u);
}
