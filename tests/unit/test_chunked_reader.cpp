#include <gtest/gtest.h>
#include "assetrelay/crypto/hash.hpp"
#include "assetrelay/storage/part_spool.hpp"
#include "assetrelay/transfer/chunked_reader.hpp"
#include "support/scripted_reader.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace assetrelay;
using namespace assetrelay::transfer;
using core::TransferError;

namespace {

std::vector<uint8_t> drain(ChunkedReader& reader, size_t chunk, core::TransferResult& last) {
    std::vector<uint8_t> all;
    std::vector<uint8_t> buffer;
    while (true) {
        last = reader.next_chunk(chunk, buffer);
        if (!last || buffer.empty()) {
            return all;
        }
        all.insert(all.end(), buffer.begin(), buffer.end());
    }
}

}

TEST(StreamReaderTest, ReadsUntilEndWithoutDeclaredLength) {
    std::istringstream input(std::string(1000, 'x'));
    StreamReader reader(input);
    ASSERT_TRUE(reader.open());

    core::TransferResult last;
    auto data = drain(reader, 64, last);

    EXPECT_TRUE(last);
    EXPECT_EQ(data.size(), 1000u);
    EXPECT_EQ(reader.bytes_read(), 1000u);
    EXPECT_FALSE(reader.total_bytes_known().has_value());
    EXPECT_FALSE(reader.seekable());
}

TEST(StreamReaderTest, ReadsExactlyDeclaredLength) {
    std::istringstream input(std::string(600, 'x'));
    StreamReader reader(input, 600);
    ASSERT_TRUE(reader.open());

    core::TransferResult last;
    auto data = drain(reader, 256, last);

    EXPECT_TRUE(last);
    EXPECT_EQ(data.size(), 600u);
    ASSERT_TRUE(reader.total_bytes_known());
    EXPECT_EQ(*reader.total_bytes_known(), 600u);
}

TEST(StreamReaderTest, BytesPastDeclaredLengthAreRejected) {
    std::istringstream input(std::string(1000, 'x'));
    StreamReader reader(input, 600);
    ASSERT_TRUE(reader.open());

    core::TransferResult last;
    auto data = drain(reader, 256, last);

    EXPECT_EQ(last.error, core::TransferError::INVALID_REQUEST);
    EXPECT_EQ(data.size(), 512u);

    std::vector<uint8_t> out;
    EXPECT_TRUE(reader.next_chunk(256, out));
    EXPECT_TRUE(out.empty());
}

TEST(StreamReaderTest, ShortStreamIsTruncated) {
    std::istringstream input(std::string(300, 'x'));
    StreamReader reader(input, 500, "stdin");
    ASSERT_TRUE(reader.open());

    core::TransferResult last;
    drain(reader, 128, last);

    EXPECT_EQ(last.error, TransferError::SOURCE_TRUNCATED);
    EXPECT_NE(last.message.find("stdin"), std::string::npos);
}

TEST(StreamReaderTest, SeekIsRejected) {
    std::istringstream input("abc");
    StreamReader reader(input);

    EXPECT_EQ(reader.seek(0).error, TransferError::INVALID_STATE);
}

TEST(BufferReaderTest, SeekRepositions) {
    BufferReader reader(test::make_payload(100));
    ASSERT_TRUE(reader.open());

    std::vector<uint8_t> chunk;
    ASSERT_TRUE(reader.next_chunk(40, chunk));
    ASSERT_TRUE(reader.seek(90));
    ASSERT_TRUE(reader.next_chunk(40, chunk));
    EXPECT_EQ(chunk.size(), 10u);
    EXPECT_EQ(reader.seek(101).error, TransferError::INVALID_REQUEST);
}

class FileReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() / "assetrelay_reader_test.bin";
        payload = test::make_payload(5000);
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    }

    void TearDown() override {
        std::filesystem::remove(path);
    }

    std::filesystem::path path;
    std::vector<uint8_t> payload;
};

TEST_F(FileReaderTest, ReadsWholeFile) {
    FileReader reader(path);
    ASSERT_TRUE(reader.open());
    ASSERT_TRUE(reader.total_bytes_known());
    EXPECT_EQ(*reader.total_bytes_known(), 5000u);

    core::TransferResult last;
    auto data = drain(reader, 1024, last);
    EXPECT_TRUE(last);
    EXPECT_EQ(data, payload);
}

TEST_F(FileReaderTest, SeekAfterEndReopens) {
    FileReader reader(path);
    ASSERT_TRUE(reader.open());

    core::TransferResult last;
    drain(reader, 4096, last);
    ASSERT_TRUE(reader.seek(4000));

    auto tail = drain(reader, 4096, last);
    EXPECT_EQ(tail, std::vector<uint8_t>(payload.begin() + 4000, payload.end()));
}

TEST_F(FileReaderTest, MissingFileIsUnreachable) {
    FileReader reader(path.string() + ".missing");
    EXPECT_EQ(reader.open().error, TransferError::SOURCE_UNREACHABLE);
}

class PartSpoolTest : public ::testing::Test {
protected:
    std::filesystem::path directory = std::filesystem::temp_directory_path() / "assetrelay_spool_test";

    void TearDown() override {
        std::filesystem::remove_all(directory);
    }
};

TEST_F(PartSpoolTest, ReplaysAppendedBytes) {
    storage::PartSpool spool(directory);
    ASSERT_TRUE(spool.open());

    auto payload = test::make_payload(3000);
    ASSERT_TRUE(spool.append(std::span<const uint8_t>(payload.data(), 1000)));
    ASSERT_TRUE(spool.append(std::span<const uint8_t>(payload.data() + 1000, 2000)));
    EXPECT_EQ(spool.size(), 3000u);

    for (int pass = 0; pass < 2; ++pass) {
        ASSERT_TRUE(spool.rewind(0));
        std::vector<uint8_t> replayed;
        std::vector<uint8_t> chunk;
        while (spool.read(700, chunk) && !chunk.empty()) {
            replayed.insert(replayed.end(), chunk.begin(), chunk.end());
        }
        EXPECT_EQ(replayed, payload);
    }
}

TEST_F(PartSpoolTest, ResetDiscardsContents) {
    storage::PartSpool spool(directory);
    ASSERT_TRUE(spool.open());

    auto payload = test::make_payload(100);
    ASSERT_TRUE(spool.append(payload));
    ASSERT_TRUE(spool.reset());
    EXPECT_EQ(spool.size(), 0u);

    std::vector<uint8_t> chunk;
    ASSERT_TRUE(spool.read(10, chunk));
    EXPECT_TRUE(chunk.empty());
    EXPECT_EQ(spool.rewind(1).error, TransferError::INVALID_REQUEST);
}

TEST_F(PartSpoolTest, FileRemovedOnDestruction) {
    std::filesystem::path spool_path;
    {
        storage::PartSpool spool(directory);
        ASSERT_TRUE(spool.open());
        spool_path = spool.get_path();
        EXPECT_TRUE(std::filesystem::exists(spool_path));
    }
    EXPECT_FALSE(std::filesystem::exists(spool_path));
}

TEST(ContentHasherTest, IncrementalMatchesOneShot) {
    auto payload = test::make_payload(10000);

    crypto::ContentHasher hasher;
    hasher.update(std::span<const uint8_t>(payload.data(), 3333));
    hasher.update(std::span<const uint8_t>(payload.data() + 3333, payload.size() - 3333));
    EXPECT_EQ(hasher.bytes_hashed(), 10000u);

    EXPECT_EQ(hasher.finalize(), crypto::ContentHasher::hash(payload));
}

TEST(ContentHasherTest, HexRoundTrip) {
    auto digest = crypto::hash_utils::hash_string("assetrelay");
    auto hex = crypto::hash_utils::hash_to_hex(digest);

    EXPECT_EQ(hex.size(), crypto::CONTENT_HASH_SIZE * 2);
    auto parsed = crypto::hash_utils::hash_from_hex(hex);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(*parsed, digest);
    EXPECT_FALSE(crypto::hash_utils::hash_from_hex("zz").has_value());
}

TEST(ContentHasherTest, DifferentContentDiffers) {
    EXPECT_NE(crypto::hash_utils::hash_string("a"), crypto::hash_utils::hash_string("b"));
}
