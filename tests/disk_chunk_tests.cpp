#include <gtest/gtest.h>
#include "disk_chunk.hpp"
#include "errors.hpp"
#include "test_utils.hpp"
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>

using SnapFetch::Checksum::Bytes;
using SnapFetch::Chunks::Chunk;
using SnapFetch::Chunks::ChunkEqual;
using SnapFetch::Chunks::ChunkHash;
using SnapFetch::Chunks::DiskChunk;

namespace {
/** Output stream whose buffer refuses every write. */
class RejectingBuf : public std::streambuf {
protected:
    int_type overflow(int_type) override { return traits_type::eof(); }
    std::streamsize xsputn(const char*, std::streamsize) override { return 0; }
};
}

TEST(DiskChunkTest, ChecksumIsCopiedInAndOut) {
    TempDir dir("disk_chunk_checksum");
    Bytes checksum = {1, 2, 3, 4};
    DiskChunk chunk(checksum, dir.path / "c");

    checksum[0] = 99;
    EXPECT_EQ(chunk.checksum(), (Bytes{1, 2, 3, 4}));

    Bytes returned = chunk.checksum();
    returned[1] = 42;
    EXPECT_EQ(chunk.checksum(), (Bytes{1, 2, 3, 4}));
}

TEST(DiskChunkTest, CopyToWritesWholeFile) {
    TempDir dir("disk_chunk_copy");
    std::string content(150000, '\0');
    for (size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>(i * 7);
    writeFile(dir.path / "data", content);

    DiskChunk chunk({0xaa}, dir.path / "data");
    std::ostringstream out;
    EXPECT_EQ(chunk.copyTo(out), content.size());
    EXPECT_EQ(out.str(), content);

    // Each call opens its own handle, so a second copy sees the full content again.
    std::ostringstream again;
    EXPECT_EQ(chunk.copyTo(again), content.size());
    EXPECT_EQ(again.str(), content);
}

TEST(DiskChunkTest, CopyToEmptyFileWritesNothing) {
    TempDir dir("disk_chunk_empty");
    writeFile(dir.path / "empty", "");
    DiskChunk chunk({}, dir.path / "empty");
    std::ostringstream out;
    EXPECT_EQ(chunk.copyTo(out), 0u);
    EXPECT_TRUE(out.str().empty());
}

TEST(DiskChunkTest, MissingFileIsAnIOError) {
    TempDir dir("disk_chunk_missing");
    DiskChunk chunk({1}, dir.path / "absent");
    std::ostringstream out;
    EXPECT_THROW(chunk.copyTo(out), SnapFetch::Errors::IOError);
    EXPECT_THROW(chunk.inputStream(), SnapFetch::Errors::IOError);
}

TEST(DiskChunkTest, RejectingSinkIsAnIOError) {
    TempDir dir("disk_chunk_sink");
    writeFile(dir.path / "data", "some bytes");
    DiskChunk chunk({1}, dir.path / "data");

    RejectingBuf buf;
    std::ostream sink(&buf);
    EXPECT_THROW(chunk.copyTo(sink), SnapFetch::Errors::IOError);
}

TEST(DiskChunkTest, InputStreamsAreIndependent) {
    TempDir dir("disk_chunk_streams");
    writeFile(dir.path / "data", "0123456789");
    DiskChunk chunk({1}, dir.path / "data");

    auto first = chunk.inputStream();
    auto second = chunk.inputStream();
    char buf[4] = {};
    first->read(buf, 4);
    EXPECT_EQ(std::string(buf, 4), "0123");

    std::string rest((std::istreambuf_iterator<char>(*second)), std::istreambuf_iterator<char>());
    EXPECT_EQ(rest, "0123456789");
}

TEST(DiskChunkTest, ConcurrentReadersSeeSameContent) {
    TempDir dir("disk_chunk_concurrent");
    std::string content(50000, 'q');
    writeFile(dir.path / "data", content);
    DiskChunk chunk({7}, dir.path / "data");

    std::vector<std::thread> readers;
    std::atomic<int> matches{0};
    for (int i = 0; i < 8; ++i) {
        readers.emplace_back([&] {
            std::ostringstream out;
            if (chunk.copyTo(out) == content.size() && out.str() == content) ++matches;
        });
    }
    for (auto& t : readers) t.join();
    EXPECT_EQ(matches.load(), 8);
}

TEST(DiskChunkTest, IdentityIsTheChecksum) {
    TempDir dir("disk_chunk_identity");
    auto a = std::make_shared<DiskChunk>(Bytes{1, 2}, dir.path / "a");
    auto b = std::make_shared<DiskChunk>(Bytes{1, 2}, dir.path / "b");
    auto c = std::make_shared<DiskChunk>(Bytes{3}, dir.path / "a");

    EXPECT_TRUE(*a == *b);
    EXPECT_TRUE(*a != *c);
    EXPECT_EQ(ChunkHash{}(*a), ChunkHash{}(*b));

    std::unordered_set<std::shared_ptr<const Chunk>, ChunkHash, ChunkEqual> set;
    set.insert(a);
    set.insert(b);
    set.insert(c);
    EXPECT_EQ(set.size(), 2u);
}

TEST(DiskChunkTest, HashCoversEveryChecksumByte) {
    TempDir dir("disk_chunk_hash");
    DiskChunk high(Bytes{0x00, 0x80, 0xff}, dir.path / "high");
    std::string raw{'\x00', '\x80', '\xff'};
    EXPECT_EQ(ChunkHash{}(high), std::hash<std::string>{}(raw));

    std::shared_ptr<const Chunk> none;
    EXPECT_EQ(ChunkHash{}(none), 0u);
}

TEST(DiskChunkTest, EmptyPathIsRejected) {
    EXPECT_THROW(DiskChunk({1}, std::filesystem::path()), std::invalid_argument);
}

TEST(DiskChunkTest, ToStringShowsChecksumAndFile) {
    DiskChunk chunk({0xde, 0xad}, "/tmp/chunk");
    EXPECT_EQ(chunk.toString(), "DiskChunk{checksum=dead, file=/tmp/chunk}");
}
