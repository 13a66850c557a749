// SPDX-License-Identifier: MIT

// tests/chunk_queue_test.cpp
#include <gtest/gtest.h>

#include <array>
#include <string>

#include "lib/stream/chunk_queue.hpp"

using namespace chunk_pipe;

namespace {

std::string ReadString(ChunkQueue& queue, size_t max_len) {
    std::string out(max_len, '\0');
    size_t n = queue.ReadFront(reinterpret_cast<std::byte*>(out.data()), max_len);
    out.resize(n);
    return out;
}

}  // namespace

TEST(ChunkTest, MakeChunkFromText) {
    auto chunk = MakeChunk("abc");
    ASSERT_NE(chunk, nullptr);
    EXPECT_EQ(ChunkSize(chunk), 3);
    EXPECT_EQ((*chunk)[0], std::byte{'a'});
}

TEST(ChunkTest, NullChunkHasZeroSize) {
    Chunk chunk;
    EXPECT_EQ(ChunkSize(chunk), 0);
}

TEST(ChunkQueueTest, EmptyQueue) {
    ChunkQueue queue;
    EXPECT_TRUE(queue.Empty());
    EXPECT_EQ(queue.Size(), 0);
    EXPECT_EQ(queue.ChunkCount(), 0);
    EXPECT_EQ(queue.HeadOffset(), 0);
    EXPECT_EQ(queue.ContiguousSize(), 0);
}

TEST(ChunkQueueTest, AppendTracksSize) {
    ChunkQueue queue;
    queue.Append(MakeChunk("hello"));
    queue.Append(MakeChunk("world!"));

    EXPECT_FALSE(queue.Empty());
    EXPECT_EQ(queue.Size(), 11);
    EXPECT_EQ(queue.ChunkCount(), 2);
    EXPECT_EQ(queue.ContiguousSize(), 5);
}

TEST(ChunkQueueTest, AppendEmptyChunkIsDropped) {
    ChunkQueue queue;
    queue.Append(MakeChunk(""));
    queue.Append(nullptr);

    EXPECT_TRUE(queue.Empty());
    EXPECT_EQ(queue.ChunkCount(), 0);
}

TEST(ChunkQueueTest, ReadFrontStopsAtChunkBoundary) {
    ChunkQueue queue;
    queue.Append(MakeChunk("abc"));
    queue.Append(MakeChunk("defg"));

    EXPECT_EQ(ReadString(queue, 10), "abc");
    EXPECT_EQ(queue.ChunkCount(), 1);
    EXPECT_EQ(queue.HeadOffset(), 0);
    EXPECT_EQ(queue.Size(), 4);

    EXPECT_EQ(ReadString(queue, 10), "defg");
    EXPECT_TRUE(queue.Empty());
}

TEST(ChunkQueueTest, PartialReadAdvancesHeadOffset) {
    ChunkQueue queue;
    queue.Append(MakeChunk("abcdef"));

    EXPECT_EQ(ReadString(queue, 2), "ab");
    EXPECT_EQ(queue.HeadOffset(), 2);
    EXPECT_EQ(queue.Size(), 4);
    EXPECT_EQ(queue.ContiguousSize(), 4);
    EXPECT_EQ(*queue.FrontData(), std::byte{'c'});
}

TEST(ChunkQueueTest, ReadFromEmptyReturnsZero) {
    ChunkQueue queue;
    std::array<std::byte, 4> buf{};
    EXPECT_EQ(queue.ReadFront(buf.data(), buf.size()), 0);
}

TEST(ChunkQueueTest, ConsumeAcrossChunks) {
    ChunkQueue queue;
    queue.Append(MakeChunk("abc"));
    queue.Append(MakeChunk("def"));
    queue.Append(MakeChunk("ghi"));

    queue.Consume(4);
    EXPECT_EQ(queue.ChunkCount(), 2);
    EXPECT_EQ(queue.HeadOffset(), 1);
    EXPECT_EQ(queue.Size(), 5);
    EXPECT_EQ(ReadString(queue, 10), "ef");
}

TEST(ChunkQueueTest, ConsumeMoreThanAvailableEmptiesQueue) {
    ChunkQueue queue;
    queue.Append(MakeChunk("abc"));
    queue.Consume(100);

    EXPECT_TRUE(queue.Empty());
    EXPECT_EQ(queue.Size(), 0);
    EXPECT_EQ(queue.HeadOffset(), 0);
}

TEST(ChunkQueueTest, CopyIsIndependentSnapshot) {
    ChunkQueue queue;
    queue.Append(MakeChunk("abc"));
    queue.Append(MakeChunk("def"));
    queue.Consume(1);

    ChunkQueue snapshot = queue;
    queue.Consume(4);
    queue.Append(MakeChunk("xyz"));

    EXPECT_EQ(snapshot.Size(), 5);
    EXPECT_EQ(snapshot.HeadOffset(), 1);
    EXPECT_EQ(snapshot.ChunkCount(), 2);
    EXPECT_EQ(ReadString(snapshot, 10), "bc");
    EXPECT_EQ(ReadString(snapshot, 10), "def");
}

TEST(ChunkQueueTest, SnapshotSharesChunkBytes) {
    ChunkQueue queue;
    queue.Append(MakeChunk("abc"));

    ChunkQueue snapshot = queue;
    EXPECT_EQ(snapshot.ChunkAt(0).get(), queue.ChunkAt(0).get());
}

TEST(ChunkQueueTest, StructuralEquality) {
    ChunkQueue a;
    a.Append(MakeChunk("abc"));
    a.Append(MakeChunk("de"));

    ChunkQueue b;
    b.Append(MakeChunk("abc"));
    b.Append(MakeChunk("de"));
    EXPECT_EQ(a, b);

    // Same byte stream, different chunking
    ChunkQueue c;
    c.Append(MakeChunk("ab"));
    c.Append(MakeChunk("cde"));
    EXPECT_NE(a, c);

    b.Consume(1);
    EXPECT_NE(a, b);
}

TEST(ChunkQueueTest, ClearResetsState) {
    ChunkQueue queue;
    queue.Append(MakeChunk("abc"));
    queue.Consume(1);
    queue.Clear();

    EXPECT_TRUE(queue.Empty());
    EXPECT_EQ(queue.Size(), 0);
    EXPECT_EQ(queue.HeadOffset(), 0);
}
