#include "transfer/write_buffer.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <random>

namespace {
    // feeds data in the given chunk sizes, checks tiling and content, returns segment count
    size_t feedAndCheck(const std::vector<char>& data, const std::vector<size_t>& chunkSizes, size_t unit) {
        WriteBuffer buffer(unit);
        std::vector<Segment> segments;
        size_t pos = 0;
        for (size_t size : chunkSizes) {
            for (Segment& s : buffer.accept(data.data() + pos, size)) {
                EXPECT_EQ(s.bytes.size(), unit);
                segments.push_back(std::move(s));
            }
            pos += size;
            EXPECT_LT(buffer.pending(), unit);
        }
        std::optional<Segment> last = buffer.flushRemainder();
        if (last) {
            EXPECT_GT(last->bytes.size(), 0u);
            EXPECT_LE(last->bytes.size(), unit);
            segments.push_back(std::move(*last));
        }
        EXPECT_EQ(buffer.pending(), 0u);

        std::vector<char> joined;
        uint64_t expectedOffset = 0;
        for (const Segment& s : segments) {
            EXPECT_EQ(s.offset, expectedOffset);
            expectedOffset += s.bytes.size();
            joined.insert(joined.end(), s.bytes.begin(), s.bytes.end());
        }
        EXPECT_EQ(joined, std::vector<char>(data.begin(), data.begin() + pos));
        return segments.size();
    }
}

TEST(WriteBufferTest, SmallChunksAreReassembledIntoFullUnits) {
    std::vector<char> data = makeObject(100);
    EXPECT_EQ(feedAndCheck(data, std::vector<size_t>(10, 10), 32), 4u);   // 3 x 32 + 4
}

TEST(WriteBufferTest, LargeChunkIsSlicedWithoutWaiting) {
    WriteBuffer buffer(16);
    std::vector<char> data = makeObject(50);
    std::vector<Segment> segments = buffer.accept(data);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[2].offset, 32u);
    EXPECT_EQ(buffer.pending(), 2u);
    EXPECT_EQ(buffer.nextOffset(), 48u);
}

TEST(WriteBufferTest, ExactUnitsLeaveNothingToFlush) {
    WriteBuffer buffer(8);
    std::vector<char> data = makeObject(8);
    EXPECT_EQ(buffer.accept(data).size(), 1u);
    EXPECT_EQ(buffer.accept(data).size(), 1u);
    EXPECT_FALSE(buffer.flushRemainder().has_value());
}

TEST(WriteBufferTest, RemainderIsFlushedOnceAtTheEnd) {
    WriteBuffer buffer(10);
    std::vector<char> data = makeObject(7);
    EXPECT_TRUE(buffer.accept(data).empty());
    std::optional<Segment> last = buffer.flushRemainder();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->offset, 0u);
    EXPECT_EQ(last->bytes, data);
    EXPECT_FALSE(buffer.flushRemainder().has_value());
}

TEST(WriteBufferTest, EmptyChunkYieldsNothing) {
    WriteBuffer buffer(4);
    EXPECT_TRUE(buffer.accept(nullptr, 0).empty());
    EXPECT_FALSE(buffer.flushRemainder().has_value());
}

TEST(WriteBufferTest, TilingHoldsForRandomChunkSequences) {
    std::mt19937 rng(1234);
    for (int round = 0; round < 50; ++round) {
        size_t unit = 1 + rng() % 97;
        std::vector<size_t> sizes;
        size_t total = 0;
        for (int i = 0; i < 40; ++i) {
            size_t size = rng() % 250;
            sizes.push_back(size);
            total += size;
        }
        feedAndCheck(makeObject(total), sizes, unit);
    }
}

TEST(WriteBufferTest, ZeroWriteUnitIsRejectedWithoutThrowing) {
    Result<std::unique_ptr<WriteBuffer>> buffer = WriteBuffer::create(0);
    EXPECT_FALSE(buffer.success);
    EXPECT_EQ(buffer.kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(buffer.data, nullptr);

    Result<std::unique_ptr<WriteBuffer>> usable = WriteBuffer::create(4096);
    ASSERT_TRUE(usable.success);
    EXPECT_EQ(usable.data->writeUnit(), 4096u);
}
