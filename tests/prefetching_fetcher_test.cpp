#include "source/prefetching_fetcher.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

TEST(PrefetchingFetcherTest, DeliversChunksInFetchOrder) {
    FakeObjectStore store(makeObject(1000));
    PrefetchingFetcher fetcher(std::make_unique<RangeFetcher>(store, "b", "k", 1000, 64), 2);

    std::vector<char> joined;
    for (;;) {
        Result<Chunk> chunk = fetcher.next();
        ASSERT_TRUE(chunk.success);
        if (chunk.data.bytes.empty()) break;
        EXPECT_EQ(chunk.data.offset, joined.size());
        joined.insert(joined.end(), chunk.data.bytes.begin(), chunk.data.bytes.end());
    }
    EXPECT_EQ(joined, makeObject(1000));
    EXPECT_TRUE(fetcher.next().data.bytes.empty());
}

TEST(PrefetchingFetcherTest, ForwardsErrorsAfterEarlierChunks) {
    FakeObjectStore store(makeObject(500));
    store.failOnRead = 4;
    PrefetchingFetcher fetcher(std::make_unique<RangeFetcher>(store, "b", "k", 500, 100), 4);

    for (int i = 0; i < 3; ++i) {
        Result<Chunk> chunk = fetcher.next();
        ASSERT_TRUE(chunk.success);
        EXPECT_EQ(chunk.data.offset, static_cast<uint64_t>(i) * 100);
    }
    Result<Chunk> failed = fetcher.next();
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.kind, ErrorKind::SourceReadFailure);
}

TEST(PrefetchingFetcherTest, StopReleasesABlockedWorker) {
    FakeObjectStore store(makeObject(10000));
    PrefetchingFetcher fetcher(std::make_unique<RangeFetcher>(store, "b", "k", 10000, 10), 1);
    ASSERT_TRUE(fetcher.next().success);
    fetcher.stop();
    Result<Chunk> after = fetcher.next();
    EXPECT_FALSE(after.success);
    EXPECT_EQ(after.kind, ErrorKind::Cancelled);
    EXPECT_LT(store.ranges.size(), 1000u);
}
