#pragma once
#include <atomic>
#include <memory>
#include "range_fetcher.hpp"
#include "../common/chunk_channel.hpp"
#include "../common/thread_pool.hpp"

// Runs a RangeFetcher on a single worker pool, PREFETCH_DEPTH chunks ahead of the
// writer. Chunks and errors come out in fetch order.
class PrefetchingFetcher : public ChunkSource {
public:
    PrefetchingFetcher(std::unique_ptr<RangeFetcher> fetcher, size_t depth);
    ~PrefetchingFetcher() override;
    PrefetchingFetcher(const PrefetchingFetcher&) = delete;
    PrefetchingFetcher& operator=(const PrefetchingFetcher&) = delete;

    Result<Chunk> next() override;

    // stops the worker after its current fetch; next() then reports end of data
    void stop();

private:
    void run();

    std::unique_ptr<RangeFetcher> fetcher_;
    ChunkChannel<Result<Chunk>> channel_;
    std::atomic<bool> stopping_;
    bool exhausted_;
    ThreadPool worker_;
};
