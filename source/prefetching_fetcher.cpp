#include "prefetching_fetcher.hpp"
#include "../common/logger.hpp"

PrefetchingFetcher::PrefetchingFetcher(std::unique_ptr<RangeFetcher> fetcher, size_t depth)
    : fetcher_(std::move(fetcher)), channel_(depth), stopping_(false), exhausted_(false), worker_(1, "Prefetch") {
    worker_.submit([this]() { run(); });
}

PrefetchingFetcher::~PrefetchingFetcher() {
    stop();
}

void PrefetchingFetcher::stop() {
    stopping_ = true;
    channel_.close();
    if (worker_.busyWorkers() > 0) Logger::debug("Prefetch", "Waiting for the fetch in flight");
    worker_.shutdown();
}

void PrefetchingFetcher::run() {
    while (!stopping_) {
        Result<Chunk> chunk = fetcher_->next();
        bool last = !chunk.success || chunk.data.bytes.empty();
        if (!channel_.push(std::move(chunk))) return;
        if (last) break;
    }
    channel_.finish();
    Logger::debug("Prefetch", "Worker finished after " + std::to_string(fetcher_->fetchCount()) + " fetches");
}

Result<Chunk> PrefetchingFetcher::next() {
    if (exhausted_) return Result<Chunk>::Ok(Chunk{0, {}});

    Result<Chunk> chunk = Result<Chunk>::Ok(Chunk{});
    if (!channel_.pop(chunk)) {
        exhausted_ = true;
        if (stopping_) return Result<Chunk>::Error(ErrorKind::Cancelled, "Prefetch stopped");
        return Result<Chunk>::Ok(Chunk{0, {}});
    }
    if (!chunk.success || chunk.data.bytes.empty()) exhausted_ = true;
    return chunk;
}
