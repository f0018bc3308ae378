#pragma once
#include <functional>
#include <memory>
#include "cancellation_token.hpp"
#include "metrics_collector.hpp"
#include "transfer_types.hpp"
#include "write_buffer.hpp"
#include "../common/result.hpp"
#include "../common/stream_digest.hpp"
#include "../destination/share_client.hpp"
#include "../source/object_store.hpp"
#include "../source/range_fetcher.hpp"

// mounted share the transfer writes into
struct SinkTarget {
    uint32_t treeId;
    uint32_t maxWriteSize;
};

// Drives fetch -> buffer -> write for one object. Writes go out in strictly
// increasing offset order; the destination file is closed exactly once on
// every exit path. A failed run leaves a truncated file and must be redone
// from offset 0.
class TransferOrchestrator {
public:
    using ProgressCallback = std::function<void(const TransferCursor&, uint64_t declaredSize)>;

    TransferOrchestrator(ObjectStore& source, ShareClient& sink, TransferOptions options,
                         const CancellationToken& cancel);

    void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

    Result<TransferResult> run(const TransferRequest& request, const SinkTarget& target);

    // counters of the last run, also after a failure
    const TransferCursor& cursor() const { return cursor_; }

private:
    std::unique_ptr<ChunkSource> makeChunkSource(const TransferRequest& request, uint64_t writeUnit) const;
    Result<void> writeSegment(uint64_t fileId, const Segment& segment, StreamDigest& digest, uint64_t declaredSize);

    ObjectStore& source_;
    ShareClient& sink_;
    TransferOptions options_;
    const CancellationToken& cancel_;
    ProgressCallback progress_;
    TransferCursor cursor_;
};
