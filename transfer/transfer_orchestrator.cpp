#include "transfer_orchestrator.hpp"
#include "size_negotiator.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../destination/destination_session.hpp"
#include "../source/prefetching_fetcher.hpp"

TransferOrchestrator::TransferOrchestrator(ObjectStore& source, ShareClient& sink, TransferOptions options,
                                           const CancellationToken& cancel)
    : source_(source), sink_(sink), options_(options), cancel_(cancel) {}

std::unique_ptr<ChunkSource> TransferOrchestrator::makeChunkSource(const TransferRequest& request, uint64_t writeUnit) const {
    uint64_t window = writeUnit;
    if (options_.policy == FetchPolicy::Streaming) {
        window = options_.fetchWindow > 0 ? options_.fetchWindow : Config::DEFAULT_FETCH_WINDOW;
    }

    auto fetcher = std::make_unique<RangeFetcher>(source_, request.bucket, request.key, request.declaredSize, window);
    if (!options_.pipeline) return fetcher;

    size_t depth = options_.prefetchDepth > 0 ? options_.prefetchDepth : Config::PREFETCH_DEPTH;
    return std::make_unique<PrefetchingFetcher>(std::move(fetcher), depth);
}

Result<void> TransferOrchestrator::writeSegment(uint64_t fileId, const Segment& segment, StreamDigest& digest,
                                                uint64_t declaredSize) {
    Result<uint32_t> written = sink_.write(fileId, segment.offset, segment.bytes.data(), segment.bytes.size());
    if (!written.success) {
        if (written.kind == ErrorKind::SinkWriteFailure || written.kind == ErrorKind::Cancelled) {
            return Result<void>::From(written);
        }
        return Result<void>::Error(ErrorKind::SinkWriteFailure,
                                   "Write at offset " + std::to_string(segment.offset) + " failed: " + written.describe());
    }

    cursor_.bytesWritten += segment.bytes.size();
    cursor_.writeOperations++;
    digest.update(segment.bytes.data(), segment.bytes.size());
    if (progress_) progress_(cursor_, declaredSize);
    return Result<void>::Ok();
}

Result<TransferResult> TransferOrchestrator::run(const TransferRequest& request, const SinkTarget& target) {
    cursor_ = TransferCursor{};

    Result<uint64_t> unit = SizeNegotiator::negotiate(static_cast<int64_t>(request.requestedWriteUnit),
                                                      static_cast<int64_t>(target.maxWriteSize));
    if (!unit.success) return Result<TransferResult>::From(unit);
    if (SizeNegotiator::isClamped(static_cast<int64_t>(request.requestedWriteUnit), target.maxWriteSize)) {
        Logger::warn("Transfer", "Requested write size (" + std::to_string(request.requestedWriteUnit / 1024) +
                                 "KB) exceeds destination max write size (" + std::to_string(target.maxWriteSize / 1024) +
                                 "KB), using " + std::to_string(unit.data / 1024) + "KB");
    }

    if (cancel_.cancelled()) {
        return Result<TransferResult>::Error(ErrorKind::Cancelled, "Cancelled before the destination file was opened");
    }

    Result<uint64_t> opened = sink_.openFile(target.treeId, request.destinationPath, DISPOSITION_OVERWRITE_IF);
    if (!opened.success) return Result<TransferResult>::From(opened);
    FileHandleGuard file(sink_, opened.data, request.destinationPath);
    Logger::info("Transfer", "Opened destination file: " + request.destinationPath);

    Result<std::unique_ptr<WriteBuffer>> buffer = WriteBuffer::create(unit.data);
    if (!buffer.success) return Result<TransferResult>::From(buffer);

    // failure path: release the source first, close the file, report the original cause
    std::unique_ptr<ChunkSource> chunks = makeChunkSource(request, unit.data);
    auto abortTransfer = [&](ErrorKind kind, const std::string& message) {
        chunks.reset();
        Result<void> closed = file.close();
        if (!closed.success) {
            Logger::warn("Transfer", "Close of " + request.destinationPath + " failed during abort: " + closed.describe());
        }
        Logger::error("Transfer", std::string(errorKindName(kind)) + ": " + message);
        return Result<TransferResult>::Error(kind, message);
    };

    StreamDigest digest;
    MetricsCollector metrics;
    metrics.start();

    Logger::info("Transfer", "Starting transfer with " + std::to_string(unit.data / 1024) + "KB write buffers...");

    for (;;) {
        if (cancel_.cancelled()) {
            return abortTransfer(ErrorKind::Cancelled, "Transfer cancelled after " + std::to_string(cursor_.bytesWritten) + " bytes");
        }

        Result<Chunk> chunk = chunks->next();
        if (!chunk.success) return abortTransfer(chunk.kind, chunk.message);
        if (chunk.data.bytes.empty()) break;

        cursor_.fetchOperations++;
        cursor_.bytesFetched += chunk.data.bytes.size();

        for (const Segment& segment : buffer.data->accept(chunk.data.bytes)) {
            Result<void> written = writeSegment(file.fileId(), segment, digest, request.declaredSize);
            if (!written.success) return abortTransfer(written.kind, written.message);
        }
    }

    std::optional<Segment> last = buffer.data->flushRemainder();
    if (last) {
        Result<void> written = writeSegment(file.fileId(), *last, digest, request.declaredSize);
        if (!written.success) return abortTransfer(written.kind, written.message);
    }
    chunks.reset();

    Result<void> closed = file.close();
    if (!closed.success) {
        // data may not be on the share yet, so this fails the transfer
        Logger::error("Transfer", "Close failed: " + closed.describe());
        return Result<TransferResult>::Error(ErrorKind::SinkWriteFailure, "Close failed: " + closed.message);
    }

    digest.finish();
    TransferResult result = MetricsCollector::summarize(cursor_, metrics.elapsed());
    result.effectiveWriteUnit = unit.data;
    result.declaredSize = request.declaredSize;
    result.sha256 = digest.sha256Hex();
    result.md5 = digest.md5Hex();

    if (cursor_.bytesFetched != request.declaredSize) {
        result.sizeMismatch = true;
        Logger::warn("Transfer", "Source delivered " + std::to_string(cursor_.bytesFetched) + " bytes, declared size was " +
                                 std::to_string(request.declaredSize) + "; the object changed during the transfer");
    }
    return Result<TransferResult>::Ok(result);
}
