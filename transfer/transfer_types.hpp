#pragma once
#include <cstdint>
#include <string>

// how the source is read: one write unit per range request (single shot),
// or small fixed windows reassembled by the WriteBuffer (streaming)
enum class FetchPolicy { Aligned, Streaming };

struct TransferRequest {
    const std::string bucket;
    const std::string key;
    const uint64_t declaredSize;
    const std::string destinationPath;
    const uint64_t requestedWriteUnit;
};

struct TransferOptions {
    FetchPolicy policy = FetchPolicy::Aligned;
    uint64_t fetchWindow = 0;   // streaming only; 0 -> Config::DEFAULT_FETCH_WINDOW
    bool pipeline = false;      // prefetch on a worker thread
    size_t prefetchDepth = 0;   // 0 -> Config::PREFETCH_DEPTH
};

// owned by the orchestrator for one run
// bytesWritten <= bytesFetched <= declaredSize at every step
struct TransferCursor {
    uint64_t bytesFetched = 0;
    uint64_t bytesWritten = 0;
    uint64_t writeOperations = 0;
    uint64_t fetchOperations = 0;
};

struct TransferResult {
    double elapsedSeconds = 0;
    uint64_t bytesWritten = 0;
    uint64_t writeOperations = 0;
    bool throughputMeasurable = false;   // false when no time elapsed or nothing was written
    double throughputBytesPerSec = 0;
    double operationsPerSec = 0;
    double averageWriteSize = 0;

    uint64_t effectiveWriteUnit = 0;
    uint64_t declaredSize = 0;
    bool sizeMismatch = false;           // source delivered fewer bytes than declared
    std::string sha256;
    std::string md5;
};
