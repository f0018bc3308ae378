#include "metrics_collector.hpp"

TransferResult MetricsCollector::summarize(const TransferCursor& cursor, std::chrono::duration<double> elapsed) {
    TransferResult result;
    result.elapsedSeconds = elapsed.count();
    result.bytesWritten = cursor.bytesWritten;
    result.writeOperations = cursor.writeOperations;

    if (result.elapsedSeconds > 0 && cursor.writeOperations > 0) {
        result.throughputMeasurable = true;
        result.throughputBytesPerSec = static_cast<double>(cursor.bytesWritten) / result.elapsedSeconds;
        result.operationsPerSec = static_cast<double>(cursor.writeOperations) / result.elapsedSeconds;
    }

    if (cursor.writeOperations > 0) {
        result.averageWriteSize = static_cast<double>(cursor.bytesWritten) / static_cast<double>(cursor.writeOperations);
    }
    return result;
}
