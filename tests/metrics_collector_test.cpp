#include "transfer/metrics_collector.hpp"
#include <gtest/gtest.h>

TEST(MetricsCollectorTest, ZeroElapsedIsNotMeasurable) {
    TransferCursor cursor;
    cursor.bytesWritten = 4096;
    cursor.writeOperations = 2;

    TransferResult result = MetricsCollector::summarize(cursor, std::chrono::duration<double>(0));

    EXPECT_FALSE(result.throughputMeasurable);
    EXPECT_EQ(result.throughputBytesPerSec, 0.0);
    EXPECT_EQ(result.operationsPerSec, 0.0);
    EXPECT_EQ(result.averageWriteSize, 2048.0);
}

TEST(MetricsCollectorTest, RatesFollowElapsedTime) {
    TransferCursor cursor;
    cursor.bytesWritten = 1000000;
    cursor.writeOperations = 16;

    TransferResult result = MetricsCollector::summarize(cursor, std::chrono::duration<double>(2.0));

    EXPECT_TRUE(result.throughputMeasurable);
    EXPECT_DOUBLE_EQ(result.throughputBytesPerSec, 500000.0);
    EXPECT_DOUBLE_EQ(result.operationsPerSec, 8.0);
    EXPECT_DOUBLE_EQ(result.averageWriteSize, 62500.0);
    EXPECT_EQ(result.bytesWritten, 1000000u);
    EXPECT_EQ(result.writeOperations, 16u);
}

TEST(MetricsCollectorTest, NoWritesMeansZeroAverage) {
    TransferResult result = MetricsCollector::summarize(TransferCursor{}, std::chrono::duration<double>(1.5));
    EXPECT_EQ(result.writeOperations, 0u);
    EXPECT_FALSE(result.throughputMeasurable);
    EXPECT_EQ(result.averageWriteSize, 0.0);
    EXPECT_EQ(result.operationsPerSec, 0.0);
}

TEST(MetricsCollectorTest, ElapsedIsMonotonic) {
    MetricsCollector metrics;
    metrics.start();
    std::chrono::duration<double> first = metrics.elapsed();
    std::chrono::duration<double> second = metrics.elapsed();
    EXPECT_GE(first.count(), 0.0);
    EXPECT_GE(second.count(), first.count());
}
