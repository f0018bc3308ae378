#pragma once
#include <chrono>
#include "transfer_types.hpp"

class MetricsCollector {
public:
    using clock = std::chrono::steady_clock;

    void start() { start_ = clock::now(); }
    std::chrono::duration<double> elapsed() const { return clock::now() - start_; }

    // no elapsed time or no writes leaves throughput and operation rate unmeasurable
    static TransferResult summarize(const TransferCursor& cursor, std::chrono::duration<double> elapsed);

private:
    clock::time_point start_ = clock::now();
};
