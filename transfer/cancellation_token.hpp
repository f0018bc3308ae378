#pragma once
#include <atomic>

// set from a signal handler or another thread, polled by the transfer loop
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool cancelled() const noexcept { return cancelled_.load(); }
    void reset() noexcept { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};
