#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// Bounded single producer / single consumer queue.
// finish() lets the consumer drain what is queued; close() drops everything
// and releases a producer blocked on a full queue.
template<typename T>
class ChunkChannel {
public:
    explicit ChunkChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // blocks while full; false once the channel is closed
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [this]() {
            return closed_ || finished_ || items_.size() < capacity_;
        });
        if (closed_ || finished_) return false;
        items_.push_back(std::move(item));
        notEmpty_.notify_one();
        return true;
    }

    // blocks while empty; false once closed, or finished and drained
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this]() {
            return closed_ || finished_ || !items_.empty();
        });
        if (closed_ || items_.empty()) return false;
        item = std::move(items_.front());
        items_.pop_front();
        notFull_.notify_one();
        return true;
    }

    void finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        items_.clear();
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    size_t capacity_;
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    bool finished_ = false;
    bool closed_ = false;
};
