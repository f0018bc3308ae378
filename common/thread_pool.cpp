#include "thread_pool.hpp"
#include "logger.hpp"

ThreadPool::ThreadPool(size_t threads, std::string name) : name_(std::move(name)) {
    for (size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this]() { workerLoop(); });
    }
    Logger::debug(name_, "Started " + std::to_string(threads) + " workers");
}

void ThreadPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        // lock
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            condition.wait(lock, [this]() {
                return stop || !tasks.empty();
            });

            if (stop && tasks.empty())
                return;

            task = std::move(tasks.front());
            tasks.pop();
            busy_++;
        }

        // packaged_task keeps exceptions in its future
        task();

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            busy_--;
        }
    }
}

size_t ThreadPool::busyWorkers() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return busy_;
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop && workers.empty()) return;
        stop = true;
    }
    condition.notify_all(); // Wake all threads
    for (std::thread &worker : workers) {
        if (worker.joinable()) worker.join();
    }
    workers.clear();
}

ThreadPool::~ThreadPool() {
    shutdown();
}
