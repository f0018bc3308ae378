#pragma once
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

// Fixed set of workers draining a task queue. The prefetcher runs its fetch
// loop as the single task of a one worker pool.
class ThreadPool {
public:
    ThreadPool(size_t threads, std::string name);
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))>;

    // stops accepting work, runs what is queued, joins the workers
    void shutdown();
    size_t busyWorkers() const;
    ~ThreadPool();

private:
    void workerLoop();

    std::string name_;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    size_t busy_ = 0;
    bool stop = false;
};

// submitting the task
template<class F, class... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))> {
    using return_type = decltype(f(args...));

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();
    {
        std::unique_lock<std::mutex> lock(queue_mutex);

        if (stop)
            throw std::runtime_error("submit on stopped ThreadPool " + name_);

        tasks.emplace([task]() { (*task)(); });
    }
    condition.notify_one();
    return res;
}
