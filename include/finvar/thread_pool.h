#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace finvar {

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * @brief Workers for the analysis stages (sheet probes, statement matching).
 *
 * Tasks are nullary callables; a task's result or exception is delivered
 * through its future. Tasks must not wait on each other's futures, so the
 * analyzer submits one stage and collects it before starting the next.
 * The destructor finishes queued tasks before joining.
 */
class ThreadPool {
public:
    // threads <= 0 uses the hardware concurrency
    explicit ThreadPool(int threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<class Task>
    std::future<std::invoke_result_t<Task>> submit(Task task);

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable ready_;
    bool closed_ = false;

    void run();
};

template<class Task>
std::future<std::invoke_result_t<Task>> ThreadPool::submit(Task task) {
    using Result = std::invoke_result_t<Task>;

    // std::function needs a copyable target; the packaged_task is shared
    auto job = std::make_shared<std::packaged_task<Result()>>(std::move(task));
    std::future<Result> result = job->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw std::logic_error("ThreadPool::submit after shutdown");
        }
        queue_.emplace_back([job] { (*job)(); });
    }
    ready_.notify_one();
    return result;
}

}  // namespace finvar
