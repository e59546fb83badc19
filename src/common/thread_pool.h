#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool for running independent analysis branches

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace rootscope {

/// @brief Runs submitted branches on a fixed set of workers.
///
/// Branches queued before destruction still run; the destructor drains the
/// queue and joins every worker.
class ThreadPool {
public:
    /// @param workers Number of worker threads, at least one is started
    explicit ThreadPool(size_t workers);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// @brief Queue a branch. Its result, or the exception it threw, arrives
    /// through the returned future.
    template <typename Fn>
    std::future<std::invoke_result_t<Fn>> Submit(Fn&& branch);

private:
    void Run();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable ready_;
    bool shutting_down_ = false;
};

template <typename Fn>
std::future<std::invoke_result_t<Fn>> ThreadPool::Submit(Fn&& branch) {
    using Result = std::invoke_result_t<Fn>;

    // std::function needs a copyable target, so the task lives behind a shared_ptr
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(branch));
    std::future<Result> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.emplace_back([task]() { (*task)(); });
    }
    ready_.notify_one();
    return result;
}

}  // namespace rootscope
