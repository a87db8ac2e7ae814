#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace conform::platform {

// Fixed set of workers taking tasks from one FIFO queue. Tasks start in
// submission order; each result or exception comes back through its future.
class ThreadPool {
public:
    // Zero workers is treated as one.
    explicit ThreadPool(size_t workers);

    // Runs everything still queued, then joins.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error once the pool has been shut down.
    template<typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    size_t size() const { return worker_count_; }
    size_t pending() const;
    bool accepting() const;

    // Refuses new work, lets the workers finish the queue, and joins them.
    // Safe to call more than once.
    void shutdown();

private:
    using Task = std::function<void()>;

    void push(Task task);
    std::optional<Task> next_task(std::stop_token stop);
    void run(std::stop_token stop);

    mutable std::mutex mutex_;
    std::condition_variable_any ready_;
    std::deque<Task> queue_;
    bool accepting_ = true;
    size_t worker_count_ = 0;
    std::vector<std::jthread> workers_;
};

template<typename F>
auto ThreadPool::submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;
    auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
    std::future<Result> result = packaged->get_future();
    push([packaged]() { (*packaged)(); });
    return result;
}

} // namespace conform::platform
