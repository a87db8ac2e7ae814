#include <conform/platform/thread_pool.h>

#include <algorithm>

namespace conform::platform {

ThreadPool::ThreadPool(size_t workers)
    : worker_count_(std::max<size_t>(workers, 1)) {
    workers_.reserve(worker_count_);
    for (size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { run(stop); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::push(Task task) {
    std::unique_lock lock(mutex_);
    if (!accepting_) {
        throw std::runtime_error("thread pool no longer accepts tasks");
    }
    queue_.push_back(std::move(task));
    lock.unlock();
    ready_.notify_one();
}

size_t ThreadPool::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

bool ThreadPool::accepting() const {
    std::lock_guard lock(mutex_);
    return accepting_;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        accepting_ = false;
    }
    ready_.notify_all();
    // Destroying a jthread requests stop and joins it.
    workers_.clear();
}

std::optional<ThreadPool::Task> ThreadPool::next_task(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    ready_.wait(lock, stop, [this]() { return !accepting_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    Task task = std::move(queue_.front());
    queue_.pop_front();
    return task;
}

void ThreadPool::run(std::stop_token stop) {
    // A stop request alone does not abandon queued work.
    while (auto task = next_task(stop)) {
        (*task)();
    }
}

} // namespace conform::platform
