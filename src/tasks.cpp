#include "tasks.hpp"
#include <exception>
#include <stdexcept>

namespace tasks {

TaskExecutor::TaskExecutor(std::size_t worker_count, std::size_t capacity, ErrorHandler on_error)
    : capacity_(capacity), on_error_(std::move(on_error)) {
    if (worker_count == 0) {
        throw std::invalid_argument("worker_count must be > 0");
    }
    if (capacity == 0) {
        throw std::invalid_argument("capacity must be > 0");
    }
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&TaskExecutor::worker_loop, this);
    }
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

bool TaskExecutor::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || tasks_.size() >= capacity_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void TaskExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        std::queue<std::function<void()>> empty;
        std::swap(tasks_, empty);
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

std::size_t TaskExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TaskExecutor::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return stopping_ || !tasks_.empty(); });
            if (stopping_) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        try {
            task();
        } catch (const std::exception& e) {
            if (on_error_) on_error_(e.what());
        }
    }
}

} // namespace tasks
