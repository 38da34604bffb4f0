#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include "dispatch.hpp"

namespace testing_support {

// Stands in for the GUI main loop: tasks posted from any thread run when the
// test thread drains the queue
class ControlQueue {
public:
    dispatch::Dispatcher dispatcher() {
        return [this](dispatch::Task task) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                tasks_.push_back(std::move(task));
            }
            cv_.notify_all();
        };
    }

    std::size_t drain() {
        std::size_t ran = 0;
        while (true) {
            dispatch::Task task;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (tasks_.empty()) return ran;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
            ++ran;
        }
    }

    std::size_t pending() {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    // Drains until pred() holds or the timeout elapses
    bool run_until(const std::function<bool()>& pred,
                   std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            drain();
            if (pred()) return true;
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(10), [this] { return !tasks_.empty(); });
        }
        drain();
        return pred();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<dispatch::Task> tasks_;
};

} // namespace testing_support
