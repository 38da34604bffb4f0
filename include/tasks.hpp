#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace tasks {

// Fixed set of workers draining a bounded FIFO queue
class TaskExecutor {
public:
    using ErrorHandler = std::function<void(const std::string&)>;

    TaskExecutor(std::size_t worker_count, std::size_t capacity, ErrorHandler on_error = nullptr);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    // False when the queue is full or the executor is shutting down
    bool submit(std::function<void()> task);

    // Finishes running tasks, drops queued ones, joins the workers
    void shutdown();

    std::size_t pending() const;

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t capacity_;
    ErrorHandler on_error_;
    bool stopping_{false};
};

} // namespace tasks
