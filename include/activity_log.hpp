#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace logging {

// Receives one user-facing message (category prefix included, no timestamp)
using StatusCallback = std::function<void(const std::string&)>;

// Sink: fully formatted line, raw message
using Sink = std::function<void(const std::string& line, const std::string& message)>;

// "[2025-01-31 08:00:00] message"
std::string format_line(const std::string& message, std::chrono::system_clock::time_point when);

// Status bar text: messages of 80+ code points are cut to 77 plus "..."
std::string status_text(const std::string& message);

class ActivityLog {
public:
    void add_sink(Sink sink);
    void append(const std::string& message);

    // Adapter for modules that report through a StatusCallback
    StatusCallback callback();

private:
    std::mutex mutex_;
    std::vector<Sink> sinks_;
};

// Mirrors every line to std::clog
Sink stderr_sink();

} // namespace logging
