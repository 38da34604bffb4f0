#include "activity_log.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <iostream>

namespace logging {

namespace {

constexpr std::size_t kStatusLimit = 80;
constexpr std::size_t kStatusKeep = 77;

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::string format_line(const std::string& message, std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    return fmt::format("[{:%Y-%m-%d %H:%M:%S}] {}", fmt::localtime(t), message);
}

std::string status_text(const std::string& message) {
    // Count code points, not bytes: most messages are CJK
    std::size_t points = 0;
    std::size_t cut = message.size();
    for (std::size_t i = 0; i < message.size(); ++i) {
        if (is_continuation(static_cast<unsigned char>(message[i]))) continue;
        if (points == kStatusKeep) cut = i;
        ++points;
    }
    if (points < kStatusLimit) return message;
    return message.substr(0, cut) + "...";
}

void ActivityLog::add_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void ActivityLog::append(const std::string& message) {
    std::string line = format_line(message, std::chrono::system_clock::now());
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink(line, message);
    }
}

StatusCallback ActivityLog::callback() {
    return [this](const std::string& message) { append(message); };
}

Sink stderr_sink() {
    return [](const std::string& line, const std::string& /*message*/) {
        std::clog << line << "\n";
    };
}

} // namespace logging
