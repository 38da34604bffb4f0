#pragma once

#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "transport.hpp"

namespace testing_support {

// Scripted HttpTransport: every request is recorded and answered by `reply`
class FakeTransport : public transport::HttpTransport {
public:
    using Reply = std::function<transport::HttpResult(const transport::HttpRequest&)>;

    explicit FakeTransport(Reply reply = nullptr) : reply_(std::move(reply)) {}

    void set_reply(Reply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        reply_ = std::move(reply);
    }

    transport::HttpResult perform(const transport::HttpRequest& request) override {
        Reply reply;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            requests_.back().upload = nullptr;
            reply = reply_;
        }
        if (request.upload) {
            std::string payload(request.upload_size, '\0');
            request.upload->read(&payload[0], static_cast<std::streamsize>(payload.size()));
            std::lock_guard<std::mutex> lock(mutex_);
            uploads_.push_back(payload);
        }
        if (!reply) throw std::runtime_error("connection refused");
        return reply(request);
    }

    std::vector<transport::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<std::string> uploads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploads_;
    }

    std::size_t count_path(const std::string& fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& r : requests_) {
            if (r.target.find(fragment) != std::string::npos) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    Reply reply_;
    std::vector<transport::HttpRequest> requests_;
    std::vector<std::string> uploads_;
};

inline transport::HttpResult json_reply(const std::string& body, int status = 200) {
    transport::HttpResult result;
    result.status = status;
    result.content = body;
    return result;
}

inline bool path_is(const transport::HttpRequest& request, const std::string& op) {
    return request.target.find("/cloudcenter/conversionNew/" + op) == 0;
}

// Value of a multipart text field in the request preamble
inline std::string form_field(const transport::HttpRequest& request, const std::string& name) {
    std::string marker = "name=\"" + name + "\"\r\n\r\n";
    auto start = request.body.find(marker);
    if (start == std::string::npos) return "";
    start += marker.size();
    auto end = request.body.find("\r\n", start);
    return request.body.substr(start, end - start);
}

} // namespace testing_support
