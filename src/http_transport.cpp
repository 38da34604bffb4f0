#include "transport.hpp"
#include <algorithm>
#include <array>
#include <future>
#include <limits>
#include <stdexcept>
#include <vector>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace transport {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr std::size_t kUploadChunk = 64 * 1024; // 64KB per write
constexpr std::size_t kReadChunk = 8192;

// getaddrinfo cannot be interrupted once it starts. Lookups run here so a
// stuck one is abandoned by its caller instead of holding the connection's
// io_context (whose destructor would join it).
net::thread_pool& lookup_pool() {
    static net::thread_pool pool(1);
    return pool;
}

// One HTTP/1.1 exchange. Every socket operation runs against a fresh
// deadline, so a stalled peer surfaces as beast::error::timeout.
class Connection {
public:
    explicit Connection(std::chrono::milliseconds timeout) : timeout_(timeout) {
        parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
    }

    ~Connection() { close(); }

    void connect(const std::string& host, const std::string& port) {
        auto endpoints = resolve(host, port);
        await("connect", [&](auto&& handler) {
            stream_.async_connect(endpoints, std::forward<decltype(handler)>(handler));
        });
    }

    void write_request(const HttpRequest& request) {
        http::request<http::empty_body> req{request.method, request.target, 11};
        req.set(http::field::host, request.authority);
        for (const auto& [name, value] : request.headers) {
            req.set(name, value);
        }
        auto length = request.content_length();
        if (length > 0 || request.method != http::verb::get) {
            req.content_length(length);
        }

        http::request_serializer<http::empty_body> serializer{req};
        await("write", [&](auto&& handler) {
            http::async_write_header(stream_, serializer, std::forward<decltype(handler)>(handler));
        });

        write_raw(request.body.data(), request.body.size());

        if (request.upload && request.upload_size > 0) {
            std::vector<char> buffer(kUploadChunk);
            std::uint64_t remaining = request.upload_size;
            while (remaining > 0) {
                auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
                request.upload->read(buffer.data(), want);
                std::streamsize got = request.upload->gcount();
                if (got <= 0) {
                    throw std::runtime_error("upload source ended before the announced size");
                }
                write_raw(buffer.data(), static_cast<std::size_t>(got));
                remaining -= static_cast<std::uint64_t>(got);
            }
        }

        write_raw(request.trailer.data(), request.trailer.size());
    }

    int read_status() {
        await("read", [&](auto&& handler) {
            http::async_read_header(stream_, buffer_, parser_, std::forward<decltype(handler)>(handler));
        });
        return static_cast<int>(parser_.get().result_int());
    }

    std::size_t read_body(char* data, std::size_t size) {
        while (!parser_.is_done()) {
            parser_.get().body().data = data;
            parser_.get().body().size = size;

            beast::error_code ec;
            stream_.expires_after(timeout_);
            http::async_read(stream_, buffer_, parser_,
                             [&ec](const beast::error_code& e, std::size_t) { ec = e; });
            run();
            if (ec == http::error::need_buffer) ec = {};
            if (ec) throw beast::system_error(ec, "read");

            std::size_t filled = size - parser_.get().body().size;
            if (filled > 0) return filled;
        }
        return 0;
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

private:
    tcp::resolver::results_type resolve(const std::string& host, const std::string& port) {
        tcp::resolver resolver(lookup_pool().get_executor());
        auto pending = resolver.async_resolve(host, port, net::use_future);
        if (pending.wait_for(timeout_) != std::future_status::ready) {
            resolver.cancel();
            throw beast::system_error(beast::error::timeout, "resolve");
        }
        try {
            return pending.get();
        } catch (const boost::system::system_error& e) {
            throw beast::system_error(e.code(), "resolve");
        }
    }

    void write_raw(const char* data, std::size_t size) {
        if (size == 0) return;
        await("write", [&](auto&& handler) {
            net::async_write(stream_, net::buffer(data, size), std::forward<decltype(handler)>(handler));
        });
    }

    template <class Start>
    void await(const char* what, Start&& start) {
        beast::error_code ec;
        stream_.expires_after(timeout_);
        start([&ec](const beast::error_code& e, auto&&...) { ec = e; });
        run();
        if (ec) throw beast::system_error(ec, what);
    }

    void run() {
        ioc_.restart();
        ioc_.run();
    }

    std::chrono::milliseconds timeout_;
    net::io_context ioc_;
    beast::tcp_stream stream_{ioc_};
    beast::flat_buffer buffer_;
    http::response_parser<http::buffer_body> parser_;
};

class ConnectionBodyStream : public BodyStream {
public:
    explicit ConnectionBodyStream(std::unique_ptr<Connection> connection)
        : connection_(std::move(connection)) {}

    std::size_t read_some(char* data, std::size_t size) override {
        return connection_->read_body(data, size);
    }

private:
    std::unique_ptr<Connection> connection_;
};

} // namespace

BeastTransport::BeastTransport(std::chrono::milliseconds timeout) : timeout_(timeout) {}

HttpResult BeastTransport::perform(const HttpRequest& request) {
    auto connection = std::make_unique<Connection>(timeout_);
    connection->connect(request.host, request.port);
    connection->write_request(request);

    HttpResult result;
    result.status = connection->read_status();

    if (request.stream_response) {
        result.stream = std::make_shared<ConnectionBodyStream>(std::move(connection));
        return result;
    }

    std::array<char, kReadChunk> chunk;
    std::size_t n;
    while ((n = connection->read_body(chunk.data(), chunk.size())) > 0) {
        result.content.append(chunk.data(), n);
    }
    return result;
}

} // namespace transport
