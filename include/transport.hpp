#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>
#include "endpoint.hpp"

namespace transport {

// Pull-based view of a response body that is still on the wire
class BodyStream {
public:
    virtual ~BodyStream() = default;

    // Fills at most `size` bytes; 0 means the body is exhausted. Throws on I/O errors.
    virtual std::size_t read_some(char* data, std::size_t size) = 0;
};

using ChunkSink = std::function<void(const char*, std::size_t)>;

struct TransferResponse {
    int status_code = 500;
    nlohmann::json body = nlohmann::json::object();  // empty object when the payload is not JSON
    std::string content;                             // buffered payload (empty for streamed responses)
    std::shared_ptr<BodyStream> stream;              // set only for streamed responses

    bool ok() const { return status_code == 200; }

    // Feeds the payload to `sink` in pieces of at most chunk_size bytes
    void iter_content(std::size_t chunk_size, const ChunkSink& sink) const;
};

struct HttpRequest {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    std::string url;      // reported on failure
    std::string host;     // resolver name
    std::string port;
    std::string authority;
    std::string target;   // path and query
    std::vector<std::pair<std::string, std::string>> headers;

    // Payload: body, then upload_size bytes pulled from upload, then trailer
    std::string body;
    std::istream* upload = nullptr;
    std::uint64_t upload_size = 0;
    std::string trailer;

    bool stream_response = false;

    std::uint64_t content_length() const;
};

struct HttpResult {
    int status = 0;
    std::string content;
    std::shared_ptr<BodyStream> stream;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // One request/response exchange. Throws on any transport failure.
    virtual HttpResult perform(const HttpRequest& request) = 0;
};

// Boost.Beast over plain TCP, one connection per request
class BeastTransport : public HttpTransport {
public:
    explicit BeastTransport(std::chrono::milliseconds timeout = std::chrono::seconds(5));
    HttpResult perform(const HttpRequest& request) override;

private:
    std::chrono::milliseconds timeout_;
};

struct TransportFailure {
    std::string what;
    std::string url;
};

using Outcome = std::variant<TransferResponse, TransportFailure>;

// Never throws: non-JSON or non-object payloads yield {}
nlohmann::json try_parse_json(const std::string& bytes);

// Synthetic reply substituted for a failed exchange
TransferResponse failure_response();

using ErrorHandler = std::function<void(const std::string& what, const std::string& url)>;

class Client {
public:
    explicit Client(std::shared_ptr<HttpTransport> http, ErrorHandler on_error = nullptr);

    TransferResponse resolve_code(const endpoint::ServerEndpoint& server, const std::string& code);
    TransferResponse upload_file(const endpoint::ServerEndpoint& server, const std::string& code,
                                 const std::string& file_name, std::uint64_t file_size,
                                 std::istream& data);
    TransferResponse list_files(const endpoint::ServerEndpoint& server, const std::string& code);
    TransferResponse download_file(const endpoint::ServerEndpoint& server,
                                   const std::string& file_ids, bool stream = true);

    // Runs one request, reporting a failure to the error handler exactly once
    Outcome execute(const HttpRequest& request);

private:
    HttpRequest prepare(const endpoint::ServerEndpoint& server, const std::string& target,
                        bool x_requested, bool form) const;
    TransferResponse send(const HttpRequest& request);

    std::shared_ptr<HttpTransport> http_;
    ErrorHandler on_error_;
};

} // namespace transport
