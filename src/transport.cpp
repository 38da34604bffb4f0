#include "transport.hpp"
#include "protocol/remote_api.hpp"
#include <algorithm>
#include <random>

namespace transport {

namespace http = boost::beast::http;

namespace {

constexpr std::size_t kDefaultChunk = 8192;

std::string make_boundary() {
    const char charset[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);
    std::string boundary;
    for (int i = 0; i < 32; ++i) {
        boundary += charset[dis(gen)];
    }
    return boundary;
}

// Quoted-string safe file name for Content-Disposition (raw UTF-8 otherwise)
std::string disposition_name(const std::string& name) {
    std::string out;
    for (char c : name) {
        if (c == '"') out += "%22";
        else if (c == '\r') out += "%0D";
        else if (c == '\n') out += "%0A";
        else out.push_back(c);
    }
    return out;
}

std::string form_part(const std::string& boundary, const std::string& name, const std::string& value) {
    return "--" + boundary + "\r\n"
           "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n" +
           value + "\r\n";
}

long long now_millis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

std::uint64_t HttpRequest::content_length() const {
    return body.size() + upload_size + trailer.size();
}

void TransferResponse::iter_content(std::size_t chunk_size, const ChunkSink& sink) const {
    if (chunk_size == 0) chunk_size = kDefaultChunk;

    if (stream) {
        std::vector<char> buffer(chunk_size);
        std::size_t n;
        while ((n = stream->read_some(buffer.data(), buffer.size())) > 0) {
            sink(buffer.data(), n);
        }
        return;
    }

    for (std::size_t offset = 0; offset < content.size(); offset += chunk_size) {
        sink(content.data() + offset, std::min(chunk_size, content.size() - offset));
    }
}

nlohmann::json try_parse_json(const std::string& bytes) {
    auto parsed = nlohmann::json::parse(bytes, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return nlohmann::json::object();
    }
    return parsed;
}

TransferResponse failure_response() {
    return TransferResponse{};
}

// ─── Client ─────────────────────────────────────────────────────────────────

Client::Client(std::shared_ptr<HttpTransport> http, ErrorHandler on_error)
    : http_(std::move(http)), on_error_(std::move(on_error)) {}

HttpRequest Client::prepare(const endpoint::ServerEndpoint& server, const std::string& target,
                            bool x_requested, bool form) const {
    HttpRequest request;
    request.host = server.connect_host();
    request.port = server.connect_port();
    request.authority = server.authority();
    request.target = target;
    request.url = "http://" + request.authority + target;

    std::string origin = "http://" + request.authority;
    request.headers = {
        {"Origin", origin},
        {"Referer", origin + protocol::kRefererPath},
        {"Accept-Language", protocol::kAcceptLanguage},
        {"User-Agent", protocol::kUserAgent},
        {"Cookie", protocol::kSystemCookie},
    };
    if (x_requested) {
        request.headers.emplace_back("X-Requested-With", "XMLHttpRequest");
    }
    if (form) {
        request.headers.emplace_back("Content-Type", protocol::kFormContentType);
    }
    return request;
}

TransferResponse Client::resolve_code(const endpoint::ServerEndpoint& server, const std::string& code) {
    auto request = prepare(server, protocol::operation_path(protocol::Operation::RESOLVE_CODE), true, true);
    request.method = http::verb::post;
    request.body = protocol::form_encode({{"code", code}});
    return send(request);
}

TransferResponse Client::upload_file(const endpoint::ServerEndpoint& server, const std::string& code,
                                     const std::string& file_name, std::uint64_t file_size,
                                     std::istream& data) {
    auto request = prepare(server, protocol::operation_path(protocol::Operation::UPLOAD_FILE), false, false);
    request.method = http::verb::post;

    std::string boundary = make_boundary();
    request.headers.emplace_back("Content-Type", "multipart/form-data; boundary=" + boundary);

    request.body = form_part(boundary, "name", file_name) +
                   form_part(boundary, "code", code) +
                   form_part(boundary, "hash", "") +
                   form_part(boundary, "size", std::to_string(file_size)) +
                   form_part(boundary, "fileName", file_name) +
                   "--" + boundary + "\r\n"
                   "Content-Disposition: form-data; name=\"Filedata\"; filename=\"" +
                   disposition_name(file_name) + "\"\r\n"
                   "Content-Type: " + protocol::guess_mime_type(file_name) + "\r\n\r\n";
    request.upload = &data;
    request.upload_size = file_size;
    request.trailer = "\r\n--" + boundary + "--\r\n";
    return send(request);
}

TransferResponse Client::list_files(const endpoint::ServerEndpoint& server, const std::string& code) {
    std::string query = protocol::form_encode({
        {"code", code},
        {"order", "ctime"},
        {"asc", "desc"},
        {"_", std::to_string(now_millis())},
    });
    auto request = prepare(server, protocol::operation_path(protocol::Operation::LIST_FILES) + "?" + query,
                           true, false);
    request.method = http::verb::get;
    return send(request);
}

TransferResponse Client::download_file(const endpoint::ServerEndpoint& server,
                                       const std::string& file_ids, bool stream) {
    auto request = prepare(server, protocol::operation_path(protocol::Operation::DOWNLOAD_FILE), false, true);
    request.method = http::verb::post;
    request.body = protocol::form_encode({{"fileIds", file_ids}});
    request.stream_response = stream;
    return send(request);
}

Outcome Client::execute(const HttpRequest& request) {
    if (request.host.empty()) {
        TransportFailure failure{"server address is not configured", request.url};
        if (on_error_) on_error_(failure.what, failure.url);
        return failure;
    }

    try {
        HttpResult result = http_->perform(request);
        TransferResponse response;
        response.status_code = result.status;
        response.content = std::move(result.content);
        response.stream = std::move(result.stream);
        if (!response.stream) {
            response.body = try_parse_json(response.content);
        }
        return response;
    } catch (const std::exception& e) {
        if (on_error_) on_error_(e.what(), request.url);
        return TransportFailure{e.what(), request.url};
    }
}

TransferResponse Client::send(const HttpRequest& request) {
    auto outcome = execute(request);
    if (auto* response = std::get_if<TransferResponse>(&outcome)) {
        return std::move(*response);
    }
    return failure_response();
}

} // namespace transport
