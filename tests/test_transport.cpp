#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include "fake_transport.hpp"
#include "protocol/remote_api.hpp"
#include "protocol/remote_file.hpp"
#include "transport.hpp"

using testing_support::FakeTransport;
using testing_support::form_field;
using testing_support::json_reply;

namespace {

endpoint::ServerEndpoint server() {
    return *endpoint::parse_endpoint("files.example.com:8080");
}

std::string header(const transport::HttpRequest& request, const std::string& name) {
    for (const auto& [key, value] : request.headers) {
        if (key == name) return value;
    }
    return "";
}

// Hands out the payload a few bytes at a time
class SlowStream : public transport::BodyStream {
public:
    explicit SlowStream(std::string data) : data_(std::move(data)) {}

    std::size_t read_some(char* out, std::size_t size) override {
        std::size_t n = std::min<std::size_t>({size, 3, data_.size() - offset_});
        std::copy_n(data_.data() + offset_, n, out);
        offset_ += n;
        return n;
    }

private:
    std::string data_;
    std::size_t offset_ = 0;
};

struct ErrorLog {
    int calls = 0;
    std::string what;
    std::string url;

    transport::ErrorHandler handler() {
        return [this](const std::string& w, const std::string& u) {
            ++calls;
            what = w;
            url = u;
        };
    }
};

} // namespace

TEST(TransportClient, ResolveCodeSendsFormWithFixedHeaders) {
    auto fake = std::make_shared<FakeTransport>([](const transport::HttpRequest&) {
        return json_reply(R"({"success": true})");
    });
    transport::Client client(fake);

    auto response = client.resolve_code(server(), "123456");
    EXPECT_EQ(response.status_code, 200);
    EXPECT_TRUE(protocol::is_success(response.body));

    auto requests = fake->requests();
    ASSERT_EQ(requests.size(), 1u);
    const auto& r = requests[0];
    EXPECT_EQ(r.method, boost::beast::http::verb::post);
    EXPECT_EQ(r.url, "http://files.example.com:8080/cloudcenter/conversionNew/resolveCode");
    EXPECT_EQ(r.host, "files.example.com");
    EXPECT_EQ(r.port, "8080");
    EXPECT_EQ(r.body, "code=123456");
    EXPECT_EQ(header(r, "Origin"), "http://files.example.com:8080");
    EXPECT_EQ(header(r, "Referer"), "http://files.example.com:8080/cloudcenter/nj_home.html");
    EXPECT_EQ(header(r, "Cookie"), "_systemType_=_NANJING_");
    EXPECT_EQ(header(r, "X-Requested-With"), "XMLHttpRequest");
    EXPECT_EQ(header(r, "Content-Type"), "application/x-www-form-urlencoded; charset=UTF-8");
    EXPECT_EQ(header(r, "Accept-Language"), "zh-CN,zh;q=0.9");
    EXPECT_NE(header(r, "User-Agent").find("Chrome/142"), std::string::npos);
}

TEST(TransportClient, NetworkExceptionBecomesUniformFailure) {
    auto fake = std::make_shared<FakeTransport>([](const transport::HttpRequest&) -> transport::HttpResult {
        throw std::runtime_error("timed out");
    });
    ErrorLog errors;
    transport::Client client(fake, errors.handler());

    std::istringstream data("abc");
    std::vector<transport::TransferResponse> responses = {
        client.resolve_code(server(), "123456"),
        client.upload_file(server(), "123456", "a.txt", 3, data),
        client.list_files(server(), "123456"),
        client.download_file(server(), "1,2"),
    };

    for (const auto& response : responses) {
        EXPECT_EQ(response.status_code, 500);
        EXPECT_TRUE(response.body.is_object());
        EXPECT_TRUE(response.body.empty());
        EXPECT_TRUE(response.content.empty());
        EXPECT_FALSE(response.stream);

        int chunks = 0;
        response.iter_content(8192, [&chunks](const char*, std::size_t) { ++chunks; });
        EXPECT_EQ(chunks, 0);
    }
    EXPECT_EQ(errors.calls, 4);
    EXPECT_EQ(errors.what, "timed out");
    EXPECT_EQ(errors.url, "http://files.example.com:8080/cloudcenter/conversionNew/downLoadFile");
}

TEST(TransportClient, ExecuteReportsTaggedFailure) {
    auto fake = std::make_shared<FakeTransport>();  // no reply: throws
    transport::Client client(fake);

    transport::HttpRequest request;
    request.host = "example.com";
    request.url = "http://example.com/x";
    auto outcome = client.execute(request);
    ASSERT_TRUE(std::holds_alternative<transport::TransportFailure>(outcome));
    EXPECT_EQ(std::get<transport::TransportFailure>(outcome).url, "http://example.com/x");
}

TEST(TransportClient, EmptyHostNeverReachesTheNetwork) {
    auto fake = std::make_shared<FakeTransport>([](const transport::HttpRequest&) {
        return json_reply("{}");
    });
    ErrorLog errors;
    transport::Client client(fake, errors.handler());

    auto response = client.resolve_code(endpoint::ServerEndpoint{}, "123456");
    EXPECT_EQ(response.status_code, 500);
    EXPECT_TRUE(fake->requests().empty());
    EXPECT_EQ(errors.calls, 1);
}

TEST(TransportClient, UploadBuildsMultipartBody) {
    auto fake = std::make_shared<FakeTransport>([](const transport::HttpRequest&) {
        return json_reply(R"({"success": true})");
    });
    transport::Client client(fake);

    std::istringstream data("hello");
    client.upload_file(server(), "123456", "report.pdf", 5, data);

    auto requests = fake->requests();
    ASSERT_EQ(requests.size(), 1u);
    const auto& r = requests[0];
    EXPECT_EQ(form_field(r, "name"), "report.pdf");
    EXPECT_EQ(form_field(r, "code"), "123456");
    EXPECT_EQ(form_field(r, "hash"), "");
    EXPECT_EQ(form_field(r, "size"), "5");
    EXPECT_EQ(form_field(r, "fileName"), "report.pdf");
    EXPECT_NE(r.body.find("name=\"Filedata\"; filename=\"report.pdf\""), std::string::npos);
    EXPECT_NE(r.body.find("Content-Type: application/pdf"), std::string::npos);
    EXPECT_EQ(header(r, "X-Requested-With"), "");
    EXPECT_EQ(header(r, "Content-Type").rfind("multipart/form-data; boundary=", 0), 0u);
    EXPECT_EQ(r.content_length(), r.body.size() + 5 + r.trailer.size());

    ASSERT_EQ(fake->uploads().size(), 1u);
    EXPECT_EQ(fake->uploads()[0], "hello");
}

TEST(TransportClient, ListFilesQuery) {
    auto fake = std::make_shared<FakeTransport>([](const transport::HttpRequest&) {
        return json_reply(R"({"success": true, "data": []})");
    });
    transport::Client client(fake);
    client.list_files(server(), "123456");

    auto r = fake->requests().at(0);
    EXPECT_EQ(r.method, boost::beast::http::verb::get);
    EXPECT_EQ(r.target.rfind("/cloudcenter/conversionNew/getFileListForDownCode?code=123456&order=ctime&asc=desc&_=", 0),
              0u);
    EXPECT_EQ(header(r, "X-Requested-With"), "XMLHttpRequest");
    EXPECT_EQ(header(r, "Content-Type"), "");
}

TEST(TransportClient, DownloadPostsCommaJoinedIdsAndStreams) {
    auto fake = std::make_shared<FakeTransport>([](const transport::HttpRequest&) {
        transport::HttpResult result;
        result.status = 200;
        result.stream = std::make_shared<SlowStream>("0123456789");
        return result;
    });
    transport::Client client(fake);

    auto response = client.download_file(server(), "7,9");
    auto r = fake->requests().at(0);
    EXPECT_EQ(r.body, "fileIds=7%2C9");
    EXPECT_TRUE(r.stream_response);
    EXPECT_EQ(header(r, "Content-Type"), "application/x-www-form-urlencoded; charset=UTF-8");

    std::string received;
    response.iter_content(4, [&received](const char* data, std::size_t size) {
        EXPECT_LE(size, 4u);
        received.append(data, size);
    });
    EXPECT_EQ(received, "0123456789");
}

TEST(TransferResponse, BufferedContentIsChunked) {
    transport::TransferResponse response;
    response.status_code = 200;
    response.content = std::string(20000, 'x');

    std::vector<std::size_t> sizes;
    response.iter_content(8192, [&sizes](const char*, std::size_t size) { sizes.push_back(size); });
    EXPECT_EQ(sizes, (std::vector<std::size_t>{8192, 8192, 3616}));
}

TEST(TryParseJson, NeverThrows) {
    EXPECT_TRUE(transport::try_parse_json("").empty());
    EXPECT_TRUE(transport::try_parse_json("<html>502</html>").empty());
    EXPECT_TRUE(transport::try_parse_json("[1,2]").is_object());
    EXPECT_EQ(transport::try_parse_json(R"({"success":false,"msg":"x"})")["msg"], "x");
}

TEST(ResponseBody, SuccessTruthiness) {
    using nlohmann::json;
    EXPECT_TRUE(protocol::is_success(json{{"success", true}}));
    EXPECT_TRUE(protocol::is_success(json{{"success", 1}}));
    EXPECT_TRUE(protocol::is_success(json{{"success", "yes"}}));
    EXPECT_FALSE(protocol::is_success(json{{"success", false}}));
    EXPECT_FALSE(protocol::is_success(json{{"success", 0}}));
    EXPECT_FALSE(protocol::is_success(json{{"success", nullptr}}));
    EXPECT_FALSE(protocol::is_success(json::object()));
    EXPECT_EQ(protocol::message_of(json{{"msg", "验证码无效"}}), "验证码无效");
    EXPECT_EQ(protocol::message_of(json::object()), "");
}

TEST(ResponseBody, FileListParsing) {
    auto body = nlohmann::json::parse(R"({
        "success": true,
        "data": [
            {"id": 17, "fileName": "a.txt"},
            {"id": "abc", "fileName": null},
            {"fileName": "orphan.txt"},
            "junk",
            {"id": 18}
        ]
    })");
    auto records = protocol::parse_file_list(body);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].id, "17");
    EXPECT_EQ(records[0].file_name, "a.txt");
    EXPECT_EQ(records[1].id, "abc");
    EXPECT_EQ(records[1].file_name, "abc");
    EXPECT_EQ(records[2].file_name, "18");

    EXPECT_TRUE(protocol::parse_file_list(nlohmann::json::object()).empty());
}

TEST(RemoteApi, Encoding) {
    EXPECT_EQ(protocol::url_encode("a b&c=d/文"), "a+b%26c%3Dd%2F%E6%96%87");
    EXPECT_EQ(protocol::form_encode({{"a", "1"}, {"b", "x y"}}), "a=1&b=x+y");
    EXPECT_EQ(protocol::guess_mime_type("NOTES.TXT"), "text/plain");
    EXPECT_EQ(protocol::guess_mime_type("image.png"), "image/png");
    EXPECT_EQ(protocol::guess_mime_type("blob.unknownext"), "application/octet-stream");
    EXPECT_EQ(protocol::guess_mime_type("Makefile"), "application/octet-stream");
}
