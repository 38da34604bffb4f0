#pragma once

#include <string>
#include <utility>
#include <vector>

namespace protocol {

enum class Operation {
    RESOLVE_CODE,
    UPLOAD_FILE,
    LIST_FILES,
    DOWNLOAD_FILE
};

constexpr const char* kServicePath = "/cloudcenter/conversionNew";
constexpr const char* kRefererPath = "/cloudcenter/nj_home.html";
constexpr const char* kSystemCookie = "_systemType_=_NANJING_";
constexpr const char* kAcceptLanguage = "zh-CN,zh;q=0.9";
constexpr const char* kUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) "
    "AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/142.0.0.0 Safari/537.36";
constexpr const char* kFormContentType = "application/x-www-form-urlencoded; charset=UTF-8";

// Server reply when an upload name is already taken
constexpr const char* kCollisionMessage = "中转上传文件中已存在同名文件";

using FormFields = std::vector<std::pair<std::string, std::string>>;

// "/cloudcenter/conversionNew/resolveCode" etc.
std::string operation_path(Operation op);

std::string url_encode(const std::string& value);

// a=1&b=2, application/x-www-form-urlencoded
std::string form_encode(const FormFields& fields);

// Content type from the file extension, application/octet-stream when unknown
std::string guess_mime_type(const std::string& file_name);

} // namespace protocol
