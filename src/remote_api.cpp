#include "protocol/remote_api.hpp"
#include "protocol/remote_file.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace protocol {

std::string operation_path(Operation op) {
    std::string base = kServicePath;
    switch (op) {
    case Operation::RESOLVE_CODE:
        return base + "/resolveCode";
    case Operation::UPLOAD_FILE:
        return base + "/uploadFile";
    case Operation::LIST_FILES:
        return base + "/getFileListForDownCode";
    case Operation::DOWNLOAD_FILE:
        return base + "/downLoadFile";
    }
    return base;
}

std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string form_encode(const FormFields& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) out.push_back('&');
        out += url_encode(key) + "=" + url_encode(value);
    }
    return out;
}

std::string guess_mime_type(const std::string& file_name) {
    static const std::map<std::string, std::string> types = {
        {".txt", "text/plain"},          {".log", "text/plain"},
        {".csv", "text/csv"},            {".html", "text/html"},
        {".htm", "text/html"},           {".css", "text/css"},
        {".js", "text/javascript"},      {".json", "application/json"},
        {".xml", "text/xml"},            {".md", "text/markdown"},
        {".py", "text/x-python"},        {".c", "text/x-c"},
        {".h", "text/x-c"},              {".cpp", "text/x-c"},
        {".hpp", "text/x-c"},            {".sh", "application/x-sh"},
        {".pdf", "application/pdf"},     {".zip", "application/zip"},
        {".gz", "application/gzip"},     {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"},
        {".rar", "application/vnd.rar"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".png", "image/png"},           {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},         {".gif", "image/gif"},
        {".bmp", "image/bmp"},           {".svg", "image/svg+xml"},
        {".webp", "image/webp"},         {".mp3", "audio/mpeg"},
        {".wav", "audio/x-wav"},         {".mp4", "video/mp4"},
    };

    auto dot = file_name.rfind('.');
    if (dot == std::string::npos) return "application/octet-stream";
    std::string ext = file_name.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

// ─── Response bodies ────────────────────────────────────────────────────────

void from_json(const nlohmann::json& j, RemoteFileRecord& record) {
    const auto& id = j.at("id");
    record.id = id.is_string() ? id.get<std::string>() : id.dump();

    auto name = j.find("fileName");
    if (name != j.end() && name->is_string() && !name->get<std::string>().empty()) {
        record.file_name = name->get<std::string>();
    } else {
        record.file_name = record.id;
    }
}

std::vector<RemoteFileRecord> parse_file_list(const nlohmann::json& body) {
    std::vector<RemoteFileRecord> records;
    auto data = body.find("data");
    if (data == body.end() || !data->is_array()) return records;

    for (const auto& entry : *data) {
        if (!entry.is_object() || !entry.contains("id") || entry["id"].is_null()) continue;
        records.push_back(entry.get<RemoteFileRecord>());
    }
    return records;
}

bool is_success(const nlohmann::json& body) {
    auto it = body.find("success");
    if (it == body.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    if (it->is_string()) return !it->get<std::string>().empty();
    return false;
}

std::string message_of(const nlohmann::json& body) {
    auto it = body.find("msg");
    if (it == body.end() || it->is_null()) return "";
    return it->is_string() ? it->get<std::string>() : it->dump();
}

} // namespace protocol
