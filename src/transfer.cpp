#include "transfer.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <boost/locale/encoding.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include "protocol/remote_api.hpp"

namespace fs = std::filesystem;

namespace transfer {

namespace conv = boost::locale::conv;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// BOM-aware; little-endian when there is no BOM
std::string decode_utf16(const std::string& bytes) {
    std::size_t offset = 0;
    bool big_endian = false;
    if (bytes.size() >= 2) {
        auto b0 = static_cast<unsigned char>(bytes[0]);
        auto b1 = static_cast<unsigned char>(bytes[1]);
        if (b0 == 0xFF && b1 == 0xFE) {
            offset = 2;
        } else if (b0 == 0xFE && b1 == 0xFF) {
            offset = 2;
            big_endian = true;
        }
    }
    if ((bytes.size() - offset) % 2 != 0) {
        throw conv::conversion_error();
    }

    std::u16string units;
    units.reserve((bytes.size() - offset) / 2);
    for (std::size_t i = offset; i + 1 < bytes.size(); i += 2) {
        auto lo = static_cast<unsigned char>(bytes[big_endian ? i + 1 : i]);
        auto hi = static_cast<unsigned char>(bytes[big_endian ? i : i + 1]);
        units.push_back(static_cast<char16_t>((hi << 8) | lo));
    }
    return conv::utf_to_utf<char>(units, conv::stop);
}

std::string decode_as(const std::string& bytes, const std::string& encoding) {
    std::string name = lower(encoding);
    if (name == "utf-8" || name == "utf8") {
        return conv::utf_to_utf<char>(bytes, conv::stop);
    }
    if (name == "utf-16" || name == "utf16") {
        return decode_utf16(bytes);
    }
    if (name == "latin-1" || name == "latin1" || name == "iso-8859-1") {
        std::u32string points(bytes.begin(), bytes.end());
        for (auto& p : points) p &= 0xFF;
        return conv::utf_to_utf<char>(points, conv::stop);
    }
    return conv::to_utf<char>(bytes, encoding, conv::stop);
}

} // namespace

// ─── Naming ─────────────────────────────────────────────────────────────────

std::string timestamp_suffix(std::chrono::system_clock::time_point when) {
    using namespace std::chrono;
    auto millis = duration_cast<milliseconds>(when.time_since_epoch()).count() % 1000;
    std::time_t t = system_clock::to_time_t(when);
    return fmt::format("{:%m%d%H%M%S}{:03d}", fmt::localtime(t), static_cast<int>(millis));
}

std::string text_file_name(std::chrono::system_clock::time_point when) {
    return "文本" + timestamp_suffix(when) + ".txt";
}

std::string archive_name(std::chrono::system_clock::time_point when) {
    return "选中文件打包_" + timestamp_suffix(when) + ".zip";
}

std::string next_name(const std::string& original, int attempt) {
    if (attempt <= 0) return original;
    fs::path p = fs::u8path(original);
    std::string ext = p.extension().u8string();
    std::string base = original.substr(0, original.size() - ext.size());
    return fmt::format("{}({}){}", base, attempt, ext);
}

std::string safe_file_name(const std::string& name, const std::string& fallback) {
    // Both separators count: a name from a Windows peer may use either
    auto pos = name.find_last_of("/\\");
    std::string base = pos == std::string::npos ? name : name.substr(pos + 1);
    if (base.empty() || base == "." || base == "..") {
        return fallback == name ? std::string("download") : safe_file_name(fallback, fallback);
    }
    return base;
}

std::string download_name(const std::vector<protocol::RemoteFileRecord>& records,
                          std::chrono::system_clock::time_point when) {
    if (records.size() == 1) return safe_file_name(records.front().file_name, records.front().id);
    return archive_name(when);
}

std::string join_ids(const std::vector<protocol::RemoteFileRecord>& records) {
    std::string ids;
    for (const auto& record : records) {
        if (!ids.empty()) ids += ',';
        ids += record.id;
    }
    return ids;
}

bool is_text_file(const std::string& file_name) {
    static const std::set<std::string> extensions = {
        ".txt", ".js", ".html", ".htm", ".py", ".cpp", ".c", ".h", ".hpp",
        ".css", ".json", ".xml", ".md", ".yaml", ".yml", ".ini", ".cfg", ".sh", ".bat",
        ".java", ".cs", ".go", ".rs", ".php", ".rb", ".sql", ".log", ".csv",
    };
    std::string ext = fs::u8path(file_name).extension().u8string();
    return extensions.count(lower(ext)) > 0;
}

const std::vector<std::string>& default_encodings() {
    static const std::vector<std::string> encodings = {"utf-8", "gbk", "gb2312", "utf-16", "latin-1"};
    return encodings;
}

std::optional<std::string> decode_text(const std::string& bytes, const std::vector<std::string>& encodings) {
    for (const auto& encoding : encodings) {
        try {
            return decode_as(bytes, encoding);
        } catch (const conv::conversion_error&) {
            continue;
        } catch (const conv::invalid_charset_error&) {
            continue;
        }
    }
    return std::nullopt;
}

// ─── Uploader ───────────────────────────────────────────────────────────────

Uploader::Uploader(transport::Client& client, logging::StatusCallback status, int max_attempts)
    : client_(client), status_(std::move(status)), max_attempts_(max_attempts) {}

void Uploader::log(const std::string& message) const {
    if (status_) status_(message);
}

UploadOutcome Uploader::upload(const endpoint::ServerEndpoint& server, const std::string& code,
                               const std::string& original_name, std::uint64_t size,
                               const StreamOpener& open) {
    std::lock_guard<std::mutex> lock(mutex_);
    UploadOutcome outcome;

    for (int attempt = 0; attempt < max_attempts_; ++attempt) {
        std::string name = next_name(original_name, attempt);
        outcome.effective_name = name;
        outcome.attempts = attempt + 1;

        std::unique_ptr<std::istream> data = open();
        if (!data || !*data) {
            log("[上传] 失败，无法读取本地文件「" + original_name + "」。");
            return outcome;
        }

        transport::TransferResponse response = client_.upload_file(server, code, name, size, *data);
        if (!response.ok()) {
            log("[上传] 失败！服务器故障或服务器地址错误。");
            return outcome;
        }

        if (protocol::is_success(response.body)) {
            outcome.success = true;
            log("[上传] 成功，文件名为「" + name + "」");
            return outcome;
        }

        outcome.message = protocol::message_of(response.body);
        if (outcome.message != protocol::kCollisionMessage) {
            log("[上传] 失败，" + outcome.message + "。");
            return outcome;
        }
        log("[上传] 检测到同名，自动更名后重试：" + name);
    }

    log(fmt::format("[上传] 失败，同名文件重试已达 {} 次上限。", max_attempts_));
    return outcome;
}

UploadOutcome Uploader::upload_text(const endpoint::ServerEndpoint& server, const std::string& code,
                                    const std::string& text) {
    return upload(server, code, text_file_name(), text.size(),
                  [&text] { return std::make_unique<std::istringstream>(text); });
}

UploadOutcome Uploader::upload_path(const endpoint::ServerEndpoint& server, const std::string& code,
                                    const std::string& path) {
    fs::path p = fs::u8path(path);
    std::string name = p.filename().u8string();

    std::error_code ec;
    std::uint64_t size = fs::file_size(p, ec);
    if (ec) {
        log("[上传] 失败，无法读取本地文件「" + name + "」：" + ec.message());
        UploadOutcome outcome;
        outcome.effective_name = name;
        return outcome;
    }

    return upload(server, code, name, size,
                  [p] { return std::make_unique<std::ifstream>(p, std::ios::binary); });
}

// ─── Downloader ─────────────────────────────────────────────────────────────

Downloader::Downloader(transport::Client& client, logging::StatusCallback status,
                       std::size_t chunk_size, std::vector<std::string> encodings)
    : client_(client),
      status_(std::move(status)),
      chunk_size_(chunk_size),
      encodings_(std::move(encodings)) {}

void Downloader::log(const std::string& message) const {
    if (status_) status_(message);
}

std::vector<protocol::RemoteFileRecord> Downloader::list_files(const endpoint::ServerEndpoint& server,
                                                               const std::string& code) {
    transport::TransferResponse response = client_.list_files(server, code);
    if (!response.ok()) {
        log("[下载] 查询失败！服务器故障或服务器地址错误。");
        return {};
    }

    std::vector<protocol::RemoteFileRecord> records;
    if (protocol::is_success(response.body)) {
        records = protocol::parse_file_list(response.body);
    }
    if (records.empty()) {
        log("[下载] 当前验证码下没有可下载的文件。");
    }
    return records;
}

bool Downloader::download(const endpoint::ServerEndpoint& server,
                          const std::vector<protocol::RemoteFileRecord>& records,
                          const std::string& display_name, const std::string& dest) {
    log("[下载] 开始下载文件：" + display_name + " ...");
    transport::TransferResponse response = client_.download_file(server, join_ids(records), true);
    if (!response.ok()) {
        log(fmt::format("[下载] 失败！服务器返回状态码 {}。", response.status_code));
        return false;
    }
    return save(response, display_name, dest);
}

bool Downloader::save(const transport::TransferResponse& response, const std::string& display_name,
                      const std::string& dest) {
    fs::path target = fs::u8path(dest);
    fs::path part = fs::u8path(dest + ".part");

    try {
        {
            std::ofstream file(part, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                throw std::runtime_error("无法写入 " + part.u8string());
            }
            response.iter_content(chunk_size_, [&file](const char* data, std::size_t size) {
                file.write(data, static_cast<std::streamsize>(size));
                if (!file) throw std::runtime_error("写入文件失败");
            });
        }
        fs::rename(part, target);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(part, ec);
        log(std::string("[下载] 保存失败：") + e.what());
        return false;
    }

    log("[下载] 完成，文件「" + display_name + "」已保存到：" + dest);
    return true;
}

std::optional<std::string> Downloader::load_text(const endpoint::ServerEndpoint& server,
                                                 const protocol::RemoteFileRecord& record) {
    log("[加载] 正在加载文件：" + record.file_name + " ...");
    transport::TransferResponse response = client_.download_file(server, record.id, false);
    if (!response.ok()) {
        log(fmt::format("[加载] 失败！服务器返回状态码 {}。", response.status_code));
        return std::nullopt;
    }

    std::optional<std::string> text = decode_text(response.content, encodings_);
    if (!text) {
        log("[加载] 失败：无法解析文件编码。");
        return std::nullopt;
    }
    log("[加载] 完成，文件「" + record.file_name + "」已加载到文本输入框。");
    return text;
}

} // namespace transfer
