#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "activity_log.hpp"
#include "endpoint.hpp"
#include "protocol/remote_file.hpp"
#include "transport.hpp"

namespace transfer {

// "MMDDHHMMSS" followed by three millisecond digits
std::string timestamp_suffix(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

// 文本<suffix>.txt
std::string text_file_name(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

// 选中文件打包_<suffix>.zip
std::string archive_name(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

// "f.txt", 2 -> "f(2).txt"; attempt 0 returns the name unchanged
std::string next_name(const std::string& original, int attempt);

// Last path component of a server-supplied name. Empty, "." and ".."
// fall back to `fallback` reduced the same way, then to "download".
std::string safe_file_name(const std::string& name, const std::string& fallback);

// Name a download is saved under: the record's own name (reduced by
// safe_file_name, falling back to the id) for one record, a synthesized
// archive name for several
std::string download_name(const std::vector<protocol::RemoteFileRecord>& records,
                          std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

// Comma-joined ids, as sent in the fileIds form field
std::string join_ids(const std::vector<protocol::RemoteFileRecord>& records);

// Case-insensitive match against the extensions that can be loaded as text
bool is_text_file(const std::string& file_name);

// utf-8, gbk, gb2312, utf-16, latin-1
const std::vector<std::string>& default_encodings();

// First encoding that decodes the bytes without error, as UTF-8 text.
// nullopt when every encoding fails.
std::optional<std::string> decode_text(const std::string& bytes,
                                       const std::vector<std::string>& encodings = default_encodings());

// ─── Upload ─────────────────────────────────────────────────────────────────

// Opens a fresh stream over the payload; called once per attempt
using StreamOpener = std::function<std::unique_ptr<std::istream>()>;

struct UploadOutcome {
    bool success = false;
    std::string effective_name;
    int attempts = 0;
    std::string message;  // server msg on a terminal failure
};

class Uploader {
public:
    Uploader(transport::Client& client, logging::StatusCallback status, int max_attempts = 1000);

    // Uploads `original_name`, renaming to base(n)ext while the server reports a collision
    UploadOutcome upload(const endpoint::ServerEndpoint& server, const std::string& code,
                         const std::string& original_name, std::uint64_t size,
                         const StreamOpener& open);

    UploadOutcome upload_text(const endpoint::ServerEndpoint& server, const std::string& code,
                              const std::string& text);
    UploadOutcome upload_path(const endpoint::ServerEndpoint& server, const std::string& code,
                              const std::string& path);

private:
    void log(const std::string& message) const;

    transport::Client& client_;
    logging::StatusCallback status_;
    int max_attempts_;
    std::mutex mutex_;  // one orchestration at a time
};

// ─── Download ───────────────────────────────────────────────────────────────

class Downloader {
public:
    Downloader(transport::Client& client, logging::StatusCallback status,
               std::size_t chunk_size = 8192,
               std::vector<std::string> encodings = default_encodings());

    // Server order. Empty for "no files" and for a failed query alike; the log tells them apart.
    std::vector<protocol::RemoteFileRecord> list_files(const endpoint::ServerEndpoint& server,
                                                       const std::string& code);

    // Streams the selection to `dest`. No file is left behind on failure.
    bool download(const endpoint::ServerEndpoint& server,
                  const std::vector<protocol::RemoteFileRecord>& records,
                  const std::string& display_name, const std::string& dest);

    // Writes the payload via "<dest>.part" and renames it into place
    bool save(const transport::TransferResponse& response, const std::string& display_name,
              const std::string& dest);

    // Downloads one file and decodes it as text
    std::optional<std::string> load_text(const endpoint::ServerEndpoint& server,
                                         const protocol::RemoteFileRecord& record);

private:
    void log(const std::string& message) const;

    transport::Client& client_;
    logging::StatusCallback status_;
    std::size_t chunk_size_;
    std::vector<std::string> encodings_;
};

} // namespace transfer
