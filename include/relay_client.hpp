#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "activity_log.hpp"
#include "dispatch.hpp"
#include "endpoint.hpp"
#include "protocol/remote_file.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "tasks.hpp"
#include "transfer.hpp"
#include "transport.hpp"

namespace app {

// Why the host dialog is being shown
enum class HostPrompt {
    STARTUP,
    RUNTIME,
    MANUAL
};

struct Status {
    bool ok = true;
    std::string message;

    static Status success() { return Status{}; }
    static Status rejected(std::string message) { return Status{false, std::move(message)}; }
};

struct ClientOptions {
    session::SessionOptions session;
    std::chrono::milliseconds request_timeout{std::chrono::seconds(5)};
    std::size_t chunk_size = 8192;
    int max_upload_attempts = 1000;
    std::size_t lane_capacity = 64;
};

// Invoked on the control thread
struct ClientHooks {
    std::function<void(session::State, const std::string& code)> on_session_state;
    std::function<void()> on_code_rejected;
    std::function<void(bool busy)> on_upload_busy;
    std::function<void(HostPrompt)> on_host_required;
};

using ListCallback = std::function<void(const std::vector<protocol::RemoteFileRecord>&)>;
using TextCallback = std::function<void(const std::string&)>;
using DoneCallback = std::function<void(bool ok)>;

// Trigger surface shared by the GUI and the CLI. Every method runs on the
// control thread; network and file work is queued on the upload and query
// lanes and reports back through the dispatcher.
class RelayClient {
public:
    RelayClient(std::string config_path, logging::ActivityLog& log, dispatch::Dispatcher dispatcher,
                ClientOptions options = {}, std::shared_ptr<transport::HttpTransport> http = nullptr,
                session::IdleProbe idle_probe = nullptr);
    ~RelayClient();

    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    void set_hooks(ClientHooks hooks);

    // Loads the configuration; rejected when no host is stored yet
    Status start();

    Status reconfigure_host(const std::string& raw);
    Status submit_code(const std::string& code);
    void reset_session();

    Status upload_text(const std::string& text);
    Status upload_files(const std::vector<std::string>& paths);  // file chooser
    Status drop_files(const std::vector<std::string>& paths);    // drag and drop

    Status list_remote_files(ListCallback on_listed);

    // display_name as offered in the save dialog (derived when empty);
    // dest is nullopt when the user cancelled that dialog
    Status download_selected(const std::vector<protocol::RemoteFileRecord>& records,
                             const std::string& display_name, const std::optional<std::string>& dest,
                             DoneCallback on_done = nullptr);

    Status load_selected_to_buffer(const protocol::RemoteFileRecord& record, TextCallback on_loaded);

    void close();

    const endpoint::ServerEndpoint& server() const { return server_; }
    bool host_configured() const { return !server_.empty(); }
    session::State state() const { return session_->state(); }
    const std::string& code() const { return session_->code(); }
    bool unlocked() const { return session_->unlocked(); }
    bool upload_busy() const { return uploads_in_flight_ > 0; }
    config::ConfigStore& config() { return store_; }
    logging::ActivityLog& log() { return log_; }

private:
    Status ensure_host();
    Status ensure_ready(const std::string& category);
    Status reject(const std::string& message);
    Status queue_uploads(const std::vector<std::string>& paths, const std::string& category,
                         const std::string& prefix, const std::string& suffix);
    bool queue_upload(std::function<void()> work);
    void upload_finished();
    void post(dispatch::Task task);

    logging::ActivityLog& log_;
    dispatch::Dispatcher dispatcher_;
    std::shared_ptr<bool> alive_;
    ClientOptions options_;
    ClientHooks hooks_;

    config::ConfigStore store_;
    endpoint::ServerEndpoint server_;
    transport::Client transport_;
    std::unique_ptr<session::Session> session_;
    transfer::Uploader uploader_;
    transfer::Downloader downloader_;
    tasks::TaskExecutor upload_lane_;
    tasks::TaskExecutor query_lane_;

    int uploads_in_flight_ = 0;
    bool closed_ = false;
};

} // namespace app
