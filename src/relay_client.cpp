#include "relay_client.hpp"
#include <filesystem>
#include <boost/algorithm/string/trim.hpp>

namespace fs = std::filesystem;

namespace app {

namespace {

constexpr const char* kHostMissing = "[配置] 未检测到服务器地址(HOST)，请先点击“配置地址”进行设置。";

std::string base_name(const std::string& path) {
    return fs::u8path(path).filename().u8string();
}

// Drops tasks that arrive after the owner is gone
dispatch::Dispatcher guarded(dispatch::Dispatcher inner, std::weak_ptr<bool> alive) {
    return [inner = std::move(inner), alive](dispatch::Task task) {
        inner([alive, task = std::move(task)] {
            if (alive.lock()) task();
        });
    };
}

} // namespace

RelayClient::RelayClient(std::string config_path, logging::ActivityLog& log, dispatch::Dispatcher dispatcher,
                         ClientOptions options, std::shared_ptr<transport::HttpTransport> http,
                         session::IdleProbe idle_probe)
    : log_(log),
      dispatcher_(std::move(dispatcher)),
      alive_(std::make_shared<bool>(true)),
      options_(options),
      store_(std::move(config_path), log.callback()),
      transport_(http ? std::move(http)
                      : std::shared_ptr<transport::HttpTransport>(
                            std::make_shared<transport::BeastTransport>(options.request_timeout)),
                 [&log](const std::string& what, const std::string& url) {
                     log.append("网络请求异常：" + what + " - " + url);
                 }),
      session_(std::make_unique<session::Session>(transport_, guarded(dispatcher_, alive_), options.session,
                                                  std::move(idle_probe))),
      uploader_(transport_, log.callback(), options.max_upload_attempts),
      downloader_(transport_, log.callback(), options.chunk_size),
      upload_lane_(1, options.lane_capacity,
                   [&log](const std::string& what) { log.append("[上传] 失败：" + what); }),
      query_lane_(1, options.lane_capacity,
                  [&log](const std::string& what) { log.append("[下载] 失败：" + what); }) {
    session::SessionCallbacks callbacks;
    callbacks.on_status = log_.callback();
    callbacks.on_state_changed = [this](session::State state, const std::string& code) {
        if (hooks_.on_session_state) hooks_.on_session_state(state, code);
    };
    callbacks.on_code_rejected = [this] {
        if (hooks_.on_code_rejected) hooks_.on_code_rejected();
    };
    session_->set_callbacks(std::move(callbacks));
}

RelayClient::~RelayClient() {
    upload_lane_.shutdown();
    query_lane_.shutdown();
    alive_.reset();
}

void RelayClient::set_hooks(ClientHooks hooks) {
    hooks_ = std::move(hooks);
}

void RelayClient::post(dispatch::Task task) {
    guarded(dispatcher_, alive_)(std::move(task));
}

Status RelayClient::reject(const std::string& message) {
    log_.append(message);
    return Status::rejected(message);
}

Status RelayClient::ensure_host() {
    if (!server_.empty()) return Status::success();
    Status status = reject(kHostMissing);
    if (hooks_.on_host_required) hooks_.on_host_required(HostPrompt::RUNTIME);
    return status;
}

Status RelayClient::ensure_ready(const std::string& category) {
    if (!session_->unlocked()) {
        return reject(category + " 功能尚未启用，请先输入验证码并确认。");
    }
    return ensure_host();
}

// ─── Configuration ──────────────────────────────────────────────────────────

Status RelayClient::start() {
    config::Settings settings = store_.load_all();

    if (settings.host.empty()) {
        Status status = reject(kHostMissing);
        if (hooks_.on_host_required) hooks_.on_host_required(HostPrompt::STARTUP);
        return status;
    }

    auto parsed = endpoint::parse_endpoint(settings.host);
    if (!parsed) {
        Status status = reject("[配置] 配置文件中的服务器地址格式不正确：" + settings.host);
        if (hooks_.on_host_required) hooks_.on_host_required(HostPrompt::STARTUP);
        return status;
    }
    server_ = *parsed;
    log_.append("[配置] 已从配置文件读取服务器地址：" + server_.authority());

    if (session::Session::is_valid_code(settings.code)) {
        log_.append("[配置] 已从配置文件读取上次的验证码，正在自动验证...");
        return submit_code(settings.code);
    }
    return Status::success();
}

Status RelayClient::reconfigure_host(const std::string& raw) {
    std::string host = boost::algorithm::trim_copy(raw);
    if (host.empty()) {
        return Status::rejected("服务器地址不能为空，请输入一个有效的 HOST。");
    }

    auto parsed = endpoint::parse_endpoint(host);
    if (!parsed) {
        return Status::rejected("服务器地址格式不正确，请重新输入。");
    }

    server_ = *parsed;
    store_.save_host(server_.authority());
    log_.append("[配置] 已设置服务器地址：" + server_.authority());
    return Status::success();
}

// ─── Session ────────────────────────────────────────────────────────────────

Status RelayClient::submit_code(const std::string& code) {
    Status host = ensure_host();
    if (!host.ok) return host;

    std::string value = boost::algorithm::trim_copy(code);
    switch (session_->submit(server_, value)) {
    case session::SubmitResult::STARTED:
        return Status::success();
    case session::SubmitResult::ALREADY_POLLING:
        return Status::rejected("[验证] 已在轮询中。");
    case session::SubmitResult::INVALID_CODE:
        return reject("[验证] 验证码必须为6位数字，请检查。");
    case session::SubmitResult::NOT_CONFIGURED:
        break;
    }
    return reject(kHostMissing);
}

void RelayClient::reset_session() {
    log_.append("[验证] 正在重置验证码并锁定界面...");
    session_->reset();
    log_.append("[验证] 已重置，已恢复到待验证状态。");
}

void RelayClient::close() {
    if (closed_) return;
    closed_ = true;
    session_->close(store_);
    upload_lane_.shutdown();
    query_lane_.shutdown();
}

// ─── Upload ─────────────────────────────────────────────────────────────────

bool RelayClient::queue_upload(std::function<void()> work) {
    bool queued = upload_lane_.submit([this, work = std::move(work)] {
        try {
            work();
        } catch (...) {
            post([this] { upload_finished(); });
            throw;  // reported by the lane
        }
        post([this] { upload_finished(); });
    });
    if (!queued) {
        log_.append("[上传] 上传队列已满，请稍后再试。");
        return false;
    }
    if (uploads_in_flight_++ == 0 && hooks_.on_upload_busy) {
        hooks_.on_upload_busy(true);
    }
    return true;
}

void RelayClient::upload_finished() {
    if (uploads_in_flight_ > 0 && --uploads_in_flight_ == 0 && hooks_.on_upload_busy) {
        hooks_.on_upload_busy(false);
    }
}

Status RelayClient::upload_text(const std::string& text) {
    Status ready = ensure_ready("[上传]");
    if (!ready.ok) return ready;

    if (boost::algorithm::trim_copy(text).empty()) {
        return reject("[上传] 失败，当前文本框为空。");
    }

    log_.append("[上传] 正在上传文本内容...");
    endpoint::ServerEndpoint server = server_;
    std::string code = session_->code();
    if (!queue_upload([this, server, code, text] { uploader_.upload_text(server, code, text); })) {
        return Status::rejected("[上传] 上传队列已满，请稍后再试。");
    }
    return Status::success();
}

Status RelayClient::queue_uploads(const std::vector<std::string>& paths, const std::string& category,
                                  const std::string& prefix, const std::string& suffix) {
    Status ready = ensure_ready(category);
    if (!ready.ok) return ready;

    endpoint::ServerEndpoint server = server_;
    std::string code = session_->code();
    for (const auto& raw : paths) {
        std::string path = boost::algorithm::trim_copy(raw);
        if (path.empty()) continue;

        log_.append(prefix + base_name(path) + suffix);
        if (!queue_upload([this, server, code, path] { uploader_.upload_path(server, code, path); })) {
            return Status::rejected("[上传] 上传队列已满，请稍后再试。");
        }
    }
    return Status::success();
}

Status RelayClient::upload_files(const std::vector<std::string>& paths) {
    return queue_uploads(paths, "[上传]", "[上传] 选择文件：", "");
}

Status RelayClient::drop_files(const std::vector<std::string>& paths) {
    return queue_uploads(paths, "[拖拽]", "[上传] 正在上传文件：", " ...");
}

// ─── Download ───────────────────────────────────────────────────────────────

Status RelayClient::list_remote_files(ListCallback on_listed) {
    Status ready = ensure_ready("[下载]");
    if (!ready.ok) return ready;

    log_.append("[下载] 正在查询可下载文件列表...");
    endpoint::ServerEndpoint server = server_;
    std::string code = session_->code();
    bool queued = query_lane_.submit([this, server, code, on_listed] {
        auto records = downloader_.list_files(server, code);
        if (records.empty() || !on_listed) return;
        post([on_listed, records = std::move(records)] { on_listed(records); });
    });
    if (!queued) return reject("[下载] 查询队列已满，请稍后再试。");
    return Status::success();
}

Status RelayClient::download_selected(const std::vector<protocol::RemoteFileRecord>& records,
                                      const std::string& display_name, const std::optional<std::string>& dest,
                                      DoneCallback on_done) {
    Status ready = ensure_ready("[下载]");
    if (!ready.ok) return ready;

    if (records.empty()) {
        return reject("[下载] 请先在列表中选择至少一个文件。");
    }

    std::string name = display_name.empty() ? transfer::download_name(records) : display_name;
    if (!dest) {
        return reject("[下载] 已取消保存「" + name + "」。");
    }

    endpoint::ServerEndpoint server = server_;
    std::string path = *dest;
    bool queued = query_lane_.submit([this, server, records, name, path, on_done] {
        bool ok = downloader_.download(server, records, name, path);
        if (on_done) post([on_done, ok] { on_done(ok); });
    });
    if (!queued) return reject("[下载] 查询队列已满，请稍后再试。");
    return Status::success();
}

Status RelayClient::load_selected_to_buffer(const protocol::RemoteFileRecord& record, TextCallback on_loaded) {
    Status ready = ensure_ready("[下载]");
    if (!ready.ok) return ready;

    endpoint::ServerEndpoint server = server_;
    bool queued = query_lane_.submit([this, server, record, on_loaded] {
        auto text = downloader_.load_text(server, record);
        if (!text || !on_loaded) return;
        post([on_loaded, text = std::move(*text)] { on_loaded(text); });
    });
    if (!queued) return reject("[下载] 查询队列已满，请稍后再试。");
    return Status::success();
}

} // namespace app
