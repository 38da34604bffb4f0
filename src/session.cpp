#include "session.hpp"
#include "protocol/remote_file.hpp"
#include <algorithm>
#include <cctype>

namespace session {

const char* to_string(State state) {
    switch (state) {
    case State::LOCKED:
        return "locked";
    case State::POLLING:
        return "polling";
    case State::UNLOCKED:
        return "unlocked";
    }
    return "unknown";
}

// ─── StopSignal ─────────────────────────────────────────────────────────────

void StopSignal::set() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_ = true;
    }
    cv_.notify_all();
}

bool StopSignal::is_set() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_;
}

bool StopSignal::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return set_; });
}

// ─── Session ────────────────────────────────────────────────────────────────

Session::Session(transport::Client& client, dispatch::Dispatcher dispatcher,
                 SessionOptions options, IdleProbe idle_probe)
    : client_(client),
      dispatcher_(std::move(dispatcher)),
      options_(options),
      idle_probe_(std::move(idle_probe)) {}

Session::~Session() {
    alive_.reset();
    ++generation_;
    stop_loops();
    join_loops(false);
}

void Session::set_callbacks(SessionCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

bool Session::is_valid_code(const std::string& code) {
    return code.size() == 6 &&
           std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c); });
}

SubmitResult Session::submit(const endpoint::ServerEndpoint& server, const std::string& code) {
    if (server.empty()) return SubmitResult::NOT_CONFIGURED;
    if (!is_valid_code(code)) return SubmitResult::INVALID_CODE;

    if (loop_active_) {
        status("[验证] 已在轮询中。");
        return SubmitResult::ALREADY_POLLING;
    }

    join_loops(true);

    loop_active_ = true;
    code_ = code;
    std::uint64_t generation = ++generation_;

    PollLoop loop;
    loop.stop = std::make_shared<StopSignal>();
    loop.finished = std::make_shared<std::atomic<bool>>(false);
    loop.thread = std::thread(&Session::poll_loop, this, generation, server, code, loop.stop, loop.finished);
    loops_.push_back(std::move(loop));

    set_state(State::POLLING);
    status("[验证] 已开始轮询验证。");
    return SubmitResult::STARTED;
}

void Session::reset() {
    ++generation_;
    stop_loops();
    loop_active_ = false;
    code_.clear();
    set_state(State::LOCKED);
}

void Session::close(config::ConfigStore& store) {
    store.save_code(state_ == State::UNLOCKED ? code_ : "");
    ++generation_;
    stop_loops();
    join_loops(false);
    loop_active_ = false;
}

void Session::poll_loop(std::uint64_t generation, endpoint::ServerEndpoint server, std::string code,
                        std::shared_ptr<StopSignal> stop, std::shared_ptr<std::atomic<bool>> finished) {
    bool established = false;
    bool idle_logged = false;

    while (!stop->is_set()) {
        std::optional<double> idle = idle_probe_ ? idle_probe_() : std::nullopt;

        if (idle && *idle > options_.idle_threshold_seconds) {
            if (!idle_logged) {
                idle_logged = true;
                std::string message = "[监控] 检测到用户已空闲超过 " +
                                      std::to_string(static_cast<long>(options_.idle_threshold_seconds)) +
                                      " 秒，暂停验证码轮询。";
                post(generation, [this, message] { status(message); });
            }
            if (stop->wait_for(options_.idle_recheck)) break;
            continue;
        }
        if (idle_logged) {
            idle_logged = false;
            post(generation, [this] { status("[监控] 检测到用户恢复活动，恢复验证码轮询。"); });
        }

        if (!check_code(generation, server, code, established)) break;

        if (stop->wait_for(options_.poll_interval)) break;
    }

    post(generation, [this] { loop_active_ = false; });
    finished->store(true);
}

bool Session::check_code(std::uint64_t generation, const endpoint::ServerEndpoint& server,
                         const std::string& code, bool& established) {
    transport::TransferResponse response = client_.resolve_code(server, code);

    if (response.status_code != 200) {
        post(generation, [this] { status("[验证] 失败！服务器故障或服务器地址错误。"); });
        if (established) {
            return true;  // transient: keep the lock and try again next tick
        }
        post(generation, [this] { lock_out(false); });
        return false;
    }

    bool success = protocol::is_success(response.body);
    if (!established) {
        if (!success) {
            std::string message = "[验证] 失败：" + protocol::message_of(response.body);
            post(generation, [this, message] {
                status(message);
                lock_out(true);
            });
            return false;
        }
        established = true;
        post(generation, [this] {
            set_state(State::UNLOCKED);
            status("[验证] 成功！文本输入框、上传和拖拽区域已启用。");
        });
        return true;
    }

    if (!success) {
        post(generation, [this] {
            status("[验证] 失败！请重新输入验证码。");
            lock_out(true);
        });
        return false;
    }
    return true;
}

void Session::post(std::uint64_t generation, std::function<void()> fn) {
    std::weak_ptr<bool> alive = alive_;
    dispatcher_([this, alive, generation, fn = std::move(fn)] {
        if (alive.lock() && generation == generation_) fn();
    });
}

void Session::set_state(State state) {
    state_ = state;
    if (callbacks_.on_state_changed) callbacks_.on_state_changed(state_, code_);
}

void Session::lock_out(bool rejected) {
    loop_active_ = false;
    code_.clear();
    set_state(State::LOCKED);
    if (rejected && callbacks_.on_code_rejected) callbacks_.on_code_rejected();
}

void Session::status(const std::string& message) {
    if (callbacks_.on_status) callbacks_.on_status(message);
}

void Session::stop_loops() {
    for (auto& loop : loops_) {
        loop.stop->set();
    }
}

void Session::join_loops(bool finished_only) {
    for (auto it = loops_.begin(); it != loops_.end();) {
        if (finished_only && !it->finished->load()) {
            ++it;
            continue;
        }
        if (it->thread.joinable()) it->thread.join();
        it = loops_.erase(it);
    }
}

} // namespace session
