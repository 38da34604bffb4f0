#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "activity_log.hpp"
#include "dispatch.hpp"
#include "endpoint.hpp"
#include "settings.hpp"
#include "transport.hpp"

namespace session {

enum class State {
    LOCKED,    // no code
    POLLING,   // code submitted, first resolution pending
    UNLOCKED   // code resolved, transfers enabled
};

const char* to_string(State state);

// Seconds since the last local input event, nullopt when unknown
using IdleProbe = std::function<std::optional<double>()>;

struct SessionOptions {
    std::chrono::milliseconds poll_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds idle_recheck{std::chrono::seconds(1)};
    double idle_threshold_seconds = 60.0;
};

// Invoked on the control thread
struct SessionCallbacks {
    logging::StatusCallback on_status;
    std::function<void(State, const std::string& code)> on_state_changed;
    std::function<void()> on_code_rejected;  // the entered code should be cleared
};

enum class SubmitResult {
    STARTED,
    ALREADY_POLLING,
    INVALID_CODE,
    NOT_CONFIGURED
};

// Cooperative cancellation with interruptible waits
class StopSignal {
public:
    void set();
    bool is_set() const;

    // True when the signal fired before the timeout elapsed
    bool wait_for(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool set_ = false;
};

// Owns the lock state and the background resolve loop. All public methods
// must be called on the control thread; the loop reports back through the
// dispatcher, and reports from a superseded loop are dropped.
class Session {
public:
    Session(transport::Client& client, dispatch::Dispatcher dispatcher,
            SessionOptions options = {}, IdleProbe idle_probe = nullptr);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void set_callbacks(SessionCallbacks callbacks);

    SubmitResult submit(const endpoint::ServerEndpoint& server, const std::string& code);
    void reset();

    // Persists the code when unlocked ("" otherwise) and stops the loop
    void close(config::ConfigStore& store);

    State state() const { return state_; }
    const std::string& code() const { return code_; }
    bool unlocked() const { return state_ == State::UNLOCKED; }
    bool polling_active() const { return loop_active_; }

    static bool is_valid_code(const std::string& code);

private:
    struct PollLoop {
        std::thread thread;
        std::shared_ptr<StopSignal> stop;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void poll_loop(std::uint64_t generation, endpoint::ServerEndpoint server, std::string code,
                   std::shared_ptr<StopSignal> stop, std::shared_ptr<std::atomic<bool>> finished);
    bool check_code(std::uint64_t generation, const endpoint::ServerEndpoint& server,
                    const std::string& code, bool& established);

    void post(std::uint64_t generation, std::function<void()> fn);
    void set_state(State state);
    void lock_out(bool rejected);
    void status(const std::string& message);
    void stop_loops();
    void join_loops(bool finished_only);

    transport::Client& client_;
    dispatch::Dispatcher dispatcher_;
    SessionOptions options_;
    IdleProbe idle_probe_;
    SessionCallbacks callbacks_;

    State state_ = State::LOCKED;
    std::string code_;
    bool loop_active_ = false;
    std::uint64_t generation_ = 0;
    std::vector<PollLoop> loops_;

    // Expires on destruction; posted closures drained afterwards do nothing
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace session
