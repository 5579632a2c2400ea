// cpp/include/ttsr/shutdown.h
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace ttsr {

// Shared with the synthesizer and retry sleeps; once cancelled stays cancelled.
class CancelToken {
public:
    using Callback = std::function<void()>;

    void cancel();
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // true if cancelled (before or during the wait)
    bool wait_for(std::chrono::milliseconds d) const;

    // cb runs once on the cancelling thread, or right here if already cancelled (id 0).
    uint64_t add_callback(Callback cb) const;
    // On return cb is neither running nor will run.
    void remove_callback(uint64_t id) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;

    mutable std::mutex cb_mu_;
    mutable std::map<uint64_t, Callback> callbacks_;
    mutable uint64_t next_id_{1};
};

enum class RunState {
    Running,
    Paused,
    Stopping,
    Stopped,
};

const char* to_string(RunState s);

enum class Command {
    None,
    Pause,
    Resume,
    Stop,
    ForceStop,
    StopDelete,
    Help,
    Clear,
};

// Trimmed, case-insensitive. Unknown words -> Command::None.
Command parse_command(std::string_view line);

std::string command_help_text();

// SIGINT/SIGTERM only set a flag; ShutdownController::poll_signals() acts on it.
void install_interrupt_handlers();
void restore_interrupt_handlers();

class ShutdownController {
public:
    CancelToken& token() { return token_; }
    const CancelToken& token() const { return token_; }

    void set_processing_started(bool v);
    bool processing_started() const;

    // Each returns whether the state actually changed.
    bool request_pause();
    bool request_resume();
    bool request_stop();
    bool request_force_stop();
    bool request_stop_and_delete();
    void mark_stopped();

    // Applies a parsed user command; returns the response text ("" when ignored).
    std::string apply(Command c);

    // Pending interrupt -> force stop + cancel. Returns true if one was consumed.
    bool poll_signals();

    bool should_continue() const; // RUNNING or PAUSED
    bool is_paused() const;
    bool force_stop_requested() const;
    bool delete_requested() const;
    RunState state() const;

    // Blocks the calling thread while PAUSED.
    void handle_pause();
    // Same, bounded; returns true if still PAUSED afterwards.
    bool handle_pause_for(std::chrono::milliseconds max_wait);

    // Blocks until state differs from `seen` or timeout; returns current state.
    RunState wait_state_change(RunState seen, std::chrono::milliseconds timeout) const;

private:
    bool enter_stopping_locked(bool force, bool del);

    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    RunState state_{RunState::Running};
    bool force_{false};
    bool delete_{false};
    bool started_{false};
    CancelToken token_;
};

// Reads command lines from fd on its own thread. poll() with a short timeout keeps stop() prompt.
class CommandListener {
public:
    using Output = std::function<void(const std::string&)>;

    CommandListener(ShutdownController& ctl, int fd, Output out);
    ~CommandListener();

    CommandListener(const CommandListener&) = delete;
    CommandListener& operator=(const CommandListener&) = delete;

    void start();
    void stop();

private:
    void run();
    void handle_line(const std::string& line);

    ShutdownController& ctl_;
    int fd_{-1};
    Output out_;
    std::atomic<bool> stop_{false};
    std::thread th_;
};

} // namespace ttsr
