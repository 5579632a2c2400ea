// cpp/src/shutdown.cpp
#include "ttsr/shutdown.h"

#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>

#include <poll.h>
#include <unistd.h>

#include "text_common.h"

namespace ttsr {

// --------------------
// CancelToken
// --------------------

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();

    // held while running so remove_callback() waits for an in-progress call
    std::lock_guard<std::mutex> lk(cb_mu_);
    std::map<uint64_t, Callback> cbs;
    cbs.swap(callbacks_);
    for (auto& kv : cbs) kv.second();
}

uint64_t CancelToken::add_callback(Callback cb) const {
    std::lock_guard<std::mutex> lk(cb_mu_);
    if (cancelled()) {
        cb();
        return 0;
    }
    const uint64_t id = next_id_++;
    callbacks_.emplace(id, std::move(cb));
    return id;
}

void CancelToken::remove_callback(uint64_t id) const {
    std::lock_guard<std::mutex> lk(cb_mu_);
    callbacks_.erase(id);
}

bool CancelToken::wait_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, d, [&] { return cancelled_.load(std::memory_order_acquire); });
}

// --------------------
// commands
// --------------------

const char* to_string(RunState s) {
    switch (s) {
        case RunState::Running:  return "running";
        case RunState::Paused:   return "paused";
        case RunState::Stopping: return "stopping";
        case RunState::Stopped:  return "stopped";
    }
    return "running";
}

Command parse_command(std::string_view line) {
    std::string w(trim_view(line));
    for (auto& ch : w) ch = (char)std::tolower((unsigned char)ch);

    if (w == "p" || w == "pause") return Command::Pause;
    if (w == "r" || w == "resume") return Command::Resume;
    if (w == "s" || w == "stop" || w == "q" || w == "quit") return Command::Stop;
    if (w == "f" || w == "force" || w == "fs" || w == "force-stop") return Command::ForceStop;
    if (w == "sd" || w == "stop-delete" || w == "delete" || w == "abort") return Command::StopDelete;
    if (w == "h" || w == "help") return Command::Help;
    if (w == "c" || w == "clear") return Command::Clear;
    return Command::None;
}

std::string command_help_text() {
    return
        "============================================================\n"
        "AVAILABLE COMMANDS:\n"
        "============================================================\n"
        "p/pause     - Pause after current chunk\n"
        "r/resume    - Resume from pause\n"
        "s/stop      - Stop and save progress\n"
        "f/force     - Force stop immediately (current chunk is redone on resume)\n"
        "sd/delete   - Stop and DELETE all progress\n"
        "q/quit      - Stop and save progress\n"
        "h/help      - Show this help\n"
        "c/clear     - Clear the console\n"
        "============================================================\n";
}

// --------------------
// signals
// --------------------

namespace {

volatile std::sig_atomic_t g_interrupt_pending = 0;

struct sigaction g_prev_int;
struct sigaction g_prev_term;
bool g_installed = false;

void on_interrupt(int) {
    g_interrupt_pending = 1;
}

} // namespace

void install_interrupt_handlers() {
    if (g_installed) return;
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_interrupt;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGINT, &sa, &g_prev_int) != 0 || sigaction(SIGTERM, &sa, &g_prev_term) != 0) {
        std::cerr << "[ttsr] sigaction failed: " << std::strerror(errno) << "\n";
        return;
    }
    g_installed = true;
}

void restore_interrupt_handlers() {
    if (!g_installed) return;
    sigaction(SIGINT, &g_prev_int, nullptr);
    sigaction(SIGTERM, &g_prev_term, nullptr);
    g_installed = false;
}

// --------------------
// ShutdownController
// --------------------

void ShutdownController::set_processing_started(bool v) {
    std::lock_guard<std::mutex> lk(mu_);
    started_ = v;
}

bool ShutdownController::processing_started() const {
    std::lock_guard<std::mutex> lk(mu_);
    return started_;
}

bool ShutdownController::request_pause() {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != RunState::Running) return false;
    state_ = RunState::Paused;
    cv_.notify_all();
    return true;
}

bool ShutdownController::request_resume() {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != RunState::Paused) return false;
    state_ = RunState::Running;
    cv_.notify_all();
    return true;
}

bool ShutdownController::enter_stopping_locked(bool force, bool del) {
    if (state_ == RunState::Running || state_ == RunState::Paused) {
        state_ = RunState::Stopping;
        force_ = force;
        delete_ = del;
        cv_.notify_all();
        return true;
    }
    // graceful -> force is the only escalation
    if (state_ == RunState::Stopping && force && !force_) {
        force_ = true;
        cv_.notify_all();
        return true;
    }
    return false;
}

bool ShutdownController::request_stop() {
    std::lock_guard<std::mutex> lk(mu_);
    return enter_stopping_locked(false, false);
}

bool ShutdownController::request_force_stop() {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        changed = enter_stopping_locked(true, false);
    }
    if (changed) token_.cancel();
    return changed;
}

bool ShutdownController::request_stop_and_delete() {
    std::lock_guard<std::mutex> lk(mu_);
    return enter_stopping_locked(false, true);
}

void ShutdownController::mark_stopped() {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == RunState::Stopping) {
        state_ = RunState::Stopped;
        cv_.notify_all();
    }
}

std::string ShutdownController::apply(Command c) {
    if (!processing_started()) return "";

    switch (c) {
        case Command::Pause:
            return request_pause() ? "Pause requested. Will pause after current chunk..." : "";
        case Command::Resume:
            return request_resume() ? "Resuming..." : "";
        case Command::Stop:
            return request_stop() ? "Stop requested. Finishing current chunk..." : "";
        case Command::ForceStop:
            return request_force_stop()
                ? "Force stop requested! Stopping without finishing current chunk..."
                : "";
        case Command::StopDelete:
            return request_stop_and_delete()
                ? "Stop and delete progress requested. Progress is deleted after current chunk..."
                : "";
        case Command::Help:
            return command_help_text();
        case Command::Clear:
            return "\033[2J\033[HConsole cleared. Processing continues...";
        case Command::None:
            break;
    }
    return "";
}

bool ShutdownController::poll_signals() {
    if (!g_interrupt_pending) return false;
    g_interrupt_pending = 0;
    std::cerr << "[ttsr] interrupt received, force stopping\n";
    request_force_stop();
    token_.cancel();
    return true;
}

bool ShutdownController::should_continue() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_ == RunState::Running || state_ == RunState::Paused;
}

bool ShutdownController::is_paused() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_ == RunState::Paused;
}

bool ShutdownController::force_stop_requested() const {
    std::lock_guard<std::mutex> lk(mu_);
    return force_;
}

bool ShutdownController::delete_requested() const {
    std::lock_guard<std::mutex> lk(mu_);
    return delete_;
}

RunState ShutdownController::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

void ShutdownController::handle_pause() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [&] { return state_ != RunState::Paused; });
}

bool ShutdownController::handle_pause_for(std::chrono::milliseconds max_wait) {
    std::unique_lock<std::mutex> lk(mu_);
    return !cv_.wait_for(lk, max_wait, [&] { return state_ != RunState::Paused; });
}

RunState ShutdownController::wait_state_change(RunState seen, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [&] { return state_ != seen; });
    return state_;
}

// --------------------
// CommandListener
// --------------------

CommandListener::CommandListener(ShutdownController& ctl, int fd, Output out)
    : ctl_(ctl), fd_(fd), out_(std::move(out)) {}

CommandListener::~CommandListener() {
    stop();
}

void CommandListener::start() {
    if (th_.joinable()) return;
    stop_.store(false);
    th_ = std::thread([this] { run(); });
}

void CommandListener::stop() {
    stop_.store(true);
    if (th_.joinable()) th_.join();
}

void CommandListener::handle_line(const std::string& line) {
    const Command c = parse_command(line);
    if (c == Command::None) return;
    const std::string resp = ctl_.apply(c);
    if (!resp.empty() && out_) out_(resp);
}

void CommandListener::run() {
    std::string buf;
    char tmp[512];

    while (!stop_.load()) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const int pr = ::poll(&pfd, 1, 100);
        if (pr < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ttsr] command listener poll failed: " << std::strerror(errno) << "\n";
            return;
        }
        if (pr == 0) continue;

        const ssize_t n = ::read(fd_, tmp, sizeof(tmp));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            std::cerr << "[ttsr] command listener read failed: " << std::strerror(errno) << "\n";
            return;
        }
        if (n == 0) {
            // EOF: no more commands, the run continues
            if (!buf.empty()) handle_line(buf);
            return;
        }

        buf.append(tmp, (size_t)n);
        size_t nl;
        while ((nl = buf.find('\n')) != std::string::npos) {
            const std::string line = buf.substr(0, nl);
            buf.erase(0, nl + 1);
            handle_line(line);
        }
    }
}

} // namespace ttsr
