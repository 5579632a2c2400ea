// cpp/src/progress.cpp
#include "ttsr/progress.h"
#include "ttsr/checkpoint_store.h"

#include <chrono>
#include <cstdio>
#include <iostream>

namespace ttsr {

std::string format_duration(double seconds) {
    if (seconds < 0) seconds = 0;
    const long long s = (long long)seconds;
    char buf[64];
    if (seconds < 60) {
        std::snprintf(buf, sizeof(buf), "%llds", s);
    } else if (seconds < 3600) {
        std::snprintf(buf, sizeof(buf), "%lldm %llds", s / 60, s % 60);
    } else {
        std::snprintf(buf, sizeof(buf), "%lldh %lldm", s / 3600, (s % 3600) / 60);
    }
    return buf;
}

// --------------------
// ConsoleSink
// --------------------

ConsoleSink::ConsoleSink(std::ostream& os) : os_(os) {}

void ConsoleSink::erase_locked() {
    for (size_t i = 0; i < drawn_lines_; ++i) os_ << "\033[1A\r\033[K";
    drawn_lines_ = 0;
}

void ConsoleSink::render(const std::vector<std::string>& lines) {
    std::lock_guard<std::mutex> lk(mu_);
    erase_locked();
    for (const auto& l : lines) os_ << "\r\033[K" << l << "\n";
    drawn_lines_ = lines.size();
    os_.flush();
}

void ConsoleSink::message(const std::string& line) {
    std::lock_guard<std::mutex> lk(mu_);
    erase_locked();
    os_ << line << "\n";
    os_.flush();
}

// --------------------
// ProgressTracker
// --------------------

ProgressTracker::ProgressTracker(CheckpointStore* store, std::string run_key, size_t eta_window, Clock clock)
    : store_(store), run_key_(std::move(run_key)), eta_window_(eta_window ? eta_window : 1), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] {
            using namespace std::chrono;
            return duration<double>(steady_clock::now().time_since_epoch()).count();
        };
    }
}

double ProgressTracker::now() const { return clock_(); }

void ProgressTracker::start(int total_chunks, int already_completed) {
    const double prior = store_ ? store_->get_cumulative_time(run_key_) : 0.0;

    std::lock_guard<std::mutex> lk(mu_);
    total_ = total_chunks;
    completed_ = already_completed;
    completed_session_ = 0;
    recent_.clear();
    prior_ = prior;
    start_ = now();
    started_ = true;
    stopped_ = false;
    final_status_.clear();
}

void ProgressTracker::record_chunk(double duration_s) {
    std::lock_guard<std::mutex> lk(mu_);
    ++completed_;
    ++completed_session_;
    if (duration_s > 0) {
        recent_.push_back(duration_s);
        while (recent_.size() > eta_window_) recent_.pop_front();
    }
}

double ProgressTracker::session_elapsed_locked() const {
    if (!started_) return 0.0;
    const double end = stopped_ ? stopped_at_ : now();
    return end > start_ ? end - start_ : 0.0;
}

double ProgressTracker::session_elapsed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return session_elapsed_locked();
}

double ProgressTracker::total_elapsed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return prior_ + session_elapsed_locked();
}

double ProgressTracker::prior_cumulative() const {
    std::lock_guard<std::mutex> lk(mu_);
    return prior_;
}

int ProgressTracker::total() const {
    std::lock_guard<std::mutex> lk(mu_);
    return total_;
}

int ProgressTracker::completed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return completed_;
}

int ProgressTracker::completed_in_session() const {
    std::lock_guard<std::mutex> lk(mu_);
    return completed_session_;
}

std::optional<double> ProgressTracker::eta_locked() const {
    const int remaining = total_ - completed_;
    if (remaining <= 0) return 0.0;
    if (completed_session_ == 0) return std::nullopt;

    double avg = 0.0;
    if (!recent_.empty()) {
        for (double d : recent_) avg += d;
        avg /= (double)recent_.size();
    } else {
        const double el = session_elapsed_locked();
        if (el <= 0) return std::nullopt;
        avg = el / (double)completed_session_;
    }
    return avg * (double)remaining;
}

std::optional<double> ProgressTracker::eta_seconds() const {
    std::lock_guard<std::mutex> lk(mu_);
    return eta_locked();
}

std::string ProgressTracker::eta_text() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (total_ - completed_ <= 0) return "complete";
    auto eta = eta_locked();
    return eta ? format_duration(*eta) : "calculating...";
}

std::string ProgressTracker::status_line(int next_index) const {
    const std::string eta = eta_text();
    std::lock_guard<std::mutex> lk(mu_);
    const double session = session_elapsed_locked();
    return "Processing chunk " + std::to_string(next_index) + "/" + std::to_string(total_) +
           " | Session: " + format_duration(session) +
           " | Total: " + format_duration(prior_ + session) +
           " | ETA: " + eta;
}

bool ProgressTracker::stop(const std::string& final_status) {
    double session = 0.0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_ || stopped_) return false;
        stopped_at_ = now();
        stopped_ = true;
        final_status_ = final_status;
        session = session_elapsed_locked();
    }

    if (store_ && !run_key_.empty()) {
        if (!store_->add_cumulative_time(run_key_, session)) {
            std::cerr << "[ttsr] no checkpoint for " << run_key_ << ", session time not recorded\n";
        }
    }
    return true;
}

bool ProgressTracker::stopped() const {
    std::lock_guard<std::mutex> lk(mu_);
    return stopped_;
}

std::string ProgressTracker::final_status() const {
    std::lock_guard<std::mutex> lk(mu_);
    return final_status_;
}

} // namespace ttsr
