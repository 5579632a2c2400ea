// cpp/include/ttsr/progress.h
#pragma once
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ttsr {

class CheckpointStore;

// <60s "Ns", <1h "Mm Ss", else "Hh Mm"
std::string format_duration(double seconds);

// Where the live status view goes. The core only ever calls render().
class DisplaySink {
public:
    virtual ~DisplaySink() = default;
    virtual void render(const std::vector<std::string>& lines) = 0;
    // one-off line printed above the live view
    virtual void message(const std::string& line) = 0;
};

// Redraws in place on a terminal using cursor-up + clear-line escapes.
class ConsoleSink : public DisplaySink {
public:
    explicit ConsoleSink(std::ostream& os);

    void render(const std::vector<std::string>& lines) override;
    void message(const std::string& line) override;

private:
    void erase_locked();

    std::mutex mu_;
    std::ostream& os_;
    size_t drawn_lines_{0};
};

class ProgressTracker {
public:
    using Clock = std::function<double()>; // monotonic seconds

    // store may be null (no persistence of session time).
    ProgressTracker(CheckpointStore* store, std::string run_key, size_t eta_window = 5, Clock clock = {});

    // Starts the session clock and loads prior cumulative time for run_key.
    void start(int total_chunks, int already_completed);

    // One chunk finished successfully in this session.
    void record_chunk(double duration_s);

    double session_elapsed() const;
    double total_elapsed() const;
    double prior_cumulative() const;

    int total() const;
    int completed() const;            // including chunks from earlier sessions
    int completed_in_session() const;

    // nullopt while indeterminate (nothing finished this session)
    std::optional<double> eta_seconds() const;
    std::string eta_text() const;

    std::string status_line(int next_index) const;

    // Commits session time to the store once. Returns true only for the committing call.
    bool stop(const std::string& final_status);
    bool stopped() const;
    std::string final_status() const;

private:
    double now() const;
    double session_elapsed_locked() const;
    std::optional<double> eta_locked() const;

    mutable std::mutex mu_;
    CheckpointStore* store_{nullptr};
    std::string run_key_;
    size_t eta_window_{5};
    Clock clock_;

    double start_{0.0};
    double stopped_at_{0.0};
    double prior_{0.0};
    int total_{0};
    int completed_{0};
    int completed_session_{0};
    std::deque<double> recent_;
    bool started_{false};
    bool stopped_{false};
    std::string final_status_;
};

} // namespace ttsr
