// cpp/src/scheduler.cpp
#include "ttsr/scheduler.h"
#include "ttsr/errors.h"
#include "ttsr/fileio.h"
#include "ttsr/progress.h"
#include "ttsr/shutdown.h"
#include "ttsr/synthesizer.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace ttsr {

namespace {

double steady_seconds() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

std::string chunk_label(int index, int total) {
    return std::to_string(index + 1) + "/" + std::to_string(total);
}

} // namespace

fs::path artifact_path_for(const fs::path& dir, const std::string& prefix, int index, const std::string& ext) {
    return dir / (prefix + " " + std::to_string(index + 1) + ext);
}

Scheduler::Scheduler(const Config& cfg,
                     Synthesizer& synth,
                     ShutdownController& ctl,
                     CheckpointStore& store,
                     ProgressTracker& tracker,
                     DisplaySink* sink)
    : cfg_(cfg), synth_(synth), ctl_(ctl), store_(store), tracker_(tracker), sink_(sink) {}

int Scheduler::worker_count(size_t pending) const {
    if (pending == 0) return 0;
    if (!cfg_.parallel_enabled) return 1;
    return (int)std::min<size_t>((size_t)std::max(1, cfg_.max_parallel_chunks), pending);
}

void Scheduler::set_error(std::exception_ptr e) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!error_) error_ = e;
}

// --------------------
// workers
// --------------------

ChunkResult Scheduler::process(const ChunkJob& job) {
    ChunkResult r;
    r.index = job.index;
    r.artifact_path = job.artifact_path.string();

    const CancelToken& token = ctl_.token();
    const double t0 = steady_seconds();
    const int max_attempts = std::max(1, cfg_.max_retries);

    auto cancelled = [&]() {
        remove_file_best_effort(job.artifact_path, "ttsr.sched");
        r.success = false;
        r.cancelled = true;
        r.duration_s = steady_seconds() - t0;
        return r;
    };

    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        if (token.cancelled()) return cancelled();

        r.attempts = attempt + 1;
        try {
            synth_.synthesize(job.text, job.language, job.slow, job.artifact_path, token);

            // produced, but a force stop arrived meanwhile: redo on next run
            if (ctl_.force_stop_requested()) return cancelled();

            r.success = true;
            r.error.clear();
            r.duration_s = steady_seconds() - t0;
            return r;
        } catch (const TtsrException& e) {
            if (e.code() == ErrorCode::Cancelled || token.cancelled()) return cancelled();
            // local disk trouble ends the run; retrying cannot help
            if (e.code() == ErrorCode::IoError || e.code() == ErrorCode::PermissionDenied) throw;
            r.error = e.what();
        } catch (const std::exception& e) {
            r.error = e.what();
        }

        std::cerr << "[ttsr.sched] chunk " << chunk_label(job.index, job.total_chunks)
                  << " attempt " << (attempt + 1) << "/" << max_attempts << " failed: " << r.error << "\n";

        if (attempt + 1 < max_attempts) {
            const int shift = std::min(attempt, 20);
            const auto delay = std::chrono::milliseconds((long long)cfg_.retry_base_delay_ms << shift);
            if (token.wait_for(delay)) return cancelled();
        }
    }

    r.success = false;
    r.duration_s = steady_seconds() - t0;
    return r;
}

void Scheduler::worker_loop() {
    while (true) {
        // pause between chunks, but never outlive the queue
        while (ctl_.handle_pause_for(std::chrono::milliseconds(100))) {
            std::lock_guard<std::mutex> lk(mu_);
            if (pending_.empty()) return;
        }

        ChunkJob job;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (pending_.empty()) return;
            if (!ctl_.should_continue()) return;
            job = std::move(pending_.front());
            pending_.pop_front();
            active_[job.index] = steady_seconds();
        }

        ChunkResult r;
        try {
            r = process(job);
        } catch (...) {
            std::lock_guard<std::mutex> lk(mu_);
            active_.erase(job.index);
            throw;
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            active_.erase(job.index);
            results_.push_back(std::move(r));
        }
        results_cv_.notify_one();
    }
}

// --------------------
// aggregation
// --------------------

void Scheduler::fold(CheckpointRecord& record, std::map<int, std::string>& done, const ChunkResult& r) {
    bool ok = r.success;
    if (ok) {
        std::error_code ec;
        if (!fs::exists(r.artifact_path, ec)) {
            std::cerr << "[ttsr.sched] chunk " << chunk_label(r.index, record.total_chunks)
                      << " reported success but " << r.artifact_path << " is missing\n";
            ok = false;
        }
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (r.cancelled) {
            cancelled_.insert(r.index);
        } else if (ok) {
            completed_.insert(r.index);
            completed_now_.insert(r.index);
        } else {
            failed_.insert(r.index);
        }
        record.failed_chunks.assign(failed_.begin(), failed_.end());
    }
    if (r.cancelled) return;

    if (ok) {
        done[r.index] = r.artifact_path;
        tracker_.record_chunk(r.duration_s);
        record.status = RunStatus::InProgress;
    } else {
        record.status = RunStatus::Processing;
        if (sink_) {
            sink_->message("Chunk " + chunk_label(r.index, record.total_chunks) + " failed after " +
                           std::to_string(r.attempts) + " attempts: " + r.error);
        }
    }

    record.completed_chunks = (int)done.size();
    record.artifact_paths.clear();
    for (const auto& kv : done) record.artifact_paths.push_back(kv.second);

    // artifact is on disk before the checkpoint mentions it
    store_.save_progress(record);
}

void Scheduler::aggregator_loop(CheckpointRecord& record, std::map<int, std::string>& done) {
    const auto interval = std::chrono::milliseconds(std::max(10, cfg_.progress_interval_ms));
    double last_render = 0.0;
    bool was_paused = false;

    while (true) {
        std::vector<ChunkResult> batch;
        bool finished = false;
        {
            std::unique_lock<std::mutex> lk(mu_);
            results_cv_.wait_for(lk, std::chrono::milliseconds(50),
                                 [&] { return !results_.empty() || aggregator_done_; });
            while (!results_.empty()) {
                batch.push_back(std::move(results_.front()));
                results_.pop_front();
            }
            finished = aggregator_done_;
        }

        for (const auto& r : batch) fold(record, done, r);

        const bool paused = ctl_.is_paused();
        if (paused != was_paused) {
            was_paused = paused;
            if (paused) {
                store_.save_progress(record);
                if (sink_) sink_->message("PAUSED - type 'r' and Enter to resume");
            } else if (sink_) {
                sink_->message("RESUMED");
            }
        }

        const double now = steady_seconds();
        if (!batch.empty() || (now - last_render) * 1000.0 >= (double)interval.count()) {
            render();
            last_render = now;
        }

        if (finished) return;
    }
}

std::vector<std::string> Scheduler::display_lines() const {
    std::vector<int> comp;
    std::vector<int> act;
    std::vector<int> up;
    int total = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        comp.assign(completed_.begin(), completed_.end());
        for (const auto& kv : active_) act.push_back(kv.first);
        for (const auto& j : pending_) up.push_back(j.index);
        total = total_chunks_;
    }

    std::vector<std::string> head;
    if (ctl_.is_paused()) head.push_back("PAUSED - type 'r' and Enter to resume");

    std::vector<std::string> comp_lines;
    auto done_line = [&](int i) { return "Chunk " + chunk_label(i, total) + " completed"; };
    if (comp.size() <= 4) {
        for (int i : comp) comp_lines.push_back(done_line(i));
    } else {
        comp_lines.push_back(done_line(comp[0]));
        comp_lines.push_back(done_line(comp[1]));
        comp_lines.push_back("...");
        comp_lines.push_back(done_line(comp[comp.size() - 2]));
        comp_lines.push_back(done_line(comp[comp.size() - 1]));
    }

    std::vector<std::string> act_lines;
    for (int i : act) act_lines.push_back(tracker_.status_line(i + 1));

    const size_t cap = cfg_.max_display_lines;
    std::vector<std::string> out(head);

    // active lines win over history and queue
    const size_t fixed = head.size() + act_lines.size();
    if (fixed >= cap) {
        for (const auto& l : act_lines) out.push_back(l);
        out.resize(std::min(out.size(), cap));
        return out;
    }

    size_t room = cap - fixed;
    if (comp_lines.size() > room) comp_lines.erase(comp_lines.begin(), comp_lines.end() - (std::ptrdiff_t)room);
    room -= comp_lines.size();

    for (const auto& l : comp_lines) out.push_back(l);
    for (const auto& l : act_lines) out.push_back(l);
    for (size_t k = 0; k < up.size() && k < room; ++k) {
        out.push_back("Chunk " + chunk_label(up[k], total) + " queued");
    }
    return out;
}

void Scheduler::render() {
    if (!sink_) return;
    sink_->render(display_lines());
}

// --------------------
// run
// --------------------

SchedulerOutcome Scheduler::run(CheckpointRecord& record,
                                std::vector<ChunkJob> jobs,
                                std::map<int, std::string>& done) {
    const size_t njobs = jobs.size();
    {
        std::lock_guard<std::mutex> lk(mu_);
        pending_.assign(std::make_move_iterator(jobs.begin()), std::make_move_iterator(jobs.end()));
        active_.clear();
        completed_.clear();
        for (const auto& kv : done) completed_.insert(kv.first);
        completed_now_.clear();
        failed_.clear();
        cancelled_.clear();
        results_.clear();
        aggregator_done_ = false;
        total_chunks_ = record.total_chunks;
        error_ = nullptr;
    }

    SchedulerOutcome out;
    const int nworkers = worker_count(njobs);

    if (nworkers > 0) {
        std::thread aggregator([&]() {
            try {
                aggregator_loop(record, done);
            } catch (...) {
                set_error(std::current_exception());
                ctl_.request_stop();
            }
        });

        std::vector<std::thread> workers;
        workers.reserve((size_t)nworkers);
        for (int t = 0; t < nworkers; ++t) {
            workers.emplace_back([this]() {
                try {
                    worker_loop();
                } catch (...) {
                    set_error(std::current_exception());
                    ctl_.request_stop();
                }
            });
        }

        // exit when everything is accounted for, or when stopping with nothing in flight
        while (true) {
            ctl_.poll_signals();
            {
                std::lock_guard<std::mutex> lk(mu_);
                const size_t accounted = completed_now_.size() + failed_.size() + cancelled_.size();
                if (accounted >= njobs) break;
                if (!ctl_.should_continue() && active_.empty()) break;
                if (error_ && active_.empty()) break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        for (auto& th : workers) th.join();

        {
            std::lock_guard<std::mutex> lk(mu_);
            aggregator_done_ = true;
        }
        results_cv_.notify_all();
        aggregator.join();
    }

    std::exception_ptr err;
    {
        std::lock_guard<std::mutex> lk(mu_);
        err = error_;
        out.completed.assign(completed_now_.begin(), completed_now_.end());
        out.failed.assign(failed_.begin(), failed_.end());
        out.cancelled.assign(cancelled_.begin(), cancelled_.end());
    }
    if (err) std::rethrow_exception(err);

    out.stop_requested = !ctl_.should_continue();
    out.force_stopped = ctl_.force_stop_requested();
    return out;
}

} // namespace ttsr
