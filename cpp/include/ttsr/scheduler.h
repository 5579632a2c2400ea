// cpp/include/ttsr/scheduler.h
#pragma once
#include <condition_variable>
#include <deque>
#include <exception>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "ttsr/checkpoint_store.h"
#include "ttsr/config.h"

namespace ttsr {

class DisplaySink;
class ProgressTracker;
class ShutdownController;
class Synthesizer;

struct ChunkJob {
    int index{0};
    std::string text;
    std::filesystem::path output_dir;
    std::string language;
    bool slow{false};
    std::string name_prefix;
    int total_chunks{0};
    std::filesystem::path artifact_path;
};

struct ChunkResult {
    int index{0};
    bool success{false};
    bool cancelled{false}; // force stop: neither completed nor failed
    std::string artifact_path;
    std::string error;
    double duration_s{0.0};
    int attempts{0};
};

struct SchedulerOutcome {
    std::vector<int> completed; // this session, index order
    std::vector<int> failed;
    std::vector<int> cancelled;
    bool stop_requested{false};
    bool force_stopped{false};
};

// "<dir>/<prefix> <index+1><ext>"
std::filesystem::path artifact_path_for(const std::filesystem::path& dir,
                                        const std::string& prefix,
                                        int index,
                                        const std::string& ext);

// Runs pending chunk jobs on a bounded worker pool. The aggregation thread is the only
// checkpoint writer while run() is active.
class Scheduler {
public:
    Scheduler(const Config& cfg,
              Synthesizer& synth,
              ShutdownController& ctl,
              CheckpointStore& store,
              ProgressTracker& tracker,
              DisplaySink* sink);

    // record: in-memory copy, folded and persisted after each result.
    // done: index -> artifact for chunks already complete; extended in place.
    // Throws whatever the aggregation thread hit while persisting (StorageError).
    SchedulerOutcome run(CheckpointRecord& record,
                         std::vector<ChunkJob> jobs,
                         std::map<int, std::string>& done);

    int worker_count(size_t pending) const;

    std::vector<std::string> display_lines() const;

private:
    void worker_loop();
    ChunkResult process(const ChunkJob& job);
    void aggregator_loop(CheckpointRecord& record, std::map<int, std::string>& done);
    void fold(CheckpointRecord& record, std::map<int, std::string>& done, const ChunkResult& r);
    void render();
    void set_error(std::exception_ptr e);

    const Config& cfg_;
    Synthesizer& synth_;
    ShutdownController& ctl_;
    CheckpointStore& store_;
    ProgressTracker& tracker_;
    DisplaySink* sink_{nullptr};

    // one coarse lock for everything below
    mutable std::mutex mu_;
    std::condition_variable results_cv_;
    std::deque<ChunkJob> pending_;
    std::map<int, double> active_;       // index -> start (steady seconds)
    std::set<int> completed_;            // all runs, for display
    std::set<int> completed_now_;
    std::set<int> failed_;
    std::set<int> cancelled_;
    std::deque<ChunkResult> results_;
    bool aggregator_done_{false};
    int total_chunks_{0};
    std::exception_ptr error_;
};

} // namespace ttsr
