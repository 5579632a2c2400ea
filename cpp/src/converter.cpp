// cpp/src/converter.cpp
#include "ttsr/converter.h"
#include "ttsr/document.h"
#include "ttsr/errors.h"
#include "ttsr/fileio.h"
#include "ttsr/progress.h"
#include "ttsr/scheduler.h"
#include "ttsr/shutdown.h"

#include <iostream>
#include <set>
#include <sstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace ttsr {

const char* to_string(ConvertOutcome o) {
    switch (o) {
        case ConvertOutcome::Completed:    return "completed";
        case ConvertOutcome::Stopped:      return "stopped";
        case ConvertOutcome::ForceStopped: return "force_stopped";
        case ConvertOutcome::Deleted:      return "deleted";
        case ConvertOutcome::Failed:       return "failed";
        case ConvertOutcome::Empty:        return "empty";
    }
    return "failed";
}

ValidationResult validate_record(const CheckpointRecord& r) {
    ValidationResult vr;

    if (r.run_key.empty()) vr.errors.push_back("empty run_key");
    if (r.document_path.empty()) vr.errors.push_back("empty document_path");
    if (r.total_chunks <= 0) vr.errors.push_back("total_chunks must be > 0");

    if (r.completed_chunks < 0 || r.completed_chunks > r.total_chunks) {
        std::ostringstream oss;
        oss << "completed_chunks out of range: completed=" << r.completed_chunks
            << " total=" << r.total_chunks;
        vr.errors.push_back(oss.str());
    }

    if ((int)r.artifact_paths.size() != r.completed_chunks) {
        std::ostringstream oss;
        oss << "artifact count mismatch: artifacts=" << r.artifact_paths.size()
            << " completed=" << r.completed_chunks;
        vr.errors.push_back(oss.str());
    }

    for (const auto& a : r.artifact_paths) {
        std::error_code ec;
        if (!fs::exists(a, ec)) {
            vr.errors.push_back("missing artifact: " + a);
        }
    }

    std::set<int> seen;
    for (int i : r.failed_chunks) {
        if (i < 0 || i >= r.total_chunks) {
            vr.errors.push_back("failed chunk index out of range: " + std::to_string(i));
        } else if (!seen.insert(i).second) {
            vr.errors.push_back("duplicate failed chunk index: " + std::to_string(i));
        }
    }

    vr.ok = vr.errors.empty();
    return vr;
}

Converter::Converter(const Config& cfg, Synthesizer* synth, ShutdownController& ctl, DisplaySink* sink)
    : cfg_(cfg),
      synth_(synth),
      ctl_(ctl),
      sink_(sink),
      store_(cfg.database_path()),
      chunker_(cfg.boundaries_dir()) {}

std::optional<CheckpointRecord> Converter::find_incomplete(const fs::path& document, const std::string& label) {
    const std::string key = derive_run_key(normalize_document_path(document), label);
    return store_.load_incomplete(key);
}

void Converter::delete_audio(const std::vector<std::string>& artifacts, const fs::path& dir) {
    size_t removed = 0;
    for (const auto& a : artifacts) {
        if (remove_file_best_effort(a, "ttsr")) ++removed;
    }
    std::cerr << "[ttsr] deleted " << removed << " audio file(s)\n";

    std::error_code ec;
    if (!dir.empty() && fs::is_directory(dir, ec) && fs::is_empty(dir, ec)) {
        fs::remove(dir, ec);
        if (ec) std::cerr << "[ttsr] could not remove " << dir << ": " << ec.message() << "\n";
    }
}

void Converter::remove_stale_parts(const fs::path& dir, const std::string& prefix) {
    std::error_code ec;
    std::vector<fs::path> stale;
    const std::string head = prefix + " ";
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.size() < 5 || name.compare(name.size() - 5, 5, ".part") != 0) continue;
        if (name.compare(0, head.size(), head) != 0) continue;
        stale.push_back(it->path());
    }
    for (const auto& p : stale) remove_file_best_effort(p, "ttsr");
}

namespace {

// clears processing_started on every exit path
struct ProcessingGuard {
    ShutdownController& ctl;
    explicit ProcessingGuard(ShutdownController& c) : ctl(c) { ctl.set_processing_started(true); }
    ~ProcessingGuard() { ctl.set_processing_started(false); }
};

void ensure_writable_dir(const fs::path& dir) {
    ensure_dirs(dir);
    if (::access(dir.c_str(), W_OK) != 0) {
        throw TtsrException(ErrorCode::PermissionDenied, "output directory is not writable: " + dir.string());
    }
}

} // namespace

ConvertReport Converter::convert(const fs::path& document, const ConvertOptions& opt, ConfirmFn confirm_delete_audio) {
    if (!synth_) throw TtsrException(ErrorCode::InvalidArgs, "no synthesis provider configured");

    Document doc = read_document(document);
    const std::string key = derive_run_key(doc.path, opt.session_label);

    ConvertReport rep;
    rep.run_key = key;

    if (!opt.resume) {
        store_.purge(key);
        chunker_.remove_cache(doc.path);
    }

    const std::vector<std::string> chunks = chunker_.split(doc.content, cfg_.chunk_size, doc.path);
    const int total = (int)chunks.size();
    rep.total = total;

    if (chunks.empty()) {
        std::cerr << "[ttsr] nothing to synthesize in " << doc.path << "\n";
        rep.outcome = ConvertOutcome::Empty;
        return rep;
    }

    std::optional<CheckpointRecord> prev = store_.load_incomplete(key);
    if (prev && prev->total_chunks != total) {
        std::cerr << "[ttsr] stored progress expects " << prev->total_chunks << " chunks, document now has "
                  << total << "; starting fresh\n";
        store_.purge(key);
        prev.reset();
    } else if (prev && prev->content_hash != doc.content_hash) {
        std::cerr << "[ttsr] document text changed since the stored progress; starting fresh\n";
        store_.purge(key);
        prev.reset();
    }
    rep.resumed = prev.has_value();

    // --- settings: explicit > restored > defaults ---
    std::string prefix = opt.prefix;
    if (prefix.empty() && prev) prefix = prev->name_prefix;
    if (prefix.empty() && !opt.output_dir.empty()) {
        fs::path d = fs::path(opt.output_dir).lexically_normal();
        if (d.filename().empty()) d = d.parent_path();
        prefix = d.filename().string();
    }
    if (prefix.empty()) prefix = fs::path(doc.path).stem().string();

    fs::path out_dir;
    if (!opt.output_dir.empty()) {
        out_dir = opt.output_dir;
    } else if (prev && !prev->output_path.empty()) {
        out_dir = fs::path(prev->output_path).parent_path();
    } else {
        out_dir = fs::path(cfg_.output_root) / prefix;
    }
    {
        std::error_code ec;
        fs::path abs = fs::absolute(out_dir, ec);
        if (!ec) out_dir = abs.lexically_normal();
    }

    std::string language = opt.language;
    if (language.empty() && prev) language = prev->language;
    if (language.empty()) language = cfg_.default_language;

    bool slow = false;
    if (opt.slow) slow = *opt.slow;
    else if (prev) slow = prev->slow;

    ensure_writable_dir(out_dir);
    remove_stale_parts(out_dir, prefix);

    rep.output_dir = out_dir.string();
    rep.prefix = prefix;

    // --- completed set: listed artifacts that still exist ---
    std::set<std::string> listed;
    if (prev) listed.insert(prev->artifact_paths.begin(), prev->artifact_paths.end());

    std::map<int, std::string> done;
    std::vector<ChunkJob> jobs;
    for (int i = 0; i < total; ++i) {
        const fs::path ap = artifact_path_for(out_dir, prefix, i, cfg_.audio_extension);
        std::error_code ec;
        if (listed.count(ap.string()) && fs::exists(ap, ec)) {
            done[i] = ap.string();
            continue;
        }
        ChunkJob j;
        j.index = i;
        j.text = chunks[(size_t)i];
        j.output_dir = out_dir;
        j.language = language;
        j.slow = slow;
        j.name_prefix = prefix;
        j.total_chunks = total;
        j.artifact_path = ap;
        jobs.push_back(std::move(j));
    }

    CheckpointRecord record;
    if (prev) {
        record = *prev;
    } else {
        record.run_key = key;
        record.created_at_utc = utc_now_iso();
    }
    record.document_path = doc.path;
    record.content_hash = doc.content_hash;
    record.total_chunks = total;
    record.completed_chunks = (int)done.size();
    record.failed_chunks.clear();
    record.artifact_paths.clear();
    for (const auto& kv : done) record.artifact_paths.push_back(kv.second);
    record.output_path = (out_dir / (prefix + cfg_.audio_extension)).string();
    record.language = language;
    record.slow = slow;
    record.status = RunStatus::InProgress;
    record.session_start_time = unix_now_seconds();
    record.name_prefix = prefix;
    record.session_label = opt.session_label;

    // reconciled watermark; a brand-new run is first written after its first chunk
    if (prev) store_.save_progress(record);

    if (rep.resumed) {
        std::cerr << "[ttsr] resuming: " << done.size() << "/" << total << " chunks already done\n";
    }

    ProgressTracker tracker(&store_, key, cfg_.eta_window);
    tracker.start(total, (int)done.size());

    // an interrupt during reading or chunking is seen here, not lost
    ctl_.poll_signals();

    SchedulerOutcome so;
    if (!jobs.empty() && ctl_.should_continue()) {
        if (sink_) sink_->message("Processing " + std::to_string(jobs.size()) + " of " + std::to_string(total) + " chunks...");
        ProcessingGuard guard(ctl_);
        Scheduler sched(cfg_, *synth_, ctl_, store_, tracker, sink_);
        so = sched.run(record, std::move(jobs), done);
    }

    ctl_.poll_signals();
    so.stop_requested = so.stop_requested || !ctl_.should_continue();
    so.force_stopped = so.force_stopped || ctl_.force_stop_requested();

    auto fill = [&](ConvertOutcome o) {
        rep.outcome = o;
        rep.completed = (int)done.size();
        rep.failed = so.failed;
        rep.artifacts.clear();
        for (const auto& kv : done) rep.artifacts.push_back(kv.second);
        rep.session_seconds = tracker.session_elapsed();
        rep.total_seconds = tracker.total_elapsed();
        return rep;
    };

    // --- stop and delete ---
    if (ctl_.delete_requested()) {
        tracker.stop("Deleted");
        ctl_.mark_stopped();
        store_.purge(key);
        chunker_.remove_cache(doc.path);

        std::vector<std::string> audio;
        for (int i = 0; i < total; ++i) {
            const fs::path ap = artifact_path_for(out_dir, prefix, i, cfg_.audio_extension);
            std::error_code ec;
            if (fs::exists(ap, ec)) audio.push_back(ap.string());
        }
        if (!audio.empty() && confirm_delete_audio &&
            confirm_delete_audio("Also delete " + std::to_string(audio.size()) + " audio file(s) in " +
                                 out_dir.string() + "?")) {
            delete_audio(audio, out_dir);
        }
        store_.remove_database_if_empty();
        fill(ConvertOutcome::Deleted);
        rep.completed = 0;
        return rep;
    }

    // --- stopped ---
    if (so.stop_requested && (int)done.size() < total) {
        record.status = so.force_stopped ? RunStatus::ForceStopped : RunStatus::Stopped;
        store_.save_progress(record);
        tracker.stop(so.force_stopped ? "Force stopped" : "Stopped");
        ctl_.mark_stopped();
        return fill(so.force_stopped ? ConvertOutcome::ForceStopped : ConvertOutcome::Stopped);
    }

    // --- all chunks done ---
    if ((int)done.size() == total) {
        tracker.stop("Completed");
        store_.mark_completed(key);
        chunker_.remove_cache(doc.path);
        if (!cfg_.keep_completed_records) store_.purge(key);
        store_.remove_database_if_empty();
        ctl_.mark_stopped();
        return fill(ConvertOutcome::Completed);
    }

    // --- finished with permanent failures; resumable ---
    record.status = RunStatus::Processing;
    store_.save_progress(record);
    tracker.stop("Finished with failures");
    return fill(ConvertOutcome::Failed);
}

bool Converter::purge_progress(const fs::path& document, const std::string& label, bool delete_audio_files) {
    const std::string path = normalize_document_path(document);
    const std::string key = derive_run_key(path, label);

    std::optional<CheckpointRecord> rec = store_.load(key);
    store_.purge(key);
    chunker_.remove_cache(path);

    if (delete_audio_files && rec) {
        const fs::path dir = rec->output_path.empty() ? fs::path() : fs::path(rec->output_path).parent_path();
        delete_audio(rec->artifact_paths, dir);
    }
    store_.remove_database_if_empty();
    return rec.has_value();
}

bool Converter::clean_progress(const fs::path& document, const std::string& label) {
    return purge_progress(document, label, false);
}

int64_t Converter::cleanup_all() {
    const int64_t n = store_.purge_all();
    const size_t caches = chunker_.remove_all_caches();
    store_.remove_database_if_empty();
    std::cerr << "[ttsr] removed " << n << " checkpoint(s), " << caches << " boundary cache(s)\n";
    return n;
}

} // namespace ttsr
