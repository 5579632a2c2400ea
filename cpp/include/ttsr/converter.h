// cpp/include/ttsr/converter.h
#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ttsr/checkpoint_store.h"
#include "ttsr/chunker.h"
#include "ttsr/config.h"

namespace ttsr {

class DisplaySink;
class ShutdownController;
class Synthesizer;

enum class ConvertOutcome {
    Completed,
    Stopped,
    ForceStopped,
    Deleted,
    Failed, // some chunks failed permanently; resumable
    Empty,  // nothing to synthesize
};

const char* to_string(ConvertOutcome o);

struct ConvertOptions {
    std::string output_dir;     // empty: restored, else <output_root>/<prefix>
    std::string language;       // empty: restored, else cfg.default_language
    std::optional<bool> slow;
    std::string prefix;         // empty: restored, else output dir name or document stem
    std::string session_label;
    bool resume{true};          // false: drop existing progress first
};

struct ConvertReport {
    ConvertOutcome outcome{ConvertOutcome::Empty};
    std::string run_key;
    bool resumed{false};
    int total{0};
    int completed{0};
    std::vector<int> failed;
    std::vector<std::string> artifacts;
    std::string output_dir;
    std::string prefix;
    double session_seconds{0.0};
    double total_seconds{0.0};
};

struct ValidationResult {
    bool ok{false};
    std::vector<std::string> errors;
};

// Structural checks plus artifact existence.
ValidationResult validate_record(const CheckpointRecord& r);

class Converter {
public:
    using ConfirmFn = std::function<bool(const std::string& question)>;

    // synth may be null when only the maintenance operations are used.
    Converter(const Config& cfg, Synthesizer* synth, ShutdownController& ctl, DisplaySink* sink);

    // Throws TtsrException: IoError for unreadable input, PermissionDenied/IoError for output
    // directory failures, StorageError for checkpoint failures.
    ConvertReport convert(const std::filesystem::path& document,
                          const ConvertOptions& opt,
                          ConfirmFn confirm_delete_audio = {});

    std::optional<CheckpointRecord> find_incomplete(const std::filesystem::path& document,
                                                    const std::string& label);

    // Record + boundary cache; audio too when delete_audio. Returns whether a record existed.
    bool purge_progress(const std::filesystem::path& document, const std::string& label, bool delete_audio);

    // Bookkeeping only.
    bool clean_progress(const std::filesystem::path& document, const std::string& label);

    // Every record and boundary cache; audio is kept. Returns records removed.
    int64_t cleanup_all();

    CheckpointStore& store() { return store_; }
    Chunker& chunker() { return chunker_; }

private:
    void delete_audio(const std::vector<std::string>& artifacts, const std::filesystem::path& dir);
    void remove_stale_parts(const std::filesystem::path& dir, const std::string& prefix);

    const Config& cfg_;
    Synthesizer* synth_{nullptr};
    ShutdownController& ctl_;
    DisplaySink* sink_{nullptr};
    CheckpointStore store_;
    Chunker chunker_;
};

} // namespace ttsr
