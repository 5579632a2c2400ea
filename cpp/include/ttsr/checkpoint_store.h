// cpp/include/ttsr/checkpoint_store.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ttsr {

enum class RunStatus {
    InProgress,
    Processing,
    Stopped,
    ForceStopped,
    Completed,
};

const char* to_string(RunStatus s);
// Throws TtsrException(ParseError) on unknown text.
RunStatus parse_run_status(const std::string& s);

struct CheckpointRecord {
    std::string run_key;
    std::string document_path;
    std::string content_hash;                // of the text the artifacts were made from
    int total_chunks{0};
    int completed_chunks{0};                 // count of verified artifacts
    std::vector<int> failed_chunks;          // 0-based indices
    std::vector<std::string> artifact_paths; // one per completed chunk, index order
    std::string output_path;
    std::string language;
    bool slow{false};
    RunStatus status{RunStatus::InProgress};
    double cumulative_processing_time{0.0};  // seconds, prior sessions
    double session_start_time{0.0};          // unix seconds
    std::string name_prefix;
    std::string session_label;
    std::string created_at_utc;
    std::string updated_at_utc;
};

// 32 hex chars. The label salts the key so one document can carry separate runs.
std::string derive_run_key(const std::string& normalized_path, const std::string& label);

// One SQLite database, one row per run key. Connection opens lazily;
// read-only queries against a missing database file return empty results.
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path db_path);
    ~CheckpointStore();

    CheckpointStore(const CheckpointStore&) = delete;
    CheckpointStore& operator=(const CheckpointStore&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Upsert by run_key. cumulative_processing_time is written on insert, and on
    // update only when write_cumulative_time is set. created_at_utc is kept on update.
    void save_progress(const CheckpointRecord& r, bool write_cumulative_time = false);

    std::optional<CheckpointRecord> load_incomplete(const std::string& run_key);
    std::optional<CheckpointRecord> load(const std::string& run_key);
    std::vector<CheckpointRecord> list_all();
    int64_t count();

    bool mark_completed(const std::string& run_key);

    double get_cumulative_time(const std::string& run_key);
    // false if no such record
    bool add_cumulative_time(const std::string& run_key, double delta);

    bool purge(const std::string& run_key);
    int64_t purge_all();

    // Closes the connection and deletes the db (+ -wal/-shm) if no rows remain. Never throws.
    bool remove_database_if_empty();

private:
    void* open_locked(bool create); // sqlite3*, nullptr if !create and file missing
    void close_locked();
    std::optional<CheckpointRecord> load_where_locked(const std::string& run_key, bool incomplete_only);

    std::mutex mu_;
    void* db_{nullptr}; // sqlite3*
    std::filesystem::path path_;
};

} // namespace ttsr
