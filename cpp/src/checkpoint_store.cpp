// cpp/src/checkpoint_store.cpp
#include "ttsr/checkpoint_store.h"
#include "ttsr/errors.h"
#include "ttsr/fileio.h"

#include <iostream>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include "text_common.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ttsr {

const char* to_string(RunStatus s) {
  switch (s) {
    case RunStatus::InProgress:   return "in_progress";
    case RunStatus::Processing:   return "processing";
    case RunStatus::Stopped:      return "stopped";
    case RunStatus::ForceStopped: return "force_stopped";
    case RunStatus::Completed:    return "completed";
  }
  return "in_progress";
}

RunStatus parse_run_status(const std::string& s) {
  if (s == "in_progress") return RunStatus::InProgress;
  if (s == "processing") return RunStatus::Processing;
  if (s == "stopped") return RunStatus::Stopped;
  if (s == "force_stopped") return RunStatus::ForceStopped;
  if (s == "completed") return RunStatus::Completed;
  throw TtsrException(ErrorCode::ParseError, "unknown checkpoint status: " + s);
}

std::string derive_run_key(const std::string& normalized_path, const std::string& label) {
  if (label.empty()) return hash128_hex(normalized_path);
  std::string salted = normalized_path;
  salted.push_back('\x1f');
  salted += label;
  return hash128_hex(salted);
}

namespace {

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
  std::string msg = "sqlite " + what;
  if (db) {
    msg += ": ";
    msg += sqlite3_errmsg(db);
  }
  throw TtsrException(ErrorCode::StorageError, msg);
}

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "sqlite error";
    sqlite3_free(err);
    throw TtsrException(ErrorCode::StorageError, msg);
  }
}

// finalize on scope exit
struct Stmt {
  sqlite3_stmt* st{nullptr};
  Stmt(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) fail(db, "prepare failed");
  }
  ~Stmt() { if (st) sqlite3_finalize(st); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;
};

void bind_text(sqlite3_stmt* st, int i, const std::string& v) {
  sqlite3_bind_text(st, i, v.c_str(), -1, SQLITE_TRANSIENT);
}

std::string col_text(sqlite3_stmt* st, int i) {
  const unsigned char* p = sqlite3_column_text(st, i);
  return p ? (const char*)p : "";
}

std::string ints_to_json(const std::vector<int>& v) {
  return json(v).dump();
}

std::string strings_to_json(const std::vector<std::string>& v) {
  return json(v).dump();
}

template <class T>
std::vector<T> json_list(const std::string& s, const char* column, const std::string& run_key) {
  if (s.empty()) return {};
  json j = json::parse(s, nullptr, false);
  if (j.is_discarded() || !j.is_array()) {
    std::cerr << "[ttsr.store] bad " << column << " for " << run_key << ", treating as empty\n";
    return {};
  }
  std::vector<T> out;
  for (const auto& e : j) {
    try {
      out.push_back(e.get<T>());
    } catch (const json::exception& ex) {
      std::cerr << "[ttsr.store] bad " << column << " entry for " << run_key << ": " << ex.what() << "\n";
    }
  }
  return out;
}

const char* kSelectCols = R"SQL(
  SELECT run_key, document_path, total_chunks, completed_chunks, failed_chunks, artifact_paths,
         output_path, language, slow, status, cumulative_processing_time, session_start_time,
         name_prefix, session_label, created_at_utc, updated_at_utc, content_hash
  FROM checkpoints
)SQL";

CheckpointRecord read_row(sqlite3_stmt* st) {
  CheckpointRecord r;
  r.run_key = col_text(st, 0);
  r.document_path = col_text(st, 1);
  r.total_chunks = sqlite3_column_int(st, 2);
  r.completed_chunks = sqlite3_column_int(st, 3);
  r.failed_chunks = json_list<int>(col_text(st, 4), "failed_chunks", r.run_key);
  r.artifact_paths = json_list<std::string>(col_text(st, 5), "artifact_paths", r.run_key);
  r.output_path = col_text(st, 6);
  r.language = col_text(st, 7);
  r.slow = sqlite3_column_int(st, 8) != 0;

  const std::string status = col_text(st, 9);
  try {
    r.status = parse_run_status(status);
  } catch (const TtsrException& e) {
    std::cerr << "[ttsr.store] " << e.what() << " (" << r.run_key << "), reading as in_progress\n";
    r.status = RunStatus::InProgress;
  }

  r.cumulative_processing_time = sqlite3_column_double(st, 10);
  r.session_start_time = sqlite3_column_double(st, 11);
  r.name_prefix = col_text(st, 12);
  r.session_label = col_text(st, 13);
  r.created_at_utc = col_text(st, 14);
  r.updated_at_utc = col_text(st, 15);
  r.content_hash = col_text(st, 16);
  return r;
}

// databases written before content_hash existed
void add_missing_columns(sqlite3* db) {
  bool has_hash = false;
  {
    Stmt s(db, "PRAGMA table_info(checkpoints);");
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
      if (col_text(s.st, 1) == "content_hash") has_hash = true;
    }
    if (rc != SQLITE_DONE) fail(db, "step failed (table_info)");
  }
  if (!has_hash) exec(db, "ALTER TABLE checkpoints ADD COLUMN content_hash TEXT DEFAULT '';");
}

} // namespace

CheckpointStore::CheckpointStore(fs::path db_path) : path_(std::move(db_path)) {}

CheckpointStore::~CheckpointStore() {
  std::lock_guard<std::mutex> lk(mu_);
  close_locked();
}

void* CheckpointStore::open_locked(bool create) {
  if (db_) return db_;

  std::error_code ec;
  if (!create && !fs::exists(path_, ec)) return nullptr;

  if (path_.has_parent_path()) ensure_dirs(path_.parent_path());

  sqlite3* db = nullptr;
  if (sqlite3_open(path_.string().c_str(), &db) != SQLITE_OK) {
    std::string msg = "cannot open sqlite: " + path_.string();
    if (db) {
      msg += ": ";
      msg += sqlite3_errmsg(db);
      sqlite3_close(db);
    }
    throw TtsrException(ErrorCode::StorageError, msg);
  }
  sqlite3_busy_timeout(db, 5000);

  try {
    exec(db, R"SQL(
      PRAGMA journal_mode=WAL;
      PRAGMA synchronous=NORMAL;

      CREATE TABLE IF NOT EXISTS checkpoints (
        run_key TEXT PRIMARY KEY,
        document_path TEXT NOT NULL,
        total_chunks INTEGER NOT NULL,
        completed_chunks INTEGER NOT NULL,
        failed_chunks TEXT,
        artifact_paths TEXT,
        output_path TEXT,
        language TEXT,
        slow INTEGER DEFAULT 0,
        status TEXT NOT NULL,
        cumulative_processing_time REAL DEFAULT 0,
        session_start_time REAL DEFAULT 0,
        name_prefix TEXT,
        session_label TEXT,
        created_at_utc TEXT,
        updated_at_utc TEXT,
        content_hash TEXT DEFAULT ''
      );

      CREATE INDEX IF NOT EXISTS idx_checkpoints_status ON checkpoints(status);
    )SQL");
    add_missing_columns(db);
  } catch (...) {
    sqlite3_close(db);
    throw;
  }

  db_ = db;
  return db_;
}

void CheckpointStore::close_locked() {
  if (!db_) return;
  if (sqlite3_close((sqlite3*)db_) != SQLITE_OK) {
    std::cerr << "[ttsr.store] sqlite close failed: " << sqlite3_errmsg((sqlite3*)db_) << "\n";
  }
  db_ = nullptr;
}

void CheckpointStore::save_progress(const CheckpointRecord& r, bool write_cumulative_time) {
  if (r.run_key.empty()) throw TtsrException(ErrorCode::InvalidArgs, "save_progress: empty run_key");
  if (r.completed_chunks < 0 || r.completed_chunks > r.total_chunks) {
    throw TtsrException(ErrorCode::InvalidArgs,
                        "save_progress: completed_chunks out of range for " + r.run_key);
  }

  std::lock_guard<std::mutex> lk(mu_);
  auto* db = (sqlite3*)open_locked(true);

  const char* sql = R"SQL(
    INSERT INTO checkpoints(run_key, document_path, total_chunks, completed_chunks, failed_chunks,
                            artifact_paths, output_path, language, slow, status,
                            cumulative_processing_time, session_start_time, name_prefix,
                            session_label, created_at_utc, updated_at_utc, content_hash)
    VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?15,?17)
    ON CONFLICT(run_key) DO UPDATE SET
      document_path=excluded.document_path,
      total_chunks=excluded.total_chunks,
      completed_chunks=excluded.completed_chunks,
      failed_chunks=excluded.failed_chunks,
      artifact_paths=excluded.artifact_paths,
      output_path=excluded.output_path,
      language=excluded.language,
      slow=excluded.slow,
      status=excluded.status,
      cumulative_processing_time=CASE WHEN ?16 THEN excluded.cumulative_processing_time
                                      ELSE checkpoints.cumulative_processing_time END,
      session_start_time=excluded.session_start_time,
      name_prefix=excluded.name_prefix,
      session_label=excluded.session_label,
      updated_at_utc=excluded.updated_at_utc,
      content_hash=excluded.content_hash;
  )SQL";

  Stmt s(db, sql);
  sqlite3_stmt* st = s.st;
  bind_text(st, 1, r.run_key);
  bind_text(st, 2, r.document_path);
  sqlite3_bind_int(st, 3, r.total_chunks);
  sqlite3_bind_int(st, 4, r.completed_chunks);
  bind_text(st, 5, ints_to_json(r.failed_chunks));
  bind_text(st, 6, strings_to_json(r.artifact_paths));
  bind_text(st, 7, r.output_path);
  bind_text(st, 8, r.language);
  sqlite3_bind_int(st, 9, r.slow ? 1 : 0);
  bind_text(st, 10, to_string(r.status));
  sqlite3_bind_double(st, 11, r.cumulative_processing_time);
  sqlite3_bind_double(st, 12, r.session_start_time);
  bind_text(st, 13, r.name_prefix);
  bind_text(st, 14, r.session_label);
  bind_text(st, 15, utc_now_iso());
  sqlite3_bind_int(st, 16, write_cumulative_time ? 1 : 0);
  bind_text(st, 17, r.content_hash);

  if (sqlite3_step(st) != SQLITE_DONE) fail(db, "step failed (save_progress)");
}

std::optional<CheckpointRecord> CheckpointStore::load_where_locked(const std::string& run_key,
                                                                  bool incomplete_only) {
  auto* db = (sqlite3*)open_locked(false);
  if (!db) return std::nullopt;

  std::string sql = kSelectCols;
  sql += incomplete_only ? " WHERE run_key=? AND status != 'completed' LIMIT 1;"
                         : " WHERE run_key=? LIMIT 1;";

  Stmt s(db, sql.c_str());
  bind_text(s.st, 1, run_key);

  const int rc = sqlite3_step(s.st);
  if (rc == SQLITE_ROW) return read_row(s.st);
  if (rc != SQLITE_DONE) fail(db, "step failed (load)");
  return std::nullopt;
}

std::optional<CheckpointRecord> CheckpointStore::load_incomplete(const std::string& run_key) {
  std::lock_guard<std::mutex> lk(mu_);
  return load_where_locked(run_key, true);
}

std::optional<CheckpointRecord> CheckpointStore::load(const std::string& run_key) {
  std::lock_guard<std::mutex> lk(mu_);
  return load_where_locked(run_key, false);
}

std::vector<CheckpointRecord> CheckpointStore::list_all() {
  std::lock_guard<std::mutex> lk(mu_);
  auto* db = (sqlite3*)open_locked(false);
  if (!db) return {};

  std::string sql = kSelectCols;
  sql += " ORDER BY updated_at_utc DESC, run_key;";

  Stmt s(db, sql.c_str());
  std::vector<CheckpointRecord> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) out.push_back(read_row(s.st));
  if (rc != SQLITE_DONE) fail(db, "step failed (list_all)");
  return out;
}

int64_t CheckpointStore::count() {
  std::lock_guard<std::mutex> lk(mu_);
  auto* db = (sqlite3*)open_locked(false);
  if (!db) return 0;

  Stmt s(db, "SELECT COUNT(*) FROM checkpoints;");
  if (sqlite3_step(s.st) != SQLITE_ROW) fail(db, "step failed (count)");
  return (int64_t)sqlite3_column_int64(s.st, 0);
}

bool CheckpointStore::mark_completed(const std::string& run_key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto* db = (sqlite3*)open_locked(false);
  if (!db) return false;

  Stmt s(db, "UPDATE checkpoints SET status='completed', updated_at_utc=? WHERE run_key=?;");
  bind_text(s.st, 1, utc_now_iso());
  bind_text(s.st, 2, run_key);
  if (sqlite3_step(s.st) != SQLITE_DONE) fail(db, "step failed (mark_completed)");
  return sqlite3_changes(db) > 0;
}

double CheckpointStore::get_cumulative_time(const std::string& run_key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto* db = (sqlite3*)open_locked(false);
  if (!db) return 0.0;

  Stmt s(db, "SELECT cumulative_processing_time FROM checkpoints WHERE run_key=?;");
  bind_text(s.st, 1, run_key);
  const int rc = sqlite3_step(s.st);
  if (rc == SQLITE_ROW) return sqlite3_column_double(s.st, 0);
  if (rc != SQLITE_DONE) fail(db, "step failed (get_cumulative_time)");
  return 0.0;
}

bool CheckpointStore::add_cumulative_time(const std::string& run_key, double delta) {
  std::lock_guard<std::mutex> lk(mu_);
  auto* db = (sqlite3*)open_locked(false);
  if (!db) return false;

  Stmt s(db, R"SQL(
    UPDATE checkpoints
    SET cumulative_processing_time = COALESCE(cumulative_processing_time, 0) + ?, updated_at_utc=?
    WHERE run_key=?;
  )SQL");
  sqlite3_bind_double(s.st, 1, delta);
  bind_text(s.st, 2, utc_now_iso());
  bind_text(s.st, 3, run_key);
  if (sqlite3_step(s.st) != SQLITE_DONE) fail(db, "step failed (add_cumulative_time)");
  return sqlite3_changes(db) > 0;
}

bool CheckpointStore::purge(const std::string& run_key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto* db = (sqlite3*)open_locked(false);
  if (!db) return false;

  Stmt s(db, "DELETE FROM checkpoints WHERE run_key=?;");
  bind_text(s.st, 1, run_key);
  if (sqlite3_step(s.st) != SQLITE_DONE) fail(db, "step failed (purge)");
  return sqlite3_changes(db) > 0;
}

int64_t CheckpointStore::purge_all() {
  std::lock_guard<std::mutex> lk(mu_);
  auto* db = (sqlite3*)open_locked(false);
  if (!db) return 0;

  Stmt s(db, "DELETE FROM checkpoints;");
  if (sqlite3_step(s.st) != SQLITE_DONE) fail(db, "step failed (purge_all)");
  return (int64_t)sqlite3_changes(db);
}

bool CheckpointStore::remove_database_if_empty() {
  std::lock_guard<std::mutex> lk(mu_);

  try {
    auto* db = (sqlite3*)open_locked(false);
    if (!db) return false;

    Stmt s(db, "SELECT COUNT(*) FROM checkpoints;");
    if (sqlite3_step(s.st) != SQLITE_ROW) fail(db, "step failed (count)");
    if (sqlite3_column_int64(s.st, 0) != 0) return false;
  } catch (const TtsrException& e) {
    std::cerr << "[ttsr.store] remove_database_if_empty: " << e.what() << "\n";
    return false;
  }

  close_locked();

  bool ok = remove_file_best_effort(path_, "ttsr.store");
  remove_file_best_effort(path_.string() + "-wal", "ttsr.store");
  remove_file_best_effort(path_.string() + "-shm", "ttsr.store");
  return ok;
}

} // namespace ttsr
