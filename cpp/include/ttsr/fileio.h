#pragma once

#include <filesystem>
#include <string>

namespace ttsr {

std::string utc_now_iso();     // 2026-01-01T12:00:00Z

// Seconds since epoch (wall clock), for persisted session start times.
double unix_now_seconds();

// Throws TtsrException(PermissionDenied / IoError) on failure.
void ensure_dirs(const std::filesystem::path& p);

// write tmp + flush; false on failure
bool write_text_file_tmp(const std::filesystem::path& tmp, const std::string& content);

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin);

// Advisory delete: logs and returns false on failure, never throws.
bool remove_file_best_effort(const std::filesystem::path& p, const char* tag);

} // namespace ttsr
