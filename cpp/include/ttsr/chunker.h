// cpp/include/ttsr/chunker.h
#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ttsr {

// Byte offsets into UTF-8 content, [start, end).
struct ChunkBoundary {
    size_t start{0};
    size_t end{0};
};

struct ChunkBoundarySet {
    std::string content_hash;
    std::vector<ChunkBoundary> boundaries;
};

// Pure splitting step. max_chars counts code points.
// Prefers ". " past the half window, then whitespace, then a hard cut.
// Slices that trim to empty are not recorded.
std::vector<ChunkBoundary> compute_boundaries(std::string_view text, size_t max_chars);

// Slices + trims; empty slices are skipped.
std::vector<std::string> apply_boundaries(std::string_view text, const std::vector<ChunkBoundary>& b);

class Chunker {
public:
    explicit Chunker(std::filesystem::path cache_dir);

    // cache_key is the document's stable key (normalized path). Empty key disables memoization.
    // A cached boundary set whose content hash matches is replayed verbatim, regardless of max_chars.
    std::vector<std::string> split(const std::string& text, size_t max_chars, const std::string& cache_key);

    std::filesystem::path cache_path(const std::string& cache_key) const;

    // nullopt on missing / unreadable / mismatching / invalid cache.
    std::optional<ChunkBoundarySet> load_cache(const std::string& cache_key, std::string_view text) const;

    bool remove_cache(const std::string& cache_key) const;
    size_t remove_all_caches() const;

    const std::filesystem::path& cache_dir() const { return cache_dir_; }

private:
    void save_cache(const std::string& cache_key, const ChunkBoundarySet& set) const;

    std::filesystem::path cache_dir_;
};

} // namespace ttsr
