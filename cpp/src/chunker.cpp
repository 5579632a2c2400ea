// cpp/src/chunker.cpp
#include "ttsr/chunker.h"
#include "ttsr/errors.h"
#include "ttsr/fileio.h"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "text_common.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ttsr {

static const char* kBoundarySuffix = "_chunk_boundaries.json";

std::vector<ChunkBoundary> compute_boundaries(std::string_view text, size_t max_chars) {
    if (max_chars == 0) throw TtsrException(ErrorCode::InvalidArgs, "max_chars must be > 0");

    std::vector<ChunkBoundary> out;
    if (trim_view(text).empty()) return out;

    const size_t n = text.size();
    size_t pos = 0;

    while (pos < n) {
        const size_t start = pos;
        const size_t window_end = utf8_advance(text, start, max_chars);
        size_t end = window_end;

        if (end < n) {
            const size_t half = utf8_advance(text, start, max_chars / 2);

            // last ". " lying fully inside [start, end)
            size_t se = std::string_view::npos;
            if (end - start >= 2) {
                se = text.rfind(". ", end - 2);
                if (se != std::string_view::npos && se < start) se = std::string_view::npos;
            }

            if (se != std::string_view::npos && se > half) {
                end = se + 2;
            } else {
                while (end > start && !is_space_byte((unsigned char)text[end - 1])) --end;
                if (end == start) end = window_end;
            }
        }

        if (!trim_view(text.substr(start, end - start)).empty()) {
            out.push_back(ChunkBoundary{start, end});
        }
        pos = end;
    }
    return out;
}

std::vector<std::string> apply_boundaries(std::string_view text, const std::vector<ChunkBoundary>& b) {
    std::vector<std::string> out;
    out.reserve(b.size());
    for (const auto& cb : b) {
        std::string_view s = trim_view(text.substr(cb.start, cb.end - cb.start));
        if (!s.empty()) out.emplace_back(s);
    }
    return out;
}

Chunker::Chunker(fs::path cache_dir) : cache_dir_(std::move(cache_dir)) {}

fs::path Chunker::cache_path(const std::string& cache_key) const {
    const std::string name = fs::path(cache_key).filename().string();
    const std::string h = hash128_hex(cache_key).substr(0, 8);
    return cache_dir_ / (name + "_" + h + kBoundarySuffix);
}

static bool boundaries_valid(const std::vector<ChunkBoundary>& b, size_t n) {
    size_t prev_end = 0;
    for (const auto& cb : b) {
        if (cb.start >= cb.end) return false;
        if (cb.end > n) return false;
        if (cb.start < prev_end) return false;
        prev_end = cb.end;
    }
    return true;
}

std::optional<ChunkBoundarySet> Chunker::load_cache(const std::string& cache_key, std::string_view text) const {
    const fs::path p = cache_path(cache_key);
    std::error_code ec;
    if (!fs::exists(p, ec)) return std::nullopt;

    try {
        std::ifstream in(p, std::ios::binary);
        if (!in) return std::nullopt;
        json j = json::parse(in);

        ChunkBoundarySet set;
        set.content_hash = j.at("text_hash").get<std::string>();
        if (set.content_hash != hash128_hex(text)) return std::nullopt;

        for (const auto& pair : j.at("boundaries")) {
            if (!pair.is_array() || pair.size() != 2) return std::nullopt;
            set.boundaries.push_back(ChunkBoundary{pair[0].get<size_t>(), pair[1].get<size_t>()});
        }
        if (!boundaries_valid(set.boundaries, text.size())) {
            std::cerr << "[ttsr.chunker] ignoring cache with invalid offsets: " << p << "\n";
            return std::nullopt;
        }
        return set;
    } catch (const json::exception& e) {
        std::cerr << "[ttsr.chunker] unreadable boundary cache " << p << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

void Chunker::save_cache(const std::string& cache_key, const ChunkBoundarySet& set) const {
    json arr = json::array();
    for (const auto& cb : set.boundaries) arr.push_back(json::array({cb.start, cb.end}));
    json j;
    j["text_hash"] = set.content_hash;
    j["boundaries"] = std::move(arr);

    const fs::path fin = cache_path(cache_key);
    const fs::path tmp = fin.string() + ".tmp";

    try {
        ensure_dirs(cache_dir_);
    } catch (const TtsrException& e) {
        std::cerr << "[ttsr.chunker] could not save chunk boundaries: " << e.what() << "\n";
        return;
    }
    if (!write_text_file_tmp(tmp, j.dump())) {
        std::cerr << "[ttsr.chunker] could not save chunk boundaries: write failed " << tmp << "\n";
        remove_file_best_effort(tmp, "ttsr.chunker");
        return;
    }
    if (!atomic_replace_file_best_effort(tmp, fin)) {
        remove_file_best_effort(tmp, "ttsr.chunker");
    }
}

std::vector<std::string> Chunker::split(const std::string& text, size_t max_chars, const std::string& cache_key) {
    if (trim_view(text).empty()) return {};

    if (!cache_key.empty()) {
        if (auto cached = load_cache(cache_key, text)) {
            return apply_boundaries(text, cached->boundaries);
        }
    }

    ChunkBoundarySet set;
    set.boundaries = compute_boundaries(text, max_chars);

    if (!cache_key.empty() && !set.boundaries.empty()) {
        set.content_hash = hash128_hex(text);
        save_cache(cache_key, set);
    }
    return apply_boundaries(text, set.boundaries);
}

bool Chunker::remove_cache(const std::string& cache_key) const {
    return remove_file_best_effort(cache_path(cache_key), "ttsr.chunker");
}

size_t Chunker::remove_all_caches() const {
    std::error_code ec;
    if (!fs::is_directory(cache_dir_, ec)) return 0;

    const std::string suffix = kBoundarySuffix;
    std::vector<fs::path> victims;
    for (fs::directory_iterator it(cache_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.size() < suffix.size()) continue;
        if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;
        victims.push_back(it->path());
    }
    if (ec) std::cerr << "[ttsr.chunker] listing " << cache_dir_ << " failed: " << ec.message() << "\n";

    size_t removed = 0;
    for (const auto& p : victims) {
        if (remove_file_best_effort(p, "ttsr.chunker")) ++removed;
    }
    return removed;
}

} // namespace ttsr
