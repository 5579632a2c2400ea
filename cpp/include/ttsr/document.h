// cpp/include/ttsr/document.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace ttsr {

struct Document {
    std::string path;          // absolute, normalized; stable key
    std::string content;       // UTF-8
    std::string content_hash;  // hash128_hex(content)
};

struct DocumentInfo {
    std::string path;
    uint64_t size_bytes{0};
    uint64_t characters{0};
    uint64_t words{0};
    uint64_t lines{0};
    uint64_t estimated_chunks{0};
};

// Absolute + lexically normal path string.
std::string normalize_document_path(const std::filesystem::path& p);

// Throws TtsrException(IoError) when missing / not a regular file / unreadable.
void check_file_readability(const std::filesystem::path& p);

// Reads and decodes to UTF-8 (BOM dropped, CP1251 fallback for invalid UTF-8).
Document read_document(const std::filesystem::path& p);

DocumentInfo file_info(const std::filesystem::path& p, size_t chunk_size);

std::string format_file_size(uint64_t bytes);

} // namespace ttsr
