// cpp/common/text_common.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// UTF-8 helpers. Offsets are always byte offsets.

// Byte offset reached after advancing n code points from `from` (clamped to s.size()).
// Invalid bytes count as one code point each.
size_t utf8_advance(std::string_view s, size_t from, size_t n);

// Number of code points (invalid bytes count as one).
size_t utf8_count(std::string_view s);

bool utf8_is_valid(std::string_view s);

void append_utf8(uint32_t cp, std::string& out);

// ASCII whitespace (UTF-8 continuation bytes are never whitespace)
inline bool is_space_byte(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim_view(std::string_view s);

// --------------------
// hashing
// --------------------

uint64_t fnv1a64(std::string_view s, uint64_t seed = 1469598103934665603ULL);

// 128-bit digest as 32 lowercase hex chars (two independent FNV-1a lanes + avalanche)
std::string hash128_hex(std::string_view s);
