// cpp/common/text_common.cpp
#include "text_common.h"

#include <cstdio>

namespace {

struct Utf8Dec {
    uint32_t cp{0};
    size_t   len{1};
    bool     ok{false};
};

static inline bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

static inline Utf8Dec decode_utf8(std::string_view s, size_t i) {
    Utf8Dec r{};
    if (i >= s.size()) return r;

    const unsigned char c0 = (unsigned char)s[i];
    if (c0 < 0x80) {
        r.cp = c0; r.len = 1; r.ok = true;
        return r;
    }

    size_t len = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) len = 2;
    else if (c0 >= 0xE0 && c0 <= 0xEF) len = 3;
    else if (c0 >= 0xF0 && c0 <= 0xF4) len = 4;
    else return r;

    if (i + len > s.size()) return r;

    const unsigned char c1 = (unsigned char)s[i + 1];
    if (!is_cont(c1)) return r;

    if (len == 2) {
        uint32_t cp = ((uint32_t)(c0 & 0x1F) << 6) | (uint32_t)(c1 & 0x3F);
        r.cp = cp; r.len = 2; r.ok = true;
        return r;
    }

    const unsigned char c2 = (unsigned char)s[i + 2];
    if (!is_cont(c2)) return r;

    if (len == 3) {
        // overlong / surrogate checks
        if (c0 == 0xE0 && c1 < 0xA0) return r;
        if (c0 == 0xED && c1 >= 0xA0) return r;
        uint32_t cp = ((uint32_t)(c0 & 0x0F) << 12)
                    | ((uint32_t)(c1 & 0x3F) << 6)
                    |  (uint32_t)(c2 & 0x3F);
        r.cp = cp; r.len = 3; r.ok = true;
        return r;
    }

    const unsigned char c3 = (unsigned char)s[i + 3];
    if (!is_cont(c3)) return r;

    if (c0 == 0xF0 && c1 < 0x90) return r;
    if (c0 == 0xF4 && c1 > 0x8F) return r;

    uint32_t cp = ((uint32_t)(c0 & 0x07) << 18)
                | ((uint32_t)(c1 & 0x3F) << 12)
                | ((uint32_t)(c2 & 0x3F) << 6)
                |  (uint32_t)(c3 & 0x3F);
    if (cp > 0x10FFFF) return r;

    r.cp = cp; r.len = 4; r.ok = true;
    return r;
}

// avalanche (splitmix64 finalizer)
static inline uint64_t mix64(uint64_t x) {
    x ^= x >> 30;
    x *= 0xBF58476D1CE4E5B9ULL;
    x ^= x >> 27;
    x *= 0x94D049BB133111EBULL;
    x ^= x >> 31;
    return x;
}

} // namespace

size_t utf8_advance(std::string_view s, size_t from, size_t n) {
    size_t i = from;
    while (i < s.size() && n > 0) {
        Utf8Dec d = decode_utf8(s, i);
        i += d.ok ? d.len : 1;
        --n;
    }
    return i < s.size() ? i : s.size();
}

size_t utf8_count(std::string_view s) {
    size_t n = 0;
    for (size_t i = 0; i < s.size();) {
        Utf8Dec d = decode_utf8(s, i);
        i += d.ok ? d.len : 1;
        ++n;
    }
    return n;
}

bool utf8_is_valid(std::string_view s) {
    for (size_t i = 0; i < s.size();) {
        Utf8Dec d = decode_utf8(s, i);
        if (!d.ok) return false;
        i += d.len;
    }
    return true;
}

void append_utf8(uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back((char)cp);
    } else if (cp <= 0x7FF) {
        out.push_back((char)(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back((char)(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back((char)(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back('?');
    }
}

std::string_view trim_view(std::string_view s) {
    size_t a = 0;
    while (a < s.size() && is_space_byte((unsigned char)s[a])) ++a;
    size_t b = s.size();
    while (b > a && is_space_byte((unsigned char)s[b - 1])) --b;
    return s.substr(a, b - a);
}

// FNV-1a 64-bit
uint64_t fnv1a64(std::string_view s, uint64_t seed) {
    uint64_t h = seed;
    for (unsigned char c : s) {
        h ^= (uint64_t)c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::string hash128_hex(std::string_view s) {
    const uint64_t hi = mix64(fnv1a64(s) ^ (uint64_t)s.size());
    const uint64_t lo = mix64(fnv1a64(s, 0x9E3779B97F4A7C15ULL) + 0x9E3779B97F4A7C15ULL);

    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  (unsigned long long)hi, (unsigned long long)lo);
    return std::string(buf, 32);
}
