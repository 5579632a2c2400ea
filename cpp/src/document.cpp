// cpp/src/document.cpp
#include "ttsr/document.h"
#include "ttsr/errors.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string_view>
#include <system_error>
#include <unistd.h>

#include "text_common.h"

namespace fs = std::filesystem;

namespace ttsr {

namespace {

// CP1251 -> Unicode codepoint (0..0xFFFF). ASCII passthrough.
static uint16_t cp1251_to_unicode(unsigned char c) {
    if (c < 0x80) return (uint16_t)c;

    // table for 0x80..0xFF
    static const uint16_t tbl[128] = {
        0x0402,0x0403,0x201A,0x0453,0x201E,0x2026,0x2020,0x2021,
        0x20AC,0x2030,0x0409,0x2039,0x040A,0x040C,0x040B,0x040F,
        0x0452,0x2018,0x2019,0x201C,0x201D,0x2022,0x2013,0x2014,
        0x0000,0x2122,0x0459,0x203A,0x045A,0x045C,0x045B,0x045F,
        0x00A0,0x040E,0x045E,0x0408,0x00A4,0x0490,0x00A6,0x00A7,
        0x0401,0x00A9,0x0404,0x00AB,0x00AC,0x00AD,0x00AE,0x0407,
        0x00B0,0x00B1,0x0406,0x0456,0x0491,0x00B5,0x00B6,0x00B7,
        0x0451,0x2116,0x0454,0x00BB,0x0458,0x0405,0x0455,0x0457,
        0x0410,0x0411,0x0412,0x0413,0x0414,0x0415,0x0416,0x0417,
        0x0418,0x0419,0x041A,0x041B,0x041C,0x041D,0x041E,0x041F,
        0x0420,0x0421,0x0422,0x0423,0x0424,0x0425,0x0426,0x0427,
        0x0428,0x0429,0x042A,0x042B,0x042C,0x042D,0x042E,0x042F,
        0x0430,0x0431,0x0432,0x0433,0x0434,0x0435,0x0436,0x0437,
        0x0438,0x0439,0x043A,0x043B,0x043C,0x043D,0x043E,0x043F,
        0x0440,0x0441,0x0442,0x0443,0x0444,0x0445,0x0446,0x0447,
        0x0448,0x0449,0x044A,0x044B,0x044C,0x044D,0x044E,0x044F
    };

    const uint16_t cp = tbl[c - 0x80];
    return cp ? cp : (uint16_t)'?';
}

static std::string cp1251_to_utf8(std::string_view s) {
    std::string out;
    out.reserve(s.size() * 2);
    for (unsigned char c : s) append_utf8((uint32_t)cp1251_to_unicode(c), out);
    return out;
}

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw TtsrException(ErrorCode::IoError, "cannot open file: " + p.string());
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw TtsrException(ErrorCode::IoError, "read failed: " + p.string());
    return s;
}

} // namespace

std::string normalize_document_path(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) abs = p;
    return abs.lexically_normal().string();
}

void check_file_readability(const fs::path& p) {
    std::error_code ec;
    if (!fs::exists(p, ec)) throw TtsrException(ErrorCode::IoError, "File not found: " + p.string());
    if (!fs::is_regular_file(p, ec)) throw TtsrException(ErrorCode::IoError, "Not a file: " + p.string());
    if (::access(p.c_str(), R_OK) != 0) {
        throw TtsrException(ErrorCode::IoError, "File not readable: " + p.string());
    }
}

Document read_document(const fs::path& p) {
    check_file_readability(p);

    std::string raw = read_all(p);

    Document d;
    d.path = normalize_document_path(p);

    // - valid UTF-8 -> keep (minus BOM)
    // - otherwise CP1251 -> UTF-8
    if (utf8_is_valid(raw)) {
        if (raw.size() >= 3 && (unsigned char)raw[0] == 0xEF &&
            (unsigned char)raw[1] == 0xBB && (unsigned char)raw[2] == 0xBF) {
            raw.erase(0, 3);
        }
        d.content = std::move(raw);
    } else {
        d.content = cp1251_to_utf8(raw);
    }

    d.content_hash = hash128_hex(d.content);
    return d;
}

DocumentInfo file_info(const fs::path& p, size_t chunk_size) {
    Document d = read_document(p);

    DocumentInfo info;
    info.path = d.path;
    std::error_code ec;
    info.size_bytes = (uint64_t)fs::file_size(p, ec);
    if (ec) info.size_bytes = 0;

    info.characters = utf8_count(d.content);

    uint64_t lines = 1;
    uint64_t words = 0;
    bool in_word = false;
    for (unsigned char c : d.content) {
        if (c == '\n') ++lines;
        if (is_space_byte(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    info.lines = lines;
    info.words = words;

    const uint64_t cs = chunk_size ? (uint64_t)chunk_size : 1;
    info.estimated_chunks = std::max<uint64_t>(1, info.characters / cs);
    return info;
}

std::string format_file_size(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB"};
    double v = (double)bytes;
    for (const char* u : units) {
        if (v < 1024.0) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.2f %s", v, u);
            return buf;
        }
        v /= 1024.0;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f TB", v);
    return buf;
}

} // namespace ttsr
