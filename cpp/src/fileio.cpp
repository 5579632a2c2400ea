// cpp/src/fileio.cpp
#include "ttsr/fileio.h"
#include "ttsr/errors.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ttsr {

static std::string utc_now_fmt(const char* fmt) {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

std::string utc_now_iso() { return utc_now_fmt("%Y-%m-%dT%H:%M:%SZ"); }

double unix_now_seconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

void ensure_dirs(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::create_directories(p, ec);
    if (ec) {
        const ErrorCode code = (ec == std::errc::permission_denied || ec == std::errc::read_only_file_system)
            ? ErrorCode::PermissionDenied
            : ErrorCode::IoError;
        throw TtsrException(code, "mkdir failed: " + p.string() + " err=" + ec.message());
    }
}

bool write_text_file_tmp(const std::filesystem::path& tmp, const std::string& content) {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(content.data(), (std::streamsize)content.size());
    out.flush();
    return (bool)out;
}

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin) {
    try {
        std::error_code ec;
        std::filesystem::create_directories(fin.parent_path(), ec);

        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::filesystem::remove(fin, ec);
        ec.clear();
        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::cerr << "[ttsr] atomic_replace failed: " << ec.message()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[ttsr] atomic_replace exception: " << e.what()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    }
}

bool remove_file_best_effort(const std::filesystem::path& p, const char* tag) {
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) return true;
    std::filesystem::remove(p, ec);
    if (ec) {
        std::cerr << "[" << tag << "] could not remove " << p << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

} // namespace ttsr
