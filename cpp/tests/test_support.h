// cpp/tests/test_support.h
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "ttsr/config.h"
#include "ttsr/errors.h"
#include "ttsr/progress.h"
#include "ttsr/shutdown.h"
#include "ttsr/synthesizer.h"

namespace fs = std::filesystem;

inline fs::path mk_tmp_dir(const char* tag) {
    static int counter = 0;
    auto base = fs::temp_directory_path();
    auto p = base / ("ttsr_test_" + std::string(tag) + "_" + std::to_string((uint64_t)std::time(nullptr)) + "_" +
                     std::to_string((long)::getpid()) + "_" + std::to_string(counter++));
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

inline void write_file(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline ttsr::Config test_config(const fs::path& root) {
    ttsr::Config c;
    c.state_dir = (root / "state").string();
    c.output_root = (root / "out").string();
    c.retry_base_delay_ms = 1;
    c.progress_interval_ms = 20;
    c.max_parallel_chunks = 3;
    return c;
}

// Writes "AUDIO:<text>" to dest. `hook` runs first and may throw or flip the controller.
class FakeSynthesizer : public ttsr::Synthesizer {
public:
    using Hook = std::function<void(const fs::path& dest, const ttsr::CancelToken& cancel)>;

    Hook hook;
    bool fail_always{false};
    int delay_ms{0};

    std::atomic<int> calls{0};

    void synthesize(const std::string& text,
                    const std::string&,
                    bool,
                    const fs::path& dest,
                    const ttsr::CancelToken& cancel) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lk(mu_);
            seen_.push_back(dest.filename().string());
        }
        if (hook) hook(dest, cancel);
        if (fail_always) throw ttsr::TtsrException(ttsr::ErrorCode::SynthesisFailed, "provider down");
        if (delay_ms > 0 && cancel.wait_for(std::chrono::milliseconds(delay_ms))) {
            throw ttsr::TtsrException(ttsr::ErrorCode::Cancelled, "cancelled");
        }
        write_file(dest, "AUDIO:" + text);
    }

    std::vector<std::string> seen() {
        std::lock_guard<std::mutex> lk(mu_);
        return seen_;
    }

private:
    std::mutex mu_;
    std::vector<std::string> seen_;
};

class MemorySink : public ttsr::DisplaySink {
public:
    void render(const std::vector<std::string>& lines) override {
        std::lock_guard<std::mutex> lk(mu_);
        frames_.push_back(lines);
    }
    void message(const std::string& line) override {
        std::lock_guard<std::mutex> lk(mu_);
        messages_.push_back(line);
    }

    size_t frame_count() {
        std::lock_guard<std::mutex> lk(mu_);
        return frames_.size();
    }
    std::vector<std::string> messages() {
        std::lock_guard<std::mutex> lk(mu_);
        return messages_;
    }

private:
    std::mutex mu_;
    std::vector<std::vector<std::string>> frames_;
    std::vector<std::string> messages_;
};

// "abcd " * n
inline std::string words_text(size_t chars) {
    std::string s;
    s.reserve(chars);
    while (s.size() < chars) s += "abcd ";
    s.resize(chars);
    return s;
}

inline bool wait_until(const std::function<bool()>& pred, int timeout_ms = 3000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}
