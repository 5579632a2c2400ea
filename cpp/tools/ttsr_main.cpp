#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include "ttsr/config.h"
#include "ttsr/converter.h"
#include "ttsr/document.h"
#include "ttsr/errors.h"
#include "ttsr/progress.h"
#include "ttsr/shutdown.h"
#include "ttsr/synthesizer.h"

namespace fs = std::filesystem;

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

static void usage() {
    std::cerr <<
        "Usage: ttsr [FILE] [options]\n"
        "  -d DIR              output directory\n"
        "  -l LANG             language code (default from config)\n"
        "  -s                  slow speech\n"
        "  -p PREFIX           audio file name prefix\n"
        "  -i                  pick a .txt file interactively\n"
        "  --session LABEL     keep a separate run for the same file\n"
        "  --config FILE       JSON config\n"
        "  --workers N         parallel chunk workers\n"
        "  --chunk-size N      characters per chunk\n"
        "  --no-parallel       one chunk at a time\n"
        "  --delete-progress   delete saved progress (asks about audio)\n"
        "  --clean             delete saved progress, keep audio\n"
        "  --cleanup           delete every saved progress record\n"
        "  --info              show file statistics and exit\n"
        "  --yes               do not ask before resuming\n";
}

static bool parse_positive(const std::string& s, long long& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtoll(s.c_str(), &end, 10);
    return end && *end == '\0' && out > 0;
}

static bool ask_yes_no(const std::string& question, bool defv) {
    std::cout << question << (defv ? " [Y/n] " : " [y/N] ") << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return defv;
    line.erase(std::remove_if(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; }),
               line.end());
    if (line.empty()) return defv;
    const char c = (char)std::tolower((unsigned char)line[0]);
    return c == 'y';
}

static std::string pick_text_file() {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(".", fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".txt") files.push_back(it->path());
    }
    std::sort(files.begin(), files.end());

    if (files.empty()) {
        std::cerr << "no .txt files under the current directory\n";
        return "";
    }

    for (size_t i = 0; i < files.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << files[i].lexically_normal().string() << "\n";
    }
    std::cout << "Select a file [1-" << files.size() << "]: " << std::flush;

    std::string line;
    long long n = 0;
    if (!std::getline(std::cin, line) || !parse_positive(line, n) || n > (long long)files.size()) {
        std::cerr << "invalid selection\n";
        return "";
    }
    return files[(size_t)n - 1].string();
}

static void print_info(const ttsr::DocumentInfo& info) {
    std::cout << "File:             " << info.path << "\n"
              << "Size:             " << ttsr::format_file_size(info.size_bytes) << "\n"
              << "Characters:       " << info.characters << "\n"
              << "Words:            " << info.words << "\n"
              << "Lines:            " << info.lines << "\n"
              << "Estimated chunks: " << info.estimated_chunks << "\n";
}

static void print_record(const ttsr::CheckpointRecord& r) {
    std::cout << "Previous progress found:\n"
              << "  Completed: " << r.completed_chunks << "/" << r.total_chunks << " chunks\n"
              << "  Status:    " << ttsr::to_string(r.status) << "\n"
              << "  Output:    " << fs::path(r.output_path).parent_path().string() << "\n"
              << "  Prefix:    " << r.name_prefix << "\n"
              << "  Language:  " << r.language << (r.slow ? " (slow)" : "") << "\n"
              << "  Time so far: " << ttsr::format_duration(r.cumulative_processing_time) << "\n";
}

int main(int argc, char** argv) {
    std::string file;
    std::string config_file;
    ttsr::ConvertOptions opt;
    bool interactive = false;
    bool no_parallel = false;
    bool delete_progress = false;
    bool clean = false;
    bool cleanup = false;
    bool info = false;
    bool yes = false;
    std::string workers;
    std::string chunk_size;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-d") opt.output_dir = arg_value(i, argc, argv);
        else if (a == "-l") opt.language = arg_value(i, argc, argv);
        else if (a == "-s") opt.slow = true;
        else if (a == "-p") opt.prefix = arg_value(i, argc, argv);
        else if (a == "-i") interactive = true;
        else if (a == "--session") opt.session_label = arg_value(i, argc, argv);
        else if (a == "--config") config_file = arg_value(i, argc, argv);
        else if (a == "--workers") workers = arg_value(i, argc, argv);
        else if (a == "--chunk-size") chunk_size = arg_value(i, argc, argv);
        else if (a == "--no-parallel") no_parallel = true;
        else if (a == "--delete-progress") delete_progress = true;
        else if (a == "--clean") clean = true;
        else if (a == "--cleanup") cleanup = true;
        else if (a == "--info") info = true;
        else if (a == "--yes") yes = true;
        else if (a == "-h" || a == "--help") { usage(); return 0; }
        else if (!a.empty() && a[0] == '-') { std::cerr << "unknown option: " << a << "\n"; usage(); return 1; }
        else if (file.empty()) file = a;
        else { std::cerr << "unexpected argument: " << a << "\n"; usage(); return 1; }
    }

    ttsr::Config cfg;
    try {
        cfg = ttsr::load_config(config_file);
        long long n = 0;
        if (!workers.empty()) {
            if (!parse_positive(workers, n)) throw ttsr::TtsrException(ttsr::ErrorCode::InvalidArgs, "--workers expects a positive integer");
            cfg.max_parallel_chunks = (int)n;
        }
        if (!chunk_size.empty()) {
            if (!parse_positive(chunk_size, n)) throw ttsr::TtsrException(ttsr::ErrorCode::InvalidArgs, "--chunk-size expects a positive integer");
            cfg.chunk_size = (size_t)n;
        }
        if (no_parallel) cfg.parallel_enabled = false;
        ttsr::validate_config(cfg);
    } catch (const ttsr::TtsrException& e) {
        std::cerr << "ttsr: " << e.what() << "\n";
        return 1;
    }

    ttsr::ShutdownController ctl;

    if (cleanup) {
        try {
            ttsr::Converter conv(cfg, nullptr, ctl, nullptr);
            const int64_t n = conv.cleanup_all();
            std::cout << "Removed " << n << " saved progress record(s). Audio files were kept.\n";
            return 0;
        } catch (const ttsr::TtsrException& e) {
            std::cerr << "ttsr: cleanup failed: " << e.what() << "\n";
            return 2;
        }
    }

    if (interactive || file.empty()) {
        file = pick_text_file();
        if (file.empty()) return 1;
    }

    try {
        ttsr::check_file_readability(file);
    } catch (const ttsr::TtsrException& e) {
        std::cerr << "ttsr: " << e.what() << "\n";
        return 1;
    }

    if (info) {
        try {
            print_info(ttsr::file_info(file, cfg.chunk_size));
            return 0;
        } catch (const ttsr::TtsrException& e) {
            std::cerr << "ttsr: " << e.what() << "\n";
            return 1;
        }
    }

    if (delete_progress || clean) {
        try {
            ttsr::Converter conv(cfg, nullptr, ctl, nullptr);
            bool audio = false;
            if (delete_progress && !yes) audio = ask_yes_no("Also delete the audio files?", false);
            const bool had = delete_progress ? conv.purge_progress(file, opt.session_label, audio)
                                             : conv.clean_progress(file, opt.session_label);
            std::cout << (had ? "Saved progress removed.\n" : "No saved progress for this file.\n");
            return 0;
        } catch (const ttsr::TtsrException& e) {
            std::cerr << "ttsr: " << e.what() << "\n";
            return 2;
        }
    }

    std::unique_ptr<ttsr::Synthesizer> synth;
    try {
        synth = ttsr::make_http_synthesizer(cfg);
    } catch (const ttsr::TtsrException& e) {
        std::cerr << "ttsr: " << e.what() << " (set provider_url or TTSR_PROVIDER_URL)\n";
        return 1;
    }

    ttsr::ConsoleSink sink(std::cout);
    ttsr::Converter conv(cfg, synth.get(), ctl, &sink);

    try {
        if (auto prev = conv.find_incomplete(file, opt.session_label)) {
            if (!yes) {
                print_record(*prev);
                if (!ask_yes_no("Continue with previous settings?", true)) {
                    if (!ask_yes_no("Start fresh and discard the old progress?", false)) return 0;
                    opt.resume = false;
                }
            }
        }
    } catch (const ttsr::TtsrException& e) {
        std::cerr << "ttsr: " << e.what() << "\n";
        return 2;
    }

    std::cout << ttsr::command_help_text();

    ttsr::install_interrupt_handlers();
    ttsr::CommandListener listener(ctl, STDIN_FILENO, [&](const std::string& s) { sink.message(s); });
    listener.start();

    auto confirm = [&](const std::string& q) {
        listener.stop();
        return ask_yes_no(q, false);
    };

    int rc = 0;
    try {
        const ttsr::ConvertReport rep = conv.convert(file, opt, confirm);
        listener.stop();

        std::cout << "\n";
        switch (rep.outcome) {
            case ttsr::ConvertOutcome::Completed:
                std::cout << "All " << rep.total << " chunks completed. Audio in " << rep.output_dir << "\n";
                break;
            case ttsr::ConvertOutcome::Stopped:
            case ttsr::ConvertOutcome::ForceStopped:
                std::cout << "Paused at " << rep.completed << "/" << rep.total
                          << " chunks. Run the same command again to resume.\n";
                break;
            case ttsr::ConvertOutcome::Deleted:
                std::cout << "Progress deleted.\n";
                break;
            case ttsr::ConvertOutcome::Failed:
                std::cout << rep.failed.size() << " chunk(s) failed; " << rep.completed << "/" << rep.total
                          << " done. Run again to retry the failed chunks.\n";
                break;
            case ttsr::ConvertOutcome::Empty:
                std::cout << "Nothing to convert.\n";
                break;
        }
        if (rep.outcome != ttsr::ConvertOutcome::Empty && rep.outcome != ttsr::ConvertOutcome::Deleted) {
            std::cout << "Session: " << ttsr::format_duration(rep.session_seconds)
                      << " | Total: " << ttsr::format_duration(rep.total_seconds) << "\n";
        }
    } catch (const ttsr::TtsrException& e) {
        listener.stop();
        std::cerr << "ttsr: " << e.what() << "\n";
        rc = (e.code() == ttsr::ErrorCode::InvalidArgs || e.code() == ttsr::ErrorCode::ParseError) ? 1 : 2;
    } catch (const std::filesystem::filesystem_error& e) {
        listener.stop();
        std::cerr << "ttsr: " << e.what() << "\n";
        rc = 2;
    }

    ttsr::restore_interrupt_handlers();
    return rc;
}
