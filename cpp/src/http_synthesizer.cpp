// cpp/src/http_synthesizer.cpp
#include "ttsr/synthesizer.h"
#include "ttsr/config.h"
#include "ttsr/errors.h"
#include "ttsr/fileio.h"
#include "ttsr/shutdown.h"

#include <fstream>

#include "httplib.h"

namespace fs = std::filesystem;

namespace ttsr {

namespace {

// Aborts the client's in-flight request when the token fires.
struct CancelHook {
    const CancelToken& token;
    uint64_t id{0};
    CancelHook(const CancelToken& t, httplib::Client& cli) : token(t) {
        id = token.add_callback([&cli] { cli.stop(); });
    }
    ~CancelHook() {
        if (id) token.remove_callback(id);
    }
    CancelHook(const CancelHook&) = delete;
    CancelHook& operator=(const CancelHook&) = delete;
};

} // namespace

HttpSynthesizer::HttpSynthesizer(std::string base_url, std::string path, int timeout_s)
    : base_url_(std::move(base_url)), path_(std::move(path)), timeout_s_(timeout_s) {
    if (base_url_.empty()) throw TtsrException(ErrorCode::InvalidArgs, "provider url is empty");
    if (path_.empty() || path_[0] != '/') path_.insert(path_.begin(), '/');
}

void HttpSynthesizer::synthesize(const std::string& text,
                                 const std::string& language,
                                 bool slow,
                                 const fs::path& dest,
                                 const CancelToken& cancel) {
    if (cancel.cancelled()) throw TtsrException(ErrorCode::Cancelled, "cancelled before request");

    const fs::path part = dest.string() + ".part";

    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out) throw TtsrException(ErrorCode::IoError, "cannot open " + part.string());

    httplib::Client cli(base_url_);
    cli.set_connection_timeout(timeout_s_, 0);
    cli.set_read_timeout(timeout_s_, 0);
    cli.set_follow_location(true);

    CancelHook hook(cancel, cli);
    if (cancel.cancelled()) {
        out.close();
        remove_file_best_effort(part, "ttsr");
        throw TtsrException(ErrorCode::Cancelled, "cancelled before request");
    }

    httplib::Params params;
    params.emplace("text", text);
    params.emplace("lang", language);
    params.emplace("slow", slow ? "1" : "0");

    uint64_t received = 0;
    auto res = cli.Get(
        path_, params, httplib::Headers{},
        [&](const char* data, size_t len) {
            if (cancel.cancelled()) return false;
            out.write(data, (std::streamsize)len);
            received += len;
            return (bool)out;
        },
        [&](uint64_t, uint64_t) { return !cancel.cancelled(); });

    out.close();

    auto discard = [&]() { remove_file_best_effort(part, "ttsr"); };

    if (cancel.cancelled()) {
        discard();
        throw TtsrException(ErrorCode::Cancelled, "synthesis cancelled");
    }
    if (!out) {
        discard();
        throw TtsrException(ErrorCode::IoError, "cannot write " + part.string());
    }
    if (!res) {
        discard();
        throw TtsrException(ErrorCode::SynthesisFailed,
                            "provider request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        discard();
        throw TtsrException(ErrorCode::SynthesisFailed,
                            "provider returned HTTP " + std::to_string(res->status));
    }
    if (received == 0) {
        discard();
        throw TtsrException(ErrorCode::SynthesisFailed, "provider returned an empty body");
    }
    if (!atomic_replace_file_best_effort(part, dest)) {
        discard();
        throw TtsrException(ErrorCode::IoError, "cannot move audio into place: " + dest.string());
    }
}

std::unique_ptr<Synthesizer> make_http_synthesizer(const Config& cfg) {
    return std::make_unique<HttpSynthesizer>(cfg.provider_url, cfg.provider_path, cfg.provider_timeout_s);
}

} // namespace ttsr
