// cpp/src/config.cpp
#include "ttsr/config.h"
#include "ttsr/errors.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ttsr {

std::string Config::database_path() const {
    return (fs::path(state_dir) / "tts_checkpoints.sqlite").string();
}

std::string Config::boundaries_dir() const {
    return (fs::path(state_dir) / "boundaries").string();
}

void validate_config(const Config& c) {
    auto bad = [](const std::string& what) {
        throw TtsrException(ErrorCode::InvalidArgs, "invalid config: " + what);
    };
    if (c.chunk_size == 0) bad("chunk_size must be > 0");
    if (c.max_retries < 1) bad("max_retries must be >= 1");
    if (c.retry_base_delay_ms < 0) bad("retry_base_delay_ms must be >= 0");
    if (c.max_parallel_chunks < 1) bad("max_parallel_chunks must be >= 1");
    if (c.progress_interval_ms < 10) bad("progress_interval_ms must be >= 10");
    if (c.eta_window == 0) bad("eta_window must be > 0");
    if (c.max_display_lines == 0) bad("max_display_lines must be > 0");
    if (c.state_dir.empty()) bad("state_dir is empty");
    if (c.output_root.empty()) bad("output_root is empty");
    if (c.provider_timeout_s < 1) bad("provider_timeout_s must be >= 1");
}

// --------------------
// file
// --------------------

template <class T>
static void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::type_error& e) {
        throw TtsrException(ErrorCode::ParseError, std::string("config key '") + key + "': " + e.what());
    }
}

void apply_config_file(Config& c, const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw TtsrException(ErrorCode::IoError, "cannot open config file: " + path);

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw TtsrException(ErrorCode::ParseError, "config file is not valid JSON: " + path);
    if (!j.is_object()) throw TtsrException(ErrorCode::ParseError, "config file must hold a JSON object: " + path);

    read_key(j, "default_language", c.default_language);
    read_key(j, "chunk_size", c.chunk_size);
    read_key(j, "max_retries", c.max_retries);
    read_key(j, "retry_base_delay_ms", c.retry_base_delay_ms);
    read_key(j, "max_parallel_chunks", c.max_parallel_chunks);
    read_key(j, "parallel_enabled", c.parallel_enabled);
    read_key(j, "progress_interval_ms", c.progress_interval_ms);
    read_key(j, "eta_window", c.eta_window);
    read_key(j, "max_display_lines", c.max_display_lines);
    read_key(j, "state_dir", c.state_dir);
    read_key(j, "output_root", c.output_root);
    read_key(j, "audio_extension", c.audio_extension);
    read_key(j, "provider_url", c.provider_url);
    read_key(j, "provider_path", c.provider_path);
    read_key(j, "provider_timeout_s", c.provider_timeout_s);
    read_key(j, "keep_completed_records", c.keep_completed_records);
}

// --------------------
// env
// --------------------

static bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    throw TtsrException(ErrorCode::InvalidArgs, std::string(key) + ": expected 0/1/true/false, got '" + s + "'");
}

static long long env_int(const char* key, long long defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0') {
        throw TtsrException(ErrorCode::InvalidArgs, std::string(key) + ": not an integer: '" + s + "'");
    }
    return v;
}

static void env_str(const char* key, std::string& out) {
    const char* s = std::getenv(key);
    if (s && *s) out = s;
}

void apply_env_overrides(Config& c) {
    env_str("TTSR_STATE_DIR", c.state_dir);
    env_str("TTSR_OUTPUT_ROOT", c.output_root);
    env_str("TTSR_PROVIDER_URL", c.provider_url);

    c.max_parallel_chunks = (int)env_int("TTSR_MAX_WORKERS", c.max_parallel_chunks);
    c.max_retries = (int)env_int("TTSR_MAX_RETRIES", c.max_retries);
    c.retry_base_delay_ms = (int)env_int("TTSR_RETRY_DELAY_MS", c.retry_base_delay_ms);

    const long long cs = env_int("TTSR_CHUNK_SIZE", (long long)c.chunk_size);
    if (cs <= 0) throw TtsrException(ErrorCode::InvalidArgs, "TTSR_CHUNK_SIZE must be > 0");
    c.chunk_size = (size_t)cs;

    c.parallel_enabled = env_bool("TTSR_PARALLEL", c.parallel_enabled);
}

Config load_config(const std::string& config_file) {
    Config c;
    if (!config_file.empty()) apply_config_file(c, config_file);
    apply_env_overrides(c);
    validate_config(c);
    return c;
}

} // namespace ttsr
