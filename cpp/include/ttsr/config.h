// cpp/include/ttsr/config.h
#pragma once
#include <cstddef>
#include <string>

namespace ttsr {

struct Config {
    std::string default_language = "en";
    size_t chunk_size = 5000;          // code points per chunk window
    int max_retries = 3;               // total attempts per chunk
    int retry_base_delay_ms = 2000;    // sleep before attempt k+1 = base * 2^k

    int max_parallel_chunks = 4;
    bool parallel_enabled = true;

    int progress_interval_ms = 1000;
    size_t eta_window = 5;
    size_t max_display_lines = 8;

    std::string state_dir = "./.ttsr";
    std::string output_root = "./tts_audio_output";
    std::string audio_extension = ".mp3";

    std::string provider_url;
    std::string provider_path = "/v1/synthesize";
    int provider_timeout_s = 60;

    bool keep_completed_records = false;

    std::string database_path() const;  // <state_dir>/tts_checkpoints.sqlite
    std::string boundaries_dir() const; // <state_dir>/boundaries
};

// Throws TtsrException(InvalidArgs) on out-of-range values.
void validate_config(const Config& c);

// Keys match field names; unknown keys ignored.
// Throws TtsrException(IoError) if unreadable, (ParseError) on bad JSON or wrong types.
void apply_config_file(Config& c, const std::string& path);

// TTSR_STATE_DIR, TTSR_OUTPUT_ROOT, TTSR_PROVIDER_URL, TTSR_MAX_WORKERS, TTSR_MAX_RETRIES,
// TTSR_RETRY_DELAY_MS, TTSR_CHUNK_SIZE, TTSR_PARALLEL. Bad numbers -> TtsrException(InvalidArgs).
void apply_env_overrides(Config& c);

// defaults -> optional file -> env, then validate
Config load_config(const std::string& config_file);

} // namespace ttsr
