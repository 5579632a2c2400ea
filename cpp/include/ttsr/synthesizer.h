// cpp/include/ttsr/synthesizer.h
#pragma once
#include <filesystem>
#include <memory>
#include <string>

namespace ttsr {

class CancelToken;
struct Config;

// One chunk of text -> one audio file at dest. Retrying overwrites dest.
// Throws TtsrException(SynthesisFailed) on provider failure,
// TtsrException(Cancelled) when the token fires mid-call,
// TtsrException(IoError) when dest cannot be written.
class Synthesizer {
public:
    virtual ~Synthesizer() = default;

    virtual void synthesize(const std::string& text,
                            const std::string& language,
                            bool slow,
                            const std::filesystem::path& dest,
                            const CancelToken& cancel) = 0;
};

// GET <base_url><path>?text=..&lang=..&slow=0|1, body streamed to <dest>.part then renamed.
// Cancelling the token stops the client, also while waiting for the response.
class HttpSynthesizer : public Synthesizer {
public:
    HttpSynthesizer(std::string base_url, std::string path, int timeout_s);

    void synthesize(const std::string& text,
                    const std::string& language,
                    bool slow,
                    const std::filesystem::path& dest,
                    const CancelToken& cancel) override;

private:
    std::string base_url_;
    std::string path_;
    int timeout_s_{60};
};

// Throws TtsrException(InvalidArgs) if provider_url is empty.
std::unique_ptr<Synthesizer> make_http_synthesizer(const Config& cfg);

} // namespace ttsr
