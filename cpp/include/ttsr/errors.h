#pragma once
#include <stdexcept>
#include <string>

namespace ttsr {

enum class ErrorCode {
    Ok = 0,
    IoError,
    ParseError,
    InvalidArgs,
    PermissionDenied,
    StorageError,
    SynthesisFailed,
    Cancelled,
};

const char* to_string(ErrorCode c);

class TtsrException : public std::runtime_error {
public:
    TtsrException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_{ErrorCode::Ok};
};

} // namespace ttsr
