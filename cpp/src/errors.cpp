#include "ttsr/errors.h"

namespace ttsr {

const char* to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::Ok:               return "ok";
        case ErrorCode::IoError:          return "io_error";
        case ErrorCode::ParseError:       return "parse_error";
        case ErrorCode::InvalidArgs:      return "invalid_args";
        case ErrorCode::PermissionDenied: return "permission_denied";
        case ErrorCode::StorageError:     return "storage_error";
        case ErrorCode::SynthesisFailed:  return "synthesis_failed";
        case ErrorCode::Cancelled:        return "cancelled";
    }
    return "unknown";
}

} // namespace ttsr
