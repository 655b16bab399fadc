#include <logscan/common/error.h>

namespace logscan {

const char *Error::type_name(Type type) {
    switch (type) {
        case INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case PATTERN_ERROR:
            return "PATTERN";
        case IO_ERROR:
            return "IO";
        case DECOMPRESSION_ERROR:
            return "DECOMPRESSION";
        case TRANSPORT_ERROR:
            return "TRANSPORT";
        case NO_DATA:
            return "NO_DATA";
        case CANCELLED:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

std::string Error::format_message(Type type, const std::string &message) {
    return std::string("[") + type_name(type) + "] " + message;
}

bool Error::is_input_error() const {
    return type_ == INVALID_ARGUMENT || type_ == PATTERN_ERROR;
}

bool Error::is_remote_error() const {
    switch (type_) {
        case IO_ERROR:
        case DECOMPRESSION_ERROR:
        case TRANSPORT_ERROR:
        case NO_DATA:
            return true;
        default:
            return false;
    }
}

PatternError::PatternError(const std::string &pattern,
                           const std::string &reason)
    : Error(PATTERN_ERROR, "Invalid regex pattern: " + pattern +
                               (reason.empty() ? "" : " (" + reason + ")")),
      pattern_(pattern) {}

TransportError::TransportError(Type type, int status_code,
                               const std::string &message)
    : Error(type, status_code > 0
                      ? message + " (status " + std::to_string(status_code) +
                            ")"
                      : message),
      status_code_(status_code) {}

}  // namespace logscan
