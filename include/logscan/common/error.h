#ifndef LOGSCAN_COMMON_ERROR_H
#define LOGSCAN_COMMON_ERROR_H

#include <stdexcept>
#include <string>

namespace logscan {

/**
 * Base exception for every failure raised by the library. The type tag is
 * also rendered as a bracketed prefix in what(), e.g. "[PATTERN] ...".
 */
class Error : public std::runtime_error {
   public:
    enum Type {
        INVALID_ARGUMENT,
        PATTERN_ERROR,
        IO_ERROR,
        DECOMPRESSION_ERROR,
        TRANSPORT_ERROR,
        NO_DATA,
        CANCELLED
    };

    Error(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type type() const { return type_; }

    /**
     * Caller supplied something unusable (bad pattern, bad option value).
     */
    bool is_input_error() const;

    /**
     * The remote side or the byte source failed; retrying may help.
     */
    bool is_remote_error() const;

    static const char *type_name(Type type);

   private:
    static std::string format_message(Type type, const std::string &message);

    Type type_;
};

class PatternError : public Error {
   public:
    PatternError(const std::string &pattern, const std::string &reason);

    const std::string &pattern() const { return pattern_; }

   private:
    std::string pattern_;
};

class TransportError : public Error {
   public:
    TransportError(Type type, int status_code, const std::string &message);

    // 0 when no HTTP status was obtained
    int status_code() const { return status_code_; }

   private:
    int status_code_;
};

class CancelledError : public Error {
   public:
    explicit CancelledError(const std::string &message = "operation cancelled")
        : Error(CANCELLED, message) {}
};

}  // namespace logscan

#endif  // LOGSCAN_COMMON_ERROR_H
