#ifndef GNTP_PROTOCOL_ERROR_HPP
#define GNTP_PROTOCOL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gntp {
namespace protocol {

// Error codes reported to the peer in the Error-Code header
enum class ErrorCode {
    INVALID_REQUEST = 300,
    UNKNOWN_PROTOCOL = 301,
    UNKNOWN_PROTOCOL_VERSION = 302,
    NOT_AUTHORIZED = 400,
    UNKNOWN_APPLICATION = 401,
    UNKNOWN_NOTIFICATION = 402,
    INTERNAL_SERVER_ERROR = 500
};

inline int error_code_value(ErrorCode code) {
    return static_cast<int>(code);
}

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_REQUEST: return "Invalid request";
        case ErrorCode::UNKNOWN_PROTOCOL: return "Unknown protocol";
        case ErrorCode::UNKNOWN_PROTOCOL_VERSION: return "Unknown protocol version";
        case ErrorCode::NOT_AUTHORIZED: return "Not authorized";
        case ErrorCode::UNKNOWN_APPLICATION: return "Unknown application";
        case ErrorCode::UNKNOWN_NOTIFICATION: return "Unknown notification";
        case ErrorCode::INTERNAL_SERVER_ERROR: return "Internal server error";
        default: return "Undefined error";
    }
}

// A failure that is reported back to the peer as an ERROR response
class GntpException : public std::runtime_error {
public:
    explicit GntpException(ErrorCode code, const std::string& detail = "")
        : std::runtime_error(detail.empty()
                                 ? std::string(error_code_to_string(code))
                                 : std::string(error_code_to_string(code)) + ": " + detail)
        , code_(code)
        , detail_(detail) {}

    ErrorCode code() const { return code_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorCode code_;
    std::string detail_;
};

// The peer closed the stream before the request was complete; no response is owed
class EndOfStream : public std::runtime_error {
public:
    explicit EndOfStream(const std::string& message)
        : std::runtime_error("End of stream: " + message) {}
};

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_ERROR_HPP
