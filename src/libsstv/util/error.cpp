#include <sstv/error.h>

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                    return "ok";
        case ErrorCode::VALUE_TOO_LARGE:       return "value too large for a length-prefixed string";
        case ErrorCode::NON_ASCII_TEXT:        return "text contains non-ASCII characters";
        case ErrorCode::TRUNCATED_FRAME:       return "truncated frame";
        case ErrorCode::MALFORMED_FRAME:       return "malformed frame";
        case ErrorCode::CONNECT_ERROR:         return "could not connect to device";
        case ErrorCode::SEND_ERROR:            return "send failed";
        case ErrorCode::RECEIVE_TIMEOUT:       return "receive timed out";
        case ErrorCode::CONNECTION_CLOSED:     return "connection closed by device";
        case ErrorCode::AUTH_DENIED:           return "access denied by remote device";
        case ErrorCode::AUTH_TIMED_OUT:        return "authentication timed out on device";
        case ErrorCode::UNKNOWN_AUTH_RESPONSE: return "unknown authentication response";
        case ErrorCode::INVALID_CHANNEL:       return "channel must be between 0 and 9999";
    }
    return "unknown error";
}
