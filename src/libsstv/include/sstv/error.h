#pragma once

enum class ErrorCode {
    OK = 0,

    // encoding / decoding
    VALUE_TOO_LARGE,
    NON_ASCII_TEXT,
    TRUNCATED_FRAME,
    MALFORMED_FRAME,

    // transport
    CONNECT_ERROR,
    SEND_ERROR,
    RECEIVE_TIMEOUT,
    CONNECTION_CLOSED,

    // handshake
    AUTH_DENIED,
    AUTH_TIMED_OUT,
    UNKNOWN_AUTH_RESPONSE,

    // caller contract
    INVALID_CHANNEL,
};

/**
 * Human readable description of an error code
 * @param code Error code
 * @return Static description string
 */
const char* error_code_name(ErrorCode code);
