#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "error.h"
#include "message.h"

// Framing: [kind(1)][len(2, LE)][sender...][len(2, LE)][payload...]

#define SSTV_MAX_STRING_LENGTH 65535

/**
 * Prefix a byte string with its little-endian 16-bit length
 * @param bytes Raw bytes
 * @param out Receives len_lo, len_hi, bytes
 * @return OK or VALUE_TOO_LARGE if bytes exceed 65535
 */
ErrorCode encode_length_prefixed(const std::string& bytes, std::string* out);

/**
 * Base64 encode ASCII text, then length-prefix the result
 * @return NON_ASCII_TEXT if any byte is above 0x7f
 */
ErrorCode encode_length_prefixed_base64(const std::string& text, std::string* out);

/**
 * Read one length-prefixed string off the front of a buffer
 * @param buffer Source bytes
 * @param value Receives the payload
 * @param remainder Receives everything after the payload
 * @return OK or TRUNCATED_FRAME if the buffer is shorter than declared
 */
ErrorCode decode_length_prefixed(const std::string& buffer, std::string* value, std::string* remainder);

/**
 * Parse one complete device frame
 * @return OK, TRUNCATED_FRAME, or MALFORMED_FRAME if the buffer is empty
 *         or bytes remain after the payload
 */
ErrorCode parse_message(const std::string& buffer, Message* out);

/**
 * Build a client frame: [mode] LP(app_label + ".iapp.samsung") LP(inner_payload)
 */
ErrorCode build_command_frame(const std::string& app_label, std::uint8_t mode,
                              const std::string& inner_payload, std::string* out);

/**
 * Build the handshake frame sent right after connecting
 */
ErrorCode build_auth_request(const std::string& local_ip, const std::string& local_mac,
                             const std::string& app_label, std::string* out);

/**
 * Inner payloads of the two command modes
 */
ErrorCode build_key_payload(const std::string& key_code, std::string* out);
ErrorCode build_text_payload(const std::string& text, std::string* out);

// Printable rendering of raw bytes, non-printables as \xNN
std::string escape_bytes(const std::string& bytes);

// Lower case hex, no separators
std::string hex_bytes(const std::string& bytes);
