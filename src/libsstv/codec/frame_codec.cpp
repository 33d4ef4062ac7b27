#include <sstv/frame_codec.h>
#include <sstv/config.h>
#include "../util/crypto/base64.h"
#include <cstdio>
#include <initializer_list>
#include <utility>

ErrorCode encode_length_prefixed(const std::string& bytes, std::string* out) {
    size_t length = bytes.size();
    if (length > SSTV_MAX_STRING_LENGTH) {
        return ErrorCode::VALUE_TOO_LARGE;
    }

    std::string encoded;
    encoded.reserve(length + 2);
    encoded.push_back(static_cast<char>(length & 0xFF));
    encoded.push_back(static_cast<char>((length >> 8) & 0xFF));
    encoded += bytes;

    *out = std::move(encoded);
    return ErrorCode::OK;
}

ErrorCode encode_length_prefixed_base64(const std::string& text, std::string* out) {
    for (unsigned char c : text) {
        if (c > 0x7f) {
            return ErrorCode::NON_ASCII_TEXT;
        }
    }
    return encode_length_prefixed(base64_encode(text), out);
}

ErrorCode decode_length_prefixed(const std::string& buffer, std::string* value, std::string* remainder) {
    if (buffer.size() < 2) {
        return ErrorCode::TRUNCATED_FRAME;
    }

    size_t length = static_cast<unsigned char>(buffer[0]) +
                    static_cast<unsigned char>(buffer[1]) * 256;
    if (buffer.size() < length + 2) {
        return ErrorCode::TRUNCATED_FRAME;
    }

    *value = buffer.substr(2, length);
    *remainder = buffer.substr(length + 2);
    return ErrorCode::OK;
}

ErrorCode parse_message(const std::string& buffer, Message* out) {
    if (buffer.empty()) {
        return ErrorCode::MALFORMED_FRAME;
    }

    std::uint8_t kind = static_cast<std::uint8_t>(buffer[0]);

    std::string sender;
    std::string remaining;
    ErrorCode result = decode_length_prefixed(buffer.substr(1), &sender, &remaining);
    if (result != ErrorCode::OK) {
        return result;
    }

    std::string payload;
    std::string trailing;
    result = decode_length_prefixed(remaining, &payload, &trailing);
    if (result != ErrorCode::OK) {
        return result;
    }

    if (!trailing.empty()) {
        return ErrorCode::MALFORMED_FRAME;
    }

    *out = Message(kind, std::move(sender), std::move(payload));
    return ErrorCode::OK;
}

ErrorCode build_command_frame(const std::string& app_label, std::uint8_t mode,
                              const std::string& inner_payload, std::string* out) {
    std::string sender;
    ErrorCode result = encode_length_prefixed(app_label + SSTV_APP_SUFFIX, &sender);
    if (result != ErrorCode::OK) {
        return result;
    }

    std::string payload;
    result = encode_length_prefixed(inner_payload, &payload);
    if (result != ErrorCode::OK) {
        return result;
    }

    std::string frame;
    frame.reserve(1 + sender.size() + payload.size());
    frame.push_back(static_cast<char>(mode));
    frame += sender;
    frame += payload;

    *out = std::move(frame);
    return ErrorCode::OK;
}

ErrorCode build_auth_request(const std::string& local_ip, const std::string& local_mac,
                             const std::string& app_label, std::string* out) {
    std::string auth_content("\x64\x00", 2);

    for (const std::string* field : {&local_ip, &local_mac, &app_label}) {
        std::string encoded;
        ErrorCode result = encode_length_prefixed_base64(*field, &encoded);
        if (result != ErrorCode::OK) {
            return result;
        }
        auth_content += encoded;
    }

    return build_command_frame(app_label, MODE_KEY, auth_content, out);
}

ErrorCode build_key_payload(const std::string& key_code, std::string* out) {
    std::string encoded;
    ErrorCode result = encode_length_prefixed_base64(key_code, &encoded);
    if (result != ErrorCode::OK) {
        return result;
    }
    *out = std::string("\x00\x00\x00", 3) + encoded;
    return ErrorCode::OK;
}

ErrorCode build_text_payload(const std::string& text, std::string* out) {
    std::string encoded;
    ErrorCode result = encode_length_prefixed_base64(text, &encoded);
    if (result != ErrorCode::OK) {
        return result;
    }
    *out = std::string("\x01\x00", 2) + encoded;
    return ErrorCode::OK;
}

std::string escape_bytes(const std::string& bytes) {
    std::string result;
    result.reserve(bytes.size());

    for (unsigned char c : bytes) {
        if (c == '\\') {
            result += "\\\\";
        } else if (c >= 0x20 && c < 0x7f) {
            result += static_cast<char>(c);
        } else {
            char hex[5];
            snprintf(hex, sizeof(hex), "\\x%02x", c);
            result += hex;
        }
    }
    return result;
}

std::string hex_bytes(const std::string& bytes) {
    std::string result;
    result.reserve(bytes.size() * 2);

    for (unsigned char c : bytes) {
        char hex[3];
        snprintf(hex, sizeof(hex), "%02x", c);
        result += hex;
    }
    return result;
}
