#pragma once

#include <cstdint>
#include <string>

// Known message kinds (first byte of a device frame)
enum : std::uint8_t {
    MSG_KEY_CONFIRM      = 0x00,  // key received while viewing TV
    MSG_KEY_CONFIRM_MENU = 0x01,  // key received while in a menu
    MSG_STATE_CHANGE     = 0x02,
    MSG_TIMESHIFT        = 0x04,
};

// Command modes (first byte of a client frame)
enum : std::uint8_t {
    MODE_KEY  = 0x00,
    MODE_TEXT = 0x01,
};

/**
 * Payloads the device is known to send.
 * Observed on a UE40D5700 TV set and a HT-D5100 home theatre.
 */
struct ResponsePayload {
    static const std::string AUTH_OK;
    static const std::string AUTH_ACCESS_DENIED;
    static const std::string AUTH_NEED_CONFIRMATION;
    static const std::string AUTH_TIMEOUT;
    static const std::string KEY_OK;

    static const std::string STATUS_SHOWING_MENU;
    static const std::string STATUS_SHOWING_TV;
    static const std::string STATUS_SHOWING_TTX;
    static const std::string STATUS_SHOWING_OVERLAY;

    /**
     * Symbolic name of a known payload
     * @param payload Raw payload bytes
     * @return Constant name or empty string if unknown
     */
    static std::string name_of(const std::string& payload);
};

/**
 * One frame sent by the device: [kind][LP sender][LP payload].
 * Compares equal on (kind, payload); the sender is ignored.
 */
class Message {
private:
    std::uint8_t kind_;
    std::string sender_;
    std::string payload_;

public:
    Message() : kind_(0) {}
    Message(std::uint8_t kind, std::string sender, std::string payload);

    std::uint8_t kind() const { return kind_; }
    const std::string& sender() const { return sender_; }
    const std::string& payload() const { return payload_; }

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }

    // "2:\x10\x00\x02\x00\x00\x00"
    std::string to_string() const;

    // Message(sender=..., kind=2, payload=...)
    std::string describe() const;
};

const char* message_kind_name(std::uint8_t kind);
