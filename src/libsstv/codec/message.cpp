#include <sstv/message.h>
#include <sstv/frame_codec.h>
#include <sstream>
#include <utility>

const std::string ResponsePayload::AUTH_OK("\x64\x00\x01\x00", 4);
const std::string ResponsePayload::AUTH_ACCESS_DENIED("\x64\x00\x00\x00", 4);
const std::string ResponsePayload::AUTH_NEED_CONFIRMATION("\x0a\x00\x02\x00\x00\x00", 6);
const std::string ResponsePayload::AUTH_TIMEOUT("\x64\x00", 2);
const std::string ResponsePayload::KEY_OK("\x00\x00\x00\x00", 4);

const std::string ResponsePayload::STATUS_SHOWING_MENU("\x10\x00\x02\x00\x00\x00", 6);
const std::string ResponsePayload::STATUS_SHOWING_TV("\x10\x00\x01\x00\x00\x00", 6);
const std::string ResponsePayload::STATUS_SHOWING_TTX("\x10\x00\x0c\x00\x00\x00", 6);
const std::string ResponsePayload::STATUS_SHOWING_OVERLAY("\x10\x00\x18\x00\x00\x00", 6);

std::string ResponsePayload::name_of(const std::string& payload) {
    static const std::pair<const std::string*, const char*> known[] = {
        {&AUTH_OK, "AUTH_OK"},
        {&AUTH_ACCESS_DENIED, "AUTH_ACCESS_DENIED"},
        {&AUTH_NEED_CONFIRMATION, "AUTH_NEED_CONFIRMATION"},
        {&AUTH_TIMEOUT, "AUTH_TIMEOUT"},
        {&KEY_OK, "KEY_OK"},
        {&STATUS_SHOWING_MENU, "STATUS_SHOWING_MENU"},
        {&STATUS_SHOWING_TV, "STATUS_SHOWING_TV"},
        {&STATUS_SHOWING_TTX, "STATUS_SHOWING_TTX"},
        {&STATUS_SHOWING_OVERLAY, "STATUS_SHOWING_OVERLAY"},
    };

    for (const auto& [value, name] : known) {
        if (*value == payload) {
            return name;
        }
    }
    return "";
}

Message::Message(std::uint8_t kind, std::string sender, std::string payload)
    : kind_(kind), sender_(std::move(sender)), payload_(std::move(payload)) {
}

bool Message::operator==(const Message& other) const {
    return kind_ == other.kind_ && payload_ == other.payload_;
}

std::string Message::to_string() const {
    std::ostringstream ss;
    ss << std::hex << static_cast<int>(kind_) << ":" << escape_bytes(payload_);
    return ss.str();
}

std::string Message::describe() const {
    std::ostringstream ss;
    ss << "Message(sender=" << sender_
       << ", kind=" << std::hex << static_cast<int>(kind_)
       << ", payload='" << escape_bytes(payload_) << "')";
    return ss.str();
}

const char* message_kind_name(std::uint8_t kind) {
    switch (kind) {
        case MSG_KEY_CONFIRM:      return "KEY_CONFIRM";
        case MSG_KEY_CONFIRM_MENU: return "KEY_CONFIRM_MENU";
        case MSG_STATE_CHANGE:     return "STATE_CHANGE";
        case MSG_TIMESHIFT:        return "TIMESHIFT";
        default:                   return "UNKNOWN";
    }
}
