#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "authenticator.h"
#include "config.h"
#include "error.h"
#include "logger.h"
#include "message.h"
#include "transport.h"

/**
 * Sends key presses and text to a device.
 * The transport is connected and authenticated on first use and reused for
 * every later command.
 */
class RemoteClient {
private:
    const ConnectionConfig config;
    std::unique_ptr<ITransport> transport;
    Authenticator authenticator;
    ILogger* logger;

    ErrorCode ensure_connection();
    ErrorCode send_command(std::uint8_t mode, const std::string& inner_payload, size_t* bytes_sent);

public:
    explicit RemoteClient(const ConnectionConfig& config, ILogger* logger = nullptr);

    /**
     * @param transport Unconnected transport, ownership is taken
     */
    RemoteClient(const ConnectionConfig& config,
                 std::unique_ptr<ITransport> transport,
                 ILogger* logger = nullptr,
                 MacAddressSource mac_source = detect_local_mac);
    ~RemoteClient();

    RemoteClient(const RemoteClient&) = delete;
    RemoteClient& operator=(const RemoteClient&) = delete;

    // Connect and authenticate now instead of on the first command
    ErrorCode connect();
    void disconnect();
    bool is_connected() const;

    ErrorCode send_key(const std::string& key_code, size_t* bytes_sent = nullptr);

    /**
     * Type text into the focused input field of the device
     * (only accepted while a text field is highlighted)
     */
    ErrorCode send_text(const std::string& text, size_t* bytes_sent = nullptr);

    /**
     * Dial a channel as four zero padded digit key presses
     * @param channel 0 .. 9999, INVALID_CHANNEL otherwise (nothing is sent)
     * @param delay_ms Pause between two key presses
     */
    ErrorCode set_channel(int channel, int delay_ms = SSTV_DEFAULT_KEY_DELAY_MS);

    // Send an already encoded frame, connecting first if needed
    ErrorCode send_raw(const std::string& frame, size_t* bytes_sent = nullptr);

    /**
     * Receive and parse one reply (e.g. the KEY_OK confirmation of a key)
     * @return OK, RECEIVE_TIMEOUT, CONNECTION_CLOSED or a codec error
     */
    ErrorCode receive_message(Message* out);

    const ConnectionConfig& get_config() const { return config; }
};
