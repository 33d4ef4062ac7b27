#include <sstv/remote_client.h>
#include <sstv/frame_codec.h>
#include <sstv/key_codes.h>
#include <sstv/tcp_transport.h>
#include <chrono>
#include <cstdio>
#include <thread>
#include <utility>

RemoteClient::RemoteClient(const ConnectionConfig& config, ILogger* logger)
    : RemoteClient(config, std::make_unique<TCPTransport>(logger), logger) {
}

RemoteClient::RemoteClient(const ConnectionConfig& config,
                           std::unique_ptr<ITransport> transport,
                           ILogger* logger,
                           MacAddressSource mac_source)
    : config(config),
      transport(std::move(transport)),
      authenticator(config, logger, std::move(mac_source)),
      logger(logger) {
}

RemoteClient::~RemoteClient() {
    disconnect();
}

ErrorCode RemoteClient::ensure_connection() {
    if (transport->is_connected()) {
        return ErrorCode::OK;
    }
    return connect();
}

ErrorCode RemoteClient::connect() {
    transport->close();
    return authenticator.authenticate(*transport);
}

void RemoteClient::disconnect() {
    if (transport) {
        transport->close();
    }
}

bool RemoteClient::is_connected() const {
    return transport->is_connected();
}

ErrorCode RemoteClient::send_raw(const std::string& frame, size_t* bytes_sent) {
    ErrorCode result = ensure_connection();
    if (result != ErrorCode::OK) {
        return result;
    }

    result = transport->send_data(frame, bytes_sent);
    if (result != ErrorCode::OK) {
        // Reconnect on the next command
        transport->close();
    }
    return result;
}

ErrorCode RemoteClient::send_command(std::uint8_t mode, const std::string& inner_payload, size_t* bytes_sent) {
    std::string frame;
    ErrorCode result = build_command_frame(config.app_label, mode, inner_payload, &frame);
    if (result != ErrorCode::OK) {
        return result;
    }
    return send_raw(frame, bytes_sent);
}

ErrorCode RemoteClient::send_key(const std::string& key_code, size_t* bytes_sent) {
    std::string payload;
    ErrorCode result = build_key_payload(key_code, &payload);
    if (result != ErrorCode::OK) {
        return result;
    }

    log_message(logger, LogLevel::DEBUG, "RemoteClient", "key " + key_code);
    return send_command(MODE_KEY, payload, bytes_sent);
}

ErrorCode RemoteClient::send_text(const std::string& text, size_t* bytes_sent) {
    std::string payload;
    ErrorCode result = build_text_payload(text, &payload);
    if (result != ErrorCode::OK) {
        return result;
    }

    log_message(logger, LogLevel::DEBUG, "RemoteClient", "text '" + escape_bytes(text) + "'");
    return send_command(MODE_TEXT, payload, bytes_sent);
}

ErrorCode RemoteClient::set_channel(int channel, int delay_ms) {
    if (channel < 0 || channel > 9999) {
        log_message(logger, LogLevel::ERROR, "RemoteClient",
                    "Invalid channel " + std::to_string(channel));
        return ErrorCode::INVALID_CHANNEL;
    }

    char digits[5];
    snprintf(digits, sizeof(digits), "%04d", channel);

    for (int i = 0; i < 4; i++) {
        ErrorCode result = send_key(channel_digit_key(digits[i]));
        if (result != ErrorCode::OK) {
            return result;
        }

        if (i < 3 && delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }
    return ErrorCode::OK;
}

ErrorCode RemoteClient::receive_message(Message* out) {
    if (!transport->is_connected()) {
        return ErrorCode::CONNECTION_CLOSED;
    }

    std::string frame;
    ErrorCode result = transport->receive_data(&frame);
    if (result == ErrorCode::CONNECTION_CLOSED) {
        transport->close();
    }
    if (result != ErrorCode::OK) {
        return result;
    }
    return parse_message(frame, out);
}
