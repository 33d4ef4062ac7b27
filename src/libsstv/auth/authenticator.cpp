#include <sstv/authenticator.h>
#include <sstv/frame_codec.h>
#include <utility>

Authenticator::Authenticator(const ConnectionConfig& config, ILogger* logger, MacAddressSource mac_source)
    : config(config), logger(logger), mac_source(std::move(mac_source)) {
    if (!this->mac_source) {
        this->mac_source = detect_local_mac;
    }
}

ErrorCode Authenticator::authenticate(ITransport& transport, Message* last_response) const {
    ErrorCode result = transport.connect_to_server(config.host, config.port, config.auth_timeout_ms);
    if (result != ErrorCode::OK) {
        return result;
    }

    std::string local_ip = transport.local_address();
    std::string local_mac = mac_source(local_ip);

    std::string request;
    result = build_auth_request(local_ip, local_mac, config.app_label, &request);
    if (result != ErrorCode::OK) {
        log_message(logger, LogLevel::ERROR, "Authenticator",
                    std::string("Cannot build auth request: ") + error_code_name(result));
        transport.close();
        return result;
    }

    log_message(logger, LogLevel::DEBUG, "Authenticator",
                "Authenticating as " + config.app_label + " (" + local_ip + ", " + local_mac + ")");

    result = transport.send_data(request, nullptr);
    if (result != ErrorCode::OK) {
        transport.close();
        return result;
    }

    for (int attempt = 1; attempt <= config.max_auth_attempts; attempt++) {
        log_message(logger, LogLevel::DEBUG, "Authenticator",
                    "Waiting for response (attempt " + std::to_string(attempt) + "/" +
                    std::to_string(config.max_auth_attempts) + ")");

        std::string frame;
        result = transport.receive_data(&frame);
        if (result == ErrorCode::RECEIVE_TIMEOUT) {
            log_message(logger, LogLevel::DEBUG, "Authenticator", "Timeout");
            continue;
        }
        if (result != ErrorCode::OK) {
            transport.close();
            return result;
        }

        Message response;
        result = parse_message(frame, &response);
        if (result != ErrorCode::OK) {
            log_message(logger, LogLevel::ERROR, "Authenticator",
                        "Cannot parse response '" + escape_bytes(frame) + "': " + error_code_name(result));
            transport.close();
            return result;
        }

        if (last_response) {
            *last_response = response;
        }

        bool done = false;
        result = classify_response(transport, response, &done);
        if (done) {
            return result;
        }
    }

    log_message(logger, LogLevel::ERROR, "Authenticator", "Access denied by remote device");
    transport.close();
    return ErrorCode::AUTH_DENIED;
}

ErrorCode Authenticator::classify_response(ITransport& transport, const Message& response, bool* done) const {
    const std::string& payload = response.payload();
    *done = true;

    if (payload == ResponsePayload::AUTH_OK) {
        log_message(logger, LogLevel::INFO, "Authenticator", "Authentication successful");
        transport.set_read_timeout(config.recv_timeout_ms);
        return ErrorCode::OK;
    }

    if (payload == ResponsePayload::AUTH_ACCESS_DENIED) {
        log_message(logger, LogLevel::WARN, "Authenticator", "Authentication response: Access Denied");
        transport.close();
        return ErrorCode::AUTH_DENIED;
    }

    if (payload == ResponsePayload::AUTH_NEED_CONFIRMATION) {
        log_message(logger, LogLevel::INFO, "Authenticator",
                    "Authentication response: waiting for confirmation on device");
        *done = false;
        return ErrorCode::OK;
    }

    if (payload == ResponsePayload::AUTH_TIMEOUT) {
        log_message(logger, LogLevel::WARN, "Authenticator", "Authentication response: Timeout");
        transport.close();
        return ErrorCode::AUTH_TIMED_OUT;
    }

    log_message(logger, LogLevel::ERROR, "Authenticator",
                "Unknown authentication response: " + response.describe());
    transport.close();
    return ErrorCode::UNKNOWN_AUTH_RESPONSE;
}
