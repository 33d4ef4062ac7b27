#pragma once

#include <functional>
#include <string>

#include "config.h"
#include "error.h"
#include "logger.h"
#include "message.h"
#include "transport.h"

#define SSTV_FALLBACK_MAC "00:00:00:00:00:00"

/**
 * Supplies the MAC address sent in the handshake
 * @param local_ip Local endpoint IP of the connection
 * @return Six lower case hex octets separated by colons
 */
using MacAddressSource = std::function<std::string(const std::string& local_ip)>;

/**
 * Hardware address of the interface owning local_ip, else of the first
 * non-loopback interface, else SSTV_FALLBACK_MAC
 */
std::string detect_local_mac(const std::string& local_ip);

/**
 * Drives the handshake: connect, send the application identity, then wait
 * for the device to accept or refuse it.
 */
class Authenticator {
private:
    const ConnectionConfig config;
    ILogger* logger;
    MacAddressSource mac_source;

    /**
     * Classify one handshake reply
     * @param done Set when the reply ends the handshake
     * @return Result of the handshake if done, else OK
     */
    ErrorCode classify_response(ITransport& transport, const Message& response, bool* done) const;

public:
    explicit Authenticator(const ConnectionConfig& config,
                           ILogger* logger = nullptr,
                           MacAddressSource mac_source = detect_local_mac);

    /**
     * Connect the transport and authenticate
     * @param transport Transport to connect; on success its read timeout is
     *        switched to recv_timeout_ms
     * @param last_response Receives the last parsed reply (may be null); set
     *        for UNKNOWN_AUTH_RESPONSE
     * @return OK, AUTH_DENIED, AUTH_TIMED_OUT, UNKNOWN_AUTH_RESPONSE, or the
     *         transport/codec error that interrupted the handshake
     */
    ErrorCode authenticate(ITransport& transport, Message* last_response = nullptr) const;

    const ConnectionConfig& get_config() const { return config; }
};
