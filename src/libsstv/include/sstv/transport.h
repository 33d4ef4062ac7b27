#pragma once

#include <cstddef>
#include <string>

#include "error.h"

/**
 * Abstract base class for the byte-frame transport to a device.
 * One instance owns one connection; it is used by a single thread at a time.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * Connect to the device
     * @param host Host name or IP address
     * @param port TCP port
     * @param timeout_ms Limit for the connect attempt, also installed as the
     *        read timeout (SSTV_NO_TIMEOUT = wait forever)
     * @return OK or CONNECT_ERROR
     */
    virtual ErrorCode connect_to_server(const std::string& host, int port, int timeout_ms) = 0;

    /**
     * Send a complete frame
     * @param data Bytes to send, written in full or not at all successfully
     * @param bytes_sent Receives the number of bytes written (may be null)
     * @return OK or SEND_ERROR
     */
    virtual ErrorCode send_data(const std::string& data, size_t* bytes_sent) = 0;

    /**
     * Receive one frame, blocking up to the read timeout
     * @param frame Receives the bytes read
     * @return OK, RECEIVE_TIMEOUT, or CONNECTION_CLOSED (peer closed the
     *         stream, or the socket failed)
     */
    virtual ErrorCode receive_data(std::string* frame) = 0;

    /**
     * Change the read timeout used by receive_data
     * @param timeout_ms Milliseconds, SSTV_NO_TIMEOUT blocks
     */
    virtual void set_read_timeout(int timeout_ms) = 0;
    virtual int get_read_timeout() const = 0;

    /**
     * Close transport connection, safe to call repeatedly
     */
    virtual void close() = 0;

    /**
     * Local endpoint IP of the current connection
     * @return Address string or empty if not connected
     */
    virtual std::string local_address() const = 0;

    /**
     * Get transport type name
     * @return Transport type (e.g., "TCP")
     */
    virtual std::string get_type() const = 0;

    virtual bool is_connected() const = 0;
};
