#pragma once

#include "transport.h"
#include "config.h"
#include "logger.h"

#include <asio.hpp>
#include <string>

// One recv() is one device frame
#define SSTV_RECV_BUFFER_SIZE 2048

/**
 * TCP socket transport on top of asio.
 * Timeouts run the private io_context for a bounded time and cancel the
 * pending operation when it expires.
 */
class TCPTransport : public ITransport {
private:
    asio::io_context io_context;
    asio::ip::tcp::socket socket;
    int read_timeout_ms;
    ILogger* logger;

    // false if the timeout expired with the operation still pending
    bool run_io(int timeout_ms);

public:
    explicit TCPTransport(ILogger* logger = nullptr);
    ~TCPTransport() override;

    TCPTransport(const TCPTransport&) = delete;
    TCPTransport& operator=(const TCPTransport&) = delete;

    ErrorCode connect_to_server(const std::string& host, int port, int timeout_ms) override;
    ErrorCode send_data(const std::string& data, size_t* bytes_sent) override;
    ErrorCode receive_data(std::string* frame) override;
    void set_read_timeout(int timeout_ms) override { read_timeout_ms = timeout_ms; }
    int get_read_timeout() const override { return read_timeout_ms; }
    void close() override;
    std::string local_address() const override;

    std::string get_type() const override { return "TCP"; }
    bool is_connected() const override { return socket.is_open(); }
};
