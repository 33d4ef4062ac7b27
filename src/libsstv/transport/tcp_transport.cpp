#include <sstv/tcp_transport.h>
#include <sstv/frame_codec.h>
#include <chrono>

TCPTransport::TCPTransport(ILogger* logger)
    : socket(io_context), read_timeout_ms(SSTV_NO_TIMEOUT), logger(logger) {
}

TCPTransport::~TCPTransport() {
    close();
}

bool TCPTransport::run_io(int timeout_ms) {
    io_context.restart();

    if (timeout_ms < 0) {
        io_context.run();
        return true;
    }

    io_context.run_for(std::chrono::milliseconds(timeout_ms));
    return io_context.stopped();
}

ErrorCode TCPTransport::connect_to_server(const std::string& host, int port, int timeout_ms) {
    close();

    log_message(logger, LogLevel::DEBUG, "TCPTransport",
                "Connecting to " + host + ":" + std::to_string(port));

    asio::error_code ec;
    asio::ip::tcp::resolver resolver(io_context);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        log_message(logger, LogLevel::ERROR, "TCPTransport",
                    "resolve(" + host + ") failed: " + ec.message());
        return ErrorCode::CONNECT_ERROR;
    }

    asio::error_code connect_error = asio::error::would_block;
    asio::async_connect(socket, endpoints,
        [&connect_error](const asio::error_code& result, const asio::ip::tcp::endpoint&) {
            connect_error = result;
        });

    if (!run_io(timeout_ms)) {
        // Closing aborts the pending connect; drain its handler
        socket.close(ec);
        io_context.run();
        log_message(logger, LogLevel::ERROR, "TCPTransport",
                    "connect() timed out after " + std::to_string(timeout_ms) + " ms");
        return ErrorCode::CONNECT_ERROR;
    }

    if (connect_error) {
        log_message(logger, LogLevel::ERROR, "TCPTransport",
                    "connect() failed: " + connect_error.message());
        socket.close(ec);
        return ErrorCode::CONNECT_ERROR;
    }

    read_timeout_ms = timeout_ms;
    log_message(logger, LogLevel::DEBUG, "TCPTransport",
                "Connected from " + local_address());
    return ErrorCode::OK;
}

ErrorCode TCPTransport::send_data(const std::string& data, size_t* bytes_sent) {
    if (!socket.is_open()) {
        log_message(logger, LogLevel::ERROR, "TCPTransport", "No connection");
        return ErrorCode::SEND_ERROR;
    }

    log_message(logger, LogLevel::DEBUG, "TCPTransport", "sending '" + escape_bytes(data) + "'");

    asio::error_code ec;
    size_t sent = asio::write(socket, asio::buffer(data), ec);
    if (ec) {
        log_message(logger, LogLevel::WARN, "TCPTransport", "send() failed: " + ec.message());
        return ErrorCode::SEND_ERROR;
    }

    if (bytes_sent) {
        *bytes_sent = sent;
    }
    return ErrorCode::OK;
}

ErrorCode TCPTransport::receive_data(std::string* frame) {
    if (!socket.is_open()) {
        return ErrorCode::CONNECTION_CLOSED;
    }

    char buffer[SSTV_RECV_BUFFER_SIZE];
    asio::error_code read_error = asio::error::would_block;
    size_t received = 0;

    socket.async_read_some(asio::buffer(buffer),
        [&read_error, &received](const asio::error_code& result, size_t n) {
            read_error = result;
            received = n;
        });

    if (!run_io(read_timeout_ms)) {
        asio::error_code ec;
        socket.cancel(ec);
        io_context.run();

        // The read may have completed between the deadline and the cancel
        if (read_error == asio::error::operation_aborted) {
            log_message(logger, LogLevel::DEBUG, "TCPTransport", "received nothing");
            return ErrorCode::RECEIVE_TIMEOUT;
        }
    }

    if (read_error == asio::error::eof) {
        log_message(logger, LogLevel::DEBUG, "TCPTransport", "Device closed connection");
        return ErrorCode::CONNECTION_CLOSED;
    }

    if (read_error) {
        log_message(logger, LogLevel::WARN, "TCPTransport", "recv() failed: " + read_error.message());
        return ErrorCode::CONNECTION_CLOSED;
    }

    if (received == 0) {
        return ErrorCode::CONNECTION_CLOSED;
    }

    frame->assign(buffer, received);
    log_message(logger, LogLevel::DEBUG, "TCPTransport",
                "received '" + escape_bytes(*frame) + "' (timeout: " +
                std::to_string(read_timeout_ms) + " ms)");
    return ErrorCode::OK;
}

void TCPTransport::close() {
    if (!socket.is_open()) {
        return;
    }

    asio::error_code ec;
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

std::string TCPTransport::local_address() const {
    asio::error_code ec;
    auto endpoint = socket.local_endpoint(ec);
    if (ec) {
        return "";
    }
    return endpoint.address().to_string();
}
