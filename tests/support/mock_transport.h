#pragma once

#include <sstv/transport.h>
#include <sstv/message.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Scripted ITransport. Each receive_data() pops one step; with nothing
// queued it reports RECEIVE_TIMEOUT after a short pause.
class MockTransport : public ITransport {
private:
    struct Step {
        ErrorCode result;
        std::string frame;
    };

    mutable std::mutex mtx;
    std::deque<Step> steps;
    std::vector<std::string> sent;
    bool connected = false;
    int read_timeout_ms = -1;
    int connect_calls = 0;
    int close_calls = 0;
    int last_connect_timeout_ms = 0;

public:
    ErrorCode connect_result = ErrorCode::OK;
    std::string address = "192.168.1.10";

    void push_frame(const std::string& frame) {
        std::lock_guard<std::mutex> lock(mtx);
        steps.push_back({ErrorCode::OK, frame});
    }

    void push_error(ErrorCode error) {
        std::lock_guard<std::mutex> lock(mtx);
        steps.push_back({error, ""});
    }

    // Peer vanished without a close() from our side
    void drop() {
        std::lock_guard<std::mutex> lock(mtx);
        connected = false;
    }

    std::vector<std::string> sent_frames() const {
        std::lock_guard<std::mutex> lock(mtx);
        return sent;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mtx);
        return steps.size();
    }

    int connect_count() const {
        std::lock_guard<std::mutex> lock(mtx);
        return connect_calls;
    }

    int close_count() const {
        std::lock_guard<std::mutex> lock(mtx);
        return close_calls;
    }

    int last_connect_timeout() const {
        std::lock_guard<std::mutex> lock(mtx);
        return last_connect_timeout_ms;
    }

    ErrorCode connect_to_server(const std::string&, int, int timeout_ms) override {
        std::lock_guard<std::mutex> lock(mtx);
        connect_calls++;
        last_connect_timeout_ms = timeout_ms;
        if (connect_result != ErrorCode::OK) {
            return connect_result;
        }
        connected = true;
        read_timeout_ms = timeout_ms;
        return ErrorCode::OK;
    }

    ErrorCode send_data(const std::string& data, size_t* bytes_sent) override {
        std::lock_guard<std::mutex> lock(mtx);
        if (!connected) {
            return ErrorCode::SEND_ERROR;
        }
        sent.push_back(data);
        if (bytes_sent) {
            *bytes_sent = data.size();
        }
        return ErrorCode::OK;
    }

    ErrorCode receive_data(std::string* frame) override {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!connected) {
                return ErrorCode::CONNECTION_CLOSED;
            }
            if (!steps.empty()) {
                Step step = steps.front();
                steps.pop_front();
                if (step.result == ErrorCode::OK) {
                    *frame = step.frame;
                }
                return step.result;
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return ErrorCode::RECEIVE_TIMEOUT;
    }

    void set_read_timeout(int timeout_ms) override {
        std::lock_guard<std::mutex> lock(mtx);
        read_timeout_ms = timeout_ms;
    }

    int get_read_timeout() const override {
        std::lock_guard<std::mutex> lock(mtx);
        return read_timeout_ms;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mtx);
        close_calls++;
        connected = false;
    }

    std::string local_address() const override { return address; }
    std::string get_type() const override { return "Mock"; }

    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(mtx);
        return connected;
    }
};

// Frame as the device sends it: [kind][len][sender][len][payload]
inline std::string device_frame(std::uint8_t kind, const std::string& payload,
                                const std::string& sender = "iapp.samsung") {
    std::string frame(1, static_cast<char>(kind));
    frame.push_back(static_cast<char>(sender.size() & 0xFF));
    frame.push_back(static_cast<char>(sender.size() >> 8));
    frame += sender;
    frame.push_back(static_cast<char>(payload.size() & 0xFF));
    frame.push_back(static_cast<char>(payload.size() >> 8));
    frame += payload;
    return frame;
}

inline std::string auth_reply(const std::string& payload) {
    return device_frame(0x00, payload);
}

template <typename Predicate>
bool wait_until(Predicate predicate, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return predicate();
}
