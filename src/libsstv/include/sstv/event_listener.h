#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <utility>
#include <vector>

#include "authenticator.h"
#include "error.h"
#include "logger.h"
#include "message.h"
#include "transport.h"

using MessagePredicate = std::function<bool(const Message&)>;
using MessageCallback = std::function<void(const Message&)>;

bool match_all(const Message& message);

/**
 * Pull interface: each call blocks until the device sends a message the
 * filter accepts. Receive timeouts are retried silently.
 */
class MessageReceiver {
private:
    ITransport& transport;
    MessagePredicate filter;
    const Authenticator* authenticator;
    ILogger* logger;

public:
    /**
     * @param transport Authenticated transport, or an unconnected one when an
     *        authenticator is given
     * @param filter Messages it rejects are dropped
     * @param authenticator Used on the first call if the transport is not connected
     */
    MessageReceiver(ITransport& transport,
                    MessagePredicate filter = match_all,
                    const Authenticator* authenticator = nullptr,
                    ILogger* logger = nullptr);

    /**
     * Wait for the next accepted message
     * @return OK, or the transport/codec/auth error that ended the wait
     */
    ErrorCode next_message(Message* out);
};

/**
 * Push interface: a single worker thread receives messages and hands each
 * one to every registered listener whose matcher accepts it, in
 * registration order.
 *
 * The stop flag is checked once per receive cycle, so stop() takes effect
 * within one read timeout. The worker closes the transport on exit.
 */
class EventWatcher {
private:
    ITransport& transport;
    const Authenticator* authenticator;
    ILogger* logger;

    std::vector<std::pair<MessagePredicate, MessageCallback>> listeners;

    std::thread worker;
    std::atomic<bool> stopping{false};
    std::atomic<bool> running{false};
    std::atomic<ErrorCode> last_error{ErrorCode::OK};
    std::atomic<size_t> dispatched{0};
    std::atomic<size_t> malformed{0};

    void run();
    void dispatch(const Message& message);

public:
    EventWatcher(ITransport& transport,
                 const Authenticator* authenticator = nullptr,
                 ILogger* logger = nullptr);
    ~EventWatcher();

    EventWatcher(const EventWatcher&) = delete;
    EventWatcher& operator=(const EventWatcher&) = delete;

    /**
     * Register a listener; only allowed while the worker is not running
     * @param listener Called with every matching message on the worker thread.
     *        Anything it throws is logged and dispatch continues.
     * @param matcher Selects the messages for this listener
     * @return false if the worker is running
     */
    bool add_listener(MessageCallback listener, MessagePredicate matcher = match_all);

    /**
     * Start the worker
     * @return false if it is already running
     */
    bool start();

    // Request the worker to stop after the current receive cycle
    void stop();

    // Request stop, then wait for the worker to exit
    void join();

    bool is_running() const { return running; }

    // Error that terminated the worker, OK after a requested stop
    ErrorCode get_last_error() const { return last_error; }

    size_t listener_count() const { return listeners.size(); }
    size_t dispatched_count() const { return dispatched; }
    size_t malformed_count() const { return malformed; }
};
