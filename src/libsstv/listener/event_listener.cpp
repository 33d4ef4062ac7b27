#include <sstv/event_listener.h>
#include <sstv/frame_codec.h>
#include <exception>

bool match_all(const Message&) {
    return true;
}

MessageReceiver::MessageReceiver(ITransport& transport,
                                 MessagePredicate filter,
                                 const Authenticator* authenticator,
                                 ILogger* logger)
    : transport(transport),
      filter(filter ? std::move(filter) : MessagePredicate(match_all)),
      authenticator(authenticator),
      logger(logger) {
}

ErrorCode MessageReceiver::next_message(Message* out) {
    if (authenticator && !transport.is_connected()) {
        ErrorCode result = authenticator->authenticate(transport);
        if (result != ErrorCode::OK) {
            return result;
        }
    }

    while (true) {
        std::string frame;
        ErrorCode result = transport.receive_data(&frame);
        if (result == ErrorCode::RECEIVE_TIMEOUT) {
            continue;
        }
        if (result != ErrorCode::OK) {
            return result;
        }

        Message message;
        result = parse_message(frame, &message);
        if (result != ErrorCode::OK) {
            log_message(logger, LogLevel::WARN, "MessageReceiver",
                        "could not parse '" + escape_bytes(frame) + "'");
            return result;
        }

        if (filter(message)) {
            *out = message;
            return ErrorCode::OK;
        }
    }
}

EventWatcher::EventWatcher(ITransport& transport, const Authenticator* authenticator, ILogger* logger)
    : transport(transport), authenticator(authenticator), logger(logger) {
}

EventWatcher::~EventWatcher() {
    join();
}

bool EventWatcher::add_listener(MessageCallback listener, MessagePredicate matcher) {
    if (running) {
        log_message(logger, LogLevel::WARN, "EventWatcher", "Cannot add listener while running");
        return false;
    }
    if (!listener) {
        log_message(logger, LogLevel::ERROR, "EventWatcher", "Trying to register null listener");
        return false;
    }

    listeners.emplace_back(matcher ? std::move(matcher) : MessagePredicate(match_all), std::move(listener));
    return true;
}

bool EventWatcher::start() {
    if (running) {
        return false;
    }

    // Reap a worker that already finished on its own
    if (worker.joinable()) {
        worker.join();
    }

    stopping = false;
    running = true;
    last_error = ErrorCode::OK;
    worker = std::thread(&EventWatcher::run, this);
    return true;
}

void EventWatcher::stop() {
    stopping = true;
}

void EventWatcher::join() {
    stop();
    if (worker.joinable()) {
        worker.join();
    }
}

void EventWatcher::run() {
    log_message(logger, LogLevel::DEBUG, "EventWatcher", "Worker started");

    if (authenticator && !transport.is_connected()) {
        ErrorCode result = authenticator->authenticate(transport);
        if (result != ErrorCode::OK) {
            log_message(logger, LogLevel::ERROR, "EventWatcher",
                        std::string("Authentication failed: ") + error_code_name(result));
            last_error = result;
            transport.close();
            running = false;
            return;
        }
    }

    while (!stopping) {
        std::string frame;
        ErrorCode result = transport.receive_data(&frame);
        if (result == ErrorCode::RECEIVE_TIMEOUT) {
            continue;
        }
        if (result != ErrorCode::OK) {
            log_message(logger, LogLevel::ERROR, "EventWatcher",
                        std::string("Receive failed: ") + error_code_name(result));
            last_error = result;
            break;
        }

        Message message;
        result = parse_message(frame, &message);
        if (result != ErrorCode::OK) {
            log_message(logger, LogLevel::WARN, "EventWatcher",
                        "could not parse '" + escape_bytes(frame) + "': " + error_code_name(result));
            malformed++;
            continue;
        }

        dispatch(message);
    }

    transport.close();
    running = false;
    log_message(logger, LogLevel::DEBUG, "EventWatcher", "Worker stopped");
}

void EventWatcher::dispatch(const Message& message) {
    dispatched++;

    for (const auto& [matcher, listener] : listeners) {
        try {
            if (matcher(message)) {
                listener(message);
            }
        } catch (const std::exception& e) {
            log_message(logger, LogLevel::ERROR, "EventWatcher",
                        std::string("Listener failed: ") + e.what());
        } catch (...) {
            log_message(logger, LogLevel::ERROR, "EventWatcher", "Listener failed: unknown exception");
        }
    }
}
