#pragma once

#include <string>

#define SSTV_DEFAULT_PORT 55000
#define SSTV_DEFAULT_AUTH_TIMEOUT_MS 20000
#define SSTV_DEFAULT_RECV_TIMEOUT_MS 2000
#define SSTV_DEFAULT_AUTH_ATTEMPTS 3
#define SSTV_DEFAULT_KEY_DELAY_MS 100

// Timeout sentinel: block until data arrives
#define SSTV_NO_TIMEOUT -1

#define SSTV_APP_SUFFIX ".iapp.samsung"

/**
 * Parameters of one device session.
 * Copied by every component that uses it; never modified afterwards.
 */
struct ConnectionConfig {
    std::string app_label;   // identity shown on the TV, also the sender of every command
    std::string host;
    int port = SSTV_DEFAULT_PORT;
    int auth_timeout_ms = SSTV_DEFAULT_AUTH_TIMEOUT_MS;   // SSTV_NO_TIMEOUT = wait forever
    int recv_timeout_ms = SSTV_DEFAULT_RECV_TIMEOUT_MS;   // SSTV_NO_TIMEOUT = block
    int max_auth_attempts = SSTV_DEFAULT_AUTH_ATTEMPTS;
};
