#include <iostream>
#include <string>
#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <vector>
#include <chrono>
#include <thread>
#include <atomic>
#include <csignal>
#include <ctime>
#include <readline/readline.h>
#include <readline/history.h>
#include <nlohmann/json.hpp>
#include <sstv/authenticator.h>
#include <sstv/colors.h>
#include <sstv/event_listener.h>
#include <sstv/frame_codec.h>
#include <sstv/key_codes.h>
#include <sstv/logger.h>
#include <sstv/remote_client.h>
#include <sstv/tcp_transport.h>

#define DEFAULT_APP_LABEL "sstvremote"
#define DEFAULT_COMMAND_DELAY_MS 500
#define DEVICE_ENV "SAMSUNG_DEVICE"

using json = nlohmann::json;

struct Options {
    ConnectionConfig config;
    std::string command;
    std::vector<std::string> args;
    int delay_ms = DEFAULT_COMMAND_DELAY_MS;
    int replies = 0;
    bool json_output = false;
    bool verbose = false;
};

static std::atomic<bool> g_interrupted{false};

static void handle_signal(int) {
    g_interrupted = true;
}

static void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [OPTIONS] COMMAND [ARGS...]\n";
    std::cout << "\nSend commands to Samsung D-Series (and up) devices.\n";
    std::cout << "\nCommands:\n";
    std::cout << "  send CMD...            Send key codes (KEY_*), channels (CH<n>) or text\n";
    std::cout << "  listen [--json]        Print messages pushed by the device until Ctrl+C\n";
    std::cout << "  shell                  Interactive remote control\n";
    std::cout << "  keys [FILTER]          List known key codes\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -i, --ip HOST          Device address (default: $" DEVICE_ENV ")\n";
    std::cout << "  -p, --port PORT        Device port (default: " << SSTV_DEFAULT_PORT << ")\n";
    std::cout << "  -l, --label NAME       Application label shown on the TV (default: " DEFAULT_APP_LABEL ")\n";
    std::cout << "  -d, --delay SECONDS    Delay between commands (default: 0.5)\n";
    std::cout << "  -r, --replies N        Print up to N device replies after each command\n";
    std::cout << "      --auth-timeout S   Authentication timeout, 'none' waits forever (default: 20)\n";
    std::cout << "      --recv-timeout S   Receive timeout, 'none' blocks (default: 2)\n";
    std::cout << "      --attempts N       Authentication attempts (default: " << SSTV_DEFAULT_AUTH_ATTEMPTS << ")\n";
    std::cout << "  -v, --verbose          Debug logging\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << prog_name << " -i 192.168.1.120 send KEY_VOLUP KEY_VOLUP\n";
    std::cout << "  " << prog_name << " -i 192.168.1.120 send CH7 KEY_ENTER\n";
    std::cout << "  " << prog_name << " -i 192.168.1.120 listen --json\n";
    std::cout << "\n";
}

static bool parse_int(const std::string& text, int* out) {
    if (text.empty()) return false;

    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || value < 0 || value > 1000000) {
        return false;
    }
    *out = static_cast<int>(value);
    return true;
}

static bool parse_seconds(const std::string& text, int* out_ms) {
    if (text == "none") {
        *out_ms = SSTV_NO_TIMEOUT;
        return true;
    }
    if (text.empty()) return false;

    char* end = nullptr;
    double seconds = std::strtod(text.c_str(), &end);
    if (*end != '\0' || seconds < 0 || seconds > 86400) {
        return false;
    }
    *out_ms = static_cast<int>(seconds * 1000);
    return true;
}

// 0 = ok, 1 = help shown, 2 = usage error
static int parse_args(int argc, char** argv, Options& opts) {
    opts.config.app_label = DEFAULT_APP_LABEL;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto need = [&](const char* flag) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << flag << " requires an argument\n";
                return nullptr;
            }
            return argv[i];
        };

        if (!opts.command.empty()) {
            if (arg == "--json" && opts.command == "listen") {
                opts.json_output = true;
            } else {
                opts.args.push_back(arg);
            }
            continue;
        }

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 1;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-i" || arg == "--ip") {
            const char* v = need("--ip");
            if (!v) return 2;
            opts.config.host = v;
        } else if (arg == "-p" || arg == "--port") {
            const char* v = need("--port");
            if (!v) return 2;
            if (!parse_int(v, &opts.config.port) || opts.config.port == 0 || opts.config.port > 65535) {
                std::cerr << "Error: invalid port: " << v << "\n";
                return 2;
            }
        } else if (arg == "-l" || arg == "--label") {
            const char* v = need("--label");
            if (!v) return 2;
            opts.config.app_label = v;
        } else if (arg == "-d" || arg == "--delay") {
            const char* v = need("--delay");
            if (!v) return 2;
            if (!parse_seconds(v, &opts.delay_ms) || opts.delay_ms == SSTV_NO_TIMEOUT) {
                std::cerr << "Error: invalid delay: " << v << "\n";
                return 2;
            }
        } else if (arg == "-r" || arg == "--replies") {
            const char* v = need("--replies");
            if (!v) return 2;
            if (!parse_int(v, &opts.replies)) {
                std::cerr << "Error: invalid reply count: " << v << "\n";
                return 2;
            }
        } else if (arg == "--auth-timeout") {
            const char* v = need("--auth-timeout");
            if (!v) return 2;
            if (!parse_seconds(v, &opts.config.auth_timeout_ms)) {
                std::cerr << "Error: invalid timeout: " << v << "\n";
                return 2;
            }
        } else if (arg == "--recv-timeout") {
            const char* v = need("--recv-timeout");
            if (!v) return 2;
            if (!parse_seconds(v, &opts.config.recv_timeout_ms)) {
                std::cerr << "Error: invalid timeout: " << v << "\n";
                return 2;
            }
        } else if (arg == "--attempts") {
            const char* v = need("--attempts");
            if (!v) return 2;
            if (!parse_int(v, &opts.config.max_auth_attempts) || opts.config.max_auth_attempts == 0) {
                std::cerr << "Error: invalid attempt count: " << v << "\n";
                return 2;
            }
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        } else {
            opts.command = arg;
        }
    }

    if (opts.command.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    if (opts.command != "send" && opts.command != "listen" &&
        opts.command != "shell" && opts.command != "keys") {
        std::cerr << "Error: Unknown command: " << opts.command << "\n";
        return 2;
    }

    if (opts.command == "send" && opts.args.empty()) {
        std::cerr << "Error: Please specify one or more commands to send\n";
        return 2;
    }

    if (opts.command != "keys" && opts.config.host.empty()) {
        const char* env = std::getenv(DEVICE_ENV);
        if (!env || !*env) {
            std::cerr << "Error: Either set " DEVICE_ENV " in the environment or specify the device IP\n";
            return 2;
        }
        opts.config.host = env;
    }

    return 0;
}

static std::string timestamp() {
    char buf[32];
    std::time_t now = std::time(nullptr);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&now));
    return buf;
}

static void print_keys(const std::string& filter) {
    for (const auto& key : known_key_codes()) {
        if (!filter.empty() && key.name.find(filter) == std::string::npos) continue;
        printf("  %-20s - %s\n", key.name.c_str(), key.description.c_str());
    }
}

static void print_error(const std::string& what, ErrorCode code) {
    std::cerr << RED << "Error: " << what << ": " << error_code_name(code) << RESET << "\n";
}

static bool parse_channel_command(const std::string& command, int* channel) {
    if (command.rfind("CH", 0) != 0 || command.size() == 2) {
        return false;
    }
    return parse_int(command.substr(2), channel);
}

static void print_replies(RemoteClient& client, int count) {
    ColorManager& cm = ColorManager::instance();

    for (int i = 0; i < count; i++) {
        Message reply;
        ErrorCode result = client.receive_message(&reply);
        if (result == ErrorCode::RECEIVE_TIMEOUT) {
            if (i == 0) std::cout << "(no response)\n";
            return;
        }
        if (result != ErrorCode::OK) {
            print_error("reply", result);
            return;
        }
        std::cout << cm.theme("reply") << "<- " << reply.describe() << RESET << "\n";
    }
}

static int run_send(const Options& opts, ILogger* logger) {
    RemoteClient client(opts.config, logger);

    for (size_t i = 0; i < opts.args.size(); i++) {
        const std::string& command = opts.args[i];
        size_t sent = 0;
        int channel = 0;
        ErrorCode result;

        if (is_key_code(command)) {
            result = client.send_key(command, &sent);
        } else if (parse_channel_command(command, &channel)) {
            result = client.set_channel(channel);
        } else {
            result = client.send_text(command, &sent);
        }

        if (result != ErrorCode::OK) {
            print_error(command, result);
            return 1;
        }

        std::cout << "-> " << command;
        if (sent > 0) std::cout << " (" << sent << " bytes)";
        std::cout << "\n";

        print_replies(client, opts.replies);

        if (i + 1 < opts.args.size() && opts.delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(opts.delay_ms));
        }
    }

    client.disconnect();
    return 0;
}

static void print_event(const Message& message, bool as_json) {
    if (as_json) {
        json j = {
            {"time", timestamp()},
            {"kind", message.kind()},
            {"kind_name", message_kind_name(message.kind())},
            {"sender", escape_bytes(message.sender())},
            {"payload", hex_bytes(message.payload())},
            {"payload_name", ResponsePayload::name_of(message.payload())}
        };
        std::cout << j.dump() << std::endl;
        return;
    }

    ColorManager& cm = ColorManager::instance();
    std::cout << "--- " << timestamp() << " ---\n"
              << cm.theme("event") << message.describe() << RESET;

    std::string name = ResponsePayload::name_of(message.payload());
    if (!name.empty()) {
        std::cout << " [" << name << "]";
    }
    std::cout << "\n" << std::endl;
}

static int run_listen(const Options& opts, ILogger* logger) {
    TCPTransport transport(logger);
    Authenticator authenticator(opts.config, logger);
    EventWatcher watcher(transport, &authenticator, logger);

    bool as_json = opts.json_output;
    watcher.add_listener([as_json](const Message& message) {
        print_event(message, as_json);
    });

    signal(SIGINT, handle_signal);
    signal(SIGTERM, handle_signal);

    if (!as_json) {
        std::cerr << "Listening on " << opts.config.host << ":" << opts.config.port
                  << " (Ctrl+C to stop)\n";
    }

    watcher.start();
    while (!g_interrupted && watcher.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    watcher.join();

    ErrorCode result = watcher.get_last_error();
    if (result != ErrorCode::OK) {
        print_error("listen", result);
        return 1;
    }
    return 0;
}

static const std::vector<std::string> shell_commands = {
    "help", "keys", "text", "ch", "color", "clear", "q"
};

static char* command_generator(const char* text, int state) {
    static size_t list_index, key_index, len;

    if (!state) {
        list_index = 0;
        key_index = 0;
        len = strlen(text);
    }

    while (list_index < shell_commands.size()) {
        const std::string& name = shell_commands[list_index++];
        if (strncmp(name.c_str(), text, len) == 0) {
            return strdup(name.c_str());
        }
    }

    const auto& keys = known_key_codes();
    while (key_index < keys.size()) {
        const std::string& name = keys[key_index++].name;
        if (strncmp(name.c_str(), text, len) == 0) {
            return strdup(name.c_str());
        }
    }

    return NULL;
}

static char** shell_completion(const char* text, int start, int end) {
    (void)end;
    rl_attempted_completion_over = 1;

    // Only the first word is completed
    if (start != 0) {
        return NULL;
    }
    return rl_completion_matches(text, command_generator);
}

static void print_shell_help() {
    std::cout << "\nCommands:\n";
    std::cout << "  KEY_*                   Send a key press (Tab completes)\n";
    std::cout << "  text <text>             Type text into the focused field\n";
    std::cout << "  ch <number>             Dial a channel (0-9999)\n";
    std::cout << "  keys [filter]           List known key codes\n";
    std::cout << "  color list              Show available colors\n";
    std::cout << "  color <theme>=<COLOR>   Set prompt, event or reply color\n";
    std::cout << "  clear                   Clear the screen\n";
    std::cout << "  q                       Exit\n\n";
}

static void handle_color_command(const std::string& args) {
    ColorManager& cm = ColorManager::instance();

    if (args.empty()) {
        std::cout << cm.list_theme();
        return;
    }
    if (args == "list") {
        std::cout << cm.list_colors() << "\n";
        return;
    }

    size_t eq = args.find('=');
    if (eq == std::string::npos) {
        std::cerr << "Usage: color <theme>=<COLOR>\n";
        return;
    }

    std::string theme = args.substr(0, eq);
    std::string color = args.substr(eq + 1);
    if (!cm.set_theme_color(theme, color)) {
        std::cerr << "Unknown theme or color: " << args << "\n";
    }
}

static std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

static int run_shell(const Options& opts, ILogger* logger) {
    RemoteClient client(opts.config, logger);
    ColorManager& cm = ColorManager::instance();

    rl_attempted_completion_function = shell_completion;

    std::cout << "Connecting to " << opts.config.host << ":" << opts.config.port
              << " as " << opts.config.app_label << " (confirm on the TV if asked)\n";
    ErrorCode result = client.connect();
    if (result != ErrorCode::OK) {
        print_error("connect", result);
        return 1;
    }
    std::cout << "Connected. Type 'help' for commands.\n";

    while (true) {
        // \001 / \002 keep readline's line length right around escape codes
        std::string prompt = "\001" + cm.theme("prompt") + "\002sstv> \001" RESET "\002";
        char* input = readline(prompt.c_str());
        if (!input) {
            std::cout << "\n";
            break;
        }

        std::string command = trim(input);
        free(input);

        if (command.empty()) {
            continue;
        }
        add_history(command.c_str());

        std::string name = command.substr(0, command.find(' '));
        std::string args = command.size() > name.size() ? trim(command.substr(name.size())) : "";

        if (name == "q" || name == "quit" || name == "exit") {
            break;
        }

        if (name == "help") {
            print_shell_help();
            continue;
        }
        if (name == "keys") {
            print_keys(args);
            continue;
        }
        if (name == "color") {
            handle_color_command(args);
            continue;
        }
        if (name == "clear") {
            std::cout << "\033[2J\033[1;1H";
            continue;
        }

        if (name == "text") {
            result = client.send_text(args);
        } else if (name == "ch") {
            int channel = 0;
            if (!parse_int(args, &channel)) {
                std::cerr << "Usage: ch <number>\n";
                continue;
            }
            result = client.set_channel(channel);
        } else if (is_key_code(name)) {
            if (!find_key_code(name)) {
                std::cout << YELLOW << "(not in catalog, sending anyway)" << RESET << "\n";
            }
            result = client.send_key(name);
        } else {
            std::cerr << "Unknown command. Type 'help' for available commands.\n";
            continue;
        }

        if (result != ErrorCode::OK) {
            print_error(command, result);
            if (!client.is_connected()) {
                std::cerr << "Connection lost, will reconnect on the next command\n";
            }
        }
    }

    client.disconnect();
    return 0;
}

int main(int argc, char** argv) {
    signal(SIGPIPE, SIG_IGN);

    Options opts;
    int status = parse_args(argc, argv, opts);
    if (status == 1) return 0;
    if (status != 0) return status;

    if (opts.command == "keys") {
        print_keys(opts.args.empty() ? "" : opts.args[0]);
        return 0;
    }

    ConsoleLogger logger(opts.verbose ? LogLevel::DEBUG : LogLevel::WARN);

    try {
        if (opts.command == "send") return run_send(opts, &logger);
        if (opts.command == "listen") return run_listen(opts, &logger);
        return run_shell(opts, &logger);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
