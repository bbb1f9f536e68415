/**
 * @file pidbox_ping.cpp
 * @brief Command-line tool: ping Celery workers over the control bus
 *
 * Exit status is 0 when at least one worker replied and 1 otherwise,
 * including configuration and broker errors.
 */

#include "pidbox/global/logger.hpp"
#include "pidbox/pidbox.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pidbox;

namespace {

// Cancels the in-flight ping on SIGINT/SIGTERM
transport::CancellationToken g_cancel;

void signal_handler(int) {
    g_cancel.cancel();
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [flags]" << std::endl;
    std::cout << "       " << program << " version" << std::endl;
    std::cout << std::endl;
    std::cout << "Ping Celery workers through the broker control bus." << std::endl;
    std::cout << std::endl;
    std::cout << "Flags:" << std::endl;
    std::cout << "      --broker-url string    Broker URL (default \"" << kDefaultBrokerUrl << "\")"
              << std::endl;
    std::cout << "      --timeout duration     Timeout for ping responses (default 1.5s)" << std::endl;
    std::cout << "      --format string        Output format: text or json (default \"text\")"
              << std::endl;
    std::cout << "      --verbose              Enable verbose output" << std::endl;
    std::cout << "      --database int         Redis database number" << std::endl;
    std::cout << "      --username string      Broker username" << std::endl;
    std::cout << "      --password string      Broker password" << std::endl;
    std::cout << "  -d, --destination string   Comma separated list of destination node names"
              << std::endl;
    std::cout << "  -h, --help                 Show this help message" << std::endl;
}

void print_version() {
    std::cout << "pidbox-ping version " << version() << std::endl;
    std::cout << "Build type: " << build_type() << std::endl;
    std::cout << "Compiler: " << __VERSION__ << std::endl;
    std::cout << "Platform: " << platform() << std::endl;
}

struct Flags {
    std::optional<std::string> broker_url;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::string> format;
    bool verbose = false;
    std::optional<int> database;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> destination;
    bool help = false;
    bool version = false;
};

/// @throws ConfigError for unknown flags and malformed values
Flags parse_flags(int argc, char* argv[]) {
    Flags flags;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto value = [&]() -> std::string {
            if (inline_value) {
                return *inline_value;
            }
            if (i + 1 >= argc) {
                throw ConfigError("flag needs an argument: " + arg);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            flags.help = true;
        } else if (arg == "version" && i == 1) {
            flags.version = true;
        } else if (arg == "--verbose") {
            flags.verbose = !inline_value || *inline_value == "true" || *inline_value == "1";
        } else if (arg == "--broker-url") {
            flags.broker_url = value();
        } else if (arg == "--timeout") {
            auto text = value();
            auto parsed = parse_duration(text);
            if (!parsed) {
                throw ConfigError("invalid duration \"" + text + "\" for --timeout");
            }
            flags.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*parsed);
        } else if (arg == "--format") {
            flags.format = value();
        } else if (arg == "--database") {
            auto text = value();
            try {
                size_t used = 0;
                int db = std::stoi(text, &used);
                if (used != text.size()) {
                    throw ConfigError("invalid value \"" + text + "\" for --database");
                }
                flags.database = db;
            } catch (const std::logic_error&) {
                throw ConfigError("invalid value \"" + text + "\" for --database");
            }
        } else if (arg == "--username") {
            flags.username = value();
        } else if (arg == "--password") {
            flags.password = value();
        } else if (arg == "-d" || arg == "--destination") {
            flags.destination = value();
        } else {
            throw ConfigError("unknown flag: " + arg);
        }
    }
    return flags;
}

/// Environment first, then flags; flags only override when given.
Config build_config(const Flags& flags) {
    Config config = default_config();
    load_from_env(config);

    if (flags.broker_url && !flags.broker_url->empty()) {
        config.broker_url = *flags.broker_url;
        config.broker_type = detect_broker_type(config.broker_url);
    }
    if (flags.timeout && flags.timeout->count() > 0) {
        config.timeout = *flags.timeout;
    }
    if (flags.format && !flags.format->empty()) {
        auto format = parse_output_format(*flags.format);
        if (!format) {
            throw ConfigError("output format must be 'json' or 'text'");
        }
        config.output_format = *format;
    }
    if (flags.verbose) {
        config.verbose = true;
    }
    if (flags.database && *flags.database > 0) {
        config.database = *flags.database;
    }
    if (flags.username && !flags.username->empty()) {
        config.username = *flags.username;
    }
    if (flags.password && !flags.password->empty()) {
        config.password = *flags.password;
    }
    if (flags.destination && !flags.destination->empty()) {
        config.destinations = split_destinations(*flags.destination);
    }

    config.validate();
    return config;
}

void configure_logging(const Config& config) {
    set_log_level(config.verbose ? LogLevel::INFO : LogLevel::WARN);
    if (const char* level = std::getenv("PIDBOX_LOG_LEVEL")) {
        if (auto parsed = parse_log_level(level)) {
            set_log_level(*parsed);
        } else {
            log_warn("Ignoring unknown PIDBOX_LOG_LEVEL \"", level, "\"");
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Config config;
    try {
        Flags flags = parse_flags(argc, argv);
        if (flags.help) {
            print_usage(argv[0]);
            return 0;
        }
        if (flags.version) {
            print_version();
            return 0;
        }
        config = build_config(flags);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    configure_logging(config);

    try {
        auto broker = transport::make_transport(config.broker_type, to_broker_config(config));
        log_info("Connecting to ", to_string(config.broker_type), " broker: ", config.broker_url);
        broker->connect();

        if (config.destinations.empty()) {
            log_info("Sending ping to workers (timeout: ", config.timeout.count(), "ms)...");
        } else {
            log_info("Sending ping to ", config.destinations.size(),
                     " specific worker(s) (timeout: ", config.timeout.count(), "ms)...");
        }

        auto result = broker->ping(config.timeout, config.destinations, g_cancel);
        log_info("Collection stopped: ", to_string(result.stop_reason));
        broker->close();

        return write_result(std::cout, result.responses, config.output_format);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
