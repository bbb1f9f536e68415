#pragma once

/**
 * @file config.hpp
 * @brief Immutable run configuration and broker URL handling
 *
 * Layering: default_config() -> load_from_env() -> command-line overrides
 * -> validate(). Once validated the Config is passed by value; nothing in
 * the library reads the environment on its own.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pidbox {

enum class BrokerType { Redis, Amqp };
enum class OutputFormat { Text, Json };

const char* to_string(BrokerType type);
const char* to_string(OutputFormat format);

std::optional<BrokerType> parse_broker_type(std::string_view name);
std::optional<OutputFormat> parse_output_format(std::string_view name);

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline constexpr std::string_view kDefaultBrokerUrl = "redis://localhost:6379/0";
inline constexpr std::chrono::milliseconds kDefaultTimeout{1500};

struct Config {
    std::string broker_url{kDefaultBrokerUrl};
    BrokerType broker_type = BrokerType::Redis;
    int database = 0;
    std::string username;
    std::string password;

    std::chrono::milliseconds timeout = kDefaultTimeout;
    OutputFormat output_format = OutputFormat::Text;
    bool verbose = false;
    std::vector<std::string> destinations;

    /// @throws ConfigError describing the first invalid field
    void validate() const;
};

/**
 * @brief Connection parameters handed to a transport
 *
 * Built once from a validated Config and immutable for the transport's
 * lifetime.
 */
struct BrokerConfig {
    std::string url;
    int database = 0;
    std::string username;
    std::string password;
    std::chrono::milliseconds connect_timeout{5000};
};

/**
 * @brief Components of a broker URL
 *
 * path is the Redis database index or the AMQP vhost, without the leading
 * slash and percent-decoded.
 */
struct BrokerUrl {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string username;
    std::string password;
    std::string path;
};

/// Defaults, with BROKER_URL applied (and the broker type detected from it).
Config default_config();

/**
 * @brief Apply BROKER_URL, BROKER_USERNAME, BROKER_PASSWORD, BROKER_DB,
 * BROKER_TIMEOUT, OUTPUT_FORMAT and VERBOSE.
 *
 * Unparsable BROKER_DB and BROKER_TIMEOUT values are ignored.
 */
void load_from_env(Config& config);

/// amqp/amqps -> Amqp; everything else, including garbage, -> Redis.
BrokerType detect_broker_type(std::string_view url);

/**
 * @brief Parse "1.5s", "500ms", "1m30s", "2h" style durations
 *
 * Units: ns, us (or µs), ms, s, m, h. A bare "0" is accepted.
 */
std::optional<std::chrono::nanoseconds> parse_duration(std::string_view text);

/// @throws ConfigError on a missing scheme, empty host or out-of-range port
BrokerUrl parse_broker_url(std::string_view url);

BrokerConfig to_broker_config(const Config& config);

/// Split a comma separated list, trimming whitespace and dropping empty items.
std::vector<std::string> split_destinations(std::string_view list);

} // namespace pidbox
