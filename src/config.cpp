#include "pidbox/config.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace pidbox {

namespace {

std::string to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

uint16_t default_port(std::string_view scheme) {
    if (scheme == "redis" || scheme == "rediss") return 6379;
    if (scheme == "amqp") return 5672;
    if (scheme == "amqps") return 5671;
    return 0;
}

} // namespace

const char* to_string(BrokerType type) {
    switch (type) {
        case BrokerType::Redis: return "redis";
        case BrokerType::Amqp:  return "amqp";
    }
    return "unknown";
}

const char* to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Json: return "json";
    }
    return "unknown";
}

std::optional<BrokerType> parse_broker_type(std::string_view name) {
    auto lower = to_lower(name);
    if (lower == "redis") return BrokerType::Redis;
    if (lower == "amqp") return BrokerType::Amqp;
    return std::nullopt;
}

std::optional<OutputFormat> parse_output_format(std::string_view name) {
    if (name == "text") return OutputFormat::Text;
    if (name == "json") return OutputFormat::Json;
    return std::nullopt;
}

void Config::validate() const {
    if (broker_url.empty()) {
        throw ConfigError("broker URL is required");
    }
    try {
        parse_broker_url(broker_url);
    } catch (const ConfigError& e) {
        throw ConfigError(std::string("invalid broker URL format: ") + e.what());
    }
    if (timeout.count() <= 0) {
        throw ConfigError("timeout must be positive");
    }
    if (database < 0) {
        throw ConfigError("database must not be negative");
    }
}

Config default_config() {
    Config config;
    config.broker_url = env("BROKER_URL").value_or(std::string(kDefaultBrokerUrl));
    config.broker_type = detect_broker_type(config.broker_url);
    return config;
}

void load_from_env(Config& config) {
    if (auto url = env("BROKER_URL")) {
        config.broker_url = *url;
        config.broker_type = detect_broker_type(*url);
    }
    if (auto username = env("BROKER_USERNAME")) {
        config.username = *username;
    }
    if (auto password = env("BROKER_PASSWORD")) {
        config.password = *password;
    }
    if (auto db = env("BROKER_DB")) {
        int value = 0;
        auto [ptr, ec] = std::from_chars(db->data(), db->data() + db->size(), value);
        if (ec == std::errc() && ptr == db->data() + db->size()) {
            config.database = value;
        }
    }
    if (auto timeout = env("BROKER_TIMEOUT")) {
        if (auto parsed = parse_duration(*timeout)) {
            config.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*parsed);
        }
    }
    if (auto format = env("OUTPUT_FORMAT")) {
        auto parsed = parse_output_format(*format);
        if (!parsed) {
            throw ConfigError("output format must be 'json' or 'text'");
        }
        config.output_format = *parsed;
    }
    if (auto verbose = env("VERBOSE")) {
        config.verbose = (*verbose == "true" || *verbose == "1");
    }
}

BrokerType detect_broker_type(std::string_view url) {
    auto separator = url.find("://");
    if (separator == std::string_view::npos) {
        return BrokerType::Redis;
    }
    auto scheme = to_lower(url.substr(0, separator));
    if (scheme == "amqp" || scheme == "amqps") {
        return BrokerType::Amqp;
    }
    return BrokerType::Redis;
}

std::optional<std::chrono::nanoseconds> parse_duration(std::string_view text) {
    if (text.empty()) return std::nullopt;

    bool negative = false;
    if (text.front() == '-' || text.front() == '+') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text == "0") return std::chrono::nanoseconds::zero();
    if (text.empty()) return std::nullopt;

    long double total_ns = 0;
    while (!text.empty()) {
        size_t digits = 0;
        while (digits < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[digits])) || text[digits] == '.')) {
            ++digits;
        }
        if (digits == 0) return std::nullopt;

        std::string number(text.substr(0, digits));
        if (std::count(number.begin(), number.end(), '.') > 1 || number == ".") {
            return std::nullopt;
        }
        long double value = std::strtold(number.c_str(), nullptr);
        text.remove_prefix(digits);

        size_t unit_len = 0;
        while (unit_len < text.size() &&
               !std::isdigit(static_cast<unsigned char>(text[unit_len])) && text[unit_len] != '.') {
            ++unit_len;
        }
        auto unit = text.substr(0, unit_len);
        text.remove_prefix(unit_len);

        long double scale = 0;
        if (unit == "ns") scale = 1;
        else if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") scale = 1e3;
        else if (unit == "ms") scale = 1e6;
        else if (unit == "s") scale = 1e9;
        else if (unit == "m") scale = 60e9;
        else if (unit == "h") scale = 3600e9;
        else return std::nullopt;

        total_ns += value * scale;
    }

    auto ns = static_cast<int64_t>(std::llround(total_ns));
    return std::chrono::nanoseconds(negative ? -ns : ns);
}

BrokerUrl parse_broker_url(std::string_view url) {
    auto separator = url.find("://");
    if (separator == std::string_view::npos || separator == 0) {
        throw ConfigError("missing scheme in '" + std::string(url) + "'");
    }

    BrokerUrl parsed;
    parsed.scheme = to_lower(url.substr(0, separator));
    auto rest = url.substr(separator + 3);

    auto query = rest.find_first_of("?#");
    if (query != std::string_view::npos) {
        rest = rest.substr(0, query);
    }

    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        parsed.path = percent_decode(rest.substr(slash + 1));
    }

    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        auto userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        auto colon = userinfo.find(':');
        parsed.username = percent_decode(userinfo.substr(0, colon));
        if (colon != std::string_view::npos) {
            parsed.password = percent_decode(userinfo.substr(colon + 1));
        }
    }

    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            throw ConfigError("unterminated IPv6 address in '" + std::string(url) + "'");
        }
        parsed.host = std::string(authority.substr(1, close - 1));
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                throw ConfigError("unexpected characters after host in '" + std::string(url) + "'");
            }
            port_text = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        parsed.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (parsed.host.empty()) {
        parsed.host = "localhost";
    }

    parsed.port = default_port(parsed.scheme);
    if (!port_text.empty()) {
        unsigned long value = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size() || value == 0 ||
            value > 65535) {
            throw ConfigError("invalid port \"" + std::string(port_text) + "\"");
        }
        parsed.port = static_cast<uint16_t>(value);
    }
    if (parsed.port == 0) {
        throw ConfigError("no port given and no default for scheme '" + parsed.scheme + "'");
    }
    return parsed;
}

BrokerConfig to_broker_config(const Config& config) {
    BrokerConfig broker;
    broker.url = config.broker_url;
    broker.database = config.database;
    broker.username = config.username;
    broker.password = config.password;
    return broker;
}

std::vector<std::string> split_destinations(std::string_view list) {
    std::vector<std::string> out;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto item = trim(list.substr(0, comma));
        if (!item.empty()) {
            out.emplace_back(item);
        }
        if (comma == std::string_view::npos) break;
        list.remove_prefix(comma + 1);
    }
    return out;
}

} // namespace pidbox
