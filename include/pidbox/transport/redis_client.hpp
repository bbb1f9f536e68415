#pragma once

/**
 * @file redis_client.hpp
 * @brief Minimal Redis command surface used by the Redis transport
 *
 * RedisTransport talks to the broker only through this interface, so the
 * collection loop can be driven by an in-memory fake in tests. Every method
 * reports failure by throwing ClientError.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pidbox::transport {

struct RedisEndpoint {
    std::string host{"localhost"};
    uint16_t port = 6379;
    int database = 0;
    std::string username;
    std::string password;
    std::chrono::milliseconds connect_timeout{5000};
};

class RedisClient {
public:
    virtual ~RedisClient() = default;

    /// PING; throws unless the server answers PONG.
    virtual void ping() = 0;

    /// PUBLISH; returns the number of subscribers that received the message.
    virtual int64_t publish(const std::string& channel, const std::string& message) = 0;

    virtual int64_t sadd(const std::string& key, const std::string& member) = 0;
    virtual int64_t srem(const std::string& key, const std::string& member) = 0;
    virtual int64_t del(const std::vector<std::string>& keys) = 0;

    /**
     * @brief BRPOP over several lists
     * @param timeout whole seconds to block, at least 1
     * @return (list, value) or nullopt when the timeout expired
     */
    virtual std::optional<std::pair<std::string, std::string>>
    brpop(const std::vector<std::string>& keys, std::chrono::seconds timeout) = 0;

    /// Non-blocking RPOP; nullopt when the list is empty.
    virtual std::optional<std::string> rpop(const std::string& key) = 0;
};

using RedisClientFactory = std::function<std::unique_ptr<RedisClient>(const RedisEndpoint&)>;

/**
 * @brief Open a hiredis connection, authenticate and select the database
 * @throws ClientError (Connection) when any step fails
 */
std::unique_ptr<RedisClient> connect_hiredis(const RedisEndpoint& endpoint);

} // namespace pidbox::transport
