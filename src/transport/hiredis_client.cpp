#include "pidbox/errors.hpp"
#include "pidbox/global/logger.hpp"
#include "pidbox/transport/redis_client.hpp"
#include <hiredis/hiredis.h>
#include <sys/time.h>

namespace pidbox::transport {

namespace {

struct ContextDeleter {
    void operator()(redisContext* context) const {
        if (context) redisFree(context);
    }
};

struct ReplyDeleter {
    void operator()(redisReply* reply) const {
        if (reply) freeReplyObject(reply);
    }
};

using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

timeval to_timeval(std::chrono::milliseconds duration) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
    return tv;
}

class HiredisClient : public RedisClient {
public:
    HiredisClient(ContextPtr context, std::chrono::milliseconds io_timeout)
        : context_(std::move(context)), io_timeout_(io_timeout) {}

    void ping() override {
        auto reply = command({"PING"});
        if (reply->type != REDIS_REPLY_STATUS || std::string(reply->str, reply->len) != "PONG") {
            throw ClientError(ClientError::Kind::Command, "unexpected PING reply");
        }
    }

    int64_t publish(const std::string& channel, const std::string& message) override {
        return integer(command({"PUBLISH", channel, message}));
    }

    int64_t sadd(const std::string& key, const std::string& member) override {
        return integer(command({"SADD", key, member}));
    }

    int64_t srem(const std::string& key, const std::string& member) override {
        return integer(command({"SREM", key, member}));
    }

    int64_t del(const std::vector<std::string>& keys) override {
        std::vector<std::string> args{"DEL"};
        args.insert(args.end(), keys.begin(), keys.end());
        return integer(command(args));
    }

    std::optional<std::pair<std::string, std::string>>
    brpop(const std::vector<std::string>& keys, std::chrono::seconds timeout) override {
        std::vector<std::string> args{"BRPOP"};
        args.insert(args.end(), keys.begin(), keys.end());
        args.push_back(std::to_string(timeout.count()));

        // The socket must outlive the server-side block.
        set_timeout(std::chrono::duration_cast<std::chrono::milliseconds>(timeout) + io_timeout_);
        ReplyPtr reply = command(args);
        set_timeout(io_timeout_);

        if (reply->type == REDIS_REPLY_NIL) {
            return std::nullopt;
        }
        if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
            throw ClientError(ClientError::Kind::Command, "unexpected BRPOP reply");
        }
        return std::make_pair(bulk_string(reply->element[0]), bulk_string(reply->element[1]));
    }

    std::optional<std::string> rpop(const std::string& key) override {
        auto reply = command({"RPOP", key});
        if (reply->type == REDIS_REPLY_NIL) {
            return std::nullopt;
        }
        return bulk_string(reply.get());
    }

    ReplyPtr command(const std::vector<std::string>& args) {
        std::vector<const char*> argv;
        std::vector<size_t> argvlen;
        argv.reserve(args.size());
        argvlen.reserve(args.size());
        for (const auto& arg : args) {
            argv.push_back(arg.data());
            argvlen.push_back(arg.size());
        }

        ReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(
            context_.get(), static_cast<int>(argv.size()), argv.data(), argvlen.data())));
        if (!reply) {
            throw ClientError(ClientError::Kind::Connection,
                              context_->err ? context_->errstr : "connection lost");
        }
        if (reply->type == REDIS_REPLY_ERROR) {
            throw ClientError(ClientError::Kind::Command, std::string(reply->str, reply->len));
        }
        return reply;
    }

private:
    static int64_t integer(const ReplyPtr& reply) {
        if (reply->type != REDIS_REPLY_INTEGER) {
            throw ClientError(ClientError::Kind::Command, "expected an integer reply");
        }
        return reply->integer;
    }

    static std::string bulk_string(const redisReply* reply) {
        if (reply->type != REDIS_REPLY_STRING) {
            throw ClientError(ClientError::Kind::Command, "expected a bulk string reply");
        }
        return std::string(reply->str, reply->len);
    }

    void set_timeout(std::chrono::milliseconds timeout) {
        if (redisSetTimeout(context_.get(), to_timeval(timeout)) != REDIS_OK) {
            throw ClientError(ClientError::Kind::Connection, "failed to set socket timeout");
        }
    }

    ContextPtr context_;
    std::chrono::milliseconds io_timeout_;
};

} // namespace

std::unique_ptr<RedisClient> connect_hiredis(const RedisEndpoint& endpoint) {
    ContextPtr context(
        redisConnectWithTimeout(endpoint.host.c_str(), endpoint.port, to_timeval(endpoint.connect_timeout)));
    if (!context) {
        throw ClientError(ClientError::Kind::Connection, "cannot allocate redis context");
    }
    if (context->err) {
        throw ClientError(ClientError::Kind::Connection, context->errstr);
    }
    if (redisSetTimeout(context.get(), to_timeval(endpoint.connect_timeout)) != REDIS_OK) {
        throw ClientError(ClientError::Kind::Connection, "failed to set socket timeout");
    }

    auto client = std::make_unique<HiredisClient>(std::move(context), endpoint.connect_timeout);
    try {
        if (!endpoint.password.empty()) {
            if (endpoint.username.empty()) {
                client->command({"AUTH", endpoint.password});
            } else {
                client->command({"AUTH", endpoint.username, endpoint.password});
            }
        }
        if (endpoint.database != 0) {
            client->command({"SELECT", std::to_string(endpoint.database)});
        }
    } catch (const ClientError& e) {
        throw ClientError(ClientError::Kind::Connection, e.what());
    }
    log_debug("hiredis connected to ", endpoint.host, ":", endpoint.port);
    return client;
}

} // namespace pidbox::transport
