#include "pidbox/errors.hpp"
#include "pidbox/transport/amqp_transport.hpp"
#include "pidbox/transport/redis_transport.hpp"
#include "pidbox/transport/transport.hpp"

namespace pidbox::transport {

std::unique_ptr<Transport> make_transport(BrokerType type, const BrokerConfig& config) {
    switch (type) {
        case BrokerType::Redis:
            return std::make_unique<RedisTransport>(config);
        case BrokerType::Amqp:
            return std::make_unique<AmqpTransport>(config);
    }
    throw BrokerError(ErrorKind::Configuration, "unsupported broker type");
}

std::unique_ptr<Transport> make_transport(std::string_view type, const BrokerConfig& config) {
    auto parsed = parse_broker_type(type);
    if (!parsed) {
        throw BrokerError(ErrorKind::Configuration,
                          "unsupported broker type: " + std::string(type));
    }
    return make_transport(*parsed, config);
}

} // namespace pidbox::transport
