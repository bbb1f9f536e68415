#pragma once

#include <stdexcept>
#include <string>

namespace pidbox {

/**
 * @brief Failure categories a transport can report
 *
 * Configuration errors (transport never connected, bad settings) are never
 * retried. Connect, Declare and Publish abort the current call before or
 * during broadcast. Receive is a broker failure inside the collection loop
 * with nothing collected yet.
 */
enum class ErrorKind {
    Configuration,
    Connect,
    Declare,
    Publish,
    Receive,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Connect:       return "connect";
        case ErrorKind::Declare:       return "declare";
        case ErrorKind::Publish:       return "publish";
        case ErrorKind::Receive:       return "receive";
    }
    return "unknown";
}

class BrokerError : public std::runtime_error {
public:
    BrokerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Failure raised by a broker client adapter
 *
 * Client adapters translate their library's error reporting into this type
 * so transports never depend on hiredis or SimpleAmqpClient directly.
 */
class ClientError : public std::runtime_error {
public:
    enum class Kind {
        Command,       ///< The broker rejected a command
        Connection,    ///< Socket, protocol or authentication failure
        StreamClosed,  ///< The broker cancelled a consumer or closed the stream
    };

    ClientError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

} // namespace pidbox
