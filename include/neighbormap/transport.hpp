#ifndef NEIGHBORMAP_TRANSPORT_HPP
#define NEIGHBORMAP_TRANSPORT_HPP

#include <string>
#include <memory>   // For std::unique_ptr
#include <variant>
#include <chrono>

namespace neighbormap {

enum class ErrorKind {
    TIMEOUT,
    AUTHENTICATION_FAILURE,
    CONNECTION_ERROR,
    GENERIC_ERROR
};

inline std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TIMEOUT:                return "timeout";
        case ErrorKind::AUTHENTICATION_FAILURE: return "auth";
        case ErrorKind::CONNECTION_ERROR:       return "connection";
        case ErrorKind::GENERIC_ERROR:          return "generic";
        default:                                return "unknown";
    }
}

struct TransportError {
    ErrorKind kind = ErrorKind::GENERIC_ERROR;
    std::string message;
};

struct Credentials {
    std::string username;
    std::string password;
};

// Raw command output, or why the command could not be run.
using CommandResult = std::variant<std::string, TransportError>;

// An authenticated, command-executing handle to one device.
class Session {
public:
    virtual ~Session() = default;

    // The device's prompt, e.g. "CORE-SW-01#".
    virtual std::string identity() = 0;

    // Blocks for at most `timeout`.
    virtual CommandResult run(const std::string& command, std::chrono::seconds timeout) = 0;

    virtual void close() = 0;
};

using ConnectResult = std::variant<std::unique_ptr<Session>, TransportError>;

// Opens sessions to devices. The connection timeout belongs to the
// implementation, not to the caller.
class Transport {
public:
    virtual ~Transport() = default;

    virtual ConnectResult connect(const std::string& address,
                                  const std::string& device_type,
                                  const Credentials& credentials) = 0;
};

} // namespace neighbormap

#endif // NEIGHBORMAP_TRANSPORT_HPP
