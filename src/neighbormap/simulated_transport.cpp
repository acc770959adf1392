#include "neighbormap/simulated_transport.hpp"
#include "neighbormap/logger.hpp"
#include "neighbormap/utils.hpp"

#include <algorithm> // For std::max
#include <utility>   // For std::move

namespace neighbormap {

class SimulatedSession : public Session {
public:
    SimulatedSession(SimulatedTransport& owner, std::string address, SimulatedDevice device)
        : owner_(owner), address_(std::move(address)), device_(std::move(device)) {}

    ~SimulatedSession() override {
        close();
    }

    std::string identity() override {
        return device_.hostname + "#";
    }

    CommandResult run(const std::string& command, std::chrono::seconds timeout) override {
        if (closed_) {
            return TransportError{ErrorKind::CONNECTION_ERROR, "Session to " + address_ + " is closed"};
        }
        owner_.logger_.info("MOCK", "Executing: " + command + " on " + device_.hostname +
                                    " (timeout " + std::to_string(timeout.count()) + "s)");

        auto fault_it = owner_.command_faults_.find(address_);
        if (fault_it != owner_.command_faults_.end()) {
            for (const std::string& fragment : fault_it->second) {
                if (utils::contains(command, fragment)) {
                    return TransportError{ErrorKind::GENERIC_ERROR,
                                          "Command '" + command + "' failed on " + device_.hostname};
                }
            }
        }

        std::string lowered = utils::to_lower(command);
        if (utils::contains(lowered, "cdp")) {
            return device_.cdp_output;
        }
        if (utils::contains(lowered, "lldp")) {
            return device_.lldp_output;
        }
        return std::string();
    }

    void close() override {
        if (closed_) return;
        closed_ = true;
        owner_.logger_.info("MOCK", "Disconnected from " + device_.hostname);
        owner_.on_session_closed();
    }

private:
    SimulatedTransport& owner_;
    std::string address_;
    SimulatedDevice device_;
    bool closed_ = false;
};

SimulatedTransport::SimulatedTransport(const MapperLogger& logger, std::chrono::seconds connect_timeout)
    : logger_(logger), connect_timeout_(connect_timeout) {
}

SimulatedTransport::~SimulatedTransport() = default;

void SimulatedTransport::add_device(const std::string& address, SimulatedDevice device) {
    devices_[address] = std::move(device);
}

bool SimulatedTransport::has_device(const std::string& address) const {
    return devices_.count(address) > 0;
}

std::vector<std::string> SimulatedTransport::addresses() const {
    std::vector<std::string> result;
    for (const auto& pair : devices_) {
        result.push_back(pair.first);
    }
    return result;
}

void SimulatedTransport::fail_connect(const std::string& address, ErrorKind kind) {
    connect_faults_[address] = kind;
}

void SimulatedTransport::fail_command(const std::string& address, const std::string& command_fragment) {
    command_faults_[address].insert(command_fragment);
}

void SimulatedTransport::require_credentials(const Credentials& credentials) {
    required_credentials_ = credentials;
}

ConnectResult SimulatedTransport::connect(const std::string& address,
                                          const std::string& device_type,
                                          const Credentials& credentials) {
    connect_log_.push_back(address);

    auto fault_it = connect_faults_.find(address);
    if (fault_it != connect_faults_.end()) {
        switch (fault_it->second) {
            case ErrorKind::TIMEOUT:
                return TransportError{ErrorKind::TIMEOUT, "Connection timeout to " + address +
                                      " after " + std::to_string(connect_timeout_.count()) + "s"};
            case ErrorKind::AUTHENTICATION_FAILURE:
                return TransportError{ErrorKind::AUTHENTICATION_FAILURE, "Authentication failed to " + address};
            case ErrorKind::CONNECTION_ERROR:
                return TransportError{ErrorKind::CONNECTION_ERROR, "Connection error to " + address};
            default:
                return TransportError{ErrorKind::GENERIC_ERROR, "Unexpected error connecting to " + address};
        }
    }

    auto device_it = devices_.find(address);
    if (device_it == devices_.end()) {
        return TransportError{ErrorKind::CONNECTION_ERROR,
                              "Mock device " + address + " not found. Available: " + utils::join(addresses(), ", ")};
    }

    if (required_credentials_ &&
        (required_credentials_->username != credentials.username ||
         required_credentials_->password != credentials.password)) {
        return TransportError{ErrorKind::AUTHENTICATION_FAILURE, "Authentication failed to " + address};
    }

    ++open_sessions_;
    max_open_sessions_ = std::max(max_open_sessions_, open_sessions_);
    logger_.info("MOCK", "Connected to " + device_it->second.hostname + " (" + address + ") as " + device_type);
    return std::unique_ptr<Session>(new SimulatedSession(*this, address, device_it->second));
}

void SimulatedTransport::on_session_closed() {
    if (open_sessions_ > 0) {
        --open_sessions_;
    }
}

} // namespace neighbormap
