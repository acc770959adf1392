#ifndef NEIGHBORMAP_SIMULATED_TRANSPORT_HPP
#define NEIGHBORMAP_SIMULATED_TRANSPORT_HPP

#include "neighbormap/transport.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <chrono>
#include <cstddef>

namespace neighbormap {

class MapperLogger;

// Canned answers for one lab device.
struct SimulatedDevice {
    std::string hostname;
    std::string cdp_output;
    std::string lldp_output;
};

// In-memory stand-in for SSH: every registered address answers the neighbor
// commands with stored text. Faults can be injected per address.
class SimulatedTransport : public Transport {
public:
    explicit SimulatedTransport(const MapperLogger& logger,
                                std::chrono::seconds connect_timeout = std::chrono::seconds(15));
    ~SimulatedTransport() override;

    void add_device(const std::string& address, SimulatedDevice device);
    bool has_device(const std::string& address) const;
    std::vector<std::string> addresses() const;

    // Every later connect to `address` fails with `kind`.
    void fail_connect(const std::string& address, ErrorKind kind);

    // Commands on `address` containing `command_fragment` fail.
    void fail_command(const std::string& address, const std::string& command_fragment);

    // When set, connects with other credentials fail authentication.
    void require_credentials(const Credentials& credentials);

    ConnectResult connect(const std::string& address,
                          const std::string& device_type,
                          const Credentials& credentials) override;

    // Addresses in the order connect() was called for them.
    const std::vector<std::string>& connect_log() const { return connect_log_; }
    std::size_t open_session_count() const { return open_sessions_; }
    std::size_t max_concurrent_sessions() const { return max_open_sessions_; }

private:
    friend class SimulatedSession;

    const MapperLogger& logger_;
    std::chrono::seconds connect_timeout_;
    std::map<std::string, SimulatedDevice> devices_;
    std::map<std::string, ErrorKind> connect_faults_;
    std::map<std::string, std::set<std::string>> command_faults_;
    std::optional<Credentials> required_credentials_;
    std::vector<std::string> connect_log_;
    std::size_t open_sessions_ = 0;
    std::size_t max_open_sessions_ = 0;

    void on_session_closed();
};

// Installs the seven-device lab (core, distribution and access switches, an
// IP phone and an access point) on 192.168.1.0/24. Seed: 192.168.1.1.
void load_demo_network(SimulatedTransport& transport);

} // namespace neighbormap

#endif // NEIGHBORMAP_SIMULATED_TRANSPORT_HPP
