#include "neighbormap/topology_discoverer.hpp"
#include "neighbormap/config_manager.hpp"
#include "neighbormap/logger.hpp"
#include "neighbormap/utils.hpp"

#include <exception>
#include <memory>

namespace neighbormap {

DiscoverySettings DiscoverySettings::from_config(const ConfigManager& config) {
    DiscoverySettings settings;
    if (auto cdp = config.get_string("discovery.cdp_command"); cdp && !cdp->empty()) {
        settings.cdp_command = *cdp;
    }
    if (auto lldp = config.get_string("discovery.lldp_command"); lldp && !lldp->empty()) {
        settings.lldp_command = *lldp;
    }
    if (auto timeout = config.get_parameter_as<int>("discovery.command_timeout_seconds"); timeout && *timeout > 0) {
        settings.command_timeout = std::chrono::seconds(*timeout);
    }
    return settings;
}

TopologyDiscoverer::TopologyDiscoverer(const DeviceClassifier& classifier,
                                       Transport& transport,
                                       const MapperLogger& logger,
                                       DiscoverySettings settings)
    : classifier_(classifier),
      transport_(transport),
      logger_(logger),
      settings_(std::move(settings)),
      cdp_parser_(logger),
      lldp_parser_(logger),
      merger_(logger) {
}

std::string TopologyDiscoverer::hostname_from_prompt(const std::string& prompt) {
    std::string name = prompt;
    while (!name.empty() && (name.back() == '#' || name.back() == '>')) {
        name.pop_back();
    }
    return utils::trim(name);
}

DiscoveryResult TopologyDiscoverer::discover(const std::string& seed_address,
                                             const std::string& seed_device_type,
                                             const Credentials& credentials,
                                             int max_depth,
                                             const CrawlFilters& filters) {
    Topology topology;
    visited_.clear();
    visit_order_.clear();
    node_errors_.clear();
    cancel_requested_.store(false);

    if (max_depth < 0) {
        return DiscoveryError{ErrorKind::GENERIC_ERROR, seed_address,
                              "Invalid max depth " + std::to_string(max_depth)};
    }

    std::deque<FrontierEntry> frontier;
    frontier.push_back({seed_address, seed_device_type, 0});
    logger_.info("DISCOVERY", "Starting discovery from " + seed_address + " (type: " + seed_device_type +
                              ", max depth " + std::to_string(max_depth) + ")");

    while (!frontier.empty()) {
        if (cancel_requested_.load()) {
            logger_.warning("DISCOVERY", "Discovery cancelled with " + std::to_string(frontier.size()) +
                                         " frontier entries left");
            break;
        }

        FrontierEntry entry = frontier.front();
        frontier.pop_front();

        if (visited_.count(entry.address) > 0 || entry.depth > max_depth) {
            continue;
        }
        visited_.insert(entry.address);
        visit_order_.push_back(entry.address);
        logger_.info("DISCOVERY", "Discovering " + entry.address + " at depth " + std::to_string(entry.depth));

        const bool is_seed = visit_order_.size() == 1;
        DiscoveryError error;
        bool polled = false;
        try {
            polled = poll_node(entry, credentials, filters, topology, frontier, error);
        } catch (const std::exception& e) {
            error = DiscoveryError{ErrorKind::GENERIC_ERROR, entry.address,
                                   "Unexpected error discovering " + entry.address + ": " + e.what()};
        }

        if (!polled) {
            if (is_seed) {
                logger_.error("DISCOVERY", "Seed " + entry.address + " unreachable (" + to_string(error.kind) +
                                           "): " + error.message);
                return error;
            }
            logger_.log_node_failure(entry.address, error.message);
            node_errors_.push_back(error);
        }
    }

    logger_.log_crawl_stats(topology.device_count(), visit_order_.size(), node_errors_.size());
    return DiscoveryResult(std::move(topology));
}

bool TopologyDiscoverer::poll_node(const FrontierEntry& entry, const Credentials& credentials,
                                   const CrawlFilters& filters, Topology& topology,
                                   std::deque<FrontierEntry>& frontier, DiscoveryError& error) {
    ConnectResult connected = transport_.connect(entry.address, entry.device_type, credentials);
    if (const auto* failure = std::get_if<TransportError>(&connected)) {
        error = DiscoveryError{failure->kind, entry.address, failure->message};
        return false;
    }
    std::unique_ptr<Session> session = std::move(std::get<std::unique_ptr<Session>>(connected));
    if (!session) {
        error = DiscoveryError{ErrorKind::CONNECTION_ERROR, entry.address,
                               "Transport returned no session for " + entry.address};
        return false;
    }

    try {
        std::string hostname = hostname_from_prompt(session->identity());
        if (hostname.empty()) {
            logger_.warning("DISCOVERY", "Empty prompt from " + entry.address + ", using the address as its name");
            hostname = entry.address;
        }
        logger_.info("DISCOVERY", "Connected to " + hostname + " (" + entry.address + ")");
        topology.register_polled_device(hostname, entry.address, entry.device_type);

        for (const NeighborRecord& neighbor : collect_neighbors(*session, hostname)) {
            Link link;
            link.local_device = hostname;
            link.local_interface = neighbor.local_interface.empty() ? "?" : neighbor.local_interface;
            link.remote_device = neighbor.merge_key();
            link.remote_interface = neighbor.remote_interface.empty() ? "?" : neighbor.remote_interface;
            if (!neighbor.remote_ip.empty()) {
                link.remote_ip = neighbor.remote_ip;
            }
            link.protocols = neighbor.protocols;
            topology.add_link(link);

            std::optional<std::string> neighbor_type = classifier_.classify_neighbor(neighbor, filters);
            if (neighbor_type && !neighbor.remote_ip.empty()) {
                if (visited_.count(neighbor.remote_ip) == 0) {
                    frontier.push_back({neighbor.remote_ip, *neighbor_type, entry.depth + 1});
                    logger_.log_neighbor_queued(link.remote_device, neighbor.remote_ip, *neighbor_type,
                                                entry.depth + 1);
                }
            } else {
                logger_.log_neighbor_skipped(link.remote_device,
                                             "type=" + neighbor_type.value_or("none") +
                                             ", ip=" + (neighbor.remote_ip.empty() ? "none" : neighbor.remote_ip));
            }
        }
    } catch (...) {
        session->close();
        throw;
    }

    session->close();
    return true;
}

std::vector<NeighborRecord> TopologyDiscoverer::collect_neighbors(Session& session, const std::string& hostname) const {
    std::vector<NeighborRecord> cdp_neighbors;
    std::vector<NeighborRecord> lldp_neighbors;

    try {
        CommandResult cdp_output = session.run(settings_.cdp_command, settings_.command_timeout);
        if (const auto* text = std::get_if<std::string>(&cdp_output)) {
            cdp_neighbors = cdp_parser_.parse(*text);
            logger_.info("DISCOVERY", "Found " + std::to_string(cdp_neighbors.size()) + " CDP neighbors on " + hostname);
        } else {
            logger_.warning("DISCOVERY", "CDP discovery failed on " + hostname + ": " +
                                         std::get<TransportError>(cdp_output).message);
        }
    } catch (const std::exception& e) {
        logger_.warning("DISCOVERY", "CDP discovery failed on " + hostname + ": " + e.what());
    }

    try {
        CommandResult lldp_output = session.run(settings_.lldp_command, settings_.command_timeout);
        if (const auto* text = std::get_if<std::string>(&lldp_output)) {
            lldp_neighbors = lldp_parser_.parse(*text);
            logger_.info("DISCOVERY", "Found " + std::to_string(lldp_neighbors.size()) + " LLDP neighbors on " + hostname);
        } else {
            logger_.warning("DISCOVERY", "LLDP discovery failed on " + hostname + ": " +
                                         std::get<TransportError>(lldp_output).message);
        }
    } catch (const std::exception& e) {
        logger_.warning("DISCOVERY", "LLDP discovery failed on " + hostname + ": " + e.what());
    }

    return merger_.merge(cdp_neighbors, lldp_neighbors);
}

} // namespace neighbormap
