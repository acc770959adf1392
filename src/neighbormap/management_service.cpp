#include "neighbormap/management_service.hpp"
#include "neighbormap/config_manager.hpp"
#include "neighbormap/tree_renderer.hpp"
#include "neighbormap/utils.hpp"

#include <sstream> // For std::ostringstream
#include <variant>

namespace neighbormap {

namespace {

std::optional<bool> parse_on_off(const std::string& value) {
    std::string lowered = utils::to_lower(value);
    if (lowered == "on" || lowered == "true" || lowered == "yes" || lowered == "enable") return true;
    if (lowered == "off" || lowered == "false" || lowered == "no" || lowered == "disable") return false;
    return std::nullopt;
}

const char* on_off(bool value) {
    return value ? "on" : "off";
}

} // namespace

ManagementService::ManagementService(MapperLogger& logger, ManagementInterface& mi, DeviceClassifier& classifier,
                                     Transport& transport, const ConfigManager& config)
    : logger_(logger),
      management_interface_(mi),
      classifier_(classifier),
      discoverer_(classifier, transport, logger, DiscoverySettings::from_config(config)),
      filters_(CrawlFilters::from_config(config)) {
    if (auto depth = config.get_parameter_as<int>("discovery.max_depth"); depth && *depth >= 0) {
        default_max_depth_ = *depth;
    }
}

std::optional<std::string> ManagementService::run_discovery(const std::string& seed_address,
                                                            const std::string& device_type,
                                                            const Credentials& credentials,
                                                            int max_depth) {
    logger_.info("MGMT", "Discovery request: seed=" + seed_address + ", type=" + device_type +
                         ", user=" + credentials.username + ", depth=" + std::to_string(max_depth));

    DiscoveryResult result = discoverer_.discover(seed_address, device_type, credentials, max_depth, filters_);
    last_visited_ = discoverer_.visited();

    if (const auto* failure = std::get_if<DiscoveryError>(&result)) {
        logger_.error("MGMT", "Discovery error: " + failure->message);
        last_topology_.reset();
        return failure->message;
    }

    last_topology_ = std::move(std::get<Topology>(result));
    logger_.info("MGMT", "Discovery complete: " + std::to_string(last_topology_->device_count()) + " devices, " +
                         std::to_string(last_topology_->unique_link_count()) + " links");
    return std::nullopt;
}

std::string ManagementService::handle_discover_command(const std::vector<std::string>& args) {
    if (args.size() < 4 || args.size() > 5) {
        return "Error: Usage: discover <seed_ip> <device_type> <username> <password> [max_depth]";
    }

    int max_depth = default_max_depth_;
    if (args.size() == 5) {
        auto depth = utils::safe_stoi(args[4]);
        if (!depth || *depth < 0) {
            return "Error: Invalid max depth '" + args[4] + "'.";
        }
        max_depth = *depth;
    }

    auto error = run_discovery(args[0], args[1], Credentials{args[2], args[3]}, max_depth);
    if (error) {
        return "Discovery failed: " + *error;
    }

    std::ostringstream oss;
    oss << render_topology_tree(*last_topology_) << "\n\n" << show_summary_cli();
    return oss.str();
}

std::string ManagementService::show_topology_cli(const std::vector<std::string>& args) const {
    if (!last_topology_) {
        return "No discovery has been run.";
    }
    if (args.size() > 1) {
        return "Error: Usage: show topology [root_device]";
    }
    if (args.empty()) {
        return render_topology_tree(*last_topology_);
    }
    return render_topology_tree(*last_topology_, args[0]);
}

std::string ManagementService::show_devices_cli() const {
    if (!last_topology_) {
        return "No discovery has been run.";
    }
    std::ostringstream oss;
    for (const std::string& hostname : last_topology_->insertion_order()) {
        const Device* device = last_topology_->find_device(hostname);
        if (!device) continue;
        oss << hostname << ":\n";
        oss << "  IP: " << device->mgmt_ip.value_or("-") << "\n";
        oss << "  Type: " << device->device_type.value_or("-") << "\n";
        oss << "  Platform: " << device->platform.value_or("-") << "\n";
        oss << "  Links: " << device->links.size() << "\n";
        for (const Link& link : device->links) {
            oss << "    -> " << link.remote_device << " (" << link.protocols_label() << ")\n";
        }
    }
    return oss.str();
}

std::string ManagementService::show_summary_cli() const {
    if (!last_topology_) {
        return "No discovery has been run.";
    }
    std::ostringstream oss;
    oss << "Summary:\n";
    oss << "  Devices: " << last_topology_->device_count() << "\n";
    oss << "  Links: " << last_topology_->unique_link_count() << "\n";
    oss << "  Visited (" << last_visited_.size() << "): " << utils::join(last_visited_, ", ");
    for (const DiscoveryError& error : discoverer_.node_errors()) {
        oss << "\n  Unreachable: " << error.address << " (" << to_string(error.kind) << "): " << error.message;
    }
    return oss.str();
}

std::string ManagementService::show_filters_cli() const {
    std::ostringstream oss;
    oss << "Crawl filters:\n";
    oss << "  routers:       " << on_off(filters_.include_routers) << "\n";
    oss << "  switches:      " << on_off(filters_.include_switches) << "\n";
    oss << "  phones:        " << on_off(filters_.include_phones) << "\n";
    oss << "  servers:       " << on_off(filters_.include_servers) << "\n";
    oss << "  access-points: " << on_off(filters_.include_access_points) << "\n";
    oss << "  other:         " << on_off(filters_.include_other);
    return oss.str();
}

std::string ManagementService::handle_set_filter_command(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return "Error: Usage: set filter <routers|switches|phones|servers|access-points|other> <on|off>";
    }
    auto category = category_from_string(args[0]);
    if (!category) {
        return "Error: Unknown category '" + args[0] + "'.";
    }
    auto enabled = parse_on_off(args[1]);
    if (!enabled) {
        return "Error: Expected 'on' or 'off', got '" + args[1] + "'.";
    }
    filters_.set(*category, *enabled);
    logger_.info("MGMT", "Filter " + to_string(*category) + " set to " + on_off(*enabled));
    return "Filter " + to_string(*category) + " " + on_off(*enabled) + ".";
}

std::string ManagementService::show_device_types_cli() const {
    const ClassifierConfig& config = classifier_.config();
    std::ostringstream oss;
    oss << "Device types (in match order):";
    bool default_listed = false;
    for (std::size_t i = 0; i < config.profiles.size(); ++i) {
        const DeviceTypeProfile& profile = config.profiles[i];
        oss << "\n  " << (i + 1) << ". " << profile.id << " (priority " << profile.priority << ")";
        if (profile.id == config.default_device_type) {
            oss << " [default]";
            default_listed = true;
        }
    }
    if (!default_listed) {
        oss << "\n  Default: " << config.default_device_type;
    }
    return oss.str();
}

std::string ManagementService::help_cli() const {
    std::ostringstream oss;
    oss << "Available commands:";
    for (const std::string& line : management_interface_.usage_lines()) {
        oss << "\n  " << line;
    }
    return oss.str();
}

void ManagementService::register_cli_commands() {
    management_interface_.register_command(
        {"discover"},
        [this](const std::vector<std::string>& args) { return this->handle_discover_command(args); },
        "discover <seed_ip> <device_type> <username> <password> [max_depth]");

    management_interface_.register_command(
        {"show", "topology"},
        [this](const std::vector<std::string>& args) { return this->show_topology_cli(args); },
        "show topology [root_device]");

    management_interface_.register_command(
        {"show", "devices"},
        [this](const std::vector<std::string>&) { return this->show_devices_cli(); },
        "show devices");

    management_interface_.register_command(
        {"show", "summary"},
        [this](const std::vector<std::string>&) { return this->show_summary_cli(); },
        "show summary");

    management_interface_.register_command(
        {"show", "filters"},
        [this](const std::vector<std::string>&) { return this->show_filters_cli(); },
        "show filters");

    management_interface_.register_command(
        {"set", "filter"},
        [this](const std::vector<std::string>& args) { return this->handle_set_filter_command(args); },
        "set filter <category> <on|off>");

    management_interface_.register_command(
        {"show", "device-types"},
        [this](const std::vector<std::string>&) { return this->show_device_types_cli(); },
        "show device-types");

    management_interface_.register_command(
        {"reload", "patterns"},
        [this](const std::vector<std::string>&) {
            if (!this->classifier_.reload_patterns()) {
                return std::string("Error: Could not reload device type patterns; built-in defaults are active.");
            }
            return "Device type patterns reloaded (" +
                   std::to_string(this->classifier_.config().profiles.size()) + " profiles).";
        },
        "reload patterns");

    management_interface_.register_command(
        {"help"},
        [this](const std::vector<std::string>&) { return this->help_cli(); },
        "help");
}

} // namespace neighbormap
