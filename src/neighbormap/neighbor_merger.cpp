#include "neighbormap/neighbor_merger.hpp"
#include "neighbormap/logger.hpp"

#include <map>
#include <string>

namespace neighbormap {

NeighborMerger::NeighborMerger(const MapperLogger& logger)
    : logger_(logger) {
}

std::vector<NeighborRecord> NeighborMerger::merge(const std::vector<NeighborRecord>& cdp_neighbors,
                                                  const std::vector<NeighborRecord>& lldp_neighbors) const {
    std::vector<NeighborRecord> merged;
    std::map<std::string, size_t> index_by_key; // key -> position in merged

    for (const NeighborRecord& neighbor : cdp_neighbors) {
        const std::string& key = neighbor.merge_key();
        if (key.empty()) {
            logger_.debug("MERGE", "Dropping CDP record without name or IP");
            continue;
        }

        NeighborRecord entry = neighbor;
        entry.protocols = {DiscoveryProtocol::CDP};

        auto it = index_by_key.find(key);
        if (it != index_by_key.end()) {
            // Repeated key within CDP: later block wins, first position kept
            merged[it->second] = entry;
        } else {
            index_by_key[key] = merged.size();
            merged.push_back(entry);
        }
    }

    for (const NeighborRecord& neighbor : lldp_neighbors) {
        const std::string& key = neighbor.merge_key();
        if (key.empty()) {
            logger_.debug("MERGE", "Dropping LLDP record without name or IP");
            continue;
        }

        auto it = index_by_key.find(key);
        if (it == index_by_key.end()) {
            NeighborRecord entry = neighbor;
            entry.protocols = {DiscoveryProtocol::LLDP};
            index_by_key[key] = merged.size();
            merged.push_back(entry);
            continue;
        }

        NeighborRecord& existing = merged[it->second];
        if (existing.remote_ip.empty()) {
            existing.remote_ip = neighbor.remote_ip;
        }
        if (existing.remote_interface.empty()) {
            existing.remote_interface = neighbor.remote_interface;
        }
        if (existing.local_interface.empty()) {
            existing.local_interface = neighbor.local_interface;
        }
        if (!existing.learned_via(DiscoveryProtocol::LLDP)) {
            existing.protocols.push_back(DiscoveryProtocol::LLDP);
        }

        if (!neighbor.system_description.empty()) {
            existing.system_description = neighbor.system_description;
        }
    }

    logger_.info("MERGE", "Merged to " + std::to_string(merged.size()) + " unique neighbors");
    return merged;
}

} // namespace neighbormap
