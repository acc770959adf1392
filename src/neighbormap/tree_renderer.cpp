#include "neighbormap/tree_renderer.hpp"

#include <map>
#include <set>
#include <vector>
#include <utility> // For std::pair

namespace neighbormap {

namespace {

const std::string BRANCH_MID = "├─";
const std::string BRANCH_LAST = "└─";
const std::string INDENT_OPEN = "│  ";
const std::string INDENT_CLOSED = "   ";

// One edge as seen from the device it is drawn under.
struct EdgeView {
    std::string local_interface = "?";
    std::string remote_interface = "?";
    std::optional<std::string> remote_ip;
    std::string protocols;
};

using Adjacency = std::map<std::string, std::set<std::string>>;
using EdgeMap = std::map<std::pair<std::string, std::string>, EdgeView>;

EdgeView edge_between(const std::string& from, const std::string& to,
                      const EdgeMap& edges, const Topology& topology) {
    auto forward = edges.find({from, to});
    if (forward != edges.end()) {
        return forward->second;
    }
    EdgeView view;
    auto reverse = edges.find({to, from});
    if (reverse != edges.end()) {
        view.local_interface = reverse->second.remote_interface;
        view.remote_interface = reverse->second.local_interface;
        view.protocols = reverse->second.protocols;
    }
    if (const Device* device = topology.find_device(to)) {
        view.remote_ip = device->mgmt_ip;
    }
    return view;
}

std::string device_label(const std::string& name, const Topology& topology) {
    const Device* device = topology.find_device(name);
    if (device && device->mgmt_ip && !device->mgmt_ip->empty()) {
        return name + " (" + *device->mgmt_ip + ")";
    }
    return name;
}

// The node's unvisited neighbors are fixed on entry. A neighbor that an
// earlier sibling's subtree reaches first is still drawn under this node.
void render_node(const std::string& name, const std::string& prefix, bool is_last,
                 const Adjacency& adjacency, const EdgeMap& edges, const Topology& topology,
                 std::set<std::string>& visited, std::vector<std::string>& lines) {
    visited.insert(name);
    lines.push_back(prefix + device_label(name, topology));

    std::vector<std::string> children;
    auto it = adjacency.find(name);
    if (it != adjacency.end()) {
        for (const std::string& neighbor : it->second) { // std::set keeps names sorted
            if (visited.count(neighbor) == 0) {
                children.push_back(neighbor);
            }
        }
    }

    const std::string& own_indent = is_last ? INDENT_CLOSED : INDENT_OPEN;
    for (std::size_t i = 0; i < children.size(); ++i) {
        const std::string& child = children[i];
        const bool last_child = (i + 1 == children.size());
        EdgeView edge = edge_between(name, child, edges, topology);

        std::string line = prefix + own_indent + (last_child ? BRANCH_LAST : BRANCH_MID);
        if (!edge.protocols.empty()) {
            line += "[" + edge.protocols + "]";
        }
        line += " " + edge.local_interface + " ↔ " + edge.remote_interface;
        if (edge.remote_ip && !edge.remote_ip->empty()) {
            line += " (" + *edge.remote_ip + ")";
        }
        lines.push_back(line);

        render_node(child, prefix + own_indent + (last_child ? INDENT_CLOSED : INDENT_OPEN),
                    last_child, adjacency, edges, topology, visited, lines);
    }
}

} // namespace

std::string render_topology_tree(const Topology& topology, const std::optional<std::string>& root) {
    if (topology.empty()) {
        return "No devices discovered";
    }

    Adjacency adjacency;
    EdgeMap edges;
    for (const auto& entry : topology.devices()) {
        adjacency[entry.first];
        for (const Link& link : entry.second.links) {
            adjacency[link.local_device].insert(link.remote_device);
            adjacency[link.remote_device].insert(link.local_device);

            EdgeView view;
            view.local_interface = link.local_interface;
            view.remote_interface = link.remote_interface;
            view.remote_ip = link.remote_ip;
            view.protocols = link.protocols_label();
            edges[{link.local_device, link.remote_device}] = view; // Later links win
        }
    }

    std::string root_name = root ? *root : topology.insertion_order().front();
    if (adjacency.count(root_name) == 0) {
        return "Root device '" + root_name + "' not found";
    }

    std::set<std::string> visited;
    std::vector<std::string> lines;
    render_node(root_name, "", true, adjacency, edges, topology, visited, lines);

    std::string output;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) output += "\n";
        output += lines[i];
    }
    return output;
}

} // namespace neighbormap
