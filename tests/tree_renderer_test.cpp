#include "gtest/gtest.h"
#include "neighbormap/tree_renderer.hpp"
#include "neighbormap/topology.hpp"

#include <string>
#include <vector>

using namespace neighbormap;

namespace {

Link make_link(const std::string& local, const std::string& local_if,
               const std::string& remote, const std::string& remote_if,
               std::optional<std::string> remote_ip = std::nullopt,
               std::vector<DiscoveryProtocol> protocols = {}) {
    Link link;
    link.local_device = local;
    link.local_interface = local_if;
    link.remote_device = remote;
    link.remote_interface = remote_if;
    link.remote_ip = remote_ip;
    link.protocols = protocols;
    return link;
}

std::size_t count_lines(const std::string& text) {
    std::size_t lines = 1;
    for (char c : text) {
        if (c == '\n') ++lines;
    }
    return lines;
}

} // namespace

TEST(TreeRendererTest, EmptyTopology) {
    Topology topology;
    EXPECT_EQ(render_topology_tree(topology), "No devices discovered");
}

TEST(TreeRendererTest, UnknownRoot) {
    Topology topology;
    topology.register_polled_device("A", std::string("10.0.0.1"), std::string("cisco_ios"));
    EXPECT_EQ(render_topology_tree(topology, std::string("GHOST")), "Root device 'GHOST' not found");
}

TEST(TreeRendererTest, SingleDevice) {
    Topology topology;
    topology.register_polled_device("A", std::string("10.0.0.1"), std::string("cisco_ios"));
    EXPECT_EQ(render_topology_tree(topology), "A (10.0.0.1)");
}

TEST(TreeRendererTest, RendersChain) {
    Topology topology;
    topology.register_polled_device("A", std::string("10.0.0.1"), std::string("cisco_ios"));
    topology.add_link(make_link("A", "Gi0/1", "B", "Gi0/2", std::string("10.0.0.2"), {DiscoveryProtocol::CDP}));
    topology.register_polled_device("B", std::string("10.0.0.2"), std::string("cisco_ios"));
    topology.add_link(make_link("B", "Gi0/3", "C", "Gi0/4", std::string("10.0.0.3"),
                                {DiscoveryProtocol::CDP, DiscoveryProtocol::LLDP}));

    const std::string expected =
        "A (10.0.0.1)\n"
        "   └─[CDP] Gi0/1 ↔ Gi0/2 (10.0.0.2)\n"
        "      B (10.0.0.2)\n"
        "         └─[CDP+LLDP] Gi0/3 ↔ Gi0/4 (10.0.0.3)\n"
        "            C";
    EXPECT_EQ(render_topology_tree(topology), expected);
}

TEST(TreeRendererTest, ChildrenAreSortedWithBranchGlyphs) {
    Topology topology;
    topology.register_polled_device("R", std::nullopt, std::nullopt);
    topology.add_link(make_link("R", "p3", "Z", "q3"));
    topology.add_link(make_link("R", "p2", "M", "q2"));
    topology.add_link(make_link("R", "p1", "A", "q1"));

    const std::string expected =
        "R\n"
        "   ├─ p1 ↔ q1\n"
        "   │  A\n"
        "   ├─ p2 ↔ q2\n"
        "   │  M\n"
        "   └─ p3 ↔ q3\n"
        "      Z";
    EXPECT_EQ(render_topology_tree(topology), expected);
}

TEST(TreeRendererTest, ReverseLinkIsDrawnWithSwappedInterfaces) {
    Topology topology;
    topology.register_polled_device("A", std::string("10.0.0.1"), std::string("cisco_ios"));
    topology.register_polled_device("B", std::string("10.0.0.2"), std::string("cisco_ios"));
    topology.add_link(make_link("B", "Gi0/2", "A", "Gi0/1", std::string("10.0.0.1"), {DiscoveryProtocol::LLDP}));

    const std::string expected =
        "A (10.0.0.1)\n"
        "   └─[LLDP] Gi0/1 ↔ Gi0/2 (10.0.0.2)\n"
        "      B (10.0.0.2)";
    EXPECT_EQ(render_topology_tree(topology), expected);
}

TEST(TreeRendererTest, TriangleKeepsLinkFromParentToEverySibling) {
    Topology topology;
    topology.register_polled_device("A", std::string("10.0.0.1"), std::string("cisco_ios"));
    topology.add_link(make_link("A", "Gi0/1", "B", "Gi0/1", std::nullopt, {DiscoveryProtocol::CDP}));
    topology.add_link(make_link("A", "Gi0/2", "C", "Gi0/1", std::nullopt, {DiscoveryProtocol::CDP}));
    topology.add_link(make_link("B", "Gi0/2", "C", "Gi0/2", std::nullopt, {DiscoveryProtocol::CDP}));

    // C was not drawn yet when A was reached, so A keeps its own link to C
    const std::string expected =
        "A (10.0.0.1)\n"
        "   ├─[CDP] Gi0/1 ↔ Gi0/1\n"
        "   │  B\n"
        "   │  │  └─[CDP] Gi0/2 ↔ Gi0/2\n"
        "   │  │     C\n"
        "   └─[CDP] Gi0/2 ↔ Gi0/1\n"
        "      C";
    EXPECT_EQ(render_topology_tree(topology), expected);
}

TEST(TreeRendererTest, CycleTerminates) {
    Topology topology;
    topology.register_polled_device("A", std::nullopt, std::nullopt);
    topology.add_link(make_link("A", "e1", "B", "e1"));
    topology.add_link(make_link("B", "e2", "C", "e2"));
    topology.add_link(make_link("C", "e3", "A", "e3"));

    std::string tree = render_topology_tree(topology);

    EXPECT_EQ(count_lines(tree), 7u);
    // A has no forward link to C; the reverse one is drawn with swapped sides
    EXPECT_NE(tree.find("\n   └─ e3 ↔ e3\n      C"), std::string::npos);
}

TEST(TreeRendererTest, ExplicitRoot) {
    Topology topology;
    topology.register_polled_device("A", std::string("10.0.0.1"), std::nullopt);
    topology.add_link(make_link("A", "Gi0/1", "B", "Gi0/2"));

    const std::string expected =
        "B\n"
        "   └─ Gi0/2 ↔ Gi0/1 (10.0.0.1)\n"
        "      A (10.0.0.1)";
    EXPECT_EQ(render_topology_tree(topology, std::string("B")), expected);
}

TEST(TreeRendererTest, DisconnectedDevicesAreLeftOut) {
    Topology topology;
    topology.register_polled_device("A", std::nullopt, std::nullopt);
    topology.register_polled_device("ISLAND", std::nullopt, std::nullopt);
    EXPECT_EQ(render_topology_tree(topology), "A");
}
