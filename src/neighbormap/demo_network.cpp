#include "neighbormap/simulated_transport.hpp"

namespace neighbormap {

namespace {

SimulatedDevice core_sw_01() {
    SimulatedDevice device;
    device.hostname = "CORE-SW-01";
    device.cdp_output = R"CLI(
Device ID: DIST-SW-01
Entry address(es): 
  IP address: 192.168.1.10
Platform: cisco WS-C3750X-48,  Capabilities: Router Switch IGMP 
Interface: GigabitEthernet1/0/1,  Port ID (outgoing port): GigabitEthernet1/0/48
Holdtime : 164 sec

Version :
Cisco IOS Software, C3750E Software (C3750E-UNIVERSALK9-M), Version 15.2(4)E8

-------------------------
Device ID: DIST-SW-02
Entry address(es): 
  IP address: 192.168.1.11
Platform: cisco WS-C3750X-48,  Capabilities: Router Switch IGMP 
Interface: GigabitEthernet1/0/2,  Port ID (outgoing port): GigabitEthernet1/0/48
Holdtime : 142 sec

Version :
Cisco IOS Software, C3750E Software (C3750E-UNIVERSALK9-M), Version 15.2(4)E8
)CLI";
    device.lldp_output = R"CLI(
------------------------------------------------
Chassis id: aabb.cc00.1122
Port id: Gi1/0/48
Port Description: GigabitEthernet1/0/48
System Name: DIST-SW-01

System Description: 
Cisco IOS Software, C3750E Software (C3750E-UNIVERSALK9-M), Version 15.2(4)E8

Time remaining: 112 seconds
System Capabilities: B,R
Enabled Capabilities: R
Management Addresses:
    IP: 192.168.1.10
Auto Negotiation - supported, enabled
Physical media capabilities:
    1000baseT(FD)
Vlan ID: 1

Local Port id: Gi1/0/1

------------------------------------------------
Chassis id: aabb.cc00.3344
Port id: Gi1/0/48
Port Description: GigabitEthernet1/0/48
System Name: DIST-SW-02

System Description: 
Cisco IOS Software, C3750E Software (C3750E-UNIVERSALK9-M), Version 15.2(4)E8

Time remaining: 97 seconds
System Capabilities: B,R
Enabled Capabilities: R
Management Addresses:
    IP: 192.168.1.11
Auto Negotiation - supported, enabled
Physical media capabilities:
    1000baseT(FD)
Vlan ID: 1

Local Port id: Gi1/0/2
)CLI";
    return device;
}

SimulatedDevice dist_sw_01() {
    SimulatedDevice device;
    device.hostname = "DIST-SW-01";
    device.cdp_output = R"CLI(
Device ID: CORE-SW-01
Entry address(es): 
  IP address: 192.168.1.1
Platform: cisco WS-C4500X-32,  Capabilities: Router Switch IGMP 
Interface: GigabitEthernet1/0/48,  Port ID (outgoing port): GigabitEthernet1/0/1
Holdtime : 171 sec

Version :
Cisco IOS Software, IOS-XE Software, Catalyst 4500 L3 Switch

-------------------------
Device ID: ACCESS-SW-01
Entry address(es): 
  IP address: 192.168.1.20
Platform: cisco WS-C2960X-48,  Capabilities: Switch IGMP 
Interface: GigabitEthernet1/0/10,  Port ID (outgoing port): GigabitEthernet0/1
Holdtime : 158 sec

Version :
Cisco IOS Software, C2960X Software

-------------------------
Device ID: ACCESS-SW-02
Entry address(es): 
  IP address: 192.168.1.21
Platform: cisco WS-C2960X-48,  Capabilities: Switch IGMP 
Interface: GigabitEthernet1/0/11,  Port ID (outgoing port): GigabitEthernet0/1
Holdtime : 145 sec

Version :
Cisco IOS Software, C2960X Software

-------------------------
Device ID: SEP001122334455
Entry address(es): 
  IP address: 192.168.1.100
Platform: Cisco IP Phone 7965,  Capabilities: Host Phone 
Interface: GigabitEthernet1/0/5,  Port ID (outgoing port): Port 1
Holdtime : 132 sec

Version :
SCCP75.9-4-2SR3-1S

-------------------------
Device ID: AP-OFFICE-01
Entry address(es): 
  IP address: 192.168.1.50
Platform: Cisco AIR-AP3802I-B-K9,  Capabilities: Trans-Bridge 
Interface: GigabitEthernet1/0/15,  Port ID (outgoing port): GigabitEthernet0
Holdtime : 125 sec

Version :
Cisco IOS Software, AP3800 Software
)CLI";
    device.lldp_output = R"CLI(
------------------------------------------------
Chassis id: 1122.3344.5566
Port id: Gi1/0/1
Port Description: GigabitEthernet1/0/1
System Name: CORE-SW-01

System Description: 
Cisco IOS Software, IOS-XE Software, Catalyst 4500 L3 Switch

Time remaining: 115 seconds
System Capabilities: B,R
Enabled Capabilities: R
Management Addresses:
    IP: 192.168.1.1
Auto Negotiation - supported, enabled
Physical media capabilities:
    1000baseT(FD)
Vlan ID: 1

Local Port id: Gi1/0/48
)CLI";
    return device;
}

SimulatedDevice dist_sw_02() {
    SimulatedDevice device;
    device.hostname = "DIST-SW-02";
    device.cdp_output = R"CLI(
Device ID: CORE-SW-01
Entry address(es): 
  IP address: 192.168.1.1
Platform: cisco WS-C4500X-32,  Capabilities: Router Switch IGMP 
Interface: GigabitEthernet1/0/48,  Port ID (outgoing port): GigabitEthernet1/0/2
Holdtime : 165 sec

Version :
Cisco IOS Software, IOS-XE Software, Catalyst 4500 L3 Switch
)CLI";
    device.lldp_output = R"CLI(
------------------------------------------------
Chassis id: 1122.3344.5566
Port id: Gi1/0/2
Port Description: GigabitEthernet1/0/2
System Name: CORE-SW-01

System Description: 
Cisco IOS Software, IOS-XE Software, Catalyst 4500 L3 Switch

Time remaining: 108 seconds
System Capabilities: B,R
Enabled Capabilities: R
Management Addresses:
    IP: 192.168.1.1
Auto Negotiation - supported, enabled
Physical media capabilities:
    1000baseT(FD)
Vlan ID: 1

Local Port id: Gi1/0/48
)CLI";
    return device;
}

SimulatedDevice access_sw_01() {
    SimulatedDevice device;
    device.hostname = "ACCESS-SW-01";
    device.cdp_output = R"CLI(
Device ID: DIST-SW-01
Entry address(es): 
  IP address: 192.168.1.10
Platform: cisco WS-C3750X-48,  Capabilities: Router Switch IGMP 
Interface: GigabitEthernet0/1,  Port ID (outgoing port): GigabitEthernet1/0/10
Holdtime : 152 sec

Version :
Cisco IOS Software, C3750E Software (C3750E-UNIVERSALK9-M), Version 15.2(4)E8
)CLI";
    device.lldp_output = R"CLI(
------------------------------------------------
Chassis id: aabb.cc00.1122
Port id: Gi1/0/10
Port Description: GigabitEthernet1/0/10
System Name: DIST-SW-01

System Description: 
Cisco IOS Software, C3750E Software (C3750E-UNIVERSALK9-M), Version 15.2(4)E8

Time remaining: 102 seconds
System Capabilities: B,R
Enabled Capabilities: R
Management Addresses:
    IP: 192.168.1.10
Auto Negotiation - supported, enabled
Physical media capabilities:
    1000baseT(FD)
Vlan ID: 1

Local Port id: Gi0/1
)CLI";
    return device;
}

SimulatedDevice access_sw_02() {
    SimulatedDevice device;
    device.hostname = "ACCESS-SW-02";
    device.cdp_output = R"CLI(
Device ID: DIST-SW-01
Entry address(es): 
  IP address: 192.168.1.10
Platform: cisco WS-C3750X-48,  Capabilities: Router Switch IGMP 
Interface: GigabitEthernet0/1,  Port ID (outgoing port): GigabitEthernet1/0/11
Holdtime : 149 sec

Version :
Cisco IOS Software, C3750E Software (C3750E-UNIVERSALK9-M), Version 15.2(4)E8
)CLI";
    device.lldp_output = std::string();
    return device;
}

SimulatedDevice ip_phone() {
    SimulatedDevice device;
    device.hostname = "SEP001122334455";
    device.cdp_output = R"CLI(
Device ID: DIST-SW-01
Entry address(es): 
  IP address: 192.168.1.10
Platform: cisco WS-C3750X-48,  Capabilities: Router Switch IGMP 
Interface: Port 1,  Port ID (outgoing port): GigabitEthernet1/0/5
Holdtime : 156 sec

Version :
Cisco IOS Software, C3750E Software (C3750E-UNIVERSALK9-M), Version 15.2(4)E8
)CLI";
    device.lldp_output = std::string();
    return device;
}

SimulatedDevice ap_office_01() {
    SimulatedDevice device;
    device.hostname = "AP-OFFICE-01";
    device.cdp_output = R"CLI(
Device ID: DIST-SW-01
Entry address(es): 
  IP address: 192.168.1.10
Platform: cisco WS-C3750X-48,  Capabilities: Router Switch IGMP 
Interface: GigabitEthernet0,  Port ID (outgoing port): GigabitEthernet1/0/15
Holdtime : 148 sec

Version :
Cisco IOS Software, C3750E Software (C3750E-UNIVERSALK9-M), Version 15.2(4)E8
)CLI";
    device.lldp_output = std::string();
    return device;
}

} // namespace

void load_demo_network(SimulatedTransport& transport) {
    transport.add_device("192.168.1.1", core_sw_01());
    transport.add_device("192.168.1.10", dist_sw_01());
    transport.add_device("192.168.1.11", dist_sw_02());
    transport.add_device("192.168.1.20", access_sw_01());
    transport.add_device("192.168.1.21", access_sw_02());
    transport.add_device("192.168.1.100", ip_phone());
    transport.add_device("192.168.1.50", ap_office_01());
}

} // namespace neighbormap
