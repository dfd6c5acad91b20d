#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

inline constexpr const char* kBeaconMarker = "LANTERN";
inline constexpr std::size_t kMaxBeaconBytes = 1024;

struct BeaconInfo {
  std::uint16_t tcp_port = 0;
  std::string display_name;
  std::string instance_id;
};

// "LANTERN|<tcp_port>|<display_name>|<instance_id>". A '|' inside the display
// name is replaced by '/' so the field count stays fixed.
std::string encode_beacon(const BeaconInfo& info);

// Returns nullopt for foreign or malformed datagrams (wrong marker, port not
// numeric or outside 1-65535). Fields after the instance id are ignored.
std::optional<BeaconInfo> parse_beacon(const std::string& datagram);

struct InterfaceAddress {
  std::string name;
  std::uint32_t address = 0;   // host byte order
  std::uint32_t netmask = 0;
  bool loopback = false;
  bool has_netmask = false;
};

// IPv4 addresses of the local interfaces. Interfaces without an address are
// left out; a missing netmask is reported through has_netmask.
std::vector<InterfaceAddress> local_ipv4_interfaces();

// address | ~netmask for every non-loopback interface that has a netmask,
// deduplicated; 255.255.255.255 when none qualifies.
std::vector<std::string> broadcast_targets(const std::vector<InterfaceAddress>& interfaces);

std::string ipv4_to_string(std::uint32_t address);
