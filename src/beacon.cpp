#include "beacon.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <algorithm>

#include "address.hpp"

namespace {

std::vector<std::string> split_fields(const std::string& text, char delim) {
  std::vector<std::string> out;
  std::size_t start = 0;
  for(;;) {
    auto pos = text.find(delim, start);
    if(pos == std::string::npos) {
      out.push_back(text.substr(start));
      return out;
    }
    out.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

} // namespace

std::string encode_beacon(const BeaconInfo& info) {
  std::string name = info.display_name;
  std::replace(name.begin(), name.end(), '|', '/');
  return std::string(kBeaconMarker) + "|" + std::to_string(info.tcp_port) + "|" +
         name + "|" + info.instance_id;
}

std::optional<BeaconInfo> parse_beacon(const std::string& datagram) {
  if(datagram.size() > kMaxBeaconBytes) return std::nullopt;
  auto fields = split_fields(datagram, '|');
  if(fields.size() < 3 || fields[0] != kBeaconMarker) return std::nullopt;

  std::string error;
  auto port = parse_port(fields[1], error);
  if(!port) return std::nullopt;

  BeaconInfo info;
  info.tcp_port = *port;
  info.display_name = fields[2];
  if(fields.size() > 3) info.instance_id = fields[3];
  return info;
}

std::string ipv4_to_string(std::uint32_t address) {
  in_addr addr{};
  addr.s_addr = htonl(address);
  char buf[INET_ADDRSTRLEN] = {};
  if(!inet_ntop(AF_INET, &addr, buf, sizeof(buf))) return "0.0.0.0";
  return buf;
}

std::vector<InterfaceAddress> local_ipv4_interfaces() {
  std::vector<InterfaceAddress> out;
  ifaddrs* list = nullptr;
  if(getifaddrs(&list) != 0) return out;
  for(ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
    if(!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    InterfaceAddress entry;
    entry.name = it->ifa_name ? it->ifa_name : "";
    entry.address = ntohl(reinterpret_cast<const sockaddr_in*>(it->ifa_addr)->sin_addr.s_addr);
    entry.loopback = (it->ifa_flags & IFF_LOOPBACK) != 0;
    if(it->ifa_netmask && it->ifa_netmask->sa_family == AF_INET) {
      entry.netmask = ntohl(reinterpret_cast<const sockaddr_in*>(it->ifa_netmask)->sin_addr.s_addr);
      entry.has_netmask = true;
    }
    out.push_back(entry);
  }
  freeifaddrs(list);
  return out;
}

std::vector<std::string> broadcast_targets(const std::vector<InterfaceAddress>& interfaces) {
  std::vector<std::string> out;
  for(const auto& iface : interfaces) {
    if(iface.loopback || !iface.has_netmask) continue;
    auto target = ipv4_to_string(iface.address | ~iface.netmask);
    if(std::find(out.begin(), out.end(), target) == out.end()) {
      out.push_back(target);
    }
  }
  if(out.empty()) out.push_back("255.255.255.255");
  return out;
}
