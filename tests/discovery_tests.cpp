#include "beacon.hpp"
#include "discovery_beacon.hpp"
#include "errors.hpp"
#include "peer_registry.hpp"
#include "test_runner_utils.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
using lantern::test::wait_for_condition;

std::shared_ptr<Logger> g_logger = std::make_shared<Logger>("discovery");

// Manually advanced clock for staleness tests.
struct FakeClock {
  PeerRegistry::Clock::time_point now = PeerRegistry::Clock::time_point(std::chrono::hours(1));

  PeerRegistry::NowFn fn() {
    return [this]{ return now; };
  }
};

std::uint32_t ipv4(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d) {
  return (std::uint32_t(a) << 24) | (std::uint32_t(b) << 16) | (std::uint32_t(c) << 8) | d;
}

bool test_beacon_encode_and_parse() {
  BeaconInfo info;
  info.tcp_port = 5000;
  info.display_name = "kitchen|laptop";
  info.instance_id = "a1b2c3";
  auto text = encode_beacon(info);
  LANTERN_EXPECT(text == "LANTERN|5000|kitchen/laptop|a1b2c3");

  auto parsed = parse_beacon(text);
  LANTERN_EXPECT(parsed.has_value());
  LANTERN_EXPECT(parsed->tcp_port == 5000);
  LANTERN_EXPECT(parsed->display_name == "kitchen/laptop");
  LANTERN_EXPECT(parsed->instance_id == "a1b2c3");

  // older nodes send no instance id; newer ones may append fields
  auto legacy = parse_beacon("LANTERN|6000|den");
  LANTERN_EXPECT(legacy && legacy->instance_id.empty());
  auto extended = parse_beacon("LANTERN|6000|den|id9|future-field");
  LANTERN_EXPECT(extended && extended->instance_id == "id9");
  return true;
}

bool test_beacon_rejects_malformed() {
  LANTERN_EXPECT(!parse_beacon(""));
  LANTERN_EXPECT(!parse_beacon("LANTERN"));
  LANTERN_EXPECT(!parse_beacon("LANTERN|5000"));
  LANTERN_EXPECT(!parse_beacon("OTHERAPP|5000|name|id"));
  LANTERN_EXPECT(!parse_beacon("LANTERN|99999|name|id"));
  LANTERN_EXPECT(!parse_beacon("LANTERN|0|name|id"));
  LANTERN_EXPECT(!parse_beacon("LANTERN|50a0|name|id"));
  LANTERN_EXPECT(!parse_beacon("LANTERN|-1|name|id"));
  LANTERN_EXPECT(!parse_beacon("LANTERN|5000|" + std::string(kMaxBeaconBytes, 'n')));
  return true;
}

bool test_broadcast_targets_from_interfaces() {
  std::vector<InterfaceAddress> interfaces;
  InterfaceAddress lo;
  lo.name = "lo";
  lo.address = ipv4(127, 0, 0, 1);
  lo.netmask = ipv4(255, 0, 0, 0);
  lo.has_netmask = true;
  lo.loopback = true;
  interfaces.push_back(lo);

  InterfaceAddress eth;
  eth.name = "eth0";
  eth.address = ipv4(192, 168, 1, 20);
  eth.netmask = ipv4(255, 255, 255, 0);
  eth.has_netmask = true;
  interfaces.push_back(eth);

  InterfaceAddress tun;
  tun.name = "tun0";
  tun.address = ipv4(10, 8, 0, 2);
  interfaces.push_back(tun);

  InterfaceAddress alias = eth;
  alias.name = "eth0:1";
  alias.address = ipv4(192, 168, 1, 21);
  interfaces.push_back(alias);

  auto targets = broadcast_targets(interfaces);
  LANTERN_EXPECT(targets.size() == 1);
  LANTERN_EXPECT(targets[0] == "192.168.1.255");

  auto fallback = broadcast_targets({lo, tun});
  LANTERN_EXPECT(fallback.size() == 1);
  LANTERN_EXPECT(fallback[0] == "255.255.255.255");
  return true;
}

bool test_registry_staleness() {
  FakeClock clock;
  PeerRegistry registry(std::chrono::seconds(15), clock.fn());
  LANTERN_EXPECT(registry.upsert("192.168.1.5", 5000, "den"));
  LANTERN_EXPECT(!registry.upsert("192.168.1.5", 5000, "den"));

  clock.now += std::chrono::seconds(10);
  LANTERN_EXPECT(registry.snapshot().size() == 1);
  // refreshed here, so it survives past the original deadline
  registry.upsert("192.168.1.5", 5000, "den-renamed");
  clock.now += std::chrono::seconds(10);
  auto peers = registry.snapshot();
  LANTERN_EXPECT(peers.size() == 1);
  LANTERN_EXPECT(peers[0].display_name == "den-renamed");

  clock.now += std::chrono::seconds(6);
  // stale records are hidden before the sweep removes them
  LANTERN_EXPECT(registry.snapshot().empty());
  LANTERN_EXPECT(registry.size() == 1);
  // a beacon from a stale peer counts as a new discovery
  LANTERN_EXPECT(registry.upsert("192.168.1.5", 5000, "den"));

  clock.now += std::chrono::seconds(16);
  LANTERN_EXPECT(registry.evict_stale() == 1);
  LANTERN_EXPECT(registry.size() == 0);
  return true;
}

bool test_registry_keys_and_order() {
  FakeClock clock;
  PeerRegistry registry(std::chrono::seconds(15), clock.fn());
  registry.upsert("192.168.1.9", 5000, "zeta");
  registry.upsert("192.168.1.7", 5000, "alpha");
  registry.upsert("192.168.1.3", 5000, "alpha");
  // two nodes on one host are distinct peers
  registry.upsert("192.168.1.3", 5002, "alpha");
  registry.upsert("fe80::1", 5000, "mu");

  auto peers = registry.snapshot();
  LANTERN_EXPECT(peers.size() == 5);
  LANTERN_EXPECT(peers[0].host == "192.168.1.3" && peers[0].port == 5000);
  LANTERN_EXPECT(peers[1].host == "192.168.1.3" && peers[1].port == 5002);
  LANTERN_EXPECT(peers[2].host == "192.168.1.7");
  LANTERN_EXPECT(peers[3].display_name == "mu");
  LANTERN_EXPECT(peers[3].key() == "[fe80::1]:5000");
  LANTERN_EXPECT(peers[4].display_name == "zeta");

  registry.clear();
  LANTERN_EXPECT(registry.snapshot().empty());
  return true;
}

bool test_handle_datagram_filters() {
  auto registry = std::make_shared<PeerRegistry>();
  DiscoveryBeacon::Options options;
  options.display_name = "self";
  options.instance_id = "me-123";
  DiscoveryBeacon beacon(registry, options, g_logger);

  LANTERN_EXPECT(!beacon.handle_datagram("LANTERN|5000|self|me-123", "192.168.1.2"));
  LANTERN_EXPECT(!beacon.handle_datagram("garbage", "192.168.1.3"));
  LANTERN_EXPECT(!beacon.handle_datagram("LANTERN|70000|bad|x", "192.168.1.4"));
  LANTERN_EXPECT(registry->size() == 0);

  LANTERN_EXPECT(beacon.handle_datagram("LANTERN|5005|garage|other-1", "192.168.1.5"));
  auto peers = registry->snapshot();
  LANTERN_EXPECT(peers.size() == 1);
  // host comes from the datagram source, port from the payload
  LANTERN_EXPECT(peers[0].host == "192.168.1.5");
  LANTERN_EXPECT(peers[0].port == 5005);
  LANTERN_EXPECT(peers[0].instance_id == "other-1");
  return true;
}

bool test_start_failures_throw() {
  auto registry = std::make_shared<PeerRegistry>();
  {
    DiscoveryBeacon::Options options;
    options.bind_ip = "not-an-address";
    options.udp_port = 0;
    DiscoveryBeacon beacon(registry, options, g_logger);
    bool thrown = false;
    try {
      beacon.start();
    } catch(const LanternError& e) {
      thrown = (e.code() == ErrorCode::InvalidArgument);
    }
    LANTERN_EXPECT(thrown);
    LANTERN_EXPECT(!beacon.running());
  }
  {
    // TEST-NET-1 is never assigned to a local interface
    DiscoveryBeacon::Options options;
    options.bind_ip = "192.0.2.1";
    options.udp_port = 0;
    DiscoveryBeacon beacon(registry, options, g_logger);
    bool thrown = false;
    try {
      beacon.start();
    } catch(const LanternError& e) {
      thrown = (e.code() == ErrorCode::IoError);
    }
    LANTERN_EXPECT(thrown);
    LANTERN_EXPECT(!beacon.running());
  }
  return true;
}

bool test_live_discovery_and_sweep() {
  lantern::test::LogCapture logs;
  auto listener_logger = std::make_shared<Logger>("listener");
  logs.attach(listener_logger, "listener");

  auto registry = std::make_shared<PeerRegistry>(std::chrono::milliseconds(400));
  DiscoveryBeacon::Options listen_options;
  listen_options.bind_ip = "127.0.0.1";
  listen_options.udp_port = 0;
  listen_options.tcp_port = 7000;
  listen_options.display_name = "listener";
  listen_options.instance_id = "listener-id";
  listen_options.sweep_interval = 50ms;
  listen_options.targets = {"127.0.0.1"};
  DiscoveryBeacon listener(registry, listen_options, listener_logger);
  listener.start();
  LANTERN_EXPECT(listener.local_port() != 0);

  auto announcer_registry = std::make_shared<PeerRegistry>();
  DiscoveryBeacon::Options announce_options;
  announce_options.bind_ip = "127.0.0.1";
  announce_options.udp_port = 0;
  announce_options.tcp_port = 7100;
  announce_options.display_name = "announcer";
  announce_options.instance_id = "announcer-id";
  announce_options.interval = 100ms;
  announce_options.targets = {"127.0.0.1"};
  announce_options.target_port = listener.local_port();
  auto announcer = std::make_unique<DiscoveryBeacon>(announcer_registry, announce_options, g_logger);
  announcer->start();

  LANTERN_EXPECT(wait_for_condition([&]{ return registry->snapshot().size() == 1; }, 3s));
  auto peers = registry->snapshot();
  LANTERN_EXPECT(peers[0].display_name == "announcer");
  LANTERN_EXPECT(peers[0].host == "127.0.0.1");
  LANTERN_EXPECT(peers[0].port == 7100);
  LANTERN_EXPECT(logs.wait_for_substring("discovered 'announcer' at 127.0.0.1:7100", 1s));
  LANTERN_EXPECT(announcer->beacons_sent() >= 1);

  announcer->stop();
  LANTERN_EXPECT(!announcer->running());
  announcer.reset();
  // the sweep drops it once the staleness window passes
  LANTERN_EXPECT(wait_for_condition([&]{ return registry->size() == 0; }, 3s));

  listener.stop();
  LANTERN_EXPECT(!listener.running());
  return true;
}

} // namespace

int main(int argc, char** argv) {
  lantern::test::LogCapture logs;
  logs.attach(g_logger);
  std::vector<lantern::test::TestCase> tests = {
    {"beacon_encode_and_parse", test_beacon_encode_and_parse},
    {"beacon_rejects_malformed", test_beacon_rejects_malformed},
    {"broadcast_targets_from_interfaces", test_broadcast_targets_from_interfaces},
    {"registry_staleness", test_registry_staleness},
    {"registry_keys_and_order", test_registry_keys_and_order},
    {"handle_datagram_filters", test_handle_datagram_filters},
    {"start_failures_throw", test_start_failures_throw},
    {"live_discovery_and_sweep", test_live_discovery_and_sweep},
  };
  return lantern::test::run_suite("discovery", tests, logs, argc, argv);
}
