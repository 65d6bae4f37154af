#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace labfleet::runtime::config {
class FirewallSettings;
}

namespace labfleet::firewall {

struct FirewallParams {
  std::uint32_t syn_hitcount       = 15;
  std::uint32_t syn_window_seconds = 1;
  std::uint32_t udp_hitcount       = 60;
  std::uint32_t udp_window_seconds = 1;
  bool          flush_existing     = true;
  bool          enable_forwarding  = true;

  static FirewallParams FromConfig(const labfleet::runtime::config::FirewallSettings& settings);
};

// Ordered shell commands for one firewall node. Regenerated every run.
struct FirewallRuleSet {
  std::string              static_ip;
  std::vector<std::string> commands;
};

/*
  Pure function from (static IP, parameters) to an iptables command list:

      loopback + established/related
      ICMP to the firewall's address
      DHCP 67/68 on INPUT and FORWARD
      SCAN_GUARD chain fed by new TCP SYNs, plus a milder UDP limit

  Chain policies are never touched. Throws util::InvalidArgument for a
  malformed address or a zero parameter.
*/
FirewallRuleSet ComposeFirewallRules(const std::string& static_ip, const FirewallParams& params);

} // namespace labfleet::firewall
