#include "firewall_composer.hpp"

#include "config/config.pb.h"
#include "internal/util/errors.hpp"
#include "internal/util/ip_address.hpp"

namespace labfleet::firewall {

namespace {

constexpr const char* kScanChain = "SCAN_GUARD";

void RequirePositive(std::uint32_t value, const char* name) {
  if (value == 0) {
    throw util::InvalidArgument(std::string("firewall parameter ") + name + " must be positive");
  }
}

std::string RecentDrop(const std::string& prefix, const char* list, std::uint32_t window, std::uint32_t hitcount) {
  return prefix + " -m recent --name " + list + " --update --seconds " + std::to_string(window) + " --hitcount " +
         std::to_string(hitcount) + " -j DROP";
}

} // namespace

FirewallParams FirewallParams::FromConfig(const labfleet::runtime::config::FirewallSettings& settings) {
  FirewallParams params;
  params.syn_hitcount       = settings.syn_hitcount();
  params.syn_window_seconds = settings.syn_window_seconds();
  params.udp_hitcount       = settings.udp_hitcount();
  params.udp_window_seconds = settings.udp_window_seconds();
  params.flush_existing     = !settings.keep_existing_rules();
  params.enable_forwarding  = !settings.disable_forwarding();
  return params;
}

FirewallRuleSet ComposeFirewallRules(const std::string& static_ip, const FirewallParams& params) {
  if (!util::IsValidIpv4(static_ip)) {
    throw util::InvalidArgument("firewall address is not a valid IPv4 literal: '" + static_ip + "'");
  }
  RequirePositive(params.syn_hitcount, "syn_hitcount");
  RequirePositive(params.syn_window_seconds, "syn_window_seconds");
  RequirePositive(params.udp_hitcount, "udp_hitcount");
  RequirePositive(params.udp_window_seconds, "udp_window_seconds");

  FirewallRuleSet rules;
  rules.static_ip = static_ip;
  auto& out       = rules.commands;

  if (params.enable_forwarding) {
    out.push_back("sysctl -w net.ipv4.ip_forward=1");
  }
  if (params.flush_existing) {
    out.push_back("iptables -F INPUT");
    out.push_back("iptables -F FORWARD");
  }

  // (1) loopback, established/related
  out.push_back("iptables -A INPUT -i lo -j ACCEPT");
  out.push_back("iptables -A INPUT -m conntrack --ctstate ESTABLISHED,RELATED -j ACCEPT");
  out.push_back("iptables -A FORWARD -m conntrack --ctstate ESTABLISHED,RELATED -j ACCEPT");

  // (2) ICMP
  out.push_back("iptables -A INPUT -d " + static_ip + " -p icmp -j ACCEPT");

  // (3) DHCP
  out.push_back("iptables -A INPUT -p udp --sport 67:68 --dport 67:68 -j ACCEPT");
  out.push_back("iptables -A FORWARD -p udp --sport 67:68 --dport 67:68 -j ACCEPT");

  // (4) scan guard
  const std::string chain = std::string("iptables -A ") + kScanChain;
  out.push_back(std::string("iptables -N ") + kScanChain + " 2>/dev/null || true");
  out.push_back(std::string("iptables -F ") + kScanChain);
  out.push_back(RecentDrop(chain, "portscan", params.syn_window_seconds, params.syn_hitcount));
  out.push_back(chain + " -m recent --name portscan --set -j RETURN");
  out.push_back("iptables -A INPUT -d " + static_ip + " -p tcp --syn -j " + kScanChain);
  out.push_back(std::string("iptables -A FORWARD -p tcp --syn -j ") + kScanChain);

  out.push_back(RecentDrop("iptables -A INPUT -p udp", "udp_scan", params.udp_window_seconds, params.udp_hitcount));
  out.push_back("iptables -A INPUT -p udp -m recent --name udp_scan --set");

  return rules;
}

} // namespace labfleet::firewall
