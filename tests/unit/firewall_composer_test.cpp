#include "internal/firewall/firewall_composer.hpp"

#include <cassert>
#include <iostream>
#include <regex>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using labfleet::firewall::ComposeFirewallRules;
using labfleet::firewall::FirewallParams;

size_t Count(const std::vector<std::string>& rules, const std::string& pattern) {
  const std::regex re(pattern);
  size_t           n = 0;
  for (const auto& rule : rules) {
    if (std::regex_search(rule, re)) ++n;
  }
  return n;
}

size_t IndexOf(const std::vector<std::string>& rules, const std::string& pattern) {
  const std::regex re(pattern);
  for (size_t i = 0; i < rules.size(); ++i) {
    if (std::regex_search(rules[i], re)) return i;
  }
  return rules.size();
}

void TestRulesetForFirewallAddress() {
  auto rules = ComposeFirewallRules("10.0.0.5", FirewallParams{}).commands;

  // exactly one ICMP allow
  assert(Count(rules, "-p icmp") == 1);
  assert(Count(rules, "-d 10\\.0\\.0\\.5 -p icmp -j ACCEPT") == 1);

  // one DHCP 67/68 pair
  assert(Count(rules, "-A INPUT -p udp --sport 67:68 --dport 67:68 -j ACCEPT") == 1);
  assert(Count(rules, "-A FORWARD -p udp --sport 67:68 --dport 67:68 -j ACCEPT") == 1);
  assert(Count(rules, "67:68") == 2);

  // SYN rate limit with a bounded recent window
  assert(Count(rules, "-m recent --name portscan --update --seconds [1-9][0-9]* --hitcount [1-9][0-9]* -j DROP") >= 1);
  assert(Count(rules, "--syn -j SCAN_GUARD") == 2);
  assert(Count(rules, "--name udp_scan --update --seconds 1 --hitcount 60 -j DROP") == 1);

  // never a default policy
  assert(Count(rules, "iptables -P ") == 0);
  assert(Count(rules, "-j DROP") == 2);
}

void TestOrdering() {
  auto rules = ComposeFirewallRules("10.0.0.5", FirewallParams{}).commands;

  const auto loopback = IndexOf(rules, "-i lo -j ACCEPT");
  const auto icmp     = IndexOf(rules, "-p icmp");
  const auto dhcp     = IndexOf(rules, "67:68");
  const auto guard    = IndexOf(rules, "-N SCAN_GUARD");
  assert(loopback < icmp && icmp < dhcp && dhcp < guard && guard < rules.size());

  // the chain exists and is populated before anything jumps to it
  assert(IndexOf(rules, "-N SCAN_GUARD") < IndexOf(rules, "-j SCAN_GUARD"));
  assert(IndexOf(rules, "--name portscan --set -j RETURN") < IndexOf(rules, "-j SCAN_GUARD"));
}

void TestParametersFlowThrough() {
  FirewallParams params;
  params.syn_hitcount       = 7;
  params.syn_window_seconds = 3;
  params.udp_hitcount       = 40;
  params.udp_window_seconds = 2;
  params.flush_existing     = false;
  params.enable_forwarding  = false;

  auto rules = ComposeFirewallRules("192.168.10.1", params).commands;
  assert(Count(rules, "--name portscan --update --seconds 3 --hitcount 7 -j DROP") == 1);
  assert(Count(rules, "--name udp_scan --update --seconds 2 --hitcount 40 -j DROP") == 1);
  assert(Count(rules, "iptables -F INPUT") == 0);
  assert(Count(rules, "ip_forward") == 0);

  auto defaults = ComposeFirewallRules("192.168.10.1", FirewallParams{}).commands;
  assert(defaults.front() == "sysctl -w net.ipv4.ip_forward=1");
  assert(Count(defaults, "iptables -F INPUT") == 1);
  assert(Count(defaults, "iptables -F FORWARD") == 1);
}

void TestInvalidInput() {
  bool threw = false;
  try {
    (void)ComposeFirewallRules("10.0.0.256", FirewallParams{});
  } catch (const labfleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  FirewallParams zero;
  zero.syn_hitcount = 0;
  threw             = false;
  try {
    (void)ComposeFirewallRules("10.0.0.5", zero);
  } catch (const labfleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRulesetForFirewallAddress();
  TestOrdering();
  TestParametersFlowThrough();
  TestInvalidInput();

  std::cout << "labfleet_unit_firewall_composer: pass\n";
  return 0;
}
