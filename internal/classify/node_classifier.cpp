#include "node_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace labfleet::classify {

namespace {

constexpr std::array<std::string_view, 3> kSwitchKeywords{"switch", "openvswitch", "ovs"};
constexpr std::array<std::string_view, 2> kDhcpKeywords{"dhcp", "dnsmasq"};
constexpr std::array<std::string_view, 1> kFirewallKeywords{"firewall"};

template <size_t N>
bool ContainsAny(const std::string& haystack, const std::array<std::string_view, N>& needles) {
  return std::any_of(needles.begin(), needles.end(),
                     [&](std::string_view needle) { return haystack.find(needle) != std::string::npos; });
}

} // namespace

model::NodeRole Classify(std::string_view node_name) {
  std::string lowered(node_name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (ContainsAny(lowered, kSwitchKeywords)) return model::NodeRole::kSwitch;
  if (ContainsAny(lowered, kDhcpKeywords)) return model::NodeRole::kDhcpServer;
  if (ContainsAny(lowered, kFirewallKeywords)) return model::NodeRole::kFirewall;
  return model::NodeRole::kClient;
}

} // namespace labfleet::classify
