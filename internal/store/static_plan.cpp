#include "static_plan.hpp"

#include "api/labfleet/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ip_address.hpp"
#include "internal/util/shell.hpp"

namespace labfleet::store {

constexpr std::uint32_t kDefaultPrefix = 24;

StaticPlan StaticPlan::Load(const std::string& path) {
  labfleet::v1::StaticPlan proto;
  config::ConfigLoader::LoadMessageFromYaml(path, &proto);
  return FromProto(proto);
}

StaticPlan StaticPlan::FromProto(const labfleet::v1::StaticPlan& proto) {
  StaticPlan plan;

  for (const auto& [node_name, node_plan] : proto.nodes()) {
    for (const auto& iface : node_plan.interfaces()) {
      const std::string where = node_name + "/" + iface.ifname();
      if (iface.ifname().empty()) {
        throw util::ParseError("static plan entry for " + node_name + " has no ifname");
      }
      if (!util::IsPlainProgram(iface.ifname()) || iface.ifname().find('/') != std::string::npos) {
        throw util::ParseError("static plan " + where + ": unusable interface name");
      }

      const auto prefix = iface.prefix_length() == 0 ? kDefaultPrefix : iface.prefix_length();
      auto       cidr   = util::ParseCidr(iface.ip(), prefix);
      if (!cidr) {
        throw util::ParseError("static plan " + where + ": invalid ip '" + iface.ip() + "'");
      }
      if (!iface.gateway().empty() && !util::IsValidIpv4(iface.gateway())) {
        throw util::ParseError("static plan " + where + ": invalid gateway '" + iface.gateway() + "'");
      }

      model::StaticPlanEntry entry;
      entry.interface_name = iface.ifname();
      entry.ip             = cidr->ip;
      entry.prefix_length  = cidr->prefix_length;
      if (!iface.gateway().empty()) entry.gateway = iface.gateway();

      plan.Add(node_name, std::move(entry));
    }
  }
  return plan;
}

void StaticPlan::Add(const std::string& node_name, model::StaticPlanEntry entry) {
  entries_[node_name].push_back(std::move(entry));
}

std::optional<model::StaticPlanEntry> StaticPlan::Find(const std::string& node_name, const std::string& interface_name) const {
  auto it = entries_.find(node_name);
  if (it == entries_.end()) return std::nullopt;

  for (const auto& entry : it->second) {
    if (entry.interface_name == interface_name) return entry;
  }
  return std::nullopt;
}

std::vector<model::StaticPlanEntry> StaticPlan::Entries(const std::string& node_name) const {
  auto it = entries_.find(node_name);
  if (it == entries_.end()) return {};
  return it->second;
}

std::optional<std::string> StaticPlan::FirstInterface(const std::string& node_name) const {
  auto it = entries_.find(node_name);
  if (it == entries_.end() || it->second.empty()) return std::nullopt;
  return it->second.front().interface_name;
}

} // namespace labfleet::store
