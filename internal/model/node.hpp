#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labfleet::model {

enum class NodeRole : std::uint8_t {
  kClient     = 0,
  kSwitch     = 1,
  kDhcpServer = 2,
  kFirewall   = 3,
};

constexpr std::string_view ToString(NodeRole role) {
  switch (role) {
    case NodeRole::kSwitch:
      return "switch";
    case NodeRole::kDhcpServer:
      return "dhcp-server";
    case NodeRole::kFirewall:
      return "firewall";
    case NodeRole::kClient:
      break;
  }
  return "client";
}

/*
  One lab node as recorded in the fleet config.

  The role is derived from the name (see NodeClassifier) and never stored.
  assigned_ip / gateway change only through FleetConfigStore::UpdateNode.
*/
struct Node {
  std::string   name;
  std::string   node_id;
  std::string   console_host;
  std::uint16_t console_port = 0;
  std::string   template_name;

  std::optional<std::string> assigned_ip;
  std::optional<std::string> gateway;
};

struct FleetConfig {
  std::string       project_name;
  std::string       project_id;
  std::vector<Node> nodes;

  const Node* Find(std::string_view name) const {
    for (const auto& node : nodes) {
      if (node.name == name) return &node;
    }
    return nullptr;
  }
};

} // namespace labfleet::model
