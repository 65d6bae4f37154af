#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/command_result.hpp"
#include "internal/model/node.hpp"

namespace labfleet::model {

enum class NodeStatus : std::uint8_t {
  kResolved  = 0, // address from a lease (or the plan, for firewalls)
  kFallback  = 1, // no lease, address from the static plan
  kFailed    = 2,
  kTimeout   = 3,
  kSkipped   = 4, // switches
  kStarted   = 5, // DHCP servers
  kSucceeded = 6, // script jobs
};

constexpr std::string_view ToString(NodeStatus status) {
  switch (status) {
    case NodeStatus::kResolved:
      return "resolved";
    case NodeStatus::kFallback:
      return "fallback";
    case NodeStatus::kFailed:
      return "failed";
    case NodeStatus::kTimeout:
      return "timeout";
    case NodeStatus::kSkipped:
      return "skipped";
    case NodeStatus::kStarted:
      return "started";
    case NodeStatus::kSucceeded:
      return "succeeded";
  }
  return "failed";
}

/*
  Per-node entry of a run report. Every targeted node gets exactly one.
*/
struct NodeReport {
  std::string node_name;
  NodeRole    role   = NodeRole::kClient;
  NodeStatus  status = NodeStatus::kFailed;

  std::optional<std::string> assigned_ip;
  std::optional<std::string> gateway;
  std::string                strategy;
  std::string                error;

  std::vector<CommandResult> commands;

  // script jobs
  std::optional<int> exit_code;
  std::string        output;
  bool               upload_skipped = false;
};

} // namespace labfleet::model
