#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/acquire/dhcp_strategy.hpp"
#include "internal/console/command_runner.hpp"
#include "internal/model/node.hpp"
#include "internal/model/node_report.hpp"
#include "internal/model/static_plan_entry.hpp"
#include "internal/store/static_plan.hpp"

namespace labfleet::acquire {

struct AcquisitionOptions {
  std::chrono::milliseconds attempt_timeout{15000};
  std::string               default_interface = "eth0";
};

struct AcquisitionOutcome {
  // kResolved (lease), kFallback (static plan), kFailed, or kSkipped for switches.
  model::NodeStatus          status = model::NodeStatus::kFailed;
  std::string                interface_name;
  std::optional<std::string> ip;
  std::optional<std::string> gateway;
  // Winning strategy name, or "static".
  std::string strategy;
  std::string error;

  std::vector<model::CommandResult> commands;
};

/*
  Address acquisition for one node:

      START -> TRY_STRATEGY(i) -> SUCCESS             -> RESOLVED
                               -> NEXT_STRATEGY
                               -> STATIC_FALLBACK     -> RESOLVED (fallback) | FAILED

  Strategies run strictly in order and stop at the first valid lease. The
  static plan is consulted only after every strategy came back empty. The
  acquirer itself holds no per-node state, so one instance serves all workers.
*/
class AddressAcquirer {
 public:
  AddressAcquirer(std::vector<std::unique_ptr<DhcpStrategy>> strategies, const store::StaticPlan& plan, AcquisitionOptions options);

  // First interface the plan lists for the node, else the default.
  std::string InterfaceFor(const std::string& node_name) const;

  // Console errors (ConnectError, TimeoutError) propagate to the caller.
  AcquisitionOutcome Acquire(console::CommandRunner& runner, const model::Node& node) const;

  // Configures `entry` on the node's interface. Results are informational;
  // the address counts as assigned whatever the commands report.
  std::vector<model::CommandResult> ApplyStatic(console::CommandRunner& runner, const model::StaticPlanEntry& entry) const;

  const std::vector<std::unique_ptr<DhcpStrategy>>& strategies() const {
    return strategies_;
  }

 private:
  std::vector<std::unique_ptr<DhcpStrategy>> strategies_;
  const store::StaticPlan&                   plan_;
  AcquisitionOptions                         options_;
};

} // namespace labfleet::acquire
