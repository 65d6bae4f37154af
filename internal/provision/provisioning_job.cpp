#include "provisioning_job.hpp"

#include "internal/console/command_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/fleet_config_store.hpp"
#include "internal/util/errors.hpp"

namespace labfleet::provision {

using observability::NodeField;
using observability::StringField;

// ------------------------------------------------------------
// DHCP server start
// ------------------------------------------------------------

DhcpServerStartJob::DhcpServerStartJob(std::string node_name, const ProvisionOptions& options)
    : node_name_(std::move(node_name)), options_(options) {
}

model::NodeReport DhcpServerStartJob::Execute(dispatch::NodeContext& ctx) {
  auto                   session = ctx.OpenSession();
  console::CommandRunner runner(*session, node_name_);
  runner.Settle(options_.settle_window);

  model::NodeReport report;
  report.node_name = node_name_;
  report.role      = ctx.role;
  report.commands.push_back(runner.SendAndCapture(options_.dhcp_start_command, options_.dhcp_start_read));
  report.status = model::NodeStatus::kStarted;

  LABFLEET_LOG_INFO("DHCP service started", {NodeField(node_name_), StringField("command", options_.dhcp_start_command)});
  return report;
}

// ------------------------------------------------------------
// Client / firewall / switch workflow
// ------------------------------------------------------------

ProvisionNodeJob::ProvisionNodeJob(std::string node_name, const acquire::AddressAcquirer& acquirer, const store::StaticPlan& plan,
                                   const ProvisionOptions& options)
    : node_name_(std::move(node_name)), acquirer_(acquirer), plan_(plan), options_(options) {
}

model::NodeReport ProvisionNodeJob::Execute(dispatch::NodeContext& ctx) {
  if (ctx.role == model::NodeRole::kSwitch) {
    model::NodeReport report;
    report.node_name = node_name_;
    report.role      = ctx.role;
    report.status    = model::NodeStatus::kSkipped;
    return report;
  }

  auto                   session = ctx.OpenSession();
  console::CommandRunner runner(*session, node_name_);
  runner.Settle(options_.settle_window);

  if (ctx.role == model::NodeRole::kFirewall) {
    return RunFirewall(ctx, runner);
  }
  return RunClient(ctx, runner);
}

model::NodeReport ProvisionNodeJob::RunFirewall(dispatch::NodeContext& ctx, console::CommandRunner& runner) {
  const auto ifname = acquirer_.InterfaceFor(node_name_);
  const auto entry  = plan_.Find(node_name_, ifname);
  if (!entry) {
    Record(ctx, std::nullopt, std::nullopt);
    throw util::StaticPlanMiss("firewall " + node_name_ + " has no static plan entry for " + ifname);
  }

  // Rules are composed before touching the node so a bad plan entry fails fast.
  const auto rules = firewall::ComposeFirewallRules(entry->ip, options_.firewall);

  model::NodeReport report;
  report.node_name = node_name_;
  report.role      = ctx.role;
  report.commands  = acquirer_.ApplyStatic(runner, *entry);

  // The primary interface carries the recorded address, the default route
  // and the rules. The remaining plan interfaces only get their address.
  for (auto extra : plan_.Entries(node_name_)) {
    if (extra.interface_name == entry->interface_name) continue;
    extra.gateway.reset();
    for (auto& result : acquirer_.ApplyStatic(runner, extra)) {
      report.commands.push_back(std::move(result));
    }
  }

  std::size_t failed_rules = 0;
  for (const auto& rule : rules.commands) {
    auto result = runner.Run(rule, std::chrono::milliseconds(5000));
    if (!result.succeeded) ++failed_rules;
    report.commands.push_back(std::move(result));
  }

  report.status      = model::NodeStatus::kResolved;
  report.assigned_ip = entry->ip;
  report.gateway     = entry->gateway;
  report.strategy    = "static";
  if (failed_rules > 0) {
    report.error = std::to_string(failed_rules) + " firewall rule(s) reported a non-zero status";
    LABFLEET_LOG_WARN("Firewall rules partially applied", {NodeField(node_name_), StringField("error", report.error)});
  }

  Record(ctx, report.assigned_ip, report.gateway);
  return report;
}

model::NodeReport ProvisionNodeJob::RunClient(dispatch::NodeContext& ctx, console::CommandRunner& runner) {
  acquire::AcquisitionOutcome outcome;
  try {
    outcome = acquirer_.Acquire(runner, ctx.node);
  } catch (const util::TimeoutError&) {
    Record(ctx, std::nullopt, std::nullopt);
    throw;
  }

  model::NodeReport report;
  report.node_name   = node_name_;
  report.role        = ctx.role;
  report.status      = outcome.status;
  report.assigned_ip = outcome.ip;
  report.gateway     = outcome.gateway;
  report.strategy    = outcome.strategy;
  report.error       = outcome.error;
  report.commands    = std::move(outcome.commands);

  Record(ctx, report.assigned_ip, report.gateway);
  return report;
}

void ProvisionNodeJob::Record(dispatch::NodeContext& ctx, const std::optional<std::string>& ip, const std::optional<std::string>& gateway) {
  ctx.store.UpdateNode(node_name_, [&](model::Node& node) {
    node.assigned_ip = ip;
    node.gateway     = ip ? gateway : std::nullopt;
  });

  if (!options_.persist_incrementally) return;
  try {
    ctx.store.Save();
  } catch (const util::PersistenceError& e) {
    // the end-of-run save retries with the full snapshot
    LABFLEET_LOG_ERROR("Incremental save failed", {NodeField(node_name_), StringField("error", e.what())});
  }
}

} // namespace labfleet::provision
