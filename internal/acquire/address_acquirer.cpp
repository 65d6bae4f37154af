#include "address_acquirer.hpp"

#include "internal/classify/node_classifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ip_address.hpp"
#include "internal/util/shell.hpp"

namespace labfleet::acquire {

using observability::NodeField;
using observability::StringField;

namespace {

constexpr std::chrono::milliseconds kSetupTimeout{5000};

} // namespace

AddressAcquirer::AddressAcquirer(std::vector<std::unique_ptr<DhcpStrategy>> strategies, const store::StaticPlan& plan,
                                 AcquisitionOptions options)
    : strategies_(std::move(strategies)), plan_(plan), options_(std::move(options)) {
}

std::string AddressAcquirer::InterfaceFor(const std::string& node_name) const {
  auto ifname = plan_.FirstInterface(node_name).value_or(options_.default_interface);
  if (!util::IsPlainProgram(ifname) || ifname.find('/') != std::string::npos) {
    throw util::InvalidArgument("node " + node_name + ": unusable interface name '" + ifname + "'");
  }
  return ifname;
}

std::vector<model::CommandResult> AddressAcquirer::ApplyStatic(console::CommandRunner& runner, const model::StaticPlanEntry& entry) const {
  const auto& ifname = entry.interface_name;

  std::vector<model::CommandResult> results;
  results.push_back(runner.Run("ip addr flush dev " + ifname, kSetupTimeout));
  results.push_back(runner.Run("ip addr add " + util::FormatCidr({entry.ip, entry.prefix_length}) + " dev " + ifname, kSetupTimeout));
  results.push_back(runner.Run("ip link set " + ifname + " up", kSetupTimeout));
  if (entry.gateway) {
    results.push_back(runner.Run("ip route replace default via " + *entry.gateway + " dev " + ifname, kSetupTimeout));
  }
  return results;
}

AcquisitionOutcome AddressAcquirer::Acquire(console::CommandRunner& runner, const model::Node& node) const {
  AcquisitionOutcome outcome;

  if (classify::Classify(node.name) == model::NodeRole::kSwitch) {
    outcome.status = model::NodeStatus::kSkipped;
    return outcome;
  }

  outcome.interface_name = InterfaceFor(node.name);
  const auto& ifname     = outcome.interface_name;
  const auto  plan_entry = plan_.Find(node.name, ifname);

  // START
  outcome.commands.push_back(runner.Run("ip link set " + ifname + " up", kSetupTimeout));

  // TRY_STRATEGY(i)
  for (const auto& strategy : strategies_) {
    auto result = runner.Run(strategy->Command(ifname), options_.attempt_timeout);
    auto lease  = strategy->Parse(result.captured_output);
    outcome.commands.push_back(std::move(result));

    if (!lease) {
      LABFLEET_LOG_DEBUG("No lease from strategy", {NodeField(node.name), StringField("strategy", strategy->name())});
      continue;
    }

    // SUCCESS
    outcome.status   = model::NodeStatus::kResolved;
    outcome.ip       = lease->ip;
    outcome.strategy = std::string(strategy->name());
    if (lease->gateway) {
      outcome.gateway = lease->gateway;
    } else if (plan_entry) {
      outcome.gateway = plan_entry->gateway;
    }

    LABFLEET_LOG_INFO("Lease acquired",
                      {NodeField(node.name), StringField("strategy", outcome.strategy), StringField("ip", *outcome.ip)});
    return outcome;
  }

  // STATIC_FALLBACK
  if (!plan_entry) {
    outcome.status = model::NodeStatus::kFailed;
    outcome.error  = "no lease and no static plan entry for " + node.name + "/" + ifname;
    LABFLEET_LOG_WARN("Address acquisition failed", {NodeField(node.name), StringField("error", outcome.error)});
    return outcome;
  }

  auto applied = ApplyStatic(runner, *plan_entry);
  outcome.commands.insert(outcome.commands.end(), applied.begin(), applied.end());

  outcome.status   = model::NodeStatus::kFallback;
  outcome.ip       = plan_entry->ip;
  outcome.gateway  = plan_entry->gateway;
  outcome.strategy = "static";

  LABFLEET_LOG_INFO("Static address applied", {NodeField(node.name), StringField("ip", *outcome.ip)});
  return outcome;
}

} // namespace labfleet::acquire
