#pragma once

#include <chrono>
#include <string>

#include "internal/acquire/address_acquirer.hpp"
#include "internal/dispatch/fleet_job.hpp"
#include "internal/firewall/firewall_composer.hpp"
#include "internal/store/static_plan.hpp"

namespace labfleet::provision {

struct ProvisionOptions {
  std::string               dhcp_start_command = "/usr/local/bin/start.sh";
  std::chrono::milliseconds dhcp_start_read{5000};
  std::chrono::milliseconds dhcp_warmup{0};
  std::chrono::milliseconds node_timeout{180000};
  std::chrono::milliseconds settle_window{250};
  firewall::FirewallParams  firewall;
  bool                      persist_incrementally = false;
};

/*
  Phase 1: starts the DHCP service on a dhcp-server node. The start command
  does not return to a prompt, so its output is captured for a fixed window.
*/
class DhcpServerStartJob : public dispatch::FleetJob {
 public:
  DhcpServerStartJob(std::string node_name, const ProvisionOptions& options);

  const std::string& node_name() const override {
    return node_name_;
  }
  std::string_view kind() const override {
    return "provision";
  }
  std::chrono::milliseconds timeout() const override {
    return options_.node_timeout;
  }

  model::NodeReport Execute(dispatch::NodeContext& ctx) override;

 private:
  std::string             node_name_;
  const ProvisionOptions& options_;
};

/*
  Phase 2: one node's workflow after the DHCP servers are up.

      switch   -> skipped, the console is never opened
      firewall -> static plan address, then the composed iptables rules
      client   -> address acquisition with static fallback

  Resolved addresses are written through FleetConfigStore::UpdateNode; a
  failed or timed-out client loses any stale address.
*/
class ProvisionNodeJob : public dispatch::FleetJob {
 public:
  ProvisionNodeJob(std::string node_name, const acquire::AddressAcquirer& acquirer, const store::StaticPlan& plan,
                   const ProvisionOptions& options);

  const std::string& node_name() const override {
    return node_name_;
  }
  std::string_view kind() const override {
    return "provision";
  }
  std::chrono::milliseconds timeout() const override {
    return options_.node_timeout;
  }

  model::NodeReport Execute(dispatch::NodeContext& ctx) override;

 private:
  model::NodeReport RunFirewall(dispatch::NodeContext& ctx, console::CommandRunner& runner);
  model::NodeReport RunClient(dispatch::NodeContext& ctx, console::CommandRunner& runner);

  void Record(dispatch::NodeContext& ctx, const std::optional<std::string>& ip, const std::optional<std::string>& gateway);

  std::string                     node_name_;
  const acquire::AddressAcquirer& acquirer_;
  const store::StaticPlan&        plan_;
  const ProvisionOptions&         options_;
};

} // namespace labfleet::provision
