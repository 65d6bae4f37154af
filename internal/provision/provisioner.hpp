#pragma once

#include <cstddef>

#include "internal/acquire/address_acquirer.hpp"
#include "internal/dispatch/fleet_dispatcher.hpp"
#include "internal/provision/provisioning_job.hpp"
#include "internal/report/run_report.hpp"
#include "internal/store/fleet_config_store.hpp"
#include "internal/store/static_plan.hpp"

namespace labfleet::provision {

/*
  Provisioning run over the whole fleet.

      phase 1: start every dhcp-server node, then wait for the warm-up delay
      phase 2: switches, firewalls and clients, concurrently
      save:    once at the end when anything changed

  Every node appears in the report exactly once, in fleet order. A failed
  save is reported in save_error; the prior file is left as it was.
*/
class Provisioner {
 public:
  Provisioner(dispatch::FleetDispatcher& dispatcher, store::FleetConfigStore& store, const acquire::AddressAcquirer& acquirer,
              const store::StaticPlan& plan, ProvisionOptions options, std::size_t concurrency);

  report::RunReport Run();

 private:
  dispatch::FleetDispatcher&      dispatcher_;
  store::FleetConfigStore&        store_;
  const acquire::AddressAcquirer& acquirer_;
  const store::StaticPlan&        plan_;
  ProvisionOptions                options_;
  std::size_t                     concurrency_;
};

} // namespace labfleet::provision
