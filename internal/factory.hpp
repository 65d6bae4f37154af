#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "config/config.pb.h"

#include "internal/acquire/address_acquirer.hpp"
#include "internal/console/console_session.hpp"
#include "internal/dispatch/fleet_dispatcher.hpp"
#include "internal/provision/provisioner.hpp"
#include "internal/report/run_report.hpp"
#include "internal/scripts/script_job_loader.hpp"
#include "internal/scripts/script_push_job.hpp"
#include "internal/store/fleet_config_store.hpp"
#include "internal/store/static_plan.hpp"

namespace labfleet::factory {

/*
  Application

  Owns every long-lived object of one labfleet invocation. Members are
  declared in dependency order; later ones hold references into earlier
  ones.
*/
struct Application {
  labfleet::runtime::config::RuntimeConfig config;

  std::unique_ptr<console::ConsoleConnector>  connector;
  std::unique_ptr<store::FleetConfigStore>    store;
  std::unique_ptr<store::StaticPlan>          plan;
  std::unique_ptr<acquire::AddressAcquirer>   acquirer;
  std::unique_ptr<dispatch::FleetDispatcher>  dispatcher;
  std::unique_ptr<provision::Provisioner>     provisioner;
  std::unique_ptr<scripts::ScriptJobLoader>   job_loader;
  scripts::ScriptPushOptions                  push_options;
};

/*
  Build

  Constructs the application from runtime config. Loads the fleet config and
  the static plan, so input errors surface here before any node is touched.

  NOTE:
  This is the composition root. It is the ONLY place that knows the
  concrete console transport.
*/
Application Build(const labfleet::runtime::config::RuntimeConfig& config);

// Same, with a caller-supplied console transport (tests).
Application Build(const labfleet::runtime::config::RuntimeConfig& config, std::unique_ptr<console::ConsoleConnector> connector);

report::RunReport RunProvisioning(Application& app);

// Validates the whole job file first, then dispatches.
report::RunReport RunScripts(Application& app, const std::string& jobs_path);

} // namespace labfleet::factory
