#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/console/console_session.hpp"
#include "internal/dispatch/fleet_job.hpp"
#include "internal/model/node_report.hpp"
#include "internal/store/fleet_config_store.hpp"

namespace labfleet::dispatch {

struct DispatchOptions {
  std::string               host_override;
  std::chrono::milliseconds connect_timeout{10000};
};

/*
  Runs node jobs on a bounded pool of worker threads.

  Each worker owns the console session of the job it is running; nothing but
  the FleetConfigStore is shared. Results come back in submission order, one
  per job, whatever happened to the others.
*/
class FleetDispatcher {
 public:
  FleetDispatcher(console::ConsoleConnector& connector, store::FleetConfigStore& store, DispatchOptions options);

  std::vector<model::NodeReport> Run(const std::vector<std::unique_ptr<FleetJob>>& jobs, std::size_t concurrency);

 private:
  model::NodeReport RunOne(FleetJob& job);

  console::ConsoleConnector& connector_;
  store::FleetConfigStore&   store_;
  DispatchOptions            options_;
};

} // namespace labfleet::dispatch
