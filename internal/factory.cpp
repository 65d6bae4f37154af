#include "factory.hpp"

#include "internal/console/telnet_session.hpp"
#include "internal/firewall/firewall_composer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace labfleet::factory {

using labfleet::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

using std::chrono::milliseconds;

console::TelnetOptions MakeTelnetOptions(const RuntimeConfig& config) {
  console::TelnetOptions options;
  options.newline       = config.console().newline();
  options.exit_command  = config.console().exit_command();
  options.poll_interval = milliseconds(config.console().read_poll_interval_ms());
  return options;
}

std::unique_ptr<store::StaticPlan> LoadPlan(const std::string& path) {
  try {
    return std::make_unique<store::StaticPlan>(store::StaticPlan::Load(path));
  } catch (const util::NotFound&) {
    // only an error once a node actually needs a fallback
    LABFLEET_LOG_WARN("Static plan not found, fallback disabled", {StringField("path", path)});
    return std::make_unique<store::StaticPlan>();
  }
}

provision::ProvisionOptions MakeProvisionOptions(const RuntimeConfig& config) {
  const auto& p = config.provisioning();

  provision::ProvisionOptions options;
  options.dhcp_start_command    = p.dhcp_start_command();
  options.dhcp_start_read       = milliseconds(p.dhcp_start_read_ms());
  options.dhcp_warmup           = milliseconds(p.dhcp_warmup_ms());
  options.node_timeout          = milliseconds(p.node_timeout_ms());
  options.firewall              = firewall::FirewallParams::FromConfig(p.firewall());
  options.persist_incrementally = config.fleet().persist_incrementally();
  return options;
}

} // namespace

Application Build(const RuntimeConfig& config) {
  return Build(config, std::make_unique<console::TelnetConnector>(MakeTelnetOptions(config)));
}

Application Build(const RuntimeConfig& config, std::unique_ptr<console::ConsoleConnector> connector) {
  Application app;
  app.config    = config;
  app.connector = std::move(connector);

  // ------------------------------------------------------------
  // Inputs
  // ------------------------------------------------------------
  app.store = std::make_unique<store::FleetConfigStore>(config.fleet().config_path());
  app.plan  = LoadPlan(config.fleet().static_plan_path());

  // ------------------------------------------------------------
  // Provisioning
  // ------------------------------------------------------------
  std::vector<std::string> strategy_names(config.provisioning().strategies().begin(), config.provisioning().strategies().end());

  acquire::AcquisitionOptions acquisition;
  acquisition.attempt_timeout   = milliseconds(config.provisioning().attempt_timeout_ms());
  acquisition.default_interface = config.provisioning().default_interface();

  app.acquirer = std::make_unique<acquire::AddressAcquirer>(acquire::MakeStrategies(strategy_names), *app.plan, acquisition);

  dispatch::DispatchOptions dispatch_options;
  dispatch_options.host_override   = config.fleet().console_host_override();
  dispatch_options.connect_timeout = milliseconds(config.console().connect_timeout_ms());

  app.dispatcher  = std::make_unique<dispatch::FleetDispatcher>(*app.connector, *app.store, dispatch_options);
  app.provisioner = std::make_unique<provision::Provisioner>(*app.dispatcher, *app.store, *app.acquirer, *app.plan,
                                                             MakeProvisionOptions(config), config.dispatch().concurrency());

  // ------------------------------------------------------------
  // Script push
  // ------------------------------------------------------------
  app.job_loader = std::make_unique<scripts::ScriptJobLoader>(config.fleet().scripts_dir(),
                                                              milliseconds(config.dispatch().default_timeout_ms()));
  app.push_options.chunk_size   = config.dispatch().upload_chunk_size();
  app.push_options.step_timeout = milliseconds(config.dispatch().default_timeout_ms());

  return app;
}

report::RunReport RunProvisioning(Application& app) {
  return app.provisioner->Run();
}

report::RunReport RunScripts(Application& app, const std::string& jobs_path) {
  report::RunReport run;
  run.kind       = "script";
  run.started_at = util::Now();

  auto batch = app.job_loader->Load(jobs_path, app.store->Snapshot());

  std::vector<std::unique_ptr<dispatch::FleetJob>> jobs;
  jobs.reserve(batch.jobs.size());
  for (auto& job : batch.jobs) {
    jobs.push_back(std::make_unique<scripts::ScriptPushJob>(std::move(job), app.push_options));
  }

  const std::size_t concurrency = batch.concurrency > 0 ? batch.concurrency : app.config.dispatch().concurrency();
  run.nodes       = app.dispatcher->Run(jobs, concurrency);
  run.finished_at = util::Now();
  return run;
}

} // namespace labfleet::factory
