#include "provisioner.hpp"

#include <map>
#include <thread>

#include "internal/classify/node_classifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace labfleet::provision {

using observability::IntField;
using observability::StringField;

Provisioner::Provisioner(dispatch::FleetDispatcher& dispatcher, store::FleetConfigStore& store, const acquire::AddressAcquirer& acquirer,
                         const store::StaticPlan& plan, ProvisionOptions options, std::size_t concurrency)
    : dispatcher_(dispatcher),
      store_(store),
      acquirer_(acquirer),
      plan_(plan),
      options_(std::move(options)),
      concurrency_(concurrency) {
}

report::RunReport Provisioner::Run() {
  report::RunReport run;
  run.kind       = "provision";
  run.started_at = util::Now();

  observability::SpanScope span("provision.run");

  const auto fleet = store_.Snapshot();

  std::vector<std::unique_ptr<dispatch::FleetJob>> servers;
  std::vector<std::unique_ptr<dispatch::FleetJob>> others;
  for (const auto& node : fleet.nodes) {
    if (classify::Classify(node.name) == model::NodeRole::kDhcpServer) {
      servers.push_back(std::make_unique<DhcpServerStartJob>(node.name, options_));
    } else {
      others.push_back(std::make_unique<ProvisionNodeJob>(node.name, acquirer_, plan_, options_));
    }
  }

  LABFLEET_LOG_INFO("Provisioning fleet", {StringField("project", fleet.project_name), IntField("dhcp_servers", servers.size()),
                                           IntField("nodes", others.size())});

  std::map<std::string, model::NodeReport> by_name;

  // ------------------------------------------------------------
  // Phase 1: DHCP servers
  // ------------------------------------------------------------
  if (!servers.empty()) {
    for (auto& report : dispatcher_.Run(servers, concurrency_)) {
      by_name[report.node_name] = std::move(report);
    }
    span.AddEvent("dhcp.started");
    if (options_.dhcp_warmup.count() > 0) {
      LABFLEET_LOG_INFO("Waiting for DHCP services", {observability::DurationField("warmup", options_.dhcp_warmup)});
      std::this_thread::sleep_for(options_.dhcp_warmup);
    }
  }

  // ------------------------------------------------------------
  // Phase 2: everyone else
  // ------------------------------------------------------------
  for (auto& report : dispatcher_.Run(others, concurrency_)) {
    by_name[report.node_name] = std::move(report);
  }

  for (const auto& node : fleet.nodes) {
    run.nodes.push_back(std::move(by_name.at(node.name)));
  }

  // ------------------------------------------------------------
  // Persist
  // ------------------------------------------------------------
  run.config_changed = store_.changed();
  if (run.config_changed) {
    try {
      auto backup = store_.Save();
      if (backup) run.backup_path = backup->string();
    } catch (const util::PersistenceError& e) {
      run.save_error = e.what();
      span.RecordException(e.what());
      LABFLEET_LOG_ERROR("Saving fleet config failed", {StringField("error", e.what())});
    }
  }

  run.finished_at = util::Now();
  return run;
}

} // namespace labfleet::provision
