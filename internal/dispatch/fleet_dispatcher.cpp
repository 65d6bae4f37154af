#include "fleet_dispatcher.hpp"

#include <algorithm>
#include <thread>

#include "internal/classify/node_classifier.hpp"
#include "internal/console/console_endpoint.hpp"
#include "internal/console/deadline_session.hpp"
#include "internal/dispatch/job_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace labfleet::dispatch {

using observability::NodeField;
using observability::StringField;

std::unique_ptr<console::ConsoleSession> NodeContext::OpenSession() const {
  if (deadline.Expired()) {
    throw util::TimeoutError("node " + node.name + " exceeded its time budget before connecting");
  }

  auto endpoint = console::ResolveEndpoint(node, host_override);
  auto session  = connector.Open(endpoint, deadline.Clamp(connect_timeout));
  return std::make_unique<console::DeadlineSession>(std::move(session), deadline, node.name);
}

FleetDispatcher::FleetDispatcher(console::ConsoleConnector& connector, store::FleetConfigStore& store, DispatchOptions options)
    : connector_(connector), store_(store), options_(std::move(options)) {
}

std::vector<model::NodeReport> FleetDispatcher::Run(const std::vector<std::unique_ptr<FleetJob>>& jobs, std::size_t concurrency) {
  std::vector<model::NodeReport> results(jobs.size());
  if (jobs.empty()) return results;

  const std::size_t workers = std::clamp<std::size_t>(concurrency, 1, jobs.size());

  JobQueue queue;
  for (std::size_t i = 0; i < jobs.size(); ++i) {
    queue.Enqueue(i);
  }
  queue.Shutdown();

  LABFLEET_LOG_INFO("Dispatching node jobs",
                    {observability::IntField("jobs", static_cast<std::int64_t>(jobs.size())),
                     observability::IntField("workers", static_cast<std::int64_t>(workers))});

  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    pool.emplace_back([&] {
      while (auto index = queue.Dequeue()) {
        results[*index] = RunOne(*jobs[*index]);
      }
    });
  }
  for (auto& t : pool) {
    t.join();
  }
  return results;
}

model::NodeReport FleetDispatcher::RunOne(FleetJob& job) {
  const auto started = std::chrono::steady_clock::now();

  model::NodeReport report;
  report.node_name = job.node_name();
  report.role      = classify::Classify(job.node_name());

  observability::SpanScope span(std::string(job.kind()) + ".node");
  span.SetAttribute("node", job.node_name());
  span.SetAttribute("role", model::ToString(report.role));

  try {
    auto node = store_.FindNode(job.node_name());
    if (!node) {
      throw util::NotFound("node not found in fleet config: " + job.node_name());
    }

    util::Deadline deadline = job.timeout().count() > 0 ? util::Deadline(job.timeout()) : util::Deadline();

    NodeContext ctx{*node, report.role, options_.host_override, deadline, connector_, store_, options_.connect_timeout};

    report           = job.Execute(ctx);
    report.node_name = job.node_name();
    report.role      = ctx.role;
  } catch (const util::TimeoutError& e) {
    report.status = model::NodeStatus::kTimeout;
    report.error  = e.what();
    span.RecordException(e.what());
  } catch (const std::exception& e) {
    report.status = model::NodeStatus::kFailed;
    report.error  = e.what();
    span.RecordException(e.what());
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  const auto status  = model::ToString(report.status);

  span.SetAttribute("status", status);
  observability::Metrics::Instance().RecordNodeOutcome(job.kind(), status);
  observability::Metrics::Instance().ObserveNodeWorkflowMs(job.kind(), static_cast<double>(elapsed.count()));

  if (report.status == model::NodeStatus::kFailed || report.status == model::NodeStatus::kTimeout) {
    LABFLEET_LOG_WARN("Node job finished", {NodeField(report.node_name), StringField("status", status),
                                            StringField("error", report.error), observability::DurationField("elapsed", elapsed)});
  } else {
    LABFLEET_LOG_INFO("Node job finished",
                      {NodeField(report.node_name), StringField("status", status), observability::DurationField("elapsed", elapsed)});
  }
  return report;
}

} // namespace labfleet::dispatch
