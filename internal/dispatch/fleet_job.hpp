#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "internal/console/console_session.hpp"
#include "internal/model/node.hpp"
#include "internal/model/node_report.hpp"
#include "internal/util/time.hpp"

namespace labfleet::store {
class FleetConfigStore;
}

namespace labfleet::dispatch {

/*
  What one worker hands to one job: the node, where its console is, and the
  node's time budget. Owned by the worker for the duration of Execute.
*/
struct NodeContext {
  model::Node                node;
  model::NodeRole            role = model::NodeRole::kClient;
  std::string                host_override;
  util::Deadline             deadline;
  console::ConsoleConnector& connector;
  store::FleetConfigStore&   store;
  std::chrono::milliseconds  connect_timeout{10000};

  // Resolves the endpoint and connects within the remaining budget. The
  // returned session clamps every read to the deadline and throws
  // util::TimeoutError once it is spent.
  std::unique_ptr<console::ConsoleSession> OpenSession() const;
};

/*
  Unit of node work run by FleetDispatcher.

  Execute returns the node's report; any exception it throws is turned into
  a failed (or timeout) report by the dispatcher, never propagated.
*/
class FleetJob {
 public:
  virtual ~FleetJob() = default;

  virtual const std::string&        node_name() const = 0;
  virtual std::string_view          kind() const      = 0;
  // Zero means unbounded.
  virtual std::chrono::milliseconds timeout() const   = 0;

  virtual model::NodeReport Execute(NodeContext& ctx) = 0;
};

} // namespace labfleet::dispatch
