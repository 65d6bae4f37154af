#include "internal/dispatch/fleet_dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "internal/console/command_runner.hpp"
#include "tests/unit/support/fake_console.hpp"

namespace {

using namespace std::chrono_literals;
using labfleet::dispatch::DispatchOptions;
using labfleet::dispatch::FleetDispatcher;
using labfleet::dispatch::FleetJob;
using labfleet::dispatch::NodeContext;
using labfleet::model::NodeReport;
using labfleet::model::NodeStatus;
using labfleet::store::FleetConfigStore;
using labfleet::testing::FakeConnector;
using labfleet::testing::Reply;

std::atomic<int> g_active{0};
std::atomic<int> g_peak{0};

// Runs `hostname` and reports what came back.
class HostnameJob : public FleetJob {
 public:
  HostnameJob(std::string node, std::chrono::milliseconds timeout) : node_(std::move(node)), timeout_(timeout) {
  }

  const std::string& node_name() const override {
    return node_;
  }
  std::string_view kind() const override {
    return "test";
  }
  std::chrono::milliseconds timeout() const override {
    return timeout_;
  }

  NodeReport Execute(NodeContext& ctx) override {
    const int now = ++g_active;
    int       peak = g_peak.load();
    while (now > peak && !g_peak.compare_exchange_weak(peak, now)) {
    }

    struct Leave {
      ~Leave() {
        --g_active;
      }
    } leave;

    auto                             session = ctx.OpenSession();
    labfleet::console::CommandRunner runner(*session, node_);

    NodeReport report;
    report.node_name = node_;
    auto result      = runner.Run("hostname", 5000ms);
    report.output    = result.captured_output;
    report.status    = result.succeeded ? NodeStatus::kSucceeded : NodeStatus::kFailed;
    return report;
  }

 private:
  std::string               node_;
  std::chrono::milliseconds timeout_;
};

std::filesystem::path WriteFleet(size_t nodes) {
  const auto dir = std::filesystem::temp_directory_path() / "labfleet_dispatcher_tests";
  std::filesystem::create_directories(dir);

  std::string json = R"({"project_name": "lab", "nodes": [)";
  for (size_t i = 0; i < nodes; ++i) {
    if (i > 0) json += ",";
    json += R"({"name": "PC-)" + std::to_string(i) + R"(", "console_host": "0.0.0.0", "console": )" + std::to_string(6000 + i) + "}";
  }
  json += R"(, {"name": "PC-noport"}]})";

  const auto    path = dir / "config.json";
  std::ofstream out(path);
  out << json;
  return path;
}

void TestHungNodeDoesNotHoldBackOthers() {
  constexpr size_t kNodes = 6;
  FleetConfigStore store(WriteFleet(kNodes));

  FakeConnector connector;
  for (size_t i = 0; i < kNodes; ++i) {
    const bool silent = i == 2;
    const auto name   = "PC-" + std::to_string(i);
    connector.Add(static_cast<std::uint16_t>(6000 + i), [silent, name](const std::string&) -> std::optional<Reply> {
      if (silent) return std::nullopt;
      return Reply{name, 0};
    });
  }

  FleetDispatcher dispatcher(connector, store, DispatchOptions{"", 1000ms});

  std::vector<std::unique_ptr<FleetJob>> jobs;
  for (size_t i = 0; i < kNodes; ++i) {
    jobs.push_back(std::make_unique<HostnameJob>("PC-" + std::to_string(i), 300ms));
  }
  jobs.push_back(std::make_unique<HostnameJob>("PC-unknown", 300ms));
  jobs.push_back(std::make_unique<HostnameJob>("PC-noport", 300ms));

  const auto started = std::chrono::steady_clock::now();
  auto       results = dispatcher.Run(jobs, 3);
  assert(std::chrono::steady_clock::now() - started < 3000ms);

  assert(results.size() == jobs.size());
  for (size_t i = 0; i < kNodes; ++i) {
    assert(results[i].node_name == "PC-" + std::to_string(i));
    if (i == 2) {
      assert(results[i].status == NodeStatus::kTimeout);
      assert(!results[i].error.empty());
    } else {
      assert(results[i].status == NodeStatus::kSucceeded);
      assert(results[i].output == "PC-" + std::to_string(i));
    }
  }
  assert(results[kNodes].node_name == "PC-unknown");
  assert(results[kNodes].status == NodeStatus::kFailed);
  assert(results[kNodes + 1].node_name == "PC-noport");
  assert(results[kNodes + 1].status == NodeStatus::kFailed);

  assert(g_peak.load() <= 3);

  // wildcard console hosts resolve to loopback
  for (const auto& endpoint : connector.Opened()) {
    assert(endpoint.host == "127.0.0.1");
  }
}

void TestHostOverrideAndEmptyRun() {
  FleetConfigStore store(WriteFleet(1));
  FakeConnector    connector;
  connector.Add(6000, [](const std::string&) -> std::optional<Reply> { return Reply{"PC-0", 0}; });

  FleetDispatcher dispatcher(connector, store, DispatchOptions{"http://192.168.56.101:3080", 1000ms});
  assert(dispatcher.Run({}, 4).empty());

  std::vector<std::unique_ptr<FleetJob>> jobs;
  jobs.push_back(std::make_unique<HostnameJob>("PC-0", 1000ms));
  auto results = dispatcher.Run(jobs, 0);
  assert(results.size() == 1 && results[0].status == NodeStatus::kSucceeded);
  assert(connector.Opened().back().host == "192.168.56.101");
}

} // namespace

int main() {
  spdlog::set_level(spdlog::level::err);

  TestHungNodeDoesNotHoldBackOthers();
  TestHostOverrideAndEmptyRun();

  std::cout << "labfleet_unit_fleet_dispatcher: pass\n";
  return 0;
}
