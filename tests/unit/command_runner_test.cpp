#include "internal/console/command_runner.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/console/deadline_session.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/support/fake_console.hpp"

namespace {

using namespace std::chrono_literals;
using labfleet::console::CommandRunner;
using labfleet::console::DeadlineSession;
using labfleet::testing::FakeSession;
using labfleet::testing::Reply;

std::shared_ptr<std::vector<std::string>> Log() {
  return std::make_shared<std::vector<std::string>>();
}

void TestExitStatusAndOutputAreSeparated() {
  auto        log = Log();
  FakeSession session(
      [](const std::string& command) -> std::optional<Reply> {
        if (command == "uname -s") return Reply{"Linux", 0};
        return Reply{"oops", 3};
      },
      log);

  CommandRunner runner(session, "Workstation-1");
  runner.Settle(10ms);

  auto ok = runner.Run("uname -s", 1000ms);
  assert(ok.succeeded);
  assert(ok.exit_code && *ok.exit_code == 0);
  assert(!ok.timed_out);
  assert(ok.captured_output == "Linux");
  assert(ok.node_name == "Workstation-1");
  assert(ok.command == "uname -s");

  auto bad = runner.Run("false", 1000ms);
  assert(!bad.succeeded);
  assert(bad.exit_code && *bad.exit_code == 3);
  assert(bad.captured_output == "oops");

  assert(log->size() == 2);
  assert((*log)[0] == "uname -s");
}

void TestMissingMarkerIsTimeoutWithPartialCapture() {
  auto        log = Log();
  FakeSession session([](const std::string&) -> std::optional<Reply> { return std::nullopt; }, log);

  CommandRunner runner(session, "Workstation-1");
  auto          result = runner.Run("dhclient -v -1 eth0", 50ms);
  assert(result.timed_out);
  assert(!result.succeeded);
  assert(!result.exit_code);
}

void TestSendAndCaptureKeepsWindowOutput() {
  auto        log = Log();
  FakeSession session([](const std::string&) -> std::optional<Reply> { return Reply{"dnsmasq: started", 0}; }, log);

  CommandRunner runner(session, "DHCP-1");
  auto          result = runner.SendAndCapture("/usr/local/bin/start.sh", 10ms);
  assert(result.succeeded);
  assert(!result.exit_code);
  assert(result.captured_output.find("dnsmasq: started") != std::string::npos);
  assert(result.captured_output.find("/usr/local/bin/start.sh") == std::string::npos);
}

void TestDeadlineSessionAbandonsSilentConsole() {
  auto        log = Log();
  FakeSession inner([](const std::string&) -> std::optional<Reply> { return std::nullopt; }, log);

  DeadlineSession session(inner, labfleet::util::Deadline(100ms), "Workstation-2");
  CommandRunner   runner(session, "Workstation-2");

  const auto started = std::chrono::steady_clock::now();
  bool       threw   = false;
  try {
    (void)runner.Run("sleep 100", 10000ms);
  } catch (const labfleet::util::TimeoutError&) {
    threw = true;
  }
  assert(threw);
  assert(std::chrono::steady_clock::now() - started < 2000ms);

  threw = false;
  try {
    session.SendLine("echo again");
  } catch (const labfleet::util::TimeoutError&) {
    threw = true;
  }
  assert(threw);
}

void TestDeadlineSessionPassesMatchedReads() {
  auto        log = Log();
  FakeSession inner([](const std::string&) -> std::optional<Reply> { return Reply{"", 0}; }, log);

  DeadlineSession session(inner, labfleet::util::Deadline(5000ms), "Workstation-3");
  CommandRunner   runner(session, "Workstation-3");
  auto            result = runner.Run("true", 1000ms);
  assert(result.succeeded);
}

void TestCommandStep() {
  assert(labfleet::console::CommandStep("ip addr flush dev eth0") == "ip");
  assert(labfleet::console::CommandStep("  iptables -A INPUT") == "iptables");
  assert(labfleet::console::CommandStep("") == "command");
}

} // namespace

int main() {
  TestExitStatusAndOutputAreSeparated();
  TestMissingMarkerIsTimeoutWithPartialCapture();
  TestSendAndCaptureKeepsWindowOutput();
  TestDeadlineSessionAbandonsSilentConsole();
  TestDeadlineSessionPassesMatchedReads();
  TestCommandStep();

  std::cout << "labfleet_unit_command_runner: pass\n";
  return 0;
}
