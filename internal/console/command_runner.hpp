#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "internal/console/console_session.hpp"
#include "internal/model/command_result.hpp"

namespace labfleet::console {

/*
  Runs shell commands over a ConsoleSession and separates each command's
  output and exit status from echo and prompt noise.

  Every command is followed by a printf of a per-command token and "$?". The
  token is split in two shell words so the console's echo of the input line
  never matches the marker.
*/
class CommandRunner {
 public:
  CommandRunner(ConsoleSession& session, std::string node_name);

  // Reads until the end-of-command marker or `timeout`. A missing marker
  // yields timed_out with the partial capture.
  model::CommandResult Run(const std::string& command, std::chrono::milliseconds timeout);

  // Fire and capture: sends the line and keeps whatever arrives in `window`.
  // Used for commands that never return to a prompt (daemons).
  model::CommandResult SendAndCapture(const std::string& command, std::chrono::milliseconds window);

  // Drains banners and pending prompts after connecting.
  void Settle(std::chrono::milliseconds window);

  const std::string& node_name() const {
    return node_name_;
  }

 private:
  model::CommandResult Finish(const std::string& command, std::string output, std::chrono::steady_clock::time_point started);

  ConsoleSession& session_;
  std::string     node_name_;
};

// First word of a command line, used as the step label in metrics.
std::string_view CommandStep(std::string_view command);

} // namespace labfleet::console
