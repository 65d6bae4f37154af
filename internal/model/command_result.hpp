#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace labfleet::model {

/*
  Outcome of one console interaction. Never mutated after creation.

  exit_code is present when the command's end-of-command sentinel was seen;
  timed_out means the read window elapsed first and captured_output holds
  whatever arrived until then.
*/
struct CommandResult {
  std::string               node_name;
  std::string               command;
  std::string               captured_output;
  bool                      succeeded = false;
  std::optional<int>        exit_code;
  bool                      timed_out = false;
  std::chrono::milliseconds elapsed{0};
};

} // namespace labfleet::model
