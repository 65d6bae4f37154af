#pragma once

#include <memory>
#include <string>

#include "internal/console/console_session.hpp"
#include "internal/util/time.hpp"

namespace labfleet::console {

/*
  Clamps every read of the wrapped session to a node's remaining budget.

  Once the budget is spent, the next call throws util::TimeoutError, and so
  does a read that was cut short by the budget without matching. This is how
  a silent or hung console gets abandoned without blocking its worker.
*/
class DeadlineSession : public ConsoleSession {
 public:
  DeadlineSession(ConsoleSession& inner, util::Deadline deadline, std::string node_name);
  // Owning form: the wrapped session is closed and destroyed with this one.
  DeadlineSession(std::unique_ptr<ConsoleSession> inner, util::Deadline deadline, std::string node_name);

  void       SendLine(std::string_view text) override;
  ReadResult ReadUntil(const std::regex* pattern, std::chrono::milliseconds timeout) override;
  void       Close() override;

 private:
  void ThrowIfExpired();

  std::unique_ptr<ConsoleSession> owned_;
  ConsoleSession&                 inner_;
  util::Deadline                  deadline_;
  std::string                     node_name_;
  bool                            expired_ = false;
};

} // namespace labfleet::console
