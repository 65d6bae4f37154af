#include "deadline_session.hpp"

#include "internal/util/errors.hpp"

namespace labfleet::console {

DeadlineSession::DeadlineSession(ConsoleSession& inner, util::Deadline deadline, std::string node_name)
    : inner_(inner), deadline_(deadline), node_name_(std::move(node_name)) {
}

DeadlineSession::DeadlineSession(std::unique_ptr<ConsoleSession> inner, util::Deadline deadline, std::string node_name)
    : owned_(std::move(inner)), inner_(*owned_), deadline_(deadline), node_name_(std::move(node_name)) {
}

void DeadlineSession::ThrowIfExpired() {
  if (expired_ || deadline_.Expired()) {
    expired_ = true;
    throw util::TimeoutError("node " + node_name_ + " exceeded its time budget");
  }
}

void DeadlineSession::SendLine(std::string_view text) {
  ThrowIfExpired();
  inner_.SendLine(text);
}

ReadResult DeadlineSession::ReadUntil(const std::regex* pattern, std::chrono::milliseconds timeout) {
  ThrowIfExpired();

  const auto clamped = deadline_.Clamp(timeout);
  auto       result  = inner_.ReadUntil(pattern, clamped);
  if (!result.matched && clamped < timeout) {
    expired_ = true;
    throw util::TimeoutError("node " + node_name_ + " exceeded its time budget");
  }
  return result;
}

void DeadlineSession::Close() {
  inner_.Close();
}

} // namespace labfleet::console
