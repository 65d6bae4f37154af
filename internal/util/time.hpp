#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace labfleet::util {

/*
  Time utilities. Single place to control the clock source.

  Wall-clock values go into reports; deadlines use the steady clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t ToUnixMillis(TimePoint tp);

/*
  Deadline for one node workflow.

  A default-constructed Deadline never expires.
*/
class Deadline {
 public:
  using SteadyClock = std::chrono::steady_clock;

  Deadline() = default;
  explicit Deadline(std::chrono::milliseconds budget);

  bool Expired() const;

  // Remaining budget, never negative. Unbounded deadlines return `cap`.
  std::chrono::milliseconds Remaining(std::chrono::milliseconds cap) const;

  // min(requested, remaining)
  std::chrono::milliseconds Clamp(std::chrono::milliseconds requested) const;

  bool Bounded() const {
    return bounded_;
  }

 private:
  bool                    bounded_ = false;
  SteadyClock::time_point expires_at_{};
};

} // namespace labfleet::util
