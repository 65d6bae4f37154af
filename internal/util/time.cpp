#include "time.hpp"

#include <algorithm>

namespace labfleet::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Deadline::Deadline(std::chrono::milliseconds budget) : bounded_(true), expires_at_(SteadyClock::now() + budget) {
}

bool Deadline::Expired() const {
  return bounded_ && SteadyClock::now() >= expires_at_;
}

std::chrono::milliseconds Deadline::Remaining(std::chrono::milliseconds cap) const {
  if (!bounded_) return cap;

  // rounded up: a read clamped to this value must end at or past the deadline
  auto left = std::chrono::ceil<std::chrono::milliseconds>(expires_at_ - SteadyClock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

std::chrono::milliseconds Deadline::Clamp(std::chrono::milliseconds requested) const {
  return std::min(requested, Remaining(requested));
}

} // namespace labfleet::util
