#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace labfleet::model {

// Operator-authored fallback address for one (node, interface).
struct StaticPlanEntry {
  std::string                interface_name;
  std::string                ip;
  std::optional<std::string> gateway;
  std::uint32_t              prefix_length = 24;
};

} // namespace labfleet::model
