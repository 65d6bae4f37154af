#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/node_report.hpp"
#include "internal/util/time.hpp"

namespace labfleet::fleet::v1 {
class RunReport;
}

namespace labfleet::report {

/*
  Outcome of one provisioning or script run: exactly one entry per targeted
  node, in fleet (or submission) order.
*/
struct RunReport {
  std::string                    kind; // "provision" | "script"
  std::vector<model::NodeReport> nodes;

  bool                       config_changed = false;
  std::optional<std::string> backup_path;
  std::string                save_error;

  util::TimePoint started_at{};
  util::TimePoint finished_at{};

  const model::NodeReport* Find(const std::string& node_name) const;
};

labfleet::fleet::v1::RunReport ToProto(const RunReport& report);

// Pretty JSON through protobuf's JSON mapping, proto field names.
std::string ToJson(const RunReport& report);

} // namespace labfleet::report
