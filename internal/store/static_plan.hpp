#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/static_plan_entry.hpp"

namespace labfleet::fleet::v1 {
class StaticPlan;
}

namespace labfleet::store {

/*
  Read-only fallback addressing table keyed by (node, interface).

  Loaded once per run. A missing entry is not an error here; callers decide
  what a miss means.
*/
class StaticPlan {
 public:
  StaticPlan() = default;

  // YAML (or JSON). Throws util::NotFound / util::ParseError.
  static StaticPlan Load(const std::string& path);
  static StaticPlan FromProto(const labfleet::fleet::v1::StaticPlan& proto);

  void Add(const std::string& node_name, model::StaticPlanEntry entry);

  std::optional<model::StaticPlanEntry> Find(const std::string& node_name, const std::string& interface_name) const;

  // Every entry listed for the node, in plan order.
  std::vector<model::StaticPlanEntry> Entries(const std::string& node_name) const;

  // First interface listed for the node, if any.
  std::optional<std::string> FirstInterface(const std::string& node_name) const;

  size_t size() const {
    return entries_.size();
  }

 private:
  std::map<std::string, std::vector<model::StaticPlanEntry>> entries_;
};

} // namespace labfleet::store
