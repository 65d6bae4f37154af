#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace labfleet::model {

/*
  Unit of script dispatch for one node. Immutable once submitted.

  local_source holds the script content; nullopt means the script is already
  on the node and only the run step applies.
*/
struct ScriptJob {
  std::string                node_name;
  std::optional<std::string> local_source;
  std::string                remote_path;
  bool                       run_after_upload = false;
  bool                       executable       = true;
  bool                       overwrite        = true;
  std::chrono::milliseconds  timeout{10000};
  std::string                shell = "sh";
};

} // namespace labfleet::model
