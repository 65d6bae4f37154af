#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/model/node.hpp"
#include "internal/model/script_job.hpp"

namespace labfleet::fleet::v1 {
class ScriptJobFile;
}

namespace labfleet::scripts {

struct ScriptJobBatch {
  std::vector<model::ScriptJob> jobs;
  // 0 means "use the configured default".
  std::uint32_t concurrency = 0;
};

/*
  Turns a job file into validated ScriptJobs. Everything is checked before
  any node is contacted:

      node_name    must exist in the fleet, at most one job per node
      local_path   must resolve inside scripts_dir (empty: run-only job)
      remote_path  absolute, no quotes or line breaks
      shell        plain program name or path

  Throws util::InvalidArgument, or util::NotFound for a missing script.
*/
class ScriptJobLoader {
 public:
  ScriptJobLoader(std::filesystem::path scripts_dir, std::chrono::milliseconds default_timeout);

  // YAML (or JSON) job file. Throws util::NotFound / util::ParseError too.
  ScriptJobBatch Load(const std::string& path, const model::FleetConfig& fleet) const;

  ScriptJobBatch Build(const labfleet::fleet::v1::ScriptJobFile& file, const model::FleetConfig& fleet) const;

  std::filesystem::path ResolveLocal(const std::string& local_path) const;

 private:
  std::filesystem::path     scripts_dir_;
  std::chrono::milliseconds default_timeout_;
};

// Absolute, no quotes, no line breaks, not a directory path.
bool IsSafeRemotePath(const std::string& path);

} // namespace labfleet::scripts
