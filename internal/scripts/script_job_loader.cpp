#include "script_job_loader.hpp"

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

#include "api/labfleet/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/shell.hpp"

namespace labfleet::scripts {

namespace {

std::string ReadScript(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::NotFound("script not found: " + path.string());
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  auto r = root.begin();
  auto c = candidate.begin();
  for (; r != root.end(); ++r, ++c) {
    if (r->empty()) continue; // trailing separator
    if (c == candidate.end() || *r != *c) return false;
  }
  return c != candidate.end();
}

} // namespace

bool IsSafeRemotePath(const std::string& path) {
  if (path.size() < 2 || path.front() != '/' || path.back() == '/') return false;
  return path.find_first_of("'\"`\r\n\\") == std::string::npos && path.find('\0') == std::string::npos;
}

ScriptJobLoader::ScriptJobLoader(std::filesystem::path scripts_dir, std::chrono::milliseconds default_timeout)
    : scripts_dir_(std::move(scripts_dir)), default_timeout_(default_timeout) {
}

std::filesystem::path ScriptJobLoader::ResolveLocal(const std::string& local_path) const {
  const auto root      = std::filesystem::weakly_canonical(std::filesystem::absolute(scripts_dir_));
  const auto candidate = std::filesystem::weakly_canonical(root / local_path);
  if (!IsWithin(root, candidate)) {
    throw util::InvalidArgument("script path escapes the scripts directory: " + local_path);
  }
  return candidate;
}

ScriptJobBatch ScriptJobLoader::Load(const std::string& path, const model::FleetConfig& fleet) const {
  labfleet::v1::ScriptJobFile file;
  config::ConfigLoader::LoadMessageFromYaml(path, &file);
  return Build(file, fleet);
}

ScriptJobBatch ScriptJobLoader::Build(const labfleet::v1::ScriptJobFile& file, const model::FleetConfig& fleet) const {
  ScriptJobBatch batch;
  batch.concurrency = file.concurrency();

  // A node's console carries one session at a time.
  std::set<std::string> targeted;

  for (int i = 0; i < file.jobs_size(); ++i) {
    const auto&       entry = file.jobs(i);
    const std::string where = "job " + std::to_string(i) + " (" + entry.node_name() + ")";

    if (fleet.Find(entry.node_name()) == nullptr) {
      throw util::InvalidArgument(where + ": unknown node");
    }
    if (!targeted.insert(entry.node_name()).second) {
      throw util::InvalidArgument(where + ": node already has a job in this file");
    }
    if (!IsSafeRemotePath(entry.remote_path())) {
      throw util::InvalidArgument(where + ": remote_path must be absolute and free of quotes or line breaks");
    }
    if (!std::isfinite(entry.timeout_seconds()) || entry.timeout_seconds() < 0) {
      throw util::InvalidArgument(where + ": timeout_seconds must be a non-negative number");
    }

    model::ScriptJob job;
    job.node_name        = entry.node_name();
    job.remote_path      = entry.remote_path();
    job.run_after_upload = entry.run_after_upload();
    job.executable       = entry.has_executable() ? entry.executable() : true;
    job.overwrite        = entry.has_overwrite() ? entry.overwrite() : true;
    job.shell            = entry.shell().empty() ? "sh" : entry.shell();
    job.timeout          = entry.timeout_seconds() > 0
                               ? std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(entry.timeout_seconds() * 1000.0)))
                               : default_timeout_;

    if (!util::IsPlainProgram(job.shell)) {
      throw util::InvalidArgument(where + ": shell must be a plain program name or path");
    }
    if (!entry.local_path().empty()) {
      job.local_source = ReadScript(ResolveLocal(entry.local_path()));
    }

    batch.jobs.push_back(std::move(job));
  }
  return batch;
}

} // namespace labfleet::scripts
