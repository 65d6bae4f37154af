#include "script_push_job.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/shell.hpp"

namespace labfleet::scripts {

using observability::NodeField;
using observability::StringField;
using util::ShellQuote;

namespace {

// test, mkdir, truncate, decode, chmod
constexpr int kUploadSteps = 5;

} // namespace

ScriptPushJob::ScriptPushJob(model::ScriptJob job, ScriptPushOptions options) : job_(std::move(job)), options_(options) {
  if (options_.chunk_size == 0) options_.chunk_size = 512;
}

std::chrono::milliseconds ScriptPushJob::timeout() const {
  auto budget = job_.timeout + options_.settle_window + options_.step_timeout;
  if (job_.local_source) {
    const auto encoded = (job_.local_source->size() + 2) / 3 * 4;
    const auto chunks  = static_cast<int>((encoded + options_.chunk_size - 1) / options_.chunk_size);
    budget += options_.step_timeout * kUploadSteps + options_.step_timeout * chunks;
  }
  return budget;
}

bool ScriptPushJob::Step(console::CommandRunner& runner, model::NodeReport& report, const std::string& command) {
  auto       result = runner.Run(command, options_.step_timeout);
  const bool ok     = result.succeeded;
  if (!ok) {
    report.status = result.timed_out ? model::NodeStatus::kTimeout : model::NodeStatus::kFailed;
    report.error  = "upload step failed: " + command;
  }
  report.commands.push_back(std::move(result));
  return ok;
}

bool ScriptPushJob::Upload(console::CommandRunner& runner, model::NodeReport& report) {
  const auto& path   = job_.remote_path;
  const auto  staged = path + ".b64";

  if (!job_.overwrite) {
    auto check  = runner.Run("test -e " + ShellQuote(path), options_.step_timeout);
    const bool exists    = check.exit_code && *check.exit_code == 0;
    const bool timed_out = check.timed_out;
    report.commands.push_back(std::move(check));
    if (timed_out) {
      report.status = model::NodeStatus::kTimeout;
      report.error  = "upload step failed: test -e " + path;
      return false;
    }
    if (exists) {
      report.upload_skipped = true;
      report.error          = "exists";
      LABFLEET_LOG_INFO("Upload skipped, remote file exists", {NodeField(job_.node_name), StringField("path", path)});
      return true;
    }
  }

  const auto parent = std::filesystem::path(path).parent_path().string();
  if (!Step(runner, report, "mkdir -p " + ShellQuote(parent))) return false;
  if (!Step(runner, report, ": > " + ShellQuote(staged))) return false;

  const std::string encoded = util::Base64Encode(*job_.local_source);
  const std::size_t chunks  = (encoded.size() + options_.chunk_size - 1) / options_.chunk_size;
  for (std::size_t i = 0; i < chunks; ++i) {
    const auto chunk  = encoded.substr(i * options_.chunk_size, options_.chunk_size);
    auto       result = runner.Run("printf '%s' '" + chunk + "' >> " + ShellQuote(staged), options_.step_timeout);
    if (!result.succeeded) {
      report.status = result.timed_out ? model::NodeStatus::kTimeout : model::NodeStatus::kFailed;
      report.error  = "upload chunk " + std::to_string(i + 1) + "/" + std::to_string(chunks) + " failed";
      report.commands.push_back(std::move(result));
      return false;
    }
  }

  if (!Step(runner, report, "base64 -d " + ShellQuote(staged) + " > " + ShellQuote(path) + " && rm -f " + ShellQuote(staged))) {
    return false;
  }
  if (job_.executable && !Step(runner, report, "chmod +x " + ShellQuote(path))) return false;

  LABFLEET_LOG_INFO("Script uploaded", {NodeField(job_.node_name), StringField("path", path),
                                        observability::IntField("bytes", static_cast<std::int64_t>(job_.local_source->size()))});
  return true;
}

model::NodeReport ScriptPushJob::Execute(dispatch::NodeContext& ctx) {
  observability::SpanScope span("script.job");
  span.SetAttribute("node", job_.node_name);
  span.SetAttribute("remote_path", job_.remote_path);

  auto                   session = ctx.OpenSession();
  console::CommandRunner runner(*session, job_.node_name);
  runner.Settle(options_.settle_window);

  model::NodeReport report;
  report.node_name = job_.node_name;
  report.role      = ctx.role;
  report.status    = model::NodeStatus::kSucceeded;

  if (job_.local_source && !Upload(runner, report)) {
    span.RecordException(report.error);
    return report;
  }

  const bool run = job_.run_after_upload || !job_.local_source;
  if (!run) return report;

  auto result = runner.Run(job_.shell + " " + ShellQuote(job_.remote_path), job_.timeout);
  report.exit_code = result.exit_code;
  report.output    = result.captured_output;

  if (result.timed_out) {
    report.status = model::NodeStatus::kTimeout;
    report.error  = "script did not finish within " + std::to_string(job_.timeout.count()) + "ms";
  } else if (!result.succeeded) {
    report.status = model::NodeStatus::kFailed;
    report.error  = "script exited with status " + std::to_string(result.exit_code.value_or(-1));
  }
  report.commands.push_back(std::move(result));

  span.SetAttribute("exit_code", static_cast<std::int64_t>(report.exit_code.value_or(-1)));
  return report;
}

} // namespace labfleet::scripts
