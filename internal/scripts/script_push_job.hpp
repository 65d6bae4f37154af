#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "internal/console/command_runner.hpp"
#include "internal/dispatch/fleet_job.hpp"
#include "internal/model/script_job.hpp"

namespace labfleet::scripts {

struct ScriptPushOptions {
  std::size_t               chunk_size = 512;
  std::chrono::milliseconds step_timeout{10000};
  std::chrono::milliseconds settle_window{250};
};

/*
  Uploads a script through the node's console and optionally runs it.

  The content travels base64-encoded, appended in bounded chunks to
  "<remote>.b64" and decoded into place, so arbitrary bytes survive the line
  discipline of the console. With overwrite off and the file present, the
  upload is skipped but the run step still happens.

  The node budget is the job timeout plus a step allowance for the upload;
  the run step itself gets exactly the job timeout.
*/
class ScriptPushJob : public dispatch::FleetJob {
 public:
  ScriptPushJob(model::ScriptJob job, ScriptPushOptions options);

  const std::string& node_name() const override {
    return job_.node_name;
  }
  std::string_view kind() const override {
    return "script";
  }
  std::chrono::milliseconds timeout() const override;

  model::NodeReport Execute(dispatch::NodeContext& ctx) override;

 private:
  // False when a step failed; report carries the reason.
  bool Upload(console::CommandRunner& runner, model::NodeReport& report);
  bool Step(console::CommandRunner& runner, model::NodeReport& report, const std::string& command);

  model::ScriptJob  job_;
  ScriptPushOptions options_;
};

} // namespace labfleet::scripts
