#include "run_report.hpp"

#include <google/protobuf/util/json_util.h>

#include "api/labfleet/v1.hpp"
#include "internal/util/errors.hpp"

namespace labfleet::report {

namespace {

void ToProto(const model::CommandResult& result, labfleet::v1::CommandRecord* out) {
  out->set_command(result.command);
  out->set_output(result.captured_output);
  out->set_succeeded(result.succeeded);
  if (result.exit_code) out->set_exit_code(*result.exit_code);
  out->set_timed_out(result.timed_out);
  out->set_elapsed_ms(static_cast<uint64_t>(result.elapsed.count()));
}

void ToProto(const model::NodeReport& node, labfleet::v1::NodeReportRecord* out) {
  out->set_node_name(node.node_name);
  out->set_role(std::string(model::ToString(node.role)));
  out->set_status(std::string(model::ToString(node.status)));
  out->set_assigned_ip(node.assigned_ip.value_or(""));
  out->set_gateway(node.gateway.value_or(""));
  out->set_strategy(node.strategy);
  out->set_error(node.error);
  for (const auto& command : node.commands) {
    ToProto(command, out->add_commands());
  }
  if (node.exit_code) out->set_exit_code(*node.exit_code);
  out->set_output(node.output);
  out->set_upload_skipped(node.upload_skipped);
}

} // namespace

const model::NodeReport* RunReport::Find(const std::string& node_name) const {
  for (const auto& node : nodes) {
    if (node.node_name == node_name) return &node;
  }
  return nullptr;
}

labfleet::v1::RunReport ToProto(const RunReport& report) {
  labfleet::v1::RunReport out;
  out.set_kind(report.kind);
  for (const auto& node : report.nodes) {
    ToProto(node, out.add_nodes());
  }
  out.set_config_changed(report.config_changed);
  out.set_backup_path(report.backup_path.value_or(""));
  out.set_save_error(report.save_error);
  *out.mutable_started_at()  = util::ToProto(report.started_at);
  *out.mutable_finished_at() = util::ToProto(report.finished_at);
  return out;
}

std::string ToJson(const RunReport& report) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(report), &json, options);
  if (!status.ok()) {
    throw util::InvalidArgument("cannot render run report: " + std::string(status.message()));
  }
  return json;
}

} // namespace labfleet::report
