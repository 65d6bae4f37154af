#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace labfleet::config {

using labfleet::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("!" is yaml-cpp's non-plain tag)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

void ConfigLoader::LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message) {
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("file not found: " + path);
  }

  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ParseError("Failed to load YAML from " + path + ": " + std::string(e.what()));
  }

  if (yaml.IsNull()) {
    message->Clear();
    return;
  }
  if (!yaml.IsMap()) {
    throw util::ParseError("Top level of " + path + " must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ParseError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);

  if (!status.ok()) {
    throw util::ParseError("Invalid document " + path + ": " + std::string(status.message()));
  }
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  RuntimeConfig config;
  LoadMessageFromYaml(path, &config);
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* fleet = config->mutable_fleet();
  if (fleet->config_path().empty()) fleet->set_config_path("config.generated.json");
  if (fleet->static_plan_path().empty()) fleet->set_static_plan_path("ip_plan.yaml");
  if (fleet->scripts_dir().empty()) fleet->set_scripts_dir("scripts");

  auto* console = config->mutable_console();
  if (console->connect_timeout_ms() == 0) console->set_connect_timeout_ms(10000);
  if (console->newline().empty()) console->set_newline("\r");
  if (console->exit_command().empty()) console->set_exit_command("exit");
  if (console->read_poll_interval_ms() == 0) console->set_read_poll_interval_ms(100);

  auto* provisioning = config->mutable_provisioning();
  if (provisioning->strategies().empty()) {
    provisioning->add_strategies("dhclient");
    provisioning->add_strategies("udhcpc");
    provisioning->add_strategies("dhcpcd");
  }
  if (provisioning->attempt_timeout_ms() == 0) provisioning->set_attempt_timeout_ms(15000);
  if (provisioning->default_interface().empty()) provisioning->set_default_interface("eth0");
  if (provisioning->dhcp_start_command().empty()) provisioning->set_dhcp_start_command("/usr/local/bin/start.sh");
  if (provisioning->dhcp_start_read_ms() == 0) provisioning->set_dhcp_start_read_ms(5000);
  if (provisioning->node_timeout_ms() == 0) provisioning->set_node_timeout_ms(180000);

  auto* firewall = provisioning->mutable_firewall();
  if (firewall->syn_hitcount() == 0) firewall->set_syn_hitcount(15);
  if (firewall->syn_window_seconds() == 0) firewall->set_syn_window_seconds(1);
  if (firewall->udp_hitcount() == 0) firewall->set_udp_hitcount(60);
  if (firewall->udp_window_seconds() == 0) firewall->set_udp_window_seconds(1);

  auto* dispatch = config->mutable_dispatch();
  if (dispatch->concurrency() == 0) dispatch->set_concurrency(5);
  if (dispatch->default_timeout_ms() == 0) dispatch->set_default_timeout_ms(10000);
  if (dispatch->upload_chunk_size() == 0) dispatch->set_upload_chunk_size(512);
}

} // namespace labfleet::config
