#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "api/labfleet/v1.hpp"
#include "internal/util/errors.hpp"

namespace {

using labfleet::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "labfleet_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestSectionsAndDefaults() {
  const auto yaml_path = WriteYaml("sections",
                                   R"(fleet:
  config_path: "/srv/lab/config.generated.json"
  console_host_override: "192.168.56.101"
console:
  connect_timeout_ms: 2500
provisioning:
  strategies: [udhcpc, dhclient]
  dhcp_warmup_ms: 3000
  firewall:
    syn_hitcount: 10
dispatch:
  concurrency: 8
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.fleet().config_path() == "/srv/lab/config.generated.json");
  assert(config.fleet().console_host_override() == "192.168.56.101");
  assert(config.console().connect_timeout_ms() == 2500);
  assert(config.provisioning().strategies_size() == 2);
  assert(config.provisioning().strategies(0) == "udhcpc");
  assert(config.provisioning().dhcp_warmup_ms() == 3000);
  assert(config.provisioning().firewall().syn_hitcount() == 10);
  assert(config.dispatch().concurrency() == 8);

  // untouched settings fall back to defaults
  assert(config.fleet().static_plan_path() == "ip_plan.yaml");
  assert(config.console().newline() == "\r");
  assert(config.provisioning().default_interface() == "eth0");
  assert(config.provisioning().firewall().syn_window_seconds() == 1);
  assert(config.provisioning().firewall().udp_hitcount() == 60);
  assert(config.dispatch().upload_chunk_size() == 512);
}

void TestEmptyFileIsAllDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.provisioning().strategies_size() == 3);
  assert(config.provisioning().strategies(0) == "dhclient");
  assert(config.provisioning().strategies(2) == "dhcpcd");
  assert(config.dispatch().concurrency() == 5);
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(fleet:
  console_host_override: "10"
logging:
  level: "debug"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.fleet().console_host_override() == "10");
  assert(config.logging().level() == "debug");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(fleet:
  config_path: "x.json"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const labfleet::util::ParseError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsNotFound() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/labfleet/runtime.yaml");
  } catch (const labfleet::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestOtherMessagesLoadThroughYaml() {
  const auto yaml_path = WriteYaml("jobs",
                                   R"(concurrency: 2
jobs:
  - node_name: Workstation-1
    local_path: hello.sh
    remote_path: /tmp/hello.sh
    run_after_upload: true
    timeout_seconds: 2.5
)");

  labfleet::v1::ScriptJobFile file;
  ConfigLoader::LoadMessageFromYaml(yaml_path.string(), &file);
  assert(file.concurrency() == 2);
  assert(file.jobs_size() == 1);
  assert(file.jobs(0).run_after_upload());
  assert(file.jobs(0).timeout_seconds() == 2.5);
  assert(!file.jobs(0).has_overwrite());
}

} // namespace

int main() {
  TestSectionsAndDefaults();
  TestEmptyFileIsAllDefaults();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsNotFound();
  TestOtherMessagesLoadThroughYaml();

  std::cout << "labfleet_unit_config_loader: pass\n";
  return 0;
}
