#include <iostream>
#include <string>
#include <vector>

#include "internal/classify/node_classifier.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

static void Usage() {
  std::cerr << "Usage:\n"
            << "  labfleet --config <runtime.yaml> provision\n"
            << "  labfleet --config <runtime.yaml> push <jobs.yaml>\n"
            << "  labfleet --config <runtime.yaml> show\n";
}

static void Shutdown() {
  labfleet::observability::ShutdownLogging();
  labfleet::observability::ShutdownMetrics();
  labfleet::observability::ShutdownTracing();
}

static void Show(const labfleet::factory::Application& app) {
  const auto fleet = app.store->Snapshot();
  std::cout << "project " << fleet.project_name << " (" << fleet.project_id << ")\n";
  for (const auto& node : fleet.nodes) {
    std::cout << node.name << "\t" << labfleet::model::ToString(labfleet::classify::Classify(node.name)) << "\t"
              << node.console_host << ":" << node.console_port << "\t" << node.assigned_ip.value_or("-") << "\t"
              << node.gateway.value_or("-") << "\n";
  }
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.size() < 3 || args[0] != "--config") {
    Usage();
    return 1;
  }

  const std::string& config_path = args[1];
  const std::string& command     = args[2];
  if (!((command == "provision" && args.size() == 3) || (command == "show" && args.size() == 3) ||
        (command == "push" && args.size() == 4))) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = labfleet::config::ConfigLoader::LoadFromYaml(config_path);

    labfleet::observability::InitializeTracing(config);
    labfleet::observability::InitializeMetrics(config);
    labfleet::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = labfleet::factory::Build(config);

    if (command == "show") {
      Show(app);
      Shutdown();
      return 0;
    }

    auto report = command == "provision" ? labfleet::factory::RunProvisioning(app) : labfleet::factory::RunScripts(app, args[3]);
    std::cout << labfleet::report::ToJson(report) << std::endl;

    LABFLEET_LOG_INFO("Run finished", {labfleet::observability::StringField("kind", report.kind),
                                       labfleet::observability::IntField("nodes", static_cast<std::int64_t>(report.nodes.size()))});
    Shutdown();
    return report.save_error.empty() ? 0 : 2;
  } catch (const std::exception& e) {
    LABFLEET_LOG_ERROR("Fatal error", {labfleet::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }
}
