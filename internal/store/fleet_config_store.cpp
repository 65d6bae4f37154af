#include "fleet_config_store.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <google/protobuf/util/json_util.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_set>

#include "api/labfleet/v1.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ip_address.hpp"

namespace labfleet::store {

using namespace labfleet::v1;

namespace {

model::Node FromRecord(const NodeRecord& record) {
  model::Node node;
  node.name          = record.name();
  node.node_id       = record.node_id();
  node.console_host  = record.console_host();
  node.console_port  = static_cast<std::uint16_t>(record.console_port());
  node.template_name = record.template_name();
  if (record.has_assigned_ip()) node.assigned_ip = record.assigned_ip();
  if (record.has_gateway()) node.gateway = record.gateway();
  return node;
}

void ToRecord(const model::Node& node, NodeRecord* record) {
  record->set_name(node.name);
  record->set_node_id(node.node_id);
  record->set_console_host(node.console_host);
  record->set_console_port(node.console_port);
  record->set_template_name(node.template_name);
  if (node.assigned_ip) record->set_assigned_ip(*node.assigned_ip);
  if (node.gateway) record->set_gateway(*node.gateway);
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::NotFound("cannot open " + path.string());
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

std::string Errno(const std::string& what, const std::filesystem::path& path) {
  return what + " " + path.string() + ": " + std::strerror(errno);
}

/*
  Atomic replace:
      mkstemp (same dir) -> write -> fsync -> rename -> fsync dir
*/
void WriteAtomically(const std::filesystem::path& path, const std::string& bytes) {
  auto dir = path.parent_path();
  if (dir.empty()) dir = ".";

  std::string tmpl = (dir / ("." + path.filename().string() + ".tmpXXXXXX")).string();
  int         fd   = ::mkstemp(tmpl.data());
  if (fd < 0) {
    throw util::PersistenceError(Errno("cannot create temp file for", path));
  }

  auto fail = [&](const std::string& what) {
    const std::string message = Errno(what, tmpl);
    ::close(fd);
    ::unlink(tmpl.c_str());
    throw util::PersistenceError(message);
  };

  size_t written = 0;
  while (written < bytes.size()) {
    ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      fail("write failed on");
    }
    written += static_cast<size_t>(n);
  }
  if (::fchmod(fd, 0644) != 0) fail("chmod failed on");
  if (::fsync(fd) != 0) fail("fsync failed on");
  if (::close(fd) != 0) {
    const std::string message = Errno("close failed on", tmpl);
    ::unlink(tmpl.c_str());
    throw util::PersistenceError(message);
  }

  if (::rename(tmpl.c_str(), path.c_str()) != 0) {
    const std::string message = Errno("rename failed onto", path);
    ::unlink(tmpl.c_str());
    throw util::PersistenceError(message);
  }

  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd >= 0) {
    ::fsync(dir_fd);
    ::close(dir_fd);
  }
}

void Validate(const model::Node& node) {
  if (node.assigned_ip && !util::IsValidIpAddress(*node.assigned_ip)) {
    throw util::InvalidArgument("node " + node.name + ": invalid assigned_ip '" + *node.assigned_ip + "'");
  }
  if (node.gateway && !util::IsValidIpAddress(*node.gateway)) {
    throw util::InvalidArgument("node " + node.name + ": invalid gateway '" + *node.gateway + "'");
  }
}

bool SameFields(const model::Node& a, const model::Node& b) {
  return a.node_id == b.node_id && a.console_host == b.console_host && a.console_port == b.console_port &&
         a.template_name == b.template_name && a.assigned_ip == b.assigned_ip && a.gateway == b.gateway;
}

} // namespace

// ------------------------------------------------------------
// Static file operations
// ------------------------------------------------------------

std::filesystem::path FleetConfigStore::BackupPath(const std::filesystem::path& path) {
  auto backup = path;
  backup.replace_filename(path.stem().string() + ".backup" + path.extension().string());
  return backup;
}

model::FleetConfig FleetConfigStore::Parse(const std::string& json, const std::string& source) {
  FleetDocument document;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &document, options);
  if (!status.ok()) {
    throw util::ParseError("Invalid fleet config " + source + ": " + std::string(status.message()));
  }

  model::FleetConfig config;
  config.project_name = document.project_name();
  config.project_id   = document.project_id();

  std::unordered_set<std::string> seen;
  for (const auto& record : document.nodes()) {
    if (record.name().empty()) {
      throw util::ParseError("Invalid fleet config " + source + ": node without a name");
    }
    if (!seen.insert(record.name()).second) {
      throw util::ParseError("Invalid fleet config " + source + ": duplicate node '" + record.name() + "'");
    }
    if (record.console_port() > std::numeric_limits<std::uint16_t>::max()) {
      throw util::ParseError("Invalid fleet config " + source + ": node " + record.name() + " console port out of range");
    }

    auto node = FromRecord(record);
    try {
      Validate(node);
    } catch (const util::InvalidArgument& e) {
      throw util::ParseError("Invalid fleet config " + source + ": " + e.what());
    }
    config.nodes.push_back(std::move(node));
  }
  return config;
}

std::string FleetConfigStore::Serialize(const model::FleetConfig& config) {
  FleetDocument document;
  document.set_project_name(config.project_name);
  document.set_project_id(config.project_id);
  for (const auto& node : config.nodes) {
    ToRecord(node, document.add_nodes());
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(document, &json, options);
  if (!status.ok()) {
    throw util::PersistenceError("cannot serialize fleet config: " + std::string(status.message()));
  }
  return json;
}

model::FleetConfig FleetConfigStore::Load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("fleet config not found: " + path.string());
  }
  return Parse(ReadFile(path), path.string());
}

std::optional<std::filesystem::path> FleetConfigStore::BackUp(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return std::nullopt;

  std::string previous;
  try {
    previous = ReadFile(path);
  } catch (const util::NotFound& e) {
    throw util::PersistenceError(std::string("cannot back up fleet config: ") + e.what());
  }

  auto backup = BackupPath(path);
  WriteAtomically(backup, previous);
  return backup;
}

std::optional<std::filesystem::path> FleetConfigStore::Save(const model::FleetConfig& config, const std::filesystem::path& path) {
  const std::string json   = Serialize(config);
  auto              backup = BackUp(path);

  WriteAtomically(path, json);

  LABFLEET_LOG_INFO("Fleet config saved", {observability::StringField("path", path.string()),
                                           observability::StringField("backup", backup ? backup->string() : "")});
  return backup;
}

// ------------------------------------------------------------
// Store instance
// ------------------------------------------------------------

FleetConfigStore::FleetConfigStore(std::filesystem::path path) : path_(std::move(path)), config_(Load(path_)) {
}

model::FleetConfig FleetConfigStore::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return config_;
}

std::optional<model::Node> FleetConfigStore::FindNode(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (const auto* node = config_.Find(name)) return *node;
  return std::nullopt;
}

void FleetConfigStore::UpdateNode(const std::string& name, const std::function<void(model::Node&)>& mutator) {
  std::lock_guard<std::mutex> lock(mu_);

  for (auto& node : config_.nodes) {
    if (node.name != name) continue;

    model::Node updated = node;
    mutator(updated);
    if (updated.name != node.name) {
      throw util::InvalidArgument("node " + name + " cannot be renamed to " + updated.name);
    }
    Validate(updated);

    if (!SameFields(node, updated)) {
      node     = std::move(updated);
      changed_ = true;
    }
    return;
  }
  throw util::NotFound("node not found: " + name);
}

std::optional<std::filesystem::path> FleetConfigStore::Save() {
  std::lock_guard<std::mutex> lock(save_mu_);

  const std::string json = Serialize(Snapshot());
  if (!backed_up_) {
    backup_    = BackUp(path_);
    backed_up_ = true;
  }
  WriteAtomically(path_, json);

  LABFLEET_LOG_DEBUG("Fleet config persisted", {observability::StringField("path", path_.string())});
  return backup_;
}

bool FleetConfigStore::changed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return changed_;
}

} // namespace labfleet::store
