#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "internal/model/node.hpp"

namespace labfleet::store {

/*
  Authoritative file-backed record of the fleet.

  The document is JSON through protobuf's JSON mapping
  (labfleet.fleet.v1.FleetDocument). Saving first copies the current file to
  "<stem>.backup<ext>", then replaces the primary through a temp file in the
  same directory (write, fsync, rename, fsync dir), so a crash mid-save never
  leaves a truncated primary.

  Node fields change only through UpdateNode; updates and saves are
  serialized, so one store can be shared by every worker.

  A store instance covers one run: its first Save backs up the file as it was
  before the run, later saves (incremental persistence) only replace the
  primary, so the backup keeps the pre-run state.
*/
class FleetConfigStore {
 public:
  // Loads `path`. Throws util::NotFound / util::ParseError.
  explicit FleetConfigStore(std::filesystem::path path);

  FleetConfigStore(const FleetConfigStore&)            = delete;
  FleetConfigStore& operator=(const FleetConfigStore&) = delete;

  static model::FleetConfig Load(const std::filesystem::path& path);

  // Returns the backup path when a previous file existed and was preserved.
  // Throws util::PersistenceError.
  static std::optional<std::filesystem::path> Save(const model::FleetConfig& config, const std::filesystem::path& path);

  static std::filesystem::path BackupPath(const std::filesystem::path& path);

  // Copies the current file at `path` to BackupPath(path). Returns nullopt
  // when there is no file. Throws util::PersistenceError.
  static std::optional<std::filesystem::path> BackUp(const std::filesystem::path& path);

  static std::string        Serialize(const model::FleetConfig& config);
  static model::FleetConfig Parse(const std::string& json, const std::string& source);

  model::FleetConfig         Snapshot() const;
  std::optional<model::Node> FindNode(const std::string& name) const;

  // Throws util::NotFound for an unknown node, util::InvalidArgument when the
  // mutation renames the node or leaves an invalid address (node unchanged).
  void UpdateNode(const std::string& name, const std::function<void(model::Node&)>& mutator);

  // Persists the current snapshot to the store's own path. Returns the
  // backup taken by the first save of this store.
  std::optional<std::filesystem::path> Save();

  // True once any UpdateNode changed a stored value.
  bool changed() const;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;

  mutable std::mutex mu_;
  model::FleetConfig config_;
  bool               changed_ = false;

  std::mutex                           save_mu_;
  bool                                 backed_up_ = false;
  std::optional<std::filesystem::path> backup_;
};

} // namespace labfleet::store
