#pragma once

#include <optional>
#include <string>

#include "turngate/persistence/persistence_adapter.h"

namespace turngate {

// Keeps the whole committed world in one JSON file (serialize_world_to_json
// format). Every persist() rewrites the file through a temp file + rename, so
// the file always holds either the previous or the new turn.
class JsonSnapshotStore : public PersistenceAdapter {
 public:
  explicit JsonSnapshotStore(std::string path, int indent = 2);

  // Replaces the file with `state`. Throws std::runtime_error.
  void write_snapshot(const WorldState& state);

  // A missing file loads as a default WorldState at turn 0.
  WorldState load() override;

  bool persist(const StateDelta& delta, std::string* error) override;

  const std::string& path() const { return path_; }

 private:
  const WorldState& current();

  std::string path_;
  int indent_;
  // Last state written or read; avoids re-parsing the file on every persist.
  std::optional<WorldState> cache_;
};

} // namespace turngate
