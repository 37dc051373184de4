#include "turngate/persistence/json_snapshot_store.h"

#include <stdexcept>
#include <utility>

#include "turngate/core/serialization.h"
#include "turngate/util/file_io.h"
#include "turngate/util/log.h"

namespace turngate {

JsonSnapshotStore::JsonSnapshotStore(std::string path, int indent) : path_(std::move(path)), indent_(indent) {}

const WorldState& JsonSnapshotStore::current() {
  if (!cache_) cache_ = file_exists(path_) ? deserialize_world_from_json(read_text_file(path_)) : WorldState{};
  return *cache_;
}

void JsonSnapshotStore::write_snapshot(const WorldState& state) {
  write_text_file(path_, serialize_world_to_json(state, indent_));
  cache_ = state;
}

WorldState JsonSnapshotStore::load() {
  cache_.reset();
  return current();
}

bool JsonSnapshotStore::persist(const StateDelta& delta, std::string* error) {
  try {
    WorldState next = current();
    if (delta.turn <= next.turn) {
      throw std::runtime_error("delta turn " + std::to_string(delta.turn) + " does not advance stored turn " +
                               std::to_string(next.turn));
    }
    apply_state_delta(next, delta);
    write_text_file(path_, serialize_world_to_json(next, indent_));
    cache_ = std::move(next);
  } catch (const std::exception& e) {
    if (error) *error = e.what();
    log::warn("json snapshot: persist of turn " + std::to_string(delta.turn) + " failed: " + e.what());
    return false;
  }
  return true;
}

} // namespace turngate
