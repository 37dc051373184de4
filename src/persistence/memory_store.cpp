#include "turngate/persistence/persistence_adapter.h"

#include <stdexcept>
#include <utility>

namespace turngate {

MemoryStore::MemoryStore(WorldState initial) : stored_(std::move(initial)) {}

WorldState MemoryStore::load() { return stored_; }

bool MemoryStore::persist(const StateDelta& delta, std::string* error) {
  ++persist_calls_;
  if (failures_pending_ > 0) {
    --failures_pending_;
    if (error) *error = failure_reason_;
    return false;
  }
  WorldState next = stored_;
  try {
    apply_state_delta(next, delta);
  } catch (const std::invalid_argument& e) {
    if (error) *error = e.what();
    return false;
  }
  stored_ = std::move(next);
  last_delta_ = delta;
  return true;
}

void MemoryStore::fail_next_persists(int count, std::string reason) {
  failures_pending_ = count;
  failure_reason_ = std::move(reason);
}

} // namespace turngate
