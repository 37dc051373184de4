#pragma once

#include <string>

#include "turngate/core/state_delta.h"
#include "turngate/core/world_state.h"

namespace turngate {

// Boundary between the engine and durable storage.
class PersistenceAdapter {
 public:
  virtual ~PersistenceAdapter() = default;

  // Rebuild the last committed WorldState. Throws std::runtime_error if the
  // store cannot be read.
  virtual WorldState load() = 0;

  // Durably write one committed turn. Must be all-or-nothing: on failure
  // nothing of the delta may remain visible to a later load(). Returns false
  // and fills *error (when non-null) on failure.
  virtual bool persist(const StateDelta& delta, std::string* error) = 0;
};

// Keeps the committed state in memory. Used by tests and by hosts that
// snapshot state elsewhere.
class MemoryStore : public PersistenceAdapter {
 public:
  MemoryStore() = default;
  explicit MemoryStore(WorldState initial);

  WorldState load() override;
  bool persist(const StateDelta& delta, std::string* error) override;

  // The next `count` persist() calls fail with `reason` without writing.
  void fail_next_persists(int count, std::string reason = "injected failure");

  int persist_calls() const { return persist_calls_; }
  const StateDelta& last_delta() const { return last_delta_; }
  const WorldState& stored() const { return stored_; }

 private:
  WorldState stored_;
  StateDelta last_delta_;
  int persist_calls_{0};
  int failures_pending_{0};
  std::string failure_reason_;
};

} // namespace turngate
