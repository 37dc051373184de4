#pragma once

#include <string>

#include "turngate/persistence/persistence_adapter.h"

struct sqlite3;

namespace turngate {

// SQLite-backed store whose tables mirror the WorldState tables one-to-one:
// npc_state, structure_state, stockpiles, trade_routes, scheduled_events,
// story_progress, timeline_events, hazard_log, combat_log, plus locations and
// metadata (turn, sequence counters, format version).
//
// persist() writes a delta inside a single BEGIN IMMEDIATE ... COMMIT and rolls
// back on any error, so a failed turn leaves no rows behind.
class SqliteStore : public PersistenceAdapter {
 public:
  // Opens (creating if needed) the database and its schema. ":memory:" gives a
  // private in-memory database. Throws std::runtime_error.
  explicit SqliteStore(const std::string& path);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  // Replaces the whole database content with `state`. Used to seed a world.
  // Throws std::runtime_error; the database is unchanged on failure.
  void write_snapshot(const WorldState& state);

  // An empty database loads as a default WorldState at turn 0.
  WorldState load() override;

  // Rejects a delta whose turn does not advance the stored turn.
  bool persist(const StateDelta& delta, std::string* error) override;

  const std::string& path() const { return path_; }

 private:
  void exec(const char* sql);
  void write_delta(const StateDelta& delta);
  Turn stored_turn();

  std::string path_;
  sqlite3* db_{nullptr};
};

} // namespace turngate
