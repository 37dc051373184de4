#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "turngate/core/world_state.h"

namespace turngate {

// Changes to one keyed table between two states.
template <typename Row>
struct TableDelta {
  // Rows that are new or differ from the earlier state, sorted by key.
  std::vector<Row> upserts;
  // Keys present in the earlier state only, sorted.
  std::vector<std::string> deletions;

  bool empty() const { return upserts.empty() && deletions.empty(); }
  std::size_t size() const { return upserts.size() + deletions.size(); }
};

// Everything a committed turn changed, in the shape the persistence adapters
// write: per-table upserts/deletions, the appended log rows and the new turn.
struct StateDelta {
  Turn turn{0};

  TableDelta<Npc> npcs;
  TableDelta<Structure> structures;
  TableDelta<Stockpile> stockpiles;
  TableDelta<TradeRoute> trade_routes;
  TableDelta<ScheduledEvent> scheduled_events;
  TableDelta<StoryProgress> story_progress;

  std::vector<TimelineEvent> timeline;
  std::vector<HazardLogEntry> hazard_log;
  std::vector<CombatLogEntry> combat_log;

  std::uint64_t next_timeline_seq{1};
  std::uint64_t next_combat_seq{1};

  // True when no table row and no log row changed (the turn number may still advance).
  bool empty() const;
  std::size_t row_count() const;
};

// Compute the delta that turns `before` into `after`.
//
// The logs in `after` must extend those in `before`; throws
// std::invalid_argument otherwise. Locations are not part of the delta.
StateDelta compute_state_delta(const WorldState& before, const WorldState& after);

// Apply a delta produced by compute_state_delta().
//
// Throws std::invalid_argument if the delta would move the turn backwards.
void apply_state_delta(WorldState& state, const StateDelta& delta);

} // namespace turngate
