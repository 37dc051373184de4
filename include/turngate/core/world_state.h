#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace turngate {

// Turn counter. Turn 0 is the initial world before any committed turn.
using Turn = std::int64_t;

// --- entity tables ---

enum class NpcStatus { Active, Resting, Injured, Missing, Dead };

struct Npc {
  std::string id;
  std::string name;
  std::string template_id;
  // Must name an entry of WorldState::locations.
  std::string location;
  NpcStatus status{NpcStatus::Active};
  int trust{0};
  Turn last_updated_turn{0};
};

// Derived from durability; see derive_structure_status().
enum class StructureStatus { Stable, Damaged, Breached, Destroyed };

struct Structure {
  std::string id;
  int durability{0};
  int max_durability{100};
  StructureStatus status{StructureStatus::Stable};
  std::optional<Turn> last_repaired_turn;
  std::optional<Turn> last_reinforced_turn;
};

struct Stockpile {
  std::string resource_id;
  std::int64_t quantity{0};
  Turn last_updated_turn{0};
};

enum class TradeRouteStatus { Open, Closed };

struct TradeRoute {
  std::string id;
  TradeRouteStatus status{TradeRouteStatus::Closed};
  int risk{0};
  int reward{0};
  std::optional<Turn> opened_turn;
  // Set iff status == Closed.
  std::optional<Turn> closed_turn;
  std::string last_reason;
};

enum class ScheduledEventStatus { Scheduled, Fired, Cancelled };

struct ScheduledEvent {
  std::string id;
  Turn trigger_turn{0};
  ScheduledEventStatus status{ScheduledEventStatus::Scheduled};
};

struct StoryProgress {
  std::string act;
  // Fraction in [0, 1], never decreases.
  double progress{0.0};
  Turn last_updated_turn{0};
};

// --- append-only logs ---

struct TimelineEvent {
  std::uint64_t seq{0};
  Turn turn{0};
  std::string event_type;
  // Compact JSON text.
  std::string payload;
};

struct HazardLogEntry {
  std::string hazard_id;
  Turn turn{0};
  int severity{0};
  int duration{0};
};

struct CombatLogEntry {
  std::uint64_t seq{0};
  Turn turn{0};
  std::string attacker;
  std::string defender;
  std::string outcome;
};

// Canonical simulation state.
//
// Only FunctionRegistry mutates a WorldState during a turn. The struct is a
// plain value type: copying it produces an independent deep copy, which is how
// the transaction manager builds its shadow state.
struct WorldState {
  // Last committed turn (canonical state), or the turn being staged (shadow).
  Turn turn{0};

  // Valid places an NPC may occupy. Not mutable through the registry.
  std::unordered_set<std::string> locations;

  std::unordered_map<std::string, Npc> npcs;
  std::unordered_map<std::string, Structure> structures;
  std::unordered_map<std::string, Stockpile> stockpiles;
  std::unordered_map<std::string, TradeRoute> trade_routes;
  std::unordered_map<std::string, ScheduledEvent> scheduled_events;
  std::unordered_map<std::string, StoryProgress> story_progress;

  std::vector<TimelineEvent> timeline;
  std::vector<HazardLogEntry> hazard_log;
  std::vector<CombatLogEntry> combat_log;

  // Next sequence numbers for the seq-keyed logs. Persisted so that sequence
  // numbers stay unique across reloads.
  std::uint64_t next_timeline_seq{1};
  std::uint64_t next_combat_seq{1};
};

// Thresholds used to derive a structure's status from its durability.
struct StructureThresholds {
  // durability / max_durability below this => Breached.
  double breached_ratio{0.25};
  // durability / max_durability below this => Damaged.
  double damaged_ratio{0.6};
};

StructureStatus derive_structure_status(int durability, int max_durability,
                                        const StructureThresholds& thresholds = {});

// Small helper for safe lookups.
template <typename Map>
auto* find_ptr(Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<decltype(&it->second)>(nullptr);
  return &it->second;
}

template <typename Map>
const auto* find_ptr(const Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<const decltype(&it->second)>(nullptr);
  return &it->second;
}

} // namespace turngate
