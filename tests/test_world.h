#pragma once

// Shared fixtures for the turngate tests: a small seeded world, a call
// builder and a few scripted adjudicators.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

#include "turngate/core/adjudication.h"
#include "turngate/core/function_registry.h"
#include "turngate/core/world_state.h"

namespace tgtest {

inline turngate::ProposedCall call(std::string name, turngate::CallArgs args = {}) {
  turngate::ProposedCall c;
  c.function_name = std::move(name);
  c.args = std::move(args);
  return c;
}

// Turn 0 world:
//   npcs rhea (gate, active, trust 0) and boris (keep, dead, trust 1)
//   structures wall 40/100 (damaged) and tower 0/100 (destroyed)
//   stockpiles wood 5 and stone 20
//   trade routes north (closed) and south (open)
//   events storm (due turn 2) and harvest (due turn 1)
//   story act1 at 0.2
inline turngate::WorldState sample_world() {
  using namespace turngate;
  WorldState s;
  s.turn = 0;
  s.locations = {"gate", "keep", "market", "well"};

  Npc rhea;
  rhea.id = "rhea";
  rhea.name = "Rhea";
  rhea.template_id = "scout";
  rhea.location = "gate";
  s.npcs[rhea.id] = rhea;

  Npc boris;
  boris.id = "boris";
  boris.name = "Boris";
  boris.template_id = "smith";
  boris.location = "keep";
  boris.status = NpcStatus::Dead;
  boris.trust = 1;
  s.npcs[boris.id] = boris;

  Structure wall;
  wall.id = "wall";
  wall.durability = 40;
  wall.max_durability = 100;
  wall.status = derive_structure_status(wall.durability, wall.max_durability);
  s.structures[wall.id] = wall;

  Structure tower;
  tower.id = "tower";
  tower.durability = 0;
  tower.max_durability = 100;
  tower.status = StructureStatus::Destroyed;
  s.structures[tower.id] = tower;

  s.stockpiles["wood"] = Stockpile{"wood", 5, 0};
  s.stockpiles["stone"] = Stockpile{"stone", 20, 0};

  TradeRoute north;
  north.id = "north";
  north.status = TradeRouteStatus::Closed;
  north.closed_turn = 0;
  north.last_reason = "bandits";
  s.trade_routes[north.id] = north;

  TradeRoute south;
  south.id = "south";
  south.status = TradeRouteStatus::Open;
  south.risk = 10;
  south.reward = 4;
  south.opened_turn = 0;
  s.trade_routes[south.id] = south;

  s.scheduled_events["storm"] = ScheduledEvent{"storm", 2, ScheduledEventStatus::Scheduled};
  s.scheduled_events["harvest"] = ScheduledEvent{"harvest", 1, ScheduledEventStatus::Scheduled};

  s.story_progress["act1"] = StoryProgress{"act1", 0.2, 0};
  return s;
}

// Host functions with broken parts, registered by the failure-path tests.

// Validator that throws once the wood stockpile drops below 5.
inline std::optional<std::string> picky_validate(const turngate::CallArgs&, const turngate::WorldState& s,
                                                 const turngate::MutationContext&) {
  const auto it = s.stockpiles.find("wood");
  if (it == s.stockpiles.end() || it->second.quantity < 5) throw std::runtime_error("wood ledger unreadable");
  return std::nullopt;
}

inline std::optional<std::string> accept_any(const turngate::CallArgs&, const turngate::WorldState&,
                                             const turngate::MutationContext&) {
  return std::nullopt;
}

inline void apply_noop(const turngate::CallArgs&, turngate::WorldState&, const turngate::MutationContext&,
                          turngate::RollbackToken&) {}

// Empties the wood stockpile, then throws something that is not a std::exception.
inline void apply_then_throw_int(const turngate::CallArgs&, turngate::WorldState& s,
                                 const turngate::MutationContext&, turngate::RollbackToken& token) {
  token.capture_stockpile(s, "wood");
  s.stockpiles["wood"].quantity = 0;
  throw 7;
}

// Grows the stone stockpile.
inline void add_stone(const turngate::CallArgs&, turngate::WorldState& s, const turngate::MutationContext&,
                      turngate::RollbackToken& token) {
  token.capture_stockpile(s, "stone");
  s.stockpiles["stone"].quantity += 1;
}

// Rollback that restores nothing.
inline void forget_rollback(const turngate::RollbackToken&, turngate::WorldState&) {}

// One call per built-in function, each valid against sample_world() staged in turn 1.
inline std::vector<turngate::ProposedCall> one_valid_call_per_builtin() {
  return {
      call("move_npc", {{"npc_id", "rhea"}, {"location", "market"}}),
      call("adjust_trust", {{"npc_id", "rhea"}, {"delta", 2}}),
      call("set_npc_status", {{"npc_id", "rhea"}, {"status", "resting"}}),
      call("repair_structure", {{"structure_id", "wall"}, {"amount", 20}}),
      call("reinforce_structure", {{"structure_id", "wall"}, {"amount", 50}}),
      call("damage_structure", {{"structure_id", "wall"}, {"amount", 10}}),
      call("produce_resource", {{"resource_id", "iron"}, {"amount", 3}}),
      call("consume_resource", {{"resource_id", "wood"}, {"amount", 2}}),
      call("transfer_resource", {{"from", "stone"}, {"to", "ore"}, {"amount", 5}}),
      call("open_trade_route", {{"route_id", "north"}, {"risk", 30}, {"reward", 7}}),
      call("close_trade_route", {{"route_id", "south"}, {"reason", "flooded"}}),
      call("schedule_event", {{"event_id", "fair"}, {"trigger_turn", 5}}),
      call("fire_event", {{"event_id", "harvest"}}),
      call("cancel_event", {{"event_id", "storm"}}),
      call("record_hazard", {{"hazard_id", "flood"}, {"severity", 3}, {"duration", 2}}),
      call("record_combat", {{"attacker", "rhea"}, {"defender", "boris"}, {"outcome", "stalemate"}}),
      call("advance_story", {{"act", "act1"}, {"progress", 0.5}}),
  };
}

// Accepts everything and remembers what it saw.
class RecordingAdjudicator : public turngate::Adjudicator {
 public:
  turngate::Verdict adjudicate(const std::vector<turngate::ProposedCall>& batch,
                               const turngate::NarrativeContext&) override {
    ++calls;
    last_batch = batch;
    turngate::Verdict v;
    for (std::size_t i = 0; i < batch.size(); ++i) v[i] = turngate::CallVerdict{};
    return v;
  }

  int calls{0};
  std::vector<turngate::ProposedCall> last_batch;
};

// Rejects every call to one of the named functions.
class RejectFunctionsAdjudicator : public turngate::Adjudicator {
 public:
  explicit RejectFunctionsAdjudicator(std::unordered_set<std::string> names) : names_(std::move(names)) {}

  turngate::Verdict adjudicate(const std::vector<turngate::ProposedCall>& batch,
                               const turngate::NarrativeContext&) override {
    turngate::Verdict v;
    for (std::size_t i = 0; i < batch.size(); ++i) {
      if (names_.count(batch[i].function_name)) {
        v[i] = turngate::CallVerdict{false, "inconsistent_with_scene"};
      } else {
        v[i] = turngate::CallVerdict{};
      }
    }
    return v;
  }

 private:
  std::unordered_set<std::string> names_;
};

// Returns a verdict with no entries at all.
class SilentAdjudicator : public turngate::Adjudicator {
 public:
  turngate::Verdict adjudicate(const std::vector<turngate::ProposedCall>&, const turngate::NarrativeContext&) override {
    return {};
  }
};

class ThrowingAdjudicator : public turngate::Adjudicator {
 public:
  turngate::Verdict adjudicate(const std::vector<turngate::ProposedCall>&, const turngate::NarrativeContext&) override {
    throw std::runtime_error("model offline");
  }
};

// Sleeps before accepting everything.
class SlowAdjudicator : public turngate::Adjudicator {
 public:
  explicit SlowAdjudicator(int delay_ms) : delay_ms_(delay_ms) {}

  turngate::Verdict adjudicate(const std::vector<turngate::ProposedCall>& batch,
                               const turngate::NarrativeContext&) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    turngate::Verdict v;
    for (std::size_t i = 0; i < batch.size(); ++i) v[i] = turngate::CallVerdict{};
    finished.store(true);
    return v;
  }

  std::atomic<bool> finished{false};

 private:
  int delay_ms_;
};

// Counts concurrent adjudicate() calls. The first call sleeps for `first_delay_ms`.
class InFlightAdjudicator : public turngate::Adjudicator {
 public:
  explicit InFlightAdjudicator(int first_delay_ms) : first_delay_ms_(first_delay_ms) {}

  turngate::Verdict adjudicate(const std::vector<turngate::ProposedCall>& batch,
                               const turngate::NarrativeContext&) override {
    const int now = ++in_flight;
    int seen = max_in_flight.load();
    while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
    }
    if (calls.fetch_add(1) == 0) std::this_thread::sleep_for(std::chrono::milliseconds(first_delay_ms_));
    turngate::Verdict v;
    for (std::size_t i = 0; i < batch.size(); ++i) v[i] = turngate::CallVerdict{};
    --in_flight;
    return v;
  }

  std::atomic<int> in_flight{0};
  std::atomic<int> max_in_flight{0};
  std::atomic<int> calls{0};

 private:
  int first_delay_ms_;
};

} // namespace tgtest
