#include <iostream>
#include <string>

#include "turngate/core/builtin_functions.h"
#include "turngate/core/function_registry.h"
#include "turngate/core/state_validation.h"

#include "test_world.h"

#define TG_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using namespace turngate;
using tgtest::call;

// Reason a call gets when checked against sample_world() in turn 1 ("" = passes).
std::string reason_for(const FunctionRegistry& reg, const ProposedCall& c, Turn turn = 1) {
  const WorldState s = tgtest::sample_world();
  return reg.check(c, s, turn).reason;
}

} // namespace

int test_builtin_functions() {
  FunctionRegistry reg;
  register_builtin_functions(reg);
  reg.seal();

  // Argument shape.
  TG_ASSERT(reason_for(reg, call("move_npc", {{"npc_id", "rhea"}})) == kInvalidArgumentsReason);
  TG_ASSERT(reason_for(reg, call("adjust_trust", {{"npc_id", "rhea"}, {"delta", "two"}})) == kInvalidArgumentsReason);
  TG_ASSERT(reason_for(reg, call("adjust_trust", {{"npc_id", "rhea"}, {"delta", 1.5}})) == kInvalidArgumentsReason);
  TG_ASSERT(reason_for(reg, call("move_npc", {{"npc_id", ""}, {"location", "well"}})) == kInvalidArgumentsReason);

  // NPCs.
  TG_ASSERT(reason_for(reg, call("move_npc", {{"npc_id", "ghost"}, {"location", "well"}})) == "unknown_npc");
  TG_ASSERT(reason_for(reg, call("move_npc", {{"npc_id", "rhea"}, {"location", "moon"}})) == "unknown_location");
  TG_ASSERT(reason_for(reg, call("move_npc", {{"npc_id", "boris"}, {"location", "well"}})) == "npc_unavailable");
  TG_ASSERT(reason_for(reg, call("adjust_trust", {{"npc_id", "rhea"}, {"delta", 6}})) == "trust_out_of_range");
  TG_ASSERT(reason_for(reg, call("adjust_trust", {{"npc_id", "rhea"}, {"delta", -5}})).empty());
  TG_ASSERT(reason_for(reg, call("adjust_trust", {{"npc_id", "rhea"}, {"delta", -6}})) == "trust_out_of_range");
  // Integers a double cannot hold exactly are malformed; huge in-range deltas
  // are rejected before any arithmetic on them.
  TG_ASSERT(reason_for(reg, call("adjust_trust", {{"npc_id", "rhea"}, {"delta", 9223372036854774784.0}})) ==
            kInvalidArgumentsReason);
  TG_ASSERT(reason_for(reg, call("repair_structure", {{"structure_id", "wall"}, {"amount", -1e300}})) ==
            kInvalidArgumentsReason);
  {
    EngineConfig wide;
    wide.trust_min = -100000;
    wide.trust_max = 100000;
    FunctionRegistry wide_reg(wide);
    register_builtin_functions(wide_reg);
    TG_ASSERT(reason_for(wide_reg, call("adjust_trust", {{"npc_id", "rhea"}, {"delta", 9.0e15}})) ==
              "trust_out_of_range");
    TG_ASSERT(reason_for(wide_reg, call("adjust_trust", {{"npc_id", "rhea"}, {"delta", -200001}})) ==
              "trust_out_of_range");
    TG_ASSERT(reason_for(wide_reg, call("adjust_trust", {{"npc_id", "rhea"}, {"delta", 99999}})).empty());
  }
  TG_ASSERT(reason_for(reg, call("set_npc_status", {{"npc_id", "rhea"}, {"status", "asleep"}})) == "invalid_status");
  TG_ASSERT(reason_for(reg, call("set_npc_status", {{"npc_id", "boris"}, {"status", "active"}})) == "npc_unavailable");

  // Structures.
  TG_ASSERT(reason_for(reg, call("repair_structure", {{"structure_id", "gate"}, {"amount", 5}})) == "unknown_structure");
  TG_ASSERT(reason_for(reg, call("repair_structure", {{"structure_id", "wall"}, {"amount", 0}})) == "invalid_amount");
  TG_ASSERT(reason_for(reg, call("repair_structure", {{"structure_id", "tower"}, {"amount", 5}})) == "structure_destroyed");
  TG_ASSERT(reason_for(reg, call("reinforce_structure", {{"structure_id", "wall"}, {"amount", 950}})) ==
            "reinforce_limit_exceeded");
  TG_ASSERT(reason_for(reg, call("damage_structure", {{"structure_id", "wall"}, {"amount", -1}})) == "invalid_amount");

  // Stockpiles.
  TG_ASSERT(reason_for(reg, call("consume_resource", {{"resource_id", "wood"}, {"amount", 10}})) ==
            "insufficient_quantity");
  TG_ASSERT(reason_for(reg, call("consume_resource", {{"resource_id", "gold"}, {"amount", 1}})) == "unknown_resource");
  TG_ASSERT(reason_for(reg, call("produce_resource", {{"resource_id", "gold"}, {"amount", 0}})) == "invalid_amount");
  TG_ASSERT(reason_for(reg, call("transfer_resource", {{"from", "wood"}, {"to", "wood"}, {"amount", 1}})) ==
            "same_resource");
  TG_ASSERT(reason_for(reg, call("transfer_resource", {{"from", "wood"}, {"to", "stone"}, {"amount", 6}})) ==
            "insufficient_quantity");

  // Trade routes.
  TG_ASSERT(reason_for(reg, call("open_trade_route", {{"route_id", "south"}, {"risk", 1}, {"reward", 1}})) ==
            "route_already_open");
  TG_ASSERT(reason_for(reg, call("open_trade_route", {{"route_id", "east"}, {"risk", 101}, {"reward", 1}})) ==
            "invalid_risk");
  TG_ASSERT(reason_for(reg, call("open_trade_route", {{"route_id", "east"}, {"risk", 5}, {"reward", -1}})) ==
            "invalid_reward");
  TG_ASSERT(reason_for(reg, call("close_trade_route", {{"route_id", "east"}, {"reason", "x"}})) == "unknown_route");
  TG_ASSERT(reason_for(reg, call("close_trade_route", {{"route_id", "north"}, {"reason", "x"}})) == "route_not_open");

  // Scheduled events.
  TG_ASSERT(reason_for(reg, call("schedule_event", {{"event_id", "storm"}, {"trigger_turn", 9}})) ==
            "event_already_exists");
  TG_ASSERT(reason_for(reg, call("schedule_event", {{"event_id", "fair"}, {"trigger_turn", 0}})) == "trigger_in_past");
  TG_ASSERT(reason_for(reg, call("fire_event", {{"event_id", "fair"}})) == "unknown_event");
  TG_ASSERT(reason_for(reg, call("fire_event", {{"event_id", "storm"}})) == "event_not_due");
  TG_ASSERT(reason_for(reg, call("fire_event", {{"event_id", "storm"}}), 2).empty());

  // Logs.
  TG_ASSERT(reason_for(reg, call("record_hazard", {{"hazard_id", "fog"}, {"severity", 11}, {"duration", 1}})) ==
            "invalid_severity");
  TG_ASSERT(reason_for(reg, call("record_hazard", {{"hazard_id", "fog"}, {"severity", 1}, {"duration", 0}})) ==
            "invalid_duration");
  TG_ASSERT(reason_for(reg, call("record_combat", {{"attacker", "rhea"}, {"defender", "rhea"}, {"outcome", "retreat"}})) ==
            "invalid_combatants");
  TG_ASSERT(reason_for(reg, call("record_combat", {{"attacker", "rhea"}, {"defender", "boris"}, {"outcome", "draw"}})) ==
            "invalid_outcome");

  // Story.
  TG_ASSERT(reason_for(reg, call("advance_story", {{"act", "act1"}, {"progress", 1.5}})) == "invalid_progress");
  TG_ASSERT(reason_for(reg, call("advance_story", {{"act", "act1"}, {"progress", 0.1}})) == "progress_regression");
  TG_ASSERT(reason_for(reg, call("advance_story", {{"act", "act2"}, {"progress", 0.0}})).empty());

  // Effects, staged in turn 3.
  WorldState s = tgtest::sample_world();
  s.turn = 3;
  auto apply = [&](const ProposedCall& c) { return reg.invoke(c, s).applied(); };

  TG_ASSERT(apply(call("repair_structure", {{"structure_id", "wall"}, {"amount", 20}})));
  TG_ASSERT(s.structures.at("wall").durability == 60);
  TG_ASSERT(s.structures.at("wall").status == StructureStatus::Stable);
  TG_ASSERT(s.structures.at("wall").last_repaired_turn == std::optional<Turn>(3));

  TG_ASSERT(apply(call("repair_structure", {{"structure_id", "wall"}, {"amount", 500}})));
  TG_ASSERT(s.structures.at("wall").durability == 100);
  TG_ASSERT(reg.invoke(call("repair_structure", {{"structure_id", "wall"}, {"amount", 1}}), s).reason == "already_at_max");

  TG_ASSERT(apply(call("damage_structure", {{"structure_id", "wall"}, {"amount", 80}})));
  TG_ASSERT(s.structures.at("wall").durability == 20);
  TG_ASSERT(s.structures.at("wall").status == StructureStatus::Breached);
  TG_ASSERT(apply(call("damage_structure", {{"structure_id", "wall"}, {"amount", 80}})));
  TG_ASSERT(s.structures.at("wall").durability == 0);
  TG_ASSERT(s.structures.at("wall").status == StructureStatus::Destroyed);

  TG_ASSERT(apply(call("transfer_resource", {{"from", "stone"}, {"to", "wood"}, {"amount", 5}})));
  TG_ASSERT(s.stockpiles.at("stone").quantity == 15);
  TG_ASSERT(s.stockpiles.at("wood").quantity == 10);
  TG_ASSERT(s.stockpiles.at("wood").last_updated_turn == 3);

  TG_ASSERT(apply(call("close_trade_route", {{"route_id", "south"}, {"reason", "flooded"}})));
  TG_ASSERT(s.trade_routes.at("south").status == TradeRouteStatus::Closed);
  TG_ASSERT(s.trade_routes.at("south").closed_turn == std::optional<Turn>(3));
  TG_ASSERT(s.trade_routes.at("south").last_reason == "flooded");
  TG_ASSERT(apply(call("open_trade_route", {{"route_id", "south"}, {"risk", 50}, {"reward", 9}})));
  TG_ASSERT(s.trade_routes.at("south").status == TradeRouteStatus::Open);
  TG_ASSERT(!s.trade_routes.at("south").closed_turn.has_value());
  TG_ASSERT(s.trade_routes.at("south").opened_turn == std::optional<Turn>(3));

  TG_ASSERT(apply(call("fire_event", {{"event_id", "storm"}})));
  TG_ASSERT(s.scheduled_events.at("storm").status == ScheduledEventStatus::Fired);
  TG_ASSERT(reg.invoke(call("cancel_event", {{"event_id", "storm"}}), s).reason == "event_not_scheduled");

  TG_ASSERT(apply(call("record_hazard", {{"hazard_id", "fog"}, {"severity", 2}, {"duration", 3}})));
  TG_ASSERT(reg.invoke(call("record_hazard", {{"hazard_id", "fog"}, {"severity", 2}, {"duration", 3}}), s).reason ==
            "duplicate_hazard_entry");
  TG_ASSERT(s.hazard_log.size() == 1 && s.hazard_log[0].turn == 3);

  TG_ASSERT(apply(call("record_combat", {{"attacker", "rhea"}, {"defender", "wolf"}, {"outcome", "attacker_victory"}})));
  TG_ASSERT(s.combat_log.size() == 1 && s.combat_log[0].seq == 1 && s.next_combat_seq == 2);

  TG_ASSERT(apply(call("move_npc", {{"npc_id", "rhea"}, {"location", "well"}})));
  TG_ASSERT(s.npcs.at("rhea").location == "well");
  TG_ASSERT(s.npcs.at("rhea").last_updated_turn == 3);

  TG_ASSERT(apply(call("advance_story", {{"act", "act1"}, {"progress", 0.2}})));
  TG_ASSERT(s.story_progress.at("act1").last_updated_turn == 3);

  TG_ASSERT(s.timeline.size() == 12);
  TG_ASSERT(validate_world_state(s).empty());

  return 0;
}
