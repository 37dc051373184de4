#include <iostream>
#include <string>
#include <vector>

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

bool has_error(const std::vector<std::string>& errors, const std::string& needle) {
  for (const auto& e : errors) {
    if (e.find(needle) != std::string::npos) return true;
  }
  return false;
}

} // namespace

int test_state_validation() {
  using namespace turngate;

  TG_ASSERT(validate_world_state(tgtest::sample_world()).empty());
  TG_ASSERT(validate_world_state(WorldState{}).empty());

  {
    WorldState s = tgtest::sample_world();
    s.npcs["rhea"].trust = 9;
    s.npcs["rhea"].location = "moon";
    s.npcs["boris"].last_updated_turn = 4;
    const auto errors = validate_world_state(s);
    TG_ASSERT(errors.size() == 3);
    TG_ASSERT(has_error(errors, "Npc rhea trust 9 outside [-5, 5]"));
    TG_ASSERT(has_error(errors, "unknown location 'moon'"));
    TG_ASSERT(has_error(errors, "Npc boris last_updated_turn is in the future"));

    // A wider trust range from config accepts the same value.
    EngineConfig cfg;
    cfg.trust_min = -10;
    cfg.trust_max = 10;
    TG_ASSERT(validate_world_state(s, cfg).size() == 2);
  }

  {
    WorldState s = tgtest::sample_world();
    s.structures["wall"].durability = 90;  // still marked damaged
    s.structures["tower"].durability = -1;
    s.npcs["rhea"].id = "rhia";
    const auto errors = validate_world_state(s);
    TG_ASSERT(has_error(errors, "Structure wall status damaged does not match derived stable"));
    TG_ASSERT(has_error(errors, "Structure tower durability -1 outside [0, 100]"));
    TG_ASSERT(has_error(errors, "Npc id mismatch: key=rhea value.id=rhia"));
  }

  {
    WorldState s = tgtest::sample_world();
    s.stockpiles["wood"].quantity = -2;
    s.trade_routes["south"].closed_turn = 0;  // open but has a closed turn
    s.trade_routes["north"].opened_turn = 3;  // opened after it closed
    s.story_progress["act1"].progress = 1.5;
    const auto errors = validate_world_state(s);
    TG_ASSERT(errors.size() == 4);
    TG_ASSERT(has_error(errors, "Stockpile wood quantity is negative"));
    TG_ASSERT(has_error(errors, "TradeRoute south closed_turn must be set iff status is closed"));
    TG_ASSERT(has_error(errors, "TradeRoute north opened_turn 3 after closed_turn 0"));
    TG_ASSERT(has_error(errors, "StoryProgress act1 progress 1.5 outside [0, 1]"));
  }

  // Log ordering and sequence counters.
  {
    WorldState s = tgtest::sample_world();
    s.turn = 3;
    s.timeline.push_back(TimelineEvent{1, 2, "move_npc", "{}"});
    s.timeline.push_back(TimelineEvent{1, 1, "move_npc", "{}"});
    s.next_timeline_seq = 1;
    s.combat_log.push_back(CombatLogEntry{4, 1, "rhea", "boris", "retreat"});
    s.next_combat_seq = 2;
    s.hazard_log.push_back(HazardLogEntry{"fog", 2, 1, 1});
    s.hazard_log.push_back(HazardLogEntry{"fog", 2, 3, 1});
    const auto errors = validate_world_state(s);
    TG_ASSERT(has_error(errors, "TimelineEvent #1 seq 1 is not increasing"));
    TG_ASSERT(has_error(errors, "TimelineEvent #1 turn 1 goes backwards"));
    TG_ASSERT(has_error(errors, "next_timeline_seq 1 does not exceed last seq 1"));
    TG_ASSERT(has_error(errors, "next_combat_seq 2 does not exceed last seq 4"));
    TG_ASSERT(has_error(errors, "HazardLogEntry duplicate key (fog, 2)"));
  }

  // Output is sorted.
  {
    WorldState s = tgtest::sample_world();
    s.stockpiles["wood"].quantity = -1;
    s.npcs["rhea"].trust = 99;
    s.story_progress["act1"].progress = -0.5;
    const auto errors = validate_world_state(s);
    for (std::size_t i = 1; i < errors.size(); ++i) TG_ASSERT(errors[i - 1] <= errors[i]);
  }

  return 0;
}
