#include <iostream>
#include <stdexcept>
#include <string>

#include "turngate/core/builtin_functions.h"
#include "turngate/core/serialization.h"
#include "turngate/core/state_delta.h"
#include "turngate/util/digest.h"

#include "test_world.h"

#define TG_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_state_delta() {
  using namespace turngate;
  using tgtest::call;

  FunctionRegistry reg;
  register_builtin_functions(reg);
  reg.seal();

  const WorldState before = tgtest::sample_world();

  // No change: only the turn moves.
  {
    WorldState after = before;
    after.turn = 1;
    const StateDelta d = compute_state_delta(before, after);
    TG_ASSERT(d.empty());
    TG_ASSERT(d.row_count() == 0);
    TG_ASSERT(d.turn == 1);
  }

  WorldState after = before;
  after.turn = 1;
  TG_ASSERT(reg.invoke(call("repair_structure", {{"structure_id", "wall"}, {"amount", 20}}), after).applied());
  TG_ASSERT(reg.invoke(call("produce_resource", {{"resource_id", "iron"}, {"amount", 3}}), after).applied());
  TG_ASSERT(reg.invoke(call("produce_resource", {{"resource_id", "copper"}, {"amount", 1}}), after).applied());
  TG_ASSERT(reg.invoke(call("record_hazard", {{"hazard_id", "fog"}, {"severity", 2}, {"duration", 1}}), after).applied());
  TG_ASSERT(reg.invoke(call("record_combat", {{"attacker", "rhea"}, {"defender", "boris"}, {"outcome", "retreat"}}), after)
                .applied());
  // A row the registry never deletes, removed by hand to exercise deletions.
  after.scheduled_events.erase("harvest");

  const StateDelta d = compute_state_delta(before, after);
  TG_ASSERT(!d.empty());
  TG_ASSERT(d.turn == 1);
  TG_ASSERT(d.structures.upserts.size() == 1 && d.structures.upserts[0].id == "wall");
  TG_ASSERT(d.npcs.empty());
  TG_ASSERT(d.stockpiles.upserts.size() == 2);
  // Sorted by key.
  TG_ASSERT(d.stockpiles.upserts[0].resource_id == "copper");
  TG_ASSERT(d.stockpiles.upserts[1].resource_id == "iron");
  TG_ASSERT(d.scheduled_events.deletions.size() == 1 && d.scheduled_events.deletions[0] == "harvest");
  TG_ASSERT(d.timeline.size() == 5);
  TG_ASSERT(d.hazard_log.size() == 1);
  TG_ASSERT(d.combat_log.size() == 1);
  TG_ASSERT(d.next_timeline_seq == 6);
  TG_ASSERT(d.next_combat_seq == 2);
  TG_ASSERT(d.row_count() == 1 + 2 + 1 + 5 + 1 + 1);

  // Applying the delta to the earlier state reproduces the later one.
  WorldState replay = before;
  apply_state_delta(replay, d);
  TG_ASSERT(digest_world_state64(replay) == digest_world_state64(after));
  TG_ASSERT(serialize_world_to_json(replay) == serialize_world_to_json(after));

  // Deltas chain across turns.
  WorldState turn2 = after;
  turn2.turn = 2;
  TG_ASSERT(reg.invoke(call("consume_resource", {{"resource_id", "iron"}, {"amount", 3}}), turn2).applied());
  const StateDelta d2 = compute_state_delta(after, turn2);
  TG_ASSERT(d2.stockpiles.upserts.size() == 1 && d2.stockpiles.upserts[0].quantity == 0);
  TG_ASSERT(d2.timeline.size() == 1 && d2.timeline[0].seq == 6);
  apply_state_delta(replay, d2);
  TG_ASSERT(digest_world_state64(replay) == digest_world_state64(turn2));

  // A shrinking log is not a forward delta.
  {
    bool threw = false;
    try {
      (void)compute_state_delta(after, before);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    TG_ASSERT(threw);
  }

  // Deltas never move the turn backwards.
  {
    WorldState late = before;
    late.turn = 5;
    bool threw = false;
    try {
      apply_state_delta(late, d);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    TG_ASSERT(threw);
  }

  return 0;
}
