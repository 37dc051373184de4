#include "turngate/core/state_validation.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

#include "turngate/core/enum_strings.h"

namespace turngate {

namespace {

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

} // namespace

std::vector<std::string> validate_world_state(const WorldState& s, const EngineConfig& cfg) {
  std::vector<std::string> errors;

  if (s.turn < 0) push(errors, join("turn is negative: ", s.turn));

  for (const auto& [id, n] : s.npcs) {
    if (n.id != id) push(errors, join("Npc id mismatch: key=", id, " value.id=", n.id));
    if (n.trust < cfg.trust_min || n.trust > cfg.trust_max) {
      push(errors, join("Npc ", id, " trust ", n.trust, " outside [", cfg.trust_min, ", ", cfg.trust_max, "]"));
    }
    if (s.locations.count(n.location) == 0) push(errors, join("Npc ", id, " at unknown location '", n.location, "'"));
    if (n.last_updated_turn > s.turn) push(errors, join("Npc ", id, " last_updated_turn is in the future"));
  }

  for (const auto& [id, st] : s.structures) {
    if (st.id != id) push(errors, join("Structure id mismatch: key=", id, " value.id=", st.id));
    if (st.max_durability <= 0) push(errors, join("Structure ", id, " max_durability must be positive"));
    if (st.durability < 0 || st.durability > st.max_durability) {
      push(errors, join("Structure ", id, " durability ", st.durability, " outside [0, ", st.max_durability, "]"));
    }
    const StructureStatus want = derive_structure_status(st.durability, st.max_durability, cfg.structure_thresholds);
    if (st.status != want) {
      push(errors, join("Structure ", id, " status ", structure_status_to_string(st.status), " does not match derived ",
                        structure_status_to_string(want)));
    }
  }

  for (const auto& [id, sp] : s.stockpiles) {
    if (sp.resource_id != id) push(errors, join("Stockpile id mismatch: key=", id, " value.resource_id=", sp.resource_id));
    if (sp.quantity < 0) push(errors, join("Stockpile ", id, " quantity is negative: ", sp.quantity));
  }

  for (const auto& [id, r] : s.trade_routes) {
    if (r.id != id) push(errors, join("TradeRoute id mismatch: key=", id, " value.id=", r.id));
    const bool closed = r.status == TradeRouteStatus::Closed;
    if (closed != r.closed_turn.has_value()) {
      push(errors, join("TradeRoute ", id, " closed_turn must be set iff status is closed"));
    }
    if (r.opened_turn && r.closed_turn && *r.opened_turn > *r.closed_turn) {
      push(errors, join("TradeRoute ", id, " opened_turn ", *r.opened_turn, " after closed_turn ", *r.closed_turn));
    }
  }

  for (const auto& [id, ev] : s.scheduled_events) {
    if (ev.id != id) push(errors, join("ScheduledEvent id mismatch: key=", id, " value.id=", ev.id));
  }

  for (const auto& [act, sp] : s.story_progress) {
    if (sp.act != act) push(errors, join("StoryProgress act mismatch: key=", act, " value.act=", sp.act));
    if (!(sp.progress >= 0.0 && sp.progress <= 1.0)) {
      push(errors, join("StoryProgress ", act, " progress ", sp.progress, " outside [0, 1]"));
    }
  }

  // Logs: seq strictly increasing, turns non-decreasing and never ahead of state.
  std::uint64_t prev_seq = 0;
  Turn prev_turn = 0;
  for (std::size_t i = 0; i < s.timeline.size(); ++i) {
    const auto& e = s.timeline[i];
    if (e.seq <= prev_seq) push(errors, join("TimelineEvent #", i, " seq ", e.seq, " is not increasing"));
    if (e.turn < prev_turn) push(errors, join("TimelineEvent #", i, " turn ", e.turn, " goes backwards"));
    if (e.turn > s.turn) push(errors, join("TimelineEvent #", i, " turn ", e.turn, " is in the future"));
    prev_seq = e.seq;
    prev_turn = e.turn;
  }
  if (s.next_timeline_seq <= prev_seq) {
    push(errors, join("next_timeline_seq ", s.next_timeline_seq, " does not exceed last seq ", prev_seq));
  }

  prev_seq = 0;
  prev_turn = 0;
  for (std::size_t i = 0; i < s.combat_log.size(); ++i) {
    const auto& c = s.combat_log[i];
    if (c.seq <= prev_seq) push(errors, join("CombatLogEntry #", i, " seq ", c.seq, " is not increasing"));
    if (c.turn < prev_turn) push(errors, join("CombatLogEntry #", i, " turn ", c.turn, " goes backwards"));
    prev_seq = c.seq;
    prev_turn = c.turn;
  }
  if (s.next_combat_seq <= prev_seq) {
    push(errors, join("next_combat_seq ", s.next_combat_seq, " does not exceed last seq ", prev_seq));
  }

  std::set<std::pair<std::string, Turn>> hazard_keys;
  prev_turn = 0;
  for (std::size_t i = 0; i < s.hazard_log.size(); ++i) {
    const auto& h = s.hazard_log[i];
    if (!hazard_keys.emplace(h.hazard_id, h.turn).second) {
      push(errors, join("HazardLogEntry duplicate key (", h.hazard_id, ", ", h.turn, ")"));
    }
    if (h.turn < prev_turn) push(errors, join("HazardLogEntry #", i, " turn ", h.turn, " goes backwards"));
    prev_turn = h.turn;
  }

  std::sort(errors.begin(), errors.end());
  return errors;
}

} // namespace turngate
