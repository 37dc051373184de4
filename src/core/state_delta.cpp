#include "turngate/core/state_delta.h"

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace turngate {

namespace {

bool same_row(const Npc& a, const Npc& b) {
  return std::tie(a.id, a.name, a.template_id, a.location, a.status, a.trust, a.last_updated_turn) ==
         std::tie(b.id, b.name, b.template_id, b.location, b.status, b.trust, b.last_updated_turn);
}

bool same_row(const Structure& a, const Structure& b) {
  return std::tie(a.id, a.durability, a.max_durability, a.status, a.last_repaired_turn, a.last_reinforced_turn) ==
         std::tie(b.id, b.durability, b.max_durability, b.status, b.last_repaired_turn, b.last_reinforced_turn);
}

bool same_row(const Stockpile& a, const Stockpile& b) {
  return std::tie(a.resource_id, a.quantity, a.last_updated_turn) ==
         std::tie(b.resource_id, b.quantity, b.last_updated_turn);
}

bool same_row(const TradeRoute& a, const TradeRoute& b) {
  return std::tie(a.id, a.status, a.risk, a.reward, a.opened_turn, a.closed_turn, a.last_reason) ==
         std::tie(b.id, b.status, b.risk, b.reward, b.opened_turn, b.closed_turn, b.last_reason);
}

bool same_row(const ScheduledEvent& a, const ScheduledEvent& b) {
  return std::tie(a.id, a.trigger_turn, a.status) == std::tie(b.id, b.trigger_turn, b.status);
}

bool same_row(const StoryProgress& a, const StoryProgress& b) {
  return std::tie(a.act, a.progress, a.last_updated_turn) == std::tie(b.act, b.progress, b.last_updated_turn);
}

template <typename Map>
void diff_table(const Map& before, const Map& after, TableDelta<typename Map::mapped_type>& out) {
  std::vector<std::string> keys;
  for (const auto& [k, row] : after) {
    const auto* prev = find_ptr(before, k);
    if (!prev || !same_row(*prev, row)) keys.push_back(k);
  }
  std::sort(keys.begin(), keys.end());
  out.upserts.reserve(keys.size());
  for (const auto& k : keys) out.upserts.push_back(after.at(k));

  for (const auto& [k, _] : before) {
    if (after.find(k) == after.end()) out.deletions.push_back(k);
  }
  std::sort(out.deletions.begin(), out.deletions.end());
}

template <typename T>
std::vector<T> appended(const std::vector<T>& before, const std::vector<T>& after, const char* name) {
  if (after.size() < before.size()) {
    throw std::invalid_argument(std::string("state delta: ") + name + " shrank");
  }
  return std::vector<T>(after.begin() + static_cast<std::ptrdiff_t>(before.size()), after.end());
}

// Row key accessors; Stockpile and StoryProgress are keyed by other fields.
const std::string& row_key(const Npc& r) { return r.id; }
const std::string& row_key(const Structure& r) { return r.id; }
const std::string& row_key(const Stockpile& r) { return r.resource_id; }
const std::string& row_key(const TradeRoute& r) { return r.id; }
const std::string& row_key(const ScheduledEvent& r) { return r.id; }
const std::string& row_key(const StoryProgress& r) { return r.act; }

template <typename Map>
void apply_table(Map& table, const TableDelta<typename Map::mapped_type>& delta) {
  for (const auto& k : delta.deletions) table.erase(k);
  for (const auto& row : delta.upserts) table[row_key(row)] = row;
}

} // namespace

bool StateDelta::empty() const { return row_count() == 0; }

std::size_t StateDelta::row_count() const {
  return npcs.size() + structures.size() + stockpiles.size() + trade_routes.size() + scheduled_events.size() +
         story_progress.size() + timeline.size() + hazard_log.size() + combat_log.size();
}

StateDelta compute_state_delta(const WorldState& before, const WorldState& after) {
  StateDelta d;
  d.turn = after.turn;
  diff_table(before.npcs, after.npcs, d.npcs);
  diff_table(before.structures, after.structures, d.structures);
  diff_table(before.stockpiles, after.stockpiles, d.stockpiles);
  diff_table(before.trade_routes, after.trade_routes, d.trade_routes);
  diff_table(before.scheduled_events, after.scheduled_events, d.scheduled_events);
  diff_table(before.story_progress, after.story_progress, d.story_progress);
  d.timeline = appended(before.timeline, after.timeline, "timeline");
  d.hazard_log = appended(before.hazard_log, after.hazard_log, "hazard_log");
  d.combat_log = appended(before.combat_log, after.combat_log, "combat_log");
  d.next_timeline_seq = after.next_timeline_seq;
  d.next_combat_seq = after.next_combat_seq;
  return d;
}

void apply_state_delta(WorldState& state, const StateDelta& delta) {
  if (delta.turn < state.turn) {
    throw std::invalid_argument("state delta: turn " + std::to_string(delta.turn) + " is older than state turn " +
                                std::to_string(state.turn));
  }
  apply_table(state.npcs, delta.npcs);
  apply_table(state.structures, delta.structures);
  apply_table(state.stockpiles, delta.stockpiles);
  apply_table(state.trade_routes, delta.trade_routes);
  apply_table(state.scheduled_events, delta.scheduled_events);
  apply_table(state.story_progress, delta.story_progress);
  state.timeline.insert(state.timeline.end(), delta.timeline.begin(), delta.timeline.end());
  state.hazard_log.insert(state.hazard_log.end(), delta.hazard_log.begin(), delta.hazard_log.end());
  state.combat_log.insert(state.combat_log.end(), delta.combat_log.begin(), delta.combat_log.end());
  state.next_timeline_seq = delta.next_timeline_seq;
  state.next_combat_seq = delta.next_combat_seq;
  state.turn = delta.turn;
}

} // namespace turngate
