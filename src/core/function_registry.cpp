#include "turngate/core/function_registry.h"

#include <algorithm>
#include <exception>
#include <utility>

#include "turngate/util/log.h"

namespace turngate {

namespace {

template <typename Map>
void capture_row(std::vector<RowSnapshot<typename Map::mapped_type>>& out, const Map& table,
                 const std::string& key) {
  RowSnapshot<typename Map::mapped_type> snap;
  snap.key = key;
  if (const auto* row = find_ptr(table, key)) snap.prior = *row;
  out.push_back(std::move(snap));
}

template <typename Map>
void restore_rows(const std::vector<RowSnapshot<typename Map::mapped_type>>& snaps, Map& table) {
  for (auto it = snaps.rbegin(); it != snaps.rend(); ++it) {
    if (it->prior) {
      table[it->key] = *it->prior;
    } else {
      table.erase(it->key);
    }
  }
}

template <typename T>
void truncate(std::vector<T>& log, std::size_t mark) {
  if (log.size() > mark) log.resize(mark);
}

} // namespace

std::string describe_call(const ProposedCall& call) {
  return call.function_name + json::stringify(call.args, 0);
}

void RollbackToken::capture_npc(const WorldState& s, const std::string& id) { capture_row(npcs, s.npcs, id); }
void RollbackToken::capture_structure(const WorldState& s, const std::string& id) {
  capture_row(structures, s.structures, id);
}
void RollbackToken::capture_stockpile(const WorldState& s, const std::string& id) {
  capture_row(stockpiles, s.stockpiles, id);
}
void RollbackToken::capture_trade_route(const WorldState& s, const std::string& id) {
  capture_row(trade_routes, s.trade_routes, id);
}
void RollbackToken::capture_scheduled_event(const WorldState& s, const std::string& id) {
  capture_row(scheduled_events, s.scheduled_events, id);
}
void RollbackToken::capture_story_progress(const WorldState& s, const std::string& act) {
  capture_row(story_progress, s.story_progress, act);
}

void RollbackToken::mark_logs(const WorldState& s) {
  timeline_mark = s.timeline.size();
  hazard_mark = s.hazard_log.size();
  combat_mark = s.combat_log.size();
  next_timeline_seq_mark = s.next_timeline_seq;
  next_combat_seq_mark = s.next_combat_seq;
}

std::size_t RollbackToken::row_count() const {
  return npcs.size() + structures.size() + stockpiles.size() + trade_routes.size() + scheduled_events.size() +
         story_progress.size();
}

void restore_from_token(const RollbackToken& token, WorldState& state) {
  restore_rows(token.npcs, state.npcs);
  restore_rows(token.structures, state.structures);
  restore_rows(token.stockpiles, state.stockpiles);
  restore_rows(token.trade_routes, state.trade_routes);
  restore_rows(token.scheduled_events, state.scheduled_events);
  restore_rows(token.story_progress, state.story_progress);

  truncate(state.timeline, token.timeline_mark);
  truncate(state.hazard_log, token.hazard_mark);
  truncate(state.combat_log, token.combat_mark);
  state.next_timeline_seq = token.next_timeline_seq_mark;
  state.next_combat_seq = token.next_combat_seq_mark;
}

FunctionRegistry::FunctionRegistry(EngineConfig cfg) : cfg_(std::move(cfg)) {}

void FunctionRegistry::register_function(const std::string& name, Validator validate, Applier apply,
                                         Rollback rollback) {
  if (sealed_) throw std::logic_error("function registry is sealed; cannot register '" + name + "'");
  if (name.empty()) throw std::logic_error("function name must not be empty");
  if (!validate || !apply || !rollback) {
    throw std::logic_error("function '" + name + "' needs a validator, an apply step and a rollback");
  }
  if (entries_.count(name)) throw std::logic_error("function '" + name + "' already registered");
  entries_.emplace(name, Entry{validate, apply, rollback});
  log::debug("registered function " + name);
}

bool FunctionRegistry::contains(const std::string& name) const { return entries_.count(name) != 0; }

std::vector<std::string> FunctionRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& [name, _] : entries_) out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}

const FunctionRegistry::Entry* FunctionRegistry::find(const std::string& name) const {
  return find_ptr(entries_, name);
}

CheckResult FunctionRegistry::check(const ProposedCall& call, const WorldState& state, Turn turn) const {
  CheckResult res;
  const Entry* e = find(call.function_name);
  if (!e) {
    res.status = CheckStatus::UnknownFunction;
    res.reason = kUnknownFunctionReason;
    return res;
  }
  const MutationContext ctx{turn, cfg_};
  std::optional<std::string> reason;
  try {
    reason = e->validate(call.args, state, ctx);
  } catch (const std::exception& ex) {
    log::error("validator for '" + call.function_name + "' threw: " + ex.what());
    reason = std::string(kValidatorErrorReason);
  }
  if (reason) {
    res.status = CheckStatus::Rejected;
    res.reason = std::move(*reason);
  }
  return res;
}

MutationResult FunctionRegistry::invoke(const ProposedCall& call, WorldState& state) const {
  MutationResult res;
  const Entry* e = find(call.function_name);
  if (!e) {
    res.status = MutationStatus::UnknownFunction;
    res.reason = kUnknownFunctionReason;
    return res;
  }
  const MutationContext ctx{state.turn, cfg_};
  std::optional<std::string> reason;
  try {
    reason = e->validate(call.args, state, ctx);
  } catch (const std::exception& ex) {
    // Nothing has been written yet.
    throw ApplyError(call.function_name, std::string("validator threw: ") + ex.what());
  }
  if (reason) {
    res.status = MutationStatus::Rejected;
    res.reason = std::move(*reason);
    return res;
  }

  RollbackToken token;
  token.mark_logs(state);
  try {
    e->apply(call.args, state, ctx, token);

    TimelineEvent ev;
    ev.seq = state.next_timeline_seq++;
    ev.turn = state.turn;
    ev.event_type = call.function_name;
    ev.payload = json::stringify(call.args, 0);
    state.timeline.push_back(std::move(ev));
  } catch (const std::exception& ex) {
    // Undo whatever the apply step managed to write before it threw.
    rollback(call.function_name, token, state);
    throw ApplyError(call.function_name, ex.what());
  } catch (...) {
    rollback(call.function_name, token, state);
    throw ApplyError(call.function_name, "non-standard exception");
  }

  res.status = MutationStatus::Applied;
  res.token = std::move(token);
  return res;
}

void FunctionRegistry::rollback(const std::string& name, const RollbackToken& token, WorldState& state) const {
  const Entry* e = find(name);
  if (!e) throw std::logic_error("cannot roll back unknown function '" + name + "'");
  e->rollback(token, state);
  // The timeline row is appended by invoke(), so the registry truncates the
  // logs itself rather than relying on the entry's rollback.
  truncate(state.timeline, token.timeline_mark);
  truncate(state.hazard_log, token.hazard_mark);
  truncate(state.combat_log, token.combat_mark);
  state.next_timeline_seq = token.next_timeline_seq_mark;
  state.next_combat_seq = token.next_combat_seq_mark;
}

} // namespace turngate
