#include "turngate/core/builtin_functions.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "turngate/core/enum_strings.h"

namespace turngate {

namespace {

using Reason = std::optional<std::string>;

// --- argument access ---

std::optional<std::string> arg_str(const CallArgs& args, const char* key) {
  const auto it = args.find(key);
  if (it == args.end()) return std::nullopt;
  const std::string* s = it->second.as_string();
  if (!s || s->empty()) return std::nullopt;
  return *s;
}

// Largest magnitude a double holds exactly; wider integers are malformed.
constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53

std::optional<std::int64_t> arg_int(const CallArgs& args, const char* key) {
  const auto it = args.find(key);
  if (it == args.end()) return std::nullopt;
  const double* d = it->second.as_number();
  if (!d || !json::is_integral(*d)) return std::nullopt;
  if (*d < -kMaxExactInteger || *d > kMaxExactInteger) return std::nullopt;
  return static_cast<std::int64_t>(*d);
}

std::optional<double> arg_num(const CallArgs& args, const char* key) {
  const auto it = args.find(key);
  if (it == args.end()) return std::nullopt;
  const double* d = it->second.as_number();
  if (!d) return std::nullopt;
  return *d;
}

// Apply steps run only after their validator accepted the same arguments, so a
// missing argument here is a contract violation.
template <typename T>
T must(std::optional<T> v, const char* key) {
  if (!v) throw std::runtime_error(std::string("argument '") + key + "' missing or malformed");
  return std::move(*v);
}

template <typename Map>
auto& must_row(Map& table, const std::string& key) {
  auto* row = find_ptr(table, key);
  if (!row) throw std::runtime_error("row '" + key + "' does not exist");
  return *row;
}

Reason invalid_args() { return std::string(kInvalidArgumentsReason); }
Reason reject(const char* reason) { return std::string(reason); }

// Amounts must be positive and fit an int.
bool valid_amount(std::int64_t amount) { return amount > 0 && amount <= 1000000000; }

// --- NPCs ---

Reason validate_move_npc(const CallArgs& args, const WorldState& s, const MutationContext&) {
  const auto npc_id = arg_str(args, "npc_id");
  const auto location = arg_str(args, "location");
  if (!npc_id || !location) return invalid_args();
  const Npc* npc = find_ptr(s.npcs, *npc_id);
  if (!npc) return reject("unknown_npc");
  if (s.locations.count(*location) == 0) return reject("unknown_location");
  if (npc->status == NpcStatus::Dead || npc->status == NpcStatus::Missing) return reject("npc_unavailable");
  return std::nullopt;
}

void apply_move_npc(const CallArgs& args, WorldState& s, const MutationContext& ctx, RollbackToken& token) {
  const std::string id = must(arg_str(args, "npc_id"), "npc_id");
  token.capture_npc(s, id);
  Npc& npc = must_row(s.npcs, id);
  npc.location = must(arg_str(args, "location"), "location");
  npc.last_updated_turn = ctx.turn;
}

Reason validate_adjust_trust(const CallArgs& args, const WorldState& s, const MutationContext& ctx) {
  const auto npc_id = arg_str(args, "npc_id");
  const auto delta = arg_int(args, "delta");
  if (!npc_id || !delta) return invalid_args();
  const Npc* npc = find_ptr(s.npcs, *npc_id);
  if (!npc) return reject("unknown_npc");
  const std::int64_t span = static_cast<std::int64_t>(ctx.cfg.trust_max) - ctx.cfg.trust_min;
  if (*delta < -span || *delta > span) return reject("trust_out_of_range");
  const std::int64_t next = static_cast<std::int64_t>(npc->trust) + *delta;
  if (next < ctx.cfg.trust_min || next > ctx.cfg.trust_max) return reject("trust_out_of_range");
  return std::nullopt;
}

void apply_adjust_trust(const CallArgs& args, WorldState& s, const MutationContext& ctx, RollbackToken& token) {
  const std::string id = must(arg_str(args, "npc_id"), "npc_id");
  token.capture_npc(s, id);
  Npc& npc = must_row(s.npcs, id);
  npc.trust += static_cast<int>(must(arg_int(args, "delta"), "delta"));
  npc.last_updated_turn = ctx.turn;
}

Reason validate_set_npc_status(const CallArgs& args, const WorldState& s, const MutationContext&) {
  const auto npc_id = arg_str(args, "npc_id");
  const auto status = arg_str(args, "status");
  if (!npc_id || !status) return invalid_args();
  NpcStatus parsed;
  if (!parse_npc_status(*status, &parsed)) return reject("invalid_status");
  const Npc* npc = find_ptr(s.npcs, *npc_id);
  if (!npc) return reject("unknown_npc");
  // Death is terminal.
  if (npc->status == NpcStatus::Dead && parsed != NpcStatus::Dead) return reject("npc_unavailable");
  return std::nullopt;
}

void apply_set_npc_status(const CallArgs& args, WorldState& s, const MutationContext& ctx, RollbackToken& token) {
  const std::string id = must(arg_str(args, "npc_id"), "npc_id");
  NpcStatus status;
  if (!parse_npc_status(must(arg_str(args, "status"), "status"), &status)) {
    throw std::runtime_error("status no longer parses");
  }
  token.capture_npc(s, id);
  Npc& npc = must_row(s.npcs, id);
  npc.status = status;
  npc.last_updated_turn = ctx.turn;
}

// --- structures ---

Reason validate_structure_amount(const CallArgs& args, const WorldState& s, const Structure** out) {
  const auto id = arg_str(args, "structure_id");
  const auto amount = arg_int(args, "amount");
  if (!id || !amount) return invalid_args();
  const Structure* st = find_ptr(s.structures, *id);
  if (!st) return reject("unknown_structure");
  if (!valid_amount(*amount)) return reject("invalid_amount");
  *out = st;
  return std::nullopt;
}

Reason validate_repair_structure(const CallArgs& args, const WorldState& s, const MutationContext&) {
  const Structure* st = nullptr;
  if (auto r = validate_structure_amount(args, s, &st)) return r;
  if (st->durability <= 0) return reject("structure_destroyed");
  if (st->durability >= st->max_durability) return reject("already_at_max");
  return std::nullopt;
}

void apply_repair_structure(const CallArgs& args, WorldState& s, const MutationContext& ctx, RollbackToken& token) {
  const std::string id = must(arg_str(args, "structure_id"), "structure_id");
  const auto amount = must(arg_int(args, "amount"), "amount");
  token.capture_structure(s, id);
  Structure& st = must_row(s.structures, id);
  st.durability = static_cast<int>(std::min<std::int64_t>(st.max_durability, st.durability + amount));
  st.status = derive_structure_status(st.durability, st.max_durability, ctx.cfg.structure_thresholds);
  st.last_repaired_turn = ctx.turn;
}

Reason validate_reinforce_structure(const CallArgs& args, const WorldState& s, const MutationContext& ctx) {
  const Structure* st = nullptr;
  if (auto r = validate_structure_amount(args, s, &st)) return r;
  if (st->durability <= 0) return reject("structure_destroyed");
  const auto amount = *arg_int(args, "amount");
  if (st->max_durability + amount > ctx.cfg.max_structure_durability) return reject("reinforce_limit_exceeded");
  return std::nullopt;
}

void apply_reinforce_structure(const CallArgs& args, WorldState& s, const MutationContext& ctx,
                               RollbackToken& token) {
  const std::string id = must(arg_str(args, "structure_id"), "structure_id");
  const int amount = static_cast<int>(must(arg_int(args, "amount"), "amount"));
  token.capture_structure(s, id);
  Structure& st = must_row(s.structures, id);
  st.max_durability += amount;
  st.durability += amount;
  st.status = derive_structure_status(st.durability, st.max_durability, ctx.cfg.structure_thresholds);
  st.last_reinforced_turn = ctx.turn;
}

Reason validate_damage_structure(const CallArgs& args, const WorldState& s, const MutationContext&) {
  const Structure* st = nullptr;
  return validate_structure_amount(args, s, &st);
}

void apply_damage_structure(const CallArgs& args, WorldState& s, const MutationContext& ctx, RollbackToken& token) {
  const std::string id = must(arg_str(args, "structure_id"), "structure_id");
  const auto amount = must(arg_int(args, "amount"), "amount");
  token.capture_structure(s, id);
  Structure& st = must_row(s.structures, id);
  st.durability = static_cast<int>(std::max<std::int64_t>(0, st.durability - amount));
  st.status = derive_structure_status(st.durability, st.max_durability, ctx.cfg.structure_thresholds);
}

// --- stockpiles ---

Reason validate_produce_resource(const CallArgs& args, const WorldState&, const MutationContext&) {
  const auto id = arg_str(args, "resource_id");
  const auto amount = arg_int(args, "amount");
  if (!id || !amount) return invalid_args();
  if (!valid_amount(*amount)) return reject("invalid_amount");
  return std::nullopt;
}

void apply_produce_resource(const CallArgs& args, WorldState& s, const MutationContext& ctx, RollbackToken& token) {
  const std::string id = must(arg_str(args, "resource_id"), "resource_id");
  const auto amount = must(arg_int(args, "amount"), "amount");
  token.capture_stockpile(s, id);
  Stockpile& sp = s.stockpiles[id];
  sp.resource_id = id;
  sp.quantity += amount;
  sp.last_updated_turn = ctx.turn;
}

Reason validate_consume_resource(const CallArgs& args, const WorldState& s, const MutationContext&) {
  const auto id = arg_str(args, "resource_id");
  const auto amount = arg_int(args, "amount");
  if (!id || !amount) return invalid_args();
  const Stockpile* sp = find_ptr(s.stockpiles, *id);
  if (!sp) return reject("unknown_resource");
  if (!valid_amount(*amount)) return reject("invalid_amount");
  if (sp->quantity < *amount) return reject("insufficient_quantity");
  return std::nullopt;
}

void apply_consume_resource(const CallArgs& args, WorldState& s, const MutationContext& ctx, RollbackToken& token) {
  const std::string id = must(arg_str(args, "resource_id"), "resource_id");
  const auto amount = must(arg_int(args, "amount"), "amount");
  token.capture_stockpile(s, id);
  Stockpile& sp = must_row(s.stockpiles, id);
  sp.quantity -= amount;
  sp.last_updated_turn = ctx.turn;
}

Reason validate_transfer_resource(const CallArgs& args, const WorldState& s, const MutationContext&) {
  const auto from = arg_str(args, "from");
  const auto to = arg_str(args, "to");
  const auto amount = arg_int(args, "amount");
  if (!from || !to || !amount) return invalid_args();
  if (*from == *to) return reject("same_resource");
  const Stockpile* src = find_ptr(s.stockpiles, *from);
  if (!src) return reject("unknown_resource");
  if (!valid_amount(*amount)) return reject("invalid_amount");
  if (src->quantity < *amount) return reject("insufficient_quantity");
  return std::nullopt;
}

void apply_transfer_resource(const CallArgs& args, WorldState& s, const MutationContext& ctx,
                             RollbackToken& token) {
  const std::string from = must(arg_str(args, "from"), "from");
  const std::string to = must(arg_str(args, "to"), "to");
  const auto amount = must(arg_int(args, "amount"), "amount");
  token.capture_stockpile(s, from);
  token.capture_stockpile(s, to);

  Stockpile& src = must_row(s.stockpiles, from);
  src.quantity -= amount;
  src.last_updated_turn = ctx.turn;

  Stockpile& dst = s.stockpiles[to];
  dst.resource_id = to;
  dst.quantity += amount;
  dst.last_updated_turn = ctx.turn;
}

// --- trade routes ---

Reason validate_open_trade_route(const CallArgs& args, const WorldState& s, const MutationContext&) {
  const auto id = arg_str(args, "route_id");
  const auto risk = arg_int(args, "risk");
  const auto reward = arg_int(args, "reward");
  if (!id || !risk || !reward) return invalid_args();
  if (*risk < 0 || *risk > 100) return reject("invalid_risk");
  if (*reward < 0 || *reward > 1000000000) return reject("invalid_reward");
  const TradeRoute* route = find_ptr(s.trade_routes, *id);
  if (route && route->status == TradeRouteStatus::Open) return reject("route_already_open");
  return std::nullopt;
}

void apply_open_trade_route(const CallArgs& args, WorldState& s, const MutationContext& ctx, RollbackToken& token) {
  const std::string id = must(arg_str(args, "route_id"), "route_id");
  token.capture_trade_route(s, id);
  TradeRoute& route = s.trade_routes[id];
  route.id = id;
  route.status = TradeRouteStatus::Open;
  route.risk = static_cast<int>(must(arg_int(args, "risk"), "risk"));
  route.reward = static_cast<int>(must(arg_int(args, "reward"), "reward"));
  route.opened_turn = ctx.turn;
  route.closed_turn.reset();
  if (auto reason = arg_str(args, "reason")) route.last_reason = *reason;
}

Reason validate_close_trade_route(const CallArgs& args, const WorldState& s, const MutationContext&) {
  const auto id = arg_str(args, "route_id");
  const auto reason = arg_str(args, "reason");
  if (!id || !reason) return invalid_args();
  const TradeRoute* route = find_ptr(s.trade_routes, *id);
  if (!route) return reject("unknown_route");
  if (route->status != TradeRouteStatus::Open) return reject("route_not_open");
  return std::nullopt;
}

void apply_close_trade_route(const CallArgs& args, WorldState& s, const MutationContext& ctx,
                             RollbackToken& token) {
  const std::string id = must(arg_str(args, "route_id"), "route_id");
  token.capture_trade_route(s, id);
  TradeRoute& route = must_row(s.trade_routes, id);
  route.status = TradeRouteStatus::Closed;
  route.closed_turn = ctx.turn;
  route.last_reason = must(arg_str(args, "reason"), "reason");
}

// --- scheduled events ---

Reason validate_schedule_event(const CallArgs& args, const WorldState& s, const MutationContext& ctx) {
  const auto id = arg_str(args, "event_id");
  const auto trigger = arg_int(args, "trigger_turn");
  if (!id || !trigger) return invalid_args();
  // Existing events are never rescheduled, which keeps trigger_turn immutable once fired.
  if (s.scheduled_events.count(*id)) return reject("event_already_exists");
  if (*trigger < ctx.turn) return reject("trigger_in_past");
  return std::nullopt;
}

void apply_schedule_event(const CallArgs& args, WorldState& s, const MutationContext&, RollbackToken& token) {
  const std::string id = must(arg_str(args, "event_id"), "event_id");
  token.capture_scheduled_event(s, id);
  ScheduledEvent& ev = s.scheduled_events[id];
  ev.id = id;
  ev.trigger_turn = must(arg_int(args, "trigger_turn"), "trigger_turn");
  ev.status = ScheduledEventStatus::Scheduled;
}

Reason validate_event_transition(const CallArgs& args, const WorldState& s, const ScheduledEvent** out) {
  const auto id = arg_str(args, "event_id");
  if (!id) return invalid_args();
  const ScheduledEvent* ev = find_ptr(s.scheduled_events, *id);
  if (!ev) return reject("unknown_event");
  if (ev->status != ScheduledEventStatus::Scheduled) return reject("event_not_scheduled");
  *out = ev;
  return std::nullopt;
}

Reason validate_fire_event(const CallArgs& args, const WorldState& s, const MutationContext& ctx) {
  const ScheduledEvent* ev = nullptr;
  if (auto r = validate_event_transition(args, s, &ev)) return r;
  if (ev->trigger_turn > ctx.turn) return reject("event_not_due");
  return std::nullopt;
}

Reason validate_cancel_event(const CallArgs& args, const WorldState& s, const MutationContext&) {
  const ScheduledEvent* ev = nullptr;
  return validate_event_transition(args, s, &ev);
}

void set_event_status(const CallArgs& args, WorldState& s, RollbackToken& token, ScheduledEventStatus status) {
  const std::string id = must(arg_str(args, "event_id"), "event_id");
  token.capture_scheduled_event(s, id);
  must_row(s.scheduled_events, id).status = status;
}

void apply_fire_event(const CallArgs& args, WorldState& s, const MutationContext&, RollbackToken& token) {
  set_event_status(args, s, token, ScheduledEventStatus::Fired);
}

void apply_cancel_event(const CallArgs& args, WorldState& s, const MutationContext&, RollbackToken& token) {
  set_event_status(args, s, token, ScheduledEventStatus::Cancelled);
}

// --- logs ---

Reason validate_record_hazard(const CallArgs& args, const WorldState& s, const MutationContext& ctx) {
  const auto id = arg_str(args, "hazard_id");
  const auto severity = arg_int(args, "severity");
  const auto duration = arg_int(args, "duration");
  if (!id || !severity || !duration) return invalid_args();
  if (*severity < 1 || *severity > ctx.cfg.max_hazard_severity) return reject("invalid_severity");
  if (*duration < 1 || *duration > 1000000) return reject("invalid_duration");
  const bool duplicate = std::any_of(s.hazard_log.begin(), s.hazard_log.end(), [&](const HazardLogEntry& h) {
    return h.hazard_id == *id && h.turn == ctx.turn;
  });
  if (duplicate) return reject("duplicate_hazard_entry");
  return std::nullopt;
}

void apply_record_hazard(const CallArgs& args, WorldState& s, const MutationContext& ctx, RollbackToken&) {
  HazardLogEntry h;
  h.hazard_id = must(arg_str(args, "hazard_id"), "hazard_id");
  h.turn = ctx.turn;
  h.severity = static_cast<int>(must(arg_int(args, "severity"), "severity"));
  h.duration = static_cast<int>(must(arg_int(args, "duration"), "duration"));
  s.hazard_log.push_back(std::move(h));
}

bool valid_combat_outcome(const std::string& o) {
  return o == "attacker_victory" || o == "defender_victory" || o == "stalemate" || o == "retreat";
}

Reason validate_record_combat(const CallArgs& args, const WorldState&, const MutationContext&) {
  const auto attacker = arg_str(args, "attacker");
  const auto defender = arg_str(args, "defender");
  const auto outcome = arg_str(args, "outcome");
  if (!attacker || !defender || !outcome) return invalid_args();
  if (*attacker == *defender) return reject("invalid_combatants");
  if (!valid_combat_outcome(*outcome)) return reject("invalid_outcome");
  return std::nullopt;
}

void apply_record_combat(const CallArgs& args, WorldState& s, const MutationContext& ctx, RollbackToken&) {
  CombatLogEntry c;
  c.seq = s.next_combat_seq++;
  c.turn = ctx.turn;
  c.attacker = must(arg_str(args, "attacker"), "attacker");
  c.defender = must(arg_str(args, "defender"), "defender");
  c.outcome = must(arg_str(args, "outcome"), "outcome");
  s.combat_log.push_back(std::move(c));
}

// --- story ---

Reason validate_advance_story(const CallArgs& args, const WorldState& s, const MutationContext&) {
  const auto act = arg_str(args, "act");
  const auto progress = arg_num(args, "progress");
  if (!act || !progress) return invalid_args();
  if (!(*progress >= 0.0 && *progress <= 1.0)) return reject("invalid_progress");
  const StoryProgress* sp = find_ptr(s.story_progress, *act);
  if (sp && *progress < sp->progress) return reject("progress_regression");
  return std::nullopt;
}

void apply_advance_story(const CallArgs& args, WorldState& s, const MutationContext& ctx, RollbackToken& token) {
  const std::string act = must(arg_str(args, "act"), "act");
  token.capture_story_progress(s, act);
  StoryProgress& sp = s.story_progress[act];
  sp.act = act;
  sp.progress = must(arg_num(args, "progress"), "progress");
  sp.last_updated_turn = ctx.turn;
}

struct Builtin {
  const char* name;
  FunctionRegistry::Validator validate;
  FunctionRegistry::Applier apply;
};

constexpr Builtin kBuiltins[] = {
    {"move_npc", validate_move_npc, apply_move_npc},
    {"adjust_trust", validate_adjust_trust, apply_adjust_trust},
    {"set_npc_status", validate_set_npc_status, apply_set_npc_status},
    {"repair_structure", validate_repair_structure, apply_repair_structure},
    {"reinforce_structure", validate_reinforce_structure, apply_reinforce_structure},
    {"damage_structure", validate_damage_structure, apply_damage_structure},
    {"produce_resource", validate_produce_resource, apply_produce_resource},
    {"consume_resource", validate_consume_resource, apply_consume_resource},
    {"transfer_resource", validate_transfer_resource, apply_transfer_resource},
    {"open_trade_route", validate_open_trade_route, apply_open_trade_route},
    {"close_trade_route", validate_close_trade_route, apply_close_trade_route},
    {"schedule_event", validate_schedule_event, apply_schedule_event},
    {"fire_event", validate_fire_event, apply_fire_event},
    {"cancel_event", validate_cancel_event, apply_cancel_event},
    {"record_hazard", validate_record_hazard, apply_record_hazard},
    {"record_combat", validate_record_combat, apply_record_combat},
    {"advance_story", validate_advance_story, apply_advance_story},
};

} // namespace

void register_builtin_functions(FunctionRegistry& registry) {
  for (const Builtin& b : kBuiltins) registry.register_function(b.name, b.validate, b.apply, restore_from_token);
}

std::vector<std::string> builtin_function_names() {
  std::vector<std::string> out;
  for (const Builtin& b : kBuiltins) out.emplace_back(b.name);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace turngate
