#include "turngate/core/serialization.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "turngate/core/enum_strings.h"

namespace turngate {
namespace {

using json::Array;
using json::Object;
using json::Value;

template <typename Map>
std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& [k, _] : m) keys.push_back(k);
  std::sort(keys.begin(), keys.end());
  return keys;
}

void put_opt_turn(Object& o, const char* key, const std::optional<Turn>& t) {
  if (t) o[key] = *t;
}

// --- reading helpers ---

[[noreturn]] void bad(const std::string& where, const std::string& what) {
  throw std::runtime_error("world state JSON: " + where + ": " + what);
}

const Value& field(const Object& o, const char* key, const std::string& where) {
  const auto it = o.find(key);
  if (it == o.end()) bad(where, std::string("missing '") + key + "'");
  return it->second;
}

std::string get_string(const Object& o, const char* key, const std::string& where) {
  const std::string* s = field(o, key, where).as_string();
  if (!s) bad(where, std::string("'") + key + "' must be a string");
  return *s;
}

std::int64_t get_int(const Object& o, const char* key, const std::string& where) {
  const double* d = field(o, key, where).as_number();
  if (!d || !json::is_integral(*d)) bad(where, std::string("'") + key + "' must be an integer");
  return static_cast<std::int64_t>(*d);
}

double get_number(const Object& o, const char* key, const std::string& where) {
  const double* d = field(o, key, where).as_number();
  if (!d) bad(where, std::string("'") + key + "' must be a number");
  return *d;
}

std::optional<Turn> get_opt_turn(const Object& o, const char* key, const std::string& where) {
  const auto it = o.find(key);
  if (it == o.end() || it->second.is_null()) return std::nullopt;
  return get_int(o, key, where);
}

const Array& get_array(const Object& o, const char* key) {
  static const Array kEmpty;
  const auto it = o.find(key);
  if (it == o.end()) return kEmpty;
  const Array* a = it->second.as_array();
  if (!a) bad(key, "must be an array");
  return *a;
}

const Object& row_object(const Value& v, const std::string& where) {
  const Object* o = v.as_object();
  if (!o) bad(where, "row must be an object");
  return *o;
}

template <typename Map, typename Row>
void insert_unique(Map& table, const std::string& key, Row row, const char* table_name) {
  if (key.empty()) bad(table_name, "empty key");
  if (!table.emplace(key, std::move(row)).second) bad(table_name, "duplicate key '" + key + "'");
}

} // namespace

json::Value serialize_world_to_json_value(const WorldState& s) {
  Object root;
  root["format_version"] = kWorldFormatVersion;
  root["turn"] = s.turn;
  root["next_timeline_seq"] = s.next_timeline_seq;
  root["next_combat_seq"] = s.next_combat_seq;

  std::vector<std::string> locs(s.locations.begin(), s.locations.end());
  std::sort(locs.begin(), locs.end());
  Array locations;
  for (auto& l : locs) locations.push_back(std::move(l));
  root["locations"] = std::move(locations);

  Array npcs;
  for (const auto& id : sorted_keys(s.npcs)) {
    const Npc& n = s.npcs.at(id);
    Object o;
    o["id"] = n.id;
    o["name"] = n.name;
    o["template_id"] = n.template_id;
    o["location"] = n.location;
    o["status"] = npc_status_to_string(n.status);
    o["trust"] = n.trust;
    o["last_updated_turn"] = n.last_updated_turn;
    npcs.push_back(std::move(o));
  }
  root["npcs"] = std::move(npcs);

  Array structures;
  for (const auto& id : sorted_keys(s.structures)) {
    const Structure& st = s.structures.at(id);
    Object o;
    o["id"] = st.id;
    o["durability"] = st.durability;
    o["max_durability"] = st.max_durability;
    o["status"] = structure_status_to_string(st.status);
    put_opt_turn(o, "last_repaired_turn", st.last_repaired_turn);
    put_opt_turn(o, "last_reinforced_turn", st.last_reinforced_turn);
    structures.push_back(std::move(o));
  }
  root["structures"] = std::move(structures);

  Array stockpiles;
  for (const auto& id : sorted_keys(s.stockpiles)) {
    const Stockpile& sp = s.stockpiles.at(id);
    Object o;
    o["resource_id"] = sp.resource_id;
    o["quantity"] = sp.quantity;
    o["last_updated_turn"] = sp.last_updated_turn;
    stockpiles.push_back(std::move(o));
  }
  root["stockpiles"] = std::move(stockpiles);

  Array routes;
  for (const auto& id : sorted_keys(s.trade_routes)) {
    const TradeRoute& r = s.trade_routes.at(id);
    Object o;
    o["id"] = r.id;
    o["status"] = trade_route_status_to_string(r.status);
    o["risk"] = r.risk;
    o["reward"] = r.reward;
    put_opt_turn(o, "opened_turn", r.opened_turn);
    put_opt_turn(o, "closed_turn", r.closed_turn);
    o["last_reason"] = r.last_reason;
    routes.push_back(std::move(o));
  }
  root["trade_routes"] = std::move(routes);

  Array events;
  for (const auto& id : sorted_keys(s.scheduled_events)) {
    const ScheduledEvent& ev = s.scheduled_events.at(id);
    Object o;
    o["id"] = ev.id;
    o["trigger_turn"] = ev.trigger_turn;
    o["status"] = scheduled_event_status_to_string(ev.status);
    events.push_back(std::move(o));
  }
  root["scheduled_events"] = std::move(events);

  Array story;
  for (const auto& act : sorted_keys(s.story_progress)) {
    const StoryProgress& sp = s.story_progress.at(act);
    Object o;
    o["act"] = sp.act;
    o["progress"] = sp.progress;
    o["last_updated_turn"] = sp.last_updated_turn;
    story.push_back(std::move(o));
  }
  root["story_progress"] = std::move(story);

  Array timeline;
  for (const auto& e : s.timeline) {
    Object o;
    o["seq"] = e.seq;
    o["turn"] = e.turn;
    o["event_type"] = e.event_type;
    o["payload"] = e.payload;
    timeline.push_back(std::move(o));
  }
  root["timeline"] = std::move(timeline);

  Array hazards;
  for (const auto& h : s.hazard_log) {
    Object o;
    o["hazard_id"] = h.hazard_id;
    o["turn"] = h.turn;
    o["severity"] = h.severity;
    o["duration"] = h.duration;
    hazards.push_back(std::move(o));
  }
  root["hazard_log"] = std::move(hazards);

  Array combats;
  for (const auto& c : s.combat_log) {
    Object o;
    o["seq"] = c.seq;
    o["turn"] = c.turn;
    o["attacker"] = c.attacker;
    o["defender"] = c.defender;
    o["outcome"] = c.outcome;
    combats.push_back(std::move(o));
  }
  root["combat_log"] = std::move(combats);

  return root;
}

std::string serialize_world_to_json(const WorldState& state, int indent) {
  return json::stringify(serialize_world_to_json_value(state), indent);
}

WorldState deserialize_world_from_json_value(const json::Value& root_value) {
  const Object* root_ptr = root_value.as_object();
  if (!root_ptr) bad("root", "must be an object");
  const Object& root = *root_ptr;

  const std::int64_t version = get_int(root, "format_version", "root");
  if (version < 1 || version > kWorldFormatVersion) {
    bad("root", "unsupported format_version " + std::to_string(version));
  }

  WorldState s;
  s.turn = get_int(root, "turn", "root");
  s.next_timeline_seq = static_cast<std::uint64_t>(get_int(root, "next_timeline_seq", "root"));
  s.next_combat_seq = static_cast<std::uint64_t>(get_int(root, "next_combat_seq", "root"));

  for (const auto& v : get_array(root, "locations")) {
    const std::string* l = v.as_string();
    if (!l || l->empty()) bad("locations", "entries must be non-empty strings");
    s.locations.insert(*l);
  }

  for (const auto& v : get_array(root, "npcs")) {
    const Object& o = row_object(v, "npcs");
    Npc n;
    n.id = get_string(o, "id", "npcs");
    n.name = get_string(o, "name", "npcs/" + n.id);
    n.template_id = get_string(o, "template_id", "npcs/" + n.id);
    n.location = get_string(o, "location", "npcs/" + n.id);
    if (!parse_npc_status(get_string(o, "status", "npcs/" + n.id), &n.status)) bad("npcs/" + n.id, "bad status");
    n.trust = static_cast<int>(get_int(o, "trust", "npcs/" + n.id));
    n.last_updated_turn = get_int(o, "last_updated_turn", "npcs/" + n.id);
    const std::string key = n.id;
    insert_unique(s.npcs, key, std::move(n), "npcs");
  }

  for (const auto& v : get_array(root, "structures")) {
    const Object& o = row_object(v, "structures");
    Structure st;
    st.id = get_string(o, "id", "structures");
    const std::string where = "structures/" + st.id;
    st.durability = static_cast<int>(get_int(o, "durability", where));
    st.max_durability = static_cast<int>(get_int(o, "max_durability", where));
    if (!parse_structure_status(get_string(o, "status", where), &st.status)) bad(where, "bad status");
    st.last_repaired_turn = get_opt_turn(o, "last_repaired_turn", where);
    st.last_reinforced_turn = get_opt_turn(o, "last_reinforced_turn", where);
    const std::string key = st.id;
    insert_unique(s.structures, key, std::move(st), "structures");
  }

  for (const auto& v : get_array(root, "stockpiles")) {
    const Object& o = row_object(v, "stockpiles");
    Stockpile sp;
    sp.resource_id = get_string(o, "resource_id", "stockpiles");
    sp.quantity = get_int(o, "quantity", "stockpiles/" + sp.resource_id);
    sp.last_updated_turn = get_int(o, "last_updated_turn", "stockpiles/" + sp.resource_id);
    const std::string key = sp.resource_id;
    insert_unique(s.stockpiles, key, std::move(sp), "stockpiles");
  }

  for (const auto& v : get_array(root, "trade_routes")) {
    const Object& o = row_object(v, "trade_routes");
    TradeRoute r;
    r.id = get_string(o, "id", "trade_routes");
    const std::string where = "trade_routes/" + r.id;
    if (!parse_trade_route_status(get_string(o, "status", where), &r.status)) bad(where, "bad status");
    r.risk = static_cast<int>(get_int(o, "risk", where));
    r.reward = static_cast<int>(get_int(o, "reward", where));
    r.opened_turn = get_opt_turn(o, "opened_turn", where);
    r.closed_turn = get_opt_turn(o, "closed_turn", where);
    r.last_reason = get_string(o, "last_reason", where);
    const std::string key = r.id;
    insert_unique(s.trade_routes, key, std::move(r), "trade_routes");
  }

  for (const auto& v : get_array(root, "scheduled_events")) {
    const Object& o = row_object(v, "scheduled_events");
    ScheduledEvent ev;
    ev.id = get_string(o, "id", "scheduled_events");
    const std::string where = "scheduled_events/" + ev.id;
    ev.trigger_turn = get_int(o, "trigger_turn", where);
    if (!parse_scheduled_event_status(get_string(o, "status", where), &ev.status)) bad(where, "bad status");
    const std::string key = ev.id;
    insert_unique(s.scheduled_events, key, std::move(ev), "scheduled_events");
  }

  for (const auto& v : get_array(root, "story_progress")) {
    const Object& o = row_object(v, "story_progress");
    StoryProgress sp;
    sp.act = get_string(o, "act", "story_progress");
    sp.progress = get_number(o, "progress", "story_progress/" + sp.act);
    sp.last_updated_turn = get_int(o, "last_updated_turn", "story_progress/" + sp.act);
    const std::string key = sp.act;
    insert_unique(s.story_progress, key, std::move(sp), "story_progress");
  }

  for (const auto& v : get_array(root, "timeline")) {
    const Object& o = row_object(v, "timeline");
    TimelineEvent e;
    e.seq = static_cast<std::uint64_t>(get_int(o, "seq", "timeline"));
    e.turn = get_int(o, "turn", "timeline");
    e.event_type = get_string(o, "event_type", "timeline");
    const std::string* payload = field(o, "payload", "timeline").as_string();
    if (!payload) bad("timeline", "'payload' must be a string");
    e.payload = *payload;
    s.timeline.push_back(std::move(e));
  }

  for (const auto& v : get_array(root, "hazard_log")) {
    const Object& o = row_object(v, "hazard_log");
    HazardLogEntry h;
    h.hazard_id = get_string(o, "hazard_id", "hazard_log");
    h.turn = get_int(o, "turn", "hazard_log");
    h.severity = static_cast<int>(get_int(o, "severity", "hazard_log"));
    h.duration = static_cast<int>(get_int(o, "duration", "hazard_log"));
    s.hazard_log.push_back(std::move(h));
  }

  for (const auto& v : get_array(root, "combat_log")) {
    const Object& o = row_object(v, "combat_log");
    CombatLogEntry c;
    c.seq = static_cast<std::uint64_t>(get_int(o, "seq", "combat_log"));
    c.turn = get_int(o, "turn", "combat_log");
    c.attacker = get_string(o, "attacker", "combat_log");
    c.defender = get_string(o, "defender", "combat_log");
    c.outcome = get_string(o, "outcome", "combat_log");
    s.combat_log.push_back(std::move(c));
  }

  return s;
}

WorldState deserialize_world_from_json(const std::string& json_text) {
  return deserialize_world_from_json_value(json::parse(json_text));
}

} // namespace turngate
