#include "turngate/persistence/sqlite_store.h"

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "turngate/core/enum_strings.h"
#include "turngate/util/log.h"

namespace turngate {

namespace {

constexpr int kSchemaVersion = 1;

const char* const kSchema = R"sql(
CREATE TABLE IF NOT EXISTS metadata (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS locations (
  id TEXT PRIMARY KEY
);
CREATE TABLE IF NOT EXISTS npc_state (
  id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  template_id TEXT NOT NULL,
  location TEXT NOT NULL,
  status TEXT NOT NULL,
  trust INTEGER NOT NULL,
  last_updated_turn INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS structure_state (
  id TEXT PRIMARY KEY,
  durability INTEGER NOT NULL,
  max_durability INTEGER NOT NULL,
  status TEXT NOT NULL,
  last_repaired_turn INTEGER,
  last_reinforced_turn INTEGER
);
CREATE TABLE IF NOT EXISTS stockpiles (
  resource_id TEXT PRIMARY KEY,
  quantity INTEGER NOT NULL CHECK (quantity >= 0),
  last_updated_turn INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS trade_routes (
  id TEXT PRIMARY KEY,
  status TEXT NOT NULL,
  risk INTEGER NOT NULL,
  reward INTEGER NOT NULL,
  opened_turn INTEGER,
  closed_turn INTEGER,
  last_reason TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS scheduled_events (
  id TEXT PRIMARY KEY,
  trigger_turn INTEGER NOT NULL,
  status TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS story_progress (
  act TEXT PRIMARY KEY,
  progress REAL NOT NULL,
  last_updated_turn INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS timeline_events (
  seq INTEGER PRIMARY KEY,
  turn INTEGER NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS hazard_log (
  row_id INTEGER PRIMARY KEY AUTOINCREMENT,
  hazard_id TEXT NOT NULL,
  turn INTEGER NOT NULL,
  severity INTEGER NOT NULL,
  duration INTEGER NOT NULL,
  UNIQUE (hazard_id, turn)
);
CREATE TABLE IF NOT EXISTS combat_log (
  seq INTEGER PRIMARY KEY,
  turn INTEGER NOT NULL,
  attacker TEXT NOT NULL,
  defender TEXT NOT NULL,
  outcome TEXT NOT NULL
);
)sql";

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
  throw std::runtime_error("sqlite: " + what + ": " + (db ? sqlite3_errmsg(db) : "no database"));
}

// Prepared statement, finalized on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) fail(db_, std::string("prepare '") + sql + "'");
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind_int(int i, std::int64_t v) { check(sqlite3_bind_int64(stmt_, i, v), "bind"); }
  void bind_double(int i, double v) { check(sqlite3_bind_double(stmt_, i, v), "bind"); }
  void bind_text(int i, const std::string& v) {
    check(sqlite3_bind_text(stmt_, i, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT), "bind");
  }
  void bind_opt_int(int i, const std::optional<std::int64_t>& v) {
    if (v) {
      bind_int(i, *v);
    } else {
      check(sqlite3_bind_null(stmt_, i), "bind");
    }
  }

  // True while rows are available.
  bool step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    fail(db_, "step");
  }

  // Executes a statement that returns no rows and readies it for reuse.
  void run() {
    step();
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  std::int64_t col_int(int i) const { return sqlite3_column_int64(stmt_, i); }
  double col_double(int i) const { return sqlite3_column_double(stmt_, i); }
  std::string col_text(int i) const {
    const unsigned char* p = sqlite3_column_text(stmt_, i);
    return p ? std::string(reinterpret_cast<const char*>(p), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, i)))
             : std::string();
  }
  std::optional<std::int64_t> col_opt_int(int i) const {
    if (sqlite3_column_type(stmt_, i) == SQLITE_NULL) return std::nullopt;
    return col_int(i);
  }

 private:
  void check(int rc, const char* what) {
    if (rc != SQLITE_OK) fail(db_, what);
  }

  sqlite3* db_;
  sqlite3_stmt* stmt_{nullptr};
};

void set_meta(sqlite3* db, const char* key, const std::string& value) {
  Statement st(db, "INSERT OR REPLACE INTO metadata (key, value) VALUES (?1, ?2)");
  st.bind_text(1, key);
  st.bind_text(2, value);
  st.run();
}

std::optional<std::string> get_meta(sqlite3* db, const char* key) {
  Statement st(db, "SELECT value FROM metadata WHERE key = ?1");
  st.bind_text(1, key);
  if (!st.step()) return std::nullopt;
  return st.col_text(0);
}

std::int64_t parse_meta_int(const std::string& key, const std::string& value) {
  try {
    std::size_t used = 0;
    const long long v = std::stoll(value, &used);
    if (used != value.size()) throw std::invalid_argument("trailing characters");
    return static_cast<std::int64_t>(v);
  } catch (const std::logic_error&) {
    throw std::runtime_error("sqlite: metadata '" + key + "' is not an integer: " + value);
  }
}

void delete_keys(sqlite3* db, const char* sql, const std::vector<std::string>& keys) {
  if (keys.empty()) return;
  Statement st(db, sql);
  for (const auto& k : keys) {
    st.bind_text(1, k);
    st.run();
  }
}

// Status strings are validated on load; a bad one means a corrupted database.
template <typename E>
E parse_status(bool (*parse)(const std::string&, E*), const std::string& s, const char* table) {
  E out{};
  if (!parse(s, &out)) throw std::runtime_error(std::string("sqlite: bad status '") + s + "' in " + table);
  return out;
}

} // namespace

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
  const int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite: cannot open '" + path + "': " + msg);
  }
  try {
    exec("PRAGMA foreign_keys = ON;");
    exec(kSchema);
    if (const auto v = get_meta(db_, "schema_version")) {
      if (parse_meta_int("schema_version", *v) != kSchemaVersion) {
        throw std::runtime_error("sqlite: unsupported schema_version " + *v + " in '" + path + "'");
      }
    } else {
      set_meta(db_, "schema_version", std::to_string(kSchemaVersion));
    }
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  log::debug("sqlite store open: " + path);
}

SqliteStore::~SqliteStore() {
  if (db_) sqlite3_close(db_);
}

void SqliteStore::exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error(std::string("sqlite: exec failed: ") + msg);
  }
}

Turn SqliteStore::stored_turn() {
  const auto v = get_meta(db_, "turn");
  return v ? parse_meta_int("turn", *v) : 0;
}

void SqliteStore::write_delta(const StateDelta& d) {
  if (!d.npcs.upserts.empty()) {
    Statement st(db_,
                 "INSERT OR REPLACE INTO npc_state (id, name, template_id, location, status, trust, last_updated_turn) "
                 "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)");
    for (const auto& n : d.npcs.upserts) {
      st.bind_text(1, n.id);
      st.bind_text(2, n.name);
      st.bind_text(3, n.template_id);
      st.bind_text(4, n.location);
      st.bind_text(5, npc_status_to_string(n.status));
      st.bind_int(6, n.trust);
      st.bind_int(7, n.last_updated_turn);
      st.run();
    }
  }
  delete_keys(db_, "DELETE FROM npc_state WHERE id = ?1", d.npcs.deletions);

  if (!d.structures.upserts.empty()) {
    Statement st(db_,
                 "INSERT OR REPLACE INTO structure_state "
                 "(id, durability, max_durability, status, last_repaired_turn, last_reinforced_turn) "
                 "VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
    for (const auto& s : d.structures.upserts) {
      st.bind_text(1, s.id);
      st.bind_int(2, s.durability);
      st.bind_int(3, s.max_durability);
      st.bind_text(4, structure_status_to_string(s.status));
      st.bind_opt_int(5, s.last_repaired_turn);
      st.bind_opt_int(6, s.last_reinforced_turn);
      st.run();
    }
  }
  delete_keys(db_, "DELETE FROM structure_state WHERE id = ?1", d.structures.deletions);

  if (!d.stockpiles.upserts.empty()) {
    Statement st(db_,
                 "INSERT OR REPLACE INTO stockpiles (resource_id, quantity, last_updated_turn) VALUES (?1, ?2, ?3)");
    for (const auto& s : d.stockpiles.upserts) {
      st.bind_text(1, s.resource_id);
      st.bind_int(2, s.quantity);
      st.bind_int(3, s.last_updated_turn);
      st.run();
    }
  }
  delete_keys(db_, "DELETE FROM stockpiles WHERE resource_id = ?1", d.stockpiles.deletions);

  if (!d.trade_routes.upserts.empty()) {
    Statement st(db_,
                 "INSERT OR REPLACE INTO trade_routes "
                 "(id, status, risk, reward, opened_turn, closed_turn, last_reason) "
                 "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)");
    for (const auto& r : d.trade_routes.upserts) {
      st.bind_text(1, r.id);
      st.bind_text(2, trade_route_status_to_string(r.status));
      st.bind_int(3, r.risk);
      st.bind_int(4, r.reward);
      st.bind_opt_int(5, r.opened_turn);
      st.bind_opt_int(6, r.closed_turn);
      st.bind_text(7, r.last_reason);
      st.run();
    }
  }
  delete_keys(db_, "DELETE FROM trade_routes WHERE id = ?1", d.trade_routes.deletions);

  if (!d.scheduled_events.upserts.empty()) {
    Statement st(db_, "INSERT OR REPLACE INTO scheduled_events (id, trigger_turn, status) VALUES (?1, ?2, ?3)");
    for (const auto& e : d.scheduled_events.upserts) {
      st.bind_text(1, e.id);
      st.bind_int(2, e.trigger_turn);
      st.bind_text(3, scheduled_event_status_to_string(e.status));
      st.run();
    }
  }
  delete_keys(db_, "DELETE FROM scheduled_events WHERE id = ?1", d.scheduled_events.deletions);

  if (!d.story_progress.upserts.empty()) {
    Statement st(db_,
                 "INSERT OR REPLACE INTO story_progress (act, progress, last_updated_turn) VALUES (?1, ?2, ?3)");
    for (const auto& s : d.story_progress.upserts) {
      st.bind_text(1, s.act);
      st.bind_double(2, s.progress);
      st.bind_int(3, s.last_updated_turn);
      st.run();
    }
  }
  delete_keys(db_, "DELETE FROM story_progress WHERE act = ?1", d.story_progress.deletions);

  // Log rows are append-only: a conflicting key is an error, never a replace.
  if (!d.timeline.empty()) {
    Statement st(db_, "INSERT INTO timeline_events (seq, turn, event_type, payload) VALUES (?1, ?2, ?3, ?4)");
    for (const auto& e : d.timeline) {
      st.bind_int(1, static_cast<std::int64_t>(e.seq));
      st.bind_int(2, e.turn);
      st.bind_text(3, e.event_type);
      st.bind_text(4, e.payload);
      st.run();
    }
  }
  if (!d.hazard_log.empty()) {
    Statement st(db_, "INSERT INTO hazard_log (hazard_id, turn, severity, duration) VALUES (?1, ?2, ?3, ?4)");
    for (const auto& h : d.hazard_log) {
      st.bind_text(1, h.hazard_id);
      st.bind_int(2, h.turn);
      st.bind_int(3, h.severity);
      st.bind_int(4, h.duration);
      st.run();
    }
  }
  if (!d.combat_log.empty()) {
    Statement st(db_, "INSERT INTO combat_log (seq, turn, attacker, defender, outcome) VALUES (?1, ?2, ?3, ?4, ?5)");
    for (const auto& c : d.combat_log) {
      st.bind_int(1, static_cast<std::int64_t>(c.seq));
      st.bind_int(2, c.turn);
      st.bind_text(3, c.attacker);
      st.bind_text(4, c.defender);
      st.bind_text(5, c.outcome);
      st.run();
    }
  }

  set_meta(db_, "turn", std::to_string(d.turn));
  set_meta(db_, "next_timeline_seq", std::to_string(d.next_timeline_seq));
  set_meta(db_, "next_combat_seq", std::to_string(d.next_combat_seq));
}

void SqliteStore::write_snapshot(const WorldState& state) {
  exec("BEGIN IMMEDIATE;");
  try {
    exec("DELETE FROM locations; DELETE FROM npc_state; DELETE FROM structure_state; DELETE FROM stockpiles;"
         "DELETE FROM trade_routes; DELETE FROM scheduled_events; DELETE FROM story_progress;"
         "DELETE FROM timeline_events; DELETE FROM hazard_log; DELETE FROM combat_log;");
    {
      Statement st(db_, "INSERT INTO locations (id) VALUES (?1)");
      for (const auto& l : state.locations) {
        st.bind_text(1, l);
        st.run();
      }
    }
    write_delta(compute_state_delta(WorldState{}, state));
    exec("COMMIT;");
  } catch (const std::exception& e) {
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      log::error(std::string("sqlite: rollback failed: ") + sqlite3_errmsg(db_));
    }
    throw std::runtime_error(std::string("sqlite: snapshot write failed: ") + e.what());
  }
  log::info("sqlite store seeded at turn " + std::to_string(state.turn));
}

bool SqliteStore::persist(const StateDelta& delta, std::string* error) {
  try {
    exec("BEGIN IMMEDIATE;");
  } catch (const std::exception& e) {
    if (error) *error = e.what();
    return false;
  }

  try {
    const Turn current = stored_turn();
    if (delta.turn <= current) {
      throw std::runtime_error("delta turn " + std::to_string(delta.turn) + " does not advance stored turn " +
                               std::to_string(current));
    }
    write_delta(delta);
    exec("COMMIT;");
  } catch (const std::exception& e) {
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      log::error(std::string("sqlite: rollback failed: ") + sqlite3_errmsg(db_));
    }
    if (error) *error = e.what();
    log::warn(std::string("sqlite: persist of turn ") + std::to_string(delta.turn) + " rolled back: " + e.what());
    return false;
  }
  return true;
}

WorldState SqliteStore::load() {
  WorldState s;
  s.turn = stored_turn();
  if (const auto v = get_meta(db_, "next_timeline_seq")) {
    s.next_timeline_seq = static_cast<std::uint64_t>(parse_meta_int("next_timeline_seq", *v));
  }
  if (const auto v = get_meta(db_, "next_combat_seq")) {
    s.next_combat_seq = static_cast<std::uint64_t>(parse_meta_int("next_combat_seq", *v));
  }

  {
    Statement st(db_, "SELECT id FROM locations");
    while (st.step()) s.locations.insert(st.col_text(0));
  }
  {
    Statement st(db_, "SELECT id, name, template_id, location, status, trust, last_updated_turn FROM npc_state");
    while (st.step()) {
      Npc n;
      n.id = st.col_text(0);
      n.name = st.col_text(1);
      n.template_id = st.col_text(2);
      n.location = st.col_text(3);
      n.status = parse_status(parse_npc_status, st.col_text(4), "npc_state");
      n.trust = static_cast<int>(st.col_int(5));
      n.last_updated_turn = st.col_int(6);
      s.npcs[n.id] = n;
    }
  }
  {
    Statement st(db_,
                 "SELECT id, durability, max_durability, status, last_repaired_turn, last_reinforced_turn "
                 "FROM structure_state");
    while (st.step()) {
      Structure x;
      x.id = st.col_text(0);
      x.durability = static_cast<int>(st.col_int(1));
      x.max_durability = static_cast<int>(st.col_int(2));
      x.status = parse_status(parse_structure_status, st.col_text(3), "structure_state");
      x.last_repaired_turn = st.col_opt_int(4);
      x.last_reinforced_turn = st.col_opt_int(5);
      s.structures[x.id] = x;
    }
  }
  {
    Statement st(db_, "SELECT resource_id, quantity, last_updated_turn FROM stockpiles");
    while (st.step()) {
      Stockpile x;
      x.resource_id = st.col_text(0);
      x.quantity = st.col_int(1);
      x.last_updated_turn = st.col_int(2);
      s.stockpiles[x.resource_id] = x;
    }
  }
  {
    Statement st(db_,
                 "SELECT id, status, risk, reward, opened_turn, closed_turn, last_reason FROM trade_routes");
    while (st.step()) {
      TradeRoute x;
      x.id = st.col_text(0);
      x.status = parse_status(parse_trade_route_status, st.col_text(1), "trade_routes");
      x.risk = static_cast<int>(st.col_int(2));
      x.reward = static_cast<int>(st.col_int(3));
      x.opened_turn = st.col_opt_int(4);
      x.closed_turn = st.col_opt_int(5);
      x.last_reason = st.col_text(6);
      s.trade_routes[x.id] = x;
    }
  }
  {
    Statement st(db_, "SELECT id, trigger_turn, status FROM scheduled_events");
    while (st.step()) {
      ScheduledEvent x;
      x.id = st.col_text(0);
      x.trigger_turn = st.col_int(1);
      x.status = parse_status(parse_scheduled_event_status, st.col_text(2), "scheduled_events");
      s.scheduled_events[x.id] = x;
    }
  }
  {
    Statement st(db_, "SELECT act, progress, last_updated_turn FROM story_progress");
    while (st.step()) {
      StoryProgress x;
      x.act = st.col_text(0);
      x.progress = st.col_double(1);
      x.last_updated_turn = st.col_int(2);
      s.story_progress[x.act] = x;
    }
  }
  {
    Statement st(db_, "SELECT seq, turn, event_type, payload FROM timeline_events ORDER BY seq");
    while (st.step()) {
      TimelineEvent e;
      e.seq = static_cast<std::uint64_t>(st.col_int(0));
      e.turn = st.col_int(1);
      e.event_type = st.col_text(2);
      e.payload = st.col_text(3);
      s.timeline.push_back(std::move(e));
    }
  }
  {
    Statement st(db_, "SELECT hazard_id, turn, severity, duration FROM hazard_log ORDER BY row_id");
    while (st.step()) {
      HazardLogEntry h;
      h.hazard_id = st.col_text(0);
      h.turn = st.col_int(1);
      h.severity = static_cast<int>(st.col_int(2));
      h.duration = static_cast<int>(st.col_int(3));
      s.hazard_log.push_back(std::move(h));
    }
  }
  {
    Statement st(db_, "SELECT seq, turn, attacker, defender, outcome FROM combat_log ORDER BY seq");
    while (st.step()) {
      CombatLogEntry c;
      c.seq = static_cast<std::uint64_t>(st.col_int(0));
      c.turn = st.col_int(1);
      c.attacker = st.col_text(2);
      c.defender = st.col_text(3);
      c.outcome = st.col_text(4);
      s.combat_log.push_back(std::move(c));
    }
  }
  return s;
}

} // namespace turngate
