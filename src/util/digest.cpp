#include "turngate/util/digest.h"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <type_traits>
#include <vector>

namespace turngate {
namespace {

// FNV-1a 64-bit.
class Digest64 {
 public:
  void add_u8(std::uint8_t b) {
    h_ ^= static_cast<std::uint64_t>(b);
    h_ *= kPrime;
  }

  void add_u64(std::uint64_t v) {
    // Little-endian bytes regardless of host.
    for (int i = 0; i < 8; ++i) add_u8(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
  }

  void add_i64(std::int64_t v) { add_u64(static_cast<std::uint64_t>(v)); }
  void add_size(std::size_t n) { add_u64(static_cast<std::uint64_t>(n)); }
  void add_bool(bool b) { add_u8(static_cast<std::uint8_t>(b ? 1 : 0)); }

  template <typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
  void add_enum(E e) {
    using U = std::underlying_type_t<E>;
    add_u64(static_cast<std::uint64_t>(static_cast<U>(e)));
  }

  void add_string(const std::string& s) {
    add_size(s.size());
    for (unsigned char c : s) add_u8(static_cast<std::uint8_t>(c));
  }

  void add_double(double v) {
    std::uint64_t u = 0;
    static_assert(sizeof(u) == sizeof(v));
    std::memcpy(&u, &v, sizeof(u));
    // Normalize -0.0 to +0.0.
    if ((u << 1) == 0) u = 0;
    const std::uint64_t exp = u & 0x7ff0000000000000ULL;
    const std::uint64_t mant = u & 0x000fffffffffffffULL;
    if (exp == 0x7ff0000000000000ULL && mant != 0) u = 0x7ff8000000000000ULL;
    add_u64(u);
  }

  void add_opt_turn(const std::optional<Turn>& t) {
    add_bool(t.has_value());
    if (t) add_i64(*t);
  }

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffset = 1469598103934665603ull;
  static constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t h_{kOffset};
};

template <typename Map>
std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& [k, _] : m) keys.push_back(k);
  std::sort(keys.begin(), keys.end());
  return keys;
}

void hash_world_state(Digest64& d, const WorldState& s, const DigestOptions& opt) {
  d.add_i64(s.turn);

  std::vector<std::string> locations(s.locations.begin(), s.locations.end());
  std::sort(locations.begin(), locations.end());
  d.add_size(locations.size());
  for (const auto& l : locations) d.add_string(l);

  d.add_size(s.npcs.size());
  for (const auto& id : sorted_keys(s.npcs)) {
    const Npc& n = s.npcs.at(id);
    d.add_string(id);
    d.add_string(n.id);
    d.add_string(n.name);
    d.add_string(n.template_id);
    d.add_string(n.location);
    d.add_enum(n.status);
    d.add_i64(n.trust);
    d.add_i64(n.last_updated_turn);
  }

  d.add_size(s.structures.size());
  for (const auto& id : sorted_keys(s.structures)) {
    const Structure& st = s.structures.at(id);
    d.add_string(id);
    d.add_string(st.id);
    d.add_i64(st.durability);
    d.add_i64(st.max_durability);
    d.add_enum(st.status);
    d.add_opt_turn(st.last_repaired_turn);
    d.add_opt_turn(st.last_reinforced_turn);
  }

  d.add_size(s.stockpiles.size());
  for (const auto& id : sorted_keys(s.stockpiles)) {
    const Stockpile& sp = s.stockpiles.at(id);
    d.add_string(id);
    d.add_string(sp.resource_id);
    d.add_i64(sp.quantity);
    d.add_i64(sp.last_updated_turn);
  }

  d.add_size(s.trade_routes.size());
  for (const auto& id : sorted_keys(s.trade_routes)) {
    const TradeRoute& r = s.trade_routes.at(id);
    d.add_string(id);
    d.add_string(r.id);
    d.add_enum(r.status);
    d.add_i64(r.risk);
    d.add_i64(r.reward);
    d.add_opt_turn(r.opened_turn);
    d.add_opt_turn(r.closed_turn);
    d.add_string(r.last_reason);
  }

  d.add_size(s.scheduled_events.size());
  for (const auto& id : sorted_keys(s.scheduled_events)) {
    const ScheduledEvent& ev = s.scheduled_events.at(id);
    d.add_string(id);
    d.add_string(ev.id);
    d.add_i64(ev.trigger_turn);
    d.add_enum(ev.status);
  }

  d.add_size(s.story_progress.size());
  for (const auto& act : sorted_keys(s.story_progress)) {
    const StoryProgress& sp = s.story_progress.at(act);
    d.add_string(act);
    d.add_string(sp.act);
    d.add_double(sp.progress);
    d.add_i64(sp.last_updated_turn);
  }

  if (!opt.include_logs) return;

  d.add_u64(s.next_timeline_seq);
  d.add_u64(s.next_combat_seq);

  d.add_size(s.timeline.size());
  for (const auto& e : s.timeline) {
    d.add_u64(e.seq);
    d.add_i64(e.turn);
    d.add_string(e.event_type);
    d.add_string(e.payload);
  }

  d.add_size(s.hazard_log.size());
  for (const auto& h : s.hazard_log) {
    d.add_string(h.hazard_id);
    d.add_i64(h.turn);
    d.add_i64(h.severity);
    d.add_i64(h.duration);
  }

  d.add_size(s.combat_log.size());
  for (const auto& c : s.combat_log) {
    d.add_u64(c.seq);
    d.add_i64(c.turn);
    d.add_string(c.attacker);
    d.add_string(c.defender);
    d.add_string(c.outcome);
  }
}

} // namespace

std::uint64_t digest_world_state64(const WorldState& state, const DigestOptions& opt) {
  Digest64 d;
  hash_world_state(d, state, opt);
  return d.value();
}

std::string digest64_to_hex(std::uint64_t v) {
  std::ostringstream out;
  out << std::hex;
  out.width(16);
  out.fill('0');
  out << v;
  return out.str();
}

} // namespace turngate
