#include "turngate/core/history.h"

#include <algorithm>
#include <tuple>

#include "turngate/util/json.h"

namespace turngate {

const char* history_kind_to_string(HistoryKind k) {
  switch (k) {
    case HistoryKind::Timeline: return "timeline";
    case HistoryKind::Hazard: return "hazard";
    case HistoryKind::Combat: return "combat";
  }
  return "timeline";
}

std::vector<HistoryEntry> build_history(const WorldState& state, const HistoryOptions& opt) {
  auto in_window = [&](Turn t) { return t >= opt.min_turn && (opt.max_turn < 0 || t <= opt.max_turn); };

  std::vector<HistoryEntry> out;
  if (opt.include_timeline) {
    for (const auto& e : state.timeline) {
      if (!in_window(e.turn)) continue;
      out.push_back(HistoryEntry{e.turn, HistoryKind::Timeline, e.seq, e.event_type, e.payload});
    }
  }
  if (opt.include_hazards) {
    for (std::size_t i = 0; i < state.hazard_log.size(); ++i) {
      const auto& h = state.hazard_log[i];
      if (!in_window(h.turn)) continue;
      json::Object d{{"severity", h.severity}, {"duration", h.duration}};
      out.push_back(HistoryEntry{h.turn, HistoryKind::Hazard, static_cast<std::uint64_t>(i), h.hazard_id,
                                 json::stringify(d, 0)});
    }
  }
  if (opt.include_combat) {
    for (const auto& c : state.combat_log) {
      if (!in_window(c.turn)) continue;
      json::Object d{{"attacker", c.attacker}, {"defender", c.defender}, {"outcome", c.outcome}};
      out.push_back(HistoryEntry{c.turn, HistoryKind::Combat, c.seq, c.attacker + ">" + c.defender,
                                 json::stringify(d, 0)});
    }
  }

  std::stable_sort(out.begin(), out.end(), [](const HistoryEntry& a, const HistoryEntry& b) {
    return std::tie(a.turn, a.kind, a.seq) < std::tie(b.turn, b.kind, b.seq);
  });
  return out;
}

std::string history_to_jsonl(const std::vector<HistoryEntry>& entries) {
  std::string out;
  for (const auto& e : entries) {
    json::Object o;
    o["turn"] = e.turn;
    o["kind"] = history_kind_to_string(e.kind);
    o["seq"] = e.seq;
    o["subject"] = e.subject;
    o["detail"] = e.detail;
    out += json::stringify(o, 0);
    out += '\n';
  }
  return out;
}

} // namespace turngate
