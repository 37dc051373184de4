#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "turngate/core/world_state.h"

namespace turngate {

enum class HistoryKind { Timeline, Hazard, Combat };

const char* history_kind_to_string(HistoryKind k);

// One row of the merged log view.
struct HistoryEntry {
  Turn turn{0};
  HistoryKind kind{HistoryKind::Timeline};
  // Timeline/combat seq; position in hazard_log for hazards.
  std::uint64_t seq{0};
  // event_type, hazard_id, or "attacker>defender".
  std::string subject;
  // Compact JSON detail.
  std::string detail;
};

struct HistoryOptions {
  // Inclusive turn window. Negative max => no upper bound.
  Turn min_turn{0};
  Turn max_turn{-1};
  bool include_timeline{true};
  bool include_hazards{true};
  bool include_combat{true};
};

// Merge the three logs into one list ordered by turn, then kind
// (timeline, hazard, combat), then seq.
std::vector<HistoryEntry> build_history(const WorldState& state, const HistoryOptions& opt = {});

// One JSON object per line; output ends with a trailing newline (empty input => "").
std::string history_to_jsonl(const std::vector<HistoryEntry>& entries);

} // namespace turngate
