#pragma once

#include <string>
#include <vector>

#include "turngate/core/engine_config.h"
#include "turngate/core/world_state.h"

namespace turngate {

// Validate the invariants of a WorldState.
//
// Checks per-table invariants (trust range, durability bounds and derived
// status, non-negative quantities, trade route turn fields, story progress
// range), referential integrity (NPC locations), log ordering, sequence
// counters and hazard (hazard_id, turn) uniqueness.
//
// Returns a sorted list of human-readable error strings.
// Empty => state is considered valid.
std::vector<std::string> validate_world_state(const WorldState& s, const EngineConfig& cfg = {});

} // namespace turngate
