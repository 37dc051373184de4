#pragma once

#include <cstdint>
#include <string>

#include "turngate/core/world_state.h"

namespace turngate {

struct DigestOptions {
  // Include the timeline, hazard and combat logs (and their sequence counters).
  bool include_logs{true};
};

// Compute a stable 64-bit digest of a WorldState.
//
// Properties:
//  - Deterministic across runs/platforms (no dependence on unordered_map iteration order).
//  - Insensitive to the ordering of set-like containers (locations).
//  - Sensitive to the ordering of the append-only logs.
std::uint64_t digest_world_state64(const WorldState& state, const DigestOptions& opt = {});

// Format a 64-bit digest as a fixed-width lowercase hex string.
std::string digest64_to_hex(std::uint64_t v);

} // namespace turngate
