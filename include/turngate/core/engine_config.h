#pragma once

#include <string>

#include "turngate/core/world_state.h"
#include "turngate/util/log.h"

namespace turngate {

// How a Tier-2 rejection of one call affects the rest of the batch.
enum class AdjudicationPolicy {
  // Any rejected call aborts the whole turn.
  AtomicAll = 0,
  // Only the rejected calls are dropped; the rest proceed to staging.
  PerCall = 1,
};

const char* adjudication_policy_to_string(AdjudicationPolicy p);
bool parse_adjudication_policy(const std::string& s, AdjudicationPolicy* out);

struct EngineConfig {
  // Inclusive bounds for Npc::trust.
  int trust_min{-5};
  int trust_max{5};

  StructureThresholds structure_thresholds;

  // Largest max_durability a reinforce_structure call may produce.
  int max_structure_durability{1000};

  // Inclusive upper bound for record_hazard severity (lower bound is 1).
  int max_hazard_severity{10};

  // Per-turn call budgets enforced at Tier 1, in submission order. Only calls
  // that pass their validator count against a budget. 0 disables the limit.
  int max_calls_per_function{0};
  int max_calls_per_turn{0};

  AdjudicationPolicy adjudication_policy{AdjudicationPolicy::AtomicAll};

  // How long the engine waits for the adjudicator, in milliseconds.
  // 0 waits indefinitely.
  int adjudication_timeout_ms{30000};

  // Run validate_world_state() on the shadow copy before promoting it.
  // A violation aborts the turn.
  bool validate_before_commit{true};

  // After unwinding rollback tokens, compare the shadow digest against the
  // pre-turn digest and log an error on mismatch.
  bool verify_rollback{true};

  log::Level log_level{log::Level::Info};
};

// Parse config overrides from a JSON object. Missing keys keep their defaults.
// Throws std::runtime_error on malformed JSON, wrong value types, or values
// outside their valid range.
//
// Example:
// {
//   "trust": {"min": -5, "max": 5},
//   "structure_thresholds": {"breached_ratio": 0.25, "damaged_ratio": 0.6},
//   "max_structure_durability": 1000,
//   "max_hazard_severity": 10,
//   "rate_limits": {"max_calls_per_function": 5, "max_calls_per_turn": 20},
//   "adjudication": {"policy": "atomic_all", "timeout_ms": 30000},
//   "validate_before_commit": true,
//   "verify_rollback": true,
//   "log_level": "info"
// }
EngineConfig parse_engine_config(const std::string& json_text);

// Range checks shared by the parser and TurnEngine::open(). Throws
// std::runtime_error naming the first offending key.
void check_engine_config(const EngineConfig& cfg);

EngineConfig load_engine_config_from_file(const std::string& path);

std::string engine_config_to_json(const EngineConfig& cfg, int indent = 2);

} // namespace turngate
