#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "turngate/core/adjudication.h"
#include "turngate/core/engine_config.h"
#include "turngate/core/function_registry.h"
#include "turngate/core/rules_engine.h"
#include "turngate/core/transaction_manager.h"
#include "turngate/core/world_state.h"
#include "turngate/persistence/persistence_adapter.h"
#include "turngate/util/json.h"

namespace turngate {

enum class TurnStatus { Committed, Aborted };

const char* turn_status_to_string(TurnStatus s);

struct TurnResult {
  // The turn that was attempted. On abort the canonical turn stays one below.
  Turn turn_number{0};
  std::vector<ProposedCall> applied;
  // Every rejected call, ordered by submission index.
  std::vector<Rejection> rejected;
  TurnStatus final_status{TurnStatus::Aborted};
  // Empty when committed.
  std::string abort_reason;
  // Digest of the canonical state after the turn (unchanged state on abort).
  std::uint64_t state_digest{0};

  bool committed() const { return final_status == TurnStatus::Committed; }
};

json::Value turn_result_to_json(const TurnResult& r);

// Owns the canonical WorldState and drives one turn at a time through
// Tier 1, Tier 2, staging and commit.
//
// The built-in functions are registered on construction. Hosts may register
// more through registry() until open() seals the catalog.
class TurnEngine {
 public:
  TurnEngine(EngineConfig cfg, std::shared_ptr<Adjudicator> adjudicator, PersistenceAdapter& adapter);

  TurnEngine(const TurnEngine&) = delete;
  TurnEngine& operator=(const TurnEngine&) = delete;

  // Throws std::logic_error once the engine is open.
  FunctionRegistry& registry();

  // Loads state from the adapter, validates it and seals the registry.
  // Throws std::runtime_error if the config is out of range or the stored
  // state violates an invariant.
  void open();
  bool is_open() const { return open_; }

  // Runs the full pipeline for the next turn. Throws std::logic_error if the
  // engine is not open or if called while another turn is in progress.
  TurnResult run_turn(const std::vector<ProposedCall>& calls, const NarrativeContext& context = {});

  const WorldState& state() const { return canonical_; }
  // Last committed turn.
  Turn turn() const { return canonical_.turn; }
  const EngineConfig& config() const { return registry_.config(); }
  TxState transaction_state() const { return tx_.state(); }

 private:
  TurnResult run_turn_locked(const std::vector<ProposedCall>& calls, const NarrativeContext& context);

  FunctionRegistry registry_;
  RulesEngine rules_;
  TransactionManager tx_;
  PersistenceAdapter& adapter_;
  WorldState canonical_;
  bool open_{false};
  std::atomic<bool> in_turn_{false};
};

} // namespace turngate
