#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "turngate/core/function_registry.h"
#include "turngate/core/rules_engine.h"
#include "turngate/core/world_state.h"
#include "turngate/persistence/persistence_adapter.h"

namespace turngate {

// Idle -> Staging -> Committing -> Committed
//         Staging -> RollingBack -> Aborted
// Committing -> Aborted on persistence failure (canonical state restored).
enum class TxState { Idle, Staging, Committing, Committed, RollingBack, Aborted };

const char* tx_state_to_string(TxState s);

// Appended to the abort reason when verify_rollback finds the unwound shadow
// differs from the state begin() copied.
inline constexpr const char kRollbackMismatchReason[] = "rollback_mismatch";

struct TxOutcome {
  bool ok{true};
  ErrorKind kind{ErrorKind::ApplyFailure};
  std::string reason;
};

// Stages one turn's accepted calls on a shadow copy of the canonical state and
// commits them all or none.
//
// One transaction at a time. After Committed or Aborted a new begin() is allowed.
class TransactionManager {
 public:
  explicit TransactionManager(const FunctionRegistry& registry);

  // Deep-copies `canonical` into the shadow and stamps `turn` on it.
  // Throws std::logic_error while another transaction is in flight.
  void begin(const WorldState& canonical, Turn turn);

  // Invokes the call on the shadow. A rejection (the call stopped being valid
  // after earlier calls of the batch), an unknown function or any
  // std::exception from the registry aborts the transaction and returns !ok.
  // Other exceptions abort the transaction and are rethrown.
  TxOutcome stage(const ProposedCall& call);

  // Promotes the shadow to `canonical` and persists the delta. On persistence
  // failure `canonical` is restored to its previous value. The transaction is
  // Committed or Aborted when this returns or throws.
  TxOutcome commit(WorldState& canonical, PersistenceAdapter& adapter);

  // Unwinds every staged call in reverse order. Staging -> RollingBack -> Aborted.
  // A failed rollback or a digest mismatch is appended to abort_reason().
  void abort(const std::string& reason);

  TxState state() const { return state_; }
  Turn turn() const { return turn_; }
  const WorldState& shadow() const { return shadow_; }
  std::size_t staged_count() const { return tokens_.size(); }
  const std::string& abort_reason() const { return abort_reason_; }
  // Names of the staged calls, in staging order.
  std::vector<std::string> staged_names() const;

 private:
  void require(TxState expected, const char* op) const;

  const FunctionRegistry& registry_;
  TxState state_{TxState::Idle};
  Turn turn_{0};
  WorldState shadow_;
  std::uint64_t begin_digest_{0};
  std::vector<std::pair<std::string, RollbackToken>> tokens_;
  std::string abort_reason_;
};

} // namespace turngate
