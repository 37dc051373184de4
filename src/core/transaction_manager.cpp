#include "turngate/core/transaction_manager.h"

#include <stdexcept>
#include <utility>

#include "turngate/core/state_delta.h"
#include "turngate/core/state_validation.h"
#include "turngate/util/digest.h"
#include "turngate/util/log.h"

namespace turngate {

const char* tx_state_to_string(TxState s) {
  switch (s) {
    case TxState::Idle: return "idle";
    case TxState::Staging: return "staging";
    case TxState::Committing: return "committing";
    case TxState::Committed: return "committed";
    case TxState::RollingBack: return "rolling_back";
    case TxState::Aborted: return "aborted";
  }
  return "idle";
}

TransactionManager::TransactionManager(const FunctionRegistry& registry) : registry_(registry) {}

void TransactionManager::require(TxState expected, const char* op) const {
  if (state_ != expected) {
    throw std::logic_error(std::string("transaction ") + op + " not allowed in state " + tx_state_to_string(state_));
  }
}

void TransactionManager::begin(const WorldState& canonical, Turn turn) {
  if (state_ != TxState::Idle && state_ != TxState::Committed && state_ != TxState::Aborted) {
    throw std::logic_error(std::string("transaction begin not allowed in state ") + tx_state_to_string(state_));
  }
  if (turn <= canonical.turn) {
    throw std::logic_error("transaction turn " + std::to_string(turn) + " must follow committed turn " +
                           std::to_string(canonical.turn));
  }
  shadow_ = canonical;
  shadow_.turn = turn;
  turn_ = turn;
  tokens_.clear();
  abort_reason_.clear();
  begin_digest_ = registry_.config().verify_rollback ? digest_world_state64(shadow_) : 0;
  state_ = TxState::Staging;
}

TxOutcome TransactionManager::stage(const ProposedCall& call) {
  require(TxState::Staging, "stage");

  TxOutcome out;
  MutationResult res;
  try {
    res = registry_.invoke(call, shadow_);
  } catch (const std::exception& e) {
    // ApplyError for validator/apply failures; anything else is a rollback or
    // resource failure inside the registry. Either way the turn is over.
    log::error("turn " + std::to_string(turn_) + ": " + e.what());
    out.ok = false;
    out.kind = ErrorKind::ApplyFailure;
    out.reason = e.what();
    abort(out.reason);
    out.reason = abort_reason_;
    return out;
  } catch (...) {
    abort("non-standard exception while staging " + call.function_name);
    throw;
  }

  if (!res.applied()) {
    out.ok = false;
    out.kind = res.status == MutationStatus::UnknownFunction ? ErrorKind::UnknownFunction
                                                             : ErrorKind::ValidationRejected;
    out.reason = res.reason;
    log::warn("turn " + std::to_string(turn_) + ": staging rejected " + describe_call(call) + " (" + res.reason + ")");
    abort("staging_rejected: " + res.reason);
    return out;
  }

  tokens_.emplace_back(call.function_name, std::move(res.token));
  log::debug("turn " + std::to_string(turn_) + ": staged " + describe_call(call));
  return out;
}

void TransactionManager::abort(const std::string& reason) {
  require(TxState::Staging, "abort");
  state_ = TxState::RollingBack;
  abort_reason_ = reason;

  // Aborted however the unwinding ends, so a later begin() is always allowed.
  struct Terminal {
    TxState& state;
    ~Terminal() { state = TxState::Aborted; }
  } terminal{state_};

  bool rollback_failed = false;
  while (!tokens_.empty()) {
    auto& [name, token] = tokens_.back();
    try {
      registry_.rollback(name, token, shadow_);
    } catch (const std::exception& e) {
      log::error("turn " + std::to_string(turn_) + ": rollback of " + name + " failed: " + e.what());
      rollback_failed = true;
    }
    tokens_.pop_back();
  }
  if (rollback_failed) abort_reason_ += "; rollback_failed";

  if (registry_.config().verify_rollback) {
    const std::uint64_t now = digest_world_state64(shadow_);
    if (now != begin_digest_) {
      log::error("turn " + std::to_string(turn_) + ": rollback left shadow digest " + digest64_to_hex(now) +
                 ", expected " + digest64_to_hex(begin_digest_));
      abort_reason_ += "; " + std::string(kRollbackMismatchReason);
    }
  }

  log::info("turn " + std::to_string(turn_) + ": aborted (" + abort_reason_ + ")");
}

TxOutcome TransactionManager::commit(WorldState& canonical, PersistenceAdapter& adapter) {
  require(TxState::Staging, "commit");

  TxOutcome out;
  if (registry_.config().validate_before_commit) {
    const auto errors = validate_world_state(shadow_, registry_.config());
    if (!errors.empty()) {
      for (const auto& e : errors) log::error("turn " + std::to_string(turn_) + ": invariant violated: " + e);
      out.ok = false;
      out.kind = ErrorKind::ApplyFailure;
      out.reason = "invariant_violation: " + errors.front();
      abort(out.reason);
      return out;
    }
  }

  StateDelta delta;
  try {
    delta = compute_state_delta(canonical, shadow_);
  } catch (const std::exception& e) {
    log::error("turn " + std::to_string(turn_) + ": cannot build delta: " + e.what());
    out.ok = false;
    out.kind = ErrorKind::ApplyFailure;
    out.reason = std::string("delta_failure: ") + e.what();
    abort(out.reason);
    return out;
  }

  state_ = TxState::Committing;
  WorldState previous = std::move(canonical);
  canonical = std::move(shadow_);
  shadow_ = WorldState{};

  std::string error;
  bool persisted = false;
  try {
    persisted = adapter.persist(delta, &error);
  } catch (const std::exception& e) {
    error = e.what();
  } catch (...) {
    canonical = std::move(previous);
    tokens_.clear();
    abort_reason_ = "persistence_failure: non-standard exception";
    state_ = TxState::Aborted;
    log::error("turn " + std::to_string(turn_) + ": " + abort_reason_);
    throw;
  }

  if (!persisted) {
    canonical = std::move(previous);
    tokens_.clear();
    out.ok = false;
    out.kind = ErrorKind::PersistenceFailure;
    out.reason = "persistence_failure: " + (error.empty() ? std::string("unknown error") : error);
    abort_reason_ = out.reason;
    state_ = TxState::Aborted;
    log::error("turn " + std::to_string(turn_) + ": " + out.reason);
    return out;
  }

  tokens_.clear();
  state_ = TxState::Committed;
  log::info("turn " + std::to_string(turn_) + ": committed " + std::to_string(delta.row_count()) + " row(s)");
  return out;
}

std::vector<std::string> TransactionManager::staged_names() const {
  std::vector<std::string> out;
  out.reserve(tokens_.size());
  for (const auto& [name, _] : tokens_) out.push_back(name);
  return out;
}

} // namespace turngate
