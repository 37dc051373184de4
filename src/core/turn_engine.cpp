#include "turngate/core/turn_engine.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "turngate/core/builtin_functions.h"
#include "turngate/core/state_validation.h"
#include "turngate/util/digest.h"
#include "turngate/util/log.h"

namespace turngate {

namespace {

// Clears the in-turn flag however run_turn() exits.
class TurnGuard {
 public:
  explicit TurnGuard(std::atomic<bool>& flag) : flag_(flag) {
    if (flag_.exchange(true)) throw std::logic_error("run_turn called while a turn is already in progress");
  }
  ~TurnGuard() { flag_.store(false); }

  TurnGuard(const TurnGuard&) = delete;
  TurnGuard& operator=(const TurnGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

void sort_by_index(std::vector<Rejection>& v) {
  std::stable_sort(v.begin(), v.end(), [](const Rejection& a, const Rejection& b) { return a.index < b.index; });
}

} // namespace

const char* turn_status_to_string(TurnStatus s) {
  switch (s) {
    case TurnStatus::Committed: return "committed";
    case TurnStatus::Aborted: return "aborted";
  }
  return "aborted";
}

json::Value turn_result_to_json(const TurnResult& r) {
  json::Object o;
  o["turn_number"] = r.turn_number;
  o["final_status"] = turn_status_to_string(r.final_status);
  if (!r.abort_reason.empty()) o["abort_reason"] = r.abort_reason;
  o["state_digest"] = digest64_to_hex(r.state_digest);

  json::Array applied;
  for (const auto& c : r.applied) applied.push_back(json::Object{{"function", c.function_name}, {"args", c.args}});
  o["applied"] = std::move(applied);

  json::Array rejected;
  for (const auto& rej : r.rejected) {
    json::Object x;
    x["index"] = rej.index;
    x["function"] = rej.call.function_name;
    x["args"] = rej.call.args;
    x["tier"] = tier_to_string(rej.tier);
    x["kind"] = error_kind_to_string(rej.kind);
    x["reason"] = rej.reason;
    rejected.push_back(std::move(x));
  }
  o["rejected"] = std::move(rejected);
  return o;
}

TurnEngine::TurnEngine(EngineConfig cfg, std::shared_ptr<Adjudicator> adjudicator, PersistenceAdapter& adapter)
    : registry_(std::move(cfg)), rules_(registry_, std::move(adjudicator)), tx_(registry_), adapter_(adapter) {
  register_builtin_functions(registry_);
}

FunctionRegistry& TurnEngine::registry() {
  if (open_) throw std::logic_error("function registry is sealed once the engine is open");
  return registry_;
}

void TurnEngine::open() {
  if (open_) throw std::logic_error("turn engine already open");
  check_engine_config(registry_.config());
  log::set_level(registry_.config().log_level);

  WorldState loaded = adapter_.load();
  const auto errors = validate_world_state(loaded, registry_.config());
  if (!errors.empty()) {
    for (const auto& e : errors) log::error("stored state: " + e);
    throw std::runtime_error("stored state violates " + std::to_string(errors.size()) +
                             " invariant(s); first: " + errors.front());
  }

  canonical_ = std::move(loaded);
  registry_.seal();
  open_ = true;
  log::info("turn engine open at turn " + std::to_string(canonical_.turn) + ", " +
            std::to_string(registry_.names().size()) + " functions, policy " +
            adjudication_policy_to_string(registry_.config().adjudication_policy));
}

TurnResult TurnEngine::run_turn(const std::vector<ProposedCall>& calls, const NarrativeContext& context) {
  if (!open_) throw std::logic_error("run_turn called before open()");
  TurnGuard guard(in_turn_);
  return run_turn_locked(calls, context);
}

TurnResult TurnEngine::run_turn_locked(const std::vector<ProposedCall>& calls, const NarrativeContext& context) {
  TurnResult result;
  result.turn_number = canonical_.turn + 1;
  const Turn turn = result.turn_number;
  log::info("turn " + std::to_string(turn) + ": " + std::to_string(calls.size()) + " proposed call(s)");

  RulesOutcome rules = rules_.evaluate(calls, context, canonical_, turn);
  result.rejected = std::move(rules.rejected);

  auto finish_aborted = [&](std::string reason) {
    result.final_status = TurnStatus::Aborted;
    result.abort_reason = std::move(reason);
    result.state_digest = digest_world_state64(canonical_);
    sort_by_index(result.rejected);
    log::info("turn " + std::to_string(turn) + ": aborted (" + result.abort_reason + ")");
    return result;
  };

  if (rules.abort) return finish_aborted(rules.abort_reason);

  // Reports every accepted call as rejected at staging; the one that caused the
  // abort keeps its own reason.
  auto reject_staged = [&](ErrorKind kind, std::size_t culprit, const std::string& reason) {
    for (std::size_t k = 0; k < rules.accepted.size(); ++k) {
      Rejection r;
      r.index = rules.accepted_indices[k];
      r.call = rules.accepted[k];
      r.tier = Tier::Staging;
      r.kind = kind;
      r.reason = k == culprit ? reason : (k < culprit ? "rolled_back" : "not_staged");
      result.rejected.push_back(std::move(r));
    }
  };

  tx_.begin(canonical_, turn);
  for (std::size_t k = 0; k < rules.accepted.size(); ++k) {
    const TxOutcome staged = tx_.stage(rules.accepted[k]);
    if (!staged.ok) {
      reject_staged(staged.kind, k, staged.reason);
      std::string reason = staged.kind == ErrorKind::ApplyFailure ? "apply_failure" : "staging_rejected";
      if (tx_.abort_reason().find(kRollbackMismatchReason) != std::string::npos) {
        reason += "; " + std::string(kRollbackMismatchReason);
      }
      return finish_aborted(std::move(reason));
    }
  }

  const TxOutcome committed = tx_.commit(canonical_, adapter_);
  if (!committed.ok) {
    for (std::size_t k = 0; k < rules.accepted.size(); ++k) {
      Rejection r;
      r.index = rules.accepted_indices[k];
      r.call = rules.accepted[k];
      r.tier = Tier::Commit;
      r.kind = committed.kind;
      r.reason = committed.reason;
      result.rejected.push_back(std::move(r));
    }
    return finish_aborted(committed.kind == ErrorKind::PersistenceFailure ? "persistence_failure" : "invariant_violation");
  }

  result.applied = std::move(rules.accepted);
  result.final_status = TurnStatus::Committed;
  result.state_digest = digest_world_state64(canonical_);
  sort_by_index(result.rejected);
  log::info("turn " + std::to_string(turn) + ": committed, " + std::to_string(result.applied.size()) + " applied, " +
            std::to_string(result.rejected.size()) + " rejected");
  return result;
}

} // namespace turngate
