#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "turngate/core/adjudication.h"
#include "turngate/core/function_registry.h"

namespace turngate {

// Pipeline stage at which a call was rejected.
enum class Tier { Tier1, Tier2, Staging, Commit };

enum class ErrorKind {
  ValidationRejected,
  UnknownFunction,
  AdjudicationUnavailable,
  ApplyFailure,
  PersistenceFailure,
};

const char* tier_to_string(Tier t);
const char* error_kind_to_string(ErrorKind k);

// Reason strings produced by the engine itself (validators supply their own).
inline constexpr const char kBatchRejectedReason[] = "batch_rejected";
inline constexpr const char kAdjudicationTimeoutReason[] = "adjudication_timeout";
inline constexpr const char kAdjudicationErrorReason[] = "adjudication_error";
inline constexpr const char kAdjudicationIncompleteReason[] = "adjudication_incomplete";
// An adjudication that timed out in an earlier turn is still running.
inline constexpr const char kAdjudicationBusyReason[] = "adjudication_busy";
inline constexpr const char kRateLimitExceededReason[] = "rate_limit_exceeded";

struct Rejection {
  // Position in the submitted call list.
  std::size_t index{0};
  ProposedCall call;
  Tier tier{Tier::Tier1};
  ErrorKind kind{ErrorKind::ValidationRejected};
  std::string reason;
};

struct RulesOutcome {
  // Calls cleared for staging, in submission order, with their original indices.
  std::vector<ProposedCall> accepted;
  std::vector<std::size_t> accepted_indices;
  std::vector<Rejection> rejected;
  // Set when Tier 2 rejected the batch (atomic_all) or was unavailable.
  bool abort{false};
  std::string abort_reason;
};

// Two-tier gate for a turn's proposed calls.
//
// Tier 1 applies the per-turn call budgets and runs each call's validator in
// isolation against the pre-turn state. Survivors go to the adjudicator as one
// batch (Tier 2), which runs on a worker thread bounded by
// EngineConfig::adjudication_timeout_ms. The policy in EngineConfig decides
// whether a Tier-2 rejection drops one call or aborts the turn. A timeout, an
// exception or an incomplete verdict always rejects the whole batch.
//
// At most one adjudicate() call is in flight. A call that timed out keeps
// running on its worker; the next Tier 2 waits up to the timeout for it and
// fails closed with kAdjudicationBusyReason if it is still running.
class RulesEngine {
 public:
  RulesEngine(const FunctionRegistry& registry, std::shared_ptr<Adjudicator> adjudicator);

  RulesOutcome evaluate(const std::vector<ProposedCall>& calls, const NarrativeContext& context,
                        const WorldState& canonical, Turn turn) const;

  RulesEngine(const RulesEngine&) = delete;
  RulesEngine& operator=(const RulesEngine&) = delete;

  const FunctionRegistry& registry() const { return registry_; }

  // True while a timed-out adjudicate() call has not returned yet.
  bool adjudication_pending() const;

 private:
  struct Attempt {
    bool ok{false};
    Verdict verdict;
    std::string error;
  };

  Attempt run_adjudicator(std::vector<ProposedCall> batch, NarrativeContext context) const;

  const FunctionRegistry& registry_;
  std::shared_ptr<Adjudicator> adjudicator_;

  mutable std::mutex mutex_;
  // Result of the last timed-out call; valid() until it is reaped.
  mutable std::future<Verdict> pending_;
};

} // namespace turngate
