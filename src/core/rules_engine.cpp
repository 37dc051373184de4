#include "turngate/core/rules_engine.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <map>
#include <stdexcept>
#include <thread>
#include <utility>

#include "turngate/util/log.h"

namespace turngate {

const char* tier_to_string(Tier t) {
  switch (t) {
    case Tier::Tier1: return "tier1";
    case Tier::Tier2: return "tier2";
    case Tier::Staging: return "staging";
    case Tier::Commit: return "commit";
  }
  return "tier1";
}

const char* error_kind_to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::ValidationRejected: return "validation_rejected";
    case ErrorKind::UnknownFunction: return "unknown_function";
    case ErrorKind::AdjudicationUnavailable: return "adjudication_unavailable";
    case ErrorKind::ApplyFailure: return "apply_failure";
    case ErrorKind::PersistenceFailure: return "persistence_failure";
  }
  return "validation_rejected";
}

namespace {

std::string verdict_reason(const CallVerdict& v) { return v.reason.empty() ? "rejected_by_adjudicator" : v.reason; }

} // namespace

RulesEngine::RulesEngine(const FunctionRegistry& registry, std::shared_ptr<Adjudicator> adjudicator)
    : registry_(registry), adjudicator_(std::move(adjudicator)) {
  if (!adjudicator_) throw std::invalid_argument("RulesEngine needs an adjudicator");
}

bool RulesEngine::adjudication_pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.valid() && pending_.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
}

RulesEngine::Attempt RulesEngine::run_adjudicator(std::vector<ProposedCall> batch, NarrativeContext context) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const int timeout_ms = registry_.config().adjudication_timeout_ms;

  if (pending_.valid()) {
    if (timeout_ms > 0) {
      if (pending_.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        Attempt a;
        a.error = kAdjudicationBusyReason;
        return a;
      }
    } else {
      pending_.wait();
    }
    // The late verdict belonged to a turn that already failed closed.
    log::info("discarding late adjudication result");
    pending_ = std::future<Verdict>();
  }

  // The task owns its inputs and a reference to the adjudicator, so a timed-out
  // worker can be detached without touching engine state.
  std::packaged_task<Verdict()> task(
      [adj = adjudicator_, batch = std::move(batch), context = std::move(context)]() {
        return adj->adjudicate(batch, context);
      });
  std::future<Verdict> fut = task.get_future();

  if (timeout_ms <= 0) {
    task();
  } else {
    std::thread worker(std::move(task));
    if (fut.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
      worker.detach();
      pending_ = std::move(fut);
      Attempt a;
      a.error = kAdjudicationTimeoutReason;
      return a;
    }
    worker.join();
  }

  Attempt a;
  try {
    a.verdict = fut.get();
    a.ok = true;
  } catch (const std::exception& e) {
    a.error = std::string(kAdjudicationErrorReason) + ": " + e.what();
  } catch (...) {
    a.error = std::string(kAdjudicationErrorReason) + ": non-standard exception";
  }
  return a;
}

RulesOutcome RulesEngine::evaluate(const std::vector<ProposedCall>& calls, const NarrativeContext& context,
                                   const WorldState& canonical, Turn turn) const {
  RulesOutcome out;

  // --- Tier 1 ---
  const EngineConfig& cfg = registry_.config();
  std::vector<std::size_t> survivors;
  std::map<std::string, int> per_function;
  for (std::size_t i = 0; i < calls.size(); ++i) {
    CheckResult res;
    if (!registry_.contains(calls[i].function_name)) {
      res.status = CheckStatus::UnknownFunction;
      res.reason = kUnknownFunctionReason;
    } else if ((cfg.max_calls_per_turn > 0 && static_cast<int>(survivors.size()) >= cfg.max_calls_per_turn) ||
               (cfg.max_calls_per_function > 0 && per_function[calls[i].function_name] >= cfg.max_calls_per_function)) {
      res.status = CheckStatus::Rejected;
      res.reason = kRateLimitExceededReason;
    } else {
      res = registry_.check(calls[i], canonical, turn);
    }
    if (res.passed()) {
      survivors.push_back(i);
      ++per_function[calls[i].function_name];
      continue;
    }
    Rejection r;
    r.index = i;
    r.call = calls[i];
    r.tier = Tier::Tier1;
    r.kind = res.status == CheckStatus::UnknownFunction ? ErrorKind::UnknownFunction : ErrorKind::ValidationRejected;
    r.reason = res.reason;
    log::info("turn " + std::to_string(turn) + ": tier1 rejected " + describe_call(calls[i]) + " (" + r.reason + ")");
    out.rejected.push_back(std::move(r));
  }

  if (survivors.empty()) return out;

  // --- Tier 2 ---
  std::vector<ProposedCall> batch;
  batch.reserve(survivors.size());
  for (std::size_t i : survivors) batch.push_back(calls[i]);

  auto reject_all = [&](ErrorKind kind, const std::string& reason, const Verdict* verdict) {
    for (std::size_t j = 0; j < survivors.size(); ++j) {
      Rejection r;
      r.index = survivors[j];
      r.call = calls[survivors[j]];
      r.tier = Tier::Tier2;
      r.kind = kind;
      r.reason = reason;
      if (verdict) {
        const auto it = verdict->find(j);
        if (it != verdict->end() && !it->second.accepted) r.reason = verdict_reason(it->second);
      }
      out.rejected.push_back(std::move(r));
    }
    out.abort = true;
  };

  Attempt attempt = run_adjudicator(batch, context);
  if (attempt.ok) {
    for (std::size_t j = 0; j < survivors.size(); ++j) {
      if (attempt.verdict.find(j) == attempt.verdict.end()) {
        attempt.ok = false;
        attempt.error = kAdjudicationIncompleteReason;
        break;
      }
    }
  }
  if (!attempt.ok) {
    log::warn("turn " + std::to_string(turn) + ": adjudication unavailable (" + attempt.error + ")");
    reject_all(ErrorKind::AdjudicationUnavailable, attempt.error, nullptr);
    out.abort_reason = attempt.error;
    std::sort(out.rejected.begin(), out.rejected.end(),
              [](const Rejection& a, const Rejection& b) { return a.index < b.index; });
    return out;
  }

  bool any_rejected = false;
  for (std::size_t j = 0; j < survivors.size(); ++j) {
    if (!attempt.verdict.at(j).accepted) any_rejected = true;
  }

  if (any_rejected && registry_.config().adjudication_policy == AdjudicationPolicy::AtomicAll) {
    log::info("turn " + std::to_string(turn) + ": tier2 rejected the batch");
    reject_all(ErrorKind::ValidationRejected, kBatchRejectedReason, &attempt.verdict);
    out.abort_reason = "tier2_rejected";
  } else {
    for (std::size_t j = 0; j < survivors.size(); ++j) {
      const CallVerdict& v = attempt.verdict.at(j);
      const std::size_t i = survivors[j];
      if (v.accepted) {
        out.accepted.push_back(calls[i]);
        out.accepted_indices.push_back(i);
        continue;
      }
      Rejection r;
      r.index = i;
      r.call = calls[i];
      r.tier = Tier::Tier2;
      r.kind = ErrorKind::ValidationRejected;
      r.reason = verdict_reason(v);
      log::info("turn " + std::to_string(turn) + ": tier2 rejected " + describe_call(calls[i]) + " (" + r.reason + ")");
      out.rejected.push_back(std::move(r));
    }
  }

  std::sort(out.rejected.begin(), out.rejected.end(),
            [](const Rejection& a, const Rejection& b) { return a.index < b.index; });
  return out;
}

} // namespace turngate
