#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

#include "turngate/core/function_registry.h"

namespace turngate {

// Free-form scene description handed to the adjudicator alongside the batch.
struct NarrativeContext {
  std::string text;
  std::vector<std::string> tags;
};

struct CallVerdict {
  bool accepted{true};
  // Set when !accepted.
  std::string reason;
};

// Verdict keyed by the index of the call within the submitted batch
// (0-based, batch order, not the original submission order).
using Verdict = std::map<std::size_t, CallVerdict>;

// Consistency adjudication over a whole batch.
//
// Implementations may block. They receive their own copies of the batch and
// the context and must not assume access to any world state. A verdict that
// lacks an entry for some submitted call, or an exception escaping
// adjudicate(), is treated as the adjudicator being unavailable.
class Adjudicator {
 public:
  virtual ~Adjudicator() = default;

  virtual Verdict adjudicate(const std::vector<ProposedCall>& batch, const NarrativeContext& context) = 0;
};

// Accepts every call.
class AcceptAllAdjudicator : public Adjudicator {
 public:
  Verdict adjudicate(const std::vector<ProposedCall>& batch, const NarrativeContext& context) override;
};

// Deterministic, rule-based adjudicator for hosts without a model-backed one.
//
// Rejects calls whose function is forbidden, calls that name a locked entity
// in any string argument, and every call when the context carries one of the
// blocking tags.
class RuleBasedAdjudicator : public Adjudicator {
 public:
  struct Rules {
    std::unordered_set<std::string> forbidden_functions;
    std::unordered_set<std::string> locked_entities;
    std::unordered_set<std::string> blocking_tags;
  };

  explicit RuleBasedAdjudicator(Rules rules);

  Verdict adjudicate(const std::vector<ProposedCall>& batch, const NarrativeContext& context) override;

  const Rules& rules() const { return rules_; }

 private:
  Rules rules_;
};

} // namespace turngate
