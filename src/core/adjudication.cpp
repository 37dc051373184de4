#include "turngate/core/adjudication.h"

#include <utility>

namespace turngate {

Verdict AcceptAllAdjudicator::adjudicate(const std::vector<ProposedCall>& batch, const NarrativeContext&) {
  Verdict v;
  for (std::size_t i = 0; i < batch.size(); ++i) v[i] = CallVerdict{};
  return v;
}

RuleBasedAdjudicator::RuleBasedAdjudicator(Rules rules) : rules_(std::move(rules)) {}

Verdict RuleBasedAdjudicator::adjudicate(const std::vector<ProposedCall>& batch, const NarrativeContext& context) {
  std::string blocking_tag;
  for (const auto& tag : context.tags) {
    if (rules_.blocking_tags.count(tag)) {
      blocking_tag = tag;
      break;
    }
  }

  Verdict v;
  for (std::size_t i = 0; i < batch.size(); ++i) {
    const ProposedCall& call = batch[i];
    CallVerdict cv;
    if (!blocking_tag.empty()) {
      cv.accepted = false;
      cv.reason = "blocked_by_context:" + blocking_tag;
    } else if (rules_.forbidden_functions.count(call.function_name)) {
      cv.accepted = false;
      cv.reason = "forbidden_function";
    } else {
      for (const auto& [key, value] : call.args) {
        const std::string* s = value.as_string();
        if (s && rules_.locked_entities.count(*s)) {
          cv.accepted = false;
          cv.reason = "locked_entity:" + *s;
          break;
        }
      }
    }
    v[i] = std::move(cv);
  }
  return v;
}

} // namespace turngate
