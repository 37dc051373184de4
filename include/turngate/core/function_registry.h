#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "turngate/core/engine_config.h"
#include "turngate/core/world_state.h"
#include "turngate/util/json.h"

namespace turngate {

using CallArgs = json::Object;

// A mutation proposed by an upstream agent. Untrusted until validated.
struct ProposedCall {
  std::string function_name;
  CallArgs args;
};

std::string describe_call(const ProposedCall& call);

// Prior value of one table row, captured before an apply step touched it.
// `prior == nullopt` means the row did not exist and must be erased on rollback.
template <typename Row>
struct RowSnapshot {
  std::string key;
  std::optional<Row> prior;
};

// Everything needed to undo one applied mutation.
//
// Holds prior-value snapshots (not recomputed inverses) for every row the
// apply step touched, plus the log lengths and sequence counters from before
// the apply step ran.
struct RollbackToken {
  std::vector<RowSnapshot<Npc>> npcs;
  std::vector<RowSnapshot<Structure>> structures;
  std::vector<RowSnapshot<Stockpile>> stockpiles;
  std::vector<RowSnapshot<TradeRoute>> trade_routes;
  std::vector<RowSnapshot<ScheduledEvent>> scheduled_events;
  std::vector<RowSnapshot<StoryProgress>> story_progress;

  std::size_t timeline_mark{0};
  std::size_t hazard_mark{0};
  std::size_t combat_mark{0};
  std::uint64_t next_timeline_seq_mark{1};
  std::uint64_t next_combat_seq_mark{1};

  // Snapshot helpers; call before writing the row.
  void capture_npc(const WorldState& s, const std::string& id);
  void capture_structure(const WorldState& s, const std::string& id);
  void capture_stockpile(const WorldState& s, const std::string& id);
  void capture_trade_route(const WorldState& s, const std::string& id);
  void capture_scheduled_event(const WorldState& s, const std::string& id);
  void capture_story_progress(const WorldState& s, const std::string& act);

  void mark_logs(const WorldState& s);

  std::size_t row_count() const;
};

// Restores every captured row in reverse capture order and truncates the logs
// back to the marks. This is the inverse used by all built-in functions.
void restore_from_token(const RollbackToken& token, WorldState& state);

// A registered apply step threw after its validator accepted the call.
// This is a validator/apply contract violation, never an expected rejection.
class ApplyError : public std::runtime_error {
 public:
  ApplyError(std::string function_name, const std::string& what)
      : std::runtime_error("apply failed for '" + function_name + "': " + what),
        function_name_(std::move(function_name)) {}

  const std::string& function_name() const { return function_name_; }

 private:
  std::string function_name_;
};

enum class CheckStatus { Passed, Rejected, UnknownFunction };

struct CheckResult {
  CheckStatus status{CheckStatus::Passed};
  std::string reason;

  bool passed() const { return status == CheckStatus::Passed; }
};

enum class MutationStatus { Applied, Rejected, UnknownFunction };

struct MutationResult {
  MutationStatus status{MutationStatus::Rejected};
  std::string reason;
  // Filled only when status == Applied.
  RollbackToken token;

  bool applied() const { return status == MutationStatus::Applied; }
};

inline constexpr const char kUnknownFunctionReason[] = "unknown_function";
inline constexpr const char kInvalidArgumentsReason[] = "invalid_arguments";
// Tier-1 reason for a validator that threw instead of returning a reason.
inline constexpr const char kValidatorErrorReason[] = "validator_error";

// Inputs shared by validators and apply steps besides the call arguments.
struct MutationContext {
  // Turn the mutation belongs to. Written into *_turn fields and log rows.
  Turn turn;
  const EngineConfig& cfg;
};

// The sole mutation surface for WorldState.
//
// Entries are registered at startup and the registry is then sealed; after
// sealing the catalog is an immutable lookup table. Validators and apply steps
// must be deterministic functions of (args, state, config).
class FunctionRegistry {
 public:
  // Returns nullopt when the call may proceed, otherwise the rejection reason.
  using Validator = std::optional<std::string> (*)(const CallArgs& args, const WorldState& state,
                                                   const MutationContext& ctx);
  // Mutates state. Must capture every row into `token` before writing it.
  using Applier = void (*)(const CallArgs& args, WorldState& state, const MutationContext& ctx,
                           RollbackToken& token);
  // Inverts one apply step using only the token.
  using Rollback = void (*)(const RollbackToken& token, WorldState& state);

  explicit FunctionRegistry(EngineConfig cfg = {});

  // Throws std::logic_error if sealed, if the name is empty or already
  // registered, or if any callback is null.
  void register_function(const std::string& name, Validator validate, Applier apply, Rollback rollback);

  void seal() { sealed_ = true; }
  bool sealed() const { return sealed_; }

  bool contains(const std::string& name) const;
  std::vector<std::string> names() const;
  const EngineConfig& config() const { return cfg_; }

  // Runs the validator only, as if the call were staged in `turn`. Never
  // mutates. Tier-1 uses this against the pre-turn state. A validator that
  // throws a std::exception is reported as rejected with kValidatorErrorReason.
  CheckResult check(const ProposedCall& call, const WorldState& state, Turn turn) const;

  // Validates then applies in turn `state.turn` (the shadow copy carries the
  // turn being staged). On success appends one TimelineEvent to state and
  // returns the rollback token. Throws ApplyError if the validator or the apply
  // step throws; any partial effect is reverted before the exception leaves.
  MutationResult invoke(const ProposedCall& call, WorldState& state) const;

  // Inverts a successful invoke(). Tokens must be rolled back in reverse
  // order of application. Throws std::logic_error for an unknown name.
  void rollback(const std::string& name, const RollbackToken& token, WorldState& state) const;

 private:
  struct Entry {
    Validator validate{nullptr};
    Applier apply{nullptr};
    Rollback rollback{nullptr};
  };

  const Entry* find(const std::string& name) const;

  EngineConfig cfg_;
  std::unordered_map<std::string, Entry> entries_;
  bool sealed_{false};
};

} // namespace turngate
