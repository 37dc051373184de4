#include "turngate/core/engine_config.h"

#include <limits>
#include <stdexcept>

#include "turngate/util/file_io.h"
#include "turngate/util/json.h"

namespace turngate {

namespace {

using json::Object;
using json::Value;

[[noreturn]] void bad_value(const std::string& key, const std::string& what) {
  throw std::runtime_error("engine config: '" + key + "' " + what);
}

const Value* member(const Value& obj, const char* key) { return obj.find(key); }

void read_int(const Value& obj, const char* key, const std::string& path, int* out) {
  const Value* v = member(obj, key);
  if (!v) return;
  const double* d = v->as_number();
  if (!d || !json::is_integral(*d)) bad_value(path, "must be an integer");
  if (*d < static_cast<double>(std::numeric_limits<int>::min()) ||
      *d > static_cast<double>(std::numeric_limits<int>::max())) {
    bad_value(path, "is out of range");
  }
  *out = static_cast<int>(*d);
}

void read_double(const Value& obj, const char* key, const std::string& path, double* out) {
  const Value* v = member(obj, key);
  if (!v) return;
  const double* d = v->as_number();
  if (!d) bad_value(path, "must be a number");
  *out = *d;
}

void read_bool(const Value& obj, const char* key, bool* out) {
  const Value* v = member(obj, key);
  if (!v) return;
  const bool* b = v->as_bool();
  if (!b) bad_value(key, "must be a boolean");
  *out = *b;
}

const Value* read_section(const Value& root, const char* key) {
  const Value* v = member(root, key);
  if (v && !v->is_object()) bad_value(key, "must be an object");
  return v;
}

} // namespace

void check_engine_config(const EngineConfig& cfg) {
  if (cfg.trust_min > cfg.trust_max) bad_value("trust", "min must not exceed max");
  const auto& t = cfg.structure_thresholds;
  // Written as negated ranges so NaN fails too.
  if (!(t.breached_ratio >= 0.0 && t.breached_ratio <= 1.0)) {
    bad_value("structure_thresholds.breached_ratio", "must be in [0, 1]");
  }
  if (!(t.damaged_ratio >= 0.0 && t.damaged_ratio <= 1.0)) {
    bad_value("structure_thresholds.damaged_ratio", "must be in [0, 1]");
  }
  if (t.breached_ratio > t.damaged_ratio) bad_value("structure_thresholds", "breached_ratio must not exceed damaged_ratio");
  if (cfg.max_structure_durability <= 0) bad_value("max_structure_durability", "must be positive");
  if (cfg.max_hazard_severity < 1) bad_value("max_hazard_severity", "must be at least 1");
  if (cfg.max_calls_per_function < 0) bad_value("rate_limits.max_calls_per_function", "must not be negative");
  if (cfg.max_calls_per_turn < 0) bad_value("rate_limits.max_calls_per_turn", "must not be negative");
  if (cfg.adjudication_timeout_ms < 0) bad_value("adjudication.timeout_ms", "must not be negative");
}

const char* adjudication_policy_to_string(AdjudicationPolicy p) {
  switch (p) {
    case AdjudicationPolicy::AtomicAll: return "atomic_all";
    case AdjudicationPolicy::PerCall: return "per_call";
  }
  return "atomic_all";
}

bool parse_adjudication_policy(const std::string& s, AdjudicationPolicy* out) {
  if (s == "atomic_all") {
    if (out) *out = AdjudicationPolicy::AtomicAll;
    return true;
  }
  if (s == "per_call") {
    if (out) *out = AdjudicationPolicy::PerCall;
    return true;
  }
  return false;
}

EngineConfig parse_engine_config(const std::string& json_text) {
  const Value root = json::parse(json_text);
  if (!root.is_object()) throw std::runtime_error("engine config: root must be an object");

  EngineConfig cfg;

  if (const Value* trust = read_section(root, "trust")) {
    read_int(*trust, "min", "trust.min", &cfg.trust_min);
    read_int(*trust, "max", "trust.max", &cfg.trust_max);
  }
  if (const Value* th = read_section(root, "structure_thresholds")) {
    read_double(*th, "breached_ratio", "structure_thresholds.breached_ratio", &cfg.structure_thresholds.breached_ratio);
    read_double(*th, "damaged_ratio", "structure_thresholds.damaged_ratio", &cfg.structure_thresholds.damaged_ratio);
  }
  read_int(root, "max_structure_durability", "max_structure_durability", &cfg.max_structure_durability);
  read_int(root, "max_hazard_severity", "max_hazard_severity", &cfg.max_hazard_severity);

  if (const Value* rl = read_section(root, "rate_limits")) {
    read_int(*rl, "max_calls_per_function", "rate_limits.max_calls_per_function", &cfg.max_calls_per_function);
    read_int(*rl, "max_calls_per_turn", "rate_limits.max_calls_per_turn", &cfg.max_calls_per_turn);
  }

  if (const Value* adj = read_section(root, "adjudication")) {
    if (const Value* p = member(*adj, "policy")) {
      if (!p->is_string() || !parse_adjudication_policy(p->string_value(), &cfg.adjudication_policy)) {
        bad_value("adjudication.policy", "must be \"atomic_all\" or \"per_call\"");
      }
    }
    read_int(*adj, "timeout_ms", "adjudication.timeout_ms", &cfg.adjudication_timeout_ms);
  }

  read_bool(root, "validate_before_commit", &cfg.validate_before_commit);
  read_bool(root, "verify_rollback", &cfg.verify_rollback);

  if (const Value* lvl = member(root, "log_level")) {
    if (!lvl->is_string() || !log::parse_level(lvl->string_value(), &cfg.log_level)) {
      bad_value("log_level", "must be one of debug, info, warn, error, off");
    }
  }

  check_engine_config(cfg);
  return cfg;
}

EngineConfig load_engine_config_from_file(const std::string& path) {
  return parse_engine_config(read_text_file(path));
}

std::string engine_config_to_json(const EngineConfig& cfg, int indent) {
  Object root;
  root["trust"] = Object{{"min", cfg.trust_min}, {"max", cfg.trust_max}};
  root["structure_thresholds"] = Object{{"breached_ratio", cfg.structure_thresholds.breached_ratio},
                                        {"damaged_ratio", cfg.structure_thresholds.damaged_ratio}};
  root["max_structure_durability"] = cfg.max_structure_durability;
  root["max_hazard_severity"] = cfg.max_hazard_severity;
  root["rate_limits"] = Object{{"max_calls_per_function", cfg.max_calls_per_function},
                               {"max_calls_per_turn", cfg.max_calls_per_turn}};
  root["adjudication"] = Object{{"policy", adjudication_policy_to_string(cfg.adjudication_policy)},
                                {"timeout_ms", cfg.adjudication_timeout_ms}};
  root["validate_before_commit"] = cfg.validate_before_commit;
  root["verify_rollback"] = cfg.verify_rollback;
  std::string lvl = log::level_label(cfg.log_level);
  for (char& ch : lvl) ch = static_cast<char>(ch - 'A' + 'a');
  root["log_level"] = lvl;
  return json::stringify(root, indent);
}

} // namespace turngate
