#pragma once

#include <string>

#include "turngate/core/world_state.h"
#include "turngate/util/json.h"

namespace turngate {

inline constexpr int kWorldFormatVersion = 1;

// Canonical JSON form of a WorldState.
//
// Keyed tables are written as arrays sorted by key and locations as a sorted
// array, so two equal states always serialize to identical text.
json::Value serialize_world_to_json_value(const WorldState& state);

std::string serialize_world_to_json(const WorldState& state, int indent = 2);

// Parse a WorldState from JSON text. Throws std::runtime_error on malformed
// JSON, missing fields, unknown enum strings or duplicate keys.
WorldState deserialize_world_from_json(const std::string& json_text);

WorldState deserialize_world_from_json_value(const json::Value& root);

} // namespace turngate
