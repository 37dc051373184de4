#pragma once

#include <string>

#include "turngate/core/world_state.h"

namespace turngate {

// Shared string <-> enum conversion helpers.
//
// These strings are the persisted form (JSON snapshots and SQLite rows) and the
// form accepted in call arguments, so they must not change.

const char* npc_status_to_string(NpcStatus s);
bool parse_npc_status(const std::string& s, NpcStatus* out);

const char* structure_status_to_string(StructureStatus s);
bool parse_structure_status(const std::string& s, StructureStatus* out);

const char* trade_route_status_to_string(TradeRouteStatus s);
bool parse_trade_route_status(const std::string& s, TradeRouteStatus* out);

const char* scheduled_event_status_to_string(ScheduledEventStatus s);
bool parse_scheduled_event_status(const std::string& s, ScheduledEventStatus* out);

} // namespace turngate
