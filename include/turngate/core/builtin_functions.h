#pragma once

#include <string>
#include <vector>

#include "turngate/core/function_registry.h"

namespace turngate {

// Registers the closed catalog of world mutations:
//
//   move_npc            {npc_id, location}
//   adjust_trust        {npc_id, delta}
//   set_npc_status      {npc_id, status}
//   repair_structure    {structure_id, amount}
//   reinforce_structure {structure_id, amount}
//   damage_structure    {structure_id, amount}
//   produce_resource    {resource_id, amount}
//   consume_resource    {resource_id, amount}
//   transfer_resource   {from, to, amount}
//   open_trade_route    {route_id, risk, reward}
//   close_trade_route   {route_id, reason}
//   schedule_event      {event_id, trigger_turn}
//   fire_event          {event_id}
//   cancel_event        {event_id}
//   record_hazard       {hazard_id, severity, duration}
//   record_combat       {attacker, defender, outcome}
//   advance_story       {act, progress}
//
// Every entry uses restore_from_token() as its inverse. Throws
// std::logic_error if the registry is sealed or already holds one of the names.
void register_builtin_functions(FunctionRegistry& registry);

std::vector<std::string> builtin_function_names();

} // namespace turngate
