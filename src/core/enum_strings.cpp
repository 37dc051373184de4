#include "turngate/core/enum_strings.h"

namespace turngate {

namespace {

template <typename E>
bool assign(E* out, E v) {
  if (out) *out = v;
  return true;
}

} // namespace

const char* npc_status_to_string(NpcStatus s) {
  switch (s) {
    case NpcStatus::Active: return "active";
    case NpcStatus::Resting: return "resting";
    case NpcStatus::Injured: return "injured";
    case NpcStatus::Missing: return "missing";
    case NpcStatus::Dead: return "dead";
  }
  return "active";
}

bool parse_npc_status(const std::string& s, NpcStatus* out) {
  if (s == "active") return assign(out, NpcStatus::Active);
  if (s == "resting") return assign(out, NpcStatus::Resting);
  if (s == "injured") return assign(out, NpcStatus::Injured);
  if (s == "missing") return assign(out, NpcStatus::Missing);
  if (s == "dead") return assign(out, NpcStatus::Dead);
  return false;
}

const char* structure_status_to_string(StructureStatus s) {
  switch (s) {
    case StructureStatus::Stable: return "stable";
    case StructureStatus::Damaged: return "damaged";
    case StructureStatus::Breached: return "breached";
    case StructureStatus::Destroyed: return "destroyed";
  }
  return "stable";
}

bool parse_structure_status(const std::string& s, StructureStatus* out) {
  if (s == "stable") return assign(out, StructureStatus::Stable);
  if (s == "damaged") return assign(out, StructureStatus::Damaged);
  if (s == "breached") return assign(out, StructureStatus::Breached);
  if (s == "destroyed") return assign(out, StructureStatus::Destroyed);
  return false;
}

const char* trade_route_status_to_string(TradeRouteStatus s) {
  switch (s) {
    case TradeRouteStatus::Open: return "open";
    case TradeRouteStatus::Closed: return "closed";
  }
  return "closed";
}

bool parse_trade_route_status(const std::string& s, TradeRouteStatus* out) {
  if (s == "open") return assign(out, TradeRouteStatus::Open);
  if (s == "closed") return assign(out, TradeRouteStatus::Closed);
  return false;
}

const char* scheduled_event_status_to_string(ScheduledEventStatus s) {
  switch (s) {
    case ScheduledEventStatus::Scheduled: return "scheduled";
    case ScheduledEventStatus::Fired: return "fired";
    case ScheduledEventStatus::Cancelled: return "cancelled";
  }
  return "scheduled";
}

bool parse_scheduled_event_status(const std::string& s, ScheduledEventStatus* out) {
  if (s == "scheduled") return assign(out, ScheduledEventStatus::Scheduled);
  if (s == "fired") return assign(out, ScheduledEventStatus::Fired);
  if (s == "cancelled") return assign(out, ScheduledEventStatus::Cancelled);
  return false;
}

} // namespace turngate
